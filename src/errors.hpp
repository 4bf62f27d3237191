#ifndef PXVC_ERRORS_INCLUDED_
#define PXVC_ERRORS_INCLUDED_ 1

#include <stdexcept>
#include <string>

namespace pxvc {

// Bad command line, roster file or node name; fatal at startup
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Socket setup failure; fatal at startup
class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

}

#endif
