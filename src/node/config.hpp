#ifndef PXVC_CONFIG_INCLUDED_
#define PXVC_CONFIG_INCLUDED_ 1

#include "net/transport.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace pxvc
{

enum class TestCase : char {
  NormalCase = 1,   // view 0 -> 1 on the first timeout
  FullRotation = 2, // rotate leadership until node 0 leads again
  SingleCrash = 3,  // node 1 dies after collecting its quorum
  TwoCrashes = 4,   // nodes 1 and 2 die likewise
  ThreeCrashes = 5, // nodes 1..3 die likewise; never converges with five nodes
};

struct NodeConfig {
  std::string name;
  std::string hostfile = "hosts";
  TestCase test_case = TestCase::NormalCase;
  std::chrono::milliseconds progress_interval = std::chrono::seconds(3);
  std::chrono::milliseconds proof_interval = std::chrono::seconds(1);
  std::string log_dir; // stderr when empty
  uint16_t port = kDefaultPort;
};

// Throws ConfigError on unknown options and bad values
NodeConfig ParseArgs(int argc, char* argv[]);

// "3" is seconds, "500ms" milliseconds
std::chrono::milliseconds ParseDuration(const std::string& s);
TestCase ParseTestCase(const std::string& s);

std::string Usage(const char* prog);

}

#endif
