#ifndef PXVC_ROSTER_INCLUDED_
#define PXVC_ROSTER_INCLUDED_ 1

#include "net/transport.hpp"

#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace pxvc
{

struct RosterEntry {
  std::string name;
  std::string host;
  uint16_t port;
};

// Ordered host list; the index of an entry is its node id and view v is led
// by entry v mod Size(). Every node must load the same file.
class Roster {
public:
  // Lines are "name [host[:port]]"; blank lines and '#' comments are skipped.
  // Throws ConfigError.
  static Roster Parse(std::istream& in, uint16_t default_port = kDefaultPort);
  static Roster Load(const std::string& path, uint16_t default_port = kDefaultPort);

  explicit Roster(std::vector<RosterEntry> entries);

  int Size() const { return int(entries_.size()); }
  const RosterEntry& operator[](int idx) const { return entries_.at(idx); }

  std::optional<int> IndexOf(const std::string& name) const;
  int LeaderOf(int view) const;
  std::vector<PeerAddress> Addresses() const;

private:
  std::vector<RosterEntry> entries_;
};

}

#endif
