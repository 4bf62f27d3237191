#include "roster.hpp"

#include "core/util.hpp"
#include "errors.hpp"

#include <fstream>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace pxvc
{

namespace
{

uint16_t parsePort(const std::string& s, int lineno)
{
  std::size_t pos = 0;
  unsigned long v = 0;
  try {
    v = std::stoul(s, &pos);
  } catch (const std::logic_error&) {
    pos = 0;
  }
  if (pos == 0 || pos != s.size() || v == 0 || v > 65534)
    throw ConfigError("roster line " + std::to_string(lineno) + ": bad port '" + s + "'");
  return uint16_t(v);
}

}

Roster::Roster(std::vector<RosterEntry> entries)
  : entries_(std::move(entries))
{
  if (entries_.empty())
    throw ConfigError("roster is empty");
  std::unordered_set<std::string> names;
  for (const auto& e : entries_)
    if (!names.insert(e.name).second)
      throw ConfigError("roster lists '" + e.name + "' twice");
}

Roster Roster::Parse(std::istream& in, uint16_t default_port)
{
  std::vector<RosterEntry> entries;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    std::istringstream ls(line);
    std::string name, addr, extra;
    if (!(ls >> name) || name[0] == '#')
      continue;
    ls >> addr;
    if (ls >> extra)
      throw ConfigError("roster line " + std::to_string(lineno) + ": trailing '" + extra + "'");

    RosterEntry e { name, name, default_port };
    if (!addr.empty()) {
      const auto colon = addr.rfind(':');
      e.host = addr.substr(0, colon);
      if (colon != std::string::npos)
        e.port = parsePort(addr.substr(colon + 1), lineno);
      if (e.host.empty())
        throw ConfigError("roster line " + std::to_string(lineno) + ": empty host");
    }
    entries.push_back(std::move(e));
  }
  return Roster(std::move(entries));
}

Roster Roster::Load(const std::string& path, uint16_t default_port)
{
  std::ifstream in(path);
  if (!in)
    throw ConfigError("cannot open roster file '" + path + "'");
  return Parse(in, default_port);
}

std::optional<int> Roster::IndexOf(const std::string& name) const
{
  for (std::size_t i = 0; i < entries_.size(); ++i)
    if (entries_[i].name == name)
      return int(i);
  return std::nullopt;
}

int Roster::LeaderOf(int view) const
{
  return pxvc::LeaderOf(view, Size());
}

std::vector<PeerAddress> Roster::Addresses() const
{
  std::vector<PeerAddress> ret;
  ret.reserve(entries_.size());
  for (const auto& e : entries_)
    ret.push_back(PeerAddress { e.host, e.port });
  return ret;
}

}
