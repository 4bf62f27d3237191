#include "config.hpp"

#include "errors.hpp"

#include <getopt.h>

namespace pxvc
{

namespace
{

long parseNumber(const std::string& s, const char* what)
{
  std::size_t pos = 0;
  long v = -1;
  try {
    v = std::stol(s, &pos);
  } catch (const std::logic_error&) {
    pos = 0;
  }
  if (pos == 0 || pos != s.size() || v < 0)
    throw ConfigError(std::string("bad ") + what + " '" + s + "'");
  return v;
}

struct option long_options[] = {
  { "name", required_argument, nullptr, 'n' },
  { "hosts", required_argument, nullptr, 'h' },
  { "test", required_argument, nullptr, 't' },
  { "progress", required_argument, nullptr, 'p' },
  { "vcproof", required_argument, nullptr, 'v' },
  { "log", required_argument, nullptr, 'l' },
  { "port", required_argument, nullptr, 'P' },
  { nullptr, 0, nullptr, 0 },
};

}

std::chrono::milliseconds ParseDuration(const std::string& s)
{
  const std::string suffix = "ms";
  if (s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0) {
    const auto v = parseNumber(s.substr(0, s.size() - suffix.size()), "duration");
    return std::chrono::milliseconds(v);
  }
  return std::chrono::seconds(parseNumber(s, "duration"));
}

TestCase ParseTestCase(const std::string& s)
{
  const auto v = parseNumber(s, "test case");
  if (v < 1 || v > 5)
    throw ConfigError("test case must be within 1..5, got " + s);
  return TestCase(v);
}

std::string Usage(const char* prog)
{
  return std::string("usage: ") + prog +
    " -n NAME [-h HOSTFILE] [-t TEST_CASE] [-p SECONDS] [-v SECONDS] [-l LOGDIR] [-P PORT]\n"
    "  -n, --name      hostname of this process, as listed in HOSTFILE\n"
    "  -h, --hosts     roster, one host per line (default: hosts)\n"
    "  -t, --test      test case 1..5 (default: 1)\n"
    "  -p, --progress  progress timer, seconds or <n>ms (default: 3)\n"
    "  -v, --vcproof   view change proof timer, seconds or <n>ms (default: 1)\n"
    "  -l, --log       directory for log files (default: stderr)\n"
    "  -P, --port      base UDP port (default: 42069)\n";
}

NodeConfig ParseArgs(int argc, char* argv[])
{
  NodeConfig cfg;
  optind = 0; // full re-initialization of getopt's state
  opterr = 0;

  int c;
  while ((c = getopt_long(argc, argv, "n:h:t:p:v:l:P:", long_options, nullptr)) != -1) {
    switch (c) {
    case 'n':
      cfg.name = optarg;
      break;
    case 'h':
      cfg.hostfile = optarg;
      break;
    case 't':
      cfg.test_case = ParseTestCase(optarg);
      break;
    case 'p':
      cfg.progress_interval = ParseDuration(optarg);
      break;
    case 'v':
      cfg.proof_interval = ParseDuration(optarg);
      break;
    case 'l':
      cfg.log_dir = optarg;
      break;
    case 'P': {
      const auto port = parseNumber(optarg, "port");
      if (port == 0 || port > 65534)
        throw ConfigError(std::string("port out of range: ") + optarg);
      cfg.port = uint16_t(port);
      break;
    }
    default:
      if (optopt)
        throw ConfigError(std::string("unknown option or missing value for -") + char(optopt));
      throw ConfigError(std::string("unknown option '") + argv[optind - 1] + "'");
    }
  }
  if (optind < argc)
    throw ConfigError(std::string("unexpected argument '") + argv[optind] + "'");

  if (cfg.name.empty())
    throw ConfigError("node name (-n) is required");
  if (cfg.progress_interval.count() <= 0 || cfg.proof_interval.count() <= 0)
    throw ConfigError("timer durations must be positive");
  if (cfg.proof_interval >= cfg.progress_interval)
    throw ConfigError("proof timer must be shorter than the progress timer");
  return cfg;
}

}
