#include "errors.hpp"
#include "node/config.hpp"
#include "node/node.hpp"
#include "node/roster.hpp"
#include "node/scenario.hpp"
#include "util/logger.hpp"

#include <cstdlib>
#include <iostream>
#include <utility>

using namespace pxvc;

int main(int argc, char* argv[])
{
  NodeConfig cfg;
  try {
    cfg = ParseArgs(argc, argv);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n" << Usage(argv[0]);
    return EXIT_FAILURE;
  }

  try {
    InitLogging(cfg.name, cfg.log_dir);
  } catch (const spdlog::spdlog_ex& e) {
    std::cerr << "cannot set up logging: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  try {
    auto roster = Roster::Load(cfg.hostfile, cfg.port);
    log_info("loaded hostfile: {}", cfg.hostfile);
    Node node(cfg, std::move(roster));
    log_info("created system, starting paxos");
    return node.Run();
  } catch (const ConfigError& e) {
    log_error("configuration error: {}", e.what());
  } catch (const TransportError& e) {
    log_error("transport error: {}", e.what());
  } catch (const SimulatedCrash& e) {
    log_warn("{}", e.what());
    spdlog::shutdown();
    return 3;
  }
  spdlog::shutdown();
  return EXIT_FAILURE;
}
