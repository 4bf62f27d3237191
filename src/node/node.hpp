#ifndef PXVC_NODE_INCLUDED_
#define PXVC_NODE_INCLUDED_ 1

#include "core.hpp"
#include "ifaces.hpp"
#include "net/transport.hpp"
#include "node/config.hpp"
#include "node/roster.hpp"
#include "node/scenario.hpp"

namespace pxvc
{

// One process: roster, timers, transport and engine around a single event loop
class Node : public IViewObserver {
public:
  // throws ConfigError when cfg.name is not on the roster, TransportError on socket setup
  Node(const NodeConfig& cfg, Roster roster);

  // runs until the test case converges; SimulatedCrash escapes when it wants this node dead
  int Run();

  void QuorumCollected(int view) override;
  void ViewInstalled(int view, int leader) override;

  int Self() const { return self_; }
  int View() const { return engine_.View(); }
  bool Finished() const { return finished_; }

private:
  static int selfIndex(const Roster& roster, const std::string& name);

  const Roster roster_;
  const int self_;
  Scenario scenario_;
  TimerPair timers_;
  UdpTransport transport_;
  ViewChangeEngine<UdpTransport, Node> engine_;
  bool finished_;
};

}

#endif
