#include "node.hpp"

#include "core/core.cpp"
#include "errors.hpp"
#include "util/logger.hpp"

#include <iostream>
#include <utility>

namespace pxvc
{

Node::Node(const NodeConfig& cfg, Roster roster)
  : roster_(std::move(roster))
  , self_(selfIndex(roster_, cfg.name))
  , scenario_(cfg.test_case, self_, roster_.Size())
  , timers_(cfg.progress_interval, cfg.proof_interval)
  , transport_(self_, roster_.Addresses(), roster_[self_].port)
  , engine_(roster_.Size(), self_, transport_, *this, timers_)
  , finished_(false)
{
  log_info("{}: node '{}' of {}, test case {}, progress {}ms, proof {}ms", self_, cfg.name,
      roster_.Size(), int(cfg.test_case), cfg.progress_interval.count(),
      cfg.proof_interval.count());
}

int Node::selfIndex(const Roster& roster, const std::string& name)
{
  const auto idx = roster.IndexOf(name);
  if (!idx)
    throw ConfigError("node '" + name + "' is not in the roster");
  return *idx;
}

int Node::Run()
{
  engine_.Start();
  while (!finished_) {
    // timers first, so a busy network cannot starve them
    if (timers_.ConsumeProgressFired())
      engine_.ProgressTimeoutTicked();
    if (timers_.ConsumeProofFired() && scenario_.PeriodicProofs())
      engine_.ProofTimeoutTicked();
    if (finished_)
      break;

    auto env = transport_.Receive(timers_.UntilNextDeadline());
    if (env)
      engine_.Consume(*env);
  }
  log_info("{}:{} test case finished", self_, engine_.View());
  return 0;
}

void Node::QuorumCollected(int view)
{
  if (scenario_.CrashesOnQuorum(view)) {
    log_warn("{}:{} crashing with a quorum for v:{} in hand", self_, engine_.View(), view);
    throw SimulatedCrash("node " + std::to_string(self_) + " crashed before installing view "
        + std::to_string(view));
  }
}

void Node::ViewInstalled(int view, int leader)
{
  std::cout << self_ << ": Server " << leader << " is the new leader of view " << view
            << std::endl;
  if (scenario_.Finished(view, leader))
    finished_ = true;
}

// the node's engine
template class ViewChangeEngine<UdpTransport, Node>;

}
