#ifndef PXVC_CORE_INCLUDED_
#define PXVC_CORE_INCLUDED_ 1

#include "msgs.hpp"
#include "core/certificate.hpp"
#include "core/timer.hpp"

#include <cstddef>
#include <map>

namespace pxvc {

// View-change state machine of a single node.
//
// The node is Leader when Leader() == replica, Follower otherwise. Events come
// from the timers and from the network; each call below runs one transition.
// ConsumeMsg and the *Ticked calls return 0 when the event was acted on, and a
// negative reason when it was ignored:
//   -1 stale view (or no view left to propose), -2 invalid certificate, -3 unknown sender, -4 not leader
template <typename TMsgDispatcher, typename TViewObserver>
class ViewChangeEngine {
public:
  ViewChangeEngine(int totreplicas, int replica, TMsgDispatcher& dp, TViewObserver& obs,
    TimerPair& timers);

  // arms the progress timer on the genesis view
  void Start();

  int ProgressTimeoutTicked();
  int ProofTimeoutTicked();

  int ConsumeMsg(int from, const MsgViewChange&);
  int ConsumeMsg(int from, const MsgViewChangeProof&);
  int Consume(const Envelope&);

  int View() const { return view_; }
  int Leader() const;
  bool IsLeader() const { return Leader() == replica_; }
  int LastAttempted() const { return last_attempted_; }
  const QuorumCertificate& InstalledCertificate() const { return proof_; }
  std::size_t PendingCertificates() const { return pending_.size(); }

private:
  TMsgDispatcher& dispatcher_;
  TViewObserver& observer_;
  TimerPair& timers_;

  const int totreplicas_;
  const int replica_;
  int view_;
  int last_attempted_;
  QuorumCertificate proof_;
  std::map<int, QuorumCertificate> pending_;

private:
  void proposeView(int view);
  int checkQuorum(int view);
  void installView(int view, QuorumCertificate cert);
};

}
#endif
