#include "core.hpp"

#include "core/util.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace pxvc {

template <typename TMsgDispatcher, typename TViewObserver>
ViewChangeEngine<TMsgDispatcher, TViewObserver>::ViewChangeEngine(
  int totreplicas, int replica, TMsgDispatcher& dp, TViewObserver& obs, TimerPair& timers)
  : dispatcher_(dp)
  , observer_(obs)
  , timers_(timers)
  , totreplicas_(totreplicas)
  , replica_(replica)
  , view_(0)
  , last_attempted_(0)
  , proof_(0)
{
  if (totreplicas_ <= 0 || replica_ < 0 || replica_ >= totreplicas_)
    throw std::invalid_argument("replica " + std::to_string(replica) + " is not in a roster of "
        + std::to_string(totreplicas));
}

template <typename TMsgDispatcher, typename TViewObserver>
void ViewChangeEngine<TMsgDispatcher, TViewObserver>::Start()
{
  // genesis view 0 has no certificate, so its leader has nothing to prove
  timers_.DisableProof();
  timers_.ResetProgress();
  log_info("{}:{} started, {} replicas, quorum:{}", replica_, view_, totreplicas_,
      QuorumSize(totreplicas_));
}

template <typename TMsgDispatcher, typename TViewObserver>
int ViewChangeEngine<TMsgDispatcher, TViewObserver>::Leader() const
{
  return LeaderOf(view_, totreplicas_);
}

template <typename TMsgDispatcher, typename TViewObserver>
int ViewChangeEngine<TMsgDispatcher, TViewObserver>::ProgressTimeoutTicked()
{
  if (view_ == std::numeric_limits<int>::max()) {
    log_error("{}:{} progress timeout, no view left to propose", replica_, view_);
    timers_.ResetProgress();
    return -1;
  }
  const auto next = view_ + 1;
  log_info("{}:{} progress timeout, leader {} presumed dead; proposing v:{}", replica_, view_,
      Leader(), next);
  proposeView(next);
  timers_.ResetProgress();
  return checkQuorum(next); // a single replica is its own quorum
}

template <typename TMsgDispatcher, typename TViewObserver>
int ViewChangeEngine<TMsgDispatcher, TViewObserver>::ProofTimeoutTicked()
{
  if (!IsLeader() || !proof_.IsValid(totreplicas_)) {
    timers_.DisableProof();
    return -4;
  }
  log_debug("{}:{} (VCProof) re-announcing, attestations:{}", replica_, view_,
      proof_.Support(totreplicas_));
  dispatcher_.Broadcast(MsgViewChangeProof { view_, proof_.Attestations() });
  timers_.ResetProof();
  return 0;
}

template <typename TMsgDispatcher, typename TViewObserver>
int ViewChangeEngine<TMsgDispatcher, TViewObserver>::ConsumeMsg(
    int from, const MsgViewChange& vc)
{
  if (from < 0 || from >= totreplicas_) {
    log_warn("{}:{}<-{} (VC) unknown sender v:{}", replica_, view_, from, vc.view);
    return -3;
  }
  if (vc.view <= view_) {
    log_debug("{}:{}<-{} (VC) stale v:{}", replica_, view_, from, vc.view);
    return -1;
  }

  auto& cert = pending_.try_emplace(vc.view, vc.view).first->second;
  if (!cert.Add(from, vc.view))
    return 0; // duplicate

  if (vc.view > last_attempted_) {
    log_info("{}:{}<-{} (VC) joining view change to v:{}", replica_, view_, from, vc.view);
    proposeView(vc.view);
  }
  return checkQuorum(vc.view);
}

template <typename TMsgDispatcher, typename TViewObserver>
int ViewChangeEngine<TMsgDispatcher, TViewObserver>::ConsumeMsg(
    int from, const MsgViewChangeProof& vcp)
{
  if (from < 0 || from >= totreplicas_) {
    log_warn("{}:{}<-{} (VCProof) unknown sender v:{}", replica_, view_, from, vcp.view);
    return -3;
  }
  if (!QuorumCertificate::Validate(vcp.view, vcp.certificate, totreplicas_)) {
    log_info("{}:{}<-{} (VCProof) insufficient certificate for v:{} attestations:{}", replica_,
        view_, from, vcp.view, vcp.certificate.size());
    return -2;
  }
  if (vcp.view < view_) {
    log_debug("{}:{}<-{} (VCProof) stale v:{}", replica_, view_, from, vcp.view);
    return -1;
  }

  if (vcp.view > view_) {
    log_info("{}:{}<-{} (VCProof) installing v:{} based on proof", replica_, view_, from,
        vcp.view);
    installView(vcp.view, QuorumCertificate(vcp.view, vcp.certificate));
  }
  // a live leader exists for our view
  timers_.ResetProgress();
  return 0;
}

template <typename TMsgDispatcher, typename TViewObserver>
int ViewChangeEngine<TMsgDispatcher, TViewObserver>::Consume(const Envelope& env)
{
  return std::visit([this, &env](const auto& msg) { return ConsumeMsg(env.from, msg); }, env.msg);
}

template <typename TMsgDispatcher, typename TViewObserver>
void ViewChangeEngine<TMsgDispatcher, TViewObserver>::proposeView(int view)
{
  last_attempted_ = std::max(last_attempted_, view);
  pending_.try_emplace(view, view).first->second.Add(replica_, view);
  dispatcher_.Broadcast(MsgViewChange { view });
}

template <typename TMsgDispatcher, typename TViewObserver>
int ViewChangeEngine<TMsgDispatcher, TViewObserver>::checkQuorum(int view)
{
  auto it = pending_.find(view);
  if (it == pending_.end())
    return 0;

  const auto cnt = it->second.Support(totreplicas_);
  if (!it->second.IsValid(totreplicas_)) {
    log_info("{}:{} insufficient proof to install v:{} consensus[{}]", replica_, view_, view, cnt);
    return 0;
  }

  log_info("{}:{} (VC) consensus[{}] v:{}", replica_, view_, cnt, view);
  observer_.QuorumCollected(view);
  installView(view, std::move(it->second));
  return 0;
}

template <typename TMsgDispatcher, typename TViewObserver>
void ViewChangeEngine<TMsgDispatcher, TViewObserver>::installView(int view, QuorumCertificate cert)
{
  if (view <= view_)
    return;

  view_ = view;
  last_attempted_ = std::max(last_attempted_, view);
  proof_ = std::move(cert);
  pending_.erase(pending_.begin(), pending_.upper_bound(view));
  timers_.ResetProgress();
  log_info("{}:{} installed view, leader:{}", replica_, view_, Leader());

  if (IsLeader()) {
    timers_.ResetProof();
    dispatcher_.Broadcast(MsgViewChangeProof { view_, proof_.Attestations() });
  } else {
    timers_.DisableProof();
  }
  observer_.ViewInstalled(view_, Leader());
}

}
