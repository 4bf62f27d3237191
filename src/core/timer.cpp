#include "timer.hpp"

#include <algorithm>
#include <utility>
#include <stdexcept>

namespace pxvc
{

CountdownTimer::CountdownTimer()
  : armed_(false)
  , deadline_()
{
}

void CountdownTimer::Reset(Clock::time_point now, Clock::duration d)
{
  armed_ = true;
  deadline_ = now + d;
}

void CountdownTimer::Disable()
{
  armed_ = false;
}

bool CountdownTimer::ConsumeFired(Clock::time_point now)
{
  if (!armed_ || now < deadline_)
    return false;
  armed_ = false;
  return true;
}

TimerPair::TimerPair(std::chrono::milliseconds progress_interval,
    std::chrono::milliseconds proof_interval, NowFun now)
  : progress_interval_(progress_interval)
  , proof_interval_(proof_interval)
  , now_(std::move(now))
{
  if (progress_interval_.count() <= 0 || proof_interval_.count() <= 0)
    throw std::invalid_argument("timer intervals must be positive");
}

void TimerPair::ResetProgress()
{
  progress_.Reset(now_(), progress_interval_);
}

void TimerPair::ResetProof()
{
  proof_.Reset(now_(), proof_interval_);
}

void TimerPair::DisableProof()
{
  proof_.Disable();
}

bool TimerPair::ConsumeProgressFired()
{
  return progress_.ConsumeFired(now_());
}

bool TimerPair::ConsumeProofFired()
{
  return proof_.ConsumeFired(now_());
}

std::chrono::milliseconds TimerPair::UntilNextDeadline() const
{
  const auto now = now_();
  auto left = progress_interval_;
  bool any = false;
  for (const auto* t : { &progress_, &proof_ }) {
    if (!t->Armed())
      continue;
    const auto d = std::chrono::ceil<std::chrono::milliseconds>(t->Deadline() - now);
    left = any ? std::min(left, d) : d;
    any = true;
  }
  return std::max(left, std::chrono::milliseconds(0));
}

}
