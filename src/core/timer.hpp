#ifndef PXVC_TIMER_INCLUDED_
#define PXVC_TIMER_INCLUDED_ 1

#include <chrono>
#include <functional>

namespace pxvc
{

using Clock = std::chrono::steady_clock;

class CountdownTimer {
public:
  CountdownTimer();

  // (re)arms the timer; cancels a pending firing
  void Reset(Clock::time_point now, Clock::duration d);
  void Disable();

  bool Armed() const { return armed_; }
  Clock::time_point Deadline() const { return deadline_; }

  // true exactly once per firing; disarms the timer
  bool ConsumeFired(Clock::time_point now);

private:
  bool armed_;
  Clock::time_point deadline_;
};

// Progress timer (leader silence) and proof timer (leader's re-announcement)
class TimerPair {
public:
  using NowFun = std::function<Clock::time_point()>;

  TimerPair(std::chrono::milliseconds progress_interval, std::chrono::milliseconds proof_interval,
      NowFun now = &Clock::now);

  void ResetProgress();
  void ResetProof();
  void DisableProof();

  bool ProgressArmed() const { return progress_.Armed(); }
  bool ProofArmed() const { return proof_.Armed(); }

  bool ConsumeProgressFired();
  bool ConsumeProofFired();

  // time left until the earliest armed deadline, zero when one has passed
  std::chrono::milliseconds UntilNextDeadline() const;

  std::chrono::milliseconds ProgressInterval() const { return progress_interval_; }
  std::chrono::milliseconds ProofInterval() const { return proof_interval_; }

private:
  const std::chrono::milliseconds progress_interval_;
  const std::chrono::milliseconds proof_interval_;
  NowFun now_;
  CountdownTimer progress_;
  CountdownTimer proof_;
};

}
#endif
