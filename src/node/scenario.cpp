#include "scenario.hpp"

#include "core/util.hpp"

namespace pxvc
{

Scenario::Scenario(TestCase tc, int replica, int totreplicas)
  : test_case_(tc)
  , replica_(replica)
  , totreplicas_(totreplicas)
{
}

bool Scenario::CrashesOnQuorum(int view) const
{
  if (LeaderOf(view, totreplicas_) != replica_)
    return false;

  switch (test_case_) {
  case TestCase::SingleCrash:
    return replica_ == 1;
  case TestCase::TwoCrashes:
    return replica_ == 1 || replica_ == 2;
  case TestCase::ThreeCrashes:
    return replica_ >= 1 && replica_ <= 3;
  default:
    return false;
  }
}

bool Scenario::Finished(int view, int leader) const
{
  switch (test_case_) {
  case TestCase::NormalCase:
    return view == 1;
  case TestCase::FullRotation:
    return view != 0 && leader == 0;
  case TestCase::SingleCrash:
    return view == 2;
  case TestCase::TwoCrashes:
    return view == 3;
  case TestCase::ThreeCrashes:
    return view == 4;
  }
  return false;
}

}
