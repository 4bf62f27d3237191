#ifndef PXVC_SCENARIO_INCLUDED_
#define PXVC_SCENARIO_INCLUDED_ 1

#include "node/config.hpp"

#include <stdexcept>
#include <string>

namespace pxvc
{

// Thrown by a node the test case wants dead; main turns it into exit code 3
class SimulatedCrash : public std::runtime_error {
public:
  explicit SimulatedCrash(const std::string& what) : std::runtime_error(what) {}
};

// Crash and exit behavior of the five test cases.
//
//  replica | crashes after collecting the quorum for a view it leads in
//  --------+------------------------------------------------------------
//     1    | 3, 4, 5
//     2    | 4, 5
//     3    | 5
class Scenario {
public:
  Scenario(TestCase tc, int replica, int totreplicas);

  bool CrashesOnQuorum(int view) const;
  bool Finished(int view, int leader) const;
  // full rotation needs leaders that fall silent after installing
  bool PeriodicProofs() const { return test_case_ != TestCase::FullRotation; }

private:
  const TestCase test_case_;
  const int replica_;
  const int totreplicas_;
};

}

#endif
