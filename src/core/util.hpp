#ifndef PXVC_UTIL_INCLUDED
#define PXVC_UTIL_INCLUDED

namespace pxvc
{

// Majority of totreplicas
constexpr int QuorumSize(int totreplicas) noexcept {
  return totreplicas / 2 + 1;
}

constexpr int LeaderOf(int view, int totreplicas) noexcept {
  return view % totreplicas;
}

}

#endif
