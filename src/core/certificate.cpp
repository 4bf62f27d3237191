#include "certificate.hpp"

#include "util.hpp"

namespace pxvc
{

QuorumCertificate::QuorumCertificate(int view)
  : view_(view)
{
}

QuorumCertificate::QuorumCertificate(int view, const std::vector<Attestation>& attestations)
  : view_(view)
{
  for (const auto& a : attestations)
    Add(a.sender, a.view);
}

bool QuorumCertificate::Add(int sender, int attested_view)
{
  auto it = attested_.find(sender);
  if (it == attested_.end()) {
    attested_.emplace(sender, attested_view);
    return true;
  }
  if (it->second >= attested_view)
    return false;
  it->second = attested_view;
  return true;
}

std::size_t QuorumCertificate::Support(int totreplicas) const
{
  std::size_t cnt = 0;
  for (const auto& [sender, view] : attested_)
    if (sender >= 0 && sender < totreplicas && view >= view_)
      ++cnt;
  return cnt;
}

bool QuorumCertificate::IsValid(int totreplicas) const
{
  return totreplicas > 0 && Support(totreplicas) >= std::size_t(QuorumSize(totreplicas));
}

std::vector<Attestation> QuorumCertificate::Attestations() const
{
  std::vector<Attestation> ret;
  ret.reserve(attested_.size());
  for (const auto& [sender, view] : attested_)
    ret.push_back(Attestation { sender, view });
  return ret;
}

bool QuorumCertificate::Validate(int view, const std::vector<Attestation>& attestations,
    int totreplicas)
{
  if (view < 0 || totreplicas <= 0)
    return false;
  std::vector<bool> seen(totreplicas, false);
  int cnt = 0;
  for (const auto& a : attestations) {
    if (a.sender < 0 || a.sender >= totreplicas || a.view < view || seen[a.sender])
      continue;
    seen[a.sender] = true;
    ++cnt;
  }
  return cnt >= QuorumSize(totreplicas);
}

}
