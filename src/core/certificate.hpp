#ifndef PXVC_CERTIFICATE_INCLUDED_
#define PXVC_CERTIFICATE_INCLUDED_ 1

#include "msgs.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace pxvc
{

// Attestations gathered for candidate view; one entry per sender
class QuorumCertificate {
public:
  explicit QuorumCertificate(int view = 0);
  QuorumCertificate(int view, const std::vector<Attestation>& attestations);

  // false when sender had already attested a view this high
  bool Add(int sender, int attested_view);

  int View() const { return view_; }
  bool Empty() const { return attested_.empty(); }

  // distinct senders in [0, totreplicas) attesting a view >= View()
  std::size_t Support(int totreplicas) const;
  bool IsValid(int totreplicas) const;

  // sorted by sender
  std::vector<Attestation> Attestations() const;

  // validates a certificate received on the wire for view
  static bool Validate(int view, const std::vector<Attestation>& attestations, int totreplicas);

private:
  int view_;
  std::map<int, int> attested_; // sender -> highest attested view
};

}
#endif
