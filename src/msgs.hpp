#ifndef PXVC_MSGS_INCLUDED_
#define PXVC_MSGS_INCLUDED_ 1

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace pxvc {

// (sender, view): "sender believes in a view >= view"
struct Attestation {
  int sender;
  int view;

  bool operator==(const Attestation& o) const noexcept {
    return o.sender == sender && o.view == view;
  }
  bool operator!=(const Attestation& o) const noexcept { return !(*this == o); }
};

// Broadcast on progress timeout, or when joining a higher candidacy
struct MsgViewChange {
  int view;

  bool operator==(const MsgViewChange& o) const noexcept { return o.view == view; }
  bool operator!=(const MsgViewChange& o) const noexcept { return !(*this == o); }
};

// Leader's periodic statement that view is installed, with the quorum behind it
struct MsgViewChangeProof {
  int view;
  std::vector<Attestation> certificate;

  bool operator==(const MsgViewChangeProof& o) const noexcept {
    return o.view == view && o.certificate == certificate;
  }
  bool operator!=(const MsgViewChangeProof& o) const noexcept { return !(*this == o); }
};

using Message = std::variant<MsgViewChange, MsgViewChangeProof>;

// A message together with the roster index of the node that sent it
struct Envelope {
  int from;
  Message msg;

  bool operator==(const Envelope& o) const noexcept { return o.from == from && o.msg == msg; }
  bool operator!=(const Envelope& o) const noexcept { return !(*this == o); }
};

inline std::string toString(const Message& msg) {
  if (const auto* vc = std::get_if<MsgViewChange>(&msg))
    return "VC/" + std::to_string(vc->view);
  const auto& proof = std::get<MsgViewChangeProof>(msg);
  return "VCProof/" + std::to_string(proof.view) + "/" + std::to_string(proof.certificate.size());
}

}

#endif
