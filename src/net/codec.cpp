#include "codec.hpp"

#include <limits>
#include <stdexcept>
#include <utility>

namespace pxvc
{

namespace
{

void putU32(std::string& out, uint32_t v)
{
  out.push_back(char((v >> 24) & 0xff));
  out.push_back(char((v >> 16) & 0xff));
  out.push_back(char((v >> 8) & 0xff));
  out.push_back(char(v & 0xff));
}

void putInt(std::string& out, int v, const char* what)
{
  if (v < 0)
    throw std::invalid_argument(std::string("cannot encode negative ") + what + " "
        + std::to_string(v));
  putU32(out, uint32_t(v));
}

uint32_t getU32(const char* p)
{
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i)
    v = (v << 8) | static_cast<unsigned char>(p[i]);
  return v;
}

// bounds-checked reader over a frame body
struct Reader {
  const char* p;
  std::size_t left;

  bool Int(int& out)
  {
    if (left < 4)
      return false;
    const auto v = getU32(p);
    p += 4;
    left -= 4;
    if (v > uint32_t(std::numeric_limits<int>::max()))
      return false;
    out = int(v);
    return true;
  }
};

}

std::string Encode(int from, const Message& msg)
{
  std::string body;
  putInt(body, from, "sender");
  if (const auto* vc = std::get_if<MsgViewChange>(&msg)) {
    putU32(body, uint32_t(MsgTag::ViewChange));
    putInt(body, vc->view, "view");
  } else {
    const auto& vcp = std::get<MsgViewChangeProof>(msg);
    putU32(body, uint32_t(MsgTag::ViewChangeProof));
    putInt(body, vcp.view, "view");
    putU32(body, uint32_t(vcp.certificate.size()));
    for (const auto& a : vcp.certificate) {
      putInt(body, a.sender, "sender");
      putInt(body, a.view, "view");
    }
  }

  std::string frame;
  frame.reserve(kLengthPrefixSize + body.size());
  putU32(frame, uint32_t(body.size()));
  frame += body;
  return frame;
}

DecodeResult Decode(const char* data, std::size_t len, std::size_t* consumed)
{
  if (len < kLengthPrefixSize)
    return CodecError::Malformed;
  const std::size_t bodylen = getU32(data);
  if (bodylen > kMaxFrameSize || len - kLengthPrefixSize < bodylen)
    return CodecError::Malformed;

  Reader rd { data + kLengthPrefixSize, bodylen };
  int from = 0, tag = 0, view = 0;
  if (!rd.Int(from) || !rd.Int(tag) || !rd.Int(view))
    return CodecError::Malformed;

  Envelope env { from, MsgViewChange { view } };
  switch (MsgTag(tag)) {
  case MsgTag::ViewChange:
    break;
  case MsgTag::ViewChangeProof: {
    int count = 0;
    if (!rd.Int(count) || std::size_t(count) * 8 != rd.left)
      return CodecError::Malformed;
    MsgViewChangeProof vcp { view, {} };
    vcp.certificate.reserve(count);
    for (int i = 0; i < count; ++i) {
      Attestation a {};
      if (!rd.Int(a.sender) || !rd.Int(a.view))
        return CodecError::Malformed;
      vcp.certificate.push_back(a);
    }
    env.msg = std::move(vcp);
    break;
  }
  default:
    return CodecError::Malformed;
  }
  if (rd.left != 0) // trailing bytes do not belong to this tag
    return CodecError::Malformed;

  if (consumed)
    *consumed = kLengthPrefixSize + bodylen;
  return env;
}

DecodeResult Decode(const std::string& bytes, std::size_t* consumed)
{
  return Decode(bytes.data(), bytes.size(), consumed);
}

void FrameBuffer::Append(const char* data, std::size_t len)
{
  buf_.append(data, len);
}

std::variant<std::monostate, Envelope, CodecError> FrameBuffer::Next()
{
  if (buf_.size() < kLengthPrefixSize)
    return std::monostate {};
  const std::size_t bodylen = getU32(buf_.data());
  if (bodylen <= kMaxFrameSize && buf_.size() < kLengthPrefixSize + bodylen)
    return std::monostate {};

  std::size_t consumed = 0;
  auto res = Decode(buf_, &consumed);
  if (auto* env = std::get_if<Envelope>(&res)) {
    buf_.erase(0, consumed);
    return std::move(*env);
  }
  buf_.clear();
  return std::get<CodecError>(res);
}

}
