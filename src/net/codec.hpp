#ifndef PXVC_CODEC_INCLUDED_
#define PXVC_CODEC_INCLUDED_ 1

#include "msgs.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>

namespace pxvc
{

// Frame layout, big-endian:
//   u32 length | u32 sender | u32 tag | u32 view [| u32 count | count x (u32 sender, u32 view)]
// length counts the bytes after itself.

// any decode failure, truncated input included
enum class CodecError : char {
  Malformed = 1,
};

enum class MsgTag : uint32_t {
  ViewChange = 2,
  ViewChangeProof = 3,
};

constexpr std::size_t kLengthPrefixSize = 4;
constexpr std::size_t kMaxFrameSize = 64 * 1024;

using DecodeResult = std::variant<Envelope, CodecError>;

// sender and every view must be non-negative; throws std::invalid_argument otherwise
std::string Encode(int from, const Message& msg);

// Decodes the frame at the front of data; *consumed receives its size on success.
// A frame cut short is Malformed, FrameBuffer is the one that waits for more bytes.
DecodeResult Decode(const char* data, std::size_t len, std::size_t* consumed = nullptr);
DecodeResult Decode(const std::string& bytes, std::size_t* consumed = nullptr);

// Delimits frames on a byte stream
class FrameBuffer {
public:
  void Append(const char* data, std::size_t len);

  // monostate while the next frame is incomplete; on Malformed the buffer is reset
  std::variant<std::monostate, Envelope, CodecError> Next();

  std::size_t Size() const { return buf_.size(); }
  void Clear() { buf_.clear(); }

private:
  std::string buf_;
};

}
#endif
