#ifndef PXVC_TRANSPORT_INCLUDED_
#define PXVC_TRANSPORT_INCLUDED_ 1

#include "ifaces.hpp"
#include "msgs.hpp"
#include "net/codec.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <netinet/in.h>

namespace pxvc
{

constexpr uint16_t kDefaultPort = 42069;

struct PeerAddress {
  std::string host;
  uint16_t port;
};

// UDP transport over the roster: the inbound socket listens on port, the
// outbound one is bound to port + 1. Every frame is one datagram.
class UdpTransport : public IDispatcher {
public:
  // resolves every peer, retrying each resolve_attempts times; throws TransportError
  // when a socket cannot be set up
  UdpTransport(int self, const std::vector<PeerAddress>& peers, uint16_t port,
      int resolve_attempts = 20,
      std::chrono::milliseconds resolve_retry = std::chrono::milliseconds(500));
  ~UdpTransport();

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  void SendMsg(int to, const MsgViewChange&) override;
  void SendMsg(int to, const MsgViewChangeProof&) override;
  void Broadcast(const MsgViewChange&) override;
  void Broadcast(const MsgViewChangeProof&) override;

  // next inbound message, waiting at most timeout
  std::optional<Envelope> Receive(std::chrono::milliseconds timeout);

  int Self() const { return self_; }
  std::size_t Reachable() const;
  uint16_t InboundPort() const;

private:
  int send(int to, const Message& msg);
  int broadcast(const Message& msg);
  void drainDatagram(const char* data, std::size_t len);

  const int self_;
  int in_sock_;
  int out_sock_;
  std::vector<std::optional<sockaddr_in>> peers_;
  FrameBuffer inbuf_;
  std::deque<Envelope> received_;
};

}

#endif
