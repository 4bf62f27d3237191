#include "transport.hpp"

#include "errors.hpp"
#include "util/logger.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netdb.h>
#include <poll.h>
#include <stdexcept>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

namespace pxvc
{

namespace
{

std::optional<sockaddr_in> resolve(const PeerAddress& peer)
{
  addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;

  addrinfo* res = nullptr;
  const auto port = std::to_string(peer.port);
  const int rc = getaddrinfo(peer.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0 || res == nullptr) {
    log_debug("resolving {}:{} failed: {}", peer.host, peer.port, gai_strerror(rc));
    return std::nullopt;
  }
  sockaddr_in addr;
  std::memcpy(&addr, res->ai_addr, sizeof(addr));
  freeaddrinfo(res);
  return addr;
}

int bindUdp(uint16_t port)
{
  const int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (sock < 0)
    throw TransportError(std::string("socket: ") + std::strerror(errno));

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(port);
  if (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    const auto err = errno;
    close(sock);
    throw TransportError("bind to port " + std::to_string(port) + ": " + std::strerror(err));
  }
  return sock;
}

}

UdpTransport::UdpTransport(int self, const std::vector<PeerAddress>& peers, uint16_t port,
    int resolve_attempts, std::chrono::milliseconds resolve_retry)
  : self_(self)
  , in_sock_(-1)
  , out_sock_(-1)
  , peers_(peers.size())
{
  if (self_ < 0 || std::size_t(self_) >= peers.size())
    throw TransportError("self " + std::to_string(self) + " is not in the peer list");

  in_sock_ = bindUdp(port);
  try {
    out_sock_ = bindUdp(uint16_t(port + 1));
  } catch (...) {
    close(in_sock_);
    throw;
  }

  // containers come up in any order; their names may not resolve yet
  for (std::size_t i = 0; i < peers.size(); ++i) {
    for (int attempt = 0; attempt < resolve_attempts && !peers_[i]; ++attempt) {
      if (attempt > 0)
        std::this_thread::sleep_for(resolve_retry);
      peers_[i] = resolve(peers[i]);
    }
    if (peers_[i])
      log_info("{}: peer {} is {}:{}", self_, i, peers[i].host, peers[i].port);
    else
      log_warn("{}: peer {} ({}) unresolved, treating as unreachable", self_, i, peers[i].host);
  }
}

UdpTransport::~UdpTransport()
{
  if (in_sock_ >= 0)
    close(in_sock_);
  if (out_sock_ >= 0)
    close(out_sock_);
}

void UdpTransport::SendMsg(int to, const MsgViewChange& vc)
{
  send(to, vc);
}

void UdpTransport::SendMsg(int to, const MsgViewChangeProof& vcp)
{
  send(to, vcp);
}

void UdpTransport::Broadcast(const MsgViewChange& vc)
{
  broadcast(vc);
}

void UdpTransport::Broadcast(const MsgViewChangeProof& vcp)
{
  broadcast(vcp);
}

std::size_t UdpTransport::Reachable() const
{
  std::size_t cnt = 0;
  for (const auto& p : peers_)
    if (p)
      ++cnt;
  return cnt;
}

uint16_t UdpTransport::InboundPort() const
{
  sockaddr_in addr;
  socklen_t len = sizeof(addr);
  if (getsockname(in_sock_, reinterpret_cast<sockaddr*>(&addr), &len) < 0)
    return 0;
  return ntohs(addr.sin_port);
}

std::optional<Envelope> UdpTransport::Receive(std::chrono::milliseconds timeout)
{
  if (received_.empty()) {
    pollfd pfd { in_sock_, POLLIN, 0 };
    const int rc = poll(&pfd, 1, int(timeout.count()));
    if (rc < 0 && errno != EINTR)
      log_warn("{}: poll: {}", self_, std::strerror(errno));
    if (rc <= 0)
      return std::nullopt;

    std::string buf(kLengthPrefixSize + kMaxFrameSize, '\0');
    const auto n = recvfrom(in_sock_, &buf[0], buf.size(), MSG_DONTWAIT, nullptr, nullptr);
    if (n < 0) {
      if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)
        log_warn("{}: recvfrom: {}", self_, std::strerror(errno));
      return std::nullopt;
    }
    drainDatagram(buf.data(), std::size_t(n));
  }

  if (received_.empty())
    return std::nullopt;
  auto env = std::move(received_.front());
  received_.pop_front();
  return env;
}

int UdpTransport::send(int to, const Message& msg)
{
  if (to < 0 || std::size_t(to) >= peers_.size()) {
    log_warn("{}: refusing to send {} to unknown node {}", self_, toString(msg), to);
    return -1;
  }
  if (!peers_[to]) {
    log_trace("{}: node {} unreachable, dropping {}", self_, to, toString(msg));
    return -2;
  }

  std::string frame;
  try {
    frame = Encode(self_, msg);
  } catch (const std::invalid_argument& e) {
    log_error("{}: cannot send {} to {}: {}", self_, toString(msg), to, e.what());
    return -4;
  }
  const auto& addr = *peers_[to];
  const auto n = sendto(out_sock_, frame.data(), frame.size(), MSG_DONTWAIT,
      reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  if (n < 0 || std::size_t(n) != frame.size()) {
    log_debug("{}: sending {} to {} failed: {}", self_, toString(msg), to, std::strerror(errno));
    return -3;
  }
  log_trace("{}->{} {}", self_, to, toString(msg));
  return 0;
}

int UdpTransport::broadcast(const Message& msg)
{
  int delivered = 0;
  for (std::size_t i = 0; i < peers_.size(); ++i)
    if (send(int(i), msg) == 0)
      ++delivered;
  return delivered;
}

void UdpTransport::drainDatagram(const char* data, std::size_t len)
{
  inbuf_.Append(data, len);
  while (true) {
    auto next = inbuf_.Next();
    if (auto* env = std::get_if<Envelope>(&next)) {
      received_.push_back(std::move(*env));
      continue;
    }
    if (std::holds_alternative<CodecError>(next))
      log_warn("{}: dropping malformed datagram of {} bytes", self_, len);
    break;
  }
  if (inbuf_.Size() > 0) {
    log_warn("{}: dropping truncated frame of {} bytes", self_, inbuf_.Size());
    inbuf_.Clear();
  }
}

}
