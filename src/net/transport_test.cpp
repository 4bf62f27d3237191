#include "transport.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace pxvc
{
namespace test
{

using std::chrono::milliseconds;

constexpr uint16_t kTestPort = 47411;

void sendRaw(uint16_t port, const std::string& bytes)
{
  const int sock = ::socket(AF_INET, SOCK_DGRAM, 0);
  ASSERT_GE(sock, 0);
  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  const auto n = sendto(sock, bytes.data(), bytes.size(), 0,
      reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
  close(sock);
  ASSERT_EQ(ssize_t(bytes.size()), n);
}

TEST(TransportTest, BroadcastReachesSelf)
{
  UdpTransport tr(0, { { "127.0.0.1", kTestPort } }, kTestPort);
  ASSERT_EQ(1u, tr.Reachable());
  ASSERT_EQ(kTestPort, tr.InboundPort());

  ASSERT_FALSE(tr.Receive(milliseconds(10)));

  tr.Broadcast(MsgViewChange { 3 });
  tr.Broadcast(MsgViewChangeProof { 3, { { 0, 3 } } });
  const auto first = tr.Receive(milliseconds(1000));
  ASSERT_TRUE(first);
  ASSERT_EQ((Envelope { 0, MsgViewChange { 3 } }), *first);
  const auto second = tr.Receive(milliseconds(1000));
  ASSERT_TRUE(second);
  ASSERT_EQ((Envelope { 0, MsgViewChangeProof { 3, { { 0, 3 } } } }), *second);
}

TEST(TransportTest, MalformedDatagramsAreDropped)
{
  UdpTransport tr(0, { { "127.0.0.1", kTestPort + 2 } }, kTestPort + 2);

  sendRaw(kTestPort + 2, std::string("\x00\x00\x00\x0c" "garbagegarba", 16));
  sendRaw(kTestPort + 2, std::string("\x00\x00\x00\x30" "short", 9));
  sendRaw(kTestPort + 2, Encode(0, MsgViewChange { 9 }));

  std::optional<Envelope> env;
  for (int i = 0; i < 10 && !env; ++i)
    env = tr.Receive(milliseconds(200));
  ASSERT_TRUE(env);
  ASSERT_EQ((Envelope { 0, MsgViewChange { 9 } }), *env);
}

TEST(TransportTest, UnreachablePeerDoesNotBlockOthers)
{
  UdpTransport tr(1, { { "no-such-host.invalid", kTestPort + 6 }, { "127.0.0.1", kTestPort + 4 } },
      kTestPort + 4, 1);
  ASSERT_EQ(1u, tr.Reachable());

  tr.SendMsg(0, MsgViewChange { 1 }); // dropped
  tr.SendMsg(7, MsgViewChange { 1 }); // not on the roster
  tr.Broadcast(MsgViewChange { 2 });

  const auto env = tr.Receive(milliseconds(1000));
  ASSERT_TRUE(env);
  ASSERT_EQ((Envelope { 1, MsgViewChange { 2 } }), *env);
  ASSERT_FALSE(tr.Receive(milliseconds(50)));
}

TEST(TransportTest, SendMsgReachesOnlyItsTarget)
{
  const uint16_t base = kTestPort + 12;
  const std::vector<PeerAddress> peers {
    { "127.0.0.1", base }, { "127.0.0.1", uint16_t(base + 2) }, { "127.0.0.1", uint16_t(base + 4) },
  };
  UdpTransport n0(0, peers, peers[0].port);
  UdpTransport n1(1, peers, peers[1].port);
  UdpTransport n2(2, peers, peers[2].port);

  n0.SendMsg(1, MsgViewChangeProof { 4, { { 0, 4 }, { 1, 4 } } });
  const auto env = n1.Receive(milliseconds(1000));
  ASSERT_TRUE(env);
  ASSERT_EQ((Envelope { 0, MsgViewChangeProof { 4, { { 0, 4 }, { 1, 4 } } } }), *env);

  ASSERT_FALSE(n0.Receive(milliseconds(50)));
  ASSERT_FALSE(n2.Receive(milliseconds(50)));
  ASSERT_FALSE(n1.Receive(milliseconds(50)));
}

TEST(TransportTest, BusyPortIsFatal)
{
  UdpTransport tr(0, { { "127.0.0.1", kTestPort + 8 } }, kTestPort + 8);
  // a second node whose port pair overlaps the first one's
  ASSERT_THROW(UdpTransport(0, { { "127.0.0.1", kTestPort + 7 } }, kTestPort + 7, 1),
      TransportError);
}

TEST(TransportTest, SelfMustBeOnPeerList)
{
  ASSERT_THROW(UdpTransport(2, { { "127.0.0.1", kTestPort + 10 } }, kTestPort + 10, 1),
      TransportError);
}

}
}
