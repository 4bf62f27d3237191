#include "node.hpp"

#include "errors.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <thread>
#include <vector>

namespace pxvc
{
namespace test
{

using std::chrono::milliseconds;

constexpr uint16_t kTestPort = 47431;

NodeConfig config(const std::string& name, TestCase tc)
{
  NodeConfig cfg;
  cfg.name = name;
  cfg.test_case = tc;
  cfg.progress_interval = milliseconds(100);
  cfg.proof_interval = milliseconds(30);
  return cfg;
}

// each node takes a port pair on loopback
Roster loopback(int n, uint16_t base)
{
  std::vector<RosterEntry> entries;
  for (int i = 0; i < n; ++i)
    entries.push_back(RosterEntry { "n" + std::to_string(i), "127.0.0.1", uint16_t(base + 2 * i) });
  return Roster(std::move(entries));
}

TEST(NodeTest, NotOnRoster)
{
  ASSERT_THROW(Node(config("stranger", TestCase::NormalCase), loopback(3, kTestPort)),
      ConfigError);
}

TEST(NodeTest, SingleNodeInstallsFirstView)
{
  Node node(config("n0", TestCase::NormalCase), loopback(1, kTestPort + 2));
  ASSERT_EQ(0, node.Self());
  ASSERT_EQ(0, node.Run());
  ASSERT_TRUE(node.Finished());
  ASSERT_EQ(1, node.View());
}

TEST(NodeTest, SingleNodeFullRotation)
{
  Node node(config("n0", TestCase::FullRotation), loopback(1, kTestPort + 4));
  ASSERT_EQ(0, node.Run());
  ASSERT_EQ(1, node.View());
}

// runs every node on its own thread, recording who crashed
std::vector<char> runCluster(std::vector<std::unique_ptr<Node>>& nodes)
{
  std::vector<char> crashed(nodes.size(), 0);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < nodes.size(); ++i)
    threads.emplace_back([&, i] {
      try {
        nodes[i]->Run();
      } catch (const SimulatedCrash&) {
        crashed[i] = 1;
      }
    });
  for (auto& t : threads)
    t.join();
  return crashed;
}

TEST(NodeTest, ThreeNodesNormalCase)
{
  const auto roster = loopback(3, kTestPort + 6);
  std::vector<std::unique_ptr<Node>> nodes;
  for (int i = 0; i < 3; ++i)
    nodes.push_back(std::make_unique<Node>(config(roster[i].name, TestCase::NormalCase), roster));

  const auto crashed = runCluster(nodes);
  for (int i = 0; i < 3; ++i) {
    ASSERT_FALSE(crashed[i]);
    ASSERT_EQ(1, nodes[i]->View());
  }
}

TEST(NodeTest, ThreeNodesSurviveLeaderCrash)
{
  const auto roster = loopback(3, kTestPort + 12);
  std::vector<std::unique_ptr<Node>> nodes;
  for (int i = 0; i < 3; ++i)
    nodes.push_back(std::make_unique<Node>(config(roster[i].name, TestCase::SingleCrash), roster));

  const auto crashed = runCluster(nodes);
  ASSERT_TRUE(crashed[1]);
  ASSERT_EQ(0, nodes[1]->View());
  for (int i : { 0, 2 }) {
    ASSERT_FALSE(crashed[i]);
    ASSERT_EQ(2, nodes[i]->View());
  }
}

}
}
