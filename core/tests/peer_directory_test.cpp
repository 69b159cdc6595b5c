#include <gtest/gtest.h>
#include "pxf/net/peer_directory.h"

using pxf::net::StaticPeerDirectory;

TEST(PeerDirectory, LoadsPeerList) {
  StaticPeerDirectory dir;
  dir.load("1=127.0.0.1:9000,2=node-b.local:9001");
  EXPECT_EQ(dir.size(), 2u);

  auto p = dir.resolve(2);
  ASSERT_TRUE(p.has_value());
  EXPECT_EQ(p->id, 2u);
  EXPECT_EQ(p->host, "node-b.local");
  EXPECT_EQ(p->port, 9001);

  EXPECT_FALSE(dir.resolve(3).has_value());
}

TEST(PeerDirectory, EmptyListIsFine) {
  StaticPeerDirectory dir;
  dir.load("");
  EXPECT_EQ(dir.size(), 0u);
}

TEST(PeerDirectory, MalformedEntriesThrow) {
  StaticPeerDirectory dir;
  EXPECT_THROW(dir.load("1=localhost"), std::runtime_error);
  EXPECT_THROW(dir.load("x=localhost:9000"), std::runtime_error);
  EXPECT_THROW(dir.load("1=localhost:0"), std::runtime_error);
  EXPECT_THROW(dir.load("1=localhost:70000"), std::runtime_error);
  EXPECT_THROW(dir.load("1=:9000"), std::runtime_error);
}

TEST(PeerDirectory, RemoveForgetsPeer) {
  StaticPeerDirectory dir;
  dir.add({5, "h", 1});
  EXPECT_TRUE(dir.remove(5));
  EXPECT_FALSE(dir.remove(5));
  EXPECT_FALSE(dir.resolve(5).has_value());
}
