// Repository: Mapcycle-enforcer
// Component: Remote Console Client tests
// Purpose: Fallback channel conversation against a loopback console server.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "fixtures/LoopbackRconServer.h"
#include "mapcycle/channel/ChannelError.hpp"
#include "mapcycle/channel/RconClient.hpp"
#include "mapcycle/channel/RconRotationChannel.hpp"

namespace mapcycle::channel {
namespace {

using tests::LoopbackRconServer;

constexpr char kPassword[] = "hunter2";

// A loopback port with nothing listening on it.
uint16_t UnusedPort() {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
  ::close(fd);
  return ntohs(addr.sin_port);
}

class RconClientTest : public ::testing::Test {
 protected:
  RconSettings Settings(const std::string& password = kPassword,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    RconSettings settings;
    settings.host = "127.0.0.1";
    settings.port = server_.port();
    settings.password = password;
    settings.timeout = timeout;
    return settings;
  }

  // Runs `fn` and returns the failure kind it threw.
  template <typename Fn>
  static ChannelFailure FailureOf(Fn&& fn) {
    try {
      fn();
    } catch (const FallbackChannelError& e) {
      return e.failure();
    }
    ADD_FAILURE() << "expected FallbackChannelError";
    return ChannelFailure::kTransport;
  }

  LoopbackRconServer server_{kPassword};
};

// -----------------------------------------------------------------------------
// Conversation
// -----------------------------------------------------------------------------

TEST_F(RconClientTest, LoginListAddRemove) {
  server_.SetQueue({"foy", "carentan"});
  RconClient client(Settings());
  client.Connect();
  ASSERT_TRUE(client.IsConnected());

  EXPECT_EQ(client.ListRotation(), (std::vector<std::string>{"foy", "carentan"}));
  client.RemoveMap("foy");
  client.AddMap("stmere");
  EXPECT_EQ(server_.Queue(), (std::vector<std::string>{"carentan", "stmere"}));

  const auto commands = server_.Commands();
  ASSERT_EQ(commands.size(), 4u);
  EXPECT_EQ(commands[0], std::string("login ") + kPassword);
  EXPECT_EQ(commands[1], "rotlist");
  EXPECT_EQ(commands[2], "rotdel foy");
  EXPECT_EQ(commands[3], "rotadd stmere");
}

TEST_F(RconClientTest, EmptyListing) {
  RconClient client(Settings());
  client.Connect();
  EXPECT_TRUE(client.ListRotation().empty());
}

TEST_F(RconClientTest, CrlfListingIsTrimmed) {
  server_.set_crlf_listing(true);
  server_.SetQueue({"foy", "hill400"});
  RconClient client(Settings());
  client.Connect();
  EXPECT_EQ(client.ListRotation(), (std::vector<std::string>{"foy", "hill400"}));
}

TEST_F(RconClientTest, TrickledRepliesAreReassembled) {
  server_.set_trickle_replies(true);
  server_.SetQueue({"kharkov", "kursk", "driel"});
  RconClient client(Settings());
  client.Connect();
  EXPECT_EQ(client.ListRotation(), (std::vector<std::string>{"kharkov", "kursk", "driel"}));
}

TEST_F(RconClientTest, CloseIsIdempotent) {
  RconClient client(Settings());
  client.Connect();
  client.Close();
  client.Close();
  EXPECT_FALSE(client.IsConnected());
  EXPECT_EQ(FailureOf([&] { client.ListRotation(); }), ChannelFailure::kNotConnected);
}

// -----------------------------------------------------------------------------
// Failures
// -----------------------------------------------------------------------------

TEST_F(RconClientTest, WrongPasswordIsAuthenticationFailure) {
  RconClient client(Settings("wrong"));
  EXPECT_EQ(FailureOf([&] { client.Connect(); }), ChannelFailure::kAuthentication);
  EXPECT_FALSE(client.IsConnected());
}

TEST_F(RconClientTest, RefusedConnectionIsTransportFailure) {
  RconSettings settings = Settings();
  settings.port = UnusedPort();
  RconClient client(settings);
  EXPECT_EQ(FailureOf([&] { client.Connect(); }), ChannelFailure::kTransport);
}

TEST_F(RconClientTest, SilentServerTimesOut) {
  server_.set_silent(true);
  RconClient client(Settings(kPassword, std::chrono::milliseconds(200)));
  client.Connect();

  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(FailureOf([&] { client.ListRotation(); }), ChannelFailure::kTimeout);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST_F(RconClientTest, OperationDeadlineCapsPerCommandTimeout) {
  server_.set_silent(true);
  RconClient client(Settings(kPassword, std::chrono::seconds(5)));
  client.Connect();

  const auto start = std::chrono::steady_clock::now();
  client.SetOperationDeadline(start + std::chrono::milliseconds(200));
  EXPECT_EQ(FailureOf([&] { client.AddMap("foy"); }), ChannelFailure::kTimeout);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST_F(RconClientTest, PassedDeadlineSendsNothing) {
  auto channel = MakeRconChannelFactory(Settings())();
  channel->SetDeadline(std::chrono::steady_clock::now() - std::chrono::milliseconds(1));
  try {
    channel->AddMaps({"foy", "kursk"});
    FAIL() << "expected FallbackChannelError";
  } catch (const FallbackChannelError& e) {
    EXPECT_EQ(e.failure(), ChannelFailure::kTimeout);
  }
  // Only the login reached the server.
  EXPECT_EQ(server_.Commands().size(), 1u);
}

TEST_F(RconClientTest, MismatchedReplyIdIsMalformed) {
  server_.set_wrong_reply_id(true);
  RconClient client(Settings());
  EXPECT_EQ(FailureOf([&] { client.Connect(); }), ChannelFailure::kMalformed);
}

TEST_F(RconClientTest, RemovingAbsentMapIsRejected) {
  server_.SetQueue({"foy"});
  RconClient client(Settings());
  client.Connect();
  EXPECT_EQ(FailureOf([&] { client.RemoveMap("utah"); }), ChannelFailure::kRejected);
}

TEST_F(RconClientTest, WhitespaceInIdentifierIsRejectedLocally) {
  RconClient client(Settings());
  client.Connect();
  EXPECT_EQ(FailureOf([&] { client.AddMap("foy warfare"); }), ChannelFailure::kRejected);
  EXPECT_EQ(FailureOf([&] { client.AddMap(""); }), ChannelFailure::kRejected);
  // Only the login reached the server.
  EXPECT_EQ(server_.Commands().size(), 1u);
}

// -----------------------------------------------------------------------------
// Rotation channel
// -----------------------------------------------------------------------------

TEST_F(RconClientTest, FactoryOpensAuthenticatedChannel) {
  server_.SetQueue({"a", "b"});
  auto factory = MakeRconChannelFactory(Settings());
  {
    auto channel = factory();
    EXPECT_STREQ(channel->Name(), "fallback");
    EXPECT_EQ(channel->ListRotation(), (std::vector<std::string>{"a", "b"}));
    channel->RemoveMaps({"a"});
    channel->AddMaps({"c", "d"});
  }
  EXPECT_EQ(server_.Queue(), (std::vector<std::string>{"b", "c", "d"}));

  // A second session after the first one closed.
  auto again = factory();
  EXPECT_EQ(again->ListRotation(), (std::vector<std::string>{"b", "c", "d"}));
  EXPECT_EQ(server_.connections(), 2);
}

TEST_F(RconClientTest, FactoryPropagatesLoginFailure) {
  auto factory = MakeRconChannelFactory(Settings("wrong"));
  EXPECT_THROW(factory(), FallbackChannelError);
}

}  // namespace
}  // namespace mapcycle::channel
