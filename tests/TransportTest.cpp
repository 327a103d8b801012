#include "FakeSocket.hpp"
#include "relayhttp/Errors.hpp"
#include "relayhttp/Timestamp.hpp"
#include "relayhttp/Transport.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace relayhttp;
using relayhttp::fake::FakeServer;
using relayhttp::fake::FakeSocket;

namespace {

  const std::string kRequest = "GET / HTTP/1.1\r\nhost:  example.com\r\n\r\n";

  std::shared_ptr<Transport> connectedTransport(const std::shared_ptr<FakeServer>& server) {
    auto transport = std::make_shared<Transport>(std::make_shared<FakeSocket>(server));
    transport->makeConnection("127.0.0.1", 80);
    return transport;
  }

} // namespace

TEST(Transport, SendsAndFramesResponse) {
  auto server = std::make_shared<FakeServer>();
  server->push(fake::okResponse("hello world", "x-test: 1\r\n"));
  auto transport = connectedTransport(server);

  RawResponse response = transport->sendHttpRequest(kRequest, 1000);
  EXPECT_EQ(response.head, "HTTP/1.1 200 OK\r\ncontent-length: 11\r\nx-test: 1\r\n\r\n");
  EXPECT_EQ(response.body, "hello world");
  EXPECT_FALSE(transport->used());
  EXPECT_EQ(server->requests(), std::vector<std::string>{kRequest});
}

TEST(Transport, ServesSequentialRequests) {
  auto server = std::make_shared<FakeServer>();
  server->push(fake::okResponse("one"));
  server->push(fake::okResponse("two"));
  auto transport = connectedTransport(server);

  EXPECT_EQ(transport->sendHttpRequest(kRequest, 1000).body, "one");
  EXPECT_FALSE(transport->isClosing());
  EXPECT_EQ(transport->sendHttpRequest(kRequest, 1000).body, "two");
}

TEST(Transport, HeadRequestDoesNotWaitForBody) {
  auto server = std::make_shared<FakeServer>();
  server->push("HTTP/1.1 200 OK\r\ncontent-length: 5000\r\n\r\n");
  auto transport = connectedTransport(server);

  RawResponse response = transport->sendHttpRequest("HEAD / HTTP/1.1\r\n\r\n", 1000, false);
  EXPECT_EQ(response.body, "");
}

TEST(Transport, SecondRequestWhileStreamingIsUsageError) {
  auto server = std::make_shared<FakeServer>();
  server->piece = 64;
  server->push("HTTP/1.1 200 OK\r\ntransfer-encoding: chunked\r\n\r\n" + fake::chunked({"first", "second", "third"}));
  server->push(fake::okResponse("after"));
  auto transport = connectedTransport(server);

  StreamedResponse streamed = transport->sendHttpStreamRequest(kRequest, 1000);
  ASSERT_TRUE(streamed.body);
  EXPECT_TRUE(transport->used());
  EXPECT_THROW(transport->sendHttpRequest(kRequest, 1000), UsageError);

  EXPECT_EQ(streamed.body->readAll(), "firstsecondthird");
  EXPECT_TRUE(streamed.body->finished());
  EXPECT_FALSE(transport->used());

  // Nothing was written by the rejected call, the next response is intact.
  EXPECT_EQ(transport->sendHttpRequest(kRequest, 1000).body, "after");
}

TEST(Transport, StreamYieldsChunksLazily) {
  auto server = std::make_shared<FakeServer>();
  server->piece = 3;
  server->push("HTTP/1.1 200 OK\r\n\r\n" + fake::chunked({"abc", "defgh"}));
  auto transport = connectedTransport(server);

  StreamedResponse streamed = transport->sendHttpStreamRequest(kRequest, 1000);
  EXPECT_EQ(streamed.head, "HTTP/1.1 200 OK\r\n\r\n");

  std::string body;
  std::string chunk;
  int pieces = 0;
  while (streamed.body->next(chunk)) {
    EXPECT_FALSE(chunk.empty());
    body += chunk;
    pieces++;
  }
  EXPECT_EQ(body, "abcdefgh");
  EXPECT_GT(pieces, 1);
  EXPECT_FALSE(streamed.body->next(chunk));
}

TEST(Transport, StreamRejectsFixedLength) {
  auto server = std::make_shared<FakeServer>();
  server->push(fake::okResponse("not streamable"));
  auto transport = connectedTransport(server);

  try {
    transport->sendHttpStreamRequest(kRequest, 1000);
    FAIL() << "expected UsageError";
  } catch (const UsageError& e) {
    EXPECT_EQ(e.code(), HttpResult::STREAM_REQUIRES_CHUNKED);
  }
  EXPECT_FALSE(transport->used());
  EXPECT_TRUE(transport->isClosing());
}

TEST(Transport, SilentPeerTimesOut) {
  auto server = std::make_shared<FakeServer>();
  server->when_drained = FakeServer::WhenDrained::TIMEOUT;
  server->push("HTTP/1.1 200 OK\r\ncontent-length: 10\r\n\r\nabc");
  auto transport = connectedTransport(server);

  EXPECT_THROW(transport->sendHttpRequest(kRequest, 1000), TimeoutError);
  EXPECT_FALSE(transport->used());
}

TEST(Transport, PeerClosingMidResponseIsConnectionError) {
  auto server = std::make_shared<FakeServer>();
  server->when_drained = FakeServer::WhenDrained::CLOSE;
  server->push("HTTP/1.1 200 OK\r\ncontent-length: 10\r\n\r\nabc");
  auto transport = connectedTransport(server);

  EXPECT_THROW(transport->sendHttpRequest(kRequest, 1000), ConnectionError);
  EXPECT_TRUE(transport->isClosing());
}

TEST(Transport, MalformedChunkClosesConnection) {
  auto server = std::make_shared<FakeServer>();
  server->push("HTTP/1.1 200 OK\r\n\r\nnope\r\n");
  auto transport = connectedTransport(server);

  EXPECT_THROW(transport->sendHttpRequest(kRequest, 1000), InvalidResponseData);
  EXPECT_TRUE(transport->isClosing());
}

TEST(Transport, UnconnectedTransport) {
  auto server = std::make_shared<FakeServer>();
  Transport transport(std::make_shared<FakeSocket>(server));

  EXPECT_THROW(transport.isClosing(), UsageError);
  EXPECT_THROW(transport.sendHttpRequest(kRequest, 1000), UsageError);
}

TEST(Transport, ConnectFailureIsConnectionError) {
  auto server = std::make_shared<FakeServer>();
  server->refuseConnections(1);
  Transport transport(std::make_shared<FakeSocket>(server));

  try {
    transport.makeConnection("127.0.0.1", 80);
    FAIL() << "expected ConnectionError";
  } catch (const ConnectionError& e) {
    EXPECT_EQ(e.code(), HttpResult::OPEN_TCP_SOCKET_FAILED);
  }
}

TEST(Transport, ConnectingTwiceIsUsageError) {
  auto server = std::make_shared<FakeServer>();
  auto transport = connectedTransport(server);
  EXPECT_THROW(transport->makeConnection("127.0.0.1", 80), UsageError);
}

TEST(Transport, ConnectUsesRemainingBudget) {
  auto server = std::make_shared<FakeServer>();
  Transport transport(std::make_shared<FakeSocket>(server));

  transport.makeConnection("127.0.0.1", 443, Timestamp::getSteadyTimestamp() + 500);
  EXPECT_GT(server->lastConnectBudget(), 0);
  EXPECT_LE(server->lastConnectBudget(), 500);
}

TEST(Transport, ExpiredDeadlineDoesNotConnect) {
  auto server = std::make_shared<FakeServer>();
  Transport transport(std::make_shared<FakeSocket>(server));

  EXPECT_THROW(transport.makeConnection("127.0.0.1", 443, Timestamp::getSteadyTimestamp() - 1), TimeoutError);
  EXPECT_EQ(server->connects(), 0);
}

TEST(Transport, HandshakePastDeadlineIsTimeoutError) {
  auto server = std::make_shared<FakeServer>();
  server->handshake_delay = 2000;
  Transport transport(std::make_shared<FakeSocket>(server));

  try {
    transport.makeConnection("127.0.0.1", 443, Timestamp::getSteadyTimestamp() + 100);
    FAIL() << "expected TimeoutError";
  } catch (const TimeoutError& e) {
    EXPECT_EQ(e.code(), HttpResult::REQUEST_TIMEOUT);
  }
}
