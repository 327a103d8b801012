#include "relayhttp/Request.hpp"

#include <gtest/gtest.h>

#include <string>

using relayhttp::Request;

TEST(Request, SerializesWireFormat) {
  Request request("POST", "http://example.com/submit?a=1");
  request.headers().set("Content-Type", "text/plain");
  request.setBody("hello");

  EXPECT_EQ(request.serialize(),
    "POST /submit?a=1 HTTP/1.1\r\n"
    "host:  example.com\r\n"
    "content-length:  5\r\n"
    "content-type:  text/plain\r\n"
    "\r\n"
    "hello");
}

TEST(Request, NoContentLengthWithoutBody) {
  Request request("GET", "http://example.com");
  EXPECT_EQ(request.serialize(), "GET / HTTP/1.1\r\nhost:  example.com\r\n\r\n");
}

TEST(Request, HostCarriesNonDefaultPort) {
  Request custom("GET", "http://example.com:8080/x");
  EXPECT_NE(custom.serialize().find("host:  example.com:8080\r\n"), std::string::npos);

  Request standard("GET", "https://example.com:443/x");
  EXPECT_NE(standard.serialize().find("host:  example.com\r\n"), std::string::npos);
}

TEST(Request, UserHostHeaderIsReplaced) {
  Request request("GET", "http://example.com/");
  request.headers().set("Host", "spoofed");
  const std::string& raw = request.serialize();
  EXPECT_EQ(raw.find("spoofed"), std::string::npos);
}

TEST(Request, CacheDroppedOnEveryMutation) {
  Request request("GET", "http://example.com/");
  std::string first = request.serialize();

  request.headers().set("x-test", "1");
  std::string with_header = request.serialize();
  EXPECT_NE(first, with_header);
  EXPECT_NE(with_header.find("x-test:  1\r\n"), std::string::npos);

  request.setMethod("PUT");
  EXPECT_EQ(request.serialize().compare(0, 4, "PUT "), 0);

  request.setUrl("http://other.org/path");
  EXPECT_NE(request.serialize().find("host:  other.org"), std::string::npos);

  request.setBody("abc");
  EXPECT_NE(request.serialize().find("content-length:  3"), std::string::npos);
}

TEST(Request, SerializeIsStableWithoutChanges) {
  Request request("GET", "http://example.com/");
  const std::string& first = request.serialize();
  const std::string& second = request.serialize();
  EXPECT_EQ(&first, &second);
}
