#include "relayhttp/Cookies.hpp"
#include "relayhttp/Uri.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace relayhttp;

namespace {

  Clock::time_point at(long long seconds) {
    return Clock::time_point{} + std::chrono::seconds(seconds);
  }

  const Clock::time_point kNow = at(1445412480); // 2015-10-21 07:28:00 UTC

} // namespace

TEST(Cookies, DomainMatching) {
  EXPECT_TRUE(cookies::domainMatches("example.com", "example.com"));
  EXPECT_TRUE(cookies::domainMatches("www.Example.com", "example.com"));
  EXPECT_FALSE(cookies::domainMatches("badexample.com", "example.com"));
  EXPECT_FALSE(cookies::domainMatches("example.com", "www.example.com"));
  EXPECT_FALSE(cookies::domainMatches("1.2.3.4", "2.3.4"));
}

TEST(Cookies, DefaultPath) {
  EXPECT_EQ(cookies::defaultPath(""), "/");
  EXPECT_EQ(cookies::defaultPath("/"), "/");
  EXPECT_EQ(cookies::defaultPath("/login"), "/");
  EXPECT_EQ(cookies::defaultPath("/app/login"), "/app");
}

TEST(Cookies, PathMatching) {
  EXPECT_TRUE(cookies::pathMatches("/app", "/app"));
  EXPECT_TRUE(cookies::pathMatches("/app/page", "/app"));
  EXPECT_TRUE(cookies::pathMatches("/app/page", "/app/"));
  EXPECT_FALSE(cookies::pathMatches("/application", "/app"));
  EXPECT_FALSE(cookies::pathMatches("/", "/app"));
}

TEST(Cookies, ParsesCookieDates) {
  auto rfc1123 = cookies::parseCookieDate("Wed, 21 Oct 2015 07:28:00 GMT");
  ASSERT_TRUE(rfc1123.has_value());
  EXPECT_EQ(*rfc1123, at(1445412480));

  auto rfc850 = cookies::parseCookieDate("Sunday, 06-Nov-94 08:49:37 GMT");
  ASSERT_TRUE(rfc850.has_value());
  EXPECT_EQ(*rfc850, at(784111777));

  auto asctime = cookies::parseCookieDate("Sun Nov  6 08:49:37 1994");
  ASSERT_TRUE(asctime.has_value());
  EXPECT_EQ(*asctime, at(784111777));

  EXPECT_FALSE(cookies::parseCookieDate("not a date").has_value());
  EXPECT_FALSE(cookies::parseCookieDate("Wed, 32 Oct 2015 07:28:00 GMT").has_value());
  EXPECT_FALSE(cookies::parseCookieDate("Wed, 21 Oct 2015 25:28:00 GMT").has_value());
}

TEST(CookieJar, HostOnlyCookie) {
  CookieJar jar;
  jar.store("sid=1", Uri::parse("http://example.com/login"), kNow);

  EXPECT_EQ(jar.header(Uri::parse("http://example.com/"), kNow), "sid=1");
  EXPECT_EQ(jar.header(Uri::parse("http://www.example.com/"), kNow), "");

  ASSERT_EQ(jar.size(), 1u);
  EXPECT_TRUE(jar.cookies()[0].host_only);
  EXPECT_EQ(jar.cookies()[0].path, "/");
}

TEST(CookieJar, DomainCookieCoversSubdomains) {
  CookieJar jar;
  jar.store("sid=1; Domain=example.com", Uri::parse("http://www.example.com/"), kNow);

  EXPECT_EQ(jar.header(Uri::parse("http://example.com/"), kNow), "sid=1");
  EXPECT_EQ(jar.header(Uri::parse("http://api.example.com/"), kNow), "sid=1");
  EXPECT_EQ(jar.header(Uri::parse("http://other.com/"), kNow), "");
}

TEST(CookieJar, ForeignDomainIsIgnored) {
  CookieJar jar;
  jar.store("sid=1; Domain=other.com", Uri::parse("http://example.com/"), kNow);
  EXPECT_EQ(jar.size(), 0u);
}

TEST(CookieJar, SecureOnlyOverHttps) {
  CookieJar jar;
  jar.store("token=x; Secure", Uri::parse("https://example.com/"), kNow);

  EXPECT_EQ(jar.header(Uri::parse("https://example.com/"), kNow), "token=x");
  EXPECT_EQ(jar.header(Uri::parse("http://example.com/"), kNow), "");
}

TEST(CookieJar, MaxAgeOverridesExpires) {
  CookieJar jar;
  jar.store("a=1; Expires=Wed, 21 Oct 2015 07:28:00 GMT; Max-Age=100", Uri::parse("http://example.com/"), kNow);

  EXPECT_EQ(jar.header(Uri::parse("http://example.com/"), kNow + std::chrono::seconds(50)), "a=1");
  EXPECT_EQ(jar.header(Uri::parse("http://example.com/"), kNow + std::chrono::seconds(100)), "");

  jar.removeExpired(kNow + std::chrono::seconds(200));
  EXPECT_EQ(jar.size(), 0u);
}

TEST(CookieJar, PastExpiryDeletesCookie) {
  CookieJar jar;
  Uri uri = Uri::parse("http://example.com/");
  jar.store("a=1", uri, kNow);
  ASSERT_EQ(jar.size(), 1u);

  jar.store("a=gone; Max-Age=0", uri, kNow);
  EXPECT_EQ(jar.size(), 0u);

  jar.store("b=1", uri, kNow);
  jar.store("b=gone; Expires=Thu, 01 Jan 1970 00:00:00 GMT", uri, kNow);
  EXPECT_EQ(jar.size(), 0u);
}

TEST(Cookies, FarDatesSaturate) {
  auto distant = cookies::parseCookieDate("Fri, 31 Dec 9999 23:59:59 GMT");
  ASSERT_TRUE(distant.has_value());
  EXPECT_EQ(*distant, Clock::time_point::max());

  auto ancient = cookies::parseCookieDate("Mon, 01 Jan 1601 00:00:00 GMT");
  ASSERT_TRUE(ancient.has_value());
  EXPECT_LT(*ancient, kNow);
}

TEST(CookieJar, DistantExpiryIsKept) {
  CookieJar jar;
  Uri uri = Uri::parse("http://example.com/");
  jar.store("id=1; Expires=Fri, 31 Dec 9999 23:59:59 GMT", uri, kNow);
  EXPECT_EQ(jar.header(uri, kNow), "id=1");
  EXPECT_EQ(jar.header(uri, kNow + std::chrono::hours(24 * 365 * 100)), "id=1");
}

TEST(CookieJar, HugeMaxAgeIsKept) {
  CookieJar jar;
  Uri uri = Uri::parse("http://example.com/");
  jar.store("sid=2; Max-Age=31536000000", uri, kNow);
  EXPECT_EQ(jar.header(uri, kNow), "sid=2");
  ASSERT_EQ(jar.cookies().size(), 1u);
  ASSERT_TRUE(jar.cookies()[0].expiry.has_value());
  EXPECT_EQ(*jar.cookies()[0].expiry, Clock::time_point::max());
}

TEST(CookieJar, ReplacementKeepsCreationTime) {
  CookieJar jar;
  Uri uri = Uri::parse("http://example.com/");
  jar.store("a=1", uri, kNow);
  jar.store("a=2", uri, kNow + std::chrono::seconds(10));

  ASSERT_EQ(jar.size(), 1u);
  EXPECT_EQ(jar.cookies()[0].value, "2");
  EXPECT_EQ(jar.cookies()[0].creation, kNow);
}

TEST(CookieJar, OrdersByPathLengthThenCreation) {
  CookieJar jar;
  Uri uri = Uri::parse("http://example.com/app/page");
  jar.store("first=1; Path=/", uri, kNow);
  jar.store("deep=2; Path=/app", uri, kNow + std::chrono::seconds(1));
  jar.store("second=3; Path=/", uri, kNow + std::chrono::seconds(2));

  EXPECT_EQ(jar.header(uri, kNow + std::chrono::seconds(3)), "deep=2; first=1; second=3");
  EXPECT_EQ(jar.header(Uri::parse("http://example.com/other"), kNow + std::chrono::seconds(3)), "first=1; second=3");
}

TEST(CookieJar, Clear) {
  CookieJar jar;
  jar.store("a=1", Uri::parse("http://example.com/"), kNow);
  jar.clear();
  EXPECT_EQ(jar.size(), 0u);
}
