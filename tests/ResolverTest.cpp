#include "relayhttp/Errors.hpp"
#include "relayhttp/Resolver.hpp"
#include "relayhttp/Timestamp.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace relayhttp;

TEST(Resolver, IpLiteralsBypassLookup) {
  std::atomic<int> calls{0};
  Resolver resolver([&](const std::string&) {
    calls++;
    return std::string("10.0.0.1");
  });

  auto v4 = resolver.resolve(Uri::parse("http://192.168.1.5:8080/"));
  EXPECT_EQ(v4.first, "192.168.1.5");
  EXPECT_EQ(v4.second, 8080);

  auto v6 = resolver.resolve(Uri::parse("https://[2001:db8::1]/"));
  EXPECT_EQ(v6.first, "2001:db8::1");
  EXPECT_EQ(v6.second, 443);

  EXPECT_EQ(calls.load(), 0);
}

TEST(Resolver, MemoizesHostnames) {
  std::atomic<int> calls{0};
  Resolver resolver([&](const std::string& host) {
    calls++;
    return host == "a.test" ? std::string("10.0.0.1") : std::string("10.0.0.2");
  });

  EXPECT_EQ(resolver.resolve(Uri::parse("http://a.test/")).first, "10.0.0.1");
  EXPECT_EQ(resolver.resolve(Uri::parse("http://a.test:81/x")).first, "10.0.0.1");
  EXPECT_EQ(resolver.resolve(Uri::parse("http://b.test/")).first, "10.0.0.2");
  EXPECT_EQ(calls.load(), 2);
  EXPECT_TRUE(resolver.cached("a.test"));

  resolver.clear();
  EXPECT_FALSE(resolver.cached("a.test"));
}

TEST(Resolver, ConcurrentLookupsShareOneQuery) {
  std::atomic<int> calls{0};
  Resolver resolver([&](const std::string&) {
    calls++;
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    return std::string("10.1.2.3");
  });

  std::vector<std::string> results(8);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&resolver, &results, i]() {
      results[i] = resolver.lookup("shared.test");
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(calls.load(), 1);
  for (const std::string& result : results) {
    EXPECT_EQ(result, "10.1.2.3");
  }
}

TEST(Resolver, FailuresAreNotCached) {
  int calls = 0;
  Resolver resolver([&](const std::string& host) -> std::string {
    calls++;
    if (calls == 1) {
      throw ConnectionError(HttpResult::HOSTNAME_RESOLUTION_FAILED, "Cannot resolve " + host);
    }
    return "10.0.0.9";
  });

  EXPECT_THROW(resolver.lookup("flaky.test"), ConnectionError);
  EXPECT_FALSE(resolver.cached("flaky.test"));
  EXPECT_EQ(resolver.lookup("flaky.test"), "10.0.0.9");
  EXPECT_EQ(calls, 2);
}

TEST(Resolver, ForeignExceptionsBecomeConnectionErrors) {
  Resolver resolver([](const std::string&) -> std::string {
    throw std::runtime_error("backend down");
  });

  try {
    resolver.lookup("broken.test");
    FAIL() << "expected ConnectionError";
  } catch (const ConnectionError& e) {
    EXPECT_EQ(e.code(), HttpResult::HOSTNAME_RESOLUTION_FAILED);
  }
}

TEST(Resolver, DeadlineBoundsSlowLookup) {
  auto calls = std::make_shared<std::atomic<int>>(0);
  Resolver resolver([calls](const std::string&) {
    (*calls)++;
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    return std::string("10.9.9.9");
  });

  auto started = std::chrono::steady_clock::now();
  EXPECT_THROW(resolver.lookup("slow.test", Timestamp::getSteadyTimestamp() + 50), TimeoutError);
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));

  // The abandoned lookup still completes and is reused.
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  EXPECT_TRUE(resolver.cached("slow.test"));
  EXPECT_EQ(resolver.lookup("slow.test", Timestamp::getSteadyTimestamp() + 50), "10.9.9.9");
  EXPECT_EQ(calls->load(), 1);
}

TEST(Resolver, FastLookupWithinDeadline) {
  Resolver resolver([](const std::string&) { return std::string("10.0.0.7"); });
  auto destination = resolver.resolve(Uri::parse("http://quick.test:8080/"), Timestamp::getSteadyTimestamp() + 1000);
  EXPECT_EQ(destination.first, "10.0.0.7");
  EXPECT_EQ(destination.second, 8080);
}
