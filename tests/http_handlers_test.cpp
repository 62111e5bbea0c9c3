#include <gtest/gtest.h>
#include <chrono>
#include <string>
#include "http_handlers.hpp"

using namespace std::chrono_literals;

namespace {

http::request<http::string_body> makeRequest(http::verb verb, const std::string& target) {
    http::request<http::string_body> req{verb, target, 11};
    req.keep_alive(true);
    return req;
}

TEST(HttpHandlersTest, Health) {
    RecordStore store;
    auto res = handleRequest(makeRequest(http::verb::get, "/health"), store);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "record-store-service");
    EXPECT_TRUE(res.keep_alive());
}

TEST(HttpHandlersTest, MetricsCountRequests) {
    RecordStore store;
    handleRequest(makeRequest(http::verb::get, "/"), store);
    auto res = handleRequest(makeRequest(http::verb::get, "/metrics"), store);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_NE(res.body().find("http_requests_total 2\n"), std::string::npos);
    EXPECT_NE(res.body().find("http_requests_total{route=\"health\"} 1\n"), std::string::npos);
}

TEST(HttpHandlersTest, LockInspection) {
    RecordStore store;
    auto missing = handleRequest(makeRequest(http::verb::get, "/locks/txn-1"), store);
    EXPECT_EQ(missing.result(), http::status::not_found);

    ASSERT_TRUE(store.acquireLock("txn-1", "worker \"7\""));
    auto res = handleRequest(makeRequest(http::verb::get, "/locks/txn-1"), store);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "{\"key\":\"txn-1\",\"holder\":\"worker \\\"7\\\"\",\"expires_in_ms\":null}");
}

TEST(HttpHandlersTest, LockInspectionReportsRemainingHold) {
    RecordStore store;
    ASSERT_TRUE(store.acquireLock("txn-2", "a", 60s));
    auto res = handleRequest(makeRequest(http::verb::get, "/locks/txn-2?verbose=1"), store);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body().find("\"expires_in_ms\":null"), std::string::npos);
    EXPECT_NE(res.body().find("\"expires_in_ms\":"), std::string::npos);
}

TEST(HttpHandlersTest, LockInspectionDecodesKey) {
    RecordStore store;
    ASSERT_TRUE(store.acquireLock("flow run?/50%", "a"));
    auto res = handleRequest(makeRequest(http::verb::get, "/locks/flow%20run%3F%2F50%25"), store);
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "{\"key\":\"flow run?/50%\",\"holder\":\"a\",\"expires_in_ms\":null}");

    EXPECT_EQ(handleRequest(makeRequest(http::verb::get, "/locks/bad%2"), store).result(),
              http::status::bad_request);
    EXPECT_EQ(handleRequest(makeRequest(http::verb::get, "/locks/bad%zz"), store).result(),
              http::status::bad_request);
}

TEST(HttpHandlersTest, UnknownRouteAndMethod) {
    RecordStore store;
    EXPECT_EQ(handleRequest(makeRequest(http::verb::get, "/kv/x"), store).result(), http::status::not_found);
    EXPECT_EQ(handleRequest(makeRequest(http::verb::post, "/locks/x"), store).result(),
              http::status::method_not_allowed);
}

}  // namespace
