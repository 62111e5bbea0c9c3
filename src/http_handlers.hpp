#pragma once
#include <boost/beast/http.hpp>
#include <string>
#include "record_store.hpp"

namespace http = boost::beast::http;

// Routes one inspection request against the store:
//   GET / and /health, GET /metrics, GET /locks/<key>.
http::response<http::string_body>
handleRequest(const http::request<http::string_body>& req, RecordStore& store);

http::response<http::string_body>
handleGetLock(const http::request<http::string_body>& req, const std::string& key, RecordStore& store);
