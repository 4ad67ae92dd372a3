#pragma once

#include <string>
#include <unordered_map>

#include "card_manager.hpp"

namespace bingo {

// Largest batch a single request may ask for.
constexpr int kMaxCount = 50000;

struct HttpResponse {
    int status = 200;
    std::string content_type = "text/plain; charset=utf-8";
    std::string body;
    std::unordered_map<std::string, std::string> headers;
};

std::string json_escape(const std::string& s);
std::unordered_map<std::string, std::string> parse_query(const std::string& query);

// Strict integer parse: the whole string must be a base-10 int.
bool parse_int(const std::string& s, int& out);

// Routes one request against the session held by `manager`.
// `default_workers` applies when /api/cards carries no workers parameter.
HttpResponse handle_request(CardManager& manager, const std::string& method,
                            const std::string& target, int default_workers = 1);

std::string build_http_response(const HttpResponse& r);

}  // namespace bingo
