#include "http_api.hpp"

#include <cctype>
#include <exception>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "card.hpp"

namespace bingo {

std::string json_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"': out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    // Control chars -> \u00XX
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    return out;
}

static std::string normalize_method(const std::string& m) {
    std::string out;
    out.reserve(m.size());
    for (unsigned char c : m) {
        if (std::isalpha(c)) out.push_back(static_cast<char>(std::toupper(c)));
    }
    return out;
}

std::unordered_map<std::string, std::string> parse_query(const std::string& query) {
    std::unordered_map<std::string, std::string> out;
    size_t i = 0;
    while (i < query.size()) {
        size_t amp = query.find('&', i);
        if (amp == std::string::npos) amp = query.size();
        std::string part = query.substr(i, amp - i);
        size_t eq = part.find('=');
        if (eq == std::string::npos) {
            out[part] = "";
        } else {
            out[part.substr(0, eq)] = part.substr(eq + 1);
        }
        i = amp + 1;
    }
    return out;
}

bool parse_int(const std::string& s, int& out) {
    if (s.empty()) return false;
    try {
        size_t pos = 0;
        out = std::stoi(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

using Params = std::unordered_map<std::string, std::string>;

static int int_param(const Params& params, const std::string& key, int fallback, bool& ok) {
    auto it = params.find(key);
    if (it == params.end()) return fallback;
    int v = 0;
    if (!parse_int(it->second, v)) ok = false;
    return v;
}

// -----------------------------
// Card encoding
// -----------------------------
static void write_card_json(std::ostringstream& ss, const Card& card) {
    ss << "[";
    for (int row = 0; row < kRows; row++) {
        if (row) ss << ",";
        ss << "[";
        for (int col = 0; col < kCols; col++) {
            if (col) ss << ",";
            if (card.filled(row, col)) {
                ss << static_cast<int>(card.at(row, col));
            } else {
                ss << "null";
            }
        }
        ss << "]";
    }
    ss << "]";
}

static std::string stats_json(const CardManager& manager) {
    const auto s = manager.stats();
    std::ostringstream ss;
    ss << "{\"attempts\":" << s.attempts << ",\"accepted\":" << s.accepted
       << ",\"rejected_duplicate\":" << s.rejected_duplicate
       << ",\"rejected_invalid\":" << s.rejected_invalid << ",\"issued\":" << manager.issued()
       << ",\"prepared\":" << manager.cards().size() << ",\"card_space\":" << card_space_size()
       << "}";
    return ss.str();
}

// -----------------------------
// HTTP handling
// -----------------------------
static std::string status_text(int code) {
    switch (code) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        default: return "OK";
    }
}

static void json_error(HttpResponse& res, int status, const std::string& message) {
    res.status = status;
    res.content_type = "application/json; charset=utf-8";
    res.body = "{\"error\":\"" + json_escape(message) + "\"}";
}

static void handle_cards(HttpResponse& res, CardManager& manager, const Params& params,
                         int default_workers) {
    bool ok = true;
    const int count = int_param(params, "count", 0, ok);
    const int workers = int_param(params, "workers", default_workers, ok);
    const int batch = int_param(params, "batch", CardManager::kDefaultBatchSize, ok);
    if (!ok) {
        json_error(res, 400, "count, workers and batch must be integers");
        return;
    }
    if (count <= 0 || count > kMaxCount) {
        std::ostringstream err;
        err << "count must be an integer between 1 and " << kMaxCount;
        json_error(res, 400, err.str());
        return;
    }
    if (workers < 1 || workers > CardManager::kMaxWorkers || batch < 1) {
        std::ostringstream err;
        err << "workers must be between 1 and " << CardManager::kMaxWorkers
            << ", batch must be >= 1";
        json_error(res, 400, err.str());
        return;
    }

    auto round_it = params.find("round");
    const std::string round = round_it == params.end() ? "" : round_it->second;
    auto format_it = params.find("format");
    const std::string format = format_it == params.end() ? "json" : format_it->second;
    if (format != "json" && format != "text") {
        json_error(res, 400, "format must be json or text");
        return;
    }

    auto gen_err = manager.prepare_parallel(count, workers, batch);
    if (!gen_err.empty()) {
        std::cerr << "prepare(" << count << ") failed: " << gen_err << "\n";
        json_error(res, 500, gen_err);
        return;
    }

    const auto& cards = manager.cards();
    if (!CardManager::validate_unique(cards)) {
        json_error(res, 500, "uniqueness verification failed");
        return;
    }

    std::ostringstream ss;
    if (format == "text") {
        if (!round.empty()) ss << "Round " << round << "\n";
        for (size_t i = 0; i < cards.size(); i++) {
            ss << "Card " << (i + 1) << "\n" << cards[i] << "\n";
        }
        res.body = ss.str();
        return;
    }

    ss << "{\"round\":\"" << json_escape(round) << "\",\"count\":" << cards.size()
       << ",\"unique\":true,\"issued\":" << manager.issued() << ",\"cards\":[";
    for (size_t i = 0; i < cards.size(); i++) {
        if (i) ss << ",";
        write_card_json(ss, cards[i]);
    }
    ss << "]}";

    res.content_type = "application/json; charset=utf-8";
    res.body = ss.str();
}

static void handle_card(HttpResponse& res, const CardManager& manager, const Params& params) {
    int index = 0;
    auto it = params.find("index");
    if (it == params.end() || !parse_int(it->second, index)) {
        json_error(res, 400, "index must be an integer");
        return;
    }
    try {
        const auto& card = manager.get(index);
        std::ostringstream ss;
        ss << "{\"index\":" << index << ",\"card\":";
        write_card_json(ss, card);
        ss << "}";
        res.content_type = "application/json; charset=utf-8";
        res.body = ss.str();
    } catch (const std::out_of_range& e) {
        json_error(res, 404, e.what());
    }
}

HttpResponse handle_request(CardManager& manager, const std::string& method,
                            const std::string& target, int default_workers) {
    HttpResponse res;
    res.headers["Cache-Control"] = "no-store";
    res.headers["Access-Control-Allow-Origin"] = "*";
    res.headers["Access-Control-Allow-Methods"] = "GET, HEAD";

    const std::string m = normalize_method(method);
    const bool is_get = (m == "GET");
    const bool is_head = (m == "HEAD");
    if (!is_get && !is_head) {
        json_error(res, 405, "method " + method + " not allowed");
        return res;
    }

    std::string path = target;
    std::string query;
    if (auto q = target.find('?'); q != std::string::npos) {
        path = target.substr(0, q);
        query = target.substr(q + 1);
    }
    const auto params = parse_query(query);

    if (path == "/api/cards") {
        handle_cards(res, manager, params, default_workers);
    } else if (path == "/api/card") {
        handle_card(res, manager, params);
    } else if (path == "/api/verify") {
        const auto& cards = manager.cards();
        std::ostringstream ss;
        ss << "{\"unique\":" << (CardManager::validate_unique(cards) ? "true" : "false")
           << ",\"count\":" << cards.size() << "}";
        res.content_type = "application/json; charset=utf-8";
        res.body = ss.str();
    } else if (path == "/api/stats") {
        res.content_type = "application/json; charset=utf-8";
        res.body = stats_json(manager);
    } else if (path == "/api/reset") {
        manager.reset();
        res.content_type = "application/json; charset=utf-8";
        res.body = "{\"reset\":true}";
    } else {
        json_error(res, 404, "unknown route " + path);
    }

    if (is_head) res.body.clear();
    return res;
}

std::string build_http_response(const HttpResponse& r) {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << r.status << " " << status_text(r.status) << "\r\n";
    ss << "Connection: close\r\n";
    ss << "Content-Type: " << r.content_type << "\r\n";
    ss << "Content-Length: " << r.body.size() << "\r\n";
    for (const auto& [k, v] : r.headers) ss << k << ": " << v << "\r\n";
    ss << "\r\n";
    ss << r.body;
    return ss.str();
}

}  // namespace bingo
