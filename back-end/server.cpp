#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "card.hpp"
#include "card_manager.hpp"
#include "http_api.hpp"

using namespace std;

static bool read_until_headers_end(int fd, string& out) {
    out.clear();
    char buf[4096];
    while (out.find("\r\n\r\n") == string::npos) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        out.append(buf, buf + n);
        if (out.size() > 64 * 1024) return false;  // prevent abuse
    }
    return true;
}

int main(int argc, char** argv) {
    int port = 8080;
    if (const char* env_port = getenv("PORT"); env_port && *env_port) {
        port = atoi(env_port);
    }
    if (argc >= 2) port = atoi(argv[1]);
    if (port <= 0) port = 8080;

    int default_workers = 1;
    if (const char* env_workers = getenv("BINGO_WORKERS"); env_workers && *env_workers) {
        int w = 0;
        if (bingo::parse_int(env_workers, w) && w >= 1 && w <= bingo::CardManager::kMaxWorkers) {
            default_workers = w;
        } else {
            cerr << "Ignoring BINGO_WORKERS=" << env_workers << " (expected integer in [1, "
                 << bingo::CardManager::kMaxWorkers << "])\n";
        }
    }

    // One manager per process: every card issued while the server runs is unique.
    std::unique_ptr<bingo::CardManager> manager;
    if (const char* env_seed = getenv("BINGO_SEED"); env_seed && *env_seed) {
        char* end = nullptr;
        errno = 0;
        const unsigned long long seed = strtoull(env_seed, &end, 10);
        if (errno != 0 || end == env_seed || *end != '\0') {
            cerr << "BINGO_SEED must be an unsigned integer, got " << env_seed << "\n";
            return 1;
        }
        manager = std::make_unique<bingo::CardManager>(static_cast<uint64_t>(seed));
        cerr << "Session seeded with " << seed << " (reproducible)\n";
    } else {
        manager = std::make_unique<bingo::CardManager>();
    }
    cerr << "Card space: " << bingo::card_space_size() << " distinct cards, workers: "
         << default_workers << "\n";

    int server_fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        cerr << "socket() failed: " << strerror(errno) << "\n";
        return 1;
    }

    int opt = 1;
    if (::setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        cerr << "setsockopt() failed: " << strerror(errno) << "\n";
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY); // 0.0.0.0
    addr.sin_port = htons(static_cast<uint16_t>(port));

    if (::bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        cerr << "bind() failed: " << strerror(errno) << "\n";
        ::close(server_fd);
        return 1;
    }

    if (::listen(server_fd, 16) != 0) {
        cerr << "listen() failed: " << strerror(errno) << "\n";
        ::close(server_fd);
        return 1;
    }

    cout << "Bingo card server running on http://127.0.0.1:" << port << "\n";
    cout << "API: GET /api/cards?count=10&round=1\n";

    while (true) {
        int client_fd = ::accept(server_fd, nullptr, nullptr);
        if (client_fd < 0) continue;

        string raw;
        if (!read_until_headers_end(client_fd, raw)) {
            ::close(client_fd);
            continue;
        }

        // Request line: METHOD SP TARGET SP HTTP/1.1
        size_t line_end = raw.find("\r\n");
        string req_line = (line_end == string::npos) ? raw : raw.substr(0, line_end);
        istringstream rl(req_line);
        string method, target, version;
        rl >> method >> target >> version;

        bingo::HttpResponse res;
        if (method.empty() || target.empty()) {
            res.status = 400;
            res.body = "Bad Request\n";
        } else {
            try {
                res = bingo::handle_request(*manager, method, target, default_workers);
            } catch (const std::exception& e) {
                cerr << method << " " << target << " failed: " << e.what() << "\n";
                res = bingo::HttpResponse();
                res.status = 500;
                res.body = "Internal Server Error\n";
            }
        }

        string response = bingo::build_http_response(res);
        if (::send(client_fd, response.data(), response.size(), 0) < 0) {
            cerr << "send() failed: " << strerror(errno) << "\n";
        }
        ::close(client_fd);
    }
}
