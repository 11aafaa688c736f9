#pragma once
#include <string>
#include <functional>
#include <map>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <deque>
#include <vector>
#include <cstdint>

namespace convtrack {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // e.g. "/webhook", without query string
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;

    // Return a header value by case-insensitive name, or "" if absent.
    std::string header(const std::string& name) const;
};

struct HttpResponse {
    int         status       = 200;
    std::string content_type = "text/plain";
    std::string body;
};

// Minimal HTTP/1.1 server, one request per connection. Meant to sit behind a
// reverse proxy that terminates TLS. The accept loop runs in a background
// thread and hands connections to a fixed pool of workers, so the handler is
// called concurrently and must be thread-safe.
class HttpServer {
public:
    using Handler = std::function<HttpResponse(const HttpRequest&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:8080"; port 0 picks a free port
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    // workers:     number of connection-handling threads (at least 1)
    HttpServer(std::string listen_addr, uint32_t max_body, uint32_t workers, Handler handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Start accept and worker threads. Returns false and populates error on failure.
    bool start(std::string& error);

    // Signal the threads to stop and join them. Idempotent.
    void stop();

    // Port actually bound (meaningful after start()).
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void worker_loop();
    void handle_connection(int client_fd) const;
    void close_fds();

    std::string listen_addr_;
    uint32_t    max_body_;
    uint32_t    worker_count_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;
    std::vector<std::thread> workers_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<int> pending_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range. Port 0 is accepted only when
// allow_zero is set.
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port,
                       bool allow_zero = false);

// Decode %XX escapes and '+' in a URL component.
std::string url_decode(const std::string& s);

std::map<std::string, std::string> parse_query_string(const std::string& qs);

} // namespace convtrack
