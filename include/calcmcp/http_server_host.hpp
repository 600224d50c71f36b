#ifndef CALCMCP_HTTP_SERVER_HOST_HPP
#define CALCMCP_HTTP_SERVER_HOST_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>
#include <httplib.h>

namespace calcmcp {

struct ListenOptions {
    std::string host = "0.0.0.0";
    int port = 8080;  // 0 picks a free port
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{30};
    std::chrono::seconds idle_timeout{120};
    std::size_t max_connections = 100;
};

/**
 * Owns the httplib::Server of a transport and its listen lifecycle.
 *
 * stop() performs a bounded drain: the listening socket is closed, requests
 * already being handled are allowed to finish, and the call reports whether
 * that happened before the deadline. A late handler is not interrupted; it
 * keeps running, and the destructor waits for it.
 */
class HttpServerHost {
public:
    explicit HttpServerHost(ListenOptions options);
    ~HttpServerHost();

    HttpServerHost(const HttpServerHost&) = delete;
    HttpServerHost& operator=(const HttpServerHost&) = delete;

    httplib::Server& server() { return server_; }

    // Bind and serve on the calling thread until stop(). Throws
    // std::runtime_error if the address cannot be bound.
    void start();

    // Bind, then serve on a background thread.
    void start_background();

    // Returns false when in-flight requests did not finish within timeout.
    bool stop(std::chrono::milliseconds timeout);

    int port() const { return bound_port_; }
    std::string address() const;

private:
    void bind();
    void serve();

    ListenOptions options_;
    httplib::Server server_;
    int bound_port_ = 0;
    std::thread worker_;

    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    bool serving_ = false;
    bool stop_requested_ = false;
};

} // namespace calcmcp

#endif // CALCMCP_HTTP_SERVER_HOST_HPP
