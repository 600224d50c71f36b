#include <calcmcp/http_server_host.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace calcmcp {

HttpServerHost::HttpServerHost(ListenOptions options)
    : options_(std::move(options)) {
    server_.set_read_timeout(options_.read_timeout.count(), 0);
    server_.set_write_timeout(options_.write_timeout.count(), 0);
    server_.set_keep_alive_timeout(options_.idle_timeout.count());

    std::size_t workers = options_.max_connections;
    server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
}

HttpServerHost::~HttpServerHost() {
    if (worker_.joinable()) {
        if (!stop(std::chrono::seconds(5))) {
            // Handlers cannot be interrupted, server_ must outlive them
            std::cerr << "Waiting for in-flight requests on " << address() << " to finish" << std::endl;
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    }
}

std::string HttpServerHost::address() const {
    return options_.host + ":" + std::to_string(bound_port_ != 0 ? bound_port_ : options_.port);
}

void HttpServerHost::bind() {
    if (options_.port == 0) {
        bound_port_ = server_.bind_to_any_port(options_.host);
        if (bound_port_ < 0) {
            bound_port_ = 0;
            throw std::runtime_error("failed to bind " + options_.host + " to a free port");
        }
        return;
    }

    if (!server_.bind_to_port(options_.host, options_.port)) {
        throw std::runtime_error("failed to bind " + options_.host + ":" + std::to_string(options_.port));
    }
    bound_port_ = options_.port;
}

void HttpServerHost::serve() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (stop_requested_) {
            serving_ = false;
            state_cv_.notify_all();
            return;
        }
        serving_ = true;
    }

    if (!server_.listen_after_bind()) {
        std::cerr << "HTTP server on " << address() << " stopped listening with an error" << std::endl;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    serving_ = false;
    state_cv_.notify_all();
}

void HttpServerHost::start() {
    bind();
    std::cerr << "Server listening on http://" << address() << std::endl;
    serve();
}

void HttpServerHost::start_background() {
    bind();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        serving_ = true;
    }
    std::cerr << "Server listening on http://" << address() << std::endl;
    worker_ = std::thread([this] { serve(); });
}

bool HttpServerHost::stop(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(state_mutex_);
    stop_requested_ = true;

    // listen() may still be starting up, so keep asking until it returns.
    while (serving_) {
        lock.unlock();
        server_.stop();
        lock.lock();

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now,
                                                                   std::chrono::milliseconds(50));
        state_cv_.wait_for(lock, slice, [this] { return !serving_; });
    }

    if (serving_) {
        std::cerr << "Shutdown of " << address() << " exceeded its deadline of "
                  << timeout.count() << "ms" << std::endl;
        return false;
    }
    lock.unlock();

    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
    return true;
}

} // namespace calcmcp
