#include <calcmcp/session_store.hpp>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>
#include <sys/random.h>

namespace calcmcp {

std::string generate_random_hex(std::size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    std::size_t filled = 0;
    while (filled < bytes) {
        ssize_t n = getrandom(buffer.data() + filled, bytes - filled, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::runtime_error(std::string("getrandom failed: ") + std::strerror(errno));
        }
        filled += static_cast<std::size_t>(n);
    }

    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes * 2);
    for (unsigned char b : buffer) {
        hex.push_back(digits[b >> 4]);
        hex.push_back(digits[b & 0x0f]);
    }
    return hex;
}

SessionStore::SessionStore(std::chrono::milliseconds timeout, NowFunction now)
    : timeout_(timeout), now_(std::move(now)) {
}

SessionStore::~SessionStore() {
    stop_reaper();
}

bool SessionStore::expired(const Session& session, SessionClock::time_point now) const {
    return now - session.last_seen >= timeout_;
}

std::string SessionStore::create() {
    std::string id = generate_random_hex(16);
    auto now = now_();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_[id] = Session{id, now, now, true};
    return id;
}

bool SessionStore::is_valid(const std::string& id) const {
    auto now = now_();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || !it->second.active) {
        return false;
    }
    return !expired(it->second, now);
}

bool SessionStore::touch(const std::string& id) {
    auto now = now_();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || !it->second.active || expired(it->second, now)) {
        return false;
    }
    it->second.last_seen = now;
    return true;
}

std::size_t SessionStore::reap_expired() {
    auto now = now_();
    std::size_t removed = 0;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        if (expired(it->second, now)) {
            std::cerr << "Cleaned up expired session: " << it->first << std::endl;
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

std::optional<Session> SessionStore::find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t SessionStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

void SessionStore::start_reaper(std::chrono::milliseconds interval) {
    reaper_.start(interval, [this] { reap_expired(); });
}

void SessionStore::stop_reaper() {
    reaper_.stop();
}

} // namespace calcmcp
