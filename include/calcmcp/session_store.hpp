#ifndef CALCMCP_SESSION_STORE_HPP
#define CALCMCP_SESSION_STORE_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <calcmcp/periodic_task.hpp>

namespace calcmcp {

using SessionClock = std::chrono::steady_clock;

struct Session {
    std::string id;
    SessionClock::time_point created_at;
    SessionClock::time_point last_seen;
    bool active = true;
};

// Hex encoding of `bytes` bytes read from the kernel CSPRNG.
std::string generate_random_hex(std::size_t bytes);

/**
 * Sessions of the streamable HTTP transport.
 *
 * Validation takes a shared lock and may run concurrently; creation, touch
 * and reaping take the exclusive lock. A session is expired once
 * `now - last_seen >= timeout`. Only reap_expired() removes sessions.
 */
class SessionStore {
public:
    using NowFunction = std::function<SessionClock::time_point()>;

    explicit SessionStore(std::chrono::milliseconds timeout,
                          NowFunction now = [] { return SessionClock::now(); });
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    // New session with a 128-bit random id
    std::string create();

    bool is_valid(const std::string& id) const;

    // Validate and refresh last_seen under one lock. Returns false, and leaves
    // the session alone, if it is unknown, inactive or already expired.
    bool touch(const std::string& id);

    // Returns the number of sessions removed
    std::size_t reap_expired();

    std::optional<Session> find(const std::string& id) const;
    std::size_t size() const;

    std::chrono::milliseconds timeout() const { return timeout_; }

    // Background reaping, tied to the owning transport's lifecycle
    void start_reaper(std::chrono::milliseconds interval);
    void stop_reaper();

private:
    bool expired(const Session& session, SessionClock::time_point now) const;

    std::chrono::milliseconds timeout_;
    NowFunction now_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Session> sessions_;

    PeriodicTask reaper_;
};

} // namespace calcmcp

#endif // CALCMCP_SESSION_STORE_HPP
