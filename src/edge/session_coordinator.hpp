#pragma once

#include "common/config.hpp"
#include "common/error.hpp"
#include "common/frame.hpp"
#include "edge/pending_request.hpp"
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolrelay::edge {

namespace net = boost::asio;

// ============================================================================
// Session transport
// ============================================================================

/**
 * The socket side of a Session as seen by the coordinator.
 *
 * Both calls are non-blocking and safe from any thread. send_frame queues the
 * frame on the session's write channel and returns false when it could not.
 */
class ISessionTransport {
public:
    virtual ~ISessionTransport() = default;

    virtual bool send_frame(const wire::Frame& frame) = 0;
    virtual void close(const std::string& reason) = 0;
    virtual std::string remote_address() const = 0;
};

// Identifies a registered session
struct SessionHandle {
    std::string project_id;
    uint64_t generation = 0;
};

struct SessionInfo {
    uint64_t generation = 0;
    std::string remote_address;
    std::chrono::system_clock::time_point connected_at;
    std::chrono::system_clock::time_point last_heartbeat_at;
    size_t pending = 0;
};

struct CoordinatorStats {
    size_t projects = 0;
    size_t online = 0;
    size_t pending = 0;
    uint64_t calls_routed = 0;
    uint64_t calls_completed = 0;
    uint64_t stale_frames = 0;
};

// ============================================================================
// Session Coordinator
// ============================================================================

/**
 * SessionCoordinator - owns the project -> Session and id -> PendingRequest maps.
 *
 * At most one Session is live per project. Registering a new one retires the
 * previous generation and fails its pending requests with SUPERSEDED. Each
 * project has its own mutex; the project map itself is behind a shared_mutex
 * so different projects never contend. No lock is held while a frame is sent,
 * a transport is closed or a PendingRequest is settled.
 */
class SessionCoordinator {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionCoordinator(RelayTimings timings);

    SessionCoordinator(const SessionCoordinator&) = delete;
    SessionCoordinator& operator=(const SessionCoordinator&) = delete;

    // Add a project, or rotate its credentials. A changed relay token revokes
    // the live session and its pending requests.
    void set_project(const ProjectConfig& project);

    // Drop projects not in `projects`, add or rotate the rest.
    void sync_projects(const std::vector<ProjectConfig>& projects);

    bool remove_project(const std::string& project_id);
    bool has_project(const std::string& project_id) const;
    std::vector<std::string> project_ids() const;

    // Constant-time token checks. False for unknown projects.
    bool authenticate_relay(const std::string& project_id, std::string_view token) const;
    bool authenticate_agent(const std::string& project_id, std::string_view token) const;

    // Validate the relay token and install `transport` as the project's session.
    std::expected<SessionHandle, RelayError> register_session(
        const std::string& project_id,
        std::string_view relay_token,
        std::shared_ptr<ISessionTransport> transport);

    // Create a PendingRequest and send the Call frame. Fails with OFFLINE
    // without waiting when the project has no session.
    std::expected<std::shared_ptr<PendingRequest>, RelayError> route_call(
        const std::string& project_id,
        const std::string& method,
        boost::json::object params,
        net::any_io_executor executor,
        std::chrono::milliseconds timeout);

    // Deliver a Response or Error frame. Returns false if it was dropped.
    bool complete(const std::string& project_id, uint64_t generation, wire::Frame frame);

    // Any inbound frame counts as a sign of life.
    void record_heartbeat(const std::string& project_id, uint64_t generation);

    // The session's socket ended. No-op when `generation` is no longer current.
    void close_session(const std::string& project_id, uint64_t generation,
                       ErrorKind kind = ErrorKind::DISCONNECTED,
                       const std::string& reason = "session closed");

    // Remove a pending request without waiting for its reply.
    bool retire_pending(const std::string& project_id, const std::string& id, RelayError reason);

    // Close silent sessions and expire overdue requests. Returns entries removed.
    size_t sweep(Clock::time_point now = Clock::now());

    // Periodic sweep until shutdown().
    net::awaitable<void> run_sweeper(std::chrono::milliseconds interval);

    void update_tools(const std::string& project_id, uint64_t generation, boost::json::array tools);
    boost::json::array tools(const std::string& project_id) const;

    bool is_online(const std::string& project_id) const;
    std::optional<SessionInfo> session_info(const std::string& project_id) const;
    size_t pending_count(const std::string& project_id) const;
    CoordinatorStats stats() const;

    const RelayTimings& timings() const { return timings_; }

    // Close every session and fail every pending request.
    void shutdown();

private:
    struct Session {
        uint64_t generation = 0;
        std::shared_ptr<ISessionTransport> transport;
        std::string remote_address;
        std::chrono::system_clock::time_point connected_at;
        std::chrono::system_clock::time_point last_heartbeat_at;
        Clock::time_point last_seen;
    };

    struct ProjectState {
        mutable std::mutex mutex;
        CredentialPair credentials;
        std::optional<Session> session;
        uint64_t next_generation = 1;
        std::unordered_map<std::string, std::shared_ptr<PendingRequest>> pending;
        boost::json::array tools;
    };

    using PendingList = std::vector<std::shared_ptr<PendingRequest>>;

    std::shared_ptr<ProjectState> find(const std::string& project_id) const;

    // Detach the live session and its pending requests. Caller holds state.mutex.
    static std::shared_ptr<ISessionTransport> detach_session(ProjectState& state, PendingList& out);

    static void fail_all(PendingList& pending, ErrorKind kind, const std::string& message);

    RelayTimings timings_;

    mutable std::shared_mutex projects_mutex_;
    std::unordered_map<std::string, std::shared_ptr<ProjectState>> projects_;

    std::atomic<bool> shutting_down_{false};
    std::atomic<uint64_t> calls_routed_{0};
    std::atomic<uint64_t> calls_completed_{0};
    std::atomic<uint64_t> stale_frames_{0};
};

} // namespace toolrelay::edge
