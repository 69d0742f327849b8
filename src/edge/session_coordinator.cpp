#include "edge/session_coordinator.hpp"
#include "common/crypto.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <unordered_set>

namespace toolrelay::edge {

namespace {
constexpr const char* kLogModule = "edge.coordinator";
}

SessionCoordinator::SessionCoordinator(RelayTimings timings)
    : timings_(timings) {}

// ============================================================================
// Projects and credentials
// ============================================================================

std::shared_ptr<SessionCoordinator::ProjectState> SessionCoordinator::find(
    const std::string& project_id) const {
    std::shared_lock lock(projects_mutex_);
    auto it = projects_.find(project_id);
    return it == projects_.end() ? nullptr : it->second;
}

void SessionCoordinator::set_project(const ProjectConfig& project) {
    std::shared_ptr<ProjectState> state;
    {
        std::unique_lock lock(projects_mutex_);
        auto [it, inserted] = projects_.try_emplace(project.id);
        if (inserted) {
            it->second = std::make_shared<ProjectState>();
            it->second->credentials = project.credentials;
            LOG_INFO(kLogModule, "Project '{}' added", project.id);
            return;
        }
        state = it->second;
    }

    std::shared_ptr<ISessionTransport> revoked;
    PendingList pending;
    {
        std::lock_guard lock(state->mutex);
        bool relay_changed = state->credentials.relay_token != project.credentials.relay_token;
        bool agent_changed = state->credentials.agent_token != project.credentials.agent_token;
        if (!relay_changed && !agent_changed) {
            return;
        }
        state->credentials = project.credentials;
        revoked = detach_session(*state, pending);
        state->tools = {};
    }

    LOG_INFO(kLogModule, "Project '{}' credentials rotated, {} pending requests revoked",
               project.id, pending.size());
    fail_all(pending, ErrorKind::REVOKED, "project credentials rotated");
    if (revoked) {
        revoked->close("credentials rotated");
    }
}

void SessionCoordinator::sync_projects(const std::vector<ProjectConfig>& projects) {
    std::unordered_set<std::string> wanted;
    for (const auto& project : projects) {
        wanted.insert(project.id);
        set_project(project);
    }
    for (const auto& id : project_ids()) {
        if (!wanted.contains(id)) {
            remove_project(id);
        }
    }
}

bool SessionCoordinator::remove_project(const std::string& project_id) {
    std::shared_ptr<ProjectState> state;
    {
        std::unique_lock lock(projects_mutex_);
        auto it = projects_.find(project_id);
        if (it == projects_.end()) {
            return false;
        }
        state = std::move(it->second);
        projects_.erase(it);
    }

    std::shared_ptr<ISessionTransport> transport;
    PendingList pending;
    {
        std::lock_guard lock(state->mutex);
        transport = detach_session(*state, pending);
    }

    LOG_INFO(kLogModule, "Project '{}' removed", project_id);
    fail_all(pending, ErrorKind::REVOKED, "project removed");
    if (transport) {
        transport->close("project removed");
    }
    return true;
}

bool SessionCoordinator::has_project(const std::string& project_id) const {
    return find(project_id) != nullptr;
}

std::vector<std::string> SessionCoordinator::project_ids() const {
    std::shared_lock lock(projects_mutex_);
    std::vector<std::string> ids;
    ids.reserve(projects_.size());
    for (const auto& [id, state] : projects_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool SessionCoordinator::authenticate_relay(const std::string& project_id,
                                            std::string_view token) const {
    auto state = find(project_id);
    if (!state) {
        return false;
    }
    std::lock_guard lock(state->mutex);
    return crypto::secure_compare(token, state->credentials.relay_token);
}

bool SessionCoordinator::authenticate_agent(const std::string& project_id,
                                            std::string_view token) const {
    auto state = find(project_id);
    if (!state) {
        return false;
    }
    std::lock_guard lock(state->mutex);
    return crypto::secure_compare(token, state->credentials.agent_token);
}

// ============================================================================
// Sessions
// ============================================================================

std::shared_ptr<ISessionTransport> SessionCoordinator::detach_session(
    ProjectState& state, PendingList& out) {
    for (auto& [id, request] : state.pending) {
        out.push_back(std::move(request));
    }
    state.pending.clear();

    if (!state.session) {
        return nullptr;
    }
    auto transport = std::move(state.session->transport);
    state.session.reset();
    return transport;
}

void SessionCoordinator::fail_all(PendingList& pending, ErrorKind kind, const std::string& message) {
    for (auto& request : pending) {
        request->fail(RelayError::make(kind, message));
    }
}

std::expected<SessionHandle, RelayError> SessionCoordinator::register_session(
    const std::string& project_id,
    std::string_view relay_token,
    std::shared_ptr<ISessionTransport> transport) {

    if (shutting_down_.load(std::memory_order_acquire)) {
        return std::unexpected(RelayError::make(ErrorKind::OFFLINE, "relay shutting down"));
    }

    auto state = find(project_id);
    if (!state) {
        return std::unexpected(RelayError::make(ErrorKind::UNAUTHORIZED));
    }

    std::shared_ptr<ISessionTransport> previous;
    PendingList superseded;
    uint64_t previous_generation = 0;
    SessionHandle handle{project_id, 0};
    {
        std::lock_guard lock(state->mutex);
        if (!crypto::secure_compare(relay_token, state->credentials.relay_token)) {
            return std::unexpected(RelayError::make(ErrorKind::UNAUTHORIZED));
        }

        if (state->session) {
            previous_generation = state->session->generation;
        }
        previous = detach_session(*state, superseded);
        state->tools = {};

        auto now = std::chrono::system_clock::now();
        Session session;
        session.generation = state->next_generation++;
        session.remote_address = transport->remote_address();
        session.transport = std::move(transport);
        session.connected_at = now;
        session.last_heartbeat_at = now;
        session.last_seen = Clock::now();
        handle.generation = session.generation;
        state->session = std::move(session);
    }

    if (previous) {
        LOG_INFO(kLogModule, "Project '{}': generation {} supersedes {} ({} pending requests failed)",
                   project_id, handle.generation, previous_generation, superseded.size());
        fail_all(superseded, ErrorKind::SUPERSEDED, "session superseded by a newer connection");
        previous->close("superseded");
    } else {
        LOG_INFO(kLogModule, "Project '{}': session generation {} online", project_id, handle.generation);
    }

    return handle;
}

void SessionCoordinator::close_session(const std::string& project_id, uint64_t generation,
                                       ErrorKind kind, const std::string& reason) {
    auto state = find(project_id);
    if (!state) {
        return;
    }

    std::shared_ptr<ISessionTransport> transport;
    PendingList pending;
    {
        std::lock_guard lock(state->mutex);
        if (!state->session || state->session->generation != generation) {
            return;
        }
        transport = detach_session(*state, pending);
        state->tools = {};
    }

    LOG_INFO(kLogModule, "Project '{}': session generation {} closed ({}), {} pending requests failed",
               project_id, generation, reason, pending.size());
    fail_all(pending, kind, reason);
    transport->close(reason);
}

void SessionCoordinator::record_heartbeat(const std::string& project_id, uint64_t generation) {
    auto state = find(project_id);
    if (!state) {
        return;
    }
    std::lock_guard lock(state->mutex);
    if (state->session && state->session->generation == generation) {
        state->session->last_seen = Clock::now();
        state->session->last_heartbeat_at = std::chrono::system_clock::now();
    }
}

// ============================================================================
// Routing and completion
// ============================================================================

std::expected<std::shared_ptr<PendingRequest>, RelayError> SessionCoordinator::route_call(
    const std::string& project_id,
    const std::string& method,
    boost::json::object params,
    net::any_io_executor executor,
    std::chrono::milliseconds timeout) {

    auto state = find(project_id);
    if (!state) {
        return std::unexpected(RelayError::make(ErrorKind::OFFLINE, "unknown project"));
    }

    auto deadline = Clock::now() + timeout;
    std::shared_ptr<PendingRequest> request;
    std::shared_ptr<ISessionTransport> transport;
    {
        std::lock_guard lock(state->mutex);
        if (!state->session) {
            return std::unexpected(RelayError::make(ErrorKind::OFFLINE, "no daemon connected"));
        }

        std::string id = crypto::generate_uuid();
        while (state->pending.contains(id)) {
            id = crypto::generate_uuid();
        }

        request = std::make_shared<PendingRequest>(
            std::move(executor), id, state->session->generation, deadline);
        // Registered before the frame leaves, so an instant reply finds it
        state->pending.emplace(id, request);
        transport = state->session->transport;
    }

    calls_routed_.fetch_add(1, std::memory_order_relaxed);

    wire::CallFrame call;
    call.id = request->id();
    call.method = method;
    call.params = std::move(params);
    call.timeout_ms = static_cast<uint32_t>(std::max<int64_t>(timeout.count(), 1));

    LOG_DEBUG(kLogModule, "Project '{}': call {} method={} generation={}",
                project_id, call.id, method, request->generation());
    if (!transport->send_frame(call)) {
        auto error = RelayError::make(ErrorKind::CONNECTION_FAILED, "relay write queue unavailable");
        retire_pending(project_id, request->id(), error);
        return std::unexpected(std::move(error));
    }

    return request;
}

bool SessionCoordinator::complete(const std::string& project_id, uint64_t generation,
                                  wire::Frame frame) {
    const std::string* id = wire::frame_id(frame);
    if (!id) {
        return false;
    }

    auto state = find(project_id);
    if (!state) {
        return false;
    }

    std::shared_ptr<PendingRequest> request;
    {
        std::lock_guard lock(state->mutex);
        if (!state->session || state->session->generation != generation) {
            stale_frames_.fetch_add(1, std::memory_order_relaxed);
            LOG_DEBUG(kLogModule, "Project '{}': dropping frame {} from stale generation {}",
                        project_id, *id, generation);
            return false;
        }
        state->session->last_seen = Clock::now();
        state->session->last_heartbeat_at = std::chrono::system_clock::now();

        auto it = state->pending.find(*id);
        if (it == state->pending.end() || it->second->generation() != generation) {
            LOG_DEBUG(kLogModule, "Project '{}': dropping frame for unknown id {}", project_id, *id);
            return false;
        }
        request = std::move(it->second);
        state->pending.erase(it);
    }

    if (!request->fulfill(std::move(frame))) {
        return false;
    }
    calls_completed_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

bool SessionCoordinator::retire_pending(const std::string& project_id, const std::string& id,
                                        RelayError reason) {
    auto state = find(project_id);
    if (!state) {
        return false;
    }

    std::shared_ptr<PendingRequest> request;
    {
        std::lock_guard lock(state->mutex);
        auto it = state->pending.find(id);
        if (it == state->pending.end()) {
            return false;
        }
        request = std::move(it->second);
        state->pending.erase(it);
    }

    LOG_DEBUG(kLogModule, "Project '{}': retired {} ({})", project_id, id, error_kind_name(reason.kind));
    request->fail(std::move(reason));
    return true;
}

// ============================================================================
// Liveness sweep
// ============================================================================

size_t SessionCoordinator::sweep(Clock::time_point now) {
    std::vector<std::pair<std::string, std::shared_ptr<ProjectState>>> snapshot;
    {
        std::shared_lock lock(projects_mutex_);
        snapshot.assign(projects_.begin(), projects_.end());
    }

    const auto window = timings_.liveness_window();
    size_t removed = 0;

    for (auto& [project_id, state] : snapshot) {
        std::shared_ptr<ISessionTransport> dead;
        uint64_t dead_generation = 0;
        PendingList orphaned;
        PendingList expired;
        {
            std::lock_guard lock(state->mutex);
            if (state->session && now - state->session->last_seen > window) {
                dead_generation = state->session->generation;
                dead = detach_session(*state, orphaned);
                state->tools = {};
            } else {
                for (auto it = state->pending.begin(); it != state->pending.end();) {
                    if (now >= it->second->deadline()) {
                        expired.push_back(std::move(it->second));
                        it = state->pending.erase(it);
                    } else {
                        ++it;
                    }
                }
            }
        }

        if (dead) {
            LOG_WARN(kLogModule, "Project '{}': session generation {} missed {} heartbeats, closing",
                       project_id, dead_generation, timings_.miss_threshold);
            fail_all(orphaned, ErrorKind::DISCONNECTED, "session missed heartbeats");
            dead->close("heartbeat timeout");
            removed += orphaned.size();
        }
        for (auto& request : expired) {
            request->expire(now);
        }
        if (!expired.empty()) {
            LOG_DEBUG(kLogModule, "Project '{}': expired {} pending requests", project_id, expired.size());
        }
        removed += expired.size();
    }

    return removed;
}

net::awaitable<void> SessionCoordinator::run_sweeper(std::chrono::milliseconds interval) {
    net::steady_timer timer(co_await net::this_coro::executor);

    while (!shutting_down_.load(std::memory_order_acquire)) {
        timer.expires_after(interval);
        boost::system::error_code ec;
        co_await timer.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            break;
        }
        sweep();
    }
}

// ============================================================================
// Tools and status
// ============================================================================

void SessionCoordinator::update_tools(const std::string& project_id, uint64_t generation,
                                      boost::json::array tools) {
    auto state = find(project_id);
    if (!state) {
        return;
    }
    std::lock_guard lock(state->mutex);
    if (state->session && state->session->generation == generation) {
        LOG_INFO(kLogModule, "Project '{}': {} tools advertised", project_id, tools.size());
        state->tools = std::move(tools);
    }
}

boost::json::array SessionCoordinator::tools(const std::string& project_id) const {
    auto state = find(project_id);
    if (!state) {
        return {};
    }
    std::lock_guard lock(state->mutex);
    return state->tools;
}

bool SessionCoordinator::is_online(const std::string& project_id) const {
    auto state = find(project_id);
    if (!state) {
        return false;
    }
    std::lock_guard lock(state->mutex);
    return state->session.has_value();
}

std::optional<SessionInfo> SessionCoordinator::session_info(const std::string& project_id) const {
    auto state = find(project_id);
    if (!state) {
        return std::nullopt;
    }
    std::lock_guard lock(state->mutex);
    if (!state->session) {
        return std::nullopt;
    }
    SessionInfo info;
    info.generation = state->session->generation;
    info.remote_address = state->session->remote_address;
    info.connected_at = state->session->connected_at;
    info.last_heartbeat_at = state->session->last_heartbeat_at;
    info.pending = state->pending.size();
    return info;
}

size_t SessionCoordinator::pending_count(const std::string& project_id) const {
    auto state = find(project_id);
    if (!state) {
        return 0;
    }
    std::lock_guard lock(state->mutex);
    return state->pending.size();
}

CoordinatorStats SessionCoordinator::stats() const {
    CoordinatorStats s;
    {
        std::shared_lock lock(projects_mutex_);
        s.projects = projects_.size();
        for (const auto& [id, state] : projects_) {
            std::lock_guard project_lock(state->mutex);
            if (state->session) {
                ++s.online;
            }
            s.pending += state->pending.size();
        }
    }
    s.calls_routed = calls_routed_.load(std::memory_order_relaxed);
    s.calls_completed = calls_completed_.load(std::memory_order_relaxed);
    s.stale_frames = stale_frames_.load(std::memory_order_relaxed);
    return s;
}

void SessionCoordinator::shutdown() {
    if (shutting_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::vector<std::shared_ptr<ProjectState>> states;
    {
        std::shared_lock lock(projects_mutex_);
        for (const auto& [id, state] : projects_) {
            states.push_back(state);
        }
    }

    for (auto& state : states) {
        std::shared_ptr<ISessionTransport> transport;
        PendingList pending;
        {
            std::lock_guard lock(state->mutex);
            transport = detach_session(*state, pending);
        }
        fail_all(pending, ErrorKind::DISCONNECTED, "relay shutting down");
        if (transport) {
            transport->close("relay shutting down");
        }
    }

    LOG_INFO(kLogModule, "Coordinator shut down");
}

} // namespace toolrelay::edge
