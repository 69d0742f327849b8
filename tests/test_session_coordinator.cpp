#include <gtest/gtest.h>
#include "common/crypto.hpp"
#include "edge/session_coordinator.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <mutex>
#include <vector>

using namespace toolrelay;
using namespace toolrelay::edge;
using namespace std::chrono_literals;

namespace {

// Records what the coordinator sends and closes
class FakeTransport : public ISessionTransport {
public:
    explicit FakeTransport(std::string address = "10.0.0.1:5000")
        : address_(std::move(address)) {}

    bool send_frame(const wire::Frame& frame) override {
        std::lock_guard lock(mutex_);
        if (refuse_sends) {
            return false;
        }
        sent_.push_back(frame);
        return true;
    }

    void close(const std::string& reason) override {
        std::lock_guard lock(mutex_);
        close_reasons_.push_back(reason);
    }

    std::string remote_address() const override { return address_; }

    std::vector<wire::Frame> sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    std::vector<std::string> close_reasons() const {
        std::lock_guard lock(mutex_);
        return close_reasons_;
    }

    bool refuse_sends = false;

private:
    std::string address_;
    mutable std::mutex mutex_;
    std::vector<wire::Frame> sent_;
    std::vector<std::string> close_reasons_;
};

ProjectConfig project(std::string id, std::string relay = "relay-secret",
                      std::string agent = "agent-secret") {
    return ProjectConfig{std::move(id), CredentialPair{std::move(relay), std::move(agent)}};
}

RelayTimings fast_timings() {
    RelayTimings timings;
    timings.heartbeat_interval = 100ms;
    timings.miss_threshold = 3;
    timings.request_timeout = 1000ms;
    return timings;
}

} // anonymous namespace

class SessionCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(crypto::init());
        coordinator_ = std::make_shared<SessionCoordinator>(fast_timings());
        coordinator_->set_project(project("alpha"));
        coordinator_->set_project(project("beta", "relay-beta", "agent-beta"));
    }

    std::shared_ptr<PendingRequest> route(const std::string& project_id = "alpha",
                                          std::chrono::milliseconds timeout = 1000ms) {
        auto result = coordinator_->route_call(project_id, "read_file", {{"path", "/etc/hosts"}},
                                               ioc_.get_executor(), timeout);
        EXPECT_TRUE(result.has_value());
        return result ? *result : nullptr;
    }

    CallOutcome outcome_of(const std::shared_ptr<PendingRequest>& request) {
        std::optional<CallOutcome> outcome;
        net::co_spawn(ioc_, [&]() -> net::awaitable<void> {
            outcome = co_await request->wait();
        }, net::detached);
        ioc_.run();
        ioc_.restart();
        EXPECT_TRUE(outcome.has_value());
        return outcome.value_or(std::unexpected(RelayError::make(ErrorKind::PROTOCOL_ERROR)));
    }

    static const wire::CallFrame& last_call(const FakeTransport& transport) {
        static wire::CallFrame copy;
        auto frames = transport.sent();
        EXPECT_FALSE(frames.empty());
        copy = std::get<wire::CallFrame>(frames.back());
        return copy;
    }

    net::io_context ioc_;
    std::shared_ptr<SessionCoordinator> coordinator_;
};

TEST_F(SessionCoordinatorTest, Authentication) {
    EXPECT_TRUE(coordinator_->authenticate_relay("alpha", "relay-secret"));
    EXPECT_FALSE(coordinator_->authenticate_relay("alpha", "agent-secret"));
    EXPECT_TRUE(coordinator_->authenticate_agent("alpha", "agent-secret"));
    EXPECT_FALSE(coordinator_->authenticate_agent("alpha", "relay-secret"));
    EXPECT_FALSE(coordinator_->authenticate_agent("gamma", "agent-secret"));

    auto ids = coordinator_->project_ids();
    EXPECT_EQ(ids, (std::vector<std::string>{"alpha", "beta"}));
}

TEST_F(SessionCoordinatorTest, RegisterRejectsBadToken) {
    auto transport = std::make_shared<FakeTransport>();

    auto wrong = coordinator_->register_session("alpha", "relay-beta", transport);
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().kind, ErrorKind::UNAUTHORIZED);

    auto unknown = coordinator_->register_session("gamma", "relay-secret", transport);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, ErrorKind::UNAUTHORIZED);

    EXPECT_FALSE(coordinator_->is_online("alpha"));
}

TEST_F(SessionCoordinatorTest, OfflineFailsFast) {
    auto result = coordinator_->route_call("alpha", "read_file", {}, ioc_.get_executor(), 1000ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::OFFLINE);

    auto unknown = coordinator_->route_call("gamma", "read_file", {}, ioc_.get_executor(), 1000ms);
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().kind, ErrorKind::OFFLINE);

    EXPECT_EQ(coordinator_->pending_count("alpha"), 0u);
}

TEST_F(SessionCoordinatorTest, RouteAndComplete) {
    auto transport = std::make_shared<FakeTransport>();
    auto handle = coordinator_->register_session("alpha", "relay-secret", transport);
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(handle->generation, 1u);
    EXPECT_TRUE(coordinator_->is_online("alpha"));

    auto request = route();
    ASSERT_NE(request, nullptr);
    EXPECT_EQ(coordinator_->pending_count("alpha"), 1u);

    const auto& call = last_call(*transport);
    EXPECT_EQ(call.id, request->id());
    EXPECT_EQ(call.method, "read_file");
    EXPECT_EQ(call.params.at("path").as_string(), "/etc/hosts");
    ASSERT_TRUE(call.timeout_ms.has_value());
    EXPECT_EQ(*call.timeout_ms, 1000u);

    EXPECT_TRUE(coordinator_->complete("alpha", handle->generation,
                                       wire::ResponseFrame{call.id, "contents"}));
    EXPECT_EQ(coordinator_->pending_count("alpha"), 0u);

    auto outcome = outcome_of(request);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(std::get<wire::ResponseFrame>(*outcome).result.as_string(), "contents");

    // A duplicate reply for the same id is ignored
    EXPECT_FALSE(coordinator_->complete("alpha", handle->generation,
                                        wire::ResponseFrame{call.id, "again"}));

    auto stats = coordinator_->stats();
    EXPECT_EQ(stats.projects, 2u);
    EXPECT_EQ(stats.online, 1u);
    EXPECT_EQ(stats.calls_routed, 1u);
    EXPECT_EQ(stats.calls_completed, 1u);
}

TEST_F(SessionCoordinatorTest, ConcurrentCallsGetDistinctIds) {
    auto transport = std::make_shared<FakeTransport>();
    auto handle = coordinator_->register_session("alpha", "relay-secret", transport);
    ASSERT_TRUE(handle.has_value());

    std::vector<std::shared_ptr<PendingRequest>> requests;
    for (int i = 0; i < 50; ++i) {
        requests.push_back(route());
    }
    EXPECT_EQ(coordinator_->pending_count("alpha"), 50u);

    // Complete in reverse order; each caller sees its own reply
    for (auto it = requests.rbegin(); it != requests.rend(); ++it) {
        EXPECT_TRUE(coordinator_->complete("alpha", handle->generation,
                                           wire::ResponseFrame{(*it)->id(), boost::json::string((*it)->id())}));
    }
    for (const auto& request : requests) {
        auto outcome = outcome_of(request);
        ASSERT_TRUE(outcome.has_value());
        EXPECT_EQ(std::get<wire::ResponseFrame>(*outcome).result.as_string(), request->id());
    }
}

TEST_F(SessionCoordinatorTest, NewSessionSupersedesOld) {
    auto first = std::make_shared<FakeTransport>("10.0.0.1:1000");
    auto second = std::make_shared<FakeTransport>("10.0.0.2:2000");

    auto old_handle = coordinator_->register_session("alpha", "relay-secret", first);
    ASSERT_TRUE(old_handle.has_value());
    auto request = route();

    auto new_handle = coordinator_->register_session("alpha", "relay-secret", second);
    ASSERT_TRUE(new_handle.has_value());
    EXPECT_GT(new_handle->generation, old_handle->generation);

    EXPECT_EQ(first->close_reasons(), std::vector<std::string>{"superseded"});
    EXPECT_TRUE(second->close_reasons().empty());

    auto outcome = outcome_of(request);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::SUPERSEDED);

    auto info = coordinator_->session_info("alpha");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->generation, new_handle->generation);
    EXPECT_EQ(info->remote_address, "10.0.0.2:2000");
}

TEST_F(SessionCoordinatorTest, StaleGenerationCannotComplete) {
    auto first = std::make_shared<FakeTransport>();
    auto second = std::make_shared<FakeTransport>();

    auto old_handle = coordinator_->register_session("alpha", "relay-secret", first);
    ASSERT_TRUE(old_handle.has_value());
    auto new_handle = coordinator_->register_session("alpha", "relay-secret", second);
    ASSERT_TRUE(new_handle.has_value());

    auto request = route();
    const auto& call = last_call(*second);

    // Same id arriving over the retired socket is dropped
    EXPECT_FALSE(coordinator_->complete("alpha", old_handle->generation,
                                        wire::ResponseFrame{call.id, "stale"}));
    EXPECT_FALSE(request->settled());
    EXPECT_EQ(coordinator_->stats().stale_frames, 1u);

    // Closing the old generation leaves the new session alone
    coordinator_->close_session("alpha", old_handle->generation);
    EXPECT_TRUE(coordinator_->is_online("alpha"));
    EXPECT_EQ(coordinator_->pending_count("alpha"), 1u);

    EXPECT_TRUE(coordinator_->complete("alpha", new_handle->generation,
                                       wire::ResponseFrame{call.id, "fresh"}));
    auto outcome = outcome_of(request);
    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(std::get<wire::ResponseFrame>(*outcome).result.as_string(), "fresh");
}

TEST_F(SessionCoordinatorTest, UnknownIdIsDropped) {
    auto transport = std::make_shared<FakeTransport>();
    auto handle = coordinator_->register_session("alpha", "relay-secret", transport);
    ASSERT_TRUE(handle.has_value());

    EXPECT_FALSE(coordinator_->complete("alpha", handle->generation,
                                        wire::ResponseFrame{"never-sent", 1}));
    EXPECT_FALSE(coordinator_->complete("alpha", handle->generation, wire::HeartbeatFrame{}));
    EXPECT_TRUE(coordinator_->is_online("alpha"));
}

TEST_F(SessionCoordinatorTest, DisconnectFailsPending) {
    auto transport = std::make_shared<FakeTransport>();
    auto handle = coordinator_->register_session("alpha", "relay-secret", transport);
    ASSERT_TRUE(handle.has_value());
    auto request = route();

    coordinator_->close_session("alpha", handle->generation, ErrorKind::DISCONNECTED, "socket closed");
    EXPECT_FALSE(coordinator_->is_online("alpha"));
    EXPECT_EQ(coordinator_->pending_count("alpha"), 0u);

    auto outcome = outcome_of(request);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::DISCONNECTED);
}

TEST_F(SessionCoordinatorTest, ProjectsAreIsolated) {
    auto alpha = std::make_shared<FakeTransport>();
    auto beta = std::make_shared<FakeTransport>();
    auto alpha_handle = coordinator_->register_session("alpha", "relay-secret", alpha);
    auto beta_handle = coordinator_->register_session("beta", "relay-beta", beta);
    ASSERT_TRUE(alpha_handle.has_value());
    ASSERT_TRUE(beta_handle.has_value());

    auto request = route("beta");
    EXPECT_TRUE(alpha->sent().empty());
    ASSERT_EQ(beta->sent().size(), 1u);

    coordinator_->close_session("alpha", alpha_handle->generation);
    EXPECT_TRUE(coordinator_->is_online("beta"));
    EXPECT_FALSE(request->settled());

    // A reply routed under the wrong project does not resolve it
    EXPECT_FALSE(coordinator_->complete("alpha", alpha_handle->generation,
                                        wire::ResponseFrame{request->id(), 1}));
    EXPECT_FALSE(request->settled());
}

TEST_F(SessionCoordinatorTest, SweepExpiresOverdueRequests) {
    auto transport = std::make_shared<FakeTransport>();
    auto handle = coordinator_->register_session("alpha", "relay-secret", transport);
    ASSERT_TRUE(handle.has_value());

    auto quick = route("alpha", 200ms);
    auto slow = route("alpha", 1000ms);

    coordinator_->record_heartbeat("alpha", handle->generation);
    auto removed = coordinator_->sweep(quick->deadline());
    EXPECT_EQ(removed, 1u);
    EXPECT_TRUE(quick->settled());
    EXPECT_FALSE(slow->settled());
    EXPECT_EQ(coordinator_->pending_count("alpha"), 1u);

    auto outcome = outcome_of(quick);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::TIMEOUT);

    // A late reply for the expired id changes nothing
    EXPECT_FALSE(coordinator_->complete("alpha", handle->generation,
                                        wire::ResponseFrame{quick->id(), 1}));
}

TEST_F(SessionCoordinatorTest, SweepClosesSilentSession) {
    auto transport = std::make_shared<FakeTransport>();
    auto handle = coordinator_->register_session("alpha", "relay-secret", transport);
    ASSERT_TRUE(handle.has_value());
    auto request = route();

    auto now = SessionCoordinator::Clock::now();
    EXPECT_EQ(coordinator_->sweep(now + 100ms), 0u);
    EXPECT_TRUE(coordinator_->is_online("alpha"));

    coordinator_->sweep(now + fast_timings().liveness_window() + 50ms);
    EXPECT_FALSE(coordinator_->is_online("alpha"));
    EXPECT_EQ(transport->close_reasons(), std::vector<std::string>{"heartbeat timeout"});

    auto outcome = outcome_of(request);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::DISCONNECTED);
}

TEST_F(SessionCoordinatorTest, RetirePending) {
    auto transport = std::make_shared<FakeTransport>();
    ASSERT_TRUE(coordinator_->register_session("alpha", "relay-secret", transport).has_value());
    auto request = route();

    EXPECT_TRUE(coordinator_->retire_pending("alpha", request->id(),
                                             RelayError::make(ErrorKind::CANCELLED)));
    EXPECT_FALSE(coordinator_->retire_pending("alpha", request->id(),
                                              RelayError::make(ErrorKind::CANCELLED)));
    EXPECT_EQ(coordinator_->pending_count("alpha"), 0u);
    EXPECT_TRUE(coordinator_->is_online("alpha"));
}

TEST_F(SessionCoordinatorTest, CredentialRotationRevokes) {
    auto transport = std::make_shared<FakeTransport>();
    ASSERT_TRUE(coordinator_->register_session("alpha", "relay-secret", transport).has_value());
    auto request = route();

    // Unchanged credentials are a no-op
    coordinator_->set_project(project("alpha"));
    EXPECT_TRUE(coordinator_->is_online("alpha"));

    coordinator_->set_project(project("alpha", "relay-rotated", "agent-secret"));
    EXPECT_FALSE(coordinator_->is_online("alpha"));
    EXPECT_EQ(transport->close_reasons(), std::vector<std::string>{"credentials rotated"});
    EXPECT_FALSE(coordinator_->authenticate_relay("alpha", "relay-secret"));
    EXPECT_TRUE(coordinator_->authenticate_relay("alpha", "relay-rotated"));

    auto outcome = outcome_of(request);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::REVOKED);
}

TEST_F(SessionCoordinatorTest, SyncProjectsRemovesMissing) {
    auto transport = std::make_shared<FakeTransport>();
    ASSERT_TRUE(coordinator_->register_session("beta", "relay-beta", transport).has_value());
    auto request = route("beta");

    coordinator_->sync_projects({project("alpha"), project("gamma", "relay-g", "agent-g")});
    EXPECT_EQ(coordinator_->project_ids(), (std::vector<std::string>{"alpha", "gamma"}));
    EXPECT_EQ(transport->close_reasons(), std::vector<std::string>{"project removed"});

    auto outcome = outcome_of(request);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::REVOKED);
}

TEST_F(SessionCoordinatorTest, ToolsFollowCurrentGeneration) {
    auto first = std::make_shared<FakeTransport>();
    auto old_handle = coordinator_->register_session("alpha", "relay-secret", first);
    ASSERT_TRUE(old_handle.has_value());
    coordinator_->update_tools("alpha", old_handle->generation,
                               boost::json::array{boost::json::object{{"name", "grep"}}});
    EXPECT_EQ(coordinator_->tools("alpha").size(), 1u);

    auto second = std::make_shared<FakeTransport>();
    auto new_handle = coordinator_->register_session("alpha", "relay-secret", second);
    ASSERT_TRUE(new_handle.has_value());
    EXPECT_TRUE(coordinator_->tools("alpha").empty());

    coordinator_->update_tools("alpha", old_handle->generation,
                               boost::json::array{boost::json::object{{"name", "stale"}}});
    EXPECT_TRUE(coordinator_->tools("alpha").empty());
}

TEST_F(SessionCoordinatorTest, ShutdownRejectsNewSessions) {
    auto transport = std::make_shared<FakeTransport>();
    ASSERT_TRUE(coordinator_->register_session("alpha", "relay-secret", transport).has_value());
    auto request = route();

    coordinator_->shutdown();
    EXPECT_FALSE(coordinator_->is_online("alpha"));
    EXPECT_EQ(transport->close_reasons(), std::vector<std::string>{"relay shutting down"});

    auto again = coordinator_->register_session("alpha", "relay-secret",
                                                std::make_shared<FakeTransport>());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().kind, ErrorKind::OFFLINE);

    auto outcome = outcome_of(request);
    ASSERT_FALSE(outcome.has_value());
    EXPECT_EQ(outcome.error().kind, ErrorKind::DISCONNECTED);
}

TEST_F(SessionCoordinatorTest, FullWriteQueueFailsFast) {
    auto transport = std::make_shared<FakeTransport>();
    ASSERT_TRUE(coordinator_->register_session("alpha", "relay-secret", transport).has_value());
    transport->refuse_sends = true;

    auto result = coordinator_->route_call("alpha", "read_file", {}, ioc_.get_executor(), 1000ms);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::CONNECTION_FAILED);
    EXPECT_EQ(coordinator_->pending_count("alpha"), 0u);
    EXPECT_TRUE(coordinator_->is_online("alpha"));
}
