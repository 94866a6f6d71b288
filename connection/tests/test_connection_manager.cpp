#include "connection/connection_manager.H"
#include "connection/tws_socket.H"
#include "connection/tests/fake_gateway.H"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace tws;
using namespace tws::conn;
using namespace std::chrono_literals;

class MockListener : public SessionListener {
public:
    std::vector<wire::request> subscriptions;

    void on_event(const wire::event& ev) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(ev);
        cv.notify_all();
    }

    void on_connection_lost(const std::string& reason) override {
        std::lock_guard<std::mutex> lock(mutex);
        lost_reasons.push_back(reason);
        cv.notify_all();
    }

    std::vector<wire::request> resubscribe_requests() override {
        std::lock_guard<std::mutex> lock(mutex);
        resubscribe_calls++;
        return subscriptions;
    }

    void on_reconnected(const connection_info& info) override {
        std::lock_guard<std::mutex> lock(mutex);
        reconnects++;
        last_info = info;
        cv.notify_all();
    }

    void on_reconnect_failed(const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex);
        gave_up = true;
        cv.notify_all();
    }

    template <typename Pred>
    bool wait(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, pred);
    }

    std::mutex mutex;
    std::condition_variable cv;
    std::vector<wire::event> events;
    std::vector<std::string> lost_reasons;
    int resubscribe_calls = 0;
    int reconnects = 0;
    bool gave_up = false;
    connection_info last_info;
};

static connection_settings make_settings(uint16_t port, int client_id) {
    connection_settings settings;
    settings.host = "127.0.0.1";
    settings.port = port;
    settings.client_id = client_id;
    settings.connect_timeout = 2000ms;
    settings.reconnect_initial_backoff = 20ms;
    settings.reconnect_max_backoff = 100ms;
    settings.reconnect_max_attempts = 5;
    return settings;
}

static wire::market_data_request subscription(wire::request_id id, const std::string& symbol) {
    wire::market_data_request req;
    req.req_id = id;
    req.instrument.symbol = symbol;
    return req;
}

TEST(ConnectionManagerTest, HandshakeReturnsSessionInfo) {
    fake::FakeGateway gateway;
    gateway.next_id = 1000;
    gateway.accounts = "DU123,DU456";
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 7), listener, spdlog::default_logger());

    connection_info info = manager.connect();
    EXPECT_EQ(info.server_version, wire::MAX_CLIENT_VERSION);
    EXPECT_EQ(info.connection_time, "20261017 09:30:00 EST");
    EXPECT_EQ(info.next_valid_id, 1000);
    EXPECT_EQ(info.accounts, "DU123,DU456");
    EXPECT_EQ(manager.state(), CONNECTION_STATE::CONNECTED);

    ASSERT_TRUE(gateway.wait_for_sessions(1));
    EXPECT_EQ(gateway.last_start_api(), (fake::frame{"71", "2", "7", ""}));

    manager.disconnect();
    EXPECT_EQ(manager.state(), CONNECTION_STATE::DISCONNECTED);
}

TEST(ConnectionManagerTest, OldServerIsVersionMismatch) {
    fake::FakeGateway gateway;
    gateway.server_version = 76;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 8), listener, spdlog::default_logger());

    try {
        manager.connect();
        FAIL() << "expected connect_error";
    } catch (const connect_error& e) {
        EXPECT_EQ(e.reason, CONNECT_FAILURE::VERSION_MISMATCH);
    }
    EXPECT_EQ(manager.state(), CONNECTION_STATE::DISCONNECTED);
}

TEST(ConnectionManagerTest, NewerServerIsVersionMismatch) {
    fake::FakeGateway gateway;
    gateway.server_version = 176;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 24), listener, spdlog::default_logger());

    try {
        manager.connect();
        FAIL() << "expected connect_error";
    } catch (const connect_error& e) {
        EXPECT_EQ(e.reason, CONNECT_FAILURE::VERSION_MISMATCH);
    }
    EXPECT_EQ(manager.state(), CONNECTION_STATE::DISCONNECTED);
}

TEST(ConnectionManagerTest, OlderServerGetsItsOwnLayouts) {
    fake::FakeGateway gateway;
    gateway.server_version = wire::MIN_SERVER_VER_MARKET_CAP_PRICE - 1;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 25), listener, spdlog::default_logger());
    connection_info info = manager.connect();
    EXPECT_EQ(info.server_version, wire::MIN_SERVER_VER_MARKET_CAP_PRICE - 1);

    wire::place_order_request req;
    req.order.order_id = 1000;
    req.order.instrument.symbol = "GOOG";
    req.order.quantity = 100;
    req.order.limit_price = 600.5;
    manager.send(req);
    ASSERT_TRUE(gateway.wait_for_frames("3", 1));
    auto placed = gateway.frames_with_id("3")[0];
    EXPECT_EQ(placed[1], std::to_string(wire::PLACE_ORDER_VERSION));
    EXPECT_EQ(placed[2], "1000");

    gateway.send(fake::order_status_frame(gateway.server_version, 1000, "Submitted", 0, 100, 0));
    ASSERT_TRUE(listener.wait([&] { return !listener.events.empty(); }));

    std::lock_guard<std::mutex> lock(listener.mutex);
    auto* status = std::get_if<wire::order_status>(&listener.events[0]);
    ASSERT_NE(status, nullptr);
    EXPECT_EQ(status->order_id, 1000);
    EXPECT_EQ(status->status, "Submitted");
    EXPECT_TRUE(listener.lost_reasons.empty());
}

TEST(ConnectionManagerTest, NothingListeningIsRefused) {
    MockListener listener;
    ConnectionManager manager(make_settings(fake::closed_port(), 9), listener, spdlog::default_logger());

    try {
        manager.connect();
        FAIL() << "expected connect_error";
    } catch (const connect_error& e) {
        EXPECT_EQ(e.reason, CONNECT_FAILURE::REFUSED);
    }
    EXPECT_EQ(manager.state(), CONNECTION_STATE::DISCONNECTED);
}

TEST(ConnectionManagerTest, SilentGatewayTimesOut) {
    fake::FakeGateway gateway;
    gateway.silent = true;
    gateway.start();

    MockListener listener;
    auto settings = make_settings(gateway.port(), 10);
    settings.connect_timeout = 200ms;
    ConnectionManager manager(settings, listener, spdlog::default_logger());

    try {
        manager.connect();
        FAIL() << "expected connect_error";
    } catch (const connect_error& e) {
        EXPECT_EQ(e.reason, CONNECT_FAILURE::TIMEOUT);
    }
    gateway.drop();
}

TEST(ConnectionManagerTest, ClientIdInUse) {
    fake::FakeGateway gateway;
    gateway.reject_client_id = true;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 11), listener, spdlog::default_logger());

    try {
        manager.connect();
        FAIL() << "expected connect_error";
    } catch (const connect_error& e) {
        EXPECT_EQ(e.reason, CONNECT_FAILURE::CLIENT_ID_IN_USE);
    }
}

TEST(ConnectionManagerTest, SecondConnectionToSameEndpointIsRejected) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener first_listener;
    MockListener second_listener;
    ConnectionManager first(make_settings(gateway.port(), 12), first_listener, spdlog::default_logger());
    ConnectionManager second(make_settings(gateway.port(), 12), second_listener, spdlog::default_logger());

    first.connect();
    try {
        second.connect();
        FAIL() << "expected connect_error";
    } catch (const connect_error& e) {
        EXPECT_EQ(e.reason, CONNECT_FAILURE::ENDPOINT_IN_USE);
    }

    first.disconnect();
    EXPECT_NO_THROW(second.connect());
    EXPECT_EQ(second.state(), CONNECTION_STATE::CONNECTED);
}

TEST(ConnectionManagerTest, SendWhileDisconnectedThrows) {
    MockListener listener;
    ConnectionManager manager(make_settings(fake::closed_port(), 13), listener, spdlog::default_logger());
    EXPECT_THROW(manager.send(wire::current_time_request{}), connection_lost);
}

TEST(ConnectionManagerTest, InvalidRequestIsRejectedBeforeSending) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 14), listener, spdlog::default_logger());
    manager.connect();

    wire::place_order_request req;
    req.order.order_id = 1000;
    req.order.instrument.symbol = "GOOG";
    req.order.quantity = 100;
    EXPECT_THROW(manager.send(req), encoding_error); // limit order without a price
    EXPECT_TRUE(gateway.frames_with_id("3").empty());
}

TEST(ConnectionManagerTest, FramesReachGatewayAndEventsReachListener) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 15), listener, spdlog::default_logger());
    manager.connect();

    manager.send(subscription(1000, "GOOG"));
    ASSERT_TRUE(gateway.wait_for_frames("1", 1));
    auto sent = gateway.frames_with_id("1");
    EXPECT_EQ(sent[0][2], "1000");
    EXPECT_EQ(sent[0][4], "GOOG");

    gateway.send({"1", "6", "1000", "1", "600.25", "100", "0"});
    ASSERT_TRUE(listener.wait([&] { return !listener.events.empty(); }));

    std::lock_guard<std::mutex> lock(listener.mutex);
    auto* tick = std::get_if<wire::tick_price>(&listener.events[0]);
    ASSERT_NE(tick, nullptr);
    EXPECT_EQ(tick->req_id, 1000);
    EXPECT_DOUBLE_EQ(tick->price, 600.25);
}

TEST(ConnectionManagerTest, PostedRequestGoesOutOnSenderThread) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 26), listener, spdlog::default_logger());
    manager.connect();

    manager.post(wire::cancel_order_request{1000});
    ASSERT_TRUE(gateway.wait_for_frames("4", 1));
    EXPECT_EQ(gateway.frames_with_id("4")[0], (fake::frame{"4", "1", "1000"}));
}

TEST(ConnectionManagerTest, PostWhileDisconnectedIsDropped) {
    MockListener listener;
    ConnectionManager manager(make_settings(fake::closed_port(), 27), listener, spdlog::default_logger());
    EXPECT_NO_THROW(manager.post(wire::current_time_request{}));
}

TEST(TwsSocketTest, WriteToStalledPeerTimesOut) {
    int fds[2];
    ASSERT_EQ(socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    int flags = fcntl(fds[0], F_GETFL, 0);
    fcntl(fds[0], F_SETFL, flags | O_NONBLOCK);

    // the peer never reads, so the socket buffers fill up
    std::string payload(16 * 1024 * 1024, 'x');
    uint64_t start = nanotime();
    EXPECT_THROW(write_all(fds[0], payload, start + 200'000'000ull), connection_lost);
    EXPECT_LT(nanotime() - start, 2'000'000'000ull);

    close(fds[0]);
    close(fds[1]);
}

TEST(ConnectionManagerTest, ReconnectResubscribesEachSubscriptionOnce) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    listener.subscriptions = {subscription(1001, "GOOG"), subscription(1002, "IBM")};
    ConnectionManager manager(make_settings(gateway.port(), 16), listener, spdlog::default_logger());
    manager.connect();

    for (const auto& req : listener.subscriptions) {
        manager.send(req);
    }
    ASSERT_TRUE(gateway.wait_for_frames("1", 2));

    gateway.drop();
    ASSERT_TRUE(listener.wait([&] { return listener.reconnects == 1; }));
    ASSERT_TRUE(gateway.wait_for_frames("1", 4));
    std::this_thread::sleep_for(100ms);

    auto sent = gateway.frames_with_id("1");
    ASSERT_EQ(sent.size(), 4u);
    EXPECT_EQ(sent[2][2], "1001");
    EXPECT_EQ(sent[3][2], "1002");
    EXPECT_EQ(gateway.session_count(), 2u);

    std::lock_guard<std::mutex> lock(listener.mutex);
    EXPECT_EQ(listener.lost_reasons.size(), 1u);
    EXPECT_EQ(listener.resubscribe_calls, 1);
    EXPECT_EQ(listener.last_info.next_valid_id, 1000);
    EXPECT_EQ(manager.state(), CONNECTION_STATE::CONNECTED);
}

TEST(ConnectionManagerTest, RequestCycleRunsOnReaderThread) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 17), listener, spdlog::default_logger());
    manager.connect();

    manager.request_cycle("quote count reached");
    ASSERT_TRUE(listener.wait([&] { return listener.reconnects == 1; }));
    EXPECT_TRUE(gateway.wait_for_sessions(2));

    std::lock_guard<std::mutex> lock(listener.mutex);
    ASSERT_EQ(listener.lost_reasons.size(), 1u);
    EXPECT_NE(listener.lost_reasons[0].find("quote count reached"), std::string::npos);
}

TEST(ConnectionManagerTest, GivesUpAfterMaxAttempts) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    auto settings = make_settings(gateway.port(), 18);
    settings.reconnect_max_attempts = 2;
    ConnectionManager manager(settings, listener, spdlog::default_logger());
    manager.connect();

    gateway.close_listener();
    gateway.drop();

    ASSERT_TRUE(listener.wait([&] { return listener.gave_up; }));
    EXPECT_EQ(manager.state(), CONNECTION_STATE::DISCONNECTED);
    EXPECT_THROW(manager.send(wire::current_time_request{}), connection_lost);
}

TEST(ConnectionManagerTest, IdleSessionSendsHeartbeat) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    auto settings = make_settings(gateway.port(), 19);
    settings.heartbeat_interval = 100ms;
    settings.heartbeat_timeout = 5000ms;
    ConnectionManager manager(settings, listener, spdlog::default_logger());
    manager.connect();

    EXPECT_TRUE(gateway.wait_for_frames("49", 1, 2000ms));
    EXPECT_EQ(gateway.frames_with_id("49")[0], (fake::frame{"49", "1"}));
}

TEST(ConnectionManagerTest, HeartbeatTimeoutCyclesSession) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    auto settings = make_settings(gateway.port(), 20);
    settings.heartbeat_interval = 50ms;
    settings.heartbeat_timeout = 300ms;
    ConnectionManager manager(settings, listener, spdlog::default_logger());
    manager.connect();

    ASSERT_TRUE(listener.wait([&] { return !listener.lost_reasons.empty(); }));
    std::lock_guard<std::mutex> lock(listener.mutex);
    EXPECT_EQ(listener.lost_reasons[0], "heartbeat timeout");
}

TEST(ConnectionManagerTest, MalformedFrameIsSkipped) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 21), listener, spdlog::default_logger());
    manager.connect();

    gateway.send({"1", "6", "oops", "1", "1", "1", "0"});
    gateway.send({"49", "1", "1792224000"});

    ASSERT_TRUE(listener.wait([&] { return !listener.events.empty(); }));
    std::lock_guard<std::mutex> lock(listener.mutex);
    EXPECT_TRUE(std::holds_alternative<wire::current_time>(listener.events[0]));
    EXPECT_TRUE(listener.lost_reasons.empty());
}

TEST(ConnectionManagerTest, RepeatedProtocolErrorsCycleSession) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    auto settings = make_settings(gateway.port(), 22);
    settings.protocol_error_threshold = 2;
    ConnectionManager manager(settings, listener, spdlog::default_logger());
    manager.connect();

    for (int i = 0; i < 3; i++) {
        gateway.send({"3", "bad-id", "Submitted"});
    }

    ASSERT_TRUE(listener.wait([&] { return listener.reconnects == 1; }));
    std::lock_guard<std::mutex> lock(listener.mutex);
    ASSERT_FALSE(listener.lost_reasons.empty());
    EXPECT_EQ(listener.lost_reasons[0], "too many consecutive protocol errors");
}

TEST(ConnectionManagerTest, CorruptLengthCyclesSession) {
    fake::FakeGateway gateway;
    gateway.start();

    MockListener listener;
    ConnectionManager manager(make_settings(gateway.port(), 23), listener, spdlog::default_logger());
    manager.connect();

    gateway.send_raw(std::string("\xff\xff\xff\xff", 4));

    ASSERT_TRUE(listener.wait([&] { return listener.reconnects == 1; }));
    EXPECT_EQ(manager.state(), CONNECTION_STATE::CONNECTED);
}

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
