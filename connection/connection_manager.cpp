#include "connection_manager.H"
#include "tws_socket.H"

#include "common/utils.H"
#include "wire/field_codec.H"
#include "wire/wire_codec.H"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

namespace tws::conn {

std::mutex ConnectionManager::endpoints_mutex;
std::vector<ConnectionManager::endpoint> ConnectionManager::live_endpoints;

namespace {

constexpr int POLL_INTERVAL_MS = 50;
constexpr size_t READ_BUFFER_SIZE = 65536;

uint64_t to_ns(std::chrono::milliseconds ms) {
    return static_cast<uint64_t>(ms.count()) * 1'000'000;
}

} // namespace

const char* to_string(CONNECTION_STATE state) {
    switch (state) {
        case CONNECTION_STATE::DISCONNECTED: return "DISCONNECTED";
        case CONNECTION_STATE::CONNECTING: return "CONNECTING";
        case CONNECTION_STATE::CONNECTED: return "CONNECTED";
        case CONNECTION_STATE::RECONNECTING: return "RECONNECTING";
    }
    return "UNKNOWN";
}

ConnectionManager::ConnectionManager(connection_settings settings, SessionListener& listener,
                                     std::shared_ptr<spdlog::logger> logger)
    : config(std::move(settings)), listener(listener), logger(logger), parser(*this, logger) {
    sender = std::thread(&ConnectionManager::sender_loop, this);
}

ConnectionManager::~ConnectionManager() {
    disconnect();
    {
        std::lock_guard<std::mutex> lock(outbox_mutex);
        sender_stopping = true;
    }
    outbox_cv.notify_all();
    sender.join();
}

connection_info ConnectionManager::connect() {
    if (reader.joinable()) {
        // a previous session ended after failed reconnects
        if (reader.get_id() == std::this_thread::get_id()) {
            logger->error("connect() called from a session callback");
            throw connect_error(CONNECT_FAILURE::ENDPOINT_IN_USE, "connect from the reader thread");
        }
        reader.join();
    }

    if (state() != CONNECTION_STATE::DISCONNECTED) {
        logger->error("Already connected to {}:{}", config.host, config.port);
        throw connect_error(CONNECT_FAILURE::ENDPOINT_IN_USE, "already connected");
    }

    if (!claim_endpoint()) {
        logger->error("Endpoint {}:{} client {} already has a live connection", config.host, config.port,
                      config.client_id);
        throw connect_error(CONNECT_FAILURE::ENDPOINT_IN_USE,
                            config.host + ":" + std::to_string(config.port) + " client " +
                                std::to_string(config.client_id));
    }

    set_state(CONNECTION_STATE::CONNECTING);
    connection_info info;
    try {
        info = open_session();
    } catch (const tws_error&) {
        set_state(CONNECTION_STATE::DISCONNECTED);
        release_endpoint();
        throw;
    }

    stopping = false;
    cycle_requested = false;
    consecutive_errors = 0;
    last_receive_ns = nanotime();
    last_heartbeat_ns = last_receive_ns;
    parser.reset();
    parser.set_server_version(info.server_version);

    set_state(CONNECTION_STATE::CONNECTED);
    reader = std::thread(&ConnectionManager::reader_loop, this);

    logger->info("Connected to {}:{} as client {}, server version {}, next valid id {}", config.host, config.port,
                 config.client_id, info.server_version, info.next_valid_id);
    return info;
}

void ConnectionManager::disconnect() {
    bool was_connected = state() != CONNECTION_STATE::DISCONNECTED;
    {
        std::lock_guard<std::mutex> lock(backoff_mutex);
        stopping = true;
    }
    backoff_cv.notify_all();

    if (reader.joinable()) {
        if (reader.get_id() == std::this_thread::get_id()) {
            // the reader finishes the teardown once the current callback returns
            return;
        }
        reader.join();
    }

    close_session();
    set_state(CONNECTION_STATE::DISCONNECTED);
    release_endpoint();

    if (was_connected) {
        logger->info("Disconnected from {}:{}", config.host, config.port);
    }
}

void ConnectionManager::send(const wire::request& req) {
    std::lock_guard<std::mutex> lock(send_mutex);
    CONNECTION_STATE current = state();
    int fd;
    int version;
    {
        std::lock_guard<std::mutex> fd_lock(fd_mutex);
        fd = sock_fd;
        version = session_info.server_version;
    }
    if (current != CONNECTION_STATE::CONNECTED || fd == -1) {
        logger->warn("Cannot send {} while {}", wire::request_name(req), to_string(current));
        throw connection_lost(std::string("not connected (") + to_string(current) + ")");
    }

    std::string bytes = wire::encode(req, version);
    logger->debug("Sending {} ({} bytes)", wire::request_name(req), bytes.size());
    write_session(fd, bytes);
}

void ConnectionManager::post(const wire::request& req) {
    {
        std::lock_guard<std::mutex> lock(outbox_mutex);
        outbox.push_back(req);
    }
    outbox_cv.notify_one();
}

void ConnectionManager::sender_loop() {
    while (true) {
        wire::request req;
        {
            std::unique_lock<std::mutex> lock(outbox_mutex);
            outbox_cv.wait(lock, [this] { return sender_stopping || !outbox.empty(); });
            if (sender_stopping) {
                if (!outbox.empty()) {
                    logger->info("Dropping {} queued requests on shutdown", outbox.size());
                }
                return;
            }
            req = std::move(outbox.front());
            outbox.pop_front();
        }

        try {
            send(req);
        } catch (const tws_error& e) {
            logger->warn("Queued {} not sent: {}", wire::request_name(req), e.what());
        }
    }
}

// replay and heartbeat path; the caller already knows the session is up
void ConnectionManager::send_raw(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(send_mutex);
    int fd;
    {
        std::lock_guard<std::mutex> fd_lock(fd_mutex);
        fd = sock_fd;
    }
    if (fd == -1) {
        throw connection_lost("socket closed");
    }
    write_session(fd, bytes);
}

void ConnectionManager::write_session(int fd, const std::string& bytes) {
    try {
        write_all(fd, bytes, nanotime() + to_ns(config.write_timeout));
    } catch (const connection_lost& e) {
        // wakes the reader, which owns the teardown
        logger->error("Write to gateway failed: {}", e.what());
        ::shutdown(fd, SHUT_RDWR);
        throw;
    }
}

void ConnectionManager::close_session() {
    {
        // a writer stuck on this socket fails fast and drops send_mutex
        std::lock_guard<std::mutex> lock(fd_mutex);
        if (sock_fd != -1) {
            ::shutdown(sock_fd, SHUT_RDWR);
        }
    }
    std::lock_guard<std::mutex> send_lock(send_mutex);
    std::lock_guard<std::mutex> lock(fd_mutex);
    close_socket(sock_fd);
}

void ConnectionManager::request_cycle(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(cycle_mutex);
        cycle_reason = reason;
    }
    cycle_requested = true;
    logger->info("Session cycle requested: {}", reason);
}

connection_info ConnectionManager::info() const {
    std::lock_guard<std::mutex> lock(fd_mutex);
    return session_info;
}

void ConnectionManager::set_state(CONNECTION_STATE next) {
    CONNECTION_STATE prev = current_state.exchange(next);
    if (prev != next) {
        logger->info("Connection state {} -> {}", to_string(prev), to_string(next));
    }
}

connection_info ConnectionManager::open_session() {
    int fd = open_socket(config.host, config.port, config.connect_timeout, logger);

    connection_info info;
    try {
        info = handshake(fd);
    } catch (const tws_error&) {
        close_socket(fd);
        throw;
    }

    std::lock_guard<std::mutex> lock(fd_mutex);
    sock_fd = fd;
    session_info = info;
    return info;
}

connection_info ConnectionManager::handshake(int fd) {
    uint64_t deadline = nanotime() + to_ns(config.connect_timeout);
    connection_info info;

    try {
        write_all(fd, wire::encode_handshake(), deadline);

        std::string payload = read_frame_payload(fd, deadline);
        auto fields = wire::split_fields(payload.data(), payload.size());
        wire::FieldReader hello(fields);
        info.server_version = hello.read_int();
        if (hello.remaining() > 0) {
            info.connection_time = hello.read_string();
        }

        if (!wire::is_supported_server_version(info.server_version)) {
            logger->error("Gateway server version {} is outside the supported range {}..{}", info.server_version,
                          wire::MIN_SERVER_VERSION, wire::MAX_CLIENT_VERSION);
            throw connect_error(CONNECT_FAILURE::VERSION_MISMATCH,
                                "server version " + std::to_string(info.server_version));
        }

        wire::start_api_request start;
        start.client_id = config.client_id;
        start.optional_capabilities = config.optional_capabilities;
        write_all(fd, wire::encode(start, info.server_version), deadline);

        // the session is usable once the gateway hands out the next order id
        while (true) {
            payload = read_frame_payload(fd, deadline);
            fields = wire::split_fields(payload.data(), payload.size());
            if (fields.empty()) {
                continue;
            }

            wire::event ev = wire::decode_event(fields, info.server_version);
            if (auto* id = std::get_if<wire::next_valid_id>(&ev)) {
                info.next_valid_id = id->order_id;
                break;
            }
            if (auto* accounts = std::get_if<wire::managed_accounts>(&ev)) {
                info.accounts = accounts->accounts;
            } else if (auto* err = std::get_if<wire::error_message>(&ev)) {
                if (err->code == wire::ERR_CLIENT_ID_IN_USE) {
                    logger->error("Client id {} is already in use: {}", config.client_id, err->message);
                    throw connect_error(CONNECT_FAILURE::CLIENT_ID_IN_USE, err->message);
                }
                logger->info("Gateway notice {} during handshake: {}", err->code, err->message);
            } else {
                logger->debug("Ignoring {} during handshake", wire::event_name(ev));
            }
        }
    } catch (const timeout_error& e) {
        logger->error("Handshake with {}:{} timed out", config.host, config.port);
        throw connect_error(CONNECT_FAILURE::TIMEOUT, e.what());
    } catch (const connection_lost& e) {
        logger->error("Gateway dropped the handshake: {}", e.what());
        throw connect_error(CONNECT_FAILURE::REFUSED, e.what());
    } catch (const protocol_error& e) {
        logger->error("Unreadable handshake reply: {}", e.what());
        throw connect_error(CONNECT_FAILURE::VERSION_MISMATCH, e.what());
    }

    return info;
}

void ConnectionManager::on_event(const wire::event& ev) {
    consecutive_errors = 0;
    logger->debug("Received {}", wire::event_name(ev));
    try {
        listener.on_event(ev);
    } catch (const std::exception& e) {
        logger->error("Listener failed on {}: {}", wire::event_name(ev), e.what());
    }
}

void ConnectionManager::on_protocol_error(const protocol_error& err) {
    consecutive_errors++;
    logger->warn("Protocol error {} of {}: {}", consecutive_errors, config.protocol_error_threshold, err.what());
}

void ConnectionManager::reader_loop() {
    logger->info("Reader thread started");

    while (!stopping && state() != CONNECTION_STATE::DISCONNECTED) {
        if (cycle_requested.exchange(false)) {
            std::string reason;
            {
                std::lock_guard<std::mutex> lock(cycle_mutex);
                reason = cycle_reason;
            }
            handle_loss("session cycle: " + reason, true);
            continue;
        }

        int fd;
        {
            std::lock_guard<std::mutex> lock(fd_mutex);
            fd = sock_fd;
        }

        struct pollfd pfd = {fd, POLLIN, 0};
        int rc = poll(&pfd, 1, POLL_INTERVAL_MS);
        if (rc == -1) {
            if (errno == EINTR) {
                continue;
            }
            handle_loss("poll: " + std::string(strerror(errno)), false);
            continue;
        }
        if (rc > 0 && !read_available()) {
            continue;
        }

        if (!stopping) {
            check_heartbeat();
        }
    }

    if (stopping) {
        close_session();
        set_state(CONNECTION_STATE::DISCONNECTED);
        release_endpoint();
    }
    logger->info("Reader thread stopped");
}

bool ConnectionManager::read_available() {
    char buf[READ_BUFFER_SIZE];

    int fd;
    {
        std::lock_guard<std::mutex> lock(fd_mutex);
        fd = sock_fd;
    }

    ssize_t len = read(fd, buf, sizeof(buf));
    if (len == 0) {
        handle_loss("gateway closed the connection", false);
        return false;
    }
    if (len == -1) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
            return true;
        }
        handle_loss("read: " + std::string(strerror(errno)), false);
        return false;
    }

    last_receive_ns = nanotime();
    parser.parse(buf, static_cast<size_t>(len));

    if (parser.corrupted()) {
        handle_loss("corrupt frame stream", true);
        return false;
    }
    if (consecutive_errors > config.protocol_error_threshold) {
        handle_loss("too many consecutive protocol errors", true);
        return false;
    }
    return true;
}

void ConnectionManager::check_heartbeat() {
    uint64_t now = nanotime();
    uint64_t idle = now - last_receive_ns;

    if (config.heartbeat_timeout.count() > 0 && idle >= to_ns(config.heartbeat_timeout)) {
        handle_loss("heartbeat timeout", false);
        return;
    }

    if (config.heartbeat_interval.count() > 0 && idle >= to_ns(config.heartbeat_interval)
        && now - last_heartbeat_ns >= to_ns(config.heartbeat_interval)) {
        last_heartbeat_ns = now;
        logger->debug("Idle for {}ms, sending heartbeat", idle / 1'000'000);
        post(wire::current_time_request{});
    }
}

void ConnectionManager::handle_loss(const std::string& reason, bool immediate) {
    logger->warn("Session to {}:{} lost: {}", config.host, config.port, reason);
    set_state(CONNECTION_STATE::RECONNECTING);
    close_session();
    parser.reset();

    try {
        listener.on_connection_lost(reason);
    } catch (const std::exception& e) {
        logger->error("Listener failed on connection loss: {}", e.what());
    }

    if (stopping) {
        return;
    }
    if (reconnect(immediate)) {
        return;
    }
    if (stopping) {
        return;
    }

    logger->error("Giving up on {}:{} after {} reconnect attempts", config.host, config.port,
                  config.reconnect_max_attempts);
    set_state(CONNECTION_STATE::DISCONNECTED);
    release_endpoint();
    try {
        listener.on_reconnect_failed(reason);
    } catch (const std::exception& e) {
        logger->error("Listener failed on reconnect failure: {}", e.what());
    }
}

bool ConnectionManager::reconnect(bool immediate) {
    std::chrono::milliseconds delay = immediate ? std::chrono::milliseconds(0) : config.reconnect_initial_backoff;

    for (int attempt = 1; attempt <= config.reconnect_max_attempts; attempt++) {
        if (delay.count() > 0 && !wait_for_backoff(delay)) {
            return false;
        }
        if (stopping) {
            return false;
        }

        logger->info("Reconnect attempt {}/{} to {}:{}", attempt, config.reconnect_max_attempts, config.host,
                     config.port);
        connection_info info;
        try {
            info = open_session();
        } catch (const connect_error& e) {
            logger->warn("Reconnect attempt {} failed: {}", attempt, e.what());
            delay = delay.count() == 0 ? config.reconnect_initial_backoff
                                       : std::min(delay * 2, config.reconnect_max_backoff);
            continue;
        }

        consecutive_errors = 0;
        last_receive_ns = nanotime();
        last_heartbeat_ns = last_receive_ns;
        parser.set_server_version(info.server_version);

        // replayed while still RECONNECTING so no caller send can interleave a duplicate
        std::vector<wire::request> replay;
        try {
            replay = listener.resubscribe_requests();
        } catch (const std::exception& e) {
            logger->error("Listener failed to list subscriptions: {}", e.what());
        }
        size_t replayed = 0;
        for (const auto& req : replay) {
            try {
                send_raw(wire::encode(req, info.server_version));
                replayed++;
            } catch (const encoding_error& e) {
                logger->error("Dropping resubscription {}: {}", wire::request_name(req), e.what());
            } catch (const connection_lost& e) {
                logger->warn("Session dropped during resubscription: {}", e.what());
                break;
            }
        }

        set_state(CONNECTION_STATE::CONNECTED);
        logger->info("Session restored on attempt {}, replayed {} of {} subscriptions", attempt, replayed,
                     replay.size());
        try {
            listener.on_reconnected(info);
        } catch (const std::exception& e) {
            logger->error("Listener failed on reconnect: {}", e.what());
        }
        return true;
    }
    return false;
}

bool ConnectionManager::wait_for_backoff(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(backoff_mutex);
    backoff_cv.wait_for(lock, delay, [this] { return stopping.load(); });
    return !stopping;
}

bool ConnectionManager::claim_endpoint() {
    std::lock_guard<std::mutex> lock(endpoints_mutex);
    endpoint ep{config.host, config.port, config.client_id};
    if (std::find(live_endpoints.begin(), live_endpoints.end(), ep) != live_endpoints.end()) {
        return false;
    }
    live_endpoints.push_back(ep);
    endpoint_claimed = true;
    return true;
}

void ConnectionManager::release_endpoint() {
    std::lock_guard<std::mutex> lock(endpoints_mutex);
    if (!endpoint_claimed) {
        return;
    }
    endpoint ep{config.host, config.port, config.client_id};
    live_endpoints.erase(std::remove(live_endpoints.begin(), live_endpoints.end(), ep), live_endpoints.end());
    endpoint_claimed = false;
}

} // namespace tws::conn
