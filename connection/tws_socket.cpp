#include "tws_socket.H"

#include "common/errors.H"
#include "common/utils.H"
#include "wire/tws_protocol.H"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace tws::conn {

namespace {

int remaining_ms(uint64_t deadline_ns) {
    uint64_t now = nanotime();
    if (now >= deadline_ns) {
        return 0;
    }
    // round up so a sub-millisecond remainder still polls once
    return static_cast<int>((deadline_ns - now + 999'999) / 1'000'000);
}

} // namespace

int open_socket(const std::string& host, uint16_t port, std::chrono::milliseconds timeout,
                const std::shared_ptr<spdlog::logger>& logger) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int rc = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (rc != 0) {
        logger->error("Failed to resolve {}: {}", host, gai_strerror(rc));
        throw connect_error(CONNECT_FAILURE::REFUSED, "cannot resolve " + host + ": " + gai_strerror(rc));
    }

    struct sockaddr_in addr;
    std::memcpy(&addr, res->ai_addr, sizeof(addr));
    freeaddrinfo(res);

    int sock_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (sock_fd == -1) {
        logger->error("Failed to create socket: {}", strerror(errno));
        throw connect_error(CONNECT_FAILURE::REFUSED, "socket: " + std::string(strerror(errno)));
    }

    // set socket to non-blocking
    int flags = fcntl(sock_fd, F_GETFL, 0);
    if (flags == -1 || fcntl(sock_fd, F_SETFL, flags | O_NONBLOCK) == -1) {
        logger->error("Failed to set socket to non-blocking: {}", strerror(errno));
        std::string err = strerror(errno);
        close(sock_fd);
        throw connect_error(CONNECT_FAILURE::REFUSED, "fcntl: " + err);
    }

    int one = 1;
    setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

    if (connect(sock_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == -1) {
        if (errno != EINPROGRESS) {
            std::string err = strerror(errno);
            logger->error("Failed to connect to {}:{}: {}", host, port, err);
            close(sock_fd);
            throw connect_error(CONNECT_FAILURE::REFUSED, host + ":" + port_str + ": " + err);
        }

        struct pollfd pfd = {sock_fd, POLLOUT, 0};
        int ready = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (ready == 0) {
            logger->error("Timed out connecting to {}:{} after {}ms", host, port, timeout.count());
            close(sock_fd);
            throw connect_error(CONNECT_FAILURE::TIMEOUT, host + ":" + port_str);
        }
        if (ready == -1) {
            std::string err = strerror(errno);
            logger->error("poll failed while connecting: {}", err);
            close(sock_fd);
            throw connect_error(CONNECT_FAILURE::REFUSED, "poll: " + err);
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(sock_fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == -1) {
            so_error = errno;
        }
        if (so_error != 0) {
            logger->error("Failed to connect to {}:{}: {}", host, port, strerror(so_error));
            close(sock_fd);
            CONNECT_FAILURE reason = so_error == ETIMEDOUT ? CONNECT_FAILURE::TIMEOUT : CONNECT_FAILURE::REFUSED;
            throw connect_error(reason, host + ":" + port_str + ": " + strerror(so_error));
        }
    }

    logger->info("Connected socket {} to {}:{}", sock_fd, host, port);
    return sock_fd;
}

void write_all(int fd, const std::string& data, uint64_t deadline_ns) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n >= 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            int wait_ms = remaining_ms(deadline_ns);
            if (wait_ms == 0) {
                throw connection_lost("write timed out with " + std::to_string(data.size() - sent) + " bytes unsent");
            }
            struct pollfd pfd = {fd, POLLOUT, 0};
            if (poll(&pfd, 1, wait_ms) == -1 && errno != EINTR) {
                throw connection_lost("poll: " + std::string(strerror(errno)));
            }
            continue;
        }
        throw connection_lost("send: " + std::string(strerror(errno)));
    }
}

void read_exact(int fd, char* buf, size_t len, uint64_t deadline_ns) {
    size_t got = 0;
    while (got < len) {
        ssize_t n = read(fd, buf + got, len - got);
        if (n > 0) {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n == 0) {
            throw connection_lost("gateway closed the connection");
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            throw connection_lost("read: " + std::string(strerror(errno)));
        }

        int wait_ms = remaining_ms(deadline_ns);
        if (wait_ms == 0) {
            throw timeout_error("timed out waiting for the gateway");
        }
        struct pollfd pfd = {fd, POLLIN, 0};
        if (poll(&pfd, 1, wait_ms) == -1 && errno != EINTR) {
            throw connection_lost("poll: " + std::string(strerror(errno)));
        }
    }
}

std::string read_frame_payload(int fd, uint64_t deadline_ns) {
    unsigned char header[4];
    read_exact(fd, reinterpret_cast<char*>(header), sizeof(header), deadline_ns);
    uint32_t len = (static_cast<uint32_t>(header[0]) << 24) | (static_cast<uint32_t>(header[1]) << 16)
        | (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
    if (len == 0 || len > wire::MAX_FRAME_LENGTH) {
        throw protocol_error("invalid frame length " + std::to_string(len));
    }

    std::string payload(len, '\0');
    read_exact(fd, payload.data(), len, deadline_ns);
    return payload;
}

void close_socket(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

} // namespace tws::conn
