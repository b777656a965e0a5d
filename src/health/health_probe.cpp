#include "health_probe.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <unistd.h>
#include <fcntl.h>

namespace {

using SteadyClock = std::chrono::steady_clock;

class SocketHandle {
public:
    explicit SocketHandle(int fd) : fd(fd) {}
    ~SocketHandle() {
        if (fd >= 0) {
            close(fd);
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd; }

private:
    int fd;
};

long long elapsedMillis(SteadyClock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start).count();
}

int remainingMillis(SteadyClock::time_point deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
    return remaining > 0 ? static_cast<int>(remaining) : 0;
}

ProbeResult failure(SteadyClock::time_point start, const std::string& message) {
    return ProbeResult{false, elapsedMillis(start), -1, message};
}

// Wait until fd reports the given events or the deadline passes.
bool waitFor(int fd, short events, SteadyClock::time_point deadline) {
    while (true) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        int result = poll(&pfd, 1, remainingMillis(deadline));
        if (result > 0) {
            return true;
        }
        if (result == 0) {
            return false;
        }
        if (errno != EINTR) {
            return false;
        }
    }
}

// Non-blocking connect bounded by the deadline. Returns the connected fd or -1.
int connectWithDeadline(const ProbeTarget& target, SteadyClock::time_point deadline, std::string& error) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    std::string port = std::to_string(target.port);
    int rc = getaddrinfo(target.host.c_str(), port.c_str(), &hints, &result);
    if (rc != 0) {
        error = "Failed to resolve " + target.host + ": " + gai_strerror(rc);
        return -1;
    }

    int connected = -1;
    for (struct addrinfo* ai = result; ai != nullptr && connected < 0; ai = ai->ai_next) {
        int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            error = std::string("socket: ") + strerror(errno);
            continue;
        }
        int flags = fcntl(sock, F_GETFL, 0);
        fcntl(sock, F_SETFL, flags | O_NONBLOCK);

        int connectResult = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (connectResult == 0) {
            connected = sock;
            break;
        }
        if (errno != EINPROGRESS) {
            error = std::string("connect: ") + strerror(errno);
            close(sock);
            continue;
        }
        if (!waitFor(sock, POLLOUT, deadline)) {
            error = "connect timed out";
            close(sock);
            continue;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        getsockopt(sock, SOL_SOCKET, SO_ERROR, &soError, &len);
        if (soError != 0) {
            error = std::string("connect: ") + strerror(soError);
            close(sock);
            continue;
        }
        connected = sock;
    }
    freeaddrinfo(result);
    return connected;
}

} // namespace

ProbeResult TcpHealthProbe::probe(const ProbeTarget& target, std::chrono::milliseconds timeout) {
    auto start = SteadyClock::now();
    auto deadline = start + timeout;

    std::string error;
    SocketHandle sock(connectWithDeadline(target, deadline, error));
    if (sock.get() < 0) {
        return failure(start, error);
    }
    return ProbeResult{true, elapsedMillis(start), -1, ""};
}

HttpHealthProbe::HttpHealthProbe(const std::string& path, int expectedStatus) : path(path), expectedStatus(expectedStatus) {
    if (this->path.empty() || this->path[0] != '/') {
        this->path = "/" + this->path;
    }
}

ProbeResult HttpHealthProbe::probe(const ProbeTarget& target, std::chrono::milliseconds timeout) {
    auto start = SteadyClock::now();
    auto deadline = start + timeout;

    std::string error;
    SocketHandle sock(connectWithDeadline(target, deadline, error));
    if (sock.get() < 0) {
        return failure(start, error);
    }

    std::string request = "GET " + path + " HTTP/1.0\r\nHost: " + target.host + "\r\nConnection: close\r\n\r\n";
    size_t sent = 0;
    while (sent < request.size()) {
        if (!waitFor(sock.get(), POLLOUT, deadline)) {
            return failure(start, "send timed out");
        }
        ssize_t n = send(sock.get(), request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            return failure(start, std::string("send: ") + strerror(errno));
        }
        sent += static_cast<size_t>(n);
    }

    // Only the status line is needed
    std::string response;
    char buffer[512];
    while (response.find("\r\n") == std::string::npos) {
        if (!waitFor(sock.get(), POLLIN, deadline)) {
            return failure(start, "response timed out");
        }
        ssize_t n = recv(sock.get(), buffer, sizeof(buffer), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                continue;
            }
            return failure(start, std::string("recv: ") + strerror(errno));
        }
        if (n == 0) {
            break;
        }
        response.append(buffer, static_cast<size_t>(n));
    }

    int status = parseHttpStatusLine(response);
    long long responseTime = elapsedMillis(start);
    if (status < 0) {
        return ProbeResult{false, responseTime, -1, "Malformed HTTP response"};
    }
    if (status != expectedStatus) {
        return ProbeResult{false, responseTime, status,
                           "Unexpected status code: got " + std::to_string(status) + ", expected " + std::to_string(expectedStatus)};
    }
    return ProbeResult{true, responseTime, status, ""};
}

int parseHttpStatusLine(const std::string& response) {
    if (response.compare(0, 5, "HTTP/") != 0) {
        return -1;
    }
    size_t space = response.find(' ');
    if (space == std::string::npos || space + 4 > response.size()) {
        return -1;
    }
    int status = 0;
    for (size_t i = space + 1; i < space + 4; ++i) {
        if (response[i] < '0' || response[i] > '9') {
            return -1;
        }
        status = status * 10 + (response[i] - '0');
    }
    return status;
}

std::shared_ptr<HealthProbe> createHealthProbe(ProbeType type, const std::string& path, int expectedStatus) {
    switch (type) {
        case ProbeType::TCP_PROBE:
            return std::make_shared<TcpHealthProbe>();
        case ProbeType::HTTP_PROBE:
            return std::make_shared<HttpHealthProbe>(path, expectedStatus);
    }
    throw std::invalid_argument("Unsupported probe type: " + std::to_string(type));
}

ProbeType parseProbeType(const std::string& name) {
    if (name == "tcp") {
        return ProbeType::TCP_PROBE;
    }
    if (name == "http") {
        return ProbeType::HTTP_PROBE;
    }
    throw std::invalid_argument("Unknown health check type: " + name);
}
