#include "dfm/network/socket.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>

#ifdef DFM_PLATFORM_WINDOWS
    #define close_socket closesocket
#else
    #define close_socket ::close
    #include <fcntl.h>
    #include <poll.h>
#endif

namespace dfm::network {

namespace {

Result<void> set_blocking(socket_t socket, bool blocking) {
#ifdef DFM_PLATFORM_WINDOWS
    u_long mode = blocking ? 0 : 1;
    if (ioctlsocket(socket, FIONBIO, &mode) != 0) {
        return Err<void>(std::string("Failed to change blocking mode"));
    }
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        return Err<void>(std::string("Failed to get socket flags"));
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (fcntl(socket, F_SETFL, flags) == -1) {
        return Err<void>(std::string("Failed to change blocking mode"));
    }
#endif
    return Ok();
}

bool last_error_was_timeout() {
#ifdef DFM_PLATFORM_WINDOWS
    return WSAGetLastError() == WSAETIMEDOUT;
#else
    return errno == EAGAIN || errno == EWOULDBLOCK;
#endif
}

} // namespace

bool Socket::platform_initialized_ = false;

Result<void> Socket::initialize_platform() {
    if (platform_initialized_) {
        return Ok();
    }

#ifdef DFM_PLATFORM_WINDOWS
    WSADATA wsa_data;
    if (WSAStartup(MAKEWORD(2, 2), &wsa_data) != 0) {
        return Err<void>(std::string("Failed to initialize Winsock"));
    }
#endif

    platform_initialized_ = true;
    return Ok();
}

Socket::Socket()
    : socket_(INVALID_SOCKET_VALUE) {
    auto init = initialize_platform();
    if (init.is_error()) {
        spdlog::error("{}", init.error());
    }
}

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept
    : socket_(other.socket_) {
    other.socket_ = INVALID_SOCKET_VALUE;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        other.socket_ = INVALID_SOCKET_VALUE;
    }
    return *this;
}

Result<void> Socket::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) {
    if (socket_ != INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket already connected"));
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* resolved = nullptr;
    const std::string service = std::to_string(port);
    if (getaddrinfo(host.c_str(), service.c_str(), &hints, &resolved) != 0 || resolved == nullptr) {
        if (resolved) {
            freeaddrinfo(resolved);
        }
        return Err<void>(std::string("Failed to resolve host: ") + host);
    }

    std::string last_error = "no addresses for " + host;
    for (addrinfo* candidate = resolved; candidate != nullptr; candidate = candidate->ai_next) {
        socket_ = ::socket(candidate->ai_family, candidate->ai_socktype, candidate->ai_protocol);
        if (socket_ == INVALID_SOCKET_VALUE) {
            last_error = "Failed to create socket";
            continue;
        }

        auto connected = connect_with_timeout(candidate->ai_addr,
                                              static_cast<socklen_t>(candidate->ai_addrlen),
                                              timeout);
        if (connected.is_ok()) {
            freeaddrinfo(resolved);
            spdlog::debug("Connected to {}:{}", host, port);
            return set_timeout(timeout);
        }

        last_error = connected.error();
        close();
    }

    freeaddrinfo(resolved);
    return Err<void>("Failed to connect to " + host + ":" + std::to_string(port) + " - " + last_error);
}

Result<void> Socket::connect_with_timeout(const sockaddr* address, socklen_t length,
                                          std::chrono::milliseconds timeout) {
    auto nonblocking = set_blocking(socket_, false);
    if (nonblocking.is_error()) {
        return nonblocking;
    }

    if (::connect(socket_, address, length) != 0) {
#ifdef DFM_PLATFORM_WINDOWS
        const bool in_progress = WSAGetLastError() == WSAEWOULDBLOCK;
#else
        const bool in_progress = errno == EINPROGRESS;
#endif
        if (!in_progress) {
            return Err<void>(std::string("connect() refused"));
        }

#ifdef DFM_PLATFORM_WINDOWS
        fd_set write_set;
        FD_ZERO(&write_set);
        FD_SET(socket_, &write_set);
        timeval tv{};
        tv.tv_sec = static_cast<long>(timeout.count() / 1000);
        tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);
        const int ready = ::select(0, nullptr, &write_set, nullptr, &tv);
#else
        pollfd pfd{};
        pfd.fd = socket_;
        pfd.events = POLLOUT;
        const int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
#endif
        if (ready == 0) {
            return Err<void>(std::string("connect() timed out"));
        }
        if (ready < 0) {
            return Err<void>(std::string("connect() wait failed"));
        }

        int so_error = 0;
        socklen_t so_len = sizeof(so_error);
        if (getsockopt(socket_, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&so_error), &so_len) != 0 ||
            so_error != 0) {
            return Err<void>(std::string("connect() failed: ") + std::strerror(so_error));
        }
    }

    return set_blocking(socket_, true);
}

Result<void> Socket::set_timeout(std::chrono::milliseconds timeout) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not connected"));
    }

#ifdef DFM_PLATFORM_WINDOWS
    DWORD value = static_cast<DWORD>(timeout.count());
    const char* option = reinterpret_cast<const char*>(&value);
    const int option_len = sizeof(value);
#else
    timeval value{};
    value.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    value.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    const void* option = &value;
    const socklen_t option_len = sizeof(value);
#endif

    if (setsockopt(socket_, SOL_SOCKET, SO_RCVTIMEO, option, option_len) < 0 ||
        setsockopt(socket_, SOL_SOCKET, SO_SNDTIMEO, option, option_len) < 0) {
        return Err<void>(std::string("Failed to set socket timeouts"));
    }
    return Ok();
}

Result<void> Socket::send_all(const uint8_t* data, size_t size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<void>(std::string("Socket not connected"));
    }

    size_t total_sent = 0;
    while (total_sent < size) {
        auto sent = ::send(socket_,
                           reinterpret_cast<const char*>(data + total_sent),
                           static_cast<int>(size - total_sent), 0);
        if (sent < 0) {
            if (last_error_was_timeout()) {
                return Err<void>(std::string("Send timed out"));
            }
            return Err<void>(std::string("Failed to send data"));
        }
        total_sent += static_cast<size_t>(sent);
    }
    return Ok();
}

Result<size_t> Socket::receive(uint8_t* buffer, size_t max_size) {
    if (socket_ == INVALID_SOCKET_VALUE) {
        return Err<size_t>(std::string("Socket not connected"));
    }

    auto received = ::recv(socket_, reinterpret_cast<char*>(buffer), static_cast<int>(max_size), 0);
    if (received < 0) {
        if (last_error_was_timeout()) {
            return Err<size_t>(std::string("Receive timed out"));
        }
        return Err<size_t>(std::string("Failed to receive data"));
    }

    return Ok(static_cast<size_t>(received));
}

void Socket::close() {
    if (socket_ != INVALID_SOCKET_VALUE) {
        close_socket(socket_);
        socket_ = INVALID_SOCKET_VALUE;
    }
}

} // namespace dfm::network
