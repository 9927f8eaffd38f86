#pragma once

#include "dfm/core/platform.hpp"
#include "dfm/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dfm::network {

#ifdef DFM_PLATFORM_WINDOWS
    using socket_t = SOCKET;
    constexpr socket_t INVALID_SOCKET_VALUE = INVALID_SOCKET;
#else
    using socket_t = int;
    constexpr socket_t INVALID_SOCKET_VALUE = -1;
#endif

/**
 * @brief Blocking TCP client socket with send/receive timeouts
 *
 * Owned exclusively by one HTTP exchange; closed on destruction.
 */
class Socket {
public:
    Socket();
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    /// Resolve host (name or IPv4 literal) and connect within timeout
    Result<void> connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout);

    /// Apply SO_RCVTIMEO / SO_SNDTIMEO to subsequent calls
    Result<void> set_timeout(std::chrono::milliseconds timeout);

    Result<void> send_all(const uint8_t* data, size_t size);

    /// Returns 0 when the peer closed the connection
    Result<size_t> receive(uint8_t* buffer, size_t max_size);

    void close();
    bool is_valid() const { return socket_ != INVALID_SOCKET_VALUE; }

    socket_t native_handle() const { return socket_; }

private:
    Result<void> connect_with_timeout(const sockaddr* address, socklen_t length,
                                      std::chrono::milliseconds timeout);

    socket_t socket_;

    static bool platform_initialized_;
    static Result<void> initialize_platform();
};

} // namespace dfm::network
