#pragma once

#include <cstdint>
#include <cstddef>

namespace netsleuth::net {

// Portable type alias to avoid platform-specific ssize_t
using SSize = std::ptrdiff_t;

// Platform-agnostic socket operations used by the port prober.
// Implementations provide the actual syscall glue; common code must not
// include platform socket headers or assume AF_*/errno numeric values.
class ITcpSocketOps {
public:
    virtual ~ITcpSocketOps() = default;

    // Create an IPv4 TCP stream socket. Returns fd on success, < 0 on error (errno set).
    virtual int socket_tcp4() = 0;

    // Close socket. Safe to call on invalid fd.
    virtual void close(int fd) = 0;

    // Set nonblocking mode. Returns 0 on success, -1 on error (errno set).
    virtual int set_nonblocking(int fd) = 0;

    // Nonblocking connect to addr:port (addr in host byte order).
    // Returns 0 on immediate success, -1 with errno=EINPROGRESS if async.
    virtual int connect_ipv4(int fd, std::uint32_t addr, std::uint16_t port) = 0;

    // True once the connect attempt has resolved (check get_so_error for the outcome).
    virtual bool poll_connect_complete(int fd) = 0;

    // Get socket error status (SO_ERROR). Returns 0 if no error, errno value otherwise.
    virtual int get_so_error(int fd) = 0;

    // True if a recv() would not block.
    virtual bool poll_readable(int fd) = 0;

    // Receive data (nonblocking). Returns bytes received (>0), 0 on EOF, -1 on error (errno set).
    virtual SSize recv(int fd, void* buf, std::size_t len) = 0;

    // Get last errno value from this platform.
    virtual int last_errno() = 0;

    // Error string for errno (for logging).
    virtual const char* err_string(int errno_val) = 0;

    // errno classification helpers (platform-specific numeric values)
    virtual bool is_in_progress(int errno_val) const noexcept = 0;
    virtual bool is_would_block(int errno_val) const noexcept = 0;
};

} // namespace netsleuth::net
