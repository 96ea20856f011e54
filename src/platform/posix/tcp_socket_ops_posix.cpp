#include "netsleuth/platform/tcp_socket_ops.h"

#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace netsleuth::net {

class PosixTcpSocketOps final : public ITcpSocketOps {
public:
    int socket_tcp4() override
    {
        return ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    }

    void close(int fd) override
    {
        if (fd >= 0) {
            ::close(fd);
        }
    }

    int set_nonblocking(int fd) override
    {
        const int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags < 0) return -1;
        return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    int connect_ipv4(int fd, std::uint32_t addr, std::uint16_t port) override
    {
        struct sockaddr_in sa {};
        sa.sin_family      = AF_INET;
        sa.sin_port        = htons(port);
        sa.sin_addr.s_addr = htonl(addr);
        return ::connect(fd, reinterpret_cast<const struct sockaddr*>(&sa), sizeof(sa));
    }

    bool poll_connect_complete(int fd) override
    {
        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        const int pr = ::poll(&pfd, 1, 0);
        if (pr < 0) {
            return false; // error, errno set
        }
        return pr > 0;
    }

    int get_so_error(int fd) override
    {
        int err = 0;
        socklen_t len = sizeof(err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
            return errno;
        }
        return err;
    }

    bool poll_readable(int fd) override
    {
        struct pollfd pfd {};
        pfd.fd = fd;
        pfd.events = POLLIN;
        return ::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN) != 0;
    }

    SSize recv(int fd, void* buf, std::size_t len) override
    {
        return ::recv(fd, buf, len, MSG_DONTWAIT);
    }

    int last_errno() override
    {
        return errno;
    }

    const char* err_string(int errno_val) override
    {
        return std::strerror(errno_val);
    }

    bool is_in_progress(int errno_val) const noexcept override
    {
        return errno_val == EINPROGRESS;
    }

    bool is_would_block(int errno_val) const noexcept override
    {
        return errno_val == EAGAIN || errno_val == EWOULDBLOCK;
    }
};

} // namespace netsleuth::net

namespace netsleuth::platform {

// Global instance for POSIX platform
static netsleuth::net::PosixTcpSocketOps g_posix_socket_ops;

netsleuth::net::ITcpSocketOps& default_tcp_socket_ops()
{
    return g_posix_socket_ops;
}

} // namespace netsleuth::platform
