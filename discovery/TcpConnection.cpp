#include "TcpConnection.hpp"
#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lanwatch::discovery
{
    TcpConnection::~TcpConnection()
    {
        Close();
    }

    void TcpConnection::Close()
    {
        if (m_fd >= 0)
        {
            close(m_fd);
            m_fd = -1;
        }
    }

    ConnectOutcome TcpConnection::Connect(const std::string &address, int port, std::chrono::milliseconds timeout)
    {
        Close();

        struct sockaddr_in servaddr;
        std::memset(&servaddr, 0, sizeof(servaddr));
        servaddr.sin_family = AF_INET;
        servaddr.sin_port = htons(static_cast<uint16_t>(port));
        if (inet_pton(AF_INET, address.c_str(), &servaddr.sin_addr) != 1)
            return ConnectOutcome::Error;

        m_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (m_fd < 0)
            return ConnectOutcome::Error;

        int flags = fcntl(m_fd, F_GETFL, 0);
        if (flags < 0 || fcntl(m_fd, F_SETFL, flags | O_NONBLOCK) < 0)
        {
            Close();
            return ConnectOutcome::Error;
        }

        if (connect(m_fd, (struct sockaddr *)&servaddr, sizeof(servaddr)) == 0)
            return ConnectOutcome::Connected;

        if (errno == ECONNREFUSED)
        {
            Close();
            return ConnectOutcome::Refused;
        }
        if (errno != EINPROGRESS)
        {
            Close();
            return ConnectOutcome::Error;
        }

        struct pollfd pfd;
        pfd.fd = m_fd;
        pfd.events = POLLOUT;
        int poll_ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (poll_ret == 0)
        {
            Close();
            return ConnectOutcome::Timeout;
        }
        if (poll_ret < 0)
        {
            Close();
            return ConnectOutcome::Error;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(m_fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0)
            so_error = errno;

        if (so_error == 0)
            return ConnectOutcome::Connected;

        Close();
        if (so_error == ECONNREFUSED)
            return ConnectOutcome::Refused;
        if (so_error == ETIMEDOUT || so_error == EHOSTUNREACH)
            return ConnectOutcome::Timeout;
        return ConnectOutcome::Error;
    }

    bool TcpConnection::Send(const std::string &data)
    {
        if (m_fd < 0)
            return false;

        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = send(m_fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n > 0)
            {
                sent += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                struct pollfd pfd;
                pfd.fd = m_fd;
                pfd.events = POLLOUT;
                if (poll(&pfd, 1, 500) > 0)
                    continue;
            }
            return false;
        }
        return true;
    }

    std::string TcpConnection::Receive(std::chrono::milliseconds timeout, size_t max_bytes)
    {
        std::string received;
        if (m_fd < 0)
            return received;

        auto deadline = std::chrono::steady_clock::now() + timeout;
        char buffer[512];

        while (received.size() < max_bytes)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0)
                break;

            struct pollfd pfd;
            pfd.fd = m_fd;
            pfd.events = POLLIN;
            if (poll(&pfd, 1, static_cast<int>(remaining.count())) <= 0)
                break;

            ssize_t n = recv(m_fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
                break;
            received.append(buffer, static_cast<size_t>(n));

            // A banner line is enough; do not wait out the full timeout.
            if (received.find("\r\n\r\n") != std::string::npos)
                break;
            if (received.rfind("SSH-", 0) == 0 && received.find('\n') != std::string::npos)
                break;
        }

        if (received.size() > max_bytes)
            received.resize(max_bytes);
        return received;
    }
}
