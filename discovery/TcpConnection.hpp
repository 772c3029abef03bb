#pragma once

#include <chrono>
#include <string>

namespace lanwatch::discovery
{
    enum class ConnectOutcome
    {
        Connected,
        Refused,
        Timeout,
        Error
    };

    // Non-blocking IPv4 TCP client socket. Closes on destruction.
    class TcpConnection
    {
    public:
        TcpConnection() = default;
        ~TcpConnection();

        TcpConnection(const TcpConnection &) = delete;
        TcpConnection &operator=(const TcpConnection &) = delete;

        ConnectOutcome Connect(const std::string &address, int port, std::chrono::milliseconds timeout);

        bool Send(const std::string &data);

        // Reads whatever arrives within timeout, up to max_bytes. Empty on timeout or EOF.
        std::string Receive(std::chrono::milliseconds timeout, size_t max_bytes = 2048);

        void Close();
        bool IsOpen() const { return m_fd >= 0; }

    private:
        int m_fd = -1;
    };
}
