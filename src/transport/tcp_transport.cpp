#include "transport/tcp_transport.h"
#include "transport/host_status.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <chrono>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace llink
{
    namespace
    {
        constexpr int CONNECT_POLL_SLICE_MS = 100;

        std::string lastSocketError()
        {
            return std::to_string(errno) + " (" + std::strerror(errno) + ")";
        }

        bool setBlocking(int fd, bool blocking)
        {
            int flags = fcntl(fd, F_GETFL, 0);
            if (flags < 0)
            {
                return false;
            }
            flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
            return fcntl(fd, F_SETFL, flags) == 0;
        }
    }

    TcpTransport::TcpTransport(std::string host, int port, TcpTransportOptions options)
        : host_(std::move(host)), port_(port), options_(options)
    {
    }

    TcpTransport::~TcpTransport()
    {
        close();
    }

    std::string TcpTransport::describeEndpoint() const
    {
        return StringUtils::maskString(host_) + ":" + std::to_string(port_);
    }

    VoidResult TcpTransport::open()
    {
        std::lock_guard<std::mutex> lock(ioMutex_);

        if (socket_.load() >= 0)
        {
            return VoidResult::Success();
        }
        if (!NetworkUtils::isValidIPAddress(host_) || !NetworkUtils::isValidPort(port_))
        {
            return VoidResult::Error(LLINK_ERROR_CODE::INVALID_PARAMETER, "Invalid network address: " + host_);
        }

        closed_ = false;

        int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0)
        {
            return VoidResult::Error(LLINK_ERROR_CODE::NETWORK_ERROR, "Failed to create TCP socket: " + lastSocketError());
        }
        socket_ = fd;

        sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = htons(static_cast<uint16_t>(port_));
        inet_pton(AF_INET, host_.c_str(), &addr.sin_addr);

        auto fail = [this](const std::string &message)
        {
            int pending = socket_.exchange(-1);
            if (pending >= 0)
            {
                ::close(pending);
            }
            LABEL_LOG_WARN("TCP connect to {} failed: {}", describeEndpoint(), message);
            return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_ERROR, message);
        };

        if (!setBlocking(fd, false))
        {
            return fail("Failed to configure socket: " + lastSocketError());
        }

        int rc = ::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
        if (rc < 0 && errno != EINPROGRESS)
        {
            return fail("Connection refused: " + lastSocketError());
        }

        if (rc < 0)
        {
            // Poll in slices so close() from another thread is noticed
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.connectTimeoutMs);
            bool writable = false;
            while (!closed_.load() && std::chrono::steady_clock::now() < deadline)
            {
                pollfd pfd{fd, POLLOUT, 0};
                int ready = ::poll(&pfd, 1, CONNECT_POLL_SLICE_MS);
                if (ready < 0 && errno != EINTR)
                {
                    return fail("poll failed: " + lastSocketError());
                }
                if (ready > 0)
                {
                    writable = true;
                    break;
                }
            }

            if (closed_.load())
            {
                return fail("Connection cancelled");
            }
            if (!writable)
            {
                return fail("Connection timed out");
            }

            int soError = 0;
            socklen_t len = sizeof(soError);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0)
            {
                return fail(std::string("Connection failed: ") + std::strerror(soError));
            }
        }

        if (!setBlocking(fd, true))
        {
            return fail("Failed to configure socket: " + lastSocketError());
        }
        if (!NetworkUtils::setSocketTimeout(fd, options_.ioTimeoutMs))
        {
            LABEL_LOG_WARN("Failed to set socket timeout on {}", describeEndpoint());
        }
        int noDelay = 1;
        if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) < 0)
        {
            LABEL_LOG_DEBUG("Failed to set TCP_NODELAY: {}", lastSocketError());
        }

        LABEL_LOG_INFO("TCP transport connected to {}", describeEndpoint());
        return VoidResult::Success();
    }

    void TcpTransport::close()
    {
        closed_ = true;

        // Wake any blocked send/recv before taking the I/O lock
        int fd = socket_.load();
        if (fd >= 0)
        {
            ::shutdown(fd, SHUT_RDWR);
        }

        std::lock_guard<std::mutex> lock(ioMutex_);
        fd = socket_.exchange(-1);
        if (fd >= 0)
        {
            ::close(fd);
            LABEL_LOG_DEBUG("TCP transport to {} closed", describeEndpoint());
        }
    }

    VoidResult TcpTransport::sendAllLocked(int fd, const std::string &bytes)
    {
        size_t sent = 0;
        while (sent < bytes.size())
        {
            ssize_t n = ::send(fd, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_CONNECTION_LOST, "Socket write failed: " + lastSocketError());
            }
            sent += static_cast<size_t>(n);
        }
        return VoidResult::Success();
    }

    VoidResult TcpTransport::write(const std::string &bytes)
    {
        std::lock_guard<std::mutex> lock(ioMutex_);
        int fd = socket_.load();
        if (fd < 0 || closed_.load())
        {
            return VoidResult::Error(LLINK_ERROR_CODE::PRINTER_NOT_CONNECTED, "Socket is not open");
        }
        return sendAllLocked(fd, bytes);
    }

    bool TcpTransport::isOpen() const
    {
        std::lock_guard<std::mutex> lock(ioMutex_);
        int fd = socket_.load();
        if (fd < 0 || closed_.load())
        {
            return false;
        }

        pollfd pfd{fd, POLLIN, 0};
        int ready = ::poll(&pfd, 1, 0);
        if (ready < 0)
        {
            return false;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
        {
            return false;
        }
        if (pfd.revents & POLLIN)
        {
            char probe;
            ssize_t n = ::recv(fd, &probe, 1, MSG_PEEK | MSG_DONTWAIT);
            if (n == 0)
            {
                return false; // Orderly shutdown by the printer
            }
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
            {
                return false;
            }
        }
        return true;
    }

    std::optional<PrinterStatusFlags> TcpTransport::queryStatus()
    {
        if (!options_.enableStatusQuery)
        {
            return std::nullopt;
        }

        std::lock_guard<std::mutex> lock(ioMutex_);
        int fd = socket_.load();
        if (fd < 0 || closed_.load())
        {
            return std::nullopt;
        }

        auto sent = sendAllLocked(fd, HostStatusParser::QUERY_COMMAND);
        if (!sent.isSuccess())
        {
            LABEL_LOG_WARN("Host status query failed on {}: {}", describeEndpoint(), sent.message);
            return std::nullopt;
        }

        std::string response;
        char buffer[512];
        auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.statusQueryTimeoutMs);
        while (HostStatusParser::countFrames(response) < HostStatusParser::FRAME_COUNT)
        {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0 || closed_.load())
            {
                break;
            }

            pollfd pfd{fd, POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(remaining));
            if (ready < 0 && errno == EINTR)
            {
                continue;
            }
            if (ready <= 0)
            {
                break;
            }

            ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0)
            {
                break;
            }
            response.append(buffer, static_cast<size_t>(n));
        }

        auto flags = HostStatusParser::parse(response);
        if (!flags)
        {
            LABEL_LOG_WARN("No usable host status from {} ({} bytes received)", describeEndpoint(), response.size());
        }
        return flags;
    }

} // namespace llink
