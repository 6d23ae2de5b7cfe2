#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/core.h>

/**
 * Minimal HTTP/1.1 server on 127.0.0.1 for exercising the libcurl client.
 *
 * Connections are served one at a time on a background thread. The handler
 * receives the request path and the raw request head and returns the complete
 * response bytes; every response should carry "Connection: close".
 */
class LoopbackServer
{
public:
    using Handler = std::function<std::string(const std::string &path, const std::string &request)>;

    explicit LoopbackServer(Handler handler) : handler_(std::move(handler))
    {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listenFd_ < 0)
        {
            throw std::runtime_error(fmt::format("socket: {}", std::strerror(errno)));
        }
        int reuse = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0; // Kernel picks a free port
        socklen_t length = sizeof(address);
        if (::bind(listenFd_, reinterpret_cast<sockaddr *>(&address), sizeof(address)) != 0 ||
            ::listen(listenFd_, 16) != 0 ||
            ::getsockname(listenFd_, reinterpret_cast<sockaddr *>(&address), &length) != 0)
        {
            std::string reason = std::strerror(errno);
            ::close(listenFd_);
            throw std::runtime_error(fmt::format("listen on 127.0.0.1: {}", reason));
        }
        port_ = ntohs(address.sin_port);

        thread_ = std::thread([this]()
                              { serve(); });
    }

    ~LoopbackServer()
    {
        stop_.store(true);
        if (thread_.joinable())
        {
            thread_.join();
        }
        ::close(listenFd_);
    }

    LoopbackServer(const LoopbackServer &) = delete;
    LoopbackServer &operator=(const LoopbackServer &) = delete;

    std::string url(const std::string &path) const
    {
        return fmt::format("http://127.0.0.1:{}{}", port_, path);
    }

    int requestCount() const { return requests_.load(); }

    // Response with the given status line, extra header lines and body
    static std::string response(const std::string &status, const std::string &headers, const std::string &body)
    {
        return fmt::format("HTTP/1.1 {}\r\n{}Content-Length: {}\r\nConnection: close\r\n\r\n{}",
                           status, headers, body.size(), body);
    }

private:
    Handler handler_;
    int listenFd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> stop_{false};
    std::atomic<int> requests_{0};
    std::thread thread_;

    void serve()
    {
        while (!stop_.load())
        {
            pollfd waiting{listenFd_, POLLIN, 0};
            if (::poll(&waiting, 1, 100) <= 0)
            {
                continue;
            }
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0)
            {
                continue;
            }
            handle(client);
            ::close(client);
        }
    }

    void handle(int client)
    {
        std::string request;
        char buffer[4096];
        while (request.find("\r\n\r\n") == std::string::npos)
        {
            pollfd readable{client, POLLIN, 0};
            if (::poll(&readable, 1, 2000) <= 0)
            {
                return;
            }
            ssize_t received = ::recv(client, buffer, sizeof(buffer), 0);
            if (received <= 0)
            {
                return;
            }
            request.append(buffer, static_cast<std::size_t>(received));
        }
        ++requests_;

        // "GET /path HTTP/1.1"
        std::size_t pathStart = request.find(' ');
        std::size_t pathEnd = request.find(' ', pathStart + 1);
        std::string path = request.substr(pathStart + 1, pathEnd - pathStart - 1);

        std::string reply = handler_(path, request);
        std::size_t sent = 0;
        while (sent < reply.size())
        {
            // The client may hang up early (error bodies it does not read)
            ssize_t written = ::send(client, reply.data() + sent, reply.size() - sent, MSG_NOSIGNAL);
            if (written <= 0)
            {
                return;
            }
            sent += static_cast<std::size_t>(written);
        }
        ::shutdown(client, SHUT_WR);
    }
};
