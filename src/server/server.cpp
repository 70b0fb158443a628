#include "server.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <pthread.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include "constants.hpp"
#include "sockutils.hpp"

using namespace server;

CacheServer::CacheServer(const ServerSettings& settings, Handler& handler): handler(handler)
{
    auto address = parseAddress(settings.address);

    server_fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd == -1) {
        throw std::system_error(errno, std::system_category(), "Socket creation failed");
    }

    int flag = 1;
    if (setsockopt(server_fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == -1) {
        close(server_fd);
        throw std::system_error(errno, std::system_category(), "Failed to set TCP_NODELAY for server socket");
    }
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &flag, sizeof(flag)) == -1) {
        close(server_fd);
        throw std::system_error(errno, std::system_category(), "Failed to set SO_REUSEADDR for server socket");
    }

    if (setSocketBuffers(server_fd, settings.sockBuffer, SOCK_BUF_OPTS::SOCK_BUF_ALL) == -1) {
        close(server_fd);
        throw std::runtime_error("Failed to set socket buffer options for server socket");
    }

    if (bind(server_fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        auto error = errno;
        close(server_fd);
        throw std::system_error(error, std::system_category(), "Bind failed for " + settings.address);
    }

    if (listen(server_fd, settings.maxConnections) < 0) {
        auto error = errno;
        close(server_fd);
        throw std::system_error(error, std::system_category(), "Listen failed");
    }
}

CacheServer::~CacheServer() {
    if (server_fd >= 0) {
        close(server_fd);
    }
}

uint16_t CacheServer::getPort() const
{
    sockaddr_in address{};
    socklen_t length = sizeof(address);
    if (getsockname(server_fd, (struct sockaddr*)&address, &length) == -1) {
        throw std::system_error(errno, std::system_category(), "getsockname failed");
    }
    return ntohs(address.sin_port);
}

void CacheServer::serveConnection(int client_fd) noexcept
{
    try {
        handler.handle(client_fd);
    } catch (const std::exception& e) {
        std::cerr << "Connection client_fd = " << client_fd << " failed: " << e.what() << std::endl;
    }
    connections.done();
}

int CacheServer::Start()
{
    std::cout << "Server is listening on port " << getPort() << std::endl;

    int result = 0;
    while (!stopRequested.load()) {
        int client_fd = accept4(server_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd == -1) {
            if (errno == EINTR || errno == ECONNABORTED) {
                continue;
            }
            if (!stopRequested.load()) {
                perror("Failed to accept connection");
                result = -1;
            }
            break;
        }
#ifndef NDEBUG
        std::cout << "Accepted client_fd = " << client_fd << std::endl;
#endif

        connections.add(1);
        try {
            std::thread(&CacheServer::serveConnection, this, client_fd).detach();
        } catch (const std::system_error& e) {
            std::cerr << "Failed to start connection thread: " << e.what() << std::endl;
            close(client_fd);
            connections.done();
        }
    }

    handler.close();
    std::cout << "Waiting for " << connections.pending() << " connections to finish..." << std::endl;
    connections.wait();
    std::cout << "Server stopped" << std::endl;
    return result;
}

void CacheServer::Stop() noexcept
{
    if (stopRequested.exchange(true)) {
        return;
    }
    std::cout << "Stopping server..." << std::endl;
    // Wakes up accept in Start
    if (shutdown(server_fd, SHUT_RDWR) == -1 && errno != ENOTCONN) {
        perror("Failed to shutdown server socket");
    }
    try {
        handler.close();
    } catch (const std::exception& e) {
        std::cerr << "Failed to close handler: " << e.what() << std::endl;
    }
}

sigset_t server::blockShutdownSignals()
{
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGHUP);
    sigaddset(&signals, SIGQUIT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGINT);
    if (auto error = pthread_sigmask(SIG_BLOCK, &signals, nullptr); error != 0) {
        throw std::system_error(error, std::system_category(), "Failed to block shutdown signals");
    }
    return signals;
}

int server::listenAndServeWithSignal(const ServerSettings& settings, Handler& handler)
{
    auto signals = blockShutdownSignals();
    CacheServer cacheServer { settings, handler };

    auto signalWatcherThread = std::jthread(
        [&cacheServer, signals](std::stop_token stopToken)
        {
            auto pollInterval = std::chrono::duration_cast<std::chrono::nanoseconds>(SIGNAL_POLL_INTERVAL);
            timespec timeout{0, static_cast<long>(pollInterval.count())};
            while (!stopToken.stop_requested()) {
                int signo = sigtimedwait(&signals, nullptr, &timeout);
                if (signo > 0) {
                    std::cout << "Received signal " << strsignal(signo) << ", shutting down..." << std::endl;
                    cacheServer.Stop();
                    return;
                }
            }
        }
    );

    auto result = cacheServer.Start();
    signalWatcherThread.request_stop();
    return result;
}
