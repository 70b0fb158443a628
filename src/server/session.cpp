#include "session.hpp"
#include <cerrno>
#include <cstdio>
#include <iostream>
#include <unistd.h>
#include <sys/socket.h>
#include "constants.hpp"

using namespace server;

Session::~Session()
{
    if (fd >= 0) {
        ::close(fd);
    }
}

std::error_code Session::write(std::string_view data)
{
    WriteGuard guard(*this);
    std::lock_guard lock(writeMutex);

    size_t totalSent = 0;
    uint_fast16_t attempt = 0;
    while (totalSent < data.size()) {
        auto bytesSent = ::send(fd, data.data() + totalSent, data.size() - totalSent, MSG_NOSIGNAL);
        if (bytesSent == -1) {
            if (errno == EINTR && attempt++ < WRITE_NUM_RETRY_ON_INT) {
                continue;
            }
            return {errno, std::system_category()};
        }
        totalSent += static_cast<size_t>(bytesSent);
    }
    return {};
}

bool Session::close(std::chrono::milliseconds timeout)
{
    auto expected = SessionState::Active;
    if (!state.compare_exchange_strong(expected, SessionState::Draining)) {
        return true;
    }

    bool timedOut = pendingWrites.waitWithTimeout(timeout);
    if (timedOut) {
        std::cerr << "Session fd = " << fd << " still has " << pendingWrites.pending()
                  << " pending writes after " << timeout.count() << "ms, closing forcibly" << std::endl;
    }
    if (::shutdown(fd, SHUT_RDWR) == -1 && errno != ENOTCONN) {
        perror("Failed to shutdown client socket");
    }
    state.store(SessionState::Closed);
    return !timedOut;
}
