#include "resp_handler.hpp"
#include <exception>
#include <iostream>
#include <string>
#include <variant>
#include <unistd.h>
#include "parser.hpp"

using namespace server;

void RespHandler::handle(int client_fd)
{
    if (closing.load()) {
        ::close(client_fd);
        return;
    }

    auto session = std::make_shared<Session>(client_fd);
    activeSessions.insert(session);
    // close() may have taken its snapshot before the insert
    if (closing.load()) {
        activeSessions.erase(session);
        return;
    }
#ifndef NDEBUG
    std::cout << "Serving client_fd = " << client_fd << std::endl;
#endif

    try {
        serve(*session);
    } catch (const std::exception& e) {
        std::cerr << "Serving client_fd = " << client_fd << " failed: " << e.what() << std::endl;
    }

    activeSessions.erase(session);
    session->markClosed();
#ifndef NDEBUG
    std::cout << "Finished serving client_fd = " << client_fd << std::endl;
#endif
}

void RespHandler::serve(Session& session)
{
    FdSource source(session.getFd());
    auto stream = parseStream(source);
    while (auto payload = stream.next_value()) {
        if (payload->isTransportError()) {
#ifndef NDEBUG
            if (!payload->isEndOfStream()) {
                std::cerr << "Read failed for client_fd = " << session.getFd() << ": " << payload->errorMessage() << std::endl;
            }
#endif
            return;
        }

        auto guard = session.beginWrite();
        if (payload->isProtocolError()) {
            ++numErrors;
            if (!sendReply(session, makeErrReply(std::string(PROTOCOL_ERROR) + " " + payload->errorMessage()))) {
                return;
            }
            continue;
        }

        ++numRequests;
        const auto& request = payload->reply();
        if (std::holds_alternative<EmptyMultiBulkReply>(request)) {
            continue;
        }
        const auto* command = std::get_if<MultiBulkReply>(&request);
        if (command == nullptr) {
            ++numErrors;
            if (!sendReply(session, makeErrReply(NOT_A_MULTI_BULK))) {
                return;
            }
            continue;
        }

        auto result = executor.execute(command->args);
        if (isErrorReply(result)) {
            ++numErrors;
        }
        if (!sendReply(session, result)) {
            return;
        }
    }
}

bool RespHandler::sendReply(Session& session, const Reply& reply)
{
    if (auto ec = session.write(toBytes(reply))) {
#ifndef NDEBUG
        std::cerr << "Write failed for client_fd = " << session.getFd() << ": " << ec.message() << std::endl;
#endif
        return false;
    }
    return true;
}

void RespHandler::close()
{
    if (closing.exchange(true)) {
        return;
    }
    auto sessions = activeSessions.snapshot();
    std::cout << "Closing " << sessions.size() << " active connections..." << std::endl;
    for (const auto& session : sessions) {
        session->close(drainTimeout);
    }
}

HandlerMetrics RespHandler::getMetrics() const
{
    HandlerMetrics metrics;
    metrics.numErrors = numErrors.load();
    metrics.numActiveConnections = static_cast<uint_fast32_t>(activeSessions.size());
    metrics.numRequests = numRequests.load();
    return metrics;
}
