#pragma once
#include <string>
#include <string_view>
#include <netinet/in.h>
#include <sys/socket.h>

/// @brief Options for setSocketBuffers function flags
enum SOCK_BUF_OPTS {
  SOCK_BUF_SEND        = 0x01,
  SOCK_BUF_RECEIVE     = 0x02,
  SOCK_BUF_ALL         = 0x04,
};

/// @brief Increases socket send and receive buffers
/// @param fd file descriptor of socket
/// @param bufSize buffer size to set for socket
/// @param flags combination of SOCK_BUF_OPTS
/// @return syscall result, -1 on error, 0 on success
int setSocketBuffers(int fd, int bufSize, int flags) noexcept;

/// @brief Parses an IPv4 "host:port" address, an empty host binds every interface
/// @throws std::invalid_argument on malformed host or port
sockaddr_in parseAddress(std::string_view address);

/// @brief Renders address as "host:port"
std::string formatAddress(const sockaddr_in& address);
