#include "sockutils.hpp"
#include <charconv>
#include <cstdio>
#include <stdexcept>
#include <arpa/inet.h>

int setSocketBuffers(int fd, int bufSize, int flags) noexcept {
  int result = 0;

  if ((flags & SOCK_BUF_RECEIVE) || (flags & SOCK_BUF_ALL)) {
      if (setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &bufSize, sizeof(bufSize)) == -1) {
          perror("Failed to set SO_RCVBUF for socket");
          result = -1;
      }
  }

  if ((flags & SOCK_BUF_SEND) || (flags & SOCK_BUF_ALL)) {
      if (setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &bufSize, sizeof(bufSize)) == -1) {
          perror("Failed to set SO_SNDBUF for socket");
          result = -1;
      }
  }
  return result;
}

sockaddr_in parseAddress(std::string_view address) {
  auto separator = address.rfind(':');
  if (separator == std::string_view::npos) {
      throw std::invalid_argument("address must be host:port, got " + std::string(address));
  }

  auto portText = address.substr(separator + 1);
  unsigned int port = 0;
  auto [ptr, ec] = std::from_chars(portText.data(), portText.data() + portText.size(), port);
  if (portText.empty() || ec != std::errc() || ptr != portText.data() + portText.size() || port > 65535) {
      throw std::invalid_argument("invalid port in address " + std::string(address));
  }

  sockaddr_in result{};
  result.sin_family = AF_INET;
  result.sin_port = htons(static_cast<uint16_t>(port));

  std::string host(address.substr(0, separator));
  if (host.empty() || host == "0.0.0.0") {
      result.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (host == "localhost") {
      result.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  } else if (inet_pton(AF_INET, host.c_str(), &result.sin_addr) != 1) {
      throw std::invalid_argument("invalid host in address " + std::string(address));
  }
  return result;
}

std::string formatAddress(const sockaddr_in& address) {
  char host[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &address.sin_addr, host, sizeof(host)) == nullptr) {
      return "?:" + std::to_string(ntohs(address.sin_port));
  }
  return std::string(host) + ":" + std::to_string(ntohs(address.sin_port));
}
