// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Whoischase, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once
#ifndef __linux__
#error "Linux-only (epoll/eventfd/timerfd)"
#endif

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>
#include <vector>

#include "transport_types.hpp"

namespace whoischase
{
namespace network
{

inline std::string lastErr(int err = errno) { return std::strerror(err); }

/// \brief Owning file descriptor
class FileDescriptor
{
public:
  FileDescriptor() = default;
  explicit FileDescriptor(int fd) : _fd(fd) {}
  FileDescriptor(const FileDescriptor &) = delete;
  FileDescriptor &operator=(const FileDescriptor &) = delete;
  FileDescriptor(FileDescriptor &&other) noexcept : _fd(std::exchange(other._fd, -1)) {}
  FileDescriptor &operator=(FileDescriptor &&other) noexcept
  {
    if (this != &other)
    {
      reset(std::exchange(other._fd, -1));
    }
    return *this;
  }
  ~FileDescriptor() { reset(); }

  int get() const { return _fd; }
  bool valid() const { return _fd >= 0; }

  void reset(int fd = -1)
  {
    if (_fd >= 0)
    {
      ::close(_fd);
    }
    _fd = fd;
  }

private:
  int _fd{-1};
};

/// \brief One resolved socket address
struct ResolvedAddress
{
  sockaddr_storage storage{};
  socklen_t length{0};
  int family{AF_UNSPEC};

  const sockaddr *addr() const { return reinterpret_cast<const sockaddr *>(&storage); }

  std::string toString() const
  {
    char buf[INET6_ADDRSTRLEN] = {0};
    if (family == AF_INET)
    {
      ::inet_ntop(AF_INET, &reinterpret_cast<const sockaddr_in *>(&storage)->sin_addr, buf,
                  sizeof(buf));
    }
    else if (family == AF_INET6)
    {
      ::inet_ntop(AF_INET6, &reinterpret_cast<const sockaddr_in6 *>(&storage)->sin6_addr, buf,
                  sizeof(buf));
    }
    return buf;
  }
};

/// \brief Resolve host:port to stream socket addresses.
/// Literal IPv4/IPv6 addresses skip getaddrinfo().
/// \throws WhoisTransportException(TransportError::Resolve)
inline std::vector<ResolvedAddress> resolveEndpoint(const WhoisEndpoint &endpoint)
{
  std::vector<ResolvedAddress> out;

  ResolvedAddress literal;
  auto *sa4 = reinterpret_cast<sockaddr_in *>(&literal.storage);
  auto *sa6 = reinterpret_cast<sockaddr_in6 *>(&literal.storage);
  if (::inet_pton(AF_INET, endpoint.host.c_str(), &sa4->sin_addr) == 1)
  {
    sa4->sin_family = AF_INET;
    sa4->sin_port = htons(endpoint.port);
    literal.length = sizeof(sockaddr_in);
    literal.family = AF_INET;
    out.push_back(literal);
    return out;
  }
  literal = ResolvedAddress{};
  if (::inet_pton(AF_INET6, endpoint.host.c_str(), &sa6->sin6_addr) == 1)
  {
    sa6->sin6_family = AF_INET6;
    sa6->sin6_port = htons(endpoint.port);
    literal.length = sizeof(sockaddr_in6);
    literal.family = AF_INET6;
    out.push_back(literal);
    return out;
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  addrinfo *res = nullptr;
  std::string service = std::to_string(endpoint.port);
  int rc = ::getaddrinfo(endpoint.host.c_str(), service.c_str(), &hints, &res);
  if (rc != 0 || !res)
  {
    throw WhoisTransportException(TransportError::Resolve,
                                  endpoint.host + ": " + ::gai_strerror(rc));
  }
  for (addrinfo *ai = res; ai; ai = ai->ai_next)
  {
    if (ai->ai_addrlen > sizeof(sockaddr_storage))
    {
      continue;
    }
    ResolvedAddress ra;
    std::memcpy(&ra.storage, ai->ai_addr, ai->ai_addrlen);
    ra.length = static_cast<socklen_t>(ai->ai_addrlen);
    ra.family = ai->ai_family;
    out.push_back(ra);
  }
  ::freeaddrinfo(res);
  if (out.empty())
  {
    throw WhoisTransportException(TransportError::Resolve, endpoint.host + ": no usable address");
  }
  return out;
}

/// \brief Create a non-blocking TCP socket and start connecting.
/// \param[out] inProgress true if the connect is pending (EINPROGRESS)
/// \throws WhoisTransportException on socket creation or immediate refusal
inline FileDescriptor startConnect(const ResolvedAddress &address, bool &inProgress)
{
  FileDescriptor fd(::socket(address.family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
  if (!fd.valid())
  {
    throw WhoisTransportException(TransportError::Socket, "socket: " + lastErr(), errno);
  }
  int one = 1;
  ::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  if (::connect(fd.get(), address.addr(), address.length) == 0)
  {
    inProgress = false;
    return fd;
  }
  if (errno == EINPROGRESS)
  {
    inProgress = true;
    return fd;
  }
  int err = errno;
  throw WhoisTransportException(TransportError::Connect,
                                address.toString() + ": " + lastErr(err), err);
}

/// \brief Pending socket error (SO_ERROR), 0 when connected cleanly.
inline int socketError(int fd)
{
  int err = 0;
  socklen_t len = sizeof(err);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) != 0)
  {
    return errno;
  }
  return err;
}

} // namespace network
} // namespace whoischase
