#include "host_channel.hpp"

#include <poll.h>
#include <sys/socket.h>

#include <array>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <string>

#include "internal/util/errors.hpp"

namespace notewatch::runtime {

namespace {

constexpr std::uint32_t kMaxFrameSize = 64u * 1024u * 1024u;

using Deadline = std::optional<std::chrono::steady_clock::time_point>;

[[noreturn]] void Fail(const std::string& what) {
  throw util::ObserverExecutionError(what + ": " + std::strerror(errno));
}

void SendAll(int fd, const char* data, std::size_t size) {
  while (size > 0) {
    const ssize_t sent = ::send(fd, data, size, MSG_NOSIGNAL);
    if (sent < 0) {
      if (errno == EINTR) continue;
      Fail("host channel write failed");
    }
    data += sent;
    size -= static_cast<std::size_t>(sent);
  }
}

// false when the deadline passed first
bool WaitReadable(int fd, const Deadline& deadline) {
  while (true) {
    int wait_ms = -1;
    if (deadline) {
      const auto left = std::chrono::ceil<std::chrono::milliseconds>(*deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0) return false;
      wait_ms = static_cast<int>(left.count());
    }

    pollfd entry{fd, POLLIN, 0};
    const int ready = ::poll(&entry, 1, wait_ms);
    if (ready > 0) return true;
    if (ready < 0 && errno != EINTR) Fail("host channel poll failed");
  }
}

ReadStatus RecvAll(int fd, char* data, std::size_t size, const Deadline& deadline) {
  while (size > 0) {
    if (!WaitReadable(fd, deadline)) return ReadStatus::kTimeout;

    const ssize_t received = ::recv(fd, data, size, 0);
    if (received == 0) return ReadStatus::kClosed;
    if (received < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      if (errno == ECONNRESET) return ReadStatus::kClosed;
      Fail("host channel read failed");
    }
    data += received;
    size -= static_cast<std::size_t>(received);
  }
  return ReadStatus::kOk;
}

} // namespace

void WriteFrame(int fd, const google::protobuf::MessageLite& message) {
  std::string payload;
  if (!message.SerializeToString(&payload)) {
    throw util::ObserverExecutionError("cannot serialize host frame");
  }

  const auto          size = static_cast<std::uint32_t>(payload.size());
  std::array<char, 4> header{static_cast<char>(size >> 24), static_cast<char>(size >> 16), static_cast<char>(size >> 8),
                             static_cast<char>(size)};
  SendAll(fd, header.data(), header.size());
  SendAll(fd, payload.data(), payload.size());
}

ReadStatus ReadFrame(int fd, google::protobuf::MessageLite& message, std::optional<std::chrono::steady_clock::time_point> deadline) {
  std::array<unsigned char, 4> header{};
  auto status = RecvAll(fd, reinterpret_cast<char*>(header.data()), header.size(), deadline);
  if (status != ReadStatus::kOk) return status;

  const std::uint32_t size = (std::uint32_t{header[0]} << 24) | (std::uint32_t{header[1]} << 16) | (std::uint32_t{header[2]} << 8) |
                             std::uint32_t{header[3]};
  if (size > kMaxFrameSize) throw util::ObserverExecutionError("host frame too large");

  std::string payload(size, '\0');
  status = RecvAll(fd, payload.data(), payload.size(), deadline);
  if (status != ReadStatus::kOk) return status;

  if (!message.ParseFromString(payload)) throw util::ObserverExecutionError("malformed host frame");
  return ReadStatus::kOk;
}

} // namespace notewatch::runtime
