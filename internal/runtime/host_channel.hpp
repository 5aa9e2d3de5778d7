#pragma once

#include <chrono>
#include <optional>

#include <google/protobuf/message_lite.h>

namespace notewatch::runtime {

/*
  Length-prefixed protobuf frames over a stream socket.

  Each frame is a 4-byte big-endian size followed by the serialized
  message. Write failures and malformed frames throw
  ObserverExecutionError.
*/

enum class ReadStatus { kOk, kTimeout, kClosed };

void WriteFrame(int fd, const google::protobuf::MessageLite& message);

// Blocks until a whole frame arrived, the peer closed or `deadline` passed.
ReadStatus ReadFrame(int                                                  fd,
                     google::protobuf::MessageLite&                       message,
                     std::optional<std::chrono::steady_clock::time_point> deadline = std::nullopt);

} // namespace notewatch::runtime
