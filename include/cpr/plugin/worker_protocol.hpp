#pragma once

/// @file worker_protocol.hpp
/// @brief Length-prefixed YAML frames exchanged with the isolated worker process.
///
/// Each frame is a 4-byte big-endian payload length followed by a YAML
/// document.  Every message is a mapping with a `type` key.
///
/// Host → worker:  describe, invoke, lifecycle, next, terminate
/// Worker → host:  value, stream, chunk, end, error, event

#include "cpr/foundation/runtime_result.hpp"
#include "cpr/foundation/types.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>

namespace cpr::plugin::worker {

/// Descriptor the worker reads requests from.
inline constexpr int kRequestFd = 3;

/// Descriptor the worker writes responses to.
inline constexpr int kResponseFd = 4;

/// Frames larger than this are treated as a protocol violation.
inline constexpr uint32_t kMaxFrameBytes = 64u * 1024u * 1024u;

// Message types
inline constexpr const char* kDescribe = "describe";
inline constexpr const char* kInvoke = "invoke";
inline constexpr const char* kLifecycle = "lifecycle";
inline constexpr const char* kNext = "next";
inline constexpr const char* kTerminate = "terminate";
inline constexpr const char* kValue = "value";
inline constexpr const char* kStream = "stream";
inline constexpr const char* kChunk = "chunk";
inline constexpr const char* kEnd = "end";
inline constexpr const char* kError = "error";
inline constexpr const char* kEvent = "event";

/// Serialize a YAML node to text.
[[nodiscard]] std::string Encode(const YAML::Node& node);

/// Write one frame.  Retries on EINTR and short writes.
/// @return IsolationFailure if the pipe is closed or the write fails.
[[nodiscard]] cpr::foundation::RuntimeResult<void> WriteFrame(int fd, const YAML::Node& message);

/// Read one frame, optionally bounded by @p deadline.
///
/// @return The decoded message, or
///         - ResourceLimitExceeded (context "wall_clock") when the deadline passes,
///         - IsolationFailure on EOF, I/O errors, oversized or malformed frames.
[[nodiscard]] cpr::foundation::RuntimeResult<YAML::Node>
ReadFrame(int fd, std::optional<cpr::foundation::Clock::time_point> deadline = std::nullopt);

/// Build a message of the given type.
[[nodiscard]] YAML::Node Message(const char* type);

/// Encode an error as an `error` message.
[[nodiscard]] YAML::Node ErrorMessage(const cpr::foundation::RuntimeError& error);

/// Decode an `error` message.  A `limit` field becomes the error context.
[[nodiscard]] cpr::foundation::RuntimeError DecodeError(const YAML::Node& message);

}  // namespace cpr::plugin::worker
