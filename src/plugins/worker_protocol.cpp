/// @file worker_protocol.cpp
/// @brief Frame codec shared by the host and the isolated worker.

#include "cpr/plugin/worker_protocol.hpp"

#include "cpr/foundation/error_code.hpp"

#include <cerrno>
#include <cstring>

#include <poll.h>
#include <unistd.h>

using cpr::foundation::Clock;
using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin::worker {

namespace {

RuntimeError ioError(const std::string& what) {
    return RuntimeError(ErrorCode::IsolationFailure, what);
}

RuntimeResult<void> writeAll(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return RuntimeResult<void>::err(ioError(std::string("worker pipe write failed: ") +
                                                    std::strerror(errno)));
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return RuntimeResult<void>::ok();
}

/// Wait until @p fd is readable or the deadline passes.
RuntimeResult<void> waitReadable(int fd, const std::optional<Clock::time_point>& deadline) {
    for (;;) {
        int timeoutMs = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - Clock::now());
            if (remaining.count() <= 0) {
                return RuntimeResult<void>::err(RuntimeError(ErrorCode::ResourceLimitExceeded,
                                                             "wall-clock limit exceeded",
                                                             std::string("wall_clock")));
            }
            timeoutMs = static_cast<int>(remaining.count());
        }

        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, timeoutMs);
        if (rc > 0) {
            return RuntimeResult<void>::ok();
        }
        if (rc < 0 && errno != EINTR) {
            return RuntimeResult<void>::err(ioError(std::string("worker pipe poll failed: ") +
                                                    std::strerror(errno)));
        }
    }
}

RuntimeResult<void> readAll(int fd, char* data, std::size_t size,
                            const std::optional<Clock::time_point>& deadline) {
    while (size > 0) {
        if (auto ready = waitReadable(fd, deadline); ready.hasError()) {
            return ready;
        }
        ssize_t n = ::read(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return RuntimeResult<void>::err(ioError(std::string("worker pipe read failed: ") +
                                                    std::strerror(errno)));
        }
        if (n == 0) {
            return RuntimeResult<void>::err(ioError("worker closed the pipe"));
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return RuntimeResult<void>::ok();
}

}  // namespace

std::string Encode(const YAML::Node& node) {
    YAML::Emitter out;
    out << node;
    return out.c_str();
}

RuntimeResult<void> WriteFrame(int fd, const YAML::Node& message) {
    std::string payload = Encode(message);
    if (payload.size() > kMaxFrameBytes) {
        return RuntimeResult<void>::err(ioError("frame exceeds maximum size"));
    }

    auto len = static_cast<uint32_t>(payload.size());
    const char header[4] = {static_cast<char>((len >> 24) & 0xFF),
                            static_cast<char>((len >> 16) & 0xFF),
                            static_cast<char>((len >> 8) & 0xFF),
                            static_cast<char>(len & 0xFF)};
    if (auto r = writeAll(fd, header, sizeof(header)); r.hasError()) {
        return r;
    }
    return writeAll(fd, payload.data(), payload.size());
}

RuntimeResult<YAML::Node> ReadFrame(int fd, std::optional<Clock::time_point> deadline) {
    unsigned char header[4];
    if (auto r = readAll(fd, reinterpret_cast<char*>(header), sizeof(header), deadline);
        r.hasError()) {
        return RuntimeResult<YAML::Node>::err(r.error());
    }
    uint32_t len = (static_cast<uint32_t>(header[0]) << 24) |
                   (static_cast<uint32_t>(header[1]) << 16) |
                   (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
    if (len > kMaxFrameBytes) {
        return RuntimeResult<YAML::Node>::err(ioError("incoming frame exceeds maximum size"));
    }

    std::string payload(len, '\0');
    if (auto r = readAll(fd, payload.data(), len, deadline); r.hasError()) {
        return RuntimeResult<YAML::Node>::err(r.error());
    }

    try {
        YAML::Node message = YAML::Load(payload);
        if (!message.IsMap() || !message["type"]) {
            return RuntimeResult<YAML::Node>::err(ioError("frame is not a typed message"));
        }
        return RuntimeResult<YAML::Node>::ok(std::move(message));
    } catch (const YAML::Exception& e) {
        return RuntimeResult<YAML::Node>::err(ioError(std::string("malformed frame: ") + e.what()));
    }
}

YAML::Node Message(const char* type) {
    YAML::Node node(YAML::NodeType::Map);
    node["type"] = type;
    return node;
}

YAML::Node ErrorMessage(const RuntimeError& error) {
    auto node = Message(kError);
    node["code"] = static_cast<uint32_t>(error.code());
    node["message"] = std::string(error.message());
    if (const auto* limit = error.context<std::string>()) {
        node["limit"] = *limit;
    }
    return node;
}

RuntimeError DecodeError(const YAML::Node& message) {
    auto code = static_cast<ErrorCode>(
        message["code"].as<uint32_t>(static_cast<uint32_t>(ErrorCode::Unknown)));
    auto text = message["message"].as<std::string>("worker reported an error");
    if (auto limit = message["limit"]) {
        return RuntimeError(code, std::move(text), limit.as<std::string>());
    }
    return RuntimeError(code, std::move(text));
}

}  // namespace cpr::plugin::worker
