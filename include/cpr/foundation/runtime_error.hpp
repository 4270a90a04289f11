#pragma once

/// @file runtime_error.hpp
/// @brief Runtime error type used with Result<T, RuntimeError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "cpr/foundation/error_code.hpp"

namespace cpr::foundation {

/// Rich error type carrying an error code, human-readable message,
/// and optional type-erased context data (e.g. the list of denied
/// permissions, or a dependency report).
class RuntimeError {
public:
    RuntimeError() = default;

    explicit RuntimeError(ErrorCode code)
        : code_(code) {}

    RuntimeError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    RuntimeError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    /// The categorized error code.
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// Human-readable error description.
    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (returns nullptr if type mismatch or empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

    /// "Subsystem/message" rendering used in log lines and event payloads.
    [[nodiscard]] std::string describe() const {
        std::string out(subsystem());
        out += ": ";
        out += message_;
        return out;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace cpr::foundation
