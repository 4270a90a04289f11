#pragma once

/// @file types.hpp
/// @brief Runtime type aliases and strong ID types.

#include <chrono>
#include <cstdint>
#include <functional>

namespace cpr::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Prevents accidental mixing of different ID types (e.g., SubscriptionId
/// and StreamId) at compile time while keeping the same underlying
/// representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

// Tag types for strong IDs
struct SubscriptionIdTag {};
struct StreamIdTag {};

/// Handle returned by EventBus::Subscribe.
using SubscriptionId = StrongId<SubscriptionIdTag>;

/// Identifier of an open action stream.
using StreamId = StrongId<StreamIdTag>;

/// Clock used for deadlines, idle tracking and event timestamps.
using Clock = std::chrono::steady_clock;

} // namespace cpr::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<cpr::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const cpr::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
