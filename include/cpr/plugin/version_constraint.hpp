#pragma once

/// @file version_constraint.hpp
/// @brief Semantic versions and the version-range grammar used by
///        extension dependencies.
///
/// Range grammar (one alternative per `||`, comparators ANDed by
/// whitespace or comma):
///   "1.2.3", "=1.2.3", "==1.2.3"  exact pin
///   ">1.2", ">=1.2.0", "<2", "<=2.1"
///   "^1.2.0"   same left-most non-zero component (>=1.2.0 <2.0.0)
///   "~1.2.0"   same minor (>=1.2.0 <1.3.0)
///   "~=1.5"    compatible release (>=1.5.0, same major)
///   "*", "x", "1.x", "1.2.*"  wildcards
///   ">=1.0.0 <2.0.0 || ^3.0.0"

#include "cpr/foundation/runtime_result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cpr::plugin {

/// Strict semantic version: MAJOR.MINOR.PATCH[-prerelease][+build].
///
/// Ordering follows semver precedence: build metadata is ignored and a
/// prerelease sorts before the corresponding release.
struct SemVersion {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 0;
    std::vector<std::string> prerelease;
    std::string build;

    /// Three-way semver precedence comparison (-1, 0, 1).
    [[nodiscard]] int Compare(const SemVersion& other) const noexcept;

    [[nodiscard]] std::string ToString() const;

    friend bool operator==(const SemVersion& a, const SemVersion& b) noexcept {
        return a.Compare(b) == 0;
    }
    friend bool operator<(const SemVersion& a, const SemVersion& b) noexcept {
        return a.Compare(b) < 0;
    }
    friend bool operator<=(const SemVersion& a, const SemVersion& b) noexcept {
        return a.Compare(b) <= 0;
    }
    friend bool operator>(const SemVersion& a, const SemVersion& b) noexcept {
        return a.Compare(b) > 0;
    }
    friend bool operator>=(const SemVersion& a, const SemVersion& b) noexcept {
        return a.Compare(b) >= 0;
    }
};

/// Parse a strict semantic version string (all three components required).
[[nodiscard]] cpr::foundation::RuntimeResult<SemVersion> ParseSemVersion(std::string_view str);

/// Comparison operator for a single version constraint.
enum class ConstraintOp : uint8_t {
    Any,           ///< *
    Equal,         ///< ==
    GreaterThan,   ///< >
    GreaterEqual,  ///< >=
    LessThan,      ///< <
    LessEqual      ///< <=
};

/// A single primitive comparator.  Sugar forms (^, ~, ~=, wildcards) are
/// lowered into one or two of these at parse time.
struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Any;
    SemVersion version;

    [[nodiscard]] bool IsSatisfiedBy(const SemVersion& v) const noexcept;

    [[nodiscard]] std::string ToString() const;
};

/// A parsed version range: a disjunction of comparator sets.
class VersionRange {
public:
    /// A range that accepts every version.
    VersionRange() = default;

    /// Parse a range expression.
    /// @return The range, or InvalidArgument describing the bad token.
    [[nodiscard]] static cpr::foundation::RuntimeResult<VersionRange> Parse(std::string_view text);

    /// A prerelease version only satisfies a comparator set that names a
    /// prerelease of the same MAJOR.MINOR.PATCH, or a set that accepts
    /// everything ("*"). So "^1.0.0" rejects "2.0.0-alpha".
    [[nodiscard]] bool IsSatisfiedBy(const SemVersion& v) const noexcept;

    /// The expression as written.
    [[nodiscard]] const std::string& Text() const noexcept { return text_; }

    /// Normalized comparator form, e.g. ">=1.2.0 <2.0.0 || ==3.0.0".
    [[nodiscard]] std::string ToString() const;

private:
    std::string text_ = "*";
    std::vector<std::vector<VersionConstraint>> alternatives_;
};

/// A dependency on another extension: target id plus accepted range.
struct DependencySpec {
    std::string pluginId;
    VersionRange range;

    [[nodiscard]] bool IsSatisfiedBy(const SemVersion& v) const noexcept {
        return range.IsSatisfiedBy(v);
    }
};

}  // namespace cpr::plugin
