/// @file version_constraint.cpp
/// @brief Semantic version parsing and range matching.

#include "cpr/plugin/version_constraint.hpp"

#include <algorithm>
#include <charconv>
#include <optional>

#include "cpr/foundation/error_code.hpp"

using cpr::foundation::ErrorCode;
using cpr::foundation::RuntimeError;
using cpr::foundation::RuntimeResult;

namespace cpr::plugin {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
        s.remove_prefix(1);
    }
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.remove_suffix(1);
    }
    return s;
}

bool isDigits(std::string_view s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

bool isIdentifierChar(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
}

std::optional<uint32_t> parseNumber(std::string_view s) {
    if (!isDigits(s) || (s.size() > 1 && s.front() == '0')) {
        return std::nullopt;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = s.find(sep, start);
        parts.push_back(s.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos) {
            break;
        }
        start = pos + 1;
    }
    return parts;
}

bool isWildcard(std::string_view s) {
    return s == "*" || s == "x" || s == "X";
}

RuntimeError badRange(std::string_view text, std::string_view why) {
    return RuntimeError(ErrorCode::InvalidArgument,
                        "invalid version range '" + std::string(text) + "': " + std::string(why));
}

/// A possibly partial version used inside ranges ("1", "1.2", "1.2.x").
struct Partial {
    uint32_t major = 0;
    uint32_t minor = 0;
    uint32_t patch = 0;
    int components = 0;  // number of concrete numeric components (0..3)
    std::vector<std::string> prerelease;

    [[nodiscard]] SemVersion floor() const {
        SemVersion v{major, minor, patch, prerelease, {}};
        return v;
    }
};

RuntimeResult<Partial> parsePartial(std::string_view text) {
    text = trim(text);
    if (!text.empty() && (text.front() == 'v' || text.front() == 'V')) {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        return RuntimeResult<Partial>::err(badRange(text, "missing version"));
    }
    if (isWildcard(text)) {
        return RuntimeResult<Partial>::ok(Partial{});
    }

    // Build metadata never participates in ranges.
    if (auto plus = text.find('+'); plus != std::string_view::npos) {
        text = text.substr(0, plus);
    }

    Partial partial;
    std::string_view core = text;
    if (auto dash = text.find('-'); dash != std::string_view::npos) {
        core = text.substr(0, dash);
        for (auto id : split(text.substr(dash + 1), '.')) {
            if (id.empty() || !std::all_of(id.begin(), id.end(), isIdentifierChar)) {
                return RuntimeResult<Partial>::err(badRange(text, "bad prerelease identifier"));
            }
            partial.prerelease.emplace_back(id);
        }
    }

    auto parts = split(core, '.');
    if (parts.size() > 3) {
        return RuntimeResult<Partial>::err(badRange(text, "too many components"));
    }
    uint32_t* slots[3] = {&partial.major, &partial.minor, &partial.patch};
    bool sawWildcard = false;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (isWildcard(parts[i])) {
            sawWildcard = true;
            continue;
        }
        if (sawWildcard) {
            return RuntimeResult<Partial>::err(badRange(text, "number after wildcard"));
        }
        auto n = parseNumber(parts[i]);
        if (!n) {
            return RuntimeResult<Partial>::err(badRange(text, "component is not a number"));
        }
        *slots[i] = *n;
        partial.components = static_cast<int>(i) + 1;
    }
    if (!partial.prerelease.empty() && partial.components != 3) {
        return RuntimeResult<Partial>::err(badRange(text, "prerelease requires a full version"));
    }
    return RuntimeResult<Partial>::ok(std::move(partial));
}

/// The smallest version above every version matching @p p (exclusive upper bound).
SemVersion bumpAfter(const Partial& p) {
    if (p.components <= 1) {
        return SemVersion{p.major + 1, 0, 0, {}, {}};
    }
    return SemVersion{p.major, p.minor + 1, 0, {}, {}};
}

void addConstraint(std::vector<VersionConstraint>& set, ConstraintOp op, SemVersion v) {
    set.push_back(VersionConstraint{op, std::move(v)});
}

/// Lower one comparator token into primitive constraints.
RuntimeResult<void> lowerToken(std::string_view token, std::vector<VersionConstraint>& set) {
    auto fail = [&](std::string_view why) { return RuntimeResult<void>::err(badRange(token, why)); };

    std::string_view op;
    for (std::string_view candidate : {"~=", ">=", "<=", "==", ">", "<", "=", "^", "~"}) {
        if (token.starts_with(candidate)) {
            op = candidate;
            break;
        }
    }
    auto rest = token.substr(op.size());
    auto partialResult = parsePartial(rest);
    if (!partialResult) {
        return RuntimeResult<void>::err(partialResult.error());
    }
    const auto& p = partialResult.value();

    if (op.empty() || op == "=" || op == "==") {
        if (p.components == 0) {
            addConstraint(set, ConstraintOp::Any, {});
        } else if (p.components == 3) {
            addConstraint(set, ConstraintOp::Equal, p.floor());
        } else {
            addConstraint(set, ConstraintOp::GreaterEqual, p.floor());
            addConstraint(set, ConstraintOp::LessThan, bumpAfter(p));
        }
    } else if (op == ">=") {
        addConstraint(set, p.components == 0 ? ConstraintOp::Any : ConstraintOp::GreaterEqual, p.floor());
    } else if (op == ">") {
        if (p.components == 0) {
            return fail("'>' needs a version");
        }
        if (p.components == 3) {
            addConstraint(set, ConstraintOp::GreaterThan, p.floor());
        } else {
            addConstraint(set, ConstraintOp::GreaterEqual, bumpAfter(p));
        }
    } else if (op == "<") {
        if (p.components == 0) {
            return fail("'<' needs a version");
        }
        addConstraint(set, ConstraintOp::LessThan, p.floor());
    } else if (op == "<=") {
        if (p.components == 0) {
            addConstraint(set, ConstraintOp::Any, {});
        } else if (p.components == 3) {
            addConstraint(set, ConstraintOp::LessEqual, p.floor());
        } else {
            addConstraint(set, ConstraintOp::LessThan, bumpAfter(p));
        }
    } else if (op == "^") {
        if (p.components == 0) {
            addConstraint(set, ConstraintOp::Any, {});
            return RuntimeResult<void>::ok();
        }
        SemVersion upper;
        if (p.major > 0 || p.components == 1) {
            upper = SemVersion{p.major + 1, 0, 0, {}, {}};
        } else if (p.minor > 0 || p.components == 2) {
            upper = SemVersion{0, p.minor + 1, 0, {}, {}};
        } else {
            upper = SemVersion{0, 0, p.patch + 1, {}, {}};
        }
        addConstraint(set, ConstraintOp::GreaterEqual, p.floor());
        addConstraint(set, ConstraintOp::LessThan, std::move(upper));
    } else if (op == "~") {
        if (p.components == 0) {
            addConstraint(set, ConstraintOp::Any, {});
            return RuntimeResult<void>::ok();
        }
        addConstraint(set, ConstraintOp::GreaterEqual, p.floor());
        addConstraint(set, ConstraintOp::LessThan, bumpAfter(p));
    } else if (op == "~=") {
        // Compatible release: at least the given version, same major.
        if (p.components == 0) {
            return fail("'~=' needs a version");
        }
        addConstraint(set, ConstraintOp::GreaterEqual, p.floor());
        addConstraint(set, ConstraintOp::LessThan, SemVersion{p.major + 1, 0, 0, {}, {}});
    }
    return RuntimeResult<void>::ok();
}

/// Split an alternative into tokens, joining a lone operator with the
/// following version (">= 1.2.0" reads as ">=1.2.0").
std::vector<std::string> tokenize(std::string_view alt) {
    std::vector<std::string> raw;
    std::string current;
    for (char c : alt) {
        if (c == ' ' || c == '\t' || c == ',') {
            if (!current.empty()) {
                raw.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        raw.push_back(std::move(current));
    }

    auto operatorOnly = [](const std::string& t) {
        return std::all_of(t.begin(), t.end(), [](char c) {
            return c == '>' || c == '<' || c == '=' || c == '^' || c == '~';
        });
    };

    std::vector<std::string> tokens;
    for (auto& t : raw) {
        if (!tokens.empty() && operatorOnly(tokens.back())) {
            tokens.back() += t;
            continue;
        }
        tokens.push_back(std::move(t));
    }
    return tokens;
}

int compareIdentifiers(const std::string& a, const std::string& b) {
    bool aNum = isDigits(a);
    bool bNum = isDigits(b);
    if (aNum && bNum) {
        if (a.size() != b.size()) {
            return a.size() < b.size() ? -1 : 1;
        }
        return a.compare(b) < 0 ? -1 : (a == b ? 0 : 1);
    }
    if (aNum != bNum) {
        return aNum ? -1 : 1;  // numeric identifiers sort first
    }
    int c = a.compare(b);
    return c < 0 ? -1 : (c == 0 ? 0 : 1);
}

}  // namespace

// ── SemVersion ──────────────────────────────────────────────────────────

int SemVersion::Compare(const SemVersion& other) const noexcept {
    if (major != other.major) return major < other.major ? -1 : 1;
    if (minor != other.minor) return minor < other.minor ? -1 : 1;
    if (patch != other.patch) return patch < other.patch ? -1 : 1;

    if (prerelease.empty() || other.prerelease.empty()) {
        if (prerelease.empty() && other.prerelease.empty()) {
            return 0;
        }
        return prerelease.empty() ? 1 : -1;
    }
    auto n = std::min(prerelease.size(), other.prerelease.size());
    for (std::size_t i = 0; i < n; ++i) {
        int c = compareIdentifiers(prerelease[i], other.prerelease[i]);
        if (c != 0) {
            return c;
        }
    }
    if (prerelease.size() == other.prerelease.size()) {
        return 0;
    }
    return prerelease.size() < other.prerelease.size() ? -1 : 1;
}

std::string SemVersion::ToString() const {
    auto out = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    for (std::size_t i = 0; i < prerelease.size(); ++i) {
        out += (i == 0 ? "-" : ".");
        out += prerelease[i];
    }
    if (!build.empty()) {
        out += "+" + build;
    }
    return out;
}

RuntimeResult<SemVersion> ParseSemVersion(std::string_view str) {
    auto fail = [&](std::string_view why) {
        return RuntimeResult<SemVersion>::err(RuntimeError(
            ErrorCode::InvalidArgument,
            "invalid semantic version '" + std::string(str) + "': " + std::string(why)));
    };

    if (str.empty()) {
        return fail("empty");
    }

    SemVersion ver;
    auto text = str;
    if (auto plus = text.find('+'); plus != std::string_view::npos) {
        auto build = text.substr(plus + 1);
        for (auto id : split(build, '.')) {
            if (id.empty() || !std::all_of(id.begin(), id.end(), isIdentifierChar)) {
                return fail("bad build identifier");
            }
        }
        ver.build = std::string(build);
        text = text.substr(0, plus);
    }
    if (auto dash = text.find('-'); dash != std::string_view::npos) {
        for (auto id : split(text.substr(dash + 1), '.')) {
            if (id.empty() || !std::all_of(id.begin(), id.end(), isIdentifierChar)) {
                return fail("bad prerelease identifier");
            }
            if (isDigits(id) && id.size() > 1 && id.front() == '0') {
                return fail("numeric prerelease identifier has a leading zero");
            }
            ver.prerelease.emplace_back(id);
        }
        text = text.substr(0, dash);
    }

    auto parts = split(text, '.');
    if (parts.size() != 3) {
        return fail("expected MAJOR.MINOR.PATCH");
    }
    auto major = parseNumber(parts[0]);
    auto minor = parseNumber(parts[1]);
    auto patch = parseNumber(parts[2]);
    if (!major || !minor || !patch) {
        return fail("components must be non-negative integers without leading zeros");
    }
    ver.major = *major;
    ver.minor = *minor;
    ver.patch = *patch;
    return RuntimeResult<SemVersion>::ok(std::move(ver));
}

// ── VersionConstraint ───────────────────────────────────────────────────

bool VersionConstraint::IsSatisfiedBy(const SemVersion& v) const noexcept {
    switch (op) {
        case ConstraintOp::Any:          return true;
        case ConstraintOp::Equal:        return v == version;
        case ConstraintOp::GreaterThan:  return v > version;
        case ConstraintOp::GreaterEqual: return v >= version;
        case ConstraintOp::LessThan:     return v < version;
        case ConstraintOp::LessEqual:    return v <= version;
    }
    return false;
}

std::string VersionConstraint::ToString() const {
    switch (op) {
        case ConstraintOp::Any:          return "*";
        case ConstraintOp::Equal:        return "==" + version.ToString();
        case ConstraintOp::GreaterThan:  return ">" + version.ToString();
        case ConstraintOp::GreaterEqual: return ">=" + version.ToString();
        case ConstraintOp::LessThan:     return "<" + version.ToString();
        case ConstraintOp::LessEqual:    return "<=" + version.ToString();
    }
    return "?";
}

// ── VersionRange ────────────────────────────────────────────────────────

RuntimeResult<VersionRange> VersionRange::Parse(std::string_view text) {
    VersionRange range;
    range.text_ = std::string(trim(text));

    std::string_view rest = range.text_;
    while (true) {
        auto pos = rest.find("||");
        auto alt = trim(rest.substr(0, pos));

        std::vector<VersionConstraint> set;
        auto tokens = tokenize(alt);
        if (tokens.empty()) {
            // An empty alternative (or an empty range) accepts everything.
            addConstraint(set, ConstraintOp::Any, {});
        }
        for (const auto& token : tokens) {
            auto lowered = lowerToken(token, set);
            if (!lowered) {
                return RuntimeResult<VersionRange>::err(lowered.error());
            }
        }
        range.alternatives_.push_back(std::move(set));

        if (pos == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(pos + 2);
    }

    if (range.text_.empty()) {
        range.text_ = "*";
    }
    return RuntimeResult<VersionRange>::ok(std::move(range));
}

bool VersionRange::IsSatisfiedBy(const SemVersion& v) const noexcept {
    if (alternatives_.empty()) {
        return true;
    }
    auto prereleaseAllowed = [&](const std::vector<VersionConstraint>& set) {
        if (v.prerelease.empty()) {
            return true;
        }
        return std::all_of(set.begin(), set.end(),
                           [](const VersionConstraint& c) { return c.op == ConstraintOp::Any; }) ||
               std::any_of(set.begin(), set.end(), [&](const VersionConstraint& c) {
                   const auto& b = c.version;
                   return c.op != ConstraintOp::Any && !b.prerelease.empty() &&
                          b.major == v.major && b.minor == v.minor && b.patch == v.patch;
               });
    };
    return std::any_of(alternatives_.begin(), alternatives_.end(), [&](const auto& set) {
        return prereleaseAllowed(set) &&
               std::all_of(set.begin(), set.end(),
                           [&](const VersionConstraint& c) { return c.IsSatisfiedBy(v); });
    });
}

std::string VersionRange::ToString() const {
    if (alternatives_.empty()) {
        return "*";
    }
    std::string out;
    for (std::size_t i = 0; i < alternatives_.size(); ++i) {
        if (i > 0) {
            out += " || ";
        }
        for (std::size_t j = 0; j < alternatives_[i].size(); ++j) {
            if (j > 0) {
                out += ' ';
            }
            out += alternatives_[i][j].ToString();
        }
    }
    return out;
}

}  // namespace cpr::plugin
