#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engage {

using VersionComponents = std::vector<uint64_t>;

// Parses "1.2.3" style versions: dot-separated non-negative integers, no
// empty components, no signs or whitespace.
std::optional<VersionComponents> parseVersion(const std::string &value);

// Three-way compare; missing trailing components count as zero.
int compareVersions(const VersionComponents &a, const VersionComponents &b);

// A version constraint as used by app_version style predicates:
//   exact   "1.2.3"
//   prefix  "1.2.+", "1.2+", "+"
//   range   "[1.0,2.0)", "]1.0,2.0[", "[1.0,)", "(,2.0]"
class VersionMatcher {
public:
    static std::optional<VersionMatcher> parse(const std::string &constraint);

    bool matches(const std::string &version) const;

    const std::string &constraint() const
    {
        return m_constraint;
    }

private:
    enum class Kind {
        Exact,
        Prefix,
        Range
    };

    struct Bound {
        VersionComponents version;
        bool inclusive = true;
    };

    VersionMatcher() = default;

    std::string m_constraint;
    Kind m_kind = Kind::Exact;
    VersionComponents m_version;
    std::optional<Bound> m_lower;
    std::optional<Bound> m_upper;
};

} // namespace engage
