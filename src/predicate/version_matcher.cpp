#include "predicate/version_matcher.hpp"

#include <algorithm>
#include <cctype>

namespace engage {

namespace {

constexpr size_t kMaxComponentDigits = 18;

std::string trim(const std::string &value)
{
    const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

bool startsWithComponents(const VersionComponents &version, const VersionComponents &prefix)
{
    if (version.size() < prefix.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), version.begin());
}

} // namespace

std::optional<VersionComponents> parseVersion(const std::string &value)
{
    if (value.empty()) {
        return std::nullopt;
    }

    VersionComponents components;
    size_t start = 0;
    while (true) {
        const size_t dot = value.find('.', start);
        const std::string part = value.substr(start, dot == std::string::npos
                                                         ? std::string::npos
                                                         : dot - start);
        if (part.empty() || part.size() > kMaxComponentDigits) {
            return std::nullopt;
        }
        uint64_t number = 0;
        for (const char c : part) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return std::nullopt;
            }
            number = number * 10 + static_cast<uint64_t>(c - '0');
        }
        components.push_back(number);

        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return components;
}

int compareVersions(const VersionComponents &a, const VersionComponents &b)
{
    const size_t length = std::max(a.size(), b.size());
    for (size_t i = 0; i < length; ++i) {
        const uint64_t left = i < a.size() ? a[i] : 0;
        const uint64_t right = i < b.size() ? b[i] : 0;
        if (left < right) {
            return -1;
        }
        if (left > right) {
            return 1;
        }
    }
    return 0;
}

std::optional<VersionMatcher> VersionMatcher::parse(const std::string &constraint)
{
    const std::string text = trim(constraint);
    if (text.empty()) {
        return std::nullopt;
    }

    VersionMatcher matcher;
    matcher.m_constraint = constraint;

    const char first = text.front();
    const char last = text.back();
    const bool rangeStart = first == '[' || first == ']' || first == '(';
    const bool rangeEnd = last == '[' || last == ']' || last == ')';

    if (rangeStart || rangeEnd) {
        if (!rangeStart || !rangeEnd || text.size() < 3) {
            return std::nullopt;
        }
        const std::string body = text.substr(1, text.size() - 2);
        const size_t comma = body.find(',');
        if (comma == std::string::npos || body.find(',', comma + 1) != std::string::npos) {
            return std::nullopt;
        }

        const std::string lowerText = trim(body.substr(0, comma));
        const std::string upperText = trim(body.substr(comma + 1));
        if (lowerText.empty() && upperText.empty()) {
            return std::nullopt;
        }

        matcher.m_kind = Kind::Range;
        if (!lowerText.empty()) {
            auto version = parseVersion(lowerText);
            if (!version) {
                return std::nullopt;
            }
            matcher.m_lower = Bound{std::move(*version), first == '['};
        } else if (first != '(') {
            // An open lower end is written "(,x]" only.
            return std::nullopt;
        }
        if (!upperText.empty()) {
            auto version = parseVersion(upperText);
            if (!version) {
                return std::nullopt;
            }
            matcher.m_upper = Bound{std::move(*version), last == ']'};
        } else if (last != ')') {
            return std::nullopt;
        }

        if (matcher.m_lower && matcher.m_upper
            && compareVersions(matcher.m_lower->version, matcher.m_upper->version) > 0) {
            return std::nullopt;
        }
        return matcher;
    }

    if (last == '+') {
        matcher.m_kind = Kind::Prefix;
        std::string prefix = text.substr(0, text.size() - 1);
        if (!prefix.empty() && prefix.back() == '.') {
            prefix.pop_back();
        }
        if (prefix.empty()) {
            return matcher;
        }
        auto version = parseVersion(prefix);
        if (!version) {
            return std::nullopt;
        }
        matcher.m_version = std::move(*version);
        return matcher;
    }

    auto version = parseVersion(text);
    if (!version) {
        return std::nullopt;
    }
    matcher.m_kind = Kind::Exact;
    matcher.m_version = std::move(*version);
    return matcher;
}

bool VersionMatcher::matches(const std::string &version) const
{
    const auto parsed = parseVersion(version);
    if (!parsed) {
        return false;
    }

    switch (m_kind) {
    case Kind::Exact:
        return compareVersions(*parsed, m_version) == 0;
    case Kind::Prefix:
        return startsWithComponents(*parsed, m_version);
    case Kind::Range:
        if (m_lower) {
            const int cmp = compareVersions(*parsed, m_lower->version);
            if (cmp < 0 || (cmp == 0 && !m_lower->inclusive)) {
                return false;
            }
        }
        if (m_upper) {
            const int cmp = compareVersions(*parsed, m_upper->version);
            if (cmp > 0 || (cmp == 0 && !m_upper->inclusive)) {
                return false;
            }
        }
        return true;
    }
    return false;
}

} // namespace engage
