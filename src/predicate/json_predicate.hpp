#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace engage {

struct JsonPredicate;

// Value matchers, applied to the value a JsonMatcher resolved.
struct EqualsMatcher {
    nlohmann::json value;
};

// Inclusive numeric bounds; at least one is set.
struct NumberRangeMatcher {
    std::optional<double> atLeast;
    std::optional<double> atMost;
};

struct PresenceMatcher {
    bool present = true;
};

struct VersionConstraintMatcher {
    std::string constraint;
};

// Matches arrays with at least one element satisfying predicate. With index,
// only that element is evaluated.
struct ArrayContainsMatcher {
    std::shared_ptr<const JsonPredicate> predicate;
    std::optional<int64_t> index;
};

using JsonValueMatcher = std::variant<EqualsMatcher,
                                      NumberRangeMatcher,
                                      PresenceMatcher,
                                      VersionConstraintMatcher,
                                      ArrayContainsMatcher>;

// Resolves scope, then key (dot separated), against the subject and applies
// the value matcher to what it finds.
struct JsonMatcher {
    std::vector<std::string> scope;
    std::optional<std::string> key;
    std::optional<bool> ignoreCase;
    JsonValueMatcher value;
};

// Composable boolean predicate over JSON values. Immutable once parsed and
// safe to evaluate from any thread.
struct JsonPredicate {
    struct And {
        std::vector<JsonPredicate> children;
    };
    struct Or {
        std::vector<JsonPredicate> children;
    };
    struct Not {
        std::shared_ptr<const JsonPredicate> child;
    };

    std::variant<And, Or, Not, JsonMatcher> node;

    // Malformed input yields std::nullopt; parsing never throws.
    static std::optional<JsonPredicate> fromJson(const nlohmann::json &json);

    nlohmann::json toJson() const;
    bool evaluate(const nlohmann::json &subject) const;
};

bool matches(const JsonPredicate &predicate, const nlohmann::json &subject);

// Parses and evaluates in one go. A predicate that does not parse never matches.
bool evaluatePredicateJson(const nlohmann::json &predicate, const nlohmann::json &subject);

} // namespace engage
