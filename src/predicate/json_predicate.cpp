#include "predicate/json_predicate.hpp"

#include <algorithm>
#include <cctype>
#include <type_traits>

#include "common/logging.hpp"
#include "predicate/version_matcher.hpp"

namespace engage {

namespace {

constexpr const char *kAndKey = "and";
constexpr const char *kOrKey = "or";
constexpr const char *kNotKey = "not";
constexpr const char *kScopeKey = "scope";
constexpr const char *kKeyKey = "key";
constexpr const char *kIgnoreCaseKey = "ignore_case";
constexpr const char *kValueKey = "value";
constexpr const char *kEqualsKey = "equals";
constexpr const char *kAtLeastKey = "at_least";
constexpr const char *kAtMostKey = "at_most";
constexpr const char *kIsPresentKey = "is_present";
constexpr const char *kVersionMatchesKey = "version_matches";
constexpr const char *kVersionKey = "version";
constexpr const char *kArrayContainsKey = "array_contains";
constexpr const char *kIndexKey = "index";

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::vector<std::string> splitPath(const std::string &path)
{
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        const size_t dot = path.find('.', start);
        if (dot == std::string::npos) {
            segments.push_back(path.substr(start));
            break;
        }
        segments.push_back(path.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

// Walks one member per segment. Any non-object along the way, or a missing
// member, means the value is absent.
const nlohmann::json *resolvePath(const nlohmann::json *current,
                                  const std::vector<std::string> &segments)
{
    for (const auto &segment : segments) {
        if (!current || !current->is_object()) {
            return nullptr;
        }
        const auto it = current->find(segment);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

bool jsonEquals(const nlohmann::json &expected, const nlohmann::json &actual, bool ignoreCase)
{
    if (expected.is_string() && actual.is_string()) {
        if (ignoreCase) {
            return toLower(expected.get<std::string>()) == toLower(actual.get<std::string>());
        }
        return expected.get_ref<const std::string &>() == actual.get_ref<const std::string &>();
    }
    if (expected.is_number() && actual.is_number()) {
        // int64/uint64/double compare by value.
        return expected == actual;
    }
    if (expected.is_array() && actual.is_array()) {
        if (expected.size() != actual.size()) {
            return false;
        }
        for (size_t i = 0; i < expected.size(); ++i) {
            if (!jsonEquals(expected[i], actual[i], ignoreCase)) {
                return false;
            }
        }
        return true;
    }
    if (expected.is_object() && actual.is_object()) {
        if (expected.size() != actual.size()) {
            return false;
        }
        for (auto it = expected.begin(); it != expected.end(); ++it) {
            const auto other = actual.find(it.key());
            if (other == actual.end() || !jsonEquals(it.value(), *other, ignoreCase)) {
                return false;
            }
        }
        return true;
    }
    if (expected.type() != actual.type()) {
        return false;
    }
    return expected == actual;
}

std::optional<JsonValueMatcher> valueMatcherFromJson(const nlohmann::json &json)
{
    if (!json.is_object()) {
        return std::nullopt;
    }

    if (const auto it = json.find(kEqualsKey); it != json.end()) {
        return JsonValueMatcher{EqualsMatcher{*it}};
    }

    const auto atLeast = json.find(kAtLeastKey);
    const auto atMost = json.find(kAtMostKey);
    if (atLeast != json.end() || atMost != json.end()) {
        NumberRangeMatcher range;
        if (atLeast != json.end()) {
            if (!atLeast->is_number()) {
                return std::nullopt;
            }
            range.atLeast = atLeast->get<double>();
        }
        if (atMost != json.end()) {
            if (!atMost->is_number()) {
                return std::nullopt;
            }
            range.atMost = atMost->get<double>();
        }
        return JsonValueMatcher{range};
    }

    if (const auto it = json.find(kIsPresentKey); it != json.end()) {
        if (!it->is_boolean()) {
            return std::nullopt;
        }
        return JsonValueMatcher{PresenceMatcher{it->get<bool>()}};
    }

    auto version = json.find(kVersionMatchesKey);
    if (version == json.end()) {
        version = json.find(kVersionKey);
    }
    if (version != json.end()) {
        if (!version->is_string()) {
            return std::nullopt;
        }
        const std::string constraint = version->get<std::string>();
        if (!VersionMatcher::parse(constraint)) {
            return std::nullopt;
        }
        return JsonValueMatcher{VersionConstraintMatcher{constraint}};
    }

    if (const auto it = json.find(kArrayContainsKey); it != json.end()) {
        auto nested = JsonPredicate::fromJson(*it);
        if (!nested) {
            return std::nullopt;
        }
        ArrayContainsMatcher contains;
        contains.predicate = std::make_shared<const JsonPredicate>(std::move(*nested));
        if (const auto index = json.find(kIndexKey); index != json.end()) {
            if (!index->is_number_integer()) {
                return std::nullopt;
            }
            contains.index = index->get<int64_t>();
        }
        return JsonValueMatcher{std::move(contains)};
    }

    return std::nullopt;
}

std::optional<JsonMatcher> matcherFromJson(const nlohmann::json &json)
{
    JsonMatcher matcher;

    if (const auto it = json.find(kScopeKey); it != json.end()) {
        if (it->is_string()) {
            matcher.scope.push_back(it->get<std::string>());
        } else if (it->is_array()) {
            for (const auto &segment : *it) {
                if (!segment.is_string()) {
                    return std::nullopt;
                }
                matcher.scope.push_back(segment.get<std::string>());
            }
        } else {
            return std::nullopt;
        }
    }

    if (const auto it = json.find(kKeyKey); it != json.end()) {
        if (!it->is_string()) {
            return std::nullopt;
        }
        matcher.key = it->get<std::string>();
    }

    if (const auto it = json.find(kIgnoreCaseKey); it != json.end()) {
        if (!it->is_boolean()) {
            return std::nullopt;
        }
        matcher.ignoreCase = it->get<bool>();
    }

    const auto value = json.find(kValueKey);
    if (value == json.end()) {
        return std::nullopt;
    }
    auto valueMatcher = valueMatcherFromJson(*value);
    if (!valueMatcher) {
        return std::nullopt;
    }
    matcher.value = std::move(*valueMatcher);
    return matcher;
}

std::optional<std::vector<JsonPredicate>> childrenFromJson(const nlohmann::json &json)
{
    if (!json.is_array()) {
        return std::nullopt;
    }
    std::vector<JsonPredicate> children;
    children.reserve(json.size());
    for (const auto &item : json) {
        auto child = JsonPredicate::fromJson(item);
        if (!child) {
            return std::nullopt;
        }
        children.push_back(std::move(*child));
    }
    return children;
}

nlohmann::json valueMatcherToJson(const JsonValueMatcher &matcher)
{
    return std::visit([](const auto &m) -> nlohmann::json {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, EqualsMatcher>) {
            return {{kEqualsKey, m.value}};
        } else if constexpr (std::is_same_v<T, NumberRangeMatcher>) {
            nlohmann::json json = nlohmann::json::object();
            if (m.atLeast) {
                json[kAtLeastKey] = *m.atLeast;
            }
            if (m.atMost) {
                json[kAtMostKey] = *m.atMost;
            }
            return json;
        } else if constexpr (std::is_same_v<T, PresenceMatcher>) {
            return {{kIsPresentKey, m.present}};
        } else if constexpr (std::is_same_v<T, VersionConstraintMatcher>) {
            return {{kVersionMatchesKey, m.constraint}};
        } else {
            static_assert(std::is_same_v<T, ArrayContainsMatcher>, "unhandled value matcher");
            nlohmann::json json = {{kArrayContainsKey, m.predicate->toJson()}};
            if (m.index) {
                json[kIndexKey] = *m.index;
            }
            return json;
        }
    }, matcher);
}

struct ValueEvaluator {
    // nullptr when the matcher's path resolved to nothing.
    const nlohmann::json *actual;
    bool ignoreCase;

    bool operator()(const PresenceMatcher &m) const
    {
        return (actual != nullptr) == m.present;
    }

    bool operator()(const EqualsMatcher &m) const
    {
        return actual && jsonEquals(m.value, *actual, ignoreCase);
    }

    bool operator()(const NumberRangeMatcher &m) const
    {
        if (!actual || !actual->is_number()) {
            return false;
        }
        const double number = actual->get<double>();
        if (m.atLeast && number < *m.atLeast) {
            return false;
        }
        if (m.atMost && number > *m.atMost) {
            return false;
        }
        return true;
    }

    bool operator()(const VersionConstraintMatcher &m) const
    {
        if (!actual || !actual->is_string()) {
            return false;
        }
        const auto matcher = VersionMatcher::parse(m.constraint);
        return matcher && matcher->matches(actual->get<std::string>());
    }

    bool operator()(const ArrayContainsMatcher &m) const
    {
        if (!actual || !actual->is_array() || !m.predicate) {
            return false;
        }
        if (m.index) {
            const int64_t index = *m.index;
            if (index < 0 || static_cast<uint64_t>(index) >= actual->size()) {
                return false;
            }
            return m.predicate->evaluate((*actual)[static_cast<size_t>(index)]);
        }
        return std::any_of(actual->begin(), actual->end(), [&](const nlohmann::json &item) {
            return m.predicate->evaluate(item);
        });
    }
};

struct NodeEvaluator {
    const nlohmann::json &subject;

    bool operator()(const JsonPredicate::And &node) const
    {
        return std::all_of(node.children.begin(), node.children.end(),
                           [&](const JsonPredicate &child) {
                               return child.evaluate(subject);
                           });
    }

    bool operator()(const JsonPredicate::Or &node) const
    {
        return std::any_of(node.children.begin(), node.children.end(),
                           [&](const JsonPredicate &child) {
                               return child.evaluate(subject);
                           });
    }

    bool operator()(const JsonPredicate::Not &node) const
    {
        return node.child && !node.child->evaluate(subject);
    }

    bool operator()(const JsonMatcher &matcher) const
    {
        const nlohmann::json *current = resolvePath(&subject, matcher.scope);
        if (current && matcher.key) {
            current = resolvePath(current, splitPath(*matcher.key));
        }
        return std::visit(ValueEvaluator{current, matcher.ignoreCase.value_or(false)},
                          matcher.value);
    }
};

} // namespace

std::optional<JsonPredicate> JsonPredicate::fromJson(const nlohmann::json &json)
{
    if (!json.is_object()) {
        return std::nullopt;
    }

    if (const auto it = json.find(kAndKey); it != json.end()) {
        auto children = childrenFromJson(*it);
        if (!children) {
            return std::nullopt;
        }
        return JsonPredicate{And{std::move(*children)}};
    }

    if (const auto it = json.find(kOrKey); it != json.end()) {
        auto children = childrenFromJson(*it);
        if (!children) {
            return std::nullopt;
        }
        return JsonPredicate{Or{std::move(*children)}};
    }

    if (const auto it = json.find(kNotKey); it != json.end()) {
        // Both {"not": p} and {"not": [p]} are accepted.
        const nlohmann::json *childJson = &(*it);
        if (it->is_array()) {
            if (it->size() != 1) {
                return std::nullopt;
            }
            childJson = &(*it)[0];
        }
        auto child = fromJson(*childJson);
        if (!child) {
            return std::nullopt;
        }
        return JsonPredicate{Not{std::make_shared<const JsonPredicate>(std::move(*child))}};
    }

    auto matcher = matcherFromJson(json);
    if (!matcher) {
        return std::nullopt;
    }
    return JsonPredicate{std::move(*matcher)};
}

nlohmann::json JsonPredicate::toJson() const
{
    if (const auto *andNode = std::get_if<And>(&node)) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto &child : andNode->children) {
            children.push_back(child.toJson());
        }
        return {{kAndKey, children}};
    }
    if (const auto *orNode = std::get_if<Or>(&node)) {
        nlohmann::json children = nlohmann::json::array();
        for (const auto &child : orNode->children) {
            children.push_back(child.toJson());
        }
        return {{kOrKey, children}};
    }
    if (const auto *notNode = std::get_if<Not>(&node)) {
        return {{kNotKey, notNode->child ? notNode->child->toJson() : nlohmann::json::object()}};
    }

    const auto &matcher = std::get<JsonMatcher>(node);
    nlohmann::json json = nlohmann::json::object();
    if (!matcher.scope.empty()) {
        json[kScopeKey] = matcher.scope;
    }
    if (matcher.key) {
        json[kKeyKey] = *matcher.key;
    }
    if (matcher.ignoreCase) {
        json[kIgnoreCaseKey] = *matcher.ignoreCase;
    }
    json[kValueKey] = valueMatcherToJson(matcher.value);
    return json;
}

bool JsonPredicate::evaluate(const nlohmann::json &subject) const
{
    return std::visit(NodeEvaluator{subject}, node);
}

bool matches(const JsonPredicate &predicate, const nlohmann::json &subject)
{
    return predicate.evaluate(subject);
}

bool evaluatePredicateJson(const nlohmann::json &predicate, const nlohmann::json &subject)
{
    const auto parsed = JsonPredicate::fromJson(predicate);
    if (!parsed) {
        ELOG_WARN(QStringLiteral("PredicateEngine"),
                  QStringLiteral("evaluatePredicateJson"),
                  QStringLiteral("predicate_rejected"),
                  QStringLiteral("malformed_predicate"),
                  QStringLiteral("fail_closed"),
                  logging::defaultWho(),
                  logging::currentCorrelationId(),
                  (nlohmann::json{{"predicate", predicate}}));
        return false;
    }
    return parsed->evaluate(subject);
}

} // namespace engage
