#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace engage {

// Mutation operations. Attributes and tag groups are separate namespaces:
// an attribute named "vip" and a tag group named "vip" never interact.
struct SetAttribute {
    std::string name;
    nlohmann::json value;
};

struct RemoveAttribute {
    std::string name;
};

struct AddToGroup {
    std::string group;
    std::vector<std::string> tags;
};

struct RemoveFromGroup {
    std::string group;
    std::vector<std::string> tags;
};

using MutationOperation =
    std::variant<SetAttribute, RemoveAttribute, AddToGroup, RemoveFromGroup>;

struct Mutation {
    std::vector<MutationOperation> operations;
    std::chrono::system_clock::time_point createdAt;
};

// The single pending, already collapsed mutation of one identifier.
// sequence is the persisted sequence number; 0 means nothing is pending.
struct CollapsedMutation {
    std::string identifier;
    std::vector<MutationOperation> operations;
    int64_t sequence = 0;
    std::chrono::system_clock::time_point createdAt;

    bool empty() const
    {
        return operations.empty();
    }
};

struct PersistedRow {
    std::string identifier;
    int64_t sequence = 0;
    std::chrono::system_clock::time_point createdAt;
    nlohmann::json operations;
};

struct SyncOutcome {
    SyncOutcomeKind kind = SyncOutcomeKind::Success;
    std::string reason;
    int statusCode = 0;
    std::optional<std::chrono::milliseconds> retryAfter;
};

inline bool operator==(const SetAttribute &a, const SetAttribute &b)
{
    return a.name == b.name && a.value == b.value;
}

inline bool operator==(const RemoveAttribute &a, const RemoveAttribute &b)
{
    return a.name == b.name;
}

inline bool operator==(const AddToGroup &a, const AddToGroup &b)
{
    return a.group == b.group && a.tags == b.tags;
}

inline bool operator==(const RemoveFromGroup &a, const RemoveFromGroup &b)
{
    return a.group == b.group && a.tags == b.tags;
}

} // namespace engage
