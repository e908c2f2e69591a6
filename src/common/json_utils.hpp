#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace engage {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{value})};
}

// Operation wire format, shared by the sqlite row and the apply request:
//   {"action":"set","attribute":"color","value":"red"}
//   {"action":"remove","attribute":"color"}
//   {"action":"add","group":"device","tags":["vip"]}
//   {"action":"remove","group":"device","tags":["vip"]}
inline nlohmann::json operationToJson(const MutationOperation &operation)
{
    return std::visit([](const auto &op) -> nlohmann::json {
        using T = std::decay_t<decltype(op)>;
        if constexpr (std::is_same_v<T, SetAttribute>) {
            return {{"action", "set"}, {"attribute", op.name}, {"value", op.value}};
        } else if constexpr (std::is_same_v<T, RemoveAttribute>) {
            return {{"action", "remove"}, {"attribute", op.name}};
        } else if constexpr (std::is_same_v<T, AddToGroup>) {
            return {{"action", "add"}, {"group", op.group}, {"tags", op.tags}};
        } else {
            static_assert(std::is_same_v<T, RemoveFromGroup>, "unhandled operation kind");
            return {{"action", "remove"}, {"group", op.group}, {"tags", op.tags}};
        }
    }, operation);
}

inline nlohmann::json operationsToJson(const std::vector<MutationOperation> &operations)
{
    nlohmann::json array = nlohmann::json::array();
    for (const auto &operation : operations) {
        array.push_back(operationToJson(operation));
    }
    return array;
}

inline std::optional<std::vector<std::string>> tagsFromJson(const nlohmann::json &value)
{
    if (!value.is_array()) {
        return std::nullopt;
    }
    std::vector<std::string> tags;
    tags.reserve(value.size());
    for (const auto &tag : value) {
        if (!tag.is_string()) {
            return std::nullopt;
        }
        tags.push_back(tag.get<std::string>());
    }
    return tags;
}

inline std::optional<MutationOperation> operationFromJson(const nlohmann::json &value)
{
    if (!value.is_object()) {
        return std::nullopt;
    }
    const auto action = value.find("action");
    if (action == value.end() || !action->is_string()) {
        return std::nullopt;
    }

    const std::string actionName = action->get<std::string>();
    const auto attribute = value.find("attribute");
    const auto group = value.find("group");

    if (attribute != value.end() && group == value.end()) {
        if (!attribute->is_string() || attribute->get<std::string>().empty()) {
            return std::nullopt;
        }
        if (actionName == "set") {
            const auto payload = value.find("value");
            if (payload == value.end()) {
                return std::nullopt;
            }
            return MutationOperation{SetAttribute{attribute->get<std::string>(), *payload}};
        }
        if (actionName == "remove") {
            return MutationOperation{RemoveAttribute{attribute->get<std::string>()}};
        }
        return std::nullopt;
    }

    if (group != value.end() && attribute == value.end()) {
        if (!group->is_string() || group->get<std::string>().empty()) {
            return std::nullopt;
        }
        const auto tagsIt = value.find("tags");
        if (tagsIt == value.end()) {
            return std::nullopt;
        }
        auto tags = tagsFromJson(*tagsIt);
        if (!tags) {
            return std::nullopt;
        }
        if (actionName == "add") {
            return MutationOperation{AddToGroup{group->get<std::string>(), std::move(*tags)}};
        }
        if (actionName == "remove") {
            return MutationOperation{RemoveFromGroup{group->get<std::string>(), std::move(*tags)}};
        }
    }

    return std::nullopt;
}

inline std::optional<std::vector<MutationOperation>> operationsFromJson(
    const nlohmann::json &value)
{
    if (!value.is_array()) {
        return std::nullopt;
    }
    std::vector<MutationOperation> operations;
    operations.reserve(value.size());
    for (const auto &item : value) {
        auto operation = operationFromJson(item);
        if (!operation) {
            return std::nullopt;
        }
        operations.push_back(std::move(*operation));
    }
    return operations;
}

inline nlohmann::json collapsedMutationToJson(const CollapsedMutation &mutation)
{
    return nlohmann::json{
        {"identifier", mutation.identifier},
        {"sequence", mutation.sequence},
        {"createdAt", toIso8601Utc(mutation.createdAt)},
        {"operations", operationsToJson(mutation.operations)}
    };
}

inline std::string toTaskStateString(TaskState state)
{
    switch (state) {
    case TaskState::Idle:
        return "idle";
    case TaskState::Queued:
        return "queued";
    case TaskState::Running:
        return "running";
    case TaskState::Failed:
        return "failed";
    }
    return "idle";
}

inline std::string toOutcomeString(SyncOutcomeKind kind)
{
    switch (kind) {
    case SyncOutcomeKind::Success:
        return "success";
    case SyncOutcomeKind::RetryableFailure:
        return "retryable_failure";
    case SyncOutcomeKind::UnrecoverableFailure:
        return "unrecoverable_failure";
    }
    return "retryable_failure";
}

} // namespace engage
