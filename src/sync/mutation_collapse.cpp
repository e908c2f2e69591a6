#include "sync/mutation_collapse.hpp"

#include <optional>
#include <string>
#include <unordered_map>

namespace engage {

namespace {

enum class TagState {
    Untouched,
    AddedFresh,
    Added,
    Removed
};

struct GroupSlot {
    std::vector<std::string> order;
    std::unordered_map<std::string, TagState> tags;
};

class OperationFolder {
public:
    void fold(const MutationOperation &operation, bool sticky)
    {
        m_sticky = sticky;
        std::visit(*this, operation);
    }

    void operator()(const SetAttribute &op)
    {
        touchAttribute(op.name) = op.value;
    }

    void operator()(const RemoveAttribute &op)
    {
        touchAttribute(op.name) = std::nullopt;
    }

    void operator()(const AddToGroup &op)
    {
        GroupSlot &slot = touchGroup(op.group);
        for (const auto &tag : op.tags) {
            TagState &state = touchTag(slot, tag);
            switch (state) {
            case TagState::Untouched:
                state = m_sticky ? TagState::Added : TagState::AddedFresh;
                break;
            case TagState::Removed:
                state = TagState::Added;
                break;
            case TagState::AddedFresh:
            case TagState::Added:
                break;
            }
        }
    }

    void operator()(const RemoveFromGroup &op)
    {
        GroupSlot &slot = touchGroup(op.group);
        for (const auto &tag : op.tags) {
            TagState &state = touchTag(slot, tag);
            switch (state) {
            case TagState::AddedFresh:
                state = TagState::Untouched;
                break;
            case TagState::Added:
            case TagState::Untouched:
            case TagState::Removed:
                state = TagState::Removed;
                break;
            }
        }
    }

    std::vector<MutationOperation> result() const
    {
        std::vector<MutationOperation> operations;

        for (const auto &name : m_attributeOrder) {
            const auto &value = m_attributes.at(name);
            if (value.has_value()) {
                operations.emplace_back(SetAttribute{name, *value});
            } else {
                operations.emplace_back(RemoveAttribute{name});
            }
        }

        for (const auto &group : m_groupOrder) {
            const GroupSlot &slot = m_groups.at(group);
            RemoveFromGroup removal{group, {}};
            AddToGroup addition{group, {}};
            for (const auto &tag : slot.order) {
                switch (slot.tags.at(tag)) {
                case TagState::Untouched:
                    break;
                case TagState::AddedFresh:
                    addition.tags.push_back(tag);
                    break;
                case TagState::Added:
                    removal.tags.push_back(tag);
                    addition.tags.push_back(tag);
                    break;
                case TagState::Removed:
                    removal.tags.push_back(tag);
                    break;
                }
            }
            if (!removal.tags.empty()) {
                operations.emplace_back(std::move(removal));
            }
            if (!addition.tags.empty()) {
                operations.emplace_back(std::move(addition));
            }
        }

        return operations;
    }

private:
    std::optional<nlohmann::json> &touchAttribute(const std::string &name)
    {
        auto it = m_attributes.find(name);
        if (it == m_attributes.end()) {
            m_attributeOrder.push_back(name);
            it = m_attributes.emplace(name, std::nullopt).first;
        }
        return it->second;
    }

    GroupSlot &touchGroup(const std::string &group)
    {
        auto it = m_groups.find(group);
        if (it == m_groups.end()) {
            m_groupOrder.push_back(group);
            it = m_groups.emplace(group, GroupSlot{}).first;
        }
        return it->second;
    }

    static TagState &touchTag(GroupSlot &slot, const std::string &tag)
    {
        auto it = slot.tags.find(tag);
        if (it == slot.tags.end()) {
            slot.order.push_back(tag);
            it = slot.tags.emplace(tag, TagState::Untouched).first;
        }
        return it->second;
    }

    bool m_sticky = false;
    std::vector<std::string> m_attributeOrder;
    std::unordered_map<std::string, std::optional<nlohmann::json>> m_attributes;
    std::vector<std::string> m_groupOrder;
    std::unordered_map<std::string, GroupSlot> m_groups;
};

} // namespace

std::vector<MutationOperation> collapseOperations(
    const std::vector<MutationOperation> &operations)
{
    return collapseOperations({}, operations, false);
}

std::vector<MutationOperation> collapseOperations(
    const std::vector<MutationOperation> &base,
    const std::vector<MutationOperation> &incoming,
    bool baseSent)
{
    OperationFolder folder;
    for (const auto &operation : base) {
        folder.fold(operation, baseSent);
    }
    for (const auto &operation : incoming) {
        folder.fold(operation, false);
    }
    return folder.result();
}

} // namespace engage
