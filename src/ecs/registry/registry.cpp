/// @file registry.cpp
/// @brief Entity registry implementation.

#include "sedit/ecs/registry.hpp"

#include "sedit/foundation/editor_logger.hpp"

#include <algorithm>

namespace sedit::ecs {

using foundation::LogCategory;

// ── Entity lifecycle ─────────────────────────────────────────────────

Entity Registry::CreateEntity(std::string_view name) {
    return insertRecord(Entity(nextId_++), name);
}

Entity Registry::CreateEntity(Entity requested, std::string_view name) {
    if (!requested.isValid() || IsAlive(requested)) {
        return kNullEntity;
    }
    if (requested.id() >= nextId_) {
        nextId_ = requested.id() + 1;
    }
    SEDIT_LOG_DEBUG(LogCategory::ECS, "re-created entity " + std::to_string(requested.id()));
    return insertRecord(requested, name);
}

Entity Registry::insertRecord(Entity entity, std::string_view name) {
    EntityRecord record;
    record.name = name.empty() ? "Entity_" + std::to_string(entity.id()) : std::string(name);
    records_.emplace(entity, std::move(record));
    rootChildren_.push_back(entity);

    return entity;
}

void Registry::DestroyEntity(Entity entity) {
    auto* record = findRecord(entity);
    if (record == nullptr) {
        return;
    }

    // Each child detaches itself from `record->children`, so walk a copy.
    const auto children = record->children;
    for (Entity child : children) {
        DestroyEntity(child);
    }

    record = findRecord(entity);
    detachFromParent(entity, *record);

    for (auto& [typeId, storage] : storages_) {
        storage->Remove(entity);
    }
    records_.erase(entity);

    SEDIT_LOG_DEBUG(LogCategory::ECS, "destroyed entity " + std::to_string(entity.id()));
}

bool Registry::IsAlive(Entity entity) const {
    return findRecord(entity) != nullptr;
}

std::vector<Entity> Registry::AllEntities() const {
    std::vector<Entity> result;
    result.reserve(records_.size());
    for (const auto& [entity, record] : records_) {
        result.push_back(entity);
    }
    return result;
}

void Registry::Clear() {
    for (auto& [typeId, storage] : storages_) {
        storage->Clear();
    }
    records_.clear();
    rootChildren_.clear();
}

std::size_t Registry::CopyComponents(Entity from, Entity to) {
    if (!IsAlive(from) || !IsAlive(to)) {
        return 0;
    }
    std::size_t copied = 0;
    for (auto& [typeId, storage] : storages_) {
        if (storage->CopyComponent(from, to)) {
            ++copied;
        }
    }
    return copied;
}

// ── Metadata ─────────────────────────────────────────────────────────

bool Registry::SetName(Entity entity, std::string_view name) {
    auto* record = findRecord(entity);
    if (record == nullptr) {
        return false;
    }
    record->name = std::string(name);
    return true;
}

std::string Registry::GetName(Entity entity) const {
    const auto* record = findRecord(entity);
    return record ? record->name : std::string();
}

bool Registry::SetActive(Entity entity, bool active) {
    auto* record = findRecord(entity);
    if (record == nullptr) {
        return false;
    }
    record->active = active;
    return true;
}

bool Registry::IsActive(Entity entity) const {
    const auto* record = findRecord(entity);
    return record != nullptr && record->active;
}

bool Registry::AddTag(Entity entity, std::string_view tag) {
    auto* record = findRecord(entity);
    if (record == nullptr || tag.empty()) {
        return false;
    }
    return record->tags.emplace(tag).second;
}

bool Registry::RemoveTag(Entity entity, std::string_view tag) {
    auto* record = findRecord(entity);
    if (record == nullptr) {
        return false;
    }
    return record->tags.erase(std::string(tag)) > 0;
}

bool Registry::HasTag(Entity entity, std::string_view tag) const {
    const auto* record = findRecord(entity);
    return record != nullptr && record->tags.count(std::string(tag)) > 0;
}

std::vector<std::string> Registry::GetTags(Entity entity) const {
    const auto* record = findRecord(entity);
    if (record == nullptr) {
        return {};
    }
    return {record->tags.begin(), record->tags.end()};
}

Entity Registry::FindByName(std::string_view name) const {
    for (const auto& [entity, record] : records_) {
        if (record.name == name) {
            return entity;
        }
    }
    return kNullEntity;
}

std::vector<Entity> Registry::EntitiesWithTag(std::string_view tag) const {
    std::vector<Entity> result;
    const std::string key(tag);
    for (const auto& [entity, record] : records_) {
        if (record.tags.count(key) > 0) {
            result.push_back(entity);
        }
    }
    return result;
}

const EntityRecord* Registry::GetRecord(Entity entity) const {
    return findRecord(entity);
}

// ── Hierarchy ────────────────────────────────────────────────────────

bool Registry::SetParent(Entity entity, Entity newParent, std::size_t index) {
    if (!entity.isValid() || entity == newParent) {
        return false;
    }
    auto* record = findRecord(entity);
    if (record == nullptr) {
        return false;
    }
    if (newParent.isValid() && !IsAlive(newParent)) {
        return false;
    }
    if (IsAncestorOf(entity, newParent)) {
        SEDIT_LOG_WARN(LogCategory::ECS,
                       "rejected reparenting " + std::to_string(entity.id()) + " under its descendant " +
                           std::to_string(newParent.id()));
        return false;
    }

    detachFromParent(entity, *record);
    record->parent = newParent;

    auto* siblings = childList(newParent);
    auto pos = std::min(index, siblings->size());
    siblings->insert(siblings->begin() + static_cast<std::ptrdiff_t>(pos), entity);
    return true;
}

Entity Registry::GetParent(Entity entity) const {
    const auto* record = findRecord(entity);
    return record ? record->parent : kNullEntity;
}

std::vector<Entity> Registry::GetChildren(Entity entity) const {
    if (!entity.isValid()) {
        return rootChildren_;
    }
    const auto* record = findRecord(entity);
    return record ? record->children : std::vector<Entity>{};
}

std::size_t Registry::GetChildIndex(Entity entity) const {
    const auto* record = findRecord(entity);
    if (record == nullptr) {
        return kAppend;
    }
    const auto& siblings = record->parent.isValid() ? findRecord(record->parent)->children
                                                    : rootChildren_;
    auto it = std::find(siblings.begin(), siblings.end(), entity);
    return it == siblings.end() ? kAppend : static_cast<std::size_t>(it - siblings.begin());
}

Entity Registry::GetRoot(Entity entity) const {
    const auto* record = findRecord(entity);
    if (record == nullptr) {
        return kNullEntity;
    }
    Entity current = entity;
    while (record->parent.isValid()) {
        current = record->parent;
        record = findRecord(current);
    }
    return current;
}

std::vector<Entity> Registry::GetPath(Entity entity) const {
    std::vector<Entity> path;
    Entity current = entity;
    while (const auto* record = findRecord(current)) {
        path.push_back(current);
        current = record->parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

bool Registry::IsAncestorOf(Entity ancestor, Entity entity) const {
    const auto* record = findRecord(entity);
    if (record == nullptr) {
        return false;
    }
    if (!ancestor.isValid()) {
        return true;
    }
    while (record != nullptr && record->parent.isValid()) {
        if (record->parent == ancestor) {
            return true;
        }
        record = findRecord(record->parent);
    }
    return false;
}

// ── Private ──────────────────────────────────────────────────────────

EntityRecord* Registry::findRecord(Entity entity) {
    auto it = records_.find(entity);
    return it == records_.end() ? nullptr : &it->second;
}

const EntityRecord* Registry::findRecord(Entity entity) const {
    auto it = records_.find(entity);
    return it == records_.end() ? nullptr : &it->second;
}

std::vector<Entity>* Registry::childList(Entity parent) {
    if (!parent.isValid()) {
        return &rootChildren_;
    }
    auto* record = findRecord(parent);
    return record ? &record->children : nullptr;
}

void Registry::detachFromParent(Entity entity, const EntityRecord& record) {
    auto* siblings = childList(record.parent);
    if (siblings == nullptr) {
        return;
    }
    siblings->erase(std::remove(siblings->begin(), siblings->end(), entity), siblings->end());
}

} // namespace sedit::ecs
