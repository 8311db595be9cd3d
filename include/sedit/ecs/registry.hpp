#pragma once

/// @file registry.hpp
/// @brief Entity registry: ids, component storages, metadata and hierarchy.
///
/// The registry owns every piece of scene state.  Entity ids are allocated
/// monotonically from 1.  Each entity carries a display name, an active
/// flag, an ordered tag set and a hierarchy record (parent + ordered
/// children).  Id 0 is the permanent scene root: entities whose parent is
/// 0 are listed by `GetChildren(kNullEntity)`.
///
/// Every operation is total over entity ids.  Unknown ids produce
/// nullptr / false / kNullEntity / empty results and never throw.

#include "sedit/ecs/component_storage.hpp"
#include "sedit/ecs/entity.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sedit::ecs {

/// Per-entity metadata and hierarchy record.
struct EntityRecord {
    std::string name;
    bool active = true;
    std::set<std::string> tags;
    Entity parent;
    std::vector<Entity> children;
};

class Registry {
public:
    /// Sentinel index meaning "append at the end of the sibling list".
    static constexpr std::size_t kAppend = static_cast<std::size_t>(-1);

    Registry() = default;

    // Non-copyable, movable.
    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) noexcept = default;
    Registry& operator=(Registry&&) noexcept = default;

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Allocate a new top-level entity.
    ///
    /// A blank @p name becomes "Entity_<id>".  The entity is active, has
    /// no tags and no components, and is appended to the root's children.
    [[nodiscard]] Entity CreateEntity(std::string_view name = {});

    /// Allocate a top-level entity under a specific id.
    ///
    /// Used to bring a destroyed entity back under the id it had, so that
    /// anything still holding that id sees the same entity again.  Id
    /// allocation continues past @p requested if it is ahead of it.
    /// @return kNullEntity if @p requested is null or already alive.
    [[nodiscard]] Entity CreateEntity(Entity requested, std::string_view name = {});

    /// Destroy @p entity and its whole subtree.
    ///
    /// Children are destroyed first, then the entity is detached from its
    /// parent, stripped from every storage and its record erased.  No-op
    /// for unknown ids and for the root.
    void DestroyEntity(Entity entity);

    [[nodiscard]] bool IsAlive(Entity entity) const;

    [[nodiscard]] std::size_t Count() const noexcept { return records_.size(); }

    /// All live entities in creation order.
    [[nodiscard]] std::vector<Entity> AllEntities() const;

    /// Destroy every entity and drop all components.  Id allocation keeps
    /// counting so old ids never come back.
    void Clear();

    // ── Components ───────────────────────────────────────────────────

    /// Attach (or overwrite) a component.
    /// @return Pointer to the stored component, nullptr for unknown entities.
    template <typename T>
    T* AddComponent(Entity entity, T component = T{}) {
        if (!IsAlive(entity)) {
            return nullptr;
        }
        return &Storage<T>().Add(entity, std::move(component));
    }

    template <typename T>
    [[nodiscard]] T* GetComponent(Entity entity) {
        auto* storage = FindStorage<T>();
        return storage ? storage->Get(entity) : nullptr;
    }

    template <typename T>
    [[nodiscard]] const T* GetComponent(Entity entity) const {
        const auto* storage = FindStorage<T>();
        return storage ? storage->Get(entity) : nullptr;
    }

    template <typename T>
    [[nodiscard]] bool HasComponent(Entity entity) const {
        const auto* storage = FindStorage<T>();
        return storage != nullptr && storage->Has(entity);
    }

    template <typename T>
    void RemoveComponent(Entity entity) {
        if (auto* storage = FindStorage<T>()) {
            storage->Remove(entity);
        }
    }

    /// Entities owning a T, in the storage's dense order.
    template <typename T>
    [[nodiscard]] std::vector<Entity> EntitiesWith() const {
        const auto* storage = FindStorage<T>();
        return storage ? storage->Entities() : std::vector<Entity>{};
    }

    /// Entities owning both an A and a B.  Walks the smaller storage and
    /// filters by membership in the other.
    template <typename A, typename B>
    [[nodiscard]] std::vector<Entity> EntitiesWithAll() const {
        const auto* first = FindStorage<A>();
        const auto* second = FindStorage<B>();
        if (first == nullptr || second == nullptr) {
            return {};
        }

        const IComponentStorage* walk = first;
        const IComponentStorage* filter = second;
        if (second->Size() < first->Size()) {
            std::swap(walk, filter);
        }

        std::vector<Entity> result;
        for (Entity e : walk->Entities()) {
            if (filter->Has(e)) {
                result.push_back(e);
            }
        }
        return result;
    }

    /// Storage for T, created on first use.
    template <typename T>
    ComponentStorage<T>& Storage() {
        auto& slot = storages_[ComponentStorage<T>::TypeId()];
        if (!slot) {
            slot = std::make_unique<ComponentStorage<T>>();
        }
        return static_cast<ComponentStorage<T>&>(*slot);
    }

    template <typename T>
    [[nodiscard]] ComponentStorage<T>* FindStorage() {
        auto it = storages_.find(ComponentStorage<T>::TypeId());
        return it == storages_.end() ? nullptr
                                     : static_cast<ComponentStorage<T>*>(it->second.get());
    }

    template <typename T>
    [[nodiscard]] const ComponentStorage<T>* FindStorage() const {
        auto it = storages_.find(ComponentStorage<T>::TypeId());
        return it == storages_.end() ? nullptr
                                     : static_cast<const ComponentStorage<T>*>(it->second.get());
    }

    /// Copy every component @p from owns onto @p to.
    /// @return Number of components copied.
    std::size_t CopyComponents(Entity from, Entity to);

    // ── Metadata ─────────────────────────────────────────────────────

    bool SetName(Entity entity, std::string_view name);

    /// Display name, or an empty string for unknown entities.
    [[nodiscard]] std::string GetName(Entity entity) const;

    bool SetActive(Entity entity, bool active);
    [[nodiscard]] bool IsActive(Entity entity) const;

    bool AddTag(Entity entity, std::string_view tag);
    bool RemoveTag(Entity entity, std::string_view tag);
    [[nodiscard]] bool HasTag(Entity entity, std::string_view tag) const;

    /// Tags in lexical order.
    [[nodiscard]] std::vector<std::string> GetTags(Entity entity) const;

    /// First entity (in creation order) called @p name, or kNullEntity.
    [[nodiscard]] Entity FindByName(std::string_view name) const;

    [[nodiscard]] std::vector<Entity> EntitiesWithTag(std::string_view tag) const;

    /// Read-only record access for snapshotting and UI.
    [[nodiscard]] const EntityRecord* GetRecord(Entity entity) const;

    // ── Hierarchy ────────────────────────────────────────────────────

    /// Move @p entity under @p newParent (kNullEntity = top level).
    ///
    /// The entity is removed from its current parent's children and
    /// inserted at @p index in the new parent's list (clamped; kAppend
    /// appends).  Rejected, returning false with no change, when the
    /// entity is the root or unknown, when the parent is unknown, when
    /// the parent is the entity itself, or when the parent is one of the
    /// entity's descendants.
    bool SetParent(Entity entity, Entity newParent, std::size_t index = kAppend);

    /// Parent id; kNullEntity for top-level and unknown entities.
    [[nodiscard]] Entity GetParent(Entity entity) const;

    /// Ordered children.  `GetChildren(kNullEntity)` lists top-level entities.
    [[nodiscard]] std::vector<Entity> GetChildren(Entity entity) const;

    /// Position of @p entity among its siblings, or kAppend when unknown.
    [[nodiscard]] std::size_t GetChildIndex(Entity entity) const;

    /// Top-most ancestor (the entity itself when top-level).
    [[nodiscard]] Entity GetRoot(Entity entity) const;

    /// Ancestor chain from the top-level entity down to @p entity inclusive.
    [[nodiscard]] std::vector<Entity> GetPath(Entity entity) const;

    /// True when @p ancestor lies strictly above @p entity.  The root is an
    /// ancestor of every live entity.
    [[nodiscard]] bool IsAncestorOf(Entity ancestor, Entity entity) const;

private:
    Entity insertRecord(Entity entity, std::string_view name);
    EntityRecord* findRecord(Entity entity);
    [[nodiscard]] const EntityRecord* findRecord(Entity entity) const;

    /// Children list of @p parent (the root list for kNullEntity).
    std::vector<Entity>* childList(Entity parent);

    void detachFromParent(Entity entity, const EntityRecord& record);

    uint32_t nextId_ = 1;
    std::map<Entity, EntityRecord> records_;   ///< Ordered by id = creation order.
    std::vector<Entity> rootChildren_;
    std::unordered_map<ComponentTypeId, std::unique_ptr<IComponentStorage>> storages_;
};

} // namespace sedit::ecs
