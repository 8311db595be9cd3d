#pragma once

/// @file component_storage.hpp
/// @brief Sparse-set component storage.
///
/// ComponentStorage<T> gives O(1) add / get / has / remove and dense
/// iteration over every component of type T.  Removal swaps the last
/// element into the hole, so dense order is not stable across removals.

#include "sedit/ecs/entity.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <type_traits>
#include <utility>
#include <vector>

namespace sedit::ecs {

/// Key under which the registry keeps the storage of one component type.
using ComponentTypeId = uint32_t;

/// Type-erased view of a component pool so the registry can clean up and
/// copy components without knowing their type.
class IComponentStorage {
public:
    virtual ~IComponentStorage() = default;

    virtual void Remove(Entity entity) = 0;
    [[nodiscard]] virtual bool Has(Entity entity) const = 0;
    virtual void Clear() = 0;
    [[nodiscard]] virtual std::size_t Size() const = 0;

    /// Entity owning the component at dense @p index.
    [[nodiscard]] virtual Entity EntityAt(std::size_t index) const = 0;

    /// Snapshot of the owning entities in dense order.
    [[nodiscard]] virtual std::vector<Entity> Entities() const = 0;

    /// Copy the component of @p from onto @p to (overwriting).
    /// @return false when @p from has no component here.
    virtual bool CopyComponent(Entity from, Entity to) = 0;

protected:
    /// Hands out storage keys in first-use order.  Registries are
    /// single-threaded, and the keys are never persisted.
    static ComponentTypeId NextTypeId() noexcept {
        static ComponentTypeId next = 0;
        return next++;
    }
};

/// Sparse-set component storage.
///
/// Memory layout:
/// @code
///   sparse_  [entity.id] -> dense index  (or kInvalidIndex)
///   dense_   [index]     -> component data
///   entities_[index]     -> entity that owns dense_[index]
/// @endcode
///
/// Invariant: `sparse_[e] == i` iff `entities_[i] == e` iff `dense_[i]`
/// belongs to e.  Missing entities are reported with nullptr / false,
/// never by asserting.
template <typename T>
class ComponentStorage final : public IComponentStorage {
public:
    static_assert(std::is_copy_constructible_v<T>,
                  "Editor components must be copyable for snapshots and duplication");

    using value_type = T;
    using iterator = typename std::vector<T>::iterator;
    using const_iterator = typename std::vector<T>::const_iterator;

    // ── Capacity ────────────────────────────────────────────────────────

    [[nodiscard]] std::size_t Size() const override { return dense_.size(); }
    [[nodiscard]] bool Empty() const noexcept { return dense_.empty(); }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Store @p component for @p entity.
    ///
    /// If the entity already has a component it is overwritten in place;
    /// no second slot is created.
    /// @return Reference to the stored component.
    T& Add(Entity entity, T component = T{}) {
        if (Has(entity)) {
            auto& slot = dense_[sparse_[entity.id()]];
            slot = std::move(component);
            return slot;
        }

        const auto idx = static_cast<uint32_t>(dense_.size());
        ensureSparseSize(entity.id());
        sparse_[entity.id()] = idx;

        dense_.push_back(std::move(component));
        entities_.push_back(entity);
        return dense_.back();
    }

    /// Component owned by @p entity, or nullptr.
    [[nodiscard]] T* Get(Entity entity) {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] const T* Get(Entity entity) const {
        return Has(entity) ? &dense_[sparse_[entity.id()]] : nullptr;
    }

    [[nodiscard]] bool Has(Entity entity) const override {
        auto eid = entity.id();
        return eid < sparse_.size() && sparse_[eid] != kInvalidIndex;
    }

    /// Remove the component owned by @p entity; no-op if absent.
    void Remove(Entity entity) override {
        if (!Has(entity)) {
            return;
        }

        auto idx = sparse_[entity.id()];
        auto lastIdx = static_cast<uint32_t>(dense_.size() - 1);

        if (idx != lastIdx) {
            dense_[idx] = std::move(dense_[lastIdx]);
            entities_[idx] = entities_[lastIdx];
            sparse_[entities_[idx].id()] = idx;
        }

        dense_.pop_back();
        entities_.pop_back();
        sparse_[entity.id()] = kInvalidIndex;
    }

    void Clear() override {
        dense_.clear();
        entities_.clear();
        std::fill(sparse_.begin(), sparse_.end(), kInvalidIndex);
    }

    bool CopyComponent(Entity from, Entity to) override {
        const T* source = Get(from);
        if (source == nullptr) {
            return false;
        }
        // Copy before Add: growing dense_ would invalidate `source`.
        T copy = *source;
        Add(to, std::move(copy));
        return true;
    }

    // ── Iteration ───────────────────────────────────────────────────────

    iterator begin() noexcept { return dense_.begin(); }
    iterator end() noexcept { return dense_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return dense_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return dense_.end(); }

    [[nodiscard]] Entity EntityAt(std::size_t index) const override {
        return index < entities_.size() ? entities_[index] : kNullEntity;
    }

    /// Copy of the owner list, safe to iterate while mutating the storage.
    [[nodiscard]] std::vector<Entity> Entities() const override { return entities_; }

    /// Registry key for T, assigned the first time any registry touches T.
    [[nodiscard]] static ComponentTypeId TypeId() noexcept {
        static const ComponentTypeId id = NextTypeId();
        return id;
    }

private:
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();

    void ensureSparseSize(uint32_t entityId) {
        if (entityId >= sparse_.size()) {
            sparse_.resize(static_cast<std::size_t>(entityId) + 1, kInvalidIndex);
        }
    }

    std::vector<T> dense_;           ///< Packed component data.
    std::vector<Entity> entities_;   ///< dense index -> owner.
    std::vector<uint32_t> sparse_;   ///< entity id -> dense index.
};

} // namespace sedit::ecs
