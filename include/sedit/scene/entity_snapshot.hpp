#pragma once

/// @file entity_snapshot.hpp
/// @brief Deep copies of entity subtrees.
///
/// A snapshot captures everything observable about an entity and its
/// descendants (metadata, every scene component, child order) and can be
/// replayed into a registry to rebuild the subtree.  Each node also
/// remembers the id it was captured from: undo/redo restores under those
/// ids so that other history entries keep addressing the same entities,
/// while duplication and scene loading allocate fresh ones.

#include "sedit/ecs/registry.hpp"
#include "sedit/scene/components.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sedit::scene {

struct EntitySnapshot {
    /// Id the node had when captured; null for nodes parsed from a file.
    ecs::Entity id;

    std::string name;
    bool active = true;
    std::vector<std::string> tags;

    std::optional<Transform> transform;
    std::optional<Renderer> renderer;
    std::optional<Camera> camera;
    std::optional<Light> light;
    std::optional<Script> script;

    std::vector<EntitySnapshot> children;

    /// Number of entities in this subtree, including the root.
    [[nodiscard]] std::size_t NodeCount() const;

    /// Compares observable content only; captured ids are ignored.
    bool operator==(const EntitySnapshot& other) const;
};

/// How RestoreSnapshot assigns ids to the nodes it rebuilds.
enum class RestoreIds {
    Fresh,     ///< Allocate new ids for every node.
    Original,  ///< Reuse each node's captured id; fresh if it is null or taken.
};

/// Capture @p entity and its descendants.
///
/// Cached transform matrices are not state: captured transforms are
/// stored dirty with identity matrices.
/// @return std::nullopt for unknown entities.
[[nodiscard]] std::optional<EntitySnapshot> CaptureSnapshot(const ecs::Registry& registry,
                                                            ecs::Entity entity);

/// Rebuild @p snapshot under @p parent at sibling position @p index.
///
/// @return The new subtree root, or kNullEntity if @p parent is unknown.
ecs::Entity RestoreSnapshot(ecs::Registry& registry, const EntitySnapshot& snapshot,
                            ecs::Entity parent,
                            std::size_t index = ecs::Registry::kAppend,
                            RestoreIds ids = RestoreIds::Fresh);

} // namespace sedit::scene
