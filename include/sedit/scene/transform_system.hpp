#pragma once

/// @file transform_system.hpp
/// @brief Propagates local transforms down the hierarchy into world matrices.

#include "sedit/ecs/registry.hpp"
#include "sedit/scene/components.hpp"

#include <cstddef>

namespace sedit::scene {

/// Recomputes cached Transform matrices.
///
/// Walks the hierarchy from the root's children.  A transform whose
/// `dirty` flag is set gets a fresh `local` matrix; its `world` matrix,
/// and the world matrices of everything below it, are then rebuilt as
/// `parentWorld * local`.  An entity without a Transform passes its
/// parent's world matrix straight through to its children.
///
/// Commands that move an entity to a new parent mark its Transform dirty
/// so the next Update picks up the new parent chain.
class TransformSystem {
public:
    /// The registry must outlive this system.
    explicit TransformSystem(ecs::Registry& registry) : registry_(registry) {}

    /// Rebuild stale matrices; with @p force every matrix is rebuilt.
    /// @return Number of world matrices written.
    std::size_t Update(bool force = false);

    /// World-space position of @p entity as of the last Update; the
    /// local position for entities that have never been updated, and the
    /// origin for entities without a Transform.
    [[nodiscard]] Vector3 WorldPosition(ecs::Entity entity) const;

private:
    std::size_t updateSubtree(ecs::Entity entity, const Mat4& parentWorld,
                              bool parentChanged);

    ecs::Registry& registry_;
};

} // namespace sedit::scene
