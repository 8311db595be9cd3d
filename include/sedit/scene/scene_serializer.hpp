#pragma once

/// @file scene_serializer.hpp
/// @brief YAML scene persistence built on entity snapshots.
///
/// Document layout:
/// @code
///   version: 1
///   entities:
///     - name: Camera
///       active: true
///       tags: [main]
///       transform: {position: [0, 2, -5], rotation: [0, 0, 0], scale: [1, 1, 1]}
///       camera: {fov: 60, near: 0.1, far: 1000, main: true}
///       children: []
/// @endcode
/// Entities nest through `children`, top-level order is the root's child
/// order.  Ids are not written; loading allocates fresh ones.

#include "sedit/ecs/registry.hpp"
#include "sedit/foundation/editor_result.hpp"
#include "sedit/scene/entity_snapshot.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sedit::scene {

class SceneSerializer {
public:
    static constexpr int kFormatVersion = 1;

    /// Write every top-level subtree of @p registry to @p path.
    /// @return SceneSaveFailed when the file cannot be written.
    static foundation::EditorResult<void> Save(const ecs::Registry& registry,
                                               const std::filesystem::path& path);

    /// Replace the contents of @p registry with the scene in @p path.
    ///
    /// The document is parsed completely before the registry is touched,
    /// so a malformed file leaves the current scene intact.
    /// @return SceneLoadFailed (I/O) or SceneFormatError (content).
    static foundation::EditorResult<void> Load(ecs::Registry& registry,
                                               const std::filesystem::path& path);

    [[nodiscard]] static std::string ToString(const ecs::Registry& registry);

    static foundation::EditorResult<void> FromString(ecs::Registry& registry,
                                                     std::string_view text);

    /// Parse a document into top-level snapshots without touching a registry.
    static foundation::EditorResult<std::vector<EntitySnapshot>> Parse(std::string_view text);
};

} // namespace sedit::scene
