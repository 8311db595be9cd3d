#pragma once

/// @file editor_context.hpp
/// @brief Top-level owner of the editor core.
///
/// EditorContext owns the configuration, the registry and the command
/// history and hands them by reference to everything that needs them.
/// UI code talks to the scene through the action methods below, each of
/// which builds a command and runs it through the CommandManager, so
/// every edit is undoable.  The query accessors are for read-only use
/// (scene tree, inspector, viewport).

#include "sedit/command/command_manager.hpp"
#include "sedit/ecs/registry.hpp"
#include "sedit/foundation/config_manager.hpp"
#include "sedit/foundation/editor_result.hpp"
#include "sedit/scene/components.hpp"
#include "sedit/scene/transform_system.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace sedit::editor {

class EditorContext {
public:
    static constexpr const char* kUndoDepthKey = "editor.undo_depth";
    static constexpr const char* kDuplicateSuffixKey = "editor.duplicate_suffix";
    static constexpr const char* kLoggingPrefix = "logging";

    EditorContext();
    ~EditorContext();

    // Commands and systems hold references into this object.
    EditorContext(const EditorContext&) = delete;
    EditorContext& operator=(const EditorContext&) = delete;
    EditorContext(EditorContext&&) = delete;
    EditorContext& operator=(EditorContext&&) = delete;

    // ── Lifecycle ────────────────────────────────────────────────────

    /// Initialize with built-in defaults.
    foundation::EditorResult<void> Init();

    /// Load @p configPath and initialize from it.
    /// @return ConfigLoadFailed when the file cannot be read; the context
    ///         stays uninitialized.
    foundation::EditorResult<void> Init(const std::filesystem::path& configPath);

    /// Drop the history and the scene.  Init may be called again.
    void Shutdown();

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

    // ── Owned subsystems ─────────────────────────────────────────────

    [[nodiscard]] ecs::Registry& GetRegistry() noexcept { return registry_; }
    [[nodiscard]] const ecs::Registry& GetRegistry() const noexcept { return registry_; }
    [[nodiscard]] command::CommandManager& GetCommands() noexcept { return commands_; }
    [[nodiscard]] foundation::ConfigManager& GetConfig() noexcept { return config_; }
    [[nodiscard]] const scene::TransformSystem& GetTransforms() const noexcept { return transforms_; }

    // ── Editor actions (all undoable) ────────────────────────────────

    foundation::EditorResult<ecs::Entity> CreateNode(std::string name,
                                                     ecs::Entity parent = ecs::kNullEntity);
    foundation::EditorResult<void> DeleteNode(ecs::Entity entity);
    foundation::EditorResult<void> RenameEntity(ecs::Entity entity, std::string name);
    foundation::EditorResult<ecs::Entity> DuplicateNode(ecs::Entity entity);
    foundation::EditorResult<void> SetTransform(ecs::Entity entity, const scene::Transform& value);
    foundation::EditorResult<void> Reparent(ecs::Entity entity, ecs::Entity newParent,
                                            std::size_t index = ecs::Registry::kAppend);
    foundation::EditorResult<void> SetActive(ecs::Entity entity, bool active);

    bool Undo();
    bool Redo();

    // ── Scene ────────────────────────────────────────────────────────

    /// Empty the scene and the history.
    void NewScene();

    /// Replace the scene from a file; the history is cleared on success.
    foundation::EditorResult<void> LoadScene(const std::filesystem::path& path);

    foundation::EditorResult<void> SaveScene(const std::filesystem::path& path) const;

    /// Refresh cached world matrices; call once per frame.
    std::size_t UpdateTransforms();

    // ── Selection ────────────────────────────────────────────────────

    void Select(ecs::Entity entity) noexcept { selected_ = entity; }

    /// Selected entity, or kNullEntity once it no longer exists.
    [[nodiscard]] ecs::Entity Selected() const;

    [[nodiscard]] const std::string& DuplicateSuffix() const noexcept { return duplicateSuffix_; }

private:
    foundation::EditorResult<void> applyConfig();
    void applyUndoDepth();

    foundation::ConfigManager config_;
    ecs::Registry registry_;
    command::CommandManager commands_;
    scene::TransformSystem transforms_;

    ecs::Entity selected_;
    std::string duplicateSuffix_ = " (copy)";
    bool initialized_ = false;
    bool depthWatchRegistered_ = false;
};

} // namespace sedit::editor
