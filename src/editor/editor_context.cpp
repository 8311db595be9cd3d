/// @file editor_context.cpp
/// @brief EditorContext lifecycle, actions and scene management.

#include "sedit/editor/editor_context.hpp"

#include "sedit/command/commands.hpp"
#include "sedit/foundation/editor_logger.hpp"
#include "sedit/scene/scene_serializer.hpp"

#include <memory>
#include <utility>
#include <vector>

namespace sedit::editor {

using foundation::EditorLogger;
using foundation::EditorResult;
using foundation::ErrorCode;
using foundation::LogCategory;

EditorContext::EditorContext()
    : commands_(registry_), transforms_(registry_) {}

EditorContext::~EditorContext() = default;

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

EditorResult<void> EditorContext::Init() {
    auto applied = applyConfig();
    if (!applied) {
        return applied;
    }
    initialized_ = true;
    SEDIT_LOG_INFO(LogCategory::Core, "editor core initialized");
    return EditorResult<void>::ok();
}

EditorResult<void> EditorContext::Init(const std::filesystem::path& configPath) {
    auto loaded = config_.load(configPath);
    if (!loaded) {
        SEDIT_LOG_ERROR(LogCategory::Core, std::string(loaded.error().message()));
        return loaded;
    }
    return Init();
}

void EditorContext::Shutdown() {
    commands_.Clear();
    registry_.Clear();
    selected_ = ecs::kNullEntity;
    if (initialized_) {
        SEDIT_LOG_INFO(LogCategory::Core, "editor core shut down");
    }
    initialized_ = false;
}

EditorResult<void> EditorContext::applyConfig() {
    // Validate everything before touching the logger or the history, so a
    // rejected config leaves no partial effect behind.
    std::vector<std::pair<LogCategory, foundation::LogLevel>> levels;
    for (const auto& key : config_.keysUnder(kLoggingPrefix)) {
        auto categoryName = std::string_view(key).substr(std::string_view(kLoggingPrefix).size() + 1);
        auto category = foundation::parseLogCategory(categoryName);
        auto levelName = config_.get<std::string>(key);
        auto level = levelName ? foundation::parseLogLevel(levelName.value()) : std::nullopt;
        if (!category || !level) {
            return EditorResult<void>::err(ErrorCode::ConfigTypeMismatch,
                                           "invalid logging entry: " + key);
        }
        levels.emplace_back(*category, *level);
    }

    if (config_.hasKey(kUndoDepthKey)) {
        auto depth = config_.get<int>(kUndoDepthKey);
        if (!depth || depth.value() < 0) {
            return EditorResult<void>::err(
                ErrorCode::ConfigTypeMismatch,
                std::string(kUndoDepthKey) + " must be a non-negative integer");
        }
    }

    for (const auto& [category, level] : levels) {
        EditorLogger::instance().setCategoryLevel(category, level);
    }
    applyUndoDepth();

    duplicateSuffix_ = config_.getOr<std::string>(kDuplicateSuffixKey, " (copy)");

    if (!depthWatchRegistered_) {
        config_.watch(kUndoDepthKey, [this](std::string_view) { applyUndoDepth(); });
        depthWatchRegistered_ = true;
    }
    return EditorResult<void>::ok();
}

void EditorContext::applyUndoDepth() {
    auto depth = config_.getOr<int>(kUndoDepthKey,
                                    static_cast<int>(command::CommandManager::kDefaultMaxDepth));
    if (depth < 0) {
        SEDIT_LOG_WARN(LogCategory::Config, "ignoring negative undo depth");
        return;
    }
    commands_.SetMaxDepth(static_cast<std::size_t>(depth));
}

// ═══════════════════════════════════════════════════════════════════════════
// Actions
// ═══════════════════════════════════════════════════════════════════════════

EditorResult<ecs::Entity> EditorContext::CreateNode(std::string name, ecs::Entity parent) {
    return commands_.Execute(std::make_unique<command::AddNodeCommand>(std::move(name), parent));
}

EditorResult<void> EditorContext::DeleteNode(ecs::Entity entity) {
    return EditorResult<void>::from(
        commands_.Execute(std::make_unique<command::DeleteNodeCommand>(entity)));
}

EditorResult<void> EditorContext::RenameEntity(ecs::Entity entity, std::string name) {
    return EditorResult<void>::from(
        commands_.Execute(std::make_unique<command::RenameEntityCommand>(entity, std::move(name))));
}

EditorResult<ecs::Entity> EditorContext::DuplicateNode(ecs::Entity entity) {
    return commands_.Execute(
        std::make_unique<command::DuplicateNodeCommand>(entity, duplicateSuffix_));
}

EditorResult<void> EditorContext::SetTransform(ecs::Entity entity, const scene::Transform& value) {
    return EditorResult<void>::from(
        commands_.Execute(std::make_unique<command::ModifyTransformCommand>(entity, value)));
}

EditorResult<void> EditorContext::Reparent(ecs::Entity entity, ecs::Entity newParent,
                                           std::size_t index) {
    return EditorResult<void>::from(commands_.Execute(
        std::make_unique<command::ReparentEntityCommand>(entity, newParent, index)));
}

EditorResult<void> EditorContext::SetActive(ecs::Entity entity, bool active) {
    return EditorResult<void>::from(
        commands_.Execute(std::make_unique<command::SetActiveCommand>(entity, active)));
}

bool EditorContext::Undo() {
    return commands_.Undo();
}

bool EditorContext::Redo() {
    return commands_.Redo();
}

// ═══════════════════════════════════════════════════════════════════════════
// Scene
// ═══════════════════════════════════════════════════════════════════════════

void EditorContext::NewScene() {
    commands_.Clear();
    registry_.Clear();
    selected_ = ecs::kNullEntity;
}

EditorResult<void> EditorContext::LoadScene(const std::filesystem::path& path) {
    auto loaded = scene::SceneSerializer::Load(registry_, path);
    if (!loaded) {
        SEDIT_LOG_ERROR(LogCategory::Scene, std::string(loaded.error().message()));
        return loaded;
    }
    // Stored commands refer to ids from the previous scene.
    commands_.Clear();
    selected_ = ecs::kNullEntity;
    return loaded;
}

EditorResult<void> EditorContext::SaveScene(const std::filesystem::path& path) const {
    return scene::SceneSerializer::Save(registry_, path);
}

std::size_t EditorContext::UpdateTransforms() {
    return transforms_.Update();
}

ecs::Entity EditorContext::Selected() const {
    return registry_.IsAlive(selected_) ? selected_ : ecs::kNullEntity;
}

} // namespace sedit::editor
