/// @file command_manager.cpp
/// @brief Undo/redo history implementation.

#include "sedit/command/command_manager.hpp"

#include "sedit/foundation/editor_logger.hpp"

namespace sedit::command {

using foundation::EditorError;
using foundation::EditorLogger;
using foundation::EditorResult;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

namespace {

void logCommand(LogLevel level, std::string_view what, const ICommand& command) {
    LogContext ctx;
    ctx.command = std::string(command.Name());
    if (command.Target().isValid()) {
        ctx.entityId = command.Target().id();
    }
    EditorLogger::instance().logWithContext(level, LogCategory::Command, what, ctx);
}

} // namespace

CommandManager::CommandManager(ecs::Registry& registry, std::size_t maxDepth)
    : registry_(registry), maxDepth_(maxDepth) {}

EditorResult<ecs::Entity> CommandManager::Execute(std::unique_ptr<ICommand> command) {
    if (!command) {
        SEDIT_LOG_ERROR(LogCategory::Command, "rejected null command");
        return EditorResult<ecs::Entity>::err(EditorError(ErrorCode::NullCommand, "null command"));
    }

    auto valid = command->Validate(registry_);
    if (!valid) {
        LogContext ctx;
        ctx.command = std::string(command->Name());
        ctx.extra["reason"] = std::string(valid.error().message());
        EditorLogger::instance().logWithContext(LogLevel::Error, LogCategory::Command,
                                                "rejected command", ctx);
        return EditorResult<ecs::Entity>::err(valid.error());
    }

    redoStack_.clear();

    command->Apply(registry_);
    logCommand(LogLevel::Debug, "executed", *command);
    const ecs::Entity target = command->Target();

    undoStack_.push_back(std::move(command));
    enforceDepth();
    return EditorResult<ecs::Entity>::ok(target);
}

bool CommandManager::Undo() {
    if (undoStack_.empty()) {
        return false;
    }

    auto command = std::move(undoStack_.back());
    undoStack_.pop_back();

    command->Revert(registry_);
    logCommand(LogLevel::Debug, "undo", *command);

    redoStack_.push_back(command->Clone());
    return true;
}

bool CommandManager::Redo() {
    if (redoStack_.empty()) {
        return false;
    }

    auto command = std::move(redoStack_.back());
    redoStack_.pop_back();

    command->Reapply(registry_);
    logCommand(LogLevel::Debug, "redo", *command);

    undoStack_.push_back(command->Clone());
    enforceDepth();
    return true;
}

void CommandManager::Clear() {
    undoStack_.clear();
    redoStack_.clear();
}

void CommandManager::SetMaxDepth(std::size_t maxDepth) {
    maxDepth_ = maxDepth;
    enforceDepth();
}

std::string_view CommandManager::UndoName() const {
    return undoStack_.empty() ? std::string_view{} : undoStack_.back()->Name();
}

std::string_view CommandManager::RedoName() const {
    return redoStack_.empty() ? std::string_view{} : redoStack_.back()->Name();
}

std::vector<std::string_view> CommandManager::UndoHistory() const {
    std::vector<std::string_view> names;
    names.reserve(undoStack_.size());
    for (const auto& command : undoStack_) {
        names.push_back(command->Name());
    }
    return names;
}

void CommandManager::enforceDepth() {
    while (undoStack_.size() > maxDepth_) {
        logCommand(LogLevel::Debug, "evicted oldest history entry", *undoStack_.front());
        undoStack_.pop_front();
    }
}

} // namespace sedit::command
