/// @file command_bus.cpp
/// @brief CommandBus implementation.

#include "nrt/command/command_bus.hpp"

#include "nrt/foundation/runtime_logger.hpp"

namespace nrt::command {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::StoryError;
using foundation::StoryResult;

CommandBus::CommandBus(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

StoryResult<void> CommandBus::execute(std::unique_ptr<Command> command, story::StoryAsset& doc) {
    if (!command) {
        return StoryResult<void>::err(
            StoryError(ErrorCode::InvalidArgument, "null command"));
    }

    NRT_LOG_DEBUG(LogCategory::Command, "Executing: " + std::string(command->name()));
    auto next = command->apply(doc);
    if (next.hasError()) {
        NRT_LOG_WARN(LogCategory::Command, std::string(command->name()) + " rejected: " +
                                               std::string(next.error().message()));
        return StoryResult<void>::err(next.error());
    }

    doc = std::move(next).value();
    undo_.push_back(std::move(command));
    redo_.clear();

    while (undo_.size() > capacity_) {
        undo_.pop_front();
    }
    return StoryResult<void>::ok();
}

StoryResult<void> CommandBus::undo(story::StoryAsset& doc) {
    if (undo_.empty()) {
        return StoryResult<void>::err(StoryError(ErrorCode::NothingToUndo, "nothing to undo"));
    }

    auto& command = undo_.back();
    NRT_LOG_DEBUG(LogCategory::Command, "Undoing: " + std::string(command->name()));
    auto previous = command->revert(doc);
    if (previous.hasError()) {
        NRT_LOG_WARN(LogCategory::Command, "Undo of " + std::string(command->name()) +
                                               " failed: " +
                                               std::string(previous.error().message()));
        return StoryResult<void>::err(previous.error());
    }

    doc = std::move(previous).value();
    redo_.push_back(std::move(command));
    undo_.pop_back();
    return StoryResult<void>::ok();
}

StoryResult<void> CommandBus::redo(story::StoryAsset& doc) {
    if (redo_.empty()) {
        return StoryResult<void>::err(StoryError(ErrorCode::NothingToRedo, "nothing to redo"));
    }

    auto& command = redo_.back();
    NRT_LOG_DEBUG(LogCategory::Command, "Redoing: " + std::string(command->name()));
    auto next = command->apply(doc);
    if (next.hasError()) {
        NRT_LOG_WARN(LogCategory::Command, "Redo of " + std::string(command->name()) +
                                               " failed: " + std::string(next.error().message()));
        return StoryResult<void>::err(next.error());
    }

    doc = std::move(next).value();
    undo_.push_back(std::move(command));
    redo_.pop_back();
    while (undo_.size() > capacity_) {
        undo_.pop_front();
    }
    return StoryResult<void>::ok();
}

std::optional<std::string> CommandBus::nextUndoName() const {
    if (undo_.empty()) {
        return std::nullopt;
    }
    return std::string(undo_.back()->name());
}

std::optional<std::string> CommandBus::nextRedoName() const {
    if (redo_.empty()) {
        return std::nullopt;
    }
    return std::string(redo_.back()->name());
}

void CommandBus::clear() {
    undo_.clear();
    redo_.clear();
}

} // namespace nrt::command
