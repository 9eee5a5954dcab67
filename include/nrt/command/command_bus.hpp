#pragma once

/// @file command_bus.hpp
/// @brief Capacity-bounded undo/redo stacks over document commands.

#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <string>

#include "nrt/command/command.hpp"

namespace nrt::command {

/// Editor-facing undo/redo history.
///
/// execute() applies a command, pushes it on the undo stack and clears the
/// redo stack. Past the capacity the oldest undoable entry is dropped. A
/// command whose apply() or revert() fails leaves the document and both
/// stacks untouched.
///
/// Usage:
/// @code
///   CommandBus history(50);
///   history.execute(std::make_unique<AddNodeCommand>(segId, node), doc);
///   history.undo(doc);
///   history.redo(doc);
/// @endcode
class CommandBus {
public:
    static constexpr std::size_t kDefaultCapacity = 50;

    explicit CommandBus(std::size_t capacity = kDefaultCapacity);

    CommandBus(const CommandBus&) = delete;
    CommandBus& operator=(const CommandBus&) = delete;

    foundation::StoryResult<void> execute(std::unique_ptr<Command> command,
                                          story::StoryAsset& doc);

    /// @return NothingToUndo when the undo stack is empty.
    foundation::StoryResult<void> undo(story::StoryAsset& doc);

    /// @return NothingToRedo when the redo stack is empty.
    foundation::StoryResult<void> redo(story::StoryAsset& doc);

    [[nodiscard]] bool canUndo() const noexcept { return !undo_.empty(); }
    [[nodiscard]] bool canRedo() const noexcept { return !redo_.empty(); }

    [[nodiscard]] std::size_t undoCount() const noexcept { return undo_.size(); }
    [[nodiscard]] std::size_t redoCount() const noexcept { return redo_.size(); }

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Name of the command undo() would revert.
    [[nodiscard]] std::optional<std::string> nextUndoName() const;

    [[nodiscard]] std::optional<std::string> nextRedoName() const;

    void clear();

private:
    std::size_t capacity_;
    std::deque<std::unique_ptr<Command>> undo_;
    std::deque<std::unique_ptr<Command>> redo_;
};

} // namespace nrt::command
