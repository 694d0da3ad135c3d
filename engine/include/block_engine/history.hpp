#pragma once

#include "block_engine/commands.hpp"
#include "block_engine/intent.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace block {

struct HistoryEntry {
    std::unique_ptr<Command> command;
    std::optional<CursorTarget> before;
    std::optional<CursorTarget> after;
};

// Bounded undo/redo stacks of applied commands.
class History {
public:
    explicit History(size_t limit = 100) : limit_(limit) {}

    // Records an already-applied command. Clears the redo stack; drops the
    // oldest entry past the limit.
    void push(HistoryEntry entry);

    // Both return false (and leave tree/cursor alone) on an empty stack. A
    // throwing command leaves the entry where it was.
    bool undo(BlockTree& tree, std::optional<CursorTarget>& cursor);
    bool redo(BlockTree& tree, std::optional<CursorTarget>& cursor);

    bool can_undo() const { return !undo_.empty(); }
    bool can_redo() const { return !redo_.empty(); }
    size_t undo_size() const { return undo_.size(); }
    size_t redo_size() const { return redo_.size(); }

    void clear();
    void set_limit(size_t limit);
    size_t limit() const { return limit_; }

private:
    void trim();

    size_t limit_;
    std::vector<HistoryEntry> undo_;
    std::vector<HistoryEntry> redo_;
};

} // namespace block
