#pragma once

#include "block_engine/commands.hpp"
#include "block_engine/config.hpp"
#include "block_engine/history.hpp"
#include "block_engine/intent.hpp"
#include "block_engine/mode.hpp"
#include "block_engine/resolver.hpp"
#include "block_engine/types.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace block {

// Owns the document tree. Every structural change goes through dispatch(),
// which applies a command and records it for undo.
class Engine {
public:
    using Listener = std::function<void(const Engine&)>;

    // A null generator gets a SequentialIdGenerator with config.idPrefix.
    explicit Engine(EngineConfig config = EngineConfig{}, std::unique_ptr<IdGenerator> ids = nullptr);

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Takes ownership of an existing tree; throws InvariantViolation when it is
    // malformed. Clears history and cursor.
    void load(BlockTree tree);
    void new_document();
    void close();
    bool ready() const { return tree_.has_value(); }

    // Throws EngineNotReady before load/new_document.
    const BlockTree& tree() const;

    // Applies `command` to the current tree and pushes it on the undo stack.
    // A command that throws leaves tree and history untouched.
    void dispatch(std::unique_ptr<Command> command);
    void dispatch(std::unique_ptr<Command> command, std::optional<CursorTarget> before,
                  std::optional<CursorTarget> after);

    // False when there was nothing to undo/redo.
    bool undo();
    bool redo();
    bool can_undo() const { return history_.can_undo(); }
    bool can_redo() const { return history_.can_redo(); }
    void clear_history() { history_.clear(); }
    const History& history() const { return history_; }

    // Child-promoting delete through the command stack; nullopt when the
    // block is missing, is the root, or is the document's last block.
    std::optional<DeleteOutcome> delete_block(const BlockId& id);

    const BlockNode* get_block(const BlockId& id) const;
    bool has_children(const BlockId& id) const;

    const std::optional<CursorTarget>& cursor() const { return cursor_; }
    void set_cursor(std::optional<CursorTarget> cursor) { cursor_ = std::move(cursor); }

    ModeManager& modes() { return modes_; }
    const ModeManager& modes() const { return modes_; }
    IntentResolver& resolver() { return resolver_; }

    size_t on_change(Listener listener);
    void remove_listener(size_t id);

    const EngineConfig& config() const { return config_; }
    const BlockSchema& schema() const { return config_.schema; }
    IdGenerator& ids() { return *ids_; }

private:
    void notify();

    EngineConfig config_;
    std::unique_ptr<IdGenerator> ids_;
    std::optional<BlockTree> tree_;
    History history_;
    ModeManager modes_;
    IntentResolver resolver_;
    std::optional<CursorTarget> cursor_;
    std::vector<std::pair<size_t, Listener>> listeners_;
    size_t nextListenerId_ = 1;
};

} // namespace block
