#pragma once

#include "block_engine/engine.hpp"
#include "block_engine/intent.hpp"
#include "block_engine/key_event.hpp"
#include "block_engine/rules.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace block {

// The rendered text surface. It keeps its own mirror of the tree, addressed
// by its own positions; the engine only talks to it through this interface.
class HostSurface {
public:
    virtual ~HostSurface() = default;

    // Block mirrored at `position`, or nullopt when the surface has not caught
    // up yet.
    virtual std::optional<BlockId> block_at(size_t position) const = 0;
    // Mirror a committed tree.
    virtual void sync(const BlockTree& tree) = 0;
    virtual void place_cursor(const CursorTarget& target) = 0;
};

struct KeyResult {
    bool handled = false;   // false: let the host run its default behaviour
    bool deferred = false;  // consumed while the engine or surface was not ready
    std::string ruleId;     // first rule that produced the outcome
    std::string reason;     // why a handled key did nothing
};

// Key event -> rules -> intents -> one command -> sync -> caret.
class KeyboardController {
public:
    KeyboardController(Engine& engine, HostSurface& host, Keymap keymap = default_keymap())
        : engine_(engine), host_(host), keymap_(std::move(keymap)) {}

    KeyResult handle_key(const KeyEvent& event);

    // The single path that mutates structure for a user action: resolve all
    // intents into one undo step, commit it, let the surface mirror it, then
    // place the caret once.
    KeyResult perform_structural_edit(const std::vector<Intent>& intents,
                                      const std::optional<CursorTarget>& cursor);
    KeyResult perform_structural_delete(const std::vector<BlockId>& ids);

    bool undo();
    bool redo();

    Keymap& keymap() { return keymap_; }

private:
    KeyResult defer(const char* why, const KeyEvent& event);

    Engine& engine_;
    HostSurface& host_;
    Keymap keymap_;
};

} // namespace block
