#pragma once

#include "block_engine/intent.hpp"

#include <vector>

namespace block {

enum class InteractionMode {
    Idle,
    Typing,
    Selecting,
    BlockSelection,
    Dragging,
    Navigating,
    Command,
    ComposingIme
};

const char* to_string(InteractionMode mode);

// Current interaction mode with a push/pop stack for transient modes
// (IME composition, drags).
class ModeManager {
public:
    InteractionMode current() const { return current_; }

    void set(InteractionMode mode);
    void push(InteractionMode mode);
    // Returns to the mode active before the last push; Idle when the stack is
    // empty.
    void pop();
    void reset();

    // Structural intents are refused while composing or dragging; the
    // command palette may only create or convert blocks.
    bool is_intent_allowed(IntentKind kind) const;

private:
    InteractionMode current_ = InteractionMode::Idle;
    std::vector<InteractionMode> stack_;
};

} // namespace block
