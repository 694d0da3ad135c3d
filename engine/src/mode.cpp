#include "block_engine/mode.hpp"
#include "block_engine/log.hpp"

namespace block {

const char* to_string(InteractionMode mode) {
    switch (mode) {
        case InteractionMode::Idle: return "idle";
        case InteractionMode::Typing: return "typing";
        case InteractionMode::Selecting: return "selecting";
        case InteractionMode::BlockSelection: return "block_selection";
        case InteractionMode::Dragging: return "dragging";
        case InteractionMode::Navigating: return "navigating";
        case InteractionMode::Command: return "command";
        case InteractionMode::ComposingIme: return "composing_ime";
    }
    return "unknown";
}

void ModeManager::set(InteractionMode mode) {
    if (mode == current_) return;
    log_debug("engine", "mode %s -> %s", to_string(current_), to_string(mode));
    current_ = mode;
}

void ModeManager::push(InteractionMode mode) {
    stack_.push_back(current_);
    set(mode);
}

void ModeManager::pop() {
    if (stack_.empty()) {
        set(InteractionMode::Idle);
        return;
    }
    InteractionMode prev = stack_.back();
    stack_.pop_back();
    set(prev);
}

void ModeManager::reset() {
    stack_.clear();
    set(InteractionMode::Idle);
}

bool ModeManager::is_intent_allowed(IntentKind kind) const {
    if (kind == IntentKind::Noop) return true;
    switch (current_) {
        case InteractionMode::ComposingIme:
        case InteractionMode::Dragging:
            return false;
        case InteractionMode::Command:
            return kind == IntentKind::CreateSiblingAbove || kind == IntentKind::CreateSiblingBelow ||
                   kind == IntentKind::CreateChild || kind == IntentKind::ConvertBlock;
        default:
            return true;
    }
}

} // namespace block
