#include "block_engine/keyboard.hpp"
#include "block_engine/errors.hpp"
#include "block_engine/log.hpp"
#include "block_engine/tree_utils.hpp"

#include <algorithm>

namespace block {

KeyResult KeyboardController::defer(const char* why, const KeyEvent& event) {
    log_info("engine", "%s at position %zu deferred: %s", to_string(event.key), event.position, why);
    KeyResult r;
    r.handled = true;
    r.deferred = true;
    r.reason = why;
    return r;
}

KeyResult KeyboardController::handle_key(const KeyEvent& event) {
    const RuleEngine* rules = keymap_.for_event(event);
    if (!rules) return KeyResult{};

    if (!engine_.ready()) return defer("engine not ready", event);
    const BlockTree& tree = engine_.tree();

    auto blockId = host_.block_at(event.position);
    if (!blockId || !contains(tree, *blockId) || is_root(tree, *blockId)) {
        return defer("caret block not mirrored", event);
    }

    std::vector<BlockId> selection;
    for (size_t pos : event.selectedPositions) {
        auto id = host_.block_at(pos);
        if (!id || !contains(tree, *id) || is_root(tree, *id)) return defer("selected block not mirrored", event);
        if (std::find(selection.begin(), selection.end(), *id) == selection.end()) selection.push_back(*id);
    }
    if (selection.size() > 1) {
        auto order = document_order(tree);
        auto rank = [&](const BlockId& id) { return std::find(order.begin(), order.end(), id) - order.begin(); };
        std::sort(selection.begin(), selection.end(),
                  [&](const BlockId& a, const BlockId& b) { return rank(a) < rank(b); });
    }

    RuleContext ctx{ tree, engine_.schema(), event, *blockId, selection };
    Evaluation ev = rules->evaluate(ctx);
    if (!ev.matched) return KeyResult{};

    if (ev.intents.empty()) {
        KeyResult r;
        r.handled = ev.handled;
        r.ruleId = ev.ruleIds.front();
        if (ev.caret) {
            // navigation: caret only, nothing to commit
            engine_.set_cursor(*ev.caret);
            host_.place_cursor(*ev.caret);
        }
        return r;
    }

    CursorTarget caret{ *blockId, Placement::Offset, event.offset };
    KeyResult r = perform_structural_edit(ev.intents, caret);
    r.ruleId = ev.ruleIds.front();
    return r;
}

KeyResult KeyboardController::perform_structural_edit(const std::vector<Intent>& intents,
                                                      const std::optional<CursorTarget>& cursor) {
    KeyResult r;
    r.handled = true;
    try {
        Resolution res = engine_.resolver().resolve_all(intents, engine_.tree(), cursor, engine_.modes());
        if (!res.command) {
            if (res.refused) r.reason = std::string("refused in mode ") + to_string(engine_.modes().current());
            else if (res.rejected) r.reason = "rejected";
            else r.reason = "no change";
            return r;
        }
        engine_.dispatch(std::move(res.command), cursor, res.cursor);
        // commit, then reposition
        host_.sync(engine_.tree());
        if (res.cursor) host_.place_cursor(*res.cursor);
    } catch (const EngineNotReady& e) {
        log_info("engine", "structural edit deferred: %s", e.what());
        r.deferred = true;
        r.reason = e.what();
    } catch (const Error& e) {
        log_warn("engine", "structural edit rejected: %s", e.what());
        r.reason = e.what();
    }
    return r;
}

KeyResult KeyboardController::perform_structural_delete(const std::vector<BlockId>& ids) {
    std::vector<Intent> intents;
    intents.reserve(ids.size());
    for (const auto& id : ids) intents.push_back(delete_intent(id));
    return perform_structural_edit(intents, engine_.cursor());
}

bool KeyboardController::undo() {
    if (!engine_.undo()) return false;
    host_.sync(engine_.tree());
    if (engine_.cursor()) host_.place_cursor(*engine_.cursor());
    return true;
}

bool KeyboardController::redo() {
    if (!engine_.redo()) return false;
    host_.sync(engine_.tree());
    if (engine_.cursor()) host_.place_cursor(*engine_.cursor());
    return true;
}

} // namespace block
