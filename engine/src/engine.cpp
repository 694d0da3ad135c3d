#include "block_engine/engine.hpp"
#include "block_engine/errors.hpp"
#include "block_engine/laws.hpp"
#include "block_engine/log.hpp"
#include "block_engine/tree_utils.hpp"

#include <algorithm>

namespace block {

static std::unique_ptr<IdGenerator> default_ids(std::unique_ptr<IdGenerator> ids, const std::string& prefix) {
    if (ids) return ids;
    return std::make_unique<SequentialIdGenerator>(prefix);
}

static std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += "; ";
        out += p;
    }
    return out;
}

Engine::Engine(EngineConfig config, std::unique_ptr<IdGenerator> ids)
    : config_(std::move(config)),
      ids_(default_ids(std::move(ids), config_.idPrefix)),
      history_(config_.historyLimit),
      resolver_(config_.schema, *ids_, config_.maxDepth) {
    set_log_level(config_.logLevel);
}

void Engine::load(BlockTree tree) {
    auto problems = check_invariants(tree);
    if (!problems.empty()) {
        log_warn("engine", "rejected malformed tree: %s", join(problems).c_str());
        throw InvariantViolation("malformed tree: " + join(problems));
    }
    tree_ = std::move(tree);
    history_.clear();
    cursor_.reset();
    modes_.reset();
    log_info("engine", "loaded document with %zu blocks", tree_->nodes.size() - 1);
    notify();
}

void Engine::new_document() {
    load(make_document(*ids_));
}

void Engine::close() {
    tree_.reset();
    history_.clear();
    cursor_.reset();
    modes_.reset();
}

const BlockTree& Engine::tree() const {
    if (!tree_) throw EngineNotReady("no document loaded");
    return *tree_;
}

void Engine::dispatch(std::unique_ptr<Command> command) {
    std::optional<CursorTarget> before = cursor_;
    dispatch(std::move(command), before, cursor_);
}

void Engine::dispatch(std::unique_ptr<Command> command, std::optional<CursorTarget> before,
                      std::optional<CursorTarget> after) {
    if (!command) return;
    BlockTree next = command->apply(tree());
    if (!command->changed()) {
        log_debug("engine", "dispatch %s: no change", command->description().c_str());
        return;
    }
    auto problems = check_invariants(next);
    if (!problems.empty()) {
        throw InvariantViolation(command->description() + " would break the tree: " + join(problems));
    }
    log_debug("engine", "dispatch %s", command->description().c_str());
    tree_ = std::move(next);
    if (after) cursor_ = after;
    history_.push({ std::move(command), std::move(before), std::move(after) });
    notify();
}

bool Engine::undo() {
    if (!tree_) return false;
    std::optional<CursorTarget> cursor = cursor_;
    try {
        if (!history_.undo(*tree_, cursor)) return false;
    } catch (const Error& e) {
        log_error("history", "undo failed, history kept: %s", e.what());
        return false;
    }
    cursor_ = cursor;
    notify();
    return true;
}

bool Engine::redo() {
    if (!tree_) return false;
    std::optional<CursorTarget> cursor = cursor_;
    try {
        if (!history_.redo(*tree_, cursor)) return false;
    } catch (const Error& e) {
        log_error("history", "redo failed, history kept: %s", e.what());
        return false;
    }
    cursor_ = cursor;
    notify();
    return true;
}

std::optional<DeleteOutcome> Engine::delete_block(const BlockId& id) {
    try {
        auto cmd = std::make_unique<DeleteBlockCommand>(id);
        BlockTree preview = cmd->apply(tree());
        CursorTarget after = cursor_after_delete(preview, cmd->parent_id(), cmd->index(),
                                                 cmd->outcome().promotedChildren);
        DeleteOutcome outcome = cmd->outcome();
        dispatch(std::move(cmd), cursor_, after);
        return outcome;
    } catch (const Error& e) {
        log_warn("engine", "delete '%s' rejected: %s", id.c_str(), e.what());
        return std::nullopt;
    }
}

const BlockNode* Engine::get_block(const BlockId& id) const {
    if (!tree_) return nullptr;
    auto it = tree_->nodes.find(id);
    if (it == tree_->nodes.end()) return nullptr;
    return &it->second;
}

bool Engine::has_children(const BlockId& id) const {
    const BlockNode* n = get_block(id);
    return n && !n->children.empty();
}

size_t Engine::on_change(Listener listener) {
    size_t id = nextListenerId_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void Engine::remove_listener(size_t id) {
    listeners_.erase(std::remove_if(listeners_.begin(), listeners_.end(),
                                    [id](const std::pair<size_t, Listener>& l) { return l.first == id; }),
                     listeners_.end());
}

void Engine::notify() {
    // copy: a listener may unsubscribe itself
    auto listeners = listeners_;
    for (const auto& l : listeners) {
        if (l.second) l.second(*this);
    }
}

} // namespace block
