#include "block_engine/history.hpp"
#include "block_engine/log.hpp"

namespace block {

void History::push(HistoryEntry entry) {
    undo_.push_back(std::move(entry));
    redo_.clear();
    trim();
}

bool History::undo(BlockTree& tree, std::optional<CursorTarget>& cursor) {
    if (undo_.empty()) return false;
    HistoryEntry& e = undo_.back();
    BlockTree restored = e.command->undo(tree);
    log_debug("history", "undo %s", e.command->description().c_str());
    tree = std::move(restored);
    cursor = e.before;
    redo_.push_back(std::move(e));
    undo_.pop_back();
    return true;
}

bool History::redo(BlockTree& tree, std::optional<CursorTarget>& cursor) {
    if (redo_.empty()) return false;
    HistoryEntry& e = redo_.back();
    BlockTree replayed = e.command->apply(tree);
    log_debug("history", "redo %s", e.command->description().c_str());
    tree = std::move(replayed);
    cursor = e.after;
    undo_.push_back(std::move(e));
    redo_.pop_back();
    return true;
}

void History::clear() {
    undo_.clear();
    redo_.clear();
}

void History::set_limit(size_t limit) {
    limit_ = limit;
    trim();
}

void History::trim() {
    if (limit_ == 0 || undo_.size() <= limit_) return;
    size_t excess = undo_.size() - limit_;
    undo_.erase(undo_.begin(), undo_.begin() + static_cast<std::ptrdiff_t>(excess));
    log_debug("history", "dropped %zu oldest entries (limit %zu)", excess, limit_);
}

} // namespace block
