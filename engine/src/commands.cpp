#include "block_engine/commands.hpp"
#include "block_engine/tree_utils.hpp"

namespace block {

// --- DeleteBlockCommand ---

BlockTree DeleteBlockCommand::apply(const BlockTree& tree) {
    DeleteResult r = delete_block(tree, id_);
    deleted_ = std::move(r.deletedBlock);
    parentId_ = std::move(r.parentId);
    index_ = r.index;
    promoted_ = std::move(r.promotedChildren);
    return std::move(r.tree);
}

BlockTree DeleteBlockCommand::undo(const BlockTree& tree) {
    return undelete_block(tree, deleted_, parentId_, index_, promoted_.size());
}

std::string DeleteBlockCommand::description() const {
    return "delete-block " + id_;
}

// --- IndentBlockCommand ---

BlockTree IndentBlockCommand::apply(const BlockTree& tree) {
    MoveResult r = indent_block(tree, id_, schema_, maxDepth_);
    changed_ = r.changed;
    oldParentId_ = std::move(r.oldParentId);
    oldIndex_ = r.oldIndex;
    return std::move(r.tree);
}

BlockTree IndentBlockCommand::undo(const BlockTree& tree) {
    if (!changed_) return tree;
    return move_block(tree, id_, oldParentId_, oldIndex_);
}

std::string IndentBlockCommand::description() const {
    return "indent-block " + id_;
}

// --- OutdentBlockCommand ---

BlockTree OutdentBlockCommand::apply(const BlockTree& tree) {
    oldType_ = node_at(tree, id_).type;
    OutdentResult r = outdent_block(tree, id_, schema_, replacementId_);
    changed_ = r.changed;
    converted_ = r.converted;
    oldParentId_ = std::move(r.oldParentId);
    oldIndex_ = r.oldIndex;
    return std::move(r.tree);
}

BlockTree OutdentBlockCommand::undo(const BlockTree& tree) {
    if (!changed_) return tree;
    if (converted_) return convert_block(tree, replacementId_, oldType_, id_);
    return move_block(tree, id_, oldParentId_, oldIndex_);
}

std::string OutdentBlockCommand::description() const {
    return "outdent-block " + id_;
}

// --- SplitBlockCommand ---

BlockTree SplitBlockCommand::apply(const BlockTree& tree) {
    original_ = node_at(tree, id_).content;
    return split_block(tree, id_, offset_, newId_, schema_).tree;
}

BlockTree SplitBlockCommand::undo(const BlockTree& tree) {
    BlockTree t = remove_leaf_block(tree, newId_);
    return set_content(t, id_, original_);
}

std::string SplitBlockCommand::description() const {
    return "split-block " + id_ + " @" + std::to_string(offset_);
}

// --- CreateBlockCommand ---

BlockTree CreateBlockCommand::apply(const BlockTree& tree) {
    return create_block(tree, spec_, newId_);
}

BlockTree CreateBlockCommand::undo(const BlockTree& tree) {
    return remove_leaf_block(tree, newId_);
}

std::string CreateBlockCommand::description() const {
    return "create-block " + newId_ + " (" + spec_.type + ") under " + spec_.parentId;
}

// --- ConvertBlockCommand ---

BlockTree ConvertBlockCommand::apply(const BlockTree& tree) {
    oldType_ = node_at(tree, id_).type;
    return convert_block(tree, id_, toType_, newId_);
}

BlockTree ConvertBlockCommand::undo(const BlockTree& tree) {
    return convert_block(tree, newId_, oldType_, id_);
}

std::string ConvertBlockCommand::description() const {
    return "convert-block " + id_ + " -> " + toType_;
}

// --- MergeBlocksCommand ---

BlockTree MergeBlocksCommand::apply(const BlockTree& tree) {
    MergeResult r = merge_blocks(tree, target_, source_, schema_);
    removed_ = std::move(r.source);
    sourceIndex_ = r.sourceIndex;
    joinOffset_ = r.joinOffset;
    childJoin_ = r.childJoin;
    return std::move(r.tree);
}

BlockTree MergeBlocksCommand::undo(const BlockTree& tree) {
    return unmerge_blocks(tree, target_, removed_, sourceIndex_, joinOffset_, childJoin_);
}

std::string MergeBlocksCommand::description() const {
    return "merge-blocks " + source_ + " into " + target_;
}

// --- MoveBlockCommand ---

BlockTree MoveBlockCommand::apply(const BlockTree& tree) {
    MoveResult r = direction_ == MoveDirection::Up ? move_block_up(tree, id_) : move_block_down(tree, id_);
    changed_ = r.changed;
    oldParentId_ = std::move(r.oldParentId);
    oldIndex_ = r.oldIndex;
    return std::move(r.tree);
}

BlockTree MoveBlockCommand::undo(const BlockTree& tree) {
    if (!changed_) return tree;
    return move_block(tree, id_, oldParentId_, oldIndex_);
}

std::string MoveBlockCommand::description() const {
    return std::string(direction_ == MoveDirection::Up ? "move-up " : "move-down ") + id_;
}

// --- SetCollapsedCommand ---

BlockTree SetCollapsedCommand::apply(const BlockTree& tree) {
    previous_ = node_at(tree, id_).content.collapsed;
    return set_collapsed(tree, id_, collapsed_);
}

BlockTree SetCollapsedCommand::undo(const BlockTree& tree) {
    return set_collapsed(tree, id_, previous_);
}

std::string SetCollapsedCommand::description() const {
    return (collapsed_ ? "collapse " : "expand ") + id_;
}

// --- CommandGroup ---

BlockTree CommandGroup::apply(const BlockTree& tree) {
    BlockTree t = tree;
    for (auto& c : commands_) {
        t = c->apply(t);
    }
    return t;
}

BlockTree CommandGroup::undo(const BlockTree& tree) {
    BlockTree t = tree;
    for (auto it = commands_.rbegin(); it != commands_.rend(); ++it) {
        t = (*it)->undo(t);
    }
    return t;
}

std::string CommandGroup::description() const {
    std::string out = label_ + " [";
    for (size_t i = 0; i < commands_.size(); ++i) {
        if (i) out += ", ";
        out += commands_[i]->description();
    }
    out += "]";
    return out;
}

bool CommandGroup::changed() const {
    for (const auto& c : commands_) {
        if (c->changed()) return true;
    }
    return false;
}

} // namespace block
