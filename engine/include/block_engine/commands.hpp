#pragma once

#include "block_engine/mutations.hpp"
#include "block_engine/schema.hpp"
#include "block_engine/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace block {

// A reversible structural edit. apply() runs the mutation primitive and
// captures what undo() needs; calling apply() again on the tree undo()
// returned reproduces the same result (ids are fixed at construction).
class Command {
public:
    virtual ~Command() = default;

    virtual BlockTree apply(const BlockTree& tree) = 0;
    virtual BlockTree undo(const BlockTree& tree) = 0;
    virtual std::string description() const = 0;

    // False when the last apply() left the tree as it was (indent without a
    // previous sibling, move at the boundary, ...).
    virtual bool changed() const { return true; }
};

struct DeleteOutcome {
    BlockNode deletedBlock;
    std::vector<BlockId> promotedChildren;
};

class DeleteBlockCommand : public Command {
public:
    explicit DeleteBlockCommand(BlockId id) : id_(std::move(id)) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;

    const BlockId& id() const { return id_; }
    const BlockId& parent_id() const { return parentId_; }
    size_t index() const { return index_; }
    DeleteOutcome outcome() const { return { deleted_, promoted_ }; }

private:
    BlockId id_;
    BlockNode deleted_;
    BlockId parentId_;
    size_t index_ = 0;
    std::vector<BlockId> promoted_;
};

class IndentBlockCommand : public Command {
public:
    IndentBlockCommand(BlockId id, const BlockSchema& schema, int maxDepth)
        : id_(std::move(id)), schema_(schema), maxDepth_(maxDepth) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;
    bool changed() const override { return changed_; }

private:
    BlockId id_;
    const BlockSchema& schema_;
    int maxDepth_;
    bool changed_ = false;
    BlockId oldParentId_;
    size_t oldIndex_ = 0;
};

class OutdentBlockCommand : public Command {
public:
    // replacementId is only consumed when a top-level block converts to its
    // lower form.
    OutdentBlockCommand(BlockId id, const BlockSchema& schema, BlockId replacementId)
        : id_(std::move(id)), schema_(schema), replacementId_(std::move(replacementId)) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;
    bool changed() const override { return changed_; }

    bool converted() const { return converted_; }
    const BlockId& current_id() const { return converted_ ? replacementId_ : id_; }

private:
    BlockId id_;
    const BlockSchema& schema_;
    BlockId replacementId_;
    bool changed_ = false;
    bool converted_ = false;
    std::string oldType_;
    BlockId oldParentId_;
    size_t oldIndex_ = 0;
};

class SplitBlockCommand : public Command {
public:
    SplitBlockCommand(BlockId id, size_t offset, BlockId newId, const BlockSchema& schema)
        : id_(std::move(id)), offset_(offset), newId_(std::move(newId)), schema_(schema) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;

    const BlockId& new_id() const { return newId_; }

private:
    BlockId id_;
    size_t offset_;
    BlockId newId_;
    const BlockSchema& schema_;
    Content original_;
};

class CreateBlockCommand : public Command {
public:
    CreateBlockCommand(CreateSpec spec, BlockId newId) : spec_(std::move(spec)), newId_(std::move(newId)) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;

    const BlockId& new_id() const { return newId_; }

private:
    CreateSpec spec_;
    BlockId newId_;
};

class ConvertBlockCommand : public Command {
public:
    ConvertBlockCommand(BlockId id, std::string toType, BlockId newId)
        : id_(std::move(id)), toType_(std::move(toType)), newId_(std::move(newId)) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;

    const BlockId& new_id() const { return newId_; }

private:
    BlockId id_;
    std::string toType_;
    BlockId newId_;
    std::string oldType_;
};

class MergeBlocksCommand : public Command {
public:
    MergeBlocksCommand(BlockId target, BlockId source, const BlockSchema& schema)
        : target_(std::move(target)), source_(std::move(source)), schema_(schema) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;

    size_t join_offset() const { return joinOffset_; }

private:
    BlockId target_;
    BlockId source_;
    const BlockSchema& schema_;
    BlockNode removed_;
    size_t sourceIndex_ = 0;
    size_t joinOffset_ = 0;
    size_t childJoin_ = 0;
};

enum class MoveDirection { Up, Down };

class MoveBlockCommand : public Command {
public:
    MoveBlockCommand(BlockId id, MoveDirection direction) : id_(std::move(id)), direction_(direction) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;
    bool changed() const override { return changed_; }

private:
    BlockId id_;
    MoveDirection direction_;
    bool changed_ = false;
    BlockId oldParentId_;
    size_t oldIndex_ = 0;
};

class SetCollapsedCommand : public Command {
public:
    SetCollapsedCommand(BlockId id, bool collapsed) : id_(std::move(id)), collapsed_(collapsed) {}

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;
    bool changed() const override { return previous_ != collapsed_; }

private:
    BlockId id_;
    bool collapsed_;
    bool previous_ = false;
};

// Ordered batch forming a single undo step: applied in order, undone in
// reverse.
class CommandGroup : public Command {
public:
    explicit CommandGroup(std::string label = "group") : label_(std::move(label)) {}

    void add(std::unique_ptr<Command> command) { commands_.push_back(std::move(command)); }
    bool empty() const { return commands_.empty(); }
    size_t size() const { return commands_.size(); }
    const Command& at(size_t i) const { return *commands_.at(i); }

    BlockTree apply(const BlockTree& tree) override;
    BlockTree undo(const BlockTree& tree) override;
    std::string description() const override;
    bool changed() const override;

private:
    std::string label_;
    std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace block
