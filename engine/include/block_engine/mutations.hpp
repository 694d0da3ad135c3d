#pragma once

#include "block_engine/schema.hpp"
#include "block_engine/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace block {

// Mutation primitives. Each takes the current tree by const reference and
// returns the next tree; on failure they throw (NotFoundError,
// InvariantViolation) and the caller's tree is untouched. Commands are the
// only callers outside of tests.

struct DeleteResult {
    BlockTree tree;
    BlockNode deletedBlock;               // as it was before promotion
    BlockId parentId;
    size_t index = 0;                     // former position in parent's children
    std::vector<BlockId> promotedChildren;
};

// Removes `id` and splices its direct children into the former parent at the
// block's index. The document must keep at least one top-level block.
DeleteResult delete_block(const BlockTree& tree, const BlockId& id);

// Reverse of delete_block: reinserts `block` at `index` under `parentId` and
// takes back the `promotedCount` children sitting at that index.
BlockTree undelete_block(const BlockTree& tree, const BlockNode& block, const BlockId& parentId,
                         size_t index, size_t promotedCount);

struct MoveResult {
    BlockTree tree;
    bool changed = false;
    BlockId oldParentId;
    size_t oldIndex = 0;
};

// Nests `id` as the last child of its previous sibling when that sibling's
// type accepts children and the subtree stays within `maxDepth`.
MoveResult indent_block(const BlockTree& tree, const BlockId& id, const BlockSchema& schema, int maxDepth);

struct OutdentResult {
    BlockTree tree;
    bool changed = false;
    bool converted = false;   // top-level block degraded to its lower form
    BlockId oldParentId;
    size_t oldIndex = 0;
    BlockId currentId;        // block id after the operation
};

// Moves `id` out of its parent to sit right after it. A top-level block is
// converted to its lower form instead (taking `replacementId`), or left alone
// when the type has none.
OutdentResult outdent_block(const BlockTree& tree, const BlockId& id, const BlockSchema& schema,
                            const BlockId& replacementId);

// Hoist/sink: swap with the neighbouring sibling, or leave the parent at the
// boundary. Never moves a block above the top level.
MoveResult move_block_up(const BlockTree& tree, const BlockId& id);
MoveResult move_block_down(const BlockTree& tree, const BlockId& id);

// Id-preserving reparent, used to invert moves.
BlockTree move_block(const BlockTree& tree, const BlockId& id, const BlockId& newParentId, size_t index);

struct SplitResult {
    BlockTree tree;
    BlockId newId;
    std::string newType;
};

// Text after `offset` moves to a new sibling right after `id`. The original
// keeps its children. `offset` is clamped to the text and moved back to the
// start of the UTF-8 sequence it falls in.
SplitResult split_block(const BlockTree& tree, const BlockId& id, size_t offset, const BlockId& newId,
                        const BlockSchema& schema);

struct CreateSpec {
    std::string type;
    BlockId parentId;
    size_t index = 0;
    Content content;
};

BlockTree create_block(const BlockTree& tree, const CreateSpec& spec, const BlockId& newId);

// Removes a childless block. Inverse of create_block and split_block.
BlockTree remove_leaf_block(const BlockTree& tree, const BlockId& id);

// Replaces `id` by a node of `toType` with id `newId`; position, children and
// content carry over.
BlockTree convert_block(const BlockTree& tree, const BlockId& id, const std::string& toType, const BlockId& newId);

struct MergeResult {
    BlockTree tree;
    BlockNode source;          // removed node, as it was
    size_t sourceIndex = 0;
    size_t joinOffset = 0;     // target text length before the merge
    size_t childJoin = 0;      // target child count before the merge
};

// Appends `source` (text and children) to `target` and removes `source`.
MergeResult merge_blocks(const BlockTree& tree, const BlockId& target, const BlockId& source,
                         const BlockSchema& schema);
BlockTree unmerge_blocks(const BlockTree& tree, const BlockId& target, const BlockNode& source,
                         size_t sourceIndex, size_t joinOffset, size_t childJoin);

BlockTree set_content(const BlockTree& tree, const BlockId& id, const Content& content);
BlockTree set_collapsed(const BlockTree& tree, const BlockId& id, bool collapsed);

} // namespace block
