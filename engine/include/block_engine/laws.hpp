#pragma once

#include "block_engine/intent.hpp"
#include "block_engine/types.hpp"

#include <cstddef>
#include <vector>

namespace block {

// Caret context for the structural Enter table.
struct EnterContext {
    bool isEmpty = false;
    bool atStart = false;
    bool atEnd = false;
    bool canHaveChildren = false;
};

// Fixed, total decision order:
//   empty            -> create-sibling-below
//   container        -> create-child
//   at start         -> create-sibling-above
//   at end           -> create-sibling-below
//   otherwise        -> split-block
IntentKind resolve_structural_enter(const EnterContext& ctx);

// Caret after a child-promoting delete, computed on the tree after the
// delete: first promoted child (start), else previous sibling (end), else
// next sibling (start), else the parent (end).
CursorTarget cursor_after_delete(const BlockTree& after, const BlockId& parentId, size_t index,
                                 const std::vector<BlockId>& promotedChildren);

} // namespace block
