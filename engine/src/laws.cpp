#include "block_engine/laws.hpp"
#include "block_engine/tree_utils.hpp"

namespace block {

IntentKind resolve_structural_enter(const EnterContext& ctx) {
    if (ctx.isEmpty) return IntentKind::CreateSiblingBelow;
    if (ctx.canHaveChildren) return IntentKind::CreateChild;
    if (ctx.atStart) return IntentKind::CreateSiblingAbove;
    if (ctx.atEnd) return IntentKind::CreateSiblingBelow;
    return IntentKind::SplitBlock;
}

CursorTarget cursor_after_delete(const BlockTree& after, const BlockId& parentId, size_t index,
                                 const std::vector<BlockId>& promotedChildren) {
    if (!promotedChildren.empty()) {
        return { promotedChildren.front(), Placement::Start, 0 };
    }
    const auto& sibs = node_at(after, parentId).children;
    if (index > 0 && index - 1 < sibs.size()) {
        return { sibs[index - 1], Placement::End, 0 };
    }
    if (index < sibs.size()) {
        return { sibs[index], Placement::Start, 0 };
    }
    return { parentId, Placement::End, 0 };
}

} // namespace block
