#include "block_engine/intent.hpp"

namespace block {

static Intent make(IntentKind kind, const BlockId& id) {
    Intent i;
    i.kind = kind;
    i.blockId = id;
    return i;
}

Intent delete_intent(const BlockId& id) { return make(IntentKind::DeleteBlock, id); }
Intent indent_intent(const BlockId& id) { return make(IntentKind::IndentBlock, id); }
Intent outdent_intent(const BlockId& id) { return make(IntentKind::OutdentBlock, id); }

Intent create_sibling_above_intent(const BlockId& id, const std::string& type) {
    Intent i = make(IntentKind::CreateSiblingAbove, id);
    i.blockType = type;
    return i;
}

Intent create_sibling_below_intent(const BlockId& id, const std::string& type) {
    Intent i = make(IntentKind::CreateSiblingBelow, id);
    i.blockType = type;
    return i;
}

Intent create_child_intent(const BlockId& id, const std::string& type) {
    Intent i = make(IntentKind::CreateChild, id);
    i.blockType = type;
    return i;
}

Intent split_intent(const BlockId& id, size_t offset) {
    Intent i = make(IntentKind::SplitBlock, id);
    i.offset = offset;
    return i;
}

Intent convert_intent(const BlockId& id, const std::string& toType) {
    Intent i = make(IntentKind::ConvertBlock, id);
    i.blockType = toType;
    return i;
}

Intent merge_intent(const BlockId& target, const BlockId& source) {
    Intent i = make(IntentKind::MergeBlocks, target);
    i.otherId = source;
    return i;
}

Intent move_up_intent(const BlockId& id) { return make(IntentKind::MoveUp, id); }
Intent move_down_intent(const BlockId& id) { return make(IntentKind::MoveDown, id); }
Intent toggle_collapse_intent(const BlockId& id) { return make(IntentKind::ToggleCollapse, id); }
Intent noop_intent() { return Intent{}; }

const char* to_string(IntentKind kind) {
    switch (kind) {
        case IntentKind::DeleteBlock: return "delete-block";
        case IntentKind::IndentBlock: return "indent-block";
        case IntentKind::OutdentBlock: return "outdent-block";
        case IntentKind::CreateSiblingAbove: return "create-sibling-above";
        case IntentKind::CreateSiblingBelow: return "create-sibling-below";
        case IntentKind::CreateChild: return "create-child";
        case IntentKind::SplitBlock: return "split-block";
        case IntentKind::ConvertBlock: return "convert-block";
        case IntentKind::MergeBlocks: return "merge-blocks";
        case IntentKind::MoveUp: return "move-up";
        case IntentKind::MoveDown: return "move-down";
        case IntentKind::ToggleCollapse: return "toggle-collapse";
        case IntentKind::Noop: return "noop";
    }
    return "unknown";
}

bool is_deletion(IntentKind kind) {
    return kind == IntentKind::DeleteBlock;
}

const char* to_string(Placement placement) {
    switch (placement) {
        case Placement::Start: return "start";
        case Placement::End: return "end";
        case Placement::Safe: return "safe";
        case Placement::Offset: return "offset";
    }
    return "unknown";
}

} // namespace block
