#pragma once

#include "block_engine/types.hpp"

#include <cstddef>
#include <string>

namespace block {

// Structural operation requests, independent of the key that produced them.
enum class IntentKind {
    DeleteBlock,
    IndentBlock,
    OutdentBlock,
    CreateSiblingAbove,
    CreateSiblingBelow,
    CreateChild,
    SplitBlock,
    ConvertBlock,
    MergeBlocks,
    MoveUp,
    MoveDown,
    ToggleCollapse,
    Noop
};

struct Intent {
    IntentKind kind = IntentKind::Noop;
    BlockId blockId;       // target block (merge: the block receiving the text)
    BlockId otherId;       // merge: block being absorbed
    std::string blockType; // create-*: type override; convert: destination type
    size_t offset = 0;     // split: byte offset into the block text
};

Intent delete_intent(const BlockId& id);
Intent indent_intent(const BlockId& id);
Intent outdent_intent(const BlockId& id);
Intent create_sibling_above_intent(const BlockId& id, const std::string& type = {});
Intent create_sibling_below_intent(const BlockId& id, const std::string& type = {});
Intent create_child_intent(const BlockId& id, const std::string& type = {});
Intent split_intent(const BlockId& id, size_t offset);
Intent convert_intent(const BlockId& id, const std::string& toType);
Intent merge_intent(const BlockId& target, const BlockId& source);
Intent move_up_intent(const BlockId& id);
Intent move_down_intent(const BlockId& id);
Intent toggle_collapse_intent(const BlockId& id);
Intent noop_intent();

// "delete-block", "indent-block", ...
const char* to_string(IntentKind kind);

bool is_deletion(IntentKind kind);

// Where the host should put the caret after a structural edit.
enum class Placement {
    Start,
    End,
    Safe,   // host picks the nearest valid caret position in the block
    Offset
};

struct CursorTarget {
    BlockId blockId;
    Placement placement = Placement::Start;
    size_t offset = 0; // only meaningful for Placement::Offset
};

inline bool operator==(const CursorTarget& a, const CursorTarget& b) {
    return a.blockId == b.blockId && a.placement == b.placement &&
           (a.placement != Placement::Offset || a.offset == b.offset);
}
inline bool operator!=(const CursorTarget& a, const CursorTarget& b) { return !(a == b); }

const char* to_string(Placement placement);

} // namespace block
