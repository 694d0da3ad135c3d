#pragma once

#include "block_engine/commands.hpp"
#include "block_engine/intent.hpp"
#include "block_engine/mode.hpp"
#include "block_engine/schema.hpp"
#include "block_engine/types.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace block {

struct Resolution {
    // Commands for every intent that changed the tree, as one undo step.
    // Null when nothing changed (noop, refused, or boundary no-ops).
    std::unique_ptr<CommandGroup> command;
    BlockTree tree;                       // tree after the command
    std::optional<CursorTarget> cursor;   // unchanged cursor when nothing moved
    size_t refused = 0;                   // intents blocked by the interaction mode
    size_t rejected = 0;                  // intents whose primitive threw
};

// Maps intents to commands and computes where the caret goes. Fresh ids are
// drawn from `ids` here, once, so replaying a command never allocates.
class IntentResolver {
public:
    IntentResolver(const BlockSchema& schema, IdGenerator& ids, int maxDepth)
        : schema_(schema), ids_(ids), maxDepth_(maxDepth) {}

    // Single intent. Throws NotFoundError / InvariantViolation from the
    // primitive; `tree` is never modified.
    Resolution resolve(const Intent& intent, const BlockTree& tree, const std::optional<CursorTarget>& cursor,
                       const ModeManager& modes);

    // Batch: creation and reparenting in document order (outdents in reverse
    // document order), deletions last in reverse document order. A failing
    // intent is logged and skipped; the cursor comes from the last intent
    // that ran.
    Resolution resolve_all(const std::vector<Intent>& intents, const BlockTree& tree,
                           const std::optional<CursorTarget>& cursor, const ModeManager& modes);

    std::vector<Intent> order_batch(const std::vector<Intent>& intents, const BlockTree& tree) const;

private:
    // Builds the command for `intent`, applies it to `tree` and moves the
    // cursor. Returns null for noop.
    std::unique_ptr<Command> apply_one(const Intent& intent, BlockTree& tree, std::optional<CursorTarget>& cursor);

    const BlockSchema& schema_;
    IdGenerator& ids_;
    int maxDepth_;
};

} // namespace block
