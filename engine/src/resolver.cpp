#include "block_engine/resolver.hpp"
#include "block_engine/errors.hpp"
#include "block_engine/laws.hpp"
#include "block_engine/log.hpp"
#include "block_engine/tree_utils.hpp"

#include <algorithm>
#include <unordered_map>

namespace block {

// Same block keeps the caret where it was; a block that replaced it (type
// conversion) inherits the offset.
static CursorTarget keep_cursor(const BlockId& oldId, const BlockId& newId, const std::optional<CursorTarget>& cursor) {
    if (cursor && cursor->blockId == oldId) {
        return { newId, cursor->placement, cursor->offset };
    }
    return { newId, Placement::Safe, 0 };
}

std::unique_ptr<Command> IntentResolver::apply_one(const Intent& intent, BlockTree& tree,
                                                   std::optional<CursorTarget>& cursor) {
    std::unique_ptr<Command> cmd;
    const BlockId& id = intent.blockId;

    switch (intent.kind) {
        case IntentKind::Noop:
            return nullptr;

        case IntentKind::DeleteBlock: {
            auto del = std::make_unique<DeleteBlockCommand>(id);
            BlockTree next = del->apply(tree);
            cursor = cursor_after_delete(next, del->parent_id(), del->index(), del->outcome().promotedChildren);
            tree = std::move(next);
            return del;
        }

        case IntentKind::IndentBlock:
            cmd = std::make_unique<IndentBlockCommand>(id, schema_, maxDepth_);
            break;

        case IntentKind::OutdentBlock: {
            // only a top-level block is replaced, so only then is an id drawn
            BlockId replacement = node_at(tree, id).parentId == tree.rootId ? ids_.next() : BlockId();
            auto out = std::make_unique<OutdentBlockCommand>(id, schema_, replacement);
            BlockTree next = out->apply(tree);
            if (!out->changed()) return nullptr;
            cursor = keep_cursor(id, out->current_id(), cursor);
            tree = std::move(next);
            return out;
        }

        case IntentKind::CreateSiblingAbove:
        case IntentKind::CreateSiblingBelow:
        case IntentKind::CreateChild: {
            const BlockNode& ref = node_at(tree, id);
            CreateSpec spec;
            spec.type = intent.blockType.empty() ? schema_.continue_as(ref.type) : intent.blockType;
            if (intent.kind == IntentKind::CreateChild) {
                spec.parentId = id;
                spec.index = 0;
            } else {
                if (is_root(tree, id)) throw NotFoundError(id, "'" + id + "' is the document root, not a block");
                spec.parentId = ref.parentId;
                spec.index = index_in_siblings(tree, id) + (intent.kind == IntentKind::CreateSiblingBelow ? 1 : 0);
            }
            auto create = std::make_unique<CreateBlockCommand>(spec, ids_.next());
            BlockTree next = create->apply(tree);
            cursor = CursorTarget{ create->new_id(), Placement::Start, 0 };
            tree = std::move(next);
            return create;
        }

        case IntentKind::SplitBlock: {
            auto split = std::make_unique<SplitBlockCommand>(id, intent.offset, ids_.next(), schema_);
            BlockTree next = split->apply(tree);
            cursor = CursorTarget{ split->new_id(), Placement::Start, 0 };
            tree = std::move(next);
            return split;
        }

        case IntentKind::ConvertBlock: {
            auto convert = std::make_unique<ConvertBlockCommand>(id, intent.blockType, ids_.next());
            BlockTree next = convert->apply(tree);
            cursor = keep_cursor(id, convert->new_id(), cursor);
            tree = std::move(next);
            return convert;
        }

        case IntentKind::MergeBlocks: {
            auto merge = std::make_unique<MergeBlocksCommand>(id, intent.otherId, schema_);
            BlockTree next = merge->apply(tree);
            cursor = CursorTarget{ id, Placement::Offset, merge->join_offset() };
            tree = std::move(next);
            return merge;
        }

        case IntentKind::MoveUp:
            cmd = std::make_unique<MoveBlockCommand>(id, MoveDirection::Up);
            break;

        case IntentKind::MoveDown:
            cmd = std::make_unique<MoveBlockCommand>(id, MoveDirection::Down);
            break;

        case IntentKind::ToggleCollapse: {
            bool collapsed = node_at(tree, id).content.collapsed;
            auto toggle = std::make_unique<SetCollapsedCommand>(id, !collapsed);
            tree = toggle->apply(tree);
            return toggle;
        }
    }

    // indent / move: same block, same offset
    BlockTree next = cmd->apply(tree);
    if (!cmd->changed()) return nullptr;
    cursor = keep_cursor(id, id, cursor);
    tree = std::move(next);
    return cmd;
}

Resolution IntentResolver::resolve(const Intent& intent, const BlockTree& tree,
                                   const std::optional<CursorTarget>& cursor, const ModeManager& modes) {
    Resolution r;
    r.tree = tree;
    r.cursor = cursor;
    if (!modes.is_intent_allowed(intent.kind)) {
        log_info("resolver", "%s refused in mode %s", to_string(intent.kind), to_string(modes.current()));
        r.refused = 1;
        return r;
    }
    auto cmd = apply_one(intent, r.tree, r.cursor);
    log_debug("resolver", "%s on '%s': %s", to_string(intent.kind), intent.blockId.c_str(),
              cmd ? cmd->description().c_str() : "no change");
    if (cmd) {
        r.command = std::make_unique<CommandGroup>(to_string(intent.kind));
        r.command->add(std::move(cmd));
    }
    return r;
}

Resolution IntentResolver::resolve_all(const std::vector<Intent>& intents, const BlockTree& tree,
                                       const std::optional<CursorTarget>& cursor, const ModeManager& modes) {
    if (intents.size() == 1) return resolve(intents.front(), tree, cursor, modes);

    Resolution r;
    r.tree = tree;
    r.cursor = cursor;
    auto group = std::make_unique<CommandGroup>("batch");
    for (const auto& intent : order_batch(intents, tree)) {
        if (!modes.is_intent_allowed(intent.kind)) {
            log_info("resolver", "%s refused in mode %s", to_string(intent.kind), to_string(modes.current()));
            ++r.refused;
            continue;
        }
        try {
            auto cmd = apply_one(intent, r.tree, r.cursor);
            if (cmd) group->add(std::move(cmd));
        } catch (const Error& e) {
            log_warn("resolver", "%s on '%s' rejected: %s", to_string(intent.kind), intent.blockId.c_str(), e.what());
            ++r.rejected;
        }
    }
    log_debug("resolver", "batch of %zu intents: %zu commands", intents.size(), group->size());
    if (!group->empty()) r.command = std::move(group);
    return r;
}

std::vector<Intent> IntentResolver::order_batch(const std::vector<Intent>& intents, const BlockTree& tree) const {
    if (intents.size() < 2) return intents;

    std::unordered_map<BlockId, size_t> rank;
    auto order = document_order(tree);
    for (size_t i = 0; i < order.size(); ++i) rank[order[i]] = i;
    auto rank_of = [&](const Intent& i) {
        auto it = rank.find(i.blockId);
        return it == rank.end() ? order.size() : it->second;
    };

    std::vector<Intent> forward, backward, deletions;
    for (const auto& i : intents) {
        if (is_deletion(i.kind)) deletions.push_back(i);
        else if (i.kind == IntentKind::OutdentBlock) backward.push_back(i);
        else forward.push_back(i);
    }
    std::stable_sort(forward.begin(), forward.end(),
                     [&](const Intent& a, const Intent& b) { return rank_of(a) < rank_of(b); });
    // each outdented block lands right after its parent, so the last one goes first
    std::stable_sort(backward.begin(), backward.end(),
                     [&](const Intent& a, const Intent& b) { return rank_of(a) > rank_of(b); });
    std::stable_sort(deletions.begin(), deletions.end(),
                     [&](const Intent& a, const Intent& b) { return rank_of(a) > rank_of(b); });

    std::vector<Intent> out;
    out.reserve(intents.size());
    out.insert(out.end(), forward.begin(), forward.end());
    out.insert(out.end(), backward.begin(), backward.end());
    out.insert(out.end(), deletions.begin(), deletions.end());
    return out;
}

} // namespace block
