#include "block_engine/mutations.hpp"
#include "block_engine/errors.hpp"
#include "block_engine/tree_utils.hpp"

#include <algorithm>

namespace block {

// Every structural primitive targets a regular block: present and not root.
static const BlockNode& require_block(const BlockTree& t, const BlockId& id) {
    const BlockNode& node = node_at(t, id);
    if (is_root(t, id) || node.parentId.empty()) {
        throw NotFoundError(id, "'" + id + "' is the document root, not a block");
    }
    return node;
}

// Byte offsets never land inside a UTF-8 sequence: step back to its lead byte.
static size_t snap_to_code_point(const std::string& text, size_t offset) {
    if (offset > text.size()) offset = text.size();
    while (offset > 0 && offset < text.size() && (static_cast<unsigned char>(text[offset]) & 0xC0) == 0x80) {
        --offset;
    }
    return offset;
}

static void require_fresh_id(const BlockTree& t, const BlockId& id) {
    if (id.empty()) throw InvariantViolation("new block id is empty");
    if (contains(t, id)) throw InvariantViolation("block id '" + id + "' is already in use");
}

DeleteResult delete_block(const BlockTree& tree, const BlockId& id) {
    require_block(tree, id);
    DeleteResult r;
    r.tree = tree;
    BlockTree& t = r.tree;
    BlockNode block = node_at(t, id);
    const BlockId parentId = block.parentId;

    auto& sibs = node_ref(t, parentId).children;
    if (parentId == t.rootId && sibs.size() == 1 && block.children.empty()) {
        throw InvariantViolation("cannot delete '" + id + "': it is the document's last top-level block");
    }
    size_t idx = index_in_siblings(t, id);
    sibs.erase(sibs.begin() + static_cast<std::ptrdiff_t>(idx));
    // promoted children take the deleted block's slot, in their original order
    sibs.insert(sibs.begin() + static_cast<std::ptrdiff_t>(idx), block.children.begin(), block.children.end());
    for (const auto& cid : block.children) {
        node_ref(t, cid).parentId = parentId;
    }
    t.nodes.erase(id);

    r.parentId = parentId;
    r.index = idx;
    r.promotedChildren = block.children;
    r.deletedBlock = std::move(block);
    return r;
}

BlockTree undelete_block(const BlockTree& tree, const BlockNode& block, const BlockId& parentId,
                         size_t index, size_t promotedCount) {
    require_fresh_id(tree, block.id);
    BlockTree t = tree;
    auto& sibs = node_ref(t, parentId).children;
    if (index + promotedCount > sibs.size()) {
        throw InvariantViolation("cannot restore '" + block.id + "': parent has too few children");
    }
    auto first = sibs.begin() + static_cast<std::ptrdiff_t>(index);
    auto last = first + static_cast<std::ptrdiff_t>(promotedCount);
    if (!std::equal(first, last, block.children.begin(), block.children.end())) {
        throw InvariantViolation("cannot restore '" + block.id + "': promoted children have moved");
    }
    sibs.erase(first, last);
    sibs.insert(sibs.begin() + static_cast<std::ptrdiff_t>(index), block.id);
    for (const auto& cid : block.children) {
        node_ref(t, cid).parentId = block.id;
    }
    BlockNode restored = block;
    restored.parentId = parentId;
    t.nodes[restored.id] = std::move(restored);
    return t;
}

MoveResult indent_block(const BlockTree& tree, const BlockId& id, const BlockSchema& schema, int maxDepth) {
    const BlockNode& node = require_block(tree, id);
    MoveResult r;
    r.tree = tree;
    BlockId prevId = prev_sibling_id(tree, id);
    if (prevId.empty()) return r; // no previous sibling -> no-op
    if (!schema.accepts_children(node_at(tree, prevId).type)) return r;
    if (maxDepth > 0 && depth_of(tree, prevId) + 1 + subtree_height(tree, id) > maxDepth) return r;

    r.oldParentId = node.parentId;
    r.oldIndex = index_in_siblings(tree, id);
    BlockTree& t = r.tree;
    erase_from(node_ref(t, node.parentId).children, id);
    node_ref(t, id).parentId = prevId;
    node_ref(t, prevId).children.push_back(id);
    r.changed = true;
    return r;
}

OutdentResult outdent_block(const BlockTree& tree, const BlockId& id, const BlockSchema& schema,
                            const BlockId& replacementId) {
    const BlockNode& node = require_block(tree, id);
    OutdentResult r;
    r.tree = tree;
    r.currentId = id;
    const BlockId parentId = node.parentId;

    if (parentId == tree.rootId) {
        // already top-level: degrade to the lower form, if the type has one
        const std::string& lower = schema.lower_form(node.type);
        if (lower.empty() || lower == node.type) return r;
        r.oldParentId = parentId;
        r.oldIndex = index_in_siblings(tree, id);
        r.tree = convert_block(tree, id, lower, replacementId);
        r.currentId = replacementId;
        r.changed = true;
        r.converted = true;
        return r;
    }

    r.oldParentId = parentId;
    r.oldIndex = index_in_siblings(tree, id);
    BlockTree& t = r.tree;
    const BlockId grandParentId = node_at(t, parentId).parentId;
    erase_from(node_ref(t, parentId).children, id);
    // insert as next sibling after parent in grandparent's list
    insert_after(node_ref(t, grandParentId).children, parentId, id);
    node_ref(t, id).parentId = grandParentId;
    r.changed = true;
    return r;
}

MoveResult move_block_up(const BlockTree& tree, const BlockId& id) {
    const BlockNode& node = require_block(tree, id);
    MoveResult r;
    r.tree = tree;
    r.oldParentId = node.parentId;
    r.oldIndex = index_in_siblings(tree, id);
    BlockTree& t = r.tree;
    auto& sibs = node_ref(t, node.parentId).children;
    if (r.oldIndex > 0) {
        std::swap(sibs[r.oldIndex - 1], sibs[r.oldIndex]);
        r.changed = true;
        return r;
    }
    // At first position, hoist if possible
    if (node.parentId == t.rootId) return r; // first top-level block -> no-op
    const BlockId parentId = node.parentId;
    const BlockId grandParentId = node_at(t, parentId).parentId;
    erase_from(sibs, id);
    insert_before(node_ref(t, grandParentId).children, parentId, id);
    node_ref(t, id).parentId = grandParentId;
    r.changed = true;
    return r;
}

MoveResult move_block_down(const BlockTree& tree, const BlockId& id) {
    const BlockNode& node = require_block(tree, id);
    MoveResult r;
    r.tree = tree;
    r.oldParentId = node.parentId;
    r.oldIndex = index_in_siblings(tree, id);
    BlockTree& t = r.tree;
    auto& sibs = node_ref(t, node.parentId).children;
    if (r.oldIndex + 1 < sibs.size()) {
        std::swap(sibs[r.oldIndex], sibs[r.oldIndex + 1]);
        r.changed = true;
        return r;
    }
    // At last position, sink if possible
    if (node.parentId == t.rootId) return r; // last top-level block -> no-op
    const BlockId parentId = node.parentId;
    const BlockId grandParentId = node_at(t, parentId).parentId;
    erase_from(sibs, id);
    insert_after(node_ref(t, grandParentId).children, parentId, id);
    node_ref(t, id).parentId = grandParentId;
    r.changed = true;
    return r;
}

BlockTree move_block(const BlockTree& tree, const BlockId& id, const BlockId& newParentId, size_t index) {
    const BlockNode& node = require_block(tree, id);
    node_at(tree, newParentId);
    if (newParentId == id || is_descendant_of(tree, newParentId, id)) {
        throw InvariantViolation("moving '" + id + "' under '" + newParentId + "' would create a cycle");
    }
    BlockTree t = tree;
    const BlockId oldParentId = node.parentId;
    erase_from(node_ref(t, oldParentId).children, id);
    auto& dest = node_ref(t, newParentId).children;
    if (index > dest.size()) {
        throw InvariantViolation("index " + std::to_string(index) + " out of range under '" + newParentId + "'");
    }
    dest.insert(dest.begin() + static_cast<std::ptrdiff_t>(index), id);
    node_ref(t, id).parentId = newParentId;
    if (node_at(t, t.rootId).children.empty()) {
        throw InvariantViolation("moving '" + id + "' would leave the document empty");
    }
    return t;
}

SplitResult split_block(const BlockTree& tree, const BlockId& id, size_t offset, const BlockId& newId,
                        const BlockSchema& schema) {
    const BlockNode& node = require_block(tree, id);
    if (!schema.is_textual(node.type)) {
        throw InvariantViolation("cannot split '" + id + "': type '" + node.type + "' carries no text");
    }
    require_fresh_id(tree, newId);
    offset = snap_to_code_point(node.content.text, offset);

    SplitResult r;
    r.tree = tree;
    r.newId = newId;
    r.newType = schema.continue_as(node.type);
    BlockNode& original = node_ref(r.tree, id);
    BlockNode second{ newId, r.newType, original.parentId, {}, {} };
    second.content.text = original.content.text.substr(offset);
    original.content.text.erase(offset);
    const BlockId parentId = original.parentId;
    r.tree.nodes[newId] = std::move(second);
    insert_after(node_ref(r.tree, parentId).children, id, newId);
    return r;
}

BlockTree create_block(const BlockTree& tree, const CreateSpec& spec, const BlockId& newId) {
    require_fresh_id(tree, newId);
    if (spec.type.empty()) throw InvariantViolation("new block has no type");
    if (spec.type == "doc") throw InvariantViolation("only the root may be of type 'doc'");
    const auto& parent = node_at(tree, spec.parentId);
    if (spec.index > parent.children.size()) {
        throw InvariantViolation("index " + std::to_string(spec.index) + " out of range under '" +
                                 spec.parentId + "'");
    }
    BlockTree t = tree;
    auto& dest = node_ref(t, spec.parentId).children;
    dest.insert(dest.begin() + static_cast<std::ptrdiff_t>(spec.index), newId);
    t.nodes[newId] = BlockNode{ newId, spec.type, spec.parentId, {}, spec.content };
    return t;
}

BlockTree remove_leaf_block(const BlockTree& tree, const BlockId& id) {
    const BlockNode& node = require_block(tree, id);
    if (!node.children.empty()) {
        throw InvariantViolation("cannot remove '" + id + "': it still has children");
    }
    BlockTree t = tree;
    auto& sibs = node_ref(t, node.parentId).children;
    if (node.parentId == t.rootId && sibs.size() == 1) {
        throw InvariantViolation("cannot remove '" + id + "': it is the document's last top-level block");
    }
    erase_from(sibs, id);
    t.nodes.erase(id);
    return t;
}

BlockTree convert_block(const BlockTree& tree, const BlockId& id, const std::string& toType, const BlockId& newId) {
    const BlockNode& node = require_block(tree, id);
    if (toType.empty() || toType == "doc") {
        throw InvariantViolation("cannot convert '" + id + "' to type '" + toType + "'");
    }
    require_fresh_id(tree, newId);
    BlockTree t = tree;
    BlockNode replacement = node;
    replacement.id = newId;
    replacement.type = toType;
    auto& sibs = node_ref(t, node.parentId).children;
    sibs[index_in_siblings(t, id)] = newId;
    for (const auto& cid : replacement.children) {
        node_ref(t, cid).parentId = newId;
    }
    t.nodes.erase(id);
    t.nodes[newId] = std::move(replacement);
    return t;
}

MergeResult merge_blocks(const BlockTree& tree, const BlockId& target, const BlockId& source,
                         const BlockSchema& schema) {
    const BlockNode& into = require_block(tree, target);
    const BlockNode& from = require_block(tree, source);
    if (target == source) throw InvariantViolation("cannot merge '" + target + "' into itself");
    if (!schema.is_textual(into.type) || schema.is_structural(into.type) || !schema.is_textual(from.type)) {
        throw InvariantViolation("cannot merge '" + source + "' into '" + target + "' (" + into.type + ")");
    }
    if (!into.children.empty()) {
        throw InvariantViolation("cannot merge into '" + target + "': it has children");
    }
    if (next_sibling_id(tree, target) != source) {
        throw InvariantViolation("'" + source + "' is not the next sibling of '" + target + "'");
    }

    MergeResult r;
    r.source = from;
    r.sourceIndex = index_in_siblings(tree, source);
    r.joinOffset = into.content.text.size();
    r.childJoin = into.children.size();
    r.tree = tree;
    BlockTree& t = r.tree;
    BlockNode& dest = node_ref(t, target);
    dest.content.text += from.content.text;
    dest.children.insert(dest.children.end(), from.children.begin(), from.children.end());
    for (const auto& cid : from.children) {
        node_ref(t, cid).parentId = target;
    }
    erase_from(node_ref(t, from.parentId).children, source);
    t.nodes.erase(source);
    return r;
}

BlockTree unmerge_blocks(const BlockTree& tree, const BlockId& target, const BlockNode& source,
                         size_t sourceIndex, size_t joinOffset, size_t childJoin) {
    require_block(tree, target);
    require_fresh_id(tree, source.id);
    BlockTree t = tree;
    BlockNode& dest = node_ref(t, target);
    if (dest.content.text.size() < joinOffset || dest.content.text.compare(joinOffset, std::string::npos,
                                                                           source.content.text) != 0) {
        throw InvariantViolation("cannot unmerge '" + source.id + "': text of '" + target + "' changed");
    }
    if (dest.children.size() < childJoin ||
        !std::equal(dest.children.begin() + static_cast<std::ptrdiff_t>(childJoin), dest.children.end(),
                    source.children.begin(), source.children.end())) {
        throw InvariantViolation("cannot unmerge '" + source.id + "': children of '" + target + "' changed");
    }
    dest.content.text.erase(joinOffset);
    dest.children.resize(childJoin);
    for (const auto& cid : source.children) {
        node_ref(t, cid).parentId = source.id;
    }
    auto& sibs = node_ref(t, source.parentId).children;
    if (sourceIndex > sibs.size()) throw InvariantViolation("cannot unmerge '" + source.id + "': bad index");
    sibs.insert(sibs.begin() + static_cast<std::ptrdiff_t>(sourceIndex), source.id);
    t.nodes[source.id] = source;
    return t;
}

BlockTree set_content(const BlockTree& tree, const BlockId& id, const Content& content) {
    require_block(tree, id);
    BlockTree t = tree;
    node_ref(t, id).content = content;
    return t;
}

BlockTree set_collapsed(const BlockTree& tree, const BlockId& id, bool collapsed) {
    require_block(tree, id);
    BlockTree t = tree;
    node_ref(t, id).content.collapsed = collapsed;
    return t;
}

} // namespace block
