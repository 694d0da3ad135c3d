#include "block_engine/tree_utils.hpp"
#include "block_engine/errors.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace block {

const BlockNode& node_at(const BlockTree& t, const BlockId& id) {
    auto it = t.nodes.find(id);
    if (it == t.nodes.end()) throw NotFoundError(id);
    return it->second;
}

BlockNode& node_ref(BlockTree& t, const BlockId& id) {
    auto it = t.nodes.find(id);
    if (it == t.nodes.end()) throw NotFoundError(id);
    return it->second;
}

bool contains(const BlockTree& t, const BlockId& id) {
    return t.nodes.find(id) != t.nodes.end();
}

bool is_root(const BlockTree& t, const BlockId& id) {
    return !id.empty() && id == t.rootId;
}

std::vector<BlockId>& siblings_ref(BlockTree& t, const BlockId& id) {
    const BlockNode& node = node_at(t, id);
    if (node.parentId.empty()) {
        throw NotFoundError(id, "root block '" + id + "' has no siblings");
    }
    return node_ref(t, node.parentId).children;
}

const std::vector<BlockId>& siblings_cref(const BlockTree& t, const BlockId& id) {
    const BlockNode& node = node_at(t, id);
    if (node.parentId.empty()) {
        throw NotFoundError(id, "root block '" + id + "' has no siblings");
    }
    return node_at(t, node.parentId).children;
}

size_t index_in_siblings(const BlockTree& t, const BlockId& id) {
    const auto& sibs = siblings_cref(t, id);
    auto it = std::find(sibs.begin(), sibs.end(), id);
    if (it == sibs.end()) {
        throw InvariantViolation("block '" + id + "' is missing from its parent's children");
    }
    return static_cast<size_t>(std::distance(sibs.begin(), it));
}

BlockId prev_sibling_id(const BlockTree& t, const BlockId& id) {
    const auto& sibs = siblings_cref(t, id);
    auto idx = index_in_siblings(t, id);
    if (idx == 0) return BlockId();
    return sibs[idx - 1];
}

BlockId next_sibling_id(const BlockTree& t, const BlockId& id) {
    const auto& sibs = siblings_cref(t, id);
    auto idx = index_in_siblings(t, id);
    if (idx + 1 >= sibs.size()) return BlockId();
    return sibs[idx + 1];
}

void insert_after(std::vector<BlockId>& vec, const BlockId& existing, const BlockId& newcomer) {
    auto it = std::find(vec.begin(), vec.end(), existing);
    if (it == vec.end()) throw InvariantViolation("anchor '" + existing + "' not in container");
    vec.insert(it + 1, newcomer);
}

void insert_before(std::vector<BlockId>& vec, const BlockId& existing, const BlockId& newcomer) {
    auto it = std::find(vec.begin(), vec.end(), existing);
    if (it == vec.end()) throw InvariantViolation("anchor '" + existing + "' not in container");
    vec.insert(it, newcomer);
}

void erase_from(std::vector<BlockId>& vec, const BlockId& id) {
    auto it = std::find(vec.begin(), vec.end(), id);
    if (it == vec.end()) throw InvariantViolation("'" + id + "' not in container");
    vec.erase(it);
}

static void preorder_collect(const BlockTree& t, const BlockId& id, bool skipCollapsed,
                             std::vector<BlockId>& out) {
    const auto& node = node_at(t, id);
    out.push_back(id);
    if (skipCollapsed && node.content.collapsed) return;
    for (const auto& cid : node.children) {
        preorder_collect(t, cid, skipCollapsed, out);
    }
}

std::vector<BlockId> document_order(const BlockTree& t) {
    std::vector<BlockId> out;
    if (!contains(t, t.rootId)) return out;
    out.reserve(t.nodes.size());
    for (const auto& cid : node_at(t, t.rootId).children) {
        preorder_collect(t, cid, false, out);
    }
    return out;
}

std::vector<BlockId> visible_order(const BlockTree& t) {
    std::vector<BlockId> out;
    if (!contains(t, t.rootId)) return out;
    for (const auto& cid : node_at(t, t.rootId).children) {
        preorder_collect(t, cid, true, out);
    }
    return out;
}

bool is_hidden(const BlockTree& t, const BlockId& id) {
    BlockId cur = node_at(t, id).parentId;
    while (!cur.empty() && cur != t.rootId) {
        const auto& node = node_at(t, cur);
        if (node.content.collapsed) return true;
        cur = node.parentId;
    }
    return false;
}

BlockId prev_visible_id(const BlockTree& t, const BlockId& id) {
    auto order = visible_order(t);
    auto it = std::find(order.begin(), order.end(), id);
    if (it == order.end() || it == order.begin()) return BlockId();
    return *(it - 1);
}

BlockId next_visible_id(const BlockTree& t, const BlockId& id) {
    auto order = visible_order(t);
    auto it = std::find(order.begin(), order.end(), id);
    if (it == order.end() || it + 1 == order.end()) return BlockId();
    return *(it + 1);
}

std::vector<BlockId> ancestors_to_root(const BlockTree& t, const BlockId& id) {
    std::vector<BlockId> rev;
    if (!contains(t, id)) return {};
    BlockId cur = id;
    while (!cur.empty()) {
        rev.push_back(cur);
        if (rev.size() > t.nodes.size()) {
            throw InvariantViolation("cycle detected above '" + id + "'");
        }
        cur = node_at(t, cur).parentId;
    }
    // root..id
    std::reverse(rev.begin(), rev.end());
    return rev;
}

int depth_of(const BlockTree& t, const BlockId& id) {
    // the root itself sits at depth 0, top-level blocks at 1
    return static_cast<int>(ancestors_to_root(t, id).size()) - 1;
}

int subtree_height(const BlockTree& t, const BlockId& id) {
    int best = 0;
    for (const auto& cid : node_at(t, id).children) {
        best = std::max(best, 1 + subtree_height(t, cid));
    }
    return best;
}

bool is_descendant_of(const BlockTree& t, const BlockId& candidate, const BlockId& ancestor) {
    if (!contains(t, candidate)) return false;
    BlockId cur = node_at(t, candidate).parentId;
    size_t steps = 0;
    while (!cur.empty() && steps++ <= t.nodes.size()) {
        if (cur == ancestor) return true;
        auto it = t.nodes.find(cur);
        if (it == t.nodes.end()) return false;
        cur = it->second.parentId;
    }
    return false;
}

std::vector<std::string> check_invariants(const BlockTree& t) {
    std::vector<std::string> problems;
    auto rootIt = t.nodes.find(t.rootId);
    if (rootIt == t.nodes.end()) {
        problems.push_back("root '" + t.rootId + "' missing");
        return problems;
    }
    if (!rootIt->second.parentId.empty()) problems.push_back("root has a parent");
    if (rootIt->second.type != "doc") problems.push_back("root type is not 'doc'");
    if (rootIt->second.children.empty()) problems.push_back("root has no top-level block");

    // every node must appear in exactly one children list (the root in none)
    std::unordered_map<BlockId, int> containCount;
    for (const auto& kv : t.nodes) {
        std::unordered_set<BlockId> childset;
        for (const auto& cid : kv.second.children) {
            if (!childset.insert(cid).second) {
                problems.push_back("duplicate child '" + cid + "' under '" + kv.first + "'");
            }
            containCount[cid] += 1;
            auto itc = t.nodes.find(cid);
            if (itc == t.nodes.end()) {
                problems.push_back("child '" + cid + "' of '" + kv.first + "' does not exist");
            } else if (itc->second.parentId != kv.first) {
                problems.push_back("child '" + cid + "' has parentId '" + itc->second.parentId +
                                   "', expected '" + kv.first + "'");
            }
        }
    }
    for (const auto& kv : t.nodes) {
        if (kv.first != kv.second.id) problems.push_back("key '" + kv.first + "' holds node '" + kv.second.id + "'");
        int c = containCount.count(kv.first) ? containCount[kv.first] : 0;
        if (kv.first == t.rootId) {
            if (c != 0) problems.push_back("root listed as a child");
            continue;
        }
        if (c != 1) problems.push_back("'" + kv.first + "' contained " + std::to_string(c) + " times");
        if (kv.second.parentId.empty() || t.nodes.find(kv.second.parentId) == t.nodes.end()) {
            problems.push_back("'" + kv.first + "' has dangling parentId '" + kv.second.parentId + "'");
        }
    }

    // reachability from the root bounds every parent chain, so no cycles
    std::unordered_set<BlockId> seen;
    std::vector<BlockId> stack{ t.rootId };
    while (!stack.empty()) {
        BlockId id = stack.back();
        stack.pop_back();
        if (!seen.insert(id).second) {
            problems.push_back("'" + id + "' reached twice (cycle)");
            continue;
        }
        auto it = t.nodes.find(id);
        if (it == t.nodes.end()) continue;
        for (const auto& cid : it->second.children) stack.push_back(cid);
    }
    if (seen.size() != t.nodes.size()) {
        problems.push_back(std::to_string(t.nodes.size() - std::min(seen.size(), t.nodes.size())) +
                           " node(s) unreachable from root");
    }
    return problems;
}

BlockTree make_document(IdGenerator& ids) {
    BlockTree t;
    t.rootId = "root";
    BlockNode root{ t.rootId, "doc", "", {}, {} };
    BlockNode first{ ids.next(), "paragraph", t.rootId, {}, {} };
    root.children.push_back(first.id);
    t.nodes[root.id] = root;
    t.nodes[first.id] = first;
    return t;
}

} // namespace block
