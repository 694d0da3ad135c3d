#pragma once

#include "block_engine/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace block {

// Node lookup; both throw NotFoundError for unknown ids.
const BlockNode& node_at(const BlockTree& t, const BlockId& id);
BlockNode& node_ref(BlockTree& t, const BlockId& id);

bool contains(const BlockTree& t, const BlockId& id);
bool is_root(const BlockTree& t, const BlockId& id);

// Sibling container helpers (the parent's children list)
std::vector<BlockId>& siblings_ref(BlockTree& t, const BlockId& id);
const std::vector<BlockId>& siblings_cref(const BlockTree& t, const BlockId& id);
std::size_t index_in_siblings(const BlockTree& t, const BlockId& id);
BlockId prev_sibling_id(const BlockTree& t, const BlockId& id);
BlockId next_sibling_id(const BlockTree& t, const BlockId& id);

// Container editing helpers
void insert_after(std::vector<BlockId>& vec, const BlockId& existing, const BlockId& newcomer);
void insert_before(std::vector<BlockId>& vec, const BlockId& existing, const BlockId& newcomer);
void erase_from(std::vector<BlockId>& vec, const BlockId& id);

// Ordering, visibility and ancestry helpers. Orders never include the root.
std::vector<BlockId> document_order(const BlockTree& t);
std::vector<BlockId> visible_order(const BlockTree& t);
bool is_hidden(const BlockTree& t, const BlockId& id);
BlockId prev_visible_id(const BlockTree& t, const BlockId& id);
BlockId next_visible_id(const BlockTree& t, const BlockId& id);
std::vector<BlockId> ancestors_to_root(const BlockTree& t, const BlockId& id);
int depth_of(const BlockTree& t, const BlockId& id);
int subtree_height(const BlockTree& t, const BlockId& id);
bool is_descendant_of(const BlockTree& t, const BlockId& candidate, const BlockId& ancestor);

// Structural well-formedness: returns one message per violation, empty when
// the tree satisfies parent/children linkage, acyclicity, reachability and
// root non-emptiness.
std::vector<std::string> check_invariants(const BlockTree& t);

// Fresh document: root(doc) -> [paragraph].
BlockTree make_document(IdGenerator& ids);

} // namespace block
