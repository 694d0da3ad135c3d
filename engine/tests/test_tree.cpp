#include "test_helpers.hpp"

#include "block_engine/errors.hpp"
#include "block_engine/tree_utils.hpp"

using namespace block;
using namespace block_test;

// root -> [A -> [A1 -> [A1a], A2], B]
static BlockTree sample() {
    BlockTree t = doc();
    add(t, "A", "root");
    add(t, "A1", "A");
    add(t, "A1a", "A1");
    add(t, "A2", "A");
    add(t, "B", "root");
    return t;
}

static void test_make_document() {
    SequentialIdGenerator ids("n");
    BlockTree t = make_document(ids);
    verify_invariants(t);
    assert_eq(t.rootId, "root", "root id");
    assert_eq_size(children(t, "root").size(), 1, "one top-level block");
    assert_eq(children(t, "root")[0], "n1", "first id from generator");
    assert_eq(t.nodes.at("n1").type, "paragraph", "first block is a paragraph");
    assert_true(ids.issued() == 1, "one id issued");
}

static void test_lookup_and_siblings() {
    BlockTree t = sample();
    assert_true(contains(t, "A1a"), "contains A1a");
    assert_true(!contains(t, "Z"), "no Z");
    assert_true(is_root(t, "root"), "root is root");
    assert_throws<NotFoundError>([&] { node_at(t, "Z"); }, "node_at unknown");
    assert_throws<NotFoundError>([&] { siblings_cref(t, "root"); }, "root has no siblings");

    assert_eq_size(index_in_siblings(t, "A2"), 1, "A2 index");
    assert_eq(prev_sibling_id(t, "A2"), "A1", "prev of A2");
    assert_eq(next_sibling_id(t, "A1"), "A2", "next of A1");
    assert_eq(prev_sibling_id(t, "A"), "", "A has no prev");
    assert_eq(next_sibling_id(t, "B"), "", "B has no next");
}

static void test_orders_and_visibility() {
    BlockTree t = sample();
    assert_ids(document_order(t), { "A", "A1", "A1a", "A2", "B" }, "document order");
    assert_ids(visible_order(t), { "A", "A1", "A1a", "A2", "B" }, "all visible");

    t.nodes.at("A1").content.collapsed = true;
    assert_ids(visible_order(t), { "A", "A1", "A2", "B" }, "A1 children hidden");
    assert_true(is_hidden(t, "A1a"), "A1a hidden");
    assert_true(!is_hidden(t, "A1"), "collapsed block itself visible");
    assert_eq(next_visible_id(t, "A1"), "A2", "next visible skips hidden range");
    assert_eq(prev_visible_id(t, "A2"), "A1", "prev visible skips hidden range");
    assert_eq(prev_visible_id(t, "A"), "", "nothing before A");
    assert_eq(next_visible_id(t, "B"), "", "nothing after B");
}

static void test_ancestry() {
    BlockTree t = sample();
    assert_ids(ancestors_to_root(t, "A1a"), { "root", "A", "A1", "A1a" }, "ancestors");
    assert_true(depth_of(t, "root") == 0, "root depth");
    assert_true(depth_of(t, "A") == 1, "top-level depth");
    assert_true(depth_of(t, "A1a") == 3, "A1a depth");
    assert_true(subtree_height(t, "A") == 2, "A height");
    assert_true(subtree_height(t, "B") == 0, "leaf height");
    assert_true(is_descendant_of(t, "A1a", "A"), "A1a under A");
    assert_true(!is_descendant_of(t, "B", "A"), "B not under A");
}

static void test_check_invariants() {
    BlockTree t = sample();
    assert_true(check_invariants(t).empty(), "sample is well-formed");

    BlockTree orphan = t;
    orphan.nodes.at("A").children.pop_back();
    assert_true(!check_invariants(orphan).empty(), "A2 dropped from A.children");

    BlockTree badParent = t;
    badParent.nodes.at("A2").parentId = "B";
    assert_true(!check_invariants(badParent).empty(), "parent link mismatch");

    BlockTree cyc = t;
    cyc.nodes.at("A1a").children.push_back("A");
    assert_true(!check_invariants(cyc).empty(), "cycle");

    BlockTree empty = doc();
    assert_true(!check_invariants(empty).empty(), "childless root");

    BlockTree dup = t;
    dup.nodes.at("B").children.push_back("A1a");
    assert_true(!check_invariants(dup).empty(), "block listed twice");
}

int main() {
    test_make_document();
    test_lookup_and_siblings();
    test_orders_and_visibility();
    test_ancestry();
    test_check_invariants();
    std::cout << "All tree tests passed\n";
    return 0;
}
