#include "test_helpers.hpp"

#include "block_engine/errors.hpp"
#include "block_engine/mode.hpp"
#include "block_engine/resolver.hpp"
#include "block_engine/schema.hpp"

using namespace block;
using namespace block_test;

struct Fixture {
    BlockSchema schema = BlockSchema::defaults();
    SequentialIdGenerator ids{ "n" };
    ModeManager modes;
    IntentResolver resolver{ schema, ids, 8 };
};

static void expect_cursor(const Resolution& r, const BlockId& id, Placement placement, const char* msg) {
    assert_true(r.cursor.has_value(), msg);
    assert_eq(r.cursor->blockId, id, msg);
    assert_eq(to_string(r.cursor->placement), to_string(placement), msg);
}

int main() {
    // 1) delete-block cursor law through the resolver
    {
        Fixture f;
        BlockTree t = doc();
        add(t, "P", "root", "paragraph", "prev");
        add(t, "A", "root");
        add(t, "K", "A");
        add(t, "N", "root");

        Resolution r = f.resolver.resolve(delete_intent("A"), t, std::nullopt, f.modes);
        assert_true(r.command != nullptr, "command produced");
        verify_invariants(r.tree);
        expect_cursor(r, "K", Placement::Start, "first promoted child");

        r = f.resolver.resolve(delete_intent("N"), t, std::nullopt, f.modes);
        expect_cursor(r, "A", Placement::End, "previous sibling");

        r = f.resolver.resolve(delete_intent("P"), t, std::nullopt, f.modes);
        expect_cursor(r, "A", Placement::Start, "following sibling");

        r = f.resolver.resolve(delete_intent("K"), t, std::nullopt, f.modes);
        expect_cursor(r, "A", Placement::End, "parent");

        assert_throws<NotFoundError>([&] { f.resolver.resolve(delete_intent("ghost"), t, std::nullopt, f.modes); },
                                     "missing target");
    }

    // 2) create-* and split: new block, fresh id, cursor at its start
    {
        Fixture f;
        BlockTree t = doc();
        add(t, "H", "root", "heading", "Title");
        add(t, "T", "root", "toggle", "Toggle");
        add(t, "T1", "T");

        Resolution below = f.resolver.resolve(create_sibling_below_intent("H"), t, std::nullopt, f.modes);
        assert_ids(children(below.tree, "root"), { "H", "n1", "T" }, "sibling below");
        assert_eq(below.tree.nodes.at("n1").type, "paragraph", "heading continues as paragraph");
        expect_cursor(below, "n1", Placement::Start, "new block start");

        Resolution above = f.resolver.resolve(create_sibling_above_intent("H"), t, std::nullopt, f.modes);
        assert_ids(children(above.tree, "root"), { "n2", "H", "T" }, "sibling above");

        Resolution child = f.resolver.resolve(create_child_intent("T"), t, std::nullopt, f.modes);
        assert_ids(children(child.tree, "T"), { "n3", "T1" }, "first child of the container");
        assert_eq(child.tree.nodes.at("n3").type, "paragraph", "toggle children are paragraphs");

        Resolution typed = f.resolver.resolve(create_sibling_below_intent("H", "code"), t, std::nullopt, f.modes);
        assert_eq(typed.tree.nodes.at("n4").type, "code", "type override");

        Resolution split = f.resolver.resolve(split_intent("H", 3), t, std::nullopt, f.modes);
        assert_eq(split.tree.nodes.at("H").content.text, "Tit", "head");
        assert_eq(split.tree.nodes.at("n5").content.text, "le", "tail");
        expect_cursor(split, "n5", Placement::Start, "split cursor");

        assert_throws<NotFoundError>(
            [&] { f.resolver.resolve(create_sibling_below_intent("root"), t, std::nullopt, f.modes); },
            "no siblings for the root");
    }

    // 3) indent/outdent/convert/merge keep the caret in the same (or replacing) block
    {
        Fixture f;
        BlockTree t = doc();
        add(t, "A", "root", "paragraph", "abc");
        add(t, "B", "root", "paragraph", "def");
        add(t, "L", "root", "bullet_list", "item");

        CursorTarget caret{ "B", Placement::Offset, 2 };
        Resolution in = f.resolver.resolve(indent_intent("B"), t, caret, f.modes);
        assert_eq(parent(in.tree, "B"), "A", "indented");
        assert_true(in.cursor == caret, "offset preserved");

        CursorTarget onL{ "L", Placement::Offset, 1 };
        Resolution out = f.resolver.resolve(outdent_intent("L"), t, onL, f.modes);
        assert_true(!contains(out.tree, "L"), "top-level list converted");
        BlockId replaced = children(out.tree, "root")[2];
        assert_eq(out.tree.nodes.at(replaced).type, "paragraph", "lower form");
        assert_eq(out.cursor->blockId, replaced, "cursor follows new id");
        assert_true(out.cursor->offset == 1, "same offset");

        Resolution merged = f.resolver.resolve(merge_intent("A", "B"), t, CursorTarget{ "B", Placement::Start, 0 },
                                               f.modes);
        assert_eq(merged.tree.nodes.at("A").content.text, "abcdef", "merged");
        expect_cursor(merged, "A", Placement::Offset, "cursor at join");
        assert_true(merged.cursor->offset == 3, "join offset");

        Resolution conv = f.resolver.resolve(convert_intent("A", "heading"), t, CursorTarget{ "A", Placement::End, 0 },
                                             f.modes);
        BlockId h = children(conv.tree, "root")[0];
        assert_eq(conv.tree.nodes.at(h).type, "heading", "converted");
        assert_true(h != "A", "conversion regenerates the id");
        expect_cursor(conv, h, Placement::End, "placement carried over");
    }

    // 4) noop and boundary no-ops: no command, cursor unchanged
    {
        Fixture f;
        BlockTree t = doc();
        add(t, "A", "root");
        CursorTarget caret{ "A", Placement::Offset, 0 };

        Resolution n = f.resolver.resolve(noop_intent(), t, caret, f.modes);
        assert_true(!n.command, "noop has no command");
        assert_true(n.tree == t && n.cursor == caret, "noop changes nothing");

        Resolution edge = f.resolver.resolve(indent_intent("A"), t, caret, f.modes);
        assert_true(!edge.command, "indent of the first block does nothing");

        Resolution toggle = f.resolver.resolve(toggle_collapse_intent("A"), t, caret, f.modes);
        assert_true(toggle.command && toggle.tree.nodes.at("A").content.collapsed, "collapsed");
        assert_true(toggle.cursor == caret, "caret stays");
    }

    // 5) interaction modes gate structural intents
    {
        Fixture f;
        BlockTree t = doc();
        add(t, "A", "root");
        add(t, "B", "root");

        f.modes.push(InteractionMode::ComposingIme);
        Resolution r = f.resolver.resolve(delete_intent("B"), t, std::nullopt, f.modes);
        assert_true(!r.command && r.refused == 1, "refused while composing");
        assert_true(r.tree == t, "tree untouched");
        f.modes.pop();
        assert_true(f.modes.current() == InteractionMode::Idle, "back to idle");

        f.modes.set(InteractionMode::Command);
        assert_true(f.modes.is_intent_allowed(IntentKind::ConvertBlock), "palette converts");
        assert_true(!f.modes.is_intent_allowed(IntentKind::DeleteBlock), "palette does not delete");
        f.modes.set(InteractionMode::Dragging);
        assert_true(f.modes.is_intent_allowed(IntentKind::Noop), "noop always allowed");
        f.modes.reset();
        assert_true(f.modes.is_intent_allowed(IntentKind::DeleteBlock), "idle allows everything");
    }

    // 6) batches: one command, deletes last in reverse document order, outdents keep order
    {
        Fixture f;
        BlockTree t = doc();
        add(t, "X", "root");
        add(t, "A", "root");
        add(t, "B", "A");
        add(t, "Y", "root");

        Resolution del = f.resolver.resolve_all({ delete_intent("A"), delete_intent("B") }, t, std::nullopt, f.modes);
        verify_invariants(del.tree);
        assert_ids(children(del.tree, "root"), { "X", "Y" }, "parent and child deleted");
        assert_eq_size(del.command->size(), 2, "one group, two commands");
        assert_true(del.command->undo(del.tree) == t, "group undo restores");

        auto ordered = f.resolver.order_batch({ delete_intent("A"), indent_intent("Y"), delete_intent("B") }, t);
        assert_true(ordered[0].kind == IntentKind::IndentBlock, "non-deletes first");
        assert_eq(ordered[1].blockId, "B", "deepest delete first");
        assert_eq(ordered[2].blockId, "A", "then its parent");

        BlockTree nested = doc();
        add(nested, "P", "root");
        add(nested, "C1", "P");
        add(nested, "C2", "P");
        Resolution out = f.resolver.resolve_all({ outdent_intent("C1"), outdent_intent("C2") }, nested,
                                                std::nullopt, f.modes);
        assert_ids(children(out.tree, "root"), { "P", "C1", "C2" }, "outdented blocks keep their order");

        BlockTree flat = doc();
        add(flat, "X", "root");
        add(flat, "Y", "root");
        LogCapture logs(LogLevel::Warn);
        Resolution all = f.resolver.resolve_all({ delete_intent("X"), delete_intent("Y") }, flat, std::nullopt,
                                                f.modes);
        assert_true(all.rejected == 1, "last block refuses to go");
        assert_eq_size(children(all.tree, "root").size(), 1, "one block survives");
        assert_true(logs.count(LogLevel::Warn, "resolver") == 1, "rejection logged");
    }

    // 7) replaying a resolved command reuses its ids
    {
        Fixture f;
        BlockTree t = doc();
        add(t, "A", "root", "paragraph", "hello");
        Resolution r = f.resolver.resolve(split_intent("A", 2), t, std::nullopt, f.modes);
        BlockTree undone = r.command->undo(r.tree);
        assert_true(undone == t, "undo split");
        BlockTree again = r.command->apply(undone);
        assert_true(again == r.tree, "redo split is identical");
        assert_true(f.ids.issued() == 1, "no id drawn on replay");
    }

    std::cout << "All resolver tests passed\n";
    return 0;
}
