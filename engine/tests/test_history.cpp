#include "test_helpers.hpp"

#include "block_engine/commands.hpp"
#include "block_engine/engine.hpp"
#include "block_engine/errors.hpp"
#include "block_engine/history.hpp"

#include <memory>
#include <random>

using namespace block;
using namespace block_test;

static EngineConfig quiet_config() {
    EngineConfig cfg;
    cfg.logLevel = LogLevel::Off;
    return cfg;
}

// Random structural command against the current tree.
static std::unique_ptr<Command> random_command(std::mt19937& rng, Engine& engine) {
    auto pool = document_order(engine.tree());
    std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
    BlockId id = pool[pick(rng)];
    const BlockTree& t = engine.tree();
    std::uniform_int_distribution<int> op(0, 7);
    switch (op(rng)) {
        case 0: return std::make_unique<SplitBlockCommand>(id, 1, engine.ids().next(), engine.schema());
        case 1: {
            CreateSpec spec;
            spec.type = "bullet_list";
            spec.parentId = id;
            spec.index = 0;
            return std::make_unique<CreateBlockCommand>(spec, engine.ids().next());
        }
        case 2: return std::make_unique<IndentBlockCommand>(id, engine.schema(), 8);
        case 3: return std::make_unique<OutdentBlockCommand>(id, engine.schema(), engine.ids().next());
        case 4: return std::make_unique<MoveBlockCommand>(id, MoveDirection::Up);
        case 5: return std::make_unique<MoveBlockCommand>(id, MoveDirection::Down);
        case 6: return std::make_unique<DeleteBlockCommand>(id);
        default: return std::make_unique<SetCollapsedCommand>(id, !t.nodes.at(id).content.collapsed);
    }
}

int main() {
    // 1) Full round trip of a delete: undo restores A with its children, redo deletes again
    {
        Engine engine(quiet_config());
        BlockTree t = doc();
        add(t, "A", "root");
        add(t, "C1", "A");
        add(t, "C2", "A");
        engine.load(t);

        engine.dispatch(std::make_unique<DeleteBlockCommand>("A"));
        BlockTree deleted = engine.tree();
        assert_ids(children(deleted, "root"), { "C1", "C2" }, "children promoted");
        assert_true(engine.can_undo() && !engine.can_redo(), "one undo step");

        assert_true(engine.undo(), "undo");
        verify_invariants(engine.tree());
        assert_ids(children(engine.tree(), "A"), { "C1", "C2" }, "A children restored");
        assert_eq(parent(engine.tree(), "C1"), "A", "C1 back under A");
        assert_eq(parent(engine.tree(), "C2"), "A", "C2 back under A");
        assert_ids(children(engine.tree(), "root"), { "A" }, "root children restored");
        assert_true(engine.tree() == t, "exact pre-delete state");

        assert_true(engine.redo(), "redo");
        assert_true(engine.tree() == deleted, "redo reproduces deleted state");
        assert_true(!engine.redo(), "redo stack empty");
    }

    // 2) Engine-level delete returns outcome, null on failure
    {
        Engine engine(quiet_config());
        BlockTree t = doc();
        add(t, "A", "root");
        add(t, "K", "A");
        add(t, "B", "root");
        engine.load(t);

        auto outcome = engine.delete_block("A");
        assert_true(outcome.has_value(), "delete A");
        assert_eq(outcome->deletedBlock.id, "A", "deleted block");
        assert_ids(outcome->promotedChildren, { "K" }, "promoted");
        assert_true(engine.cursor().has_value() && engine.cursor()->blockId == "K", "cursor on first promoted child");
        assert_true(engine.cursor()->placement == Placement::Start, "at its start");

        assert_true(!engine.delete_block("ghost").has_value(), "missing block");
        assert_true(!engine.delete_block("root").has_value(), "root");
        assert_true(engine.get_block("A") == nullptr, "A gone");
        assert_true(engine.get_block("K") != nullptr, "K present");
        assert_true(!engine.has_children("K"), "K childless");
    }

    // 3) A throwing command leaves tree and history untouched
    {
        Engine engine(quiet_config());
        engine.new_document();
        BlockTree before = engine.tree();
        BlockId only = children(before, "root")[0];
        assert_throws<InvariantViolation>([&] { engine.dispatch(std::make_unique<DeleteBlockCommand>(only)); },
                                          "last block");
        assert_true(engine.tree() == before, "tree unchanged");
        assert_true(!engine.can_undo(), "nothing recorded");

        // no-op commands are not recorded either
        engine.dispatch(std::make_unique<IndentBlockCommand>(only, engine.schema(), 8));
        assert_true(!engine.can_undo(), "no-op indent not recorded");
    }

    // 4) Not ready
    {
        Engine engine(quiet_config());
        assert_true(!engine.ready(), "not ready before load");
        assert_throws<EngineNotReady>([&] { engine.tree(); }, "tree() before load");
        assert_throws<EngineNotReady>([&] { engine.dispatch(std::make_unique<DeleteBlockCommand>("x")); },
                                      "dispatch before load");
        assert_true(!engine.undo(), "undo before load");
        assert_true(engine.get_block("x") == nullptr, "get_block before load");

        BlockTree bad = doc();
        assert_throws<InvariantViolation>([&] { engine.load(bad); }, "empty document rejected");
        assert_true(!engine.ready(), "still not ready");
    }

    // 5) Command group is a single undo step
    {
        Engine engine(quiet_config());
        BlockTree t = doc();
        add(t, "A", "root", "paragraph", "one");
        add(t, "B", "root", "paragraph", "two");
        add(t, "C", "root", "paragraph", "three");
        engine.load(t);

        auto group = std::make_unique<CommandGroup>("tab");
        group->add(std::make_unique<IndentBlockCommand>("B", engine.schema(), 8));
        group->add(std::make_unique<IndentBlockCommand>("C", engine.schema(), 8));
        engine.dispatch(std::move(group));
        assert_ids(children(engine.tree(), "A"), { "B", "C" }, "both indented");
        assert_true(engine.undo(), "undo group");
        assert_true(engine.tree() == t, "group undone at once");
        assert_true(!engine.can_undo(), "single step");
    }

    // 6) History limit drops the oldest entries
    {
        EngineConfig cfg = quiet_config();
        cfg.historyLimit = 3;
        Engine engine(cfg);
        engine.new_document();
        BlockId first = children(engine.tree(), "root")[0];
        for (int i = 0; i < 5; ++i) {
            engine.dispatch(std::make_unique<SetCollapsedCommand>(first, i % 2 == 0));
        }
        int undone = 0;
        while (engine.undo()) ++undone;
        assert_true(undone == 3, "only three steps kept");

        History h(2);
        assert_true(h.limit() == 2, "limit");
        h.set_limit(0);
        assert_true(h.limit() == 0, "unbounded");
    }

    // 7) Change listeners
    {
        Engine engine(quiet_config());
        int calls = 0;
        size_t sub = engine.on_change([&](const Engine& e) {
            assert_true(e.ready(), "listener sees a ready engine");
            ++calls;
        });
        engine.new_document();
        BlockId first = children(engine.tree(), "root")[0];
        engine.dispatch(std::make_unique<SetCollapsedCommand>(first, true));
        engine.undo();
        engine.redo();
        assert_true(calls == 4, "load, dispatch, undo, redo");
        engine.remove_listener(sub);
        engine.undo();
        assert_true(calls == 4, "unsubscribed");
    }

    // 8) Cursor before/after travels with history
    {
        Engine engine(quiet_config());
        engine.new_document();
        BlockId first = children(engine.tree(), "root")[0];
        CursorTarget before{ first, Placement::Offset, 0 };
        CursorTarget after{ "n-new", Placement::Start, 0 };
        CreateSpec spec;
        spec.type = "paragraph";
        spec.parentId = "root";
        spec.index = 1;
        engine.dispatch(std::make_unique<CreateBlockCommand>(spec, "n-new"), before, after);
        assert_true(engine.cursor() == after, "cursor after dispatch");
        engine.undo();
        assert_true(engine.cursor() == before, "cursor restored by undo");
        engine.redo();
        assert_true(engine.cursor() == after, "cursor re-applied by redo");
    }

    // 9) Property: dispatch n, undo n, redo n never drifts
    {
        std::mt19937 rng(4242u);
        for (int round = 0; round < 30; ++round) {
            Engine engine(quiet_config(), std::make_unique<SequentialIdGenerator>("r" + std::to_string(round) + "_"));
            engine.new_document();
            std::vector<BlockTree> states{ engine.tree() };
            for (int i = 0; i < 40; ++i) {
                size_t depth = engine.history().undo_size();
                try {
                    engine.dispatch(random_command(rng, engine));
                } catch (const Error&) {
                    // rejected command: nothing recorded
                }
                verify_invariants(engine.tree());
                if (engine.history().undo_size() > depth) states.push_back(engine.tree());
            }
            size_t n = states.size() - 1;
            for (size_t k = n; k > 0; --k) {
                assert_true(engine.undo(), "undo available");
                verify_invariants(engine.tree());
                assert_true(engine.tree() == states[k - 1], "undo matches recorded state");
            }
            assert_true(!engine.undo(), "undo stack exhausted");
            for (size_t k = 1; k <= n; ++k) {
                assert_true(engine.redo(), "redo available");
                assert_true(engine.tree() == states[k], "redo matches recorded state");
            }
            // interleaved cycles
            for (int c = 0; c < 5 && n > 0; ++c) {
                engine.undo();
                engine.undo();
                engine.redo();
                engine.redo();
                assert_true(engine.tree() == states[n], "undo/redo cycles do not drift");
            }
        }
    }

    std::cout << "All history tests passed\n";
    return 0;
}
