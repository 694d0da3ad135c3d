#include "block_engine/rules.hpp"
#include "block_engine/laws.hpp"
#include "block_engine/tree_utils.hpp"

#include <algorithm>

namespace block {

static const BlockNode& caret_node(const RuleContext& ctx) {
    return node_at(ctx.tree, ctx.blockId);
}

static bool is_top_level(const RuleContext& ctx) {
    return caret_node(ctx).parentId == ctx.tree.rootId;
}

static bool is_list(const std::string& type) {
    return type == "bullet_list" || type == "numbered_list" || type == "task_list";
}

static bool is_wrapper(const std::string& type) {
    return type == "quote" || type == "callout";
}

// Selected blocks when there is a block selection, the caret block otherwise.
static std::vector<BlockId> targets(const RuleContext& ctx) {
    if (!ctx.selection.empty()) return ctx.selection;
    return { ctx.blockId };
}

static BlockId prev_in_document(const BlockTree& t, const BlockId& id) {
    auto order = document_order(t);
    auto it = std::find(order.begin(), order.end(), id);
    if (it == order.end() || it == order.begin()) return {};
    return *(it - 1);
}

static Rule make_rule(std::string id, int priority, std::function<bool(const RuleContext&)> when,
                      std::function<RuleResult(const RuleContext&)> execute) {
    Rule r;
    r.id = std::move(id);
    r.priority = priority;
    r.when = std::move(when);
    r.execute = std::move(execute);
    return r;
}

std::vector<Rule> default_enter_rules() {
    std::vector<Rule> rules;

    rules.push_back(make_rule("enter:onSelectedBlocks", 1000,
        [](const RuleContext& ctx) { return !ctx.selection.empty(); },
        [](const RuleContext& ctx) {
            return RuleResult::of(create_sibling_below_intent(ctx.selection.back(), "paragraph"));
        }));

    // closed subtree boundary: Enter at the end of an expanded parent adds a
    // sibling instead of touching the established children
    rules.push_back(make_rule("enter:atEndOfParent", 125,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            return ctx.event.atEnd && !n.children.empty() && !n.content.collapsed;
        },
        [](const RuleContext& ctx) { return RuleResult::of(create_sibling_below_intent(ctx.blockId)); }));

    // a collapsed container never takes a child: it would land in the hidden range
    rules.push_back(make_rule("enter:containerCreatesChild", 120,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            return !ctx.event.isEmpty && ctx.schema.can_have_children(n.type) && !n.content.collapsed;
        },
        [](const RuleContext& ctx) { return RuleResult::of(create_child_intent(ctx.blockId)); }));

    rules.push_back(make_rule("enter:exitEmptyNested", 115,
        [](const RuleContext& ctx) { return ctx.event.isEmpty && !is_top_level(ctx); },
        [](const RuleContext& ctx) { return RuleResult::of(outdent_intent(ctx.blockId)); }));

    // the new sibling lands after the collapsed block's whole hidden range
    rules.push_back(make_rule("enter:skipHiddenBlocks", 95,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            return ctx.event.atEnd && n.content.collapsed && !n.children.empty();
        },
        [](const RuleContext& ctx) { return RuleResult::of(create_sibling_below_intent(ctx.blockId)); }));

    rules.push_back(make_rule("enter:exitEmptyList", 85,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            return ctx.event.isEmpty && is_list(n.type) && !ctx.schema.lower_form(n.type).empty();
        },
        [](const RuleContext& ctx) {
            return RuleResult::of(convert_intent(ctx.blockId, ctx.schema.lower_form(caret_node(ctx).type)));
        }));

    rules.push_back(make_rule("enter:exitEmptyHeading", 80,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            return ctx.event.isEmpty && n.type == "heading" && !ctx.schema.lower_form(n.type).empty();
        },
        [](const RuleContext& ctx) {
            return RuleResult::of(convert_intent(ctx.blockId, ctx.schema.lower_form(caret_node(ctx).type)));
        }));

    rules.push_back(make_rule("enter:exitEmptyWrapper", 70,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            return ctx.event.isEmpty && is_wrapper(n.type) && !ctx.schema.lower_form(n.type).empty();
        },
        [](const RuleContext& ctx) {
            return RuleResult::of(convert_intent(ctx.blockId, ctx.schema.lower_form(caret_node(ctx).type)));
        }));

    rules.push_back(make_rule("enter:structuralLaw", -1000,
        [](const RuleContext&) { return true; },
        [](const RuleContext& ctx) {
            EnterContext ec;
            ec.isEmpty = ctx.event.isEmpty;
            ec.atStart = ctx.event.atStart;
            ec.atEnd = ctx.event.atEnd;
            const auto& n = caret_node(ctx);
            ec.canHaveChildren = ctx.schema.can_have_children(n.type) && !n.content.collapsed;
            switch (resolve_structural_enter(ec)) {
                case IntentKind::CreateChild: return RuleResult::of(create_child_intent(ctx.blockId));
                case IntentKind::CreateSiblingAbove: return RuleResult::of(create_sibling_above_intent(ctx.blockId));
                case IntentKind::SplitBlock: return RuleResult::of(split_intent(ctx.blockId, ctx.event.offset));
                default: return RuleResult::of(create_sibling_below_intent(ctx.blockId));
            }
        }));

    return rules;
}

std::vector<Rule> default_backspace_rules() {
    std::vector<Rule> rules;

    rules.push_back(make_rule("backspace:deleteSelectedBlocks", 1000,
        [](const RuleContext& ctx) { return !ctx.selection.empty(); },
        [](const RuleContext& ctx) {
            std::vector<Intent> intents;
            for (const auto& id : ctx.selection) intents.push_back(delete_intent(id));
            return RuleResult::of(std::move(intents));
        }));

    rules.push_back(make_rule("backspace:outdentEmptyNestedList", 120,
        [](const RuleContext& ctx) {
            return ctx.event.atStart && ctx.event.isEmpty && is_list(caret_node(ctx).type) && !is_top_level(ctx);
        },
        [](const RuleContext& ctx) { return RuleResult::of(outdent_intent(ctx.blockId)); }));

    rules.push_back(make_rule("backspace:normalizeEmptyBlock", 110,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            return ctx.event.atStart && ctx.event.isEmpty && n.type != "paragraph" &&
                   !ctx.schema.lower_form(n.type).empty();
        },
        [](const RuleContext& ctx) {
            return RuleResult::of(convert_intent(ctx.blockId, ctx.schema.lower_form(caret_node(ctx).type)));
        }));

    rules.push_back(make_rule("backspace:deleteEmptyParagraph", 100,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            if (!ctx.event.atStart || !ctx.event.isEmpty || n.type != "paragraph") return false;
            return ctx.tree.nodes.size() > 2; // root plus this block
        },
        [](const RuleContext& ctx) { return RuleResult::of(delete_intent(ctx.blockId)); }));

    // hidden content is never deleted from a visible caret
    rules.push_back(make_rule("backspace:skipHiddenBlocks", 95,
        [](const RuleContext& ctx) {
            if (!ctx.event.atStart) return false;
            BlockId prev = prev_in_document(ctx.tree, ctx.blockId);
            return !prev.empty() && is_hidden(ctx.tree, prev);
        },
        [](const RuleContext&) { return RuleResult::of(noop_intent()); }));

    rules.push_back(make_rule("backspace:guardStructuralBlock", 70,
        [](const RuleContext& ctx) {
            if (!ctx.event.atStart || caret_node(ctx).type != "paragraph") return false;
            BlockId prev = prev_sibling_id(ctx.tree, ctx.blockId);
            return !prev.empty() && ctx.schema.is_structural(node_at(ctx.tree, prev).type);
        },
        [](const RuleContext&) { return RuleResult::direct(true); }));

    rules.push_back(make_rule("backspace:mergeWithPrevious", 60,
        [](const RuleContext& ctx) {
            const auto& n = caret_node(ctx);
            if (!ctx.event.atStart || ctx.event.isEmpty || !n.children.empty()) return false;
            BlockId prev = prev_sibling_id(ctx.tree, ctx.blockId);
            if (prev.empty()) return false;
            const auto& p = node_at(ctx.tree, prev);
            return p.children.empty() && ctx.schema.is_textual(p.type) && !ctx.schema.is_structural(p.type);
        },
        [](const RuleContext& ctx) {
            return RuleResult::of(merge_intent(prev_sibling_id(ctx.tree, ctx.blockId), ctx.blockId));
        }));

    return rules;
}

std::vector<Rule> default_tab_rules() {
    std::vector<Rule> rules;

    rules.push_back(make_rule("tab:outdentBlock", 110,
        [](const RuleContext& ctx) { return ctx.event.shift; },
        [](const RuleContext& ctx) {
            std::vector<Intent> intents;
            for (const auto& id : targets(ctx)) intents.push_back(outdent_intent(id));
            return RuleResult::of(std::move(intents));
        }));

    rules.push_back(make_rule("tab:indentBlock", 100,
        [](const RuleContext& ctx) { return !ctx.event.shift; },
        [](const RuleContext& ctx) {
            std::vector<Intent> intents;
            for (const auto& id : targets(ctx)) intents.push_back(indent_intent(id));
            return RuleResult::of(std::move(intents));
        }));

    return rules;
}

std::vector<Rule> default_move_up_rules() {
    return { make_rule("move:up", 100,
        [](const RuleContext&) { return true; },
        [](const RuleContext& ctx) { return RuleResult::of(move_up_intent(ctx.blockId)); }) };
}

std::vector<Rule> default_move_down_rules() {
    return { make_rule("move:down", 100,
        [](const RuleContext&) { return true; },
        [](const RuleContext& ctx) { return RuleResult::of(move_down_intent(ctx.blockId)); }) };
}

std::vector<Rule> default_collapse_rules() {
    return { make_rule("collapse:toggle", 100,
        [](const RuleContext& ctx) { return !caret_node(ctx).children.empty(); },
        [](const RuleContext& ctx) { return RuleResult::of(toggle_collapse_intent(ctx.blockId)); }) };
}

// Caret-only rules: cross a block boundary onto the neighbouring visible
// block. Hidden ranges are skipped; a block selection is left to the host.
static bool can_navigate(const RuleContext& ctx) {
    return ctx.selection.empty() && !is_hidden(ctx.tree, ctx.blockId);
}

static size_t column_in(const BlockTree& t, const BlockId& id, size_t offset) {
    return std::min(offset, node_at(t, id).content.text.size());
}

std::vector<Rule> default_arrow_up_rules() {
    return { make_rule("navigation:moveToPreviousLine", 50,
        [](const RuleContext& ctx) {
            return ctx.event.onFirstLine && can_navigate(ctx) && !prev_visible_id(ctx.tree, ctx.blockId).empty();
        },
        [](const RuleContext& ctx) {
            BlockId prev = prev_visible_id(ctx.tree, ctx.blockId);
            return RuleResult::move_caret({ prev, Placement::Offset, column_in(ctx.tree, prev, ctx.event.offset) });
        }) };
}

std::vector<Rule> default_arrow_down_rules() {
    return { make_rule("navigation:moveToNextLine", 50,
        [](const RuleContext& ctx) {
            return ctx.event.onLastLine && can_navigate(ctx) && !next_visible_id(ctx.tree, ctx.blockId).empty();
        },
        [](const RuleContext& ctx) {
            BlockId next = next_visible_id(ctx.tree, ctx.blockId);
            return RuleResult::move_caret({ next, Placement::Offset, column_in(ctx.tree, next, ctx.event.offset) });
        }) };
}

std::vector<Rule> default_arrow_left_rules() {
    return { make_rule("navigation:moveToPreviousBlock", 50,
        [](const RuleContext& ctx) {
            return ctx.event.atStart && can_navigate(ctx) && !prev_visible_id(ctx.tree, ctx.blockId).empty();
        },
        [](const RuleContext& ctx) {
            return RuleResult::move_caret({ prev_visible_id(ctx.tree, ctx.blockId), Placement::End, 0 });
        }) };
}

std::vector<Rule> default_arrow_right_rules() {
    return { make_rule("navigation:moveToNextBlock", 50,
        [](const RuleContext& ctx) {
            return ctx.event.atEnd && can_navigate(ctx) && !next_visible_id(ctx.tree, ctx.blockId).empty();
        },
        [](const RuleContext& ctx) {
            return RuleResult::move_caret({ next_visible_id(ctx.tree, ctx.blockId), Placement::Start, 0 });
        }) };
}

const RuleEngine* Keymap::for_event(const KeyEvent& event) const {
    switch (event.key) {
        case Key::Enter: return event.mod ? &collapse : &enter;
        case Key::Backspace: return &backspace;
        case Key::Tab: return &tab;
        case Key::ArrowUp: return event.alt ? &moveUp : &lineUp;
        case Key::ArrowDown: return event.alt ? &moveDown : &lineDown;
        case Key::ArrowLeft: return &blockLeft;
        case Key::ArrowRight: return &blockRight;
        case Key::Other: return nullptr;
    }
    return nullptr;
}

Keymap default_keymap() {
    Keymap km;
    km.enter.set_rules(default_enter_rules());
    km.backspace.set_rules(default_backspace_rules());
    km.tab.set_rules(default_tab_rules());
    km.moveUp.set_rules(default_move_up_rules());
    km.moveDown.set_rules(default_move_down_rules());
    km.collapse.set_rules(default_collapse_rules());
    km.lineUp.set_rules(default_arrow_up_rules());
    km.lineDown.set_rules(default_arrow_down_rules());
    km.blockLeft.set_rules(default_arrow_left_rules());
    km.blockRight.set_rules(default_arrow_right_rules());
    return km;
}

} // namespace block
