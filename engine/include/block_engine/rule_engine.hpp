#pragma once

#include "block_engine/intent.hpp"
#include "block_engine/key_event.hpp"
#include "block_engine/schema.hpp"
#include "block_engine/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace block {

// Everything a rule may look at. Rules receive it explicitly; nothing is
// read from ambient state.
struct RuleContext {
    const BlockTree& tree;
    const BlockSchema& schema;
    const KeyEvent& event;
    BlockId blockId;                 // caret block
    std::vector<BlockId> selection;  // selected blocks, document order
};

struct RuleResult {
    enum class Kind { None, Intents, Handled, Caret };

    Kind kind = Kind::None;
    std::vector<Intent> intents;
    bool handled = false;
    CursorTarget caret;

    static RuleResult none() { return {}; }
    static RuleResult of(Intent intent) { return of(std::vector<Intent>{ std::move(intent) }); }
    static RuleResult of(std::vector<Intent> intents) {
        RuleResult r;
        r.kind = Kind::Intents;
        r.intents = std::move(intents);
        return r;
    }
    // Direct handled / not-handled signal; bypasses the resolver. A rule
    // that declines (false) lets the next rule try.
    static RuleResult direct(bool handled) {
        RuleResult r;
        r.kind = Kind::Handled;
        r.handled = handled;
        return r;
    }
    // Caret-only move; the tree is not touched.
    static RuleResult move_caret(CursorTarget target) {
        RuleResult r;
        r.kind = Kind::Caret;
        r.handled = true;
        r.caret = std::move(target);
        return r;
    }
};

struct Rule {
    std::string id;
    int priority = 0;
    std::function<bool(const RuleContext&)> when;       // must not mutate anything
    std::function<RuleResult(const RuleContext&)> execute;
    bool stopPropagation = true;
};

struct Evaluation {
    bool matched = false;     // at least one rule produced a result
    bool handled = false;
    std::vector<Intent> intents;
    std::vector<std::string> ruleIds; // rules whose result was taken, in order
    std::optional<CursorTarget> caret; // last caret move, if any
};

// Rules for one key, highest priority first; equal priorities keep
// declaration order.
class RuleEngine {
public:
    RuleEngine() = default;
    explicit RuleEngine(std::vector<Rule> rules) { set_rules(std::move(rules)); }

    void set_rules(std::vector<Rule> rules);
    void add_rule(Rule rule);
    const std::vector<Rule>& rules() const { return rules_; }

    // The first rule whose predicate holds and whose executor returns a
    // result decides; with stopPropagation off, later matches are appended.
    // Executors returning none() or direct(false) do not count as a match.
    Evaluation evaluate(const RuleContext& ctx) const;

private:
    void sort();

    std::vector<Rule> rules_;
};

} // namespace block
