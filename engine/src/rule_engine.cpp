#include "block_engine/rule_engine.hpp"
#include "block_engine/log.hpp"

#include <algorithm>

namespace block {

const char* to_string(Key key) {
    switch (key) {
        case Key::Enter: return "Enter";
        case Key::Backspace: return "Backspace";
        case Key::Tab: return "Tab";
        case Key::ArrowUp: return "ArrowUp";
        case Key::ArrowDown: return "ArrowDown";
        case Key::ArrowLeft: return "ArrowLeft";
        case Key::ArrowRight: return "ArrowRight";
        case Key::Other: return "Other";
    }
    return "unknown";
}

void RuleEngine::set_rules(std::vector<Rule> rules) {
    rules_ = std::move(rules);
    sort();
}

void RuleEngine::add_rule(Rule rule) {
    rules_.push_back(std::move(rule));
    sort();
}

void RuleEngine::sort() {
    std::stable_sort(rules_.begin(), rules_.end(),
                     [](const Rule& a, const Rule& b) { return a.priority > b.priority; });
}

Evaluation RuleEngine::evaluate(const RuleContext& ctx) const {
    Evaluation ev;
    for (const auto& rule : rules_) {
        if (!rule.when || !rule.when(ctx)) continue;
        RuleResult result = rule.execute ? rule.execute(ctx) : RuleResult::none();
        if (result.kind == RuleResult::Kind::None) continue;
        if (result.kind == RuleResult::Kind::Handled && !result.handled) {
            log_debug("rules", "%s declined on '%s'", rule.id.c_str(), ctx.blockId.c_str());
            continue;
        }

        log_debug("rules", "%s matched on '%s' (priority %d)", rule.id.c_str(), ctx.blockId.c_str(),
                  rule.priority);
        ev.matched = true;
        ev.ruleIds.push_back(rule.id);
        ev.handled = true;
        if (result.kind == RuleResult::Kind::Intents) {
            ev.intents.insert(ev.intents.end(), result.intents.begin(), result.intents.end());
        } else if (result.kind == RuleResult::Kind::Caret) {
            ev.caret = result.caret;
        }
        if (rule.stopPropagation) break;
    }
    return ev;
}

} // namespace block
