#pragma once

#include "block_engine/key_event.hpp"
#include "block_engine/rule_engine.hpp"

#include <vector>

namespace block {

std::vector<Rule> default_enter_rules();
std::vector<Rule> default_backspace_rules();
std::vector<Rule> default_tab_rules();
std::vector<Rule> default_move_up_rules();
std::vector<Rule> default_move_down_rules();
std::vector<Rule> default_collapse_rules();
std::vector<Rule> default_arrow_up_rules();
std::vector<Rule> default_arrow_down_rules();
std::vector<Rule> default_arrow_left_rules();
std::vector<Rule> default_arrow_right_rules();

// One rule engine per key binding.
struct Keymap {
    RuleEngine enter;       // Enter, Shift+Enter
    RuleEngine backspace;
    RuleEngine tab;         // Tab, Shift+Tab
    RuleEngine moveUp;      // Alt+ArrowUp
    RuleEngine moveDown;    // Alt+ArrowDown
    RuleEngine collapse;    // Mod+Enter
    RuleEngine lineUp;      // ArrowUp on the first line
    RuleEngine lineDown;    // ArrowDown on the last line
    RuleEngine blockLeft;   // ArrowLeft at block start
    RuleEngine blockRight;  // ArrowRight at block end

    // Engine bound to the event's key and modifiers, or nullptr when the core
    // does not handle that key.
    const RuleEngine* for_event(const KeyEvent& event) const;
};

Keymap default_keymap();

} // namespace block
