#pragma once

#include <cstddef>
#include <vector>

namespace block {

enum class Key {
    Enter,
    Backspace,
    Tab,
    ArrowUp,
    ArrowDown,
    ArrowLeft,
    ArrowRight,
    Other
};

const char* to_string(Key key);

// Key press as reported by the host surface. Positions are in the host's own
// position space and are translated to block ids by HostSurface::block_at.
struct KeyEvent {
    Key key = Key::Other;
    bool shift = false;
    bool alt = false;
    bool mod = false;
    size_t position = 0;   // caret block
    size_t offset = 0;     // caret byte offset inside the block text
    bool isEmpty = false;
    bool atStart = false;
    bool atEnd = false;
    bool onFirstLine = false;  // caret on the block's first visual line
    bool onLastLine = false;   // caret on the block's last visual line
    std::vector<size_t> selectedPositions; // block selection, if any
};

} // namespace block
