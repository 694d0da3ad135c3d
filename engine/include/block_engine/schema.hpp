#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace block {

// Per-type structural behaviour.
struct BlockTypeInfo {
    std::string type;
    bool container = false;       // Enter in a non-empty block nests a child (toggle)
    bool acceptsChildren = true;  // Tab may nest a block under it
    bool textual = true;          // carries editable text
    bool structural = false;      // Backspace never merges into it
    std::string lowerForm;        // outdent-at-root / exit-empty target; empty = none
    std::string continueAs;       // type created by Enter after this block; empty = same type
};

class BlockSchema {
public:
    // doc, paragraph, heading, lists, toggle, quote, callout, code, divider
    static BlockSchema defaults();

    // Inserts or replaces the entry for info.type.
    void set(BlockTypeInfo info);
    void clear();

    bool knows(const std::string& type) const;
    // Unknown types behave like a plain paragraph.
    const BlockTypeInfo& info(const std::string& type) const;

    bool can_have_children(const std::string& type) const { return info(type).container; }
    bool accepts_children(const std::string& type) const { return info(type).acceptsChildren; }
    bool is_textual(const std::string& type) const { return info(type).textual; }
    bool is_structural(const std::string& type) const { return info(type).structural; }
    const std::string& lower_form(const std::string& type) const { return info(type).lowerForm; }
    std::string continue_as(const std::string& type) const;

    // Declaration order, for serialization.
    const std::vector<BlockTypeInfo>& types() const { return types_; }

private:
    std::vector<BlockTypeInfo> types_;
    std::unordered_map<std::string, size_t> index_;
    BlockTypeInfo fallback_{ "", false, true, true, false, "", "paragraph" };
};

} // namespace block
