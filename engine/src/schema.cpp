#include "block_engine/schema.hpp"

namespace block {

BlockSchema BlockSchema::defaults() {
    BlockSchema s;
    //       type             container accepts textual structural lowerForm    continueAs
    s.set({ "doc",            false,    true,   false,  false,     "",          "paragraph" });
    s.set({ "paragraph",      false,    true,   true,   false,     "",          "paragraph" });
    s.set({ "heading",        false,    true,   true,   false,     "paragraph", "paragraph" });
    s.set({ "bullet_list",    false,    true,   true,   false,     "paragraph", "" });
    s.set({ "numbered_list",  false,    true,   true,   false,     "paragraph", "" });
    s.set({ "task_list",      false,    true,   true,   false,     "paragraph", "" });
    s.set({ "toggle",         true,     true,   true,   false,     "paragraph", "paragraph" });
    s.set({ "quote",          false,    true,   true,   true,      "paragraph", "paragraph" });
    s.set({ "callout",        false,    true,   true,   true,      "paragraph", "paragraph" });
    s.set({ "code",           false,    false,  true,   true,      "paragraph", "paragraph" });
    s.set({ "divider",        false,    false,  false,  true,      "",          "paragraph" });
    return s;
}

void BlockSchema::set(BlockTypeInfo info) {
    auto it = index_.find(info.type);
    if (it != index_.end()) {
        types_[it->second] = std::move(info);
        return;
    }
    index_[info.type] = types_.size();
    types_.push_back(std::move(info));
}

void BlockSchema::clear() {
    types_.clear();
    index_.clear();
}

bool BlockSchema::knows(const std::string& type) const {
    return index_.find(type) != index_.end();
}

const BlockTypeInfo& BlockSchema::info(const std::string& type) const {
    auto it = index_.find(type);
    if (it == index_.end()) return fallback_;
    return types_[it->second];
}

std::string BlockSchema::continue_as(const std::string& type) const {
    const auto& i = info(type);
    return i.continueAs.empty() ? type : i.continueAs;
}

} // namespace block
