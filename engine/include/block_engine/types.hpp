#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <unordered_map>
#include <vector>

namespace block {

using BlockId = std::string;

// Opaque per-block payload. The engine only ever reads `text` (split/merge)
// and `collapsed` (hidden ranges); `attrs` travels untouched.
struct Content {
    std::string text;
    nlohmann::json attrs = nlohmann::json::object();
    bool collapsed = false;
};

struct BlockNode {
    BlockId id;
    std::string type;
    BlockId parentId; // empty string denotes the root
    std::vector<BlockId> children; // ordered
    Content content;
};

struct BlockTree {
    BlockId rootId;
    std::unordered_map<BlockId, BlockNode> nodes;
};

inline bool operator==(const Content& a, const Content& b) {
    return a.text == b.text && a.collapsed == b.collapsed && a.attrs == b.attrs;
}
inline bool operator!=(const Content& a, const Content& b) { return !(a == b); }

inline bool operator==(const BlockNode& a, const BlockNode& b) {
    return a.id == b.id && a.type == b.type && a.parentId == b.parentId &&
           a.children == b.children && a.content == b.content;
}
inline bool operator!=(const BlockNode& a, const BlockNode& b) { return !(a == b); }

inline bool operator==(const BlockTree& a, const BlockTree& b) {
    return a.rootId == b.rootId && a.nodes == b.nodes;
}
inline bool operator!=(const BlockTree& a, const BlockTree& b) { return !(a == b); }

// Source of fresh block ids. Every created node takes its id from here.
class IdGenerator {
public:
    virtual ~IdGenerator() = default;
    virtual BlockId next() = 0;
};

// Deterministic ids: <prefix>1, <prefix>2, ...
class SequentialIdGenerator : public IdGenerator {
public:
    explicit SequentialIdGenerator(std::string prefix = "b") : prefix_(std::move(prefix)) {}

    BlockId next() override {
        ++counter_;
        return prefix_ + std::to_string(counter_);
    }

    unsigned long long issued() const { return counter_; }

private:
    std::string prefix_;
    unsigned long long counter_ = 0;
};

} // namespace block
