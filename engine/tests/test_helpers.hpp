#pragma once

#include "block_engine/keyboard.hpp"
#include "block_engine/log.hpp"
#include "block_engine/tree_utils.hpp"
#include "block_engine/types.hpp"

#include <cstdlib>
#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace block_test {

using namespace block;

inline void assert_eq(const std::string& a, const std::string& b, const char* msg) {
    if (a != b) {
        std::cerr << "Assertion failed: " << msg << " ('" << a << "' != '" << b << "')\n";
        std::abort();
    }
}
inline void assert_eq_size(size_t a, size_t b, const char* msg) {
    if (a != b) {
        std::cerr << "Assertion failed: " << msg << " (" << a << " != " << b << ")\n";
        std::abort();
    }
}
inline void assert_true(bool cond, const char* msg) {
    if (!cond) {
        std::cerr << "Assertion failed: " << msg << "\n";
        std::abort();
    }
}
inline void assert_ids(const std::vector<BlockId>& got, const std::vector<BlockId>& want, const char* msg) {
    if (got != want) {
        std::cerr << "Assertion failed: " << msg << " ([";
        for (size_t i = 0; i < got.size(); ++i) std::cerr << (i ? "," : "") << got[i];
        std::cerr << "] != [";
        for (size_t i = 0; i < want.size(); ++i) std::cerr << (i ? "," : "") << want[i];
        std::cerr << "])\n";
        std::abort();
    }
}

// Runs `fn` and checks it throws E.
template <typename E, typename Fn>
void assert_throws(Fn fn, const char* msg) {
    try {
        fn();
    } catch (const E&) {
        return;
    }
    std::cerr << "Assertion failed: " << msg << " (no exception)\n";
    std::abort();
}

// Invariant checks: one root of type doc with at least one child, correct
// parent/children linkage, no duplicates, no orphans.
inline void verify_invariants(const BlockTree& t) {
    auto rootIt = t.nodes.find(t.rootId);
    assert_true(rootIt != t.nodes.end(), "root exists");
    assert_true(rootIt->second.parentId.empty(), "root parentId empty");
    assert_eq(rootIt->second.type, "doc", "root type");
    assert_true(!rootIt->second.children.empty(), "at least one top-level block");

    std::unordered_set<BlockId> seen;
    std::function<void(const BlockId&)> dfs = [&](const BlockId& id) {
        assert_true(seen.insert(id).second, "no duplicate visit");
        const auto& node = t.nodes.at(id);
        assert_eq(node.id, id, "node keyed by its id");
        std::unordered_set<BlockId> childset;
        for (const auto& cid : node.children) {
            assert_true(childset.insert(cid).second, "no duplicate children");
            auto itc = t.nodes.find(cid);
            assert_true(itc != t.nodes.end(), "child exists");
            assert_eq(itc->second.parentId, node.id, "child parent link");
            dfs(cid);
        }
    };
    dfs(t.rootId);
    assert_eq_size(seen.size(), t.nodes.size(), "no orphans reachable from root");
    assert_true(check_invariants(t).empty(), "check_invariants agrees");
}

// Tree building: doc() then add() in pre-order.
inline BlockTree doc() {
    BlockTree t;
    t.rootId = "root";
    t.nodes["root"] = BlockNode{ "root", "doc", "", {}, {} };
    return t;
}

inline void add(BlockTree& t, const BlockId& id, const BlockId& parent, const std::string& type = "paragraph",
                const std::string& text = "") {
    BlockNode n{ id, type, parent, {}, {} };
    n.content.text = text;
    t.nodes[id] = n;
    t.nodes.at(parent).children.push_back(id);
}

inline const std::vector<BlockId>& children(const BlockTree& t, const BlockId& id) {
    return t.nodes.at(id).children;
}

inline const BlockId& parent(const BlockTree& t, const BlockId& id) {
    return t.nodes.at(id).parentId;
}

// Host surface mirroring the tree as a flat document-order list; position i
// is the i-th block. Records the order of sync/cursor calls.
class FakeSurface : public HostSurface {
public:
    std::optional<BlockId> block_at(size_t position) const override {
        if (position >= mirror.size()) return std::nullopt;
        return mirror[position];
    }

    void sync(const BlockTree& tree) override {
        mirror = document_order(tree);
        calls.push_back("sync");
    }

    void place_cursor(const CursorTarget& target) override {
        cursors.push_back(target);
        calls.push_back("cursor");
    }

    size_t position_of(const BlockId& id) const {
        for (size_t i = 0; i < mirror.size(); ++i) {
            if (mirror[i] == id) return i;
        }
        std::cerr << "FakeSurface: '" << id << "' not mirrored\n";
        std::abort();
    }

    std::vector<BlockId> mirror;
    std::vector<CursorTarget> cursors;
    std::vector<std::string> calls;
};

// Collects log records while alive; restores the stderr sink and level after.
class LogCapture {
public:
    explicit LogCapture(LogLevel level = LogLevel::Debug) : previous_(log_level()) {
        set_log_level(level);
        set_log_sink([this](LogLevel lvl, const char* category, const std::string& message) {
            records.push_back({ lvl, category, message });
        });
    }
    ~LogCapture() {
        set_log_sink(nullptr);
        set_log_level(previous_);
    }

    struct Record {
        LogLevel level;
        std::string category;
        std::string message;
    };

    size_t count(LogLevel level, const std::string& category) const {
        size_t n = 0;
        for (const auto& r : records) {
            if (r.level == level && r.category == category) ++n;
        }
        return n;
    }

    std::vector<Record> records;

private:
    LogLevel previous_;
};

} // namespace block_test
