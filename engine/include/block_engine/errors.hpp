#pragma once

#include "block_engine/types.hpp"

#include <stdexcept>
#include <string>

namespace block {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Target block id is absent from the tree (or names the root where a
// regular block is required).
class NotFoundError : public Error {
public:
    explicit NotFoundError(const BlockId& id)
        : Error("block not found: '" + id + "'"), id_(id) {}
    NotFoundError(const BlockId& id, const std::string& what)
        : Error(what), id_(id) {}

    const BlockId& id() const { return id_; }

private:
    BlockId id_;
};

// The mutation would orphan the root, create a cycle or otherwise break
// parent/children linkage. Raised before anything is committed.
class InvariantViolation : public Error {
public:
    using Error::Error;
};

// Tree not initialized yet, or the host surface has not mirrored a block.
// Key presses hitting this are consumed and retried on the next action.
class EngineNotReady : public Error {
public:
    using Error::Error;
};

} // namespace block
