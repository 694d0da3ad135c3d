#pragma once

#include "block_engine/log.hpp"
#include "block_engine/schema.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace block {

struct EngineConfig {
    size_t historyLimit = 100;          // undo steps kept; 0 = unbounded
    LogLevel logLevel = LogLevel::Warn;
    int maxDepth = 8;                   // nesting levels below the root; 0 = unbounded
    std::string idPrefix = "b";
    BlockSchema schema = BlockSchema::defaults();
};

// engine.json:
// {
//   "schema_version": 1,
//   "history_limit": 100,
//   "log_level": "warn",
//   "max_depth": 8,
//   "id_prefix": "b",
//   "block_types": [ { "type": "toggle", "container": true, ... } ]
// }
// Listed block types are merged over the defaults. Unknown keys are ignored.
// On failure `out` is left as it was and `err` says why.
bool parse_config(const nlohmann::json& j, EngineConfig& out, std::string& err);
bool load_config_file(const std::string& path, EngineConfig& out, std::string& err);

nlohmann::json config_to_json(const EngineConfig& cfg);
bool save_config_file(const std::string& path, const EngineConfig& cfg, std::string& err);

} // namespace block
