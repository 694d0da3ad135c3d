#include "block_engine/config.hpp"

#include <fstream>
#include <limits>

using nlohmann::json;

namespace block {

static bool block_type_from_json(const json& jt, BlockTypeInfo& out, std::string& err) {
    err.clear();
    if (!jt.is_object()) {
        err = "block type entry is not an object";
        return false;
    }
    if (!jt.contains("type") || !jt["type"].is_string() || jt["type"].get<std::string>().empty()) {
        err = "block type entry missing string 'type'";
        return false;
    }
    out = BlockTypeInfo{};
    out.type = jt["type"].get<std::string>();
    if (jt.contains("container") && jt["container"].is_boolean())
        out.container = jt["container"].get<bool>();
    if (jt.contains("accepts_children") && jt["accepts_children"].is_boolean())
        out.acceptsChildren = jt["accepts_children"].get<bool>();
    if (jt.contains("textual") && jt["textual"].is_boolean())
        out.textual = jt["textual"].get<bool>();
    if (jt.contains("structural") && jt["structural"].is_boolean())
        out.structural = jt["structural"].get<bool>();
    if (jt.contains("lower_form") && jt["lower_form"].is_string())
        out.lowerForm = jt["lower_form"].get<std::string>();
    if (jt.contains("continue_as") && jt["continue_as"].is_string())
        out.continueAs = jt["continue_as"].get<std::string>();

    if (out.lowerForm == "doc" || out.continueAs == "doc") {
        err = "block type '" + out.type + "' may not lower to or continue as 'doc'";
        return false;
    }
    return true;
}

static json block_type_to_json(const BlockTypeInfo& t) {
    json out;
    out["type"] = t.type;
    out["container"] = t.container;
    out["accepts_children"] = t.acceptsChildren;
    out["textual"] = t.textual;
    out["structural"] = t.structural;
    out["lower_form"] = t.lowerForm;
    out["continue_as"] = t.continueAs;
    return out;
}

bool parse_config(const json& j, EngineConfig& out, std::string& err) {
    err.clear();
    if (!j.is_object()) {
        err = "engine config root must be an object";
        return false;
    }
    if (!j.contains("schema_version") || !j["schema_version"].is_number_integer()) {
        err = "engine config missing integer 'schema_version'";
        return false;
    }
    if (j["schema_version"].get<int>() != 1) {
        err = "unsupported engine config schema_version (expected 1)";
        return false;
    }

    EngineConfig cfg = out;
    if (j.contains("history_limit")) {
        if (!j["history_limit"].is_number_unsigned()) {
            err = "'history_limit' must be a non-negative integer";
            return false;
        }
        cfg.historyLimit = j["history_limit"].get<size_t>();
    }
    if (j.contains("log_level")) {
        if (!j["log_level"].is_string() || !parse_log_level(j["log_level"].get<std::string>(), cfg.logLevel)) {
            err = "'log_level' must be one of debug, info, warn, error, off";
            return false;
        }
    }
    if (j.contains("max_depth")) {
        if (!j["max_depth"].is_number_unsigned() ||
            j["max_depth"].get<unsigned long long>() > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            err = "'max_depth' must be a non-negative integer that fits an int";
            return false;
        }
        cfg.maxDepth = j["max_depth"].get<int>();
    }
    if (j.contains("id_prefix")) {
        if (!j["id_prefix"].is_string() || j["id_prefix"].get<std::string>().empty()) {
            err = "'id_prefix' must be a non-empty string";
            return false;
        }
        cfg.idPrefix = j["id_prefix"].get<std::string>();
    }
    if (j.contains("block_types")) {
        if (!j["block_types"].is_array()) {
            err = "'block_types' must be an array";
            return false;
        }
        for (const auto& jt : j["block_types"]) {
            BlockTypeInfo info;
            std::string type_err;
            if (!block_type_from_json(jt, info, type_err)) {
                err = "block_types: " + type_err;
                return false;
            }
            cfg.schema.set(std::move(info));
        }
    }

    out = std::move(cfg);
    return true;
}

bool load_config_file(const std::string& path, EngineConfig& out, std::string& err) {
    err.clear();
    std::ifstream f(path);
    if (!f) {
        err = "could not open '" + path + "'";
        log_warn("config", "%s, keeping defaults", err.c_str());
        return false;
    }

    json j;
    try {
        f >> j;
    } catch (const std::exception& e) {
        err = std::string("JSON parse error: ") + e.what();
        log_warn("config", "%s: %s", path.c_str(), err.c_str());
        return false;
    }

    if (!parse_config(j, out, err)) {
        log_warn("config", "%s: %s", path.c_str(), err.c_str());
        return false;
    }
    log_info("config", "loaded %s", path.c_str());
    return true;
}

json config_to_json(const EngineConfig& cfg) {
    json j;
    j["schema_version"] = 1;
    j["history_limit"] = cfg.historyLimit;
    j["log_level"] = log_level_name(cfg.logLevel);
    j["max_depth"] = cfg.maxDepth;
    j["id_prefix"] = cfg.idPrefix;
    json types = json::array();
    for (const auto& t : cfg.schema.types())
        types.push_back(block_type_to_json(t));
    j["block_types"] = std::move(types);
    return j;
}

bool save_config_file(const std::string& path, const EngineConfig& cfg, std::string& err) {
    err.clear();
    std::ofstream out(path);
    if (!out) {
        err = "failed to open '" + path + "' for writing";
        return false;
    }
    try {
        out << config_to_json(cfg).dump(2) << "\n";
    } catch (const std::exception& e) {
        err = std::string("failed to write JSON: ") + e.what();
        return false;
    }
    return true;
}

} // namespace block
