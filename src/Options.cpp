/**
 * @file Options.cpp
 * @brief Patch options and layered option loading
 */

#include "patcher/Options.hpp"
#include "patcher/Errors.hpp"
#include "patcher/Loader.hpp"
#include "patcher/Parse.hpp"
#include "patcher/Util.hpp"

#include <algorithm>

namespace patcher {

namespace {
    // Later layer wins key by key. Options are flat, so no recursion.
    void merge_into(Value& base, const Value& layer) {
        if (!layer.is_object()) {
            throw ConfigError("Options layer must be an object, got " + type_name(layer));
        }
        for (auto it = layer.begin(); it != layer.end(); ++it) {
            base[it.key()] = it.value();
        }
    }

    bool read_flag(const Value& value, const std::string& key) {
        const auto& v = value.at(key);
        if (!v.is_boolean()) {
            throw ConfigError("Option '" + key + "' must be a boolean, got " + type_name(v));
        }
        return v.get<bool>();
    }
}

const std::vector<std::string>& option_keys() {
    static const std::vector<std::string> keys = {
        "ignore_case",
        "ignore_unknown_properties",
        "validate_before_write",
    };
    return keys;
}

PatchOptions PatchOptions::from_value(const Value& value) {
    if (!value.is_object()) {
        throw ConfigError("Options must be an object, got " + type_name(value));
    }

    const auto& keys = option_keys();
    for (auto it = value.begin(); it != value.end(); ++it) {
        if (std::find(keys.begin(), keys.end(), it.key()) == keys.end()) {
            throw ConfigError("Unknown option '" + it.key() + "'");
        }
    }

    PatchOptions opts;
    if (value.contains("ignore_case")) {
        opts.ignore_case = read_flag(value, "ignore_case");
    }
    if (value.contains("ignore_unknown_properties")) {
        opts.ignore_unknown_properties = read_flag(value, "ignore_unknown_properties");
    }
    if (value.contains("validate_before_write")) {
        opts.validate_before_write = read_flag(value, "validate_before_write");
    }
    return opts;
}

Value PatchOptions::to_value() const {
    return Value{
        {"ignore_case", ignore_case},
        {"ignore_unknown_properties", ignore_unknown_properties},
        {"validate_before_write", validate_before_write},
    };
}

Value collect_env_options(const std::string& prefix) {
    Value out = Value::object();
    for (const auto& key : option_keys()) {
        const std::string var = prefix.empty() ? to_upper(key) : to_upper(prefix) + "_" + to_upper(key);
        if (auto raw = get_env_var(var)) {
            out[key] = parse_value(*raw);
        }
    }
    return out;
}

Value read_options_file(const std::string& path) {
    Value doc = load_document_file(path);
    if (!doc.is_object()) {
        throw ConfigError("Options file must hold an object: " + path);
    }
    if (doc.contains("patch")) {
        return doc["patch"];
    }
    return doc;
}

PatchOptions load_options(const OptionSources& sources) {
    Value merged = PatchOptions{}.to_value();

    // 1) defaults
    merge_into(merged, sources.defaults);

    // 2) file
    if (sources.file_path.has_value()) {
        merge_into(merged, read_options_file(*sources.file_path));
    }

    // 3) env
    if (sources.env_prefix.has_value()) {
        merge_into(merged, collect_env_options(*sources.env_prefix));
    }

    // 4) overrides
    for (const auto& [key, value] : sources.overrides) {
        merged[key] = value;
    }

    return PatchOptions::from_value(merged);
}

} // namespace patcher
