#include <star_etl/config/engine_config.h>

#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace star_etl {

namespace {

using json = nlohmann::json;

arrow::Status TypeError(const std::string& key, const char* expected) {
    return arrow::Status::Invalid("Config key '", key, "' must be ", expected);
}

} // namespace

ExecutorOptions EngineConfig::ToExecutorOptions(const std::string& base_directory) const {
    ExecutorOptions options;
    options.base_directory = base_directory;
    options.search_directories = search_directories;
    options.vectorized_subjects = vectorized_subjects;
    options.blank_node_prefix = blank_node_prefix;
    options.template_options.null_policy = null_policy;
    options.template_options.cache_capacity = template_cache_capacity;
    return options;
}

arrow::Result<EngineConfig> ParseEngineConfig(const std::string& json_text) {
    json document;
    try {
        document = json::parse(json_text);
    } catch (const json::parse_error& e) {
        return arrow::Status::Invalid("Config is not valid JSON: ", e.what());
    }
    if (!document.is_object()) {
        return arrow::Status::Invalid("Config must be a JSON object");
    }

    EngineConfig config;

    if (document.contains("search_directories")) {
        const json& dirs = document["search_directories"];
        if (!dirs.is_array()) {
            return TypeError("search_directories", "an array of strings");
        }
        for (const auto& dir : dirs) {
            if (!dir.is_string()) {
                return TypeError("search_directories", "an array of strings");
            }
            config.search_directories.push_back(dir.get<std::string>());
        }
    }

    if (document.contains("null_policy")) {
        const json& policy = document["null_policy"];
        if (!policy.is_string()) {
            return TypeError("null_policy", "a string");
        }
        const std::string value = policy.get<std::string>();
        if (value == "sentinel") {
            config.null_policy = NullPolicy::Sentinel;
        } else if (value == "skip") {
            config.null_policy = NullPolicy::Skip;
        } else {
            return arrow::Status::Invalid("Unknown null_policy '", value,
                                          "' (expected sentinel or skip)");
        }
    }

    if (document.contains("template_cache_capacity")) {
        const json& capacity = document["template_cache_capacity"];
        if (!capacity.is_number_unsigned() || capacity.get<uint64_t>() == 0) {
            return TypeError("template_cache_capacity", "a positive integer");
        }
        config.template_cache_capacity = capacity.get<size_t>();
    }

    if (document.contains("blank_node_prefix")) {
        const json& prefix = document["blank_node_prefix"];
        if (!prefix.is_string() || prefix.get<std::string>().empty()) {
            return TypeError("blank_node_prefix", "a non-empty string");
        }
        config.blank_node_prefix = prefix.get<std::string>();
    }

    if (document.contains("vectorized_subjects")) {
        if (!document["vectorized_subjects"].is_boolean()) {
            return TypeError("vectorized_subjects", "a boolean");
        }
        config.vectorized_subjects = document["vectorized_subjects"].get<bool>();
    }

    if (document.contains("emit_run_metadata")) {
        if (!document["emit_run_metadata"].is_boolean()) {
            return TypeError("emit_run_metadata", "a boolean");
        }
        config.emit_run_metadata = document["emit_run_metadata"].get<bool>();
    }

    if (document.contains("output_format")) {
        const json& format = document["output_format"];
        if (!format.is_string()) {
            return TypeError("output_format", "a string");
        }
        ARROW_ASSIGN_OR_RAISE(config.output_format,
                              ParseOutputFormat(format.get<std::string>()));
    }

    return config;
}

arrow::Result<EngineConfig> LoadEngineConfig(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return arrow::Status::IOError("Cannot read config file ", path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return ParseEngineConfig(buffer.str());
}

} // namespace star_etl
