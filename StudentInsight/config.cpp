#include "config.hpp"
#include <fstream>
#include <stdexcept>
#include "errors.hpp"
#include "validation.hpp"

namespace {

int parse_positive_int(const std::string& key, const std::string& value) {
    std::size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(value, &used);
    }
    catch (const std::logic_error&) {
        throw InvalidInputError("config: " + key + " expects an integer, got '" + value + "'");
    }
    if (used != value.size() || v <= 0)
        throw InvalidInputError("config: " + key + " must be a positive integer");
    return v;
}

bool parse_bool(const std::string& key, const std::string& value) {
    if (value == "1" || value == "true" || value == "yes") return true;
    if (value == "0" || value == "false" || value == "no") return false;
    throw InvalidInputError("config: " + key + " expects true/false, got '" + value + "'");
}

} // namespace

bool apply_config_value(InsightConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "db_path") cfg.db_path = value;
    else if (key == "model_dir") cfg.model_dir = value;
    else if (key == "log_level") {
        if (!parse_log_level(value, cfg.log_level))
            throw InvalidInputError("config: unknown log_level '" + value + "'");
    }
    else if (key == "regressor_trees") cfg.regressor.n_trees = parse_positive_int(key, value);
    else if (key == "regressor_max_depth") cfg.regressor.max_depth = parse_positive_int(key, value);
    else if (key == "classifier_trees") cfg.classifier.n_trees = parse_positive_int(key, value);
    else if (key == "classifier_max_depth") cfg.classifier.max_depth = parse_positive_int(key, value);
    else if (key == "random_seed") {
        const auto seed = static_cast<unsigned>(parse_positive_int(key, value));
        cfg.regressor.seed = seed;
        cfg.classifier.seed = seed;
    }
    else if (key == "seed_demo_data") cfg.seed_demo_data = parse_bool(key, value);
    else return false;
    return true;
}

InsightConfig load_config(const std::string& path) {
    InsightConfig cfg;
    std::ifstream in(path);
    if (!in) {
        log_info("no config at " + path + ", using defaults");
        return cfg;
    }

    std::string line;
    int line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;

        const auto eq = line.find('=');
        if (eq == std::string::npos)
            throw InvalidInputError("config: " + path + ":" + std::to_string(line_no) + ": expected key=value");

        const std::string key = trim(line.substr(0, eq));
        const std::string value = trim(line.substr(eq + 1));
        if (!apply_config_value(cfg, key, value))
            log_warn("config: ignoring unknown key '" + key + "'");
    }
    return cfg;
}
