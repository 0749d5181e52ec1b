#pragma once
#include <string>
#include "log.hpp"

/*
-------------------------------------------------------------------------------
 config.hpp - Runtime configuration
-------------------------------------------------------------------------------
Settings are read from an optional key=value file:

    # insight.conf
    db_path = insight.db
    model_dir = models
    log_level = debug
    classifier_trees = 200

Blank lines and lines starting with '#' are ignored. Unknown keys are logged
and skipped. A value that does not parse for its key throws
InvalidInputError. A missing file is not an error: defaults are used.
-------------------------------------------------------------------------------
*/

struct ForestParams {
    int n_trees{ 100 };
    int max_depth{ 10 };
    unsigned seed{ 42 };
};

struct InsightConfig {
    std::string db_path{ "insight.db" };
    std::string model_dir{ "." };
    LogLevel log_level{ LogLevel::Info };
    ForestParams regressor{ 100, 10, 42 };
    ForestParams classifier{ 100, 8, 42 };
    bool seed_demo_data{ true };
};

/// Load settings from `path` on top of the defaults.
InsightConfig load_config(const std::string& path);

/// Apply one key/value pair. Returns false for an unknown key.
bool apply_config_value(InsightConfig& cfg, const std::string& key, const std::string& value);
