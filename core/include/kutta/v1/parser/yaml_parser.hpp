#pragma once

#include "kutta/v1/run_config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace kutta::v1::parser {

struct YamlParserOptions {
    bool strict = true;  // Fail on unknown fields
};

class YamlParser {
public:
    explicit YamlParser(YamlParserOptions options = {});

    // Parse from file
    RunConfig load(const std::filesystem::path& path);

    // Parse from string
    RunConfig load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    YamlParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, RunConfig& config);
};

}  // namespace kutta::v1::parser
