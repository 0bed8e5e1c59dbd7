#pragma once

#include <bibfmt/log.hpp>
#include <bibfmt/result.hpp>
#include <optional>
#include <string>

namespace bibfmt {

// [parse] section
struct ParseOptions {
    bool remove_empty_tags = false;  // drop empty tags while building entries
};

// [format] section
struct FormatOptions {
    bool format_title = false;     // brace-protect capitalized title words
    bool skip_empty_tags = true;   // omit empty tags from output
    bool sort_entries = true;
    bool sort_tags = true;
};

// Layered configuration: global < local < command line.
// Each layer only overrides the keys it sets explicitly.
struct Config {
    ParseOptions parse;
    FormatOptions format;
    log::Level log_level = log::Info;
    bool color = false;

    // Track which fields were explicitly set (for merge)
    bool remove_empty_tags_set = false;
    bool format_title_set = false;
    bool skip_empty_tags_set = false;
    bool sort_entries_set = false;
    bool sort_tags_set = false;
    bool log_level_set = false;
    bool color_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse_toml(const std::string& toml_str);

    // Merge another config on top (other's explicit values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> local
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    // Push log settings into bibfmt::log
    void apply_logging() const;
};

// Discover the global config file path: ~/.bibfmt/config.toml
std::string global_config_path();

// Per-directory config file name
constexpr const char* kLocalConfigName = ".bibfmt.toml";

} // namespace bibfmt
