#include <bibfmt/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace bibfmt {

namespace {

// Reads an optional boolean key, rejecting values of any other type
Status read_bool(const toml::table& tbl, const char* section, const char* key,
                 bool& out, bool& set) {
    const toml::node* node = tbl.get(key);
    if (!node) return ok_status();
    auto v = node->value<bool>();
    if (!v) {
        return BibError{BibError::Config,
            std::string("[") + section + "] " + key + " must be a boolean"};
    }
    out = *v;
    set = true;
    return ok_status();
}

} // anonymous namespace

Result<Config> Config::parse_toml(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return BibError{BibError::Config,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [parse] section
    if (auto parse = doc["parse"].as_table()) {
        BIBFMT_TRY(read_bool(*parse, "parse", "remove-empty-tags",
                             cfg.parse.remove_empty_tags,
                             cfg.remove_empty_tags_set));
    }

    // [format] section
    if (auto format = doc["format"].as_table()) {
        BIBFMT_TRY(read_bool(*format, "format", "format-title",
                             cfg.format.format_title, cfg.format_title_set));
        BIBFMT_TRY(read_bool(*format, "format", "skip-empty-tags",
                             cfg.format.skip_empty_tags, cfg.skip_empty_tags_set));
        BIBFMT_TRY(read_bool(*format, "format", "sort-entries",
                             cfg.format.sort_entries, cfg.sort_entries_set));
        BIBFMT_TRY(read_bool(*format, "format", "sort-tags",
                             cfg.format.sort_tags, cfg.sort_tags_set));
    }

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto v = (*lg)["level"].value<std::string>()) {
            auto lvl = log::parse_level(*v);
            if (!lvl) {
                return BibError{BibError::Config,
                    "unknown log level '" + *v + "'",
                    "use one of: trace, debug, info, warn, error"};
            }
            cfg.log_level = *lvl;
            cfg.log_level_set = true;
        }
        BIBFMT_TRY(read_bool(*lg, "log", "color", cfg.color, cfg.color_set));
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return BibError{BibError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    auto cfg = Config::parse_toml(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.remove_empty_tags_set) {
        parse.remove_empty_tags = other.parse.remove_empty_tags;
        remove_empty_tags_set = true;
    }
    if (other.format_title_set) {
        format.format_title = other.format.format_title;
        format_title_set = true;
    }
    if (other.skip_empty_tags_set) {
        format.skip_empty_tags = other.format.skip_empty_tags;
        skip_empty_tags_set = true;
    }
    if (other.sort_entries_set) {
        format.sort_entries = other.format.sort_entries;
        sort_entries_set = true;
    }
    if (other.sort_tags_set) {
        format.sort_tags = other.format.sort_tags;
        sort_tags_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                          const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

void Config::apply_logging() const {
    log::set_level(log_level);
    if (color_set) log::set_color_enabled(color);
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.bibfmt/config.toml";
}

} // namespace bibfmt
