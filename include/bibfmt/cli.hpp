#pragma once

#include <bibfmt/config.hpp>
#include <bibfmt/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace bibfmt {

constexpr const char* kVersion = "0.1.0";

enum ExitCode {
    ExitSuccess = 0,
    ExitUsage = 1,        // bad arguments or config
    ExitInputRead = 2,
    ExitParse = 3,
    ExitOutputWrite = 4
};

// Pipeline stage an error came from, used to pick the exit code
enum class Stage { Setup, Read, Parse, Write };

struct CliArgs {
    std::string input;
    std::string output;
    bool preview = false;
    bool show_help = false;
    bool show_version = false;
    std::optional<std::string> config_path;

    // Command-line settings; only the *_set fields override config files
    Config overrides;
};

// Parse arguments (without argv[0])
Result<CliArgs> parse_args(const std::vector<std::string>& args);

std::string usage();

int exit_code_for(const BibError& e, Stage stage);

Result<std::string> read_file(const std::string& path);

// global config -> local (.bibfmt.toml or --config) -> command line
Result<Config> resolve_config(const CliArgs& args);

// Read, parse, format and write; returns the process exit code
int run(const CliArgs& args);

} // namespace bibfmt
