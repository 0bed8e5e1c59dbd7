#include <bibfmt/cli.hpp>
#include <bibfmt/lang/formatter.hpp>
#include <bibfmt/lang/parser.hpp>
#include <bibfmt/log.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace bibfmt {

std::string usage() {
    return
        "usage: bibfmt -i <input.bib> [-o <output.bib>] [options]\n"
        "\n"
        "options:\n"
        "  -i, --input <path>     BibTeX file to format\n"
        "  -o, --output <path>    where to write the formatted file\n"
        "  -p, --preview          print to stdout instead of writing\n"
        "      --config <path>    config file (default: ./.bibfmt.toml)\n"
        "      --format-title     brace-protect capitalized title words\n"
        "      --keep-empty-tags  keep tags with empty values\n"
        "      --remove-empty-tags\n"
        "                         drop empty tags while parsing\n"
        "      --no-sort-entries  keep entries in file order\n"
        "      --no-sort-tags     keep tags in entry order\n"
        "  -v, --verbose          debug logging\n"
        "  -q, --quiet            only log errors\n"
        "  -h, --help             show this message\n"
        "      --version          show version\n";
}

Result<CliArgs> parse_args(const std::vector<std::string>& args) {
    CliArgs out;
    Config& o = out.overrides;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto take_value = [&](std::string& dest) -> Status {
            if (i + 1 >= args.size()) {
                return BibError{BibError::InvalidArg,
                    "missing value for " + arg, "see bibfmt --help"};
            }
            dest = args[++i];
            return ok_status();
        };

        if (arg == "-i" || arg == "--input") {
            BIBFMT_TRY(take_value(out.input));
        } else if (arg == "-o" || arg == "--output") {
            BIBFMT_TRY(take_value(out.output));
        } else if (arg == "--config") {
            std::string path;
            BIBFMT_TRY(take_value(path));
            out.config_path = path;
        } else if (arg == "-p" || arg == "--preview") {
            out.preview = true;
        } else if (arg == "--format-title") {
            o.format.format_title = true;
            o.format_title_set = true;
        } else if (arg == "--keep-empty-tags") {
            o.format.skip_empty_tags = false;
            o.skip_empty_tags_set = true;
        } else if (arg == "--remove-empty-tags") {
            o.parse.remove_empty_tags = true;
            o.remove_empty_tags_set = true;
        } else if (arg == "--no-sort-entries") {
            o.format.sort_entries = false;
            o.sort_entries_set = true;
        } else if (arg == "--no-sort-tags") {
            o.format.sort_tags = false;
            o.sort_tags_set = true;
        } else if (arg == "-v" || arg == "--verbose") {
            o.log_level = log::Debug;
            o.log_level_set = true;
        } else if (arg == "-q" || arg == "--quiet") {
            o.log_level = log::Error;
            o.log_level_set = true;
        } else if (arg == "-h" || arg == "--help") {
            out.show_help = true;
        } else if (arg == "--version") {
            out.show_version = true;
        } else {
            return BibError{BibError::InvalidArg,
                "unknown argument '" + arg + "'", "see bibfmt --help"};
        }
    }

    if (out.show_help || out.show_version) {
        return Result<CliArgs>::ok(std::move(out));
    }

    if (out.input.empty()) {
        return BibError{BibError::InvalidArg,
            "no input file specified", "usage: bibfmt -i <input.bib> -o <output.bib>"};
    }
    if (out.output.empty() && !out.preview) {
        return BibError{BibError::InvalidArg,
            "no output file specified",
            "pass -o <output.bib>, or --preview to print instead"};
    }

    return Result<CliArgs>::ok(std::move(out));
}

int exit_code_for(const BibError& e, Stage stage) {
    if (e.code == BibError::InvalidArg || e.code == BibError::Config) {
        return ExitUsage;
    }
    if (e.is_parse_error()) return ExitParse;
    switch (stage) {
    case Stage::Setup: return ExitUsage;
    case Stage::Read:  return ExitInputRead;
    case Stage::Parse: return ExitParse;
    case Stage::Write: return ExitOutputWrite;
    }
    return ExitUsage;
}

Result<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return BibError{BibError::IO,
            "cannot read input file: " + path,
            "check the path and file permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

Result<Config> resolve_config(const CliArgs& args) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto cfg = Config::load(global_path);
        if (cfg.is_err()) return std::move(cfg).error();
        log::debug("loaded global config %s", global_path.c_str());
        global = std::move(cfg).value();
    }

    std::optional<Config> local;
    if (args.config_path) {
        auto cfg = Config::load(*args.config_path);
        if (cfg.is_err()) {
            BibError e = std::move(cfg).error();
            if (e.code == BibError::IO) e.code = BibError::Config;
            return e;
        }
        local = std::move(cfg).value();
    } else if (fs::exists(kLocalConfigName)) {
        auto cfg = Config::load(kLocalConfigName);
        if (cfg.is_err()) return std::move(cfg).error();
        log::debug("loaded local config %s", kLocalConfigName);
        local = std::move(cfg).value();
    }

    Config effective = Config::effective(global, local);
    effective.merge(args.overrides);
    return Result<Config>::ok(std::move(effective));
}

int run(const CliArgs& args) {
    auto fail = [](const BibError& e, Stage stage) {
        log::error("%s", e.format().c_str());
        return exit_code_for(e, stage);
    };

    // Command-line log flags take effect before config files are read
    args.overrides.apply_logging();

    auto cfg = resolve_config(args);
    if (cfg.is_err()) return fail(cfg.error(), Stage::Setup);
    const Config& config = cfg.value();
    config.apply_logging();

    auto source = read_file(args.input);
    if (source.is_err()) return fail(source.error(), Stage::Read);
    log::debug("read %zu bytes from %s", source.value().size(), args.input.c_str());

    auto entries = parse_source(source.value(), config.parse, args.input);
    if (entries.is_err()) return fail(entries.error(), Stage::Parse);

    if (args.preview) {
        print_entries(entries.value(), config.format);
        return ExitSuccess;
    }

    auto written = write_entries(entries.value(), args.output, config.format);
    if (written.is_err()) return fail(written.error(), Stage::Write);

    log::info("formatted %zu entries into %s",
              entries.value().size(), args.output.c_str());
    return ExitSuccess;
}

} // namespace bibfmt
