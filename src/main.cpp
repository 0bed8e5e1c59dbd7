#include <bibfmt/cli.hpp>
#include <bibfmt/log.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = bibfmt::parse_args(args);
    if (parsed.is_err()) {
        bibfmt::log::error("%s", parsed.error().format().c_str());
        return bibfmt::exit_code_for(parsed.error(), bibfmt::Stage::Setup);
    }

    const auto& cli = parsed.value();
    if (cli.show_help) {
        std::cout << bibfmt::usage();
        return bibfmt::ExitSuccess;
    }
    if (cli.show_version) {
        std::cout << "bibfmt " << bibfmt::kVersion << "\n";
        return bibfmt::ExitSuccess;
    }

    return bibfmt::run(cli);
}
