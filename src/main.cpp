#include <iostream>
#include <vector>
#include <string>
#include "cli/marksync_cli.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::TEAL << "    marksync "
              << theme::color::RESET << theme::color::AMBER << "[dir...]"
              << theme::color::RESET << theme::color::DIM
              << "          Browse directories and mark files" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    marksync --config "
              << theme::color::RESET << theme::color::AMBER << "<file>"
              << theme::color::RESET << theme::color::DIM
              << "   Use only this config file" << theme::color::RESET << "\n";
    std::cout << theme::color::TEAL << "    marksync init"
              << theme::color::RESET << theme::color::DIM
              << "                Create ~/.marksync/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    marksync --version            Show version\n"
              << "    marksync --help               Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> dirs;
        std::string config_path;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--version") {
                std::cout << theme::color::TEAL << theme::color::BOLD << "marksync"
                          << theme::color::RESET << theme::color::DIM
                          << " version 0.2.0" << theme::color::RESET << "\n";
                return 0;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else if (arg == "init" && i == 1 && argc == 2) {
                return MarkSyncCLI::run_init();
            } else if (arg == "--config") {
                if (i + 1 >= argc) {
                    std::cout << theme::fail("Missing file after --config.");
                    return 1;
                }
                config_path = argv[++i];
            } else if (arg.size() > 1 && arg[0] == '-') {
                std::cout << theme::fail("Unknown option: " + arg);
                print_usage();
                return 1;
            } else {
                dirs.push_back(arg);
            }
        }
        if (dirs.empty()) dirs.push_back(".");

        auto config = config_path.empty() ? Config::load() : Config::load_file(config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }

        MarkSyncCLI cli(config.value);
        return cli.run(dirs);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
