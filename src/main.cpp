#include <iostream>
#include <vector>
#include <string>
#include "cli/sandcache_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner(SANDCACHE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::SLATE << "    sandcache"
              << theme::color::RESET << theme::color::DIM
              << "                         Start the REPL" << theme::color::RESET << "\n";
    std::cout << theme::color::SLATE << "    sandcache init"
              << theme::color::RESET << theme::color::DIM
              << "                    Write a default config" << theme::color::RESET << "\n";
    std::cout << theme::color::SLATE << "    sandcache run "
              << theme::color::RESET << theme::color::SAND << "<session> <file.py>"
              << theme::color::RESET << theme::color::DIM
              << " Run a file once" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    sandcache --version               Show version\n"
              << "    sandcache --help                  Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc >= 2) {
            std::string cmd = argv[1];
            if (cmd == "--version") {
                std::cout << theme::color::SAND << theme::color::BOLD << "sandcache"
                          << theme::color::RESET << theme::color::DIM
                          << " version " << SANDCACHE_VERSION << theme::color::RESET << "\n";
                return 0;
            } else if (cmd == "--help") {
                print_usage();
                return 0;
            }
        }

        SandcacheCLI cli;

        if (argc == 1) {
            cli.run_repl();
            return 0;
        }

        std::string cmd = argv[1];
        if (cmd == "init") {
            return cli.run_init();
        } else if (cmd == "run") {
            if (argc < 4) {
                std::cout << theme::fail("Missing arguments.");
                std::cout << theme::step("Usage: sandcache run <session> <file.py>");
                return 1;
            }
            return cli.run_file(argv[2], argv[3]);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
