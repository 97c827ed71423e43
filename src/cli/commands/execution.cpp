#include "../base_cli.hpp"
#include "../theme.hpp"
#include "exec_helpers.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <core/utils.hpp>
#include <readline/readline.h>

static void do_session(BaseCLI& cli, const std::string& arg) {
    std::string id = arg;
    trim(id);
    if (id.empty()) {
        std::cout << theme::kv("Session", cli.current_session);
        return;
    }
    cli.current_session = id;
    std::cout << theme::ok("Session " + id);
}

static void do_exec(BaseCLI& cli, const std::string& arg) {
    if (arg.empty()) {
        std::cout << theme::fail("Usage: exec <code>");
        return;
    }
    run_and_print(cli, arg);
}

static void do_load(BaseCLI& cli, const std::string& arg) {
    std::string path = arg;
    trim(path);
    if (path.empty()) {
        std::cout << theme::fail("Usage: load <file.py>");
        return;
    }

    std::ifstream in(path);
    if (!in) {
        std::cout << theme::fail("Cannot read " + path);
        return;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    run_and_print(cli, ss.str());
}

static void do_paste(BaseCLI& cli, const std::string& arg) {
    std::cout << theme::dim("    Paste code, end with a line containing only '.'") << "\n";

    std::string code;
    while (true) {
        char* raw = readline("... ");
        if (!raw) break;  // EOF ends input too
        std::string line = raw;
        free(raw);
        if (line == ".") break;
        code += line + "\n";
    }
    run_and_print(cli, code);
}

void register_execution_commands(BaseCLI& cli) {
    cli.add_command("session", do_session, "Show or switch the current session");
    cli.add_command("exec", do_exec, "Run one line of Python in the session");
    cli.add_command("load", do_load, "Run a Python file in the session");
    cli.add_command("paste", do_paste, "Run pasted multi-line code");
}
