#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/utils.hpp>
#include <core/time_utils.hpp>

static void do_sessions(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_pool()) return;

    auto list = cli.pool->sessions();
    std::cout << theme::section("Sessions");
    if (list.empty()) {
        std::cout << theme::dim("    No sandboxes.") << "\n\n";
        return;
    }

    std::cout << theme::color::DIM
              << fmt::format("    {:<20} {:<18} {:>8} {:>8} {:>6}  {}",
                             "SESSION", "SANDBOX", "AGE", "IDLE", "RUNS", "STATE")
              << theme::color::RESET << "\n";

    for (const auto& s : list) {
        std::string state = s.broken ? theme::red("broken")
                          : s.active ? theme::green("active")
                                     : theme::yellow("expired");
        std::string marker = (s.session_id == cli.current_session) ? "*" : " ";
        std::cout << fmt::format("  {} {:<20} {:<18} {:>8} {:>8} {:>6}  ",
                                 marker, s.session_id, s.sandbox_id,
                                 format_duration_ms(s.age_ms),
                                 format_duration_ms(s.idle_ms),
                                 s.execution_count)
                  << state << "\n";
    }
    std::cout << "\n";
}

static void do_stats(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_pool()) return;

    auto st = cli.pool->stats();
    std::cout << theme::section("Stats");
    std::cout << theme::kv("Sessions", std::to_string(st.total_sessions));
    std::cout << theme::kv("Active", std::to_string(st.active_sessions));
    std::cout << theme::kv("Executions", std::to_string(st.total_executions));
    std::cout << "\n";
}

static void do_terminate(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_pool()) return;

    std::string id = arg;
    trim(id);
    if (id.empty()) id = cli.current_session;

    cli.pool->terminate(id);
    std::cout << theme::ok("Terminated " + id);
}

static void do_sweep(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_pool()) return;

    size_t n = cli.pool->sweep_now();
    std::cout << theme::ok(fmt::format("Sweep complete, {} expired session(s) terminated", n));
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("sessions", do_sessions, "List cached sandboxes");
    cli.add_command("stats", do_stats, "Show cache statistics");
    cli.add_command("terminate", do_terminate, "Terminate a session's sandbox (default: current)");
    cli.add_command("sweep", do_sweep, "Evict expired sandboxes now");
}
