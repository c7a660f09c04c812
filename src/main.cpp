#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "exchange/demo.hpp"
#include "exchange/order_script.hpp"
#include "exchange/report.hpp"
#include "exchange/session.hpp"

#include <cstdio>
#include <cstring>
#include <exception>
#include <optional>
#include <string>

namespace {

void print_usage(const char* prog) {
    printf("Usage: %s [--config <file>] [--script <file>] [--log-level <debug|info|warn|error>]\n", prog);
    printf("\n");
    printf("Without --script the built-in demo session is run.\n");
}

struct CommandLine {
    std::string config_path;
    std::string script_path;
    std::optional<std::string> log_level;
    bool help = false;
};

CommandLine parse_args(int argc, char* argv[]) {
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        auto value = [&](const char* flag) -> std::string {
            if (i + 1 >= argc) {
                throw exchange::ParseError(std::string("missing value for ") + flag);
            }
            return argv[++i];
        };

        if (strcmp(argv[i], "--config") == 0) {
            cmd.config_path = value("--config");
        } else if (strcmp(argv[i], "--script") == 0) {
            cmd.script_path = value("--script");
        } else if (strcmp(argv[i], "--log-level") == 0) {
            cmd.log_level = value("--log-level");
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            cmd.help = true;
        } else {
            throw exchange::ParseError(std::string("unknown argument '") + argv[i] + "'");
        }
    }
    return cmd;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace exchange;

    FILE* log_file = nullptr;
    int status = 0;

    try {
        CommandLine cmd = parse_args(argc, argv);
        if (cmd.help) {
            print_usage(argv[0]);
            return 0;
        }

        // --- Load config ---
        SimConfig config = cmd.config_path.empty() ? default_config() : load_config(cmd.config_path);
        if (cmd.log_level) config.log_level = parse_log_level(*cmd.log_level);
        if (!cmd.script_path.empty()) config.script_path = cmd.script_path;

        // --- Start logger ---
        if (!config.log_file.empty()) {
            log_file = fopen(config.log_file.c_str(), "a");
            if (!log_file) {
                throw ParseError("cannot open log file '" + config.log_file + "'");
            }
            Logger::instance().set_output(log_file);
        }
        Logger::instance().set_level(config.log_level);
        Logger::instance().start();
        LOG_INFO("exchange_sim starting up");

        Session session(config.random_symbol_length);

        if (config.script_path.empty()) {
            run_demo(session, stdout, config.display_books);
        } else {
            OrderScript script(session, stdout);
            const ScriptStats& stats = script.run_file(config.script_path);
            printf("\n--- Script Summary ---\n");
            printf("  Commands:         %zu\n", stats.commands);
            printf("  Orders accepted:  %zu\n", stats.orders_accepted);
            printf("  Orders rejected:  %zu\n", stats.orders_rejected);
            printf("  Trades:           %zu\n", stats.trades);
            printf("  Books:            %zu\n", session.book_count());
        }

        LOG_INFO("exchange_sim done");
    } catch (const std::exception& e) {
        LOG_ERROR("%s", e.what());
        fprintf(stderr, "error: %s\n", e.what());
        status = 1;
    }

    // --- Shutdown ---
    Logger::instance().stop();
    if (log_file) {
        Logger::instance().set_output(stderr);
        fclose(log_file);
    }
    return status;
}
