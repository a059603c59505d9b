#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <unistd.h>

// Third-party includes
#include <CLI/CLI.hpp>
#include <fmt/color.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

// Project includes
#include "internal/core/database.hpp"
#include "shell/app_config.hpp"
#include "shell/session.hpp"
#include "primdb/version.hpp"

using primdb::shell::AppConfig;

// ============================================================================
// Utility Functions
// ============================================================================
namespace {

void print_banner() {
    fmt::print(fg(fmt::color::cyan) | fmt::emphasis::bold,
        "PrimDB {} - JSON table database\n", PRIMDB_VERSION);
    fmt::print("Type 'help' for available commands, 'exit' to quit.\n\n");
}

spdlog::level::level_enum to_spdlog_level(const std::string& level) {
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "error") return spdlog::level::err;
    if (level == "off") return spdlog::level::off;
    return spdlog::level::warn;
}

bool setup_logging(const AppConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        // stdout carries command output, so diagnostics go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(to_spdlog_level(config.log_level));
        console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
        sinks.push_back(console_sink);

        if (!config.log_file.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.log_file,
                config.max_log_size,
                config.max_log_files
            );
            file_sink->set_level(spdlog::level::trace);
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>("primdb", sinks.begin(), sinks.end());
        logger->set_level(config.log_file.empty()
            ? to_spdlog_level(config.log_level)
            : spdlog::level::trace);
        logger->flush_on(spdlog::level::warn);

        spdlog::set_default_logger(logger);
        return true;

    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
        return false;
    }
}

bool confirm_on_console(std::string_view prompt) {
    std::cout << prompt << std::flush;

    std::string answer;
    if (!std::getline(std::cin, answer)) {
        return false;
    }
    return answer == "y" || answer == "Y" || answer == "yes";
}

} // anonymous namespace

// ============================================================================
// Entry Point
// ============================================================================
int main(int argc, char* argv[]) {
    AppConfig config;

    CLI::App app{"PrimDB - single-user JSON table database"};

    auto* data_dir_opt = app.add_option("-d,--data-dir", config.data_dir,
        "Directory holding the table files")
        ->envname("PRIMDB_DATA_DIR");

    app.add_option("-c,--config", config.config_file,
        "Configuration file path")
        ->envname("PRIMDB_CONFIG");

    auto* log_level_opt = app.add_option("-l,--log-level", config.log_level,
        "Log level (trace/debug/info/warn/error/off)")
        ->envname("PRIMDB_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "off"}));

    auto* log_file_opt = app.add_option("--log-file", config.log_file,
        "Log file path")
        ->envname("PRIMDB_LOG_FILE");

    bool assume_yes = false;
    app.add_flag("-y,--yes", assume_yes,
        "Do not ask for confirmation before destructive commands");

    app.add_option("-e,--execute", config.execute,
        "Run the given command(s) and exit");

    app.add_flag_callback("--version", []() {
        std::cout << "PrimDB version " << PRIMDB_VERSION << std::endl;
        std::cout << "Build type: " << PRIMDB_BUILD_TYPE << std::endl;
        std::cout << "Compiler: " << PRIMDB_COMPILER << std::endl;
        std::exit(0);
    }, "Show version information");

    CLI11_PARSE(app, argc, argv);

    // Values given on the command line win over the config file
    if (!config.config_file.empty()) {
        AppConfig from_file = config;
        if (auto status = from_file.load_from_file(config.config_file); !status) {
            std::cerr << "Failed to load config: " << status.error().message() << std::endl;
            return EXIT_FAILURE;
        }

        if (data_dir_opt->count() == 0) config.data_dir = from_file.data_dir;
        if (log_level_opt->count() == 0) config.log_level = from_file.log_level;
        if (log_file_opt->count() == 0) config.log_file = from_file.log_file;
        config.confirm = from_file.confirm;
        config.warnings = std::move(from_file.warnings);
    }

    if (assume_yes) {
        config.confirm = false;
    }

    if (!setup_logging(config)) {
        return EXIT_FAILURE;
    }

    spdlog::info("Starting PrimDB v{} ({} build, {})", PRIMDB_VERSION, PRIMDB_BUILD_TYPE, PRIMDB_COMPILER);

    for (const auto& warning : config.warnings) {
        spdlog::warn("{}", warning);
    }

    try {
        spdlog::info("Data directory: {}", std::filesystem::absolute(config.data_dir).string());
        primdb::core::Database db(config.data_dir);

        primdb::shell::Session::ConfirmFn confirm;
        if (config.confirm) {
            confirm = confirm_on_console;
        }

        primdb::shell::Session session(db, std::cout, confirm);

        if (!config.execute.empty()) {
            for (const auto& command : config.execute) {
                if (!session.execute(command)) {
                    break;
                }
            }
            return session.error_count() == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        if (isatty(fileno(stdin))) {
            print_banner();
        }

        session.run(std::cin);

    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::shutdown();
    return EXIT_SUCCESS;
}
