#include <iostream>
#include <filesystem>
#include <clocale>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include "utils/color.hpp"
#include "cli/cli_parser.hpp"
#include "cli/commands.hpp"
#include "utils/console_log_sink.hpp"
#include "utils/file_log_sink.hpp"
#include "utils/json_log_sink.hpp"
#include "../../libdroply/include/droply.hpp"
#include "../../libdroply/include/event_bus.hpp"
#include "../../libdroply/include/events.hpp"
#include "../../libdroply/include/logger.hpp"

using namespace droply;
namespace fs = std::filesystem;

inline void init_utf8_locale() {
    std::setlocale(LC_ALL, "");

    const char *cur = std::setlocale(LC_CTYPE, nullptr);
    if (cur && std::string(cur).find("UTF-8") != std::string::npos) {
        Logger::log(LogLevel::Debug, std::string("Current locale: ") + cur, "LocaleInit");
        return;
    }

    constexpr const char *fallbacks[] = {"C.UTF-8", "en_US.UTF-8"};
    for (const auto fb: fallbacks) {
        if (std::setlocale(LC_ALL, fb)) {
            Logger::log(LogLevel::Debug, std::string("Locale set to ") + fb, "LocaleInit");
            return;
        }
    }

    Logger::log(LogLevel::Warning, "UTF-8 locale not available; non-ASCII file names may be problematic.",
                "LocaleInit");
}

static void setup_logging(const Settings& settings) {
    Logger::clear_sinks();

    const LogLevel level = settings.debug ? LogLevel::Debug
                         : settings.verbose ? LogLevel::Info
                         : LogLevel::Warning;
    if (settings.json) {
        auto sink = std::make_unique<JsonLogSink>();
        sink->log_level = level;
        Logger::add_sink(std::move(sink));
    } else {
        auto sink = std::make_unique<ConsoleLogSink>();
        sink->log_level = level;
        Logger::add_sink(std::move(sink));
    }

    if (!settings.log_file.empty()) {
        Logger::add_sink(std::make_unique<FileLogSink>(settings.log_file, true));
    }
}

// progress/outcome lines for every file written by the OutputWriter
static void subscribe_output_events(EventBus& bus, const Settings& settings) {
    bus.subscribe<OutputWrittenEvent>([&settings](const OutputWrittenEvent& e) {
        if (settings.json) {
            std::cout << nlohmann::json{
                {"type", "written"},
                {"path", e.written.string()},
                {"requested", e.requested.string()},
                {"size", e.size},
                {"replaced", e.replaced},
            }.dump() << std::endl;
            return;
        }
        std::cerr << GREEN << "[DONE] " << e.written.string() << " (" << e.size << " bytes)"
                  << (e.replaced ? " [replaced]" : (e.written != e.requested ? " [renamed]" : ""))
                  << RESET << std::endl;
    });

    bus.subscribe<OutputSkippedEvent>([&settings](const OutputSkippedEvent& e) {
        if (settings.json) {
            std::cout << nlohmann::json{
                {"type", "skipped"},
                {"path", e.requested.string()},
                {"reason", e.reason},
            }.dump() << std::endl;
            return;
        }
        std::cerr << YELLOW << "[SKIP] " << e.requested.string() << " (" << e.reason << ")" << RESET << std::endl;
    });

    bus.subscribe<OutputErrorEvent>([&settings](const OutputErrorEvent& e) {
        if (settings.json) {
            std::cout << nlohmann::json{
                {"type", "error"},
                {"path", e.requested.string()},
                {"message", e.error_message},
            }.dump() << std::endl;
            return;
        }
        std::cerr << RED << "[FAIL] " << e.requested.string() << ": " << e.error_message << RESET << std::endl;
    });
}

int main(int argc, char* argv[]) {

    CLI::App app{"droply: compress, archive and restore files."};
    Settings settings;
    setup_cli_parser(app, settings);

    try {
        app.parse(argc, argv);
    }
    catch (const CLI::CallForHelp &e) {
        return app.exit(e);
    }
    catch (const CLI::CallForVersion &e) {
        return app.exit(e);
    }
    catch (const CLI::ParseError &e) {
        std::cerr << RED << "Parse error: " << e.what() << RESET << std::endl;
        app.exit(e);
        return 2;
    }

    try {
        setup_logging(settings);
    } catch (const std::exception& e) {
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
    init_utf8_locale();

    Droply droply;
    if (!settings.platform.empty()) {
        droply.platform(parse_platform(settings.platform).value_or(Platform::Server));
    }

    EventBus bus;
    subscribe_output_events(bus, settings);

    if (settings.command == Command::None) {
        std::cout << app.help() << std::endl;
        return 0;
    }

    try {
        return run_command(settings, droply, bus);
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, e.what(), "main");
        std::cerr << RED << "Error: " << e.what() << RESET << std::endl;
        return 1;
    }
}
