#include "mdns_scan/app.hpp"
#include "mdns_scan/display.hpp"
#include "mdns_scan/log.hpp"
#include "mdns_scan/mdns_discovery.hpp"
#include "mdns_scan/record_store.hpp"
#include "mdns_scan/scan_controller.hpp"

#include "terminal.hpp"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#ifndef MDNS_SCAN_VERSION
#define MDNS_SCAN_VERSION "unknown"
#endif

namespace
{

std::atomic<bool> g_stopRequested{false};

void OnStopSignal(int)
{
    g_stopRequested.store(true);
}

constexpr std::chrono::milliseconds kTick{50};
constexpr std::chrono::milliseconds kMaxInterval = std::chrono::hours(1);

struct CommandLine
{
    std::optional<std::string> query;
    std::optional<std::string> log_file;
    mdns_scan::LogLevel log_level{mdns_scan::LogLevel::Info};
    mdns_scan::ScanSettings settings;
    bool help{false};
    bool version{false};
};

void PrintUsage(const char* program)
{
    std::cout << fmt::format(
        "Simple TUI for discovering mDNS capable devices\n\n"
        "Usage: {} [options] [QUERY]\n\n"
        "  QUERY                 The mDNS query, e.g. \"_http._tcp.local\"\n"
        "  --log-file <path>     Append log messages to a file\n"
        "  --log-level <level>   debug, info, warn or error (default info)\n"
        "  --interval <seconds>  Resend the query this often (default 5, at most 3600)\n"
        "  -h, --help            Print this help\n"
        "  -V, --version         Print the version\n",
        program);
}

// Throws std::invalid_argument on bad usage
CommandLine ParseCommandLine(int argc, char** argv)
{
    CommandLine cmd;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::invalid_argument(fmt::format("{} needs a value", arg));
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "-V" || arg == "--version") {
            cmd.version = true;
        } else if (arg == "--log-file") {
            cmd.log_file = value();
        } else if (arg == "--log-level") {
            const auto text = value();
            const auto level = mdns_scan::ParseLogLevel(text);
            if (!level) {
                throw std::invalid_argument(fmt::format("Unknown log level '{}'", text));
            }
            cmd.log_level = *level;
        } else if (arg == "--interval") {
            cmd.settings.query_interval = mdns_scan::ParseSeconds(value(), kMaxInterval);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw std::invalid_argument(fmt::format("Unknown option '{}'", arg));
        } else if (!cmd.query) {
            cmd.query = arg;
        } else {
            throw std::invalid_argument(fmt::format("Unexpected argument '{}'", arg));
        }
    }
    return cmd;
}

// Log lines would corrupt the screen, so they go to a file or nowhere
void InstallLogger(const CommandLine& cmd)
{
    if (!cmd.log_file) {
        mdns_scan::SetLogger({});
        return;
    }
    auto file = std::make_shared<std::ofstream>(*cmd.log_file, std::ios::app);
    if (!*file) {
        throw std::runtime_error(fmt::format("Cannot open log file '{}'", *cmd.log_file));
    }
    mdns_scan::SetLogger([file](mdns_scan::LogLevel level, std::string_view message) {
        *file << fmt::format("{:%H:%M:%S} [{}] {}\n", fmt::localtime(std::time(nullptr)), mdns_scan::ToString(level), message) << std::flush;
    }, cmd.log_level);
}

std::optional<mdns_scan::AppEvent> ToEvent(const mdns_scan::Key& key, bool editing)
{
    using mdns_scan::KeyCode;
    if (editing) {
        switch (key.code) {
            case KeyCode::Char: return mdns_scan::AppendChar{key.c};
            case KeyCode::Backspace: return mdns_scan::DeleteChar{};
            case KeyCode::Enter:
            case KeyCode::Escape: return mdns_scan::Commit{};
            default: return std::nullopt;
        }
    }
    if (key.code == KeyCode::Escape || (key.code == KeyCode::Char && key.c == 'q')) {
        return mdns_scan::Quit{};
    }
    if (key.code == KeyCode::Char && key.c == '/') {
        return mdns_scan::EnterEdit{};
    }
    return std::nullopt;
}

std::string StatusLine(const mdns_scan::App& app, const mdns_scan::ScanController& controller, std::size_t hosts)
{
    if (!app.LastError().empty()) {
        return fmt::format("Error: {}", app.LastError());
    }
    if (const auto query = controller.ActiveQuery()) {
        return fmt::format("{} {}: {} host{}", controller.Scanning() ? "Scanning" : "Stopped", *query, hosts, hosts == 1 ? "" : "s");
    }
    return "";
}

int Run(const CommandLine& cmd)
{
    auto store = std::make_shared<mdns_scan::RecordStore>();
    auto backend = std::make_shared<mdns_scan::MdnsDiscoveryBackend>(cmd.settings);
    mdns_scan::ScanController controller(store, backend, cmd.settings);

    {
        mdns_scan::Terminal terminal;
        mdns_scan::App app(controller, cmd.query);

        while (!app.Exited() && !g_stopRequested.load()) {
            const auto rows = mdns_scan::BuildHostRows(store->Snapshot());
            terminal.Draw(app.QueryLine(), app.Editing(), StatusLine(app, controller, rows.size()), rows);

            const auto key = terminal.Poll(kTick);
            if (const auto event = ToEvent(key, app.Editing())) {
                app.Handle(*event);
            }
        }
    }

    controller.Shutdown();
    return 0;
}

}

int main(int argc, char** argv)
{
    CommandLine cmd;
    try {
        cmd = ParseCommandLine(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n\n";
        PrintUsage(argv[0]);
        return 2;
    }

    if (cmd.help) {
        PrintUsage(argv[0]);
        return 0;
    }
    if (cmd.version) {
        std::cout << "mdns_scan " << MDNS_SCAN_VERSION << "\n";
        return 0;
    }

    signal(SIGINT, OnStopSignal);
    signal(SIGTERM, OnStopSignal);

    try {
        InstallLogger(cmd);
        return Run(cmd);
    } catch (const std::exception& e) {
        std::cerr << "mdns_scan: " << e.what() << "\n";
        return 1;
    }
}
