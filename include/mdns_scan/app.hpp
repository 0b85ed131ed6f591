#pragma once

#include <optional>
#include <string>
#include <variant>

#include "mdns_scan/scan_controller.hpp"

namespace mdns_scan
{

enum class AppMode {
    Viewing,
    Editing,
    Exited
};
std::string ToString(AppMode mode);

struct EnterEdit {};
struct AppendChar { char c; };
struct DeleteChar {};
struct Commit {};
struct Quit {};

using AppEvent = std::variant<EnterEdit, AppendChar, DeleteChar, Commit, Quit>;

// Query editing and scan lifetime. Events that do not apply to the current
// mode are ignored.
class App
{
public:
    // With a query the app starts Viewing and scanning, otherwise Editing an empty query
    explicit App(ScanController& controller, std::optional<std::string> initial_query = std::nullopt);

    void Handle(const AppEvent& event);

    AppMode Mode() const { return m_mode; }
    [[nodiscard]] bool Editing() const { return m_mode == AppMode::Editing; }
    [[nodiscard]] bool Exited() const { return m_mode == AppMode::Exited; }

    const std::string& Query() const { return m_query; }
    // The query as shown in the query box, with a cursor while editing
    std::string QueryLine() const;
    // Why the last scan could not start, empty after a successful start
    const std::string& LastError() const { return m_lastError; }

private:
    void StartScan();

    ScanController& m_controller;
    AppMode m_mode{AppMode::Editing};
    std::string m_query;
    std::string m_lastError;
};

}
