#include "mdns_scan/app.hpp"
#include "mdns_scan/errors.hpp"
#include "mdns_scan/log.hpp"

#include <type_traits>

#include <fmt/format.h>

namespace mdns_scan
{

std::string ToString(AppMode mode)
{
    switch (mode) {
        case AppMode::Viewing: return "viewing";
        case AppMode::Editing: return "editing";
        case AppMode::Exited: return "exited";
    }
    return "";
}

App::App(ScanController& controller, std::optional<std::string> initial_query)
: m_controller(controller)
{
    if (initial_query) {
        m_query = std::move(*initial_query);
        m_mode = AppMode::Viewing;
        StartScan();
    }
}

void App::Handle(const AppEvent& event)
{
    std::visit([this](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;
        if (m_mode == AppMode::Viewing) {
            if constexpr (std::is_same_v<T, EnterEdit>) {
                m_mode = AppMode::Editing;
            } else if constexpr (std::is_same_v<T, Quit>) {
                m_controller.Shutdown();
                m_mode = AppMode::Exited;
            }
        } else if (m_mode == AppMode::Editing) {
            if constexpr (std::is_same_v<T, AppendChar>) {
                if (ev.c >= 0x20 && ev.c < 0x7f) {
                    m_query.push_back(ev.c);
                }
            } else if constexpr (std::is_same_v<T, DeleteChar>) {
                if (!m_query.empty()) {
                    m_query.pop_back();
                }
            } else if constexpr (std::is_same_v<T, Commit>) {
                m_mode = AppMode::Viewing;
                StartScan();
            }
        }
    }, event);
}

std::string App::QueryLine() const
{
    if (m_mode == AppMode::Editing) {
        return m_query + "_";
    }
    return m_query;
}

void App::StartScan()
{
    try {
        m_controller.Start(m_query);
        m_lastError.clear();
    } catch (const SessionOpenError& e) {
        m_lastError = e.what();
        Log(LogLevel::Warn, fmt::format("No scan running: {}", m_lastError));
    }
}

}
