#pragma once

#include <chrono>
#include <string>
#include <vector>

#include <termios.h>

#include "mdns_scan/display.hpp"

namespace mdns_scan
{

enum class KeyCode {
    None,
    Char,
    Enter,
    Escape,
    Backspace,
    Other
};

struct Key {
    KeyCode code{KeyCode::None};
    char c{0};
};

// Puts stdin into non-canonical no-echo mode and switches to the alternate
// screen. Everything is restored on destruction.
class Terminal
{
public:
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Waits at most timeout for a key press
    Key Poll(std::chrono::milliseconds timeout);

    void Draw(const std::string& query_line, bool editing, const std::string& status,
              const std::vector<HostRow>& rows);

private:
    bool m_restore{false};
    struct termios m_original;
};

}
