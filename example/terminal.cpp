#include "terminal.hpp"

#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/format.h>

namespace mdns_scan
{

namespace
{

constexpr char kEscape = 0x1b;

std::pair<std::size_t, std::size_t> TerminalSize()
{
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        return {ws.ws_col, ws.ws_row};
    }
    return {80, 24};
}

std::string Fit(const std::string& text, std::size_t width)
{
    if (text.size() >= width) {
        return text.substr(0, width);
    }
    return text + std::string(width - text.size(), ' ');
}

std::string Border(const std::string& title, std::size_t width)
{
    const std::string head = title.empty() ? "+" : fmt::format("+- {} ", title);
    if (width < head.size() + 1) {
        return Fit(head, width);
    }
    return head + std::string(width - head.size() - 1, '-') + "+";
}

std::string Boxed(const std::string& text, std::size_t width)
{
    if (width < 4) {
        return Fit(text, width);
    }
    return "| " + Fit(text, width - 4) + " |";
}

bool ReadByte(char& c, int timeout_ms)
{
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, timeout_ms);
    if (ready <= 0) {
        return false;
    }
    return read(STDIN_FILENO, &c, 1) == 1;
}

}

Terminal::Terminal()
{
    if (!isatty(STDIN_FILENO)) {
        throw std::runtime_error("stdin is not a terminal.");
    }
    if (tcgetattr(STDIN_FILENO, &m_original) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcgetattr failed");
    }

    struct termios raw = m_original;
    // Signals stay enabled so Ctrl-C goes through the normal shutdown path
    raw.c_lflag &= ~(ICANON | ECHO | IEXTEN);
    raw.c_iflag &= ~(IXON | ICRNL);
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;
    if (tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcsetattr failed");
    }
    m_restore = true;

    // Alternate screen, hidden cursor
    std::cout << "\x1b[?1049h\x1b[?25l" << std::flush;
}

Terminal::~Terminal()
{
    std::cout << "\x1b[?25h\x1b[?1049l" << std::flush;
    if (m_restore) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &m_original);
    }
}

Key Terminal::Poll(std::chrono::milliseconds timeout)
{
    char c = 0;
    if (!ReadByte(c, static_cast<int>(timeout.count()))) {
        return {};
    }

    if (c == kEscape) {
        // A lone escape is the Esc key, anything following it is a sequence to drop
        char next = 0;
        if (!ReadByte(next, 0)) {
            return {KeyCode::Escape, c};
        }
        while (ReadByte(next, 0)) {
        }
        return {KeyCode::Other, 0};
    }
    if (c == '\r' || c == '\n') {
        return {KeyCode::Enter, c};
    }
    if (c == 0x7f || c == 0x08) {
        return {KeyCode::Backspace, c};
    }
    // Printable ASCII only, so the query never holds part of a multi-byte character
    if (c >= 0x20 && c < 0x7f) {
        return {KeyCode::Char, c};
    }
    return {KeyCode::Other, c};
}

void Terminal::Draw(const std::string& query_line, bool editing, const std::string& status,
                    const std::vector<HostRow>& rows)
{
    const auto [width, height] = TerminalSize();
    const std::size_t inner = width > 4 ? width - 4 : width;
    const std::size_t hostWidth = inner * 40 / 100;
    const std::size_t ipv4Width = inner * 30 / 100;
    const std::size_t ipv6Width = inner - hostWidth - ipv4Width;

    std::string frame = "\x1b[H";
    frame += Border("mDNS Query", width) + "\r\n";
    frame += Boxed(query_line, width) + "\r\n";
    frame += Border("", width) + "\r\n";

    frame += Border("Records", width) + "\r\n";
    frame += Boxed(Fit("Host", hostWidth) + Fit("IPv4", ipv4Width) + Fit("IPv6", ipv6Width), width) + "\r\n";
    frame += Boxed("", width) + "\r\n";

    // Three rows for the query box, four for the table frame, one for the status line
    const std::size_t available = height > 8 ? height - 8 : 0;
    const std::size_t shown = std::min(rows.size(), available);
    for (std::size_t i = 0; i < shown; ++i) {
        const auto& row = rows[i];
        frame += Boxed(Fit(row.host, hostWidth) + Fit(row.ipv4, ipv4Width) + Fit(row.ipv6, ipv6Width), width) + "\r\n";
    }
    for (std::size_t i = shown; i < available; ++i) {
        frame += Boxed("", width) + "\r\n";
    }
    frame += Border("", width) + "\r\n";

    const std::string help = editing ? "Enter/Esc: search  Backspace: delete"
                                     : "/: edit query  q/Esc: quit";
    frame += Fit(status.empty() ? help : fmt::format("{}  ({})", status, help), width);

    std::cout << frame << std::flush;
}

}
