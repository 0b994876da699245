#pragma once
#include <cstdint>
#include <string>

namespace dith {

struct TermSize {
    uint32_t cols = 80;
    uint32_t rows = 24;
};

// TIOCGWINSZ on stdout. False (out untouched) when stdout is not a terminal
// or reports a zero size.
bool GetTermSize(TermSize& out);

// ESC[2J ESC[H: clear, cursor home
void AppendClearScreen(std::string& buf);

// Writes every byte, retrying partial writes and EINTR. False on any other error.
bool WriteAll(int fd, const std::string& data);

} // namespace dith
