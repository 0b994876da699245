#include "apps/term/Terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>
#include <errno.h>

namespace dith {

static constexpr const char* CLEAR_SCREEN = "\x1B[2J\x1B[H";

bool GetTermSize(TermSize& out) {
    winsize ws{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == -1) return false;
    if (ws.ws_col == 0 || ws.ws_row == 0) return false;

    out.cols = ws.ws_col;
    out.rows = ws.ws_row;
    return true;
}

void AppendClearScreen(std::string& buf) {
    buf.append(CLEAR_SCREEN);
}

bool WriteAll(int fd, const std::string& data) {
    const char* p = data.data();
    std::size_t left = data.size();

    while (left > 0) {
        const ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p    += n;
        left -= static_cast<std::size_t>(n);
    }
    return true;
}

} // namespace dith
