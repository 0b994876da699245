#include "apps/term/Terminal.hpp"

#include <iostream>
#include <string>
#include <unistd.h>

static int g_failures = 0;

static void check(const char* name, bool ok) {
    std::cout << "  " << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

int main() {
    using namespace dith;

    std::cout << "=== term_terminal_test ===\n";

    {
        std::cout << "\n[Test 0] Clear screen sequence\n";
        std::string buf = "a";
        AppendClearScreen(buf);
        check("ESC[2J ESC[H appended", buf == "a\x1B[2J\x1B[H");
    }

    {
        std::cout << "\n[Test 1] Terminal size\n";
        TermSize ts{};
        check("defaults 80x24", ts.cols == 80 && ts.rows == 24);

        if (GetTermSize(ts)) {
            std::cout << "  stdout is a terminal: " << ts.cols << "x" << ts.rows << "\n";
            check("non-zero size", ts.cols > 0 && ts.rows > 0);
        } else {
            std::cout << "  stdout is not a terminal\n";
            check("size left untouched", ts.cols == 80 && ts.rows == 24);
        }
    }

    {
        std::cout << "\n[Test 2] WriteAll() through a pipe\n";
        int fds[2];
        if (::pipe(fds) != 0) {
            std::cout << "FAIL: pipe()\n";
            return 1;
        }

        // Small enough to fit the pipe buffer without a reader thread
        std::string payload(4000, 'x');
        payload += "\xE2\xA3\xBF\n";
        check("WriteAll()", WriteAll(fds[1], payload));
        ::close(fds[1]);

        std::string got;
        char buf[512];
        ssize_t n;
        while ((n = ::read(fds[0], buf, sizeof(buf))) > 0) got.append(buf, static_cast<std::size_t>(n));
        ::close(fds[0]);
        check("all bytes arrived", got == payload);

        check("bad fd fails", !WriteAll(-1, payload));
    }

    if (g_failures) {
        std::cout << "\nterm_terminal_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nterm_terminal_test: PASS\n";
    return 0;
}
