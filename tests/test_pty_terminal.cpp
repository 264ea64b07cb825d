#include <chrono>
#include <string>

#include "../src/session/expect.hpp"
#include "../src/session/pty_terminal.hpp"

int main() {
    const std::chrono::milliseconds wait(5000);
    gwmon::PtyTerminal term;
    if (term.alive()) return 1;
    if (!term.spawn({"/bin/sh"}, {"PS1=gwmon$ ", "ENV="})) return 2;
    if (!term.alive()) return 3;

    gwmon::Expecter ex(term);
    if (ex.expect({"gwmon$ "}, wait).status != gwmon::ExpectStatus::Matched) return 4;
    // Only the shell's expansion can match; the typed line is not echoed.
    if (!term.send_line("echo marker-$((6*7))")) return 5;
    auto r = ex.expect({"marker-42"}, wait);
    if (r.status != gwmon::ExpectStatus::Matched) return 6;
    if (ex.expect({"gwmon$ "}, wait).status != gwmon::ExpectStatus::Matched) return 7;

    if (!term.terminate()) return 8;
    if (term.alive()) return 9;
    if (term.send_line("echo again")) return 10;

    // Nothing on this system is called that.
    if (!term.kill_strays({"gwmon-no-such-process"})) return 11;
    return 0;
}
