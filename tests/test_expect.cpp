#include <chrono>
#include <string>
#include <vector>

#include "fakes.hpp"

using namespace gwmon_test;

int main() {
    const std::chrono::milliseconds t(200);
    FakeTerminal term;
    term.reply("banner\nUsername: ");
    term.spawn({"/bin/sh"}, {});
    gwmon::Expecter ex(term);

    // Earliest occurrence wins regardless of list order.
    auto r = ex.expect({"Password:", "Username:", "banner"}, t);
    if (r.status != gwmon::ExpectStatus::Matched || r.index != 2) return 1;
    if (!r.before.empty()) return 2;
    // The rest of the output carries over.
    r = ex.expect({"Username:"}, t);
    if (r.status != gwmon::ExpectStatus::Matched || r.before != "\n") return 3;
    if (ex.buffer() != " ") return 4;

    // Same start: first listed pattern wins.
    term.reply("state: Connected to x");
    term.send_line("go");
    r = ex.expect({"state: Conn", "state: Connected"}, t);
    if (r.status != gwmon::ExpectStatus::Matched || r.index != 0) return 5;

    // Nothing arrives: timeout, with the unmatched text reported.
    ex.clear();
    term.reply("partial output");
    term.send_line("next");
    r = ex.expect({"VPN>"}, t);
    if (r.status != gwmon::ExpectStatus::Timeout) return 6;
    if (r.before != "partial output") return 7;

    // Child hangs up.
    ex.clear();
    term.hang_up("bye");
    term.send_line("exit");
    r = ex.expect({"VPN>"}, t);
    if (r.status != gwmon::ExpectStatus::Eof || r.before != "bye") return 8;
    return 0;
}
