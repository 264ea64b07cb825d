#include "fakes.hpp"

using namespace gwmon_test;

int main() {
    const char* site = "gw.example.org";

    // Nothing running: no I/O at all, any number of times.
    {
        FakeTerminal term;
        gwmon::ClientSession session(term, quick_options());
        if (session.disconnect() != gwmon::Outcome::Good) return 1;
        if (session.disconnect() != gwmon::Outcome::Good) return 2;
        if (!term.sent.empty() || term.terminations != 0) return 3;
        if (session.state() != gwmon::SessionState::Unstarted) return 4;
    }

    // After a clean close, a second close is a no-op.
    {
        FakeTerminal term;
        script_connect(term, site);
        script_disconnect(term);
        gwmon::ClientSession session(term, quick_options());
        if (session.connect(site, "u", "p") != gwmon::Outcome::Good) return 5;
        if (session.disconnect() != gwmon::Outcome::Good) return 6;
        size_t sent = term.sent.size();
        if (session.disconnect() != gwmon::Outcome::Good) return 7;
        if (term.sent.size() != sent || term.terminations != 1) return 8;
    }

    // The client never returns its prompt: Fail, but the child still goes away.
    {
        FakeTerminal term;
        script_connect(term, site);
        term.silence();
        gwmon::ClientSession session(term, quick_options());
        if (session.connect(site, "u", "p") != gwmon::Outcome::Good) return 9;
        if (session.disconnect() != gwmon::Outcome::Fail) return 10;
        if (session.alive() || term.terminations != 1) return 11;
        if (session.state() != gwmon::SessionState::Terminated) return 12;
    }

    // "exit" does not bring back the shell.
    {
        FakeTerminal term;
        script_connect(term, site);
        term.reply("  >> state: Disconnected\nVPN> ");
        term.hang_up();
        gwmon::ClientSession session(term, quick_options());
        if (session.connect(site, "u", "p") != gwmon::Outcome::Good) return 13;
        if (session.disconnect() != gwmon::Outcome::Fail) return 14;
        if (session.alive()) return 15;
    }
    return 0;
}
