#include <functional>
#include <string>

#include "../src/core/errors.hpp"
#include "fakes.hpp"

using namespace gwmon_test;

namespace {
const char* kSite = "10.20.30.40";

// Runs the canned connect up to `keep` replies, then the given failure.
gwmon::Outcome fail_after(int keep, const std::function<void(FakeTerminal&)>& failure,
                          FakeTerminal& term) {
    FakeTerminal full;
    script_connect(full, kSite);
    for (int i = 0; i < keep; ++i) {
        term.script.push_back(full.script.front());
        full.script.pop_front();
    }
    failure(term);
    gwmon::ClientSession session(term, quick_options());
    gwmon::Outcome o = session.connect(kSite, "bob", "pw");
    if (session.alive() || session.state() != gwmon::SessionState::Terminated) {
        return gwmon::Outcome::Good;
    }
    return o;
}

bool fails_cleanly(int keep, const std::function<void(FakeTerminal&)>& failure) {
    FakeTerminal term;
    if (fail_after(keep, failure, term) != gwmon::Outcome::Fail) return false;
    return term.terminations == 1 && term.kills.size() == 2;
}

bool is_fatal(int keep, const std::function<void(FakeTerminal&)>& failure) {
    FakeTerminal term;
    try {
        fail_after(keep, failure, term);
    } catch (const gwmon::FatalError&) {
        return term.terminations == 1;
    }
    return false;
}
}  // namespace

int main() {
    auto say = [](const std::string& s) { return [s](FakeTerminal& t) { t.reply(s); }; };
    auto nothing = [](FakeTerminal& t) { t.silence(); };

    // Site contact errors after "connect".
    if (!fails_cleanly(3, say("  >> error: Connection attempt has failed due to unsuccessful domain name resolution.\nVPN> ")))
        return 1;
    if (!fails_cleanly(3, say("  >> error: Connect not available. Another AnyConnect application is running\n")))
        return 2;
    if (!fails_cleanly(3, say("  >> error: The client cannot verify server foo.\n"))) return 3;
    if (!fails_cleanly(3, nothing)) return 4;
    // Credentials and banner.
    if (!fails_cleanly(4, nothing)) return 5;
    if (!fails_cleanly(5, say("  >> Login failed.\nUsername: "))) return 6;
    if (!fails_cleanly(5, nothing)) return 7;
    if (!fails_cleanly(6, say("  >> notice: Please try connecting again.\nVPN> "))) return 8;
    if (!fails_cleanly(6, say("  >> error: The VPN client driver encountered an error.\n"))) return 9;
    if (!fails_cleanly(6, nothing)) return 10;
    // Connected, but to some other site.
    if (!fails_cleanly(6, say("  >> state: Connected\n  >> notice: Connected to 192.0.2.1.\nVPN> ")))
        return 11;
    // Child died mid-login.
    if (!fails_cleanly(4, [](FakeTerminal& t) { t.hang_up("Segmentation fault\n"); })) return 12;

    // Shell or client never came up.
    if (!is_fatal(0, nothing)) return 13;
    if (!is_fatal(0, [](FakeTerminal& t) { t.hang_up(); })) return 14;
    if (!is_fatal(1, say("sh: 1: /opt/cisco/anyconnect/bin/vpn: not found\ngwmon$ "))) return 15;
    if (!is_fatal(2, nothing)) return 16;

    // Exclusivity and spawn failures never reach the table.
    {
        FakeTerminal term;
        term.kill_ok = false;
        gwmon::ClientSession session(term, quick_options());
        bool thrown = false;
        try {
            session.connect(kSite, "bob", "pw");
        } catch (const gwmon::FatalError&) {
            thrown = true;
        }
        if (!thrown || term.spawns != 0) return 17;
    }
    {
        FakeTerminal term;
        term.spawn_ok = false;
        gwmon::ClientSession session(term, quick_options());
        bool thrown = false;
        try {
            session.connect(kSite, "bob", "pw");
        } catch (const gwmon::FatalError&) {
            thrown = true;
        }
        if (!thrown || !term.sent.empty()) return 18;
    }
    return 0;
}
