#pragma once
#include <deque>
#include <map>
#include <string>
#include <vector>

#include "../src/core/alerter.hpp"
#include "../src/core/record.hpp"
#include "../src/core/result_log.hpp"
#include "../src/core/shutdown.hpp"
#include "../src/probes/prober.hpp"
#include "../src/session/client_session.hpp"
#include "../src/session/terminal.hpp"

namespace gwmon_test {
using namespace gwmon;

// Each spawn() or send_line() releases the next scripted reply. An empty
// reply means nothing arrives, which the reader sees as a timeout.
class FakeTerminal : public Terminal {
   public:
    struct Reply {
        std::string text;
        bool eof{false};
    };
    std::deque<Reply> script;
    std::vector<std::string> sent;
    bool spawn_ok{true};
    bool kill_ok{true};
    int spawns{0};
    int terminations{0};
    std::vector<std::vector<std::string>> kills;

    void reply(const std::string& text) { script.push_back({text, false}); }
    void silence() { script.push_back({"", false}); }
    void hang_up(const std::string& text = "") { script.push_back({text, true}); }

    bool kill_strays(const std::vector<std::string>& names) override {
        kills.push_back(names);
        return kill_ok;
    }
    bool spawn(const std::vector<std::string>&, const std::vector<std::string>&) override {
        ++spawns;
        if (!spawn_ok) return false;
        alive_ = true;
        release();
        return true;
    }
    bool send_line(const std::string& line) override {
        sent.push_back(line);
        if (!alive_) return false;
        release();
        return true;
    }
    ReadStatus read_some(std::string& out, int) override {
        if (!available_.empty()) {
            out += available_;
            available_.clear();
            return ReadStatus::Data;
        }
        return eof_ ? ReadStatus::Eof : ReadStatus::Timeout;
    }
    bool alive() override { return alive_; }
    bool terminate() override {
        ++terminations;
        alive_ = false;
        available_.clear();
        eof_ = false;
        return true;
    }

   private:
    bool alive_{false};
    bool eof_{false};
    std::string available_;

    void release() {
        if (script.empty()) return;
        Reply r = script.front();
        script.pop_front();
        available_ += r.text;
        if (r.eof) eof_ = true;
    }
};

inline SessionOptions quick_options() {
    SessionOptions o;
    o.command_delay = std::chrono::milliseconds(0);
    o.timeout = std::chrono::milliseconds(1000);
    return o;
}

// Canned client output for a clean connect to `site`.
inline void script_connect(FakeTerminal& t, const std::string& site) {
    t.reply("gwmon$ ");
    t.reply("Cisco AnyConnect Secure Mobility Client (version 4.10).\n\n  >> state: Disconnected\nVPN> ");
    t.reply("  >> state: Disconnected\nVPN> ");
    t.reply("  >> contacting host (" + site + ") for login information...\n"
            "  >> Please enter your username and password.\n\nUsername: ");
    t.reply("Password: ");
    t.reply("\n  >> notice: Authorized users only.\n\naccept? [y/n]: ");
    t.reply("  >> state: Connecting\n  >> notice: Establishing VPN session...\n"
            "  >> state: Connected\n  >> notice: Connected to " + site + ".\nVPN> ");
}

inline void script_disconnect(FakeTerminal& t) {
    t.reply("  >> state: Disconnecting\n  >> state: Disconnected\nVPN> ");
    t.reply("gwmon$ ");
}

class FakeProber : public Prober {
   public:
    std::map<std::string, std::deque<Outcome>> ping_results;
    std::map<std::string, Outcome> web_results;
    Outcome fallback{Outcome::Good};
    std::vector<std::string> pinged;
    std::vector<int> repetitions;
    std::vector<std::string> fetched;
    std::vector<std::string>* events{nullptr};

    Outcome ping(const std::string& address, int reps, int) override {
        pinged.push_back(address);
        repetitions.push_back(reps);
        if (events) events->push_back("ping " + address);
        auto it = ping_results.find(address);
        if (it == ping_results.end() || it->second.empty()) return fallback;
        Outcome o = it->second.front();
        if (it->second.size() > 1) it->second.pop_front();
        return o;
    }
    Outcome web(const std::string& url, int) override {
        fetched.push_back(url);
        if (events) events->push_back("web " + url);
        auto it = web_results.find(url);
        return it == web_results.end() ? fallback : it->second;
    }
};

class FakeSession : public GatewaySession {
   public:
    std::deque<Outcome> connect_results;
    std::deque<Outcome> disconnect_results;
    int connects{0};
    int disconnects{0};
    bool open{false};
    std::vector<std::string>* events{nullptr};

    Outcome connect(const std::string&, const std::string&, const std::string&) override {
        ++connects;
        if (events) events->push_back("connect");
        Outcome o = next(connect_results);
        open = o == Outcome::Good;
        return o;
    }
    Outcome disconnect() override {
        ++disconnects;
        if (events) events->push_back("disconnect");
        if (!open) return Outcome::Good;
        open = false;
        return next(disconnect_results);
    }

   private:
    static Outcome next(std::deque<Outcome>& q) {
        if (q.empty()) return Outcome::Good;
        Outcome o = q.front();
        if (q.size() > 1) q.pop_front();
        return o;
    }
};

class FakeSink : public ResultSink {
   public:
    std::vector<std::vector<CycleRecord>> writes;
    std::deque<Outcome> results;
    int closes{0};
    std::vector<std::string>* events{nullptr};

    Outcome write(const std::vector<CycleRecord>& rows) override {
        writes.push_back(rows);
        if (events) events->push_back("flush");
        if (results.empty()) return Outcome::Good;
        Outcome o = results.front();
        results.pop_front();
        return o;
    }
    void close() override { ++closes; }

    size_t total_rows() const {
        size_t n = 0;
        for (const auto& w : writes) n += w.size();
        return n;
    }
};

class FakeAlerter : public Alerter {
   public:
    std::vector<int> alerts;
    void alert(int pulses) override { alerts.push_back(pulses); }
};

// Interrupts at the Nth requested() check or the Nth sleep (1-based); 0
// means never.
class FakeWatch : public ShutdownWatch {
   public:
    int interrupt_on_check{0};
    int interrupt_on_sleep{0};
    int checks{0};
    std::vector<std::chrono::seconds> sleeps;

    bool requested() override {
        ++checks;
        if (interrupt_on_check > 0 && checks >= interrupt_on_check) fired_ = true;
        return fired_;
    }
    bool sleep_for(std::chrono::seconds d) override {
        sleeps.push_back(d);
        if (interrupt_on_sleep > 0 && static_cast<int>(sleeps.size()) >= interrupt_on_sleep) {
            fired_ = true;
        }
        return !fired_;
    }

   private:
    bool fired_{false};
};

class FakeAppender : public Appender {
   public:
    std::deque<AppendError> script;
    std::string written;
    int attempts{0};
    int closes{0};

    AppendError append(const std::string& path, const std::string& data,
                       std::string& detail) override {
        ++attempts;
        AppendError e = AppendError::None;
        if (!script.empty()) {
            e = script.front();
            script.pop_front();
        }
        if (e == AppendError::None) written += data;
        else detail = path + ": scripted failure";
        return e;
    }
    void close() override { ++closes; }
};
}  // namespace gwmon_test
