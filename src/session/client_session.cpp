#include "client_session.hpp"

#include <cstdio>
#include <thread>
#include <utility>

#include "../core/errors.hpp"
#include "../core/logger.hpp"

namespace gwmon {
namespace {
using S = SessionState;
using M = Match;
using A = Action;

const std::vector<Transition> kTable = {
    {S::Spawned, M::ShellPrompt, S::ShellReady, A::SendClient, "shell ready"},
    {S::Spawned, M::Unmatched, S::Terminated, A::Fatal,
     "unable to spawn child process to run the VPN client"},

    {S::ShellReady, M::ToolPrompt, S::ToolReady, A::SendDisconnect, "client ready"},
    {S::ShellReady, M::Unmatched, S::Terminated, A::Fatal, "unable to use the VPN client CLI"},

    {S::ToolReady, M::ToolPrompt, S::Disconnected, A::SendConnect, "client disconnected"},
    {S::ToolReady, M::Unmatched, S::Terminated, A::Fatal,
     "unable to disconnect the VPN before connecting"},

    {S::Disconnected, M::UsernamePrompt, S::CredentialsSent, A::SendUsername, "site answered"},
    {S::Disconnected, M::DomainFailure, S::Terminated, A::Fail, "unable to contact the VPN site"},
    {S::Disconnected, M::NotAvailable, S::Terminated, A::Fail,
     "another VPN client UI or CLI is running"},
    {S::Disconnected, M::VerifyFailure, S::Terminated, A::Fail,
     "client cannot verify the VPN server; there may be a server certificate issue"},
    {S::Disconnected, M::Timeout, S::Terminated, A::Fail, "VPN site is not responding"},
    {S::Disconnected, M::Unmatched, S::Terminated, A::Fail, "unexpected VPN connection error"},

    {S::CredentialsSent, M::PasswordPrompt, S::PasswordSent, A::SendPassword, "username taken"},
    {S::CredentialsSent, M::Unmatched, S::Terminated, A::Fail,
     "unexpected VPN credentials error"},

    {S::PasswordSent, M::AcceptPrompt, S::BannerPrompt, A::SendAccept, "login accepted"},
    {S::PasswordSent, M::LoginFailed, S::Terminated, A::Fail,
     "VPN username/password was not accepted"},
    {S::PasswordSent, M::Timeout, S::Terminated, A::Fail, "VPN credentials response timeout"},
    {S::PasswordSent, M::Unmatched, S::Terminated, A::Fail, "unexpected VPN credentials error"},

    {S::BannerPrompt, M::StateConnected, S::StateConfirmed, A::Await, "state connected"},
    {S::BannerPrompt, M::RetrySuggested, S::Terminated, A::Fail,
     "unable to establish a connection this time"},
    {S::BannerPrompt, M::DriverError, S::Terminated, A::Fail,
     "VPN client driver encountered an error; restart the host, then try again"},
    {S::BannerPrompt, M::Timeout, S::Terminated, A::Fail, "banner accept response timeout"},
    {S::BannerPrompt, M::Unmatched, S::Terminated, A::Fail, "unexpected VPN banner accept error"},

    {S::StateConfirmed, M::ConnectedToSite, S::SiteConfirmed, A::Await, "site confirmed"},
    {S::StateConfirmed, M::Unmatched, S::Terminated, A::Fail,
     "connection was not confirmed for the site"},

    {S::SiteConfirmed, M::ToolPrompt, S::Connected, A::Succeed, "connected"},
    {S::SiteConfirmed, M::Unmatched, S::Terminated, A::Fail,
     "client prompt did not return after connecting"},

    {S::DisconnectSent, M::ToolPrompt, S::ToolExited, A::SendExit, "disconnected"},
    {S::DisconnectSent, M::Unmatched, S::Terminated, A::Fail, "unable to disconnect the VPN"},

    {S::ToolExited, M::ShellPrompt, S::Terminated, A::Succeed, "client exited"},
    {S::ToolExited, M::Unmatched, S::Terminated, A::Fail, "unable to exit the VPN client CLI"},
};

bool is_pattern(Match m) {
    return m != M::Timeout && m != M::Eof && m != M::Unmatched;
}

std::string printable(const std::string& s) {
    const size_t kMax = 512;
    std::string src = s.size() > kMax ? s.substr(s.size() - kMax) : s;
    std::string out;
    out.reserve(src.size());
    for (char c : src) {
        switch (c) {
            case '\r': out += "\\r"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
                    char hex[8];
                    std::snprintf(hex, sizeof(hex), "\\x%02x", static_cast<unsigned char>(c));
                    out += hex;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

// Overwrites a credential before letting go of it.
struct Scrub {
    std::string& s;
    ~Scrub() {
        s.assign(s.size(), '\0');
        s.clear();
    }
};
}  // namespace

const char* state_name(SessionState s) {
    switch (s) {
        case S::Unstarted: return "Unstarted";
        case S::Spawned: return "Spawned";
        case S::ShellReady: return "ShellReady";
        case S::ToolReady: return "ToolReady";
        case S::Disconnected: return "Disconnected";
        case S::CredentialsSent: return "CredentialsSent";
        case S::PasswordSent: return "PasswordSent";
        case S::BannerPrompt: return "BannerPrompt";
        case S::StateConfirmed: return "StateConfirmed";
        case S::SiteConfirmed: return "SiteConfirmed";
        case S::Connected: return "Connected";
        case S::DisconnectSent: return "DisconnectSent";
        case S::ToolExited: return "ToolExited";
        case S::Terminated: return "Terminated";
    }
    return "?";
}

const std::vector<Transition>& session_table() { return kTable; }

const Transition* find_transition(SessionState state, Match match) {
    for (const auto& t : kTable) {
        if (t.state == state && t.match == match) return &t;
    }
    return nullptr;
}

ClientSession::ClientSession(Terminal& term, SessionOptions opts)
    : term_(term), expecter_(term), opts_(std::move(opts)) {}

std::string ClientSession::pattern_for(Match m) const {
    switch (m) {
        case M::ShellPrompt: return opts_.shell_prompt;
        case M::ToolPrompt: return opts_.tool_prompt;
        case M::UsernamePrompt: return opts_.username_prompt;
        case M::DomainFailure: return opts_.domain_failure;
        case M::NotAvailable: return opts_.not_available;
        case M::VerifyFailure: return opts_.verify_failure;
        case M::PasswordPrompt: return opts_.password_prompt;
        case M::AcceptPrompt: return opts_.accept_prompt;
        case M::LoginFailed: return opts_.login_failed;
        case M::StateConnected: return opts_.state_connected;
        case M::RetrySuggested: return opts_.retry_suggested;
        case M::DriverError: return opts_.driver_error;
        case M::ConnectedToSite: return opts_.connected_to + site_;
        case M::Timeout:
        case M::Eof:
        case M::Unmatched: break;
    }
    return {};
}

void ClientSession::pause() const {
    if (opts_.command_delay.count() > 0) std::this_thread::sleep_for(opts_.command_delay);
}

bool ClientSession::perform(Action action) {
    pause();
    switch (action) {
        case A::SendClient: return term_.send_line(opts_.client_path);
        case A::SendDisconnect: return term_.send_line(opts_.disconnect_command);
        case A::SendConnect: return term_.send_line(opts_.connect_command + " " + site_);
        case A::SendUsername: return term_.send_line(user_);
        case A::SendPassword: return term_.send_line(pass_);
        case A::SendAccept: return term_.send_line(opts_.accept_answer);
        case A::SendExit: return term_.send_line(opts_.exit_command);
        case A::Await:
        case A::Succeed:
        case A::Fail:
        case A::Fatal: break;
    }
    return true;
}

bool ClientSession::teardown() {
    bool ok = term_.terminate();
    if (!term_.kill_strays(opts_.lingering_processes)) ok = false;
    if (!ok) log(LogLevel::ERROR, std::string("session ") + op_ + ": unable to terminate child process");
    state_ = S::Terminated;
    return ok;
}

Outcome ClientSession::settle(const Transition& t, const std::string& output) {
    log(LogLevel::ERROR, std::string("session ") + op_ + ": " + t.message + " (state " +
                             state_name(state_) + "); client output: \"" + printable(output) +
                             "\"");
    teardown();
    if (t.action == A::Fatal) throw FatalError(std::string("session ") + op_ + ": " + t.message);
    return Outcome::Fail;
}

Outcome ClientSession::drive() {
    while (true) {
        std::vector<Match> wanted;
        std::vector<std::string> patterns;
        for (const auto& t : kTable) {
            if (t.state == state_ && is_pattern(t.match)) {
                wanted.push_back(t.match);
                patterns.push_back(pattern_for(t.match));
            }
        }

        ExpectResult res = expecter_.expect(patterns, opts_.timeout);
        Match m = M::Timeout;
        if (res.status == ExpectStatus::Matched) m = wanted[res.index];
        else if (res.status == ExpectStatus::Eof) m = M::Eof;

        const Transition* t = find_transition(state_, m);
        if (!t) t = find_transition(state_, M::Unmatched);
        if (!t) {
            Transition none{state_, M::Unmatched, S::Terminated, A::Fail, "no transition"};
            return settle(none, res.before);
        }
        if (t->action == A::Fail || t->action == A::Fatal) return settle(*t, res.before);

        log(LogLevel::DEBUG, std::string("session ") + op_ + ": " + state_name(state_) + " -> " +
                                 state_name(t->next) + " (" + t->message + ")");
        state_ = t->next;
        if (t->action == A::Succeed) return Outcome::Good;
        if (t->action != A::Await && !perform(t->action)) {
            const Transition* f = find_transition(state_, M::Unmatched);
            Transition broken{state_, M::Unmatched, S::Terminated,
                              f ? f->action : A::Fail, "write to the client failed"};
            return settle(broken, expecter_.buffer());
        }
    }
}

Outcome ClientSession::connect(const std::string& site, const std::string& user,
                               const std::string& pass) {
    op_ = "connect";
    if (term_.alive()) {
        log(LogLevel::WARN, "session connect: closing a client session left open");
        teardown();
    }
    state_ = S::Unstarted;
    site_ = site;
    user_ = user;
    pass_ = pass;
    Scrub scrub_user{user_};
    Scrub scrub_pass{pass_};

    if (!term_.kill_strays(opts_.exclusive_processes)) {
        state_ = S::Terminated;
        log(LogLevel::ERROR, "session connect: unable to end an existing VPN client UI or CLI");
        throw FatalError("session connect: cannot guarantee a single VPN client instance");
    }
    expecter_.clear();
    std::vector<std::string> argv{opts_.shell};
    std::vector<std::string> env{"PS1=" + opts_.shell_prompt, "ENV="};
    if (!term_.spawn(argv, env)) {
        state_ = S::Terminated;
        log(LogLevel::ERROR, "session connect: unable to spawn " + opts_.shell);
        throw FatalError("session connect: unable to spawn child process");
    }
    state_ = S::Spawned;
    return drive();
}

Outcome ClientSession::disconnect() {
    op_ = "disconnect";
    if (!term_.alive()) {
        if (state_ != S::Unstarted) state_ = S::Terminated;
        return Outcome::Good;
    }
    if (!perform(A::SendDisconnect)) {
        return settle(*find_transition(S::DisconnectSent, M::Unmatched), expecter_.buffer());
    }
    state_ = S::DisconnectSent;
    Outcome out = drive();
    if (out == Outcome::Good && !teardown()) out = Outcome::Fail;
    return out;
}
}  // namespace gwmon
