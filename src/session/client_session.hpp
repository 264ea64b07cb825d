#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "../core/outcome.hpp"
#include "expect.hpp"
#include "terminal.hpp"

namespace gwmon {
// What the monitor loop needs from a VPN session.
class GatewaySession {
   public:
    virtual ~GatewaySession() = default;
    virtual Outcome connect(const std::string& site, const std::string& user,
                            const std::string& pass) = 0;
    // Safe to call at any time; Good with no I/O when nothing is running.
    virtual Outcome disconnect() = 0;
};

enum class SessionState {
    Unstarted,
    Spawned,          // waiting for the shell prompt
    ShellReady,       // client command sent, waiting for its prompt
    ToolReady,        // initial "disconnect" sent
    Disconnected,     // "connect <site>" sent
    CredentialsSent,  // username sent
    PasswordSent,
    BannerPrompt,     // banner accepted, waiting for the connection state
    StateConfirmed,   // waiting for "Connected to <site>"
    SiteConfirmed,    // waiting for the client prompt
    Connected,
    DisconnectSent,
    ToolExited,       // "exit" sent, waiting for the shell prompt
    Terminated,
};

const char* state_name(SessionState s);

enum class Match {
    ShellPrompt,
    ToolPrompt,
    UsernamePrompt,
    DomainFailure,
    NotAvailable,
    VerifyFailure,
    PasswordPrompt,
    AcceptPrompt,
    LoginFailed,
    StateConnected,
    RetrySuggested,
    DriverError,
    ConnectedToSite,
    Timeout,
    Eof,
    Unmatched,  // fallback row: any outcome the state does not list
};

enum class Action {
    SendClient,
    SendDisconnect,
    SendConnect,
    SendUsername,
    SendPassword,
    SendAccept,
    SendExit,
    Await,
    Succeed,
    Fail,
    Fatal,
};

struct Transition {
    SessionState state;
    Match match;
    SessionState next;
    Action action;
    const char* message;
};

const std::vector<Transition>& session_table();
const Transition* find_transition(SessionState state, Match match);

struct SessionOptions {
    std::string shell{"/bin/sh"};
    std::string shell_prompt{"gwmon$ "};
    std::string client_path{"/opt/cisco/anyconnect/bin/vpn"};
    std::string tool_prompt{"VPN>"};
    // Killed before every spawn; only one client instance may run.
    std::vector<std::string> exclusive_processes{"vpnui", "vpn"};
    // Killed after every teardown in case the client outlived the shell.
    std::vector<std::string> lingering_processes{"vpn"};

    std::string username_prompt{"Username:"};
    std::string domain_failure{"unsuccessful domain name"};
    std::string not_available{"Connect not available."};
    std::string verify_failure{"cannot verify server"};
    std::string password_prompt{"Password:"};
    std::string accept_prompt{"accept?"};
    std::string login_failed{"Login failed"};
    std::string state_connected{"state: Connected"};
    std::string retry_suggested{"Please try connecting again"};
    std::string driver_error{"driver encountered an error"};
    std::string connected_to{"Connected to "};

    std::string disconnect_command{"disconnect"};
    std::string connect_command{"connect"};
    std::string accept_answer{"y"};
    std::string exit_command{"exit"};

    // The client drops input that arrives too quickly after its last output.
    std::chrono::milliseconds command_delay{500};
    std::chrono::milliseconds timeout{120000};
};

// Drives the interactive VPN client through session_table(). Every call
// leaves the child either connected or fully torn down.
class ClientSession : public GatewaySession {
   public:
    explicit ClientSession(Terminal& term, SessionOptions opts = {});

    // Fail on any protocol deviation. Throws FatalError when exclusivity
    // cannot be guaranteed or the client cannot be started.
    Outcome connect(const std::string& site, const std::string& user,
                    const std::string& pass) override;
    Outcome disconnect() override;

    SessionState state() const { return state_; }
    bool alive() { return term_.alive(); }
    const SessionOptions& options() const { return opts_; }

   private:
    Terminal& term_;
    Expecter expecter_;
    SessionOptions opts_;
    SessionState state_{SessionState::Unstarted};
    const char* op_{""};
    std::string site_;
    std::string user_;
    std::string pass_;

    Outcome drive();
    bool perform(Action action);
    std::string pattern_for(Match m) const;
    Outcome settle(const Transition& t, const std::string& output);
    bool teardown();
    void pause() const;
};
}  // namespace gwmon
