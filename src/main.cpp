#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include "config/params.hpp"
#include "core/alerter.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/result_log.hpp"
#include "core/shutdown.hpp"
#include "monitor/orchestrator.hpp"
#include "probes/prober.hpp"
#include "session/client_session.hpp"
#include "session/pty_terminal.hpp"

using namespace gwmon;

static int fatal_exit(const std::string& what, GatewaySession* session) {
    std::cerr << what << "\n";
    if (session) {
        try {
            session->disconnect();
        } catch (const std::exception& e) {
            log(LogLevel::ERROR, std::string("disconnect before exit failed: ") + e.what());
        }
    }
    std::cerr << "gwmon fatal error exit.\n";
    return 1;
}

static MonitorSettings monitor_settings(const Params& p) {
    MonitorSettings ms;
    ms.gateway_name = p.vpnname;
    ms.gateway_address = p.vpnurlip;
    ms.username = p.username;
    ms.password = p.password;
    ms.targets_file = p.targets;
    ms.cycles = p.cycles;
    ms.delay = std::chrono::seconds(p.delay);
    ms.gateway_pings = p.gateway_pings;
    ms.target_pings = p.target_pings;
    ms.ping_timeout_ms = p.ping_timeout_ms;
    ms.web_timeout_ms = p.web_timeout_ms;
    return ms;
}

static int cmd_run(const Params& p) {
    std::unique_ptr<SignalShutdownWatch> watch;
    try {
        watch = std::make_unique<SignalShutdownWatch>();
    } catch (const FatalError& e) {
        return fatal_exit(e.what(), nullptr);
    }

    PtyTerminal term;
    SessionOptions so;
    so.client_path = p.client_path;
    so.command_delay = std::chrono::milliseconds(p.command_delay_ms);
    so.timeout = std::chrono::seconds(p.session_timeout_s);
    ClientSession session(term, so);

    FileAppender appender;
    ResultLog results(p.datalog, appender, *watch);
    BellAlerter alerter(std::cout, p.quiet);
    NetProber prober;
    Orchestrator orch(monitor_settings(p), prober, session, results, alerter, *watch, std::cout);

    try {
        RunSummary r = orch.run();
        if (r.status == RunStatus::Interrupted) {
            log(LogLevel::INFO, "stopped after " + std::to_string(r.cycles_run) + " cycle(s)");
        }
    } catch (const ConfigError& e) {
        return fatal_exit(std::string("Failed to load targets: ") + e.what(), &session);
    } catch (const FatalError& e) {
        return fatal_exit(e.what(), &session);
    }
    return 0;
}

int main(int argc, char** argv) {
    CommandLine cl = parse_command_line(argc, argv);
    switch (cl.action) {
        case CliAction::Version:
            std::cout << "gwmon version " << kVersion << "\n";
            return 0;
        case CliAction::Help:
            print_usage(std::cout);
            return 0;
        case CliAction::Error:
            std::cerr << cl.error << "\n";
            print_usage(std::cerr);
            return 1;
        case CliAction::Run:
            break;
    }

    Params p;
    try {
        if (load_params_file(cl.params_file, p) == ParamsFile::Missing) {
            std::cout << "Running without a gwmon params file\n";
        }
        apply_overrides(cl, p);
        validate_params(p);
    } catch (const ConfigError& e) {
        return fatal_exit(std::string("Failed to load parameters: ") + e.what(), nullptr);
    }
    LogLevel lvl = LogLevel::INFO;
    parse_level(p.log_level, lvl);
    set_log_level(lvl);

    if (p.vpnurlip.empty()) {
        std::cout << "Cannot run without a VPN site URL or IP address.\n";
        return 0;
    }
    return cmd_run(p);
}
