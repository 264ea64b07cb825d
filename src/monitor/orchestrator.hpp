#pragma once
#include <chrono>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "../config/targets.hpp"
#include "../core/alerter.hpp"
#include "../core/record.hpp"
#include "../core/shutdown.hpp"
#include "../core/time_utils.hpp"
#include "../probes/prober.hpp"
#include "../session/client_session.hpp"

namespace gwmon {
constexpr int kGatewayAlertPulses = 3;
constexpr int kTargetAlertPulses = 1;

struct MonitorSettings {
    std::string gateway_name;
    std::string gateway_address;
    std::string username;
    std::string password;
    std::string targets_file;
    int cycles{1};  // negative: until interrupted
    std::chrono::seconds delay{0};
    int gateway_pings{2};
    int target_pings{2};
    int ping_timeout_ms{1000};
    int web_timeout_ms{5000};
};

struct TargetTally {
    int good{0};
    int warn{0};
    int fail{0};
};

enum class RunStatus { Completed, Interrupted };

// How a cycle ended. Complete cycles are flushed even when an interrupt
// arrived after their last item; aborted ones are dropped.
enum class CycleEnd { Complete, CompleteInterrupted, Aborted };

struct RunSummary {
    RunStatus status{RunStatus::Completed};
    int cycles_run{0};
};

// The test-cycle loop: gateway ping, session open, target pings, session
// close, result flush, delay. FatalError and ConfigError propagate.
class Orchestrator {
   public:
    using TargetLoader = std::function<TargetList(const std::string&)>;

    Orchestrator(MonitorSettings settings, Prober& prober, GatewaySession& session,
                 ResultSink& sink, Alerter& alerter, ShutdownWatch& watch, std::ostream& console,
                 TargetLoader loader = load_targets);

    RunSummary run();
    const TargetTally& last_tally() const { return tally_; }

   private:
    MonitorSettings s_;
    Prober& prober_;
    GatewaySession& session_;
    ResultSink& sink_;
    Alerter& alerter_;
    ShutdownWatch& watch_;
    std::ostream& out_;
    TargetLoader loader_;
    TargetTally tally_;
    bool told_no_targets_{false};

    CycleEnd run_cycle(int cycle, std::vector<CycleRecord>& rows);
    CycleEnd finished();
    void add_row(std::vector<CycleRecord>& rows, int cycle, const DateTod& when, ItemKind kind,
                 Outcome outcome, const std::string& address, const std::string& label);
    Outcome probe_target(const Target& t);
    void stop_on_interrupt();
};
}  // namespace gwmon
