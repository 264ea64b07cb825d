#include "orchestrator.hpp"

#include <exception>
#include <iomanip>
#include <utility>

#include "../core/logger.hpp"
#include "../core/time_utils.hpp"

namespace gwmon {
namespace {
const char* item_banner(ItemKind k) {
    switch (k) {
        case ItemKind::GatewayProbe: return "-- VPN ping -----------";
        case ItemKind::SessionOpen: return "-- VPN open() ---------";
        case ItemKind::TargetProbe: return "-- ping";
        case ItemKind::SessionClose: return "-- VPN close() --------";
    }
    return "--";
}

// Pairs a successful connect with exactly one disconnect, also on early
// return and exceptions.
class OpenSession {
   public:
    explicit OpenSession(GatewaySession& s) : s_(s) {}
    ~OpenSession() {
        if (closed_) return;
        try {
            s_.disconnect();
        } catch (const std::exception& e) {
            log(LogLevel::ERROR, std::string("disconnect during unwind failed: ") + e.what());
        }
    }
    OpenSession(const OpenSession&) = delete;
    OpenSession& operator=(const OpenSession&) = delete;

    Outcome close() {
        closed_ = true;
        return s_.disconnect();
    }

   private:
    GatewaySession& s_;
    bool closed_{false};
};
}  // namespace

Orchestrator::Orchestrator(MonitorSettings settings, Prober& prober, GatewaySession& session,
                           ResultSink& sink, Alerter& alerter, ShutdownWatch& watch,
                           std::ostream& console, TargetLoader loader)
    : s_(std::move(settings)),
      prober_(prober),
      session_(session),
      sink_(sink),
      alerter_(alerter),
      watch_(watch),
      out_(console),
      loader_(std::move(loader)) {}

void Orchestrator::add_row(std::vector<CycleRecord>& rows, int cycle, const DateTod& when,
                           ItemKind kind, Outcome outcome, const std::string& address,
                           const std::string& label) {
    rows.push_back({cycle, when.date, when.tod, kind, outcome, address, label});
    out_ << std::setw(3) << cycle << ' ' << when.date << ' ' << when.tod << ' '
         << item_banner(kind) << ' ';
    if (kind == ItemKind::TargetProbe) {
        out_ << std::left << std::setw(15) << address << std::right << ' ';
    }
    out_ << outcome_name(outcome) << ' ' << label << '\n';
}

Outcome Orchestrator::probe_target(const Target& t) {
    if (is_web_address(t.address)) return prober_.web(t.address, s_.web_timeout_ms);
    return prober_.ping(t.address, s_.target_pings, s_.ping_timeout_ms);
}

CycleEnd Orchestrator::finished() {
    return watch_.requested() ? CycleEnd::CompleteInterrupted : CycleEnd::Complete;
}

CycleEnd Orchestrator::run_cycle(int cycle, std::vector<CycleRecord>& rows) {
    TargetList targets = loader_(s_.targets_file);
    if (!targets.file_present && !told_no_targets_) {
        out_ << "Running without a targets file (" << s_.targets_file << ")\n";
        told_no_targets_ = true;
    }
    tally_ = TargetTally{};

    DateTod when = date_and_tod();
    Outcome ping = prober_.ping(s_.gateway_address, s_.gateway_pings, s_.ping_timeout_ms);
    if (ping != Outcome::Good) alerter_.alert(kGatewayAlertPulses);
    add_row(rows, cycle, when, ItemKind::GatewayProbe, ping, s_.gateway_address, s_.gateway_name);
    if (ping != Outcome::Good) return finished();
    if (watch_.requested()) return CycleEnd::Aborted;

    when = date_and_tod();
    Outcome open = session_.connect(s_.gateway_address, s_.username, s_.password);
    if (open != Outcome::Good) alerter_.alert(kGatewayAlertPulses);
    add_row(rows, cycle, when, ItemKind::SessionOpen, open, s_.gateway_address, s_.gateway_name);
    if (open != Outcome::Good) return finished();

    OpenSession guard(session_);
    for (const auto& t : targets.targets) {
        if (watch_.requested()) return CycleEnd::Aborted;
        when = date_and_tod();
        Outcome r = probe_target(t);
        if (r == Outcome::Good) ++tally_.good;
        else if (r == Outcome::Warn) ++tally_.warn;
        else ++tally_.fail;
        if (r != Outcome::Good) alerter_.alert(kTargetAlertPulses);
        add_row(rows, cycle, when, ItemKind::TargetProbe, r, t.address, t.label);
    }

    when = date_and_tod();
    Outcome close = guard.close();
    if (close != Outcome::Good) alerter_.alert(kGatewayAlertPulses);
    add_row(rows, cycle, when, ItemKind::SessionClose, close, s_.gateway_address, s_.gateway_name);
    return finished();
}

void Orchestrator::stop_on_interrupt() {
    out_ << "\n---- gwmon stopped by interrupt ----\n";
    try {
        session_.disconnect();
        out_ << "VPN connection closed\n";
    } catch (const std::exception& e) {
        log(LogLevel::ERROR, std::string("disconnect on interrupt failed: ") + e.what());
    }
    sink_.close();
    out_ << "Result log closed\n";
}

RunSummary Orchestrator::run() {
    RunSummary summary;
    const std::string of =
        s_.cycles < 0 ? "of Infinite" : "of " + std::to_string(s_.cycles);
    int count = s_.cycles;
    int cycle = 1;
    while (count != 0) {
        DateTod when = date_and_tod();
        out_ << std::setw(3) << cycle << ' ' << when.date << ' ' << when.tod
             << " Start gwmon test cycle " << cycle << ' ' << of << '\n';

        std::vector<CycleRecord> rows;
        CycleEnd end = run_cycle(cycle, rows);
        summary.cycles_run = cycle;
        if (end == CycleEnd::Aborted) {
            stop_on_interrupt();
            summary.status = RunStatus::Interrupted;
            return summary;
        }

        if (sink_.write(rows) != Outcome::Good) {
            out_ << "Unable to record test results\n";
        }

        when = date_and_tod();
        out_ << std::setw(3) << cycle << ' ' << when.date << ' ' << when.tod
             << " End gwmon test cycle " << cycle << ' ' << of << '\n';
        out_ << std::setw(3) << cycle << ' ' << when.date << ' ' << when.tod
             << " gwmon test cycle ping results:  Good: " << tally_.good
             << ",  Warn: " << tally_.warn << ",  Fail: " << tally_.fail << '\n';
        if (end == CycleEnd::CompleteInterrupted) {
            stop_on_interrupt();
            summary.status = RunStatus::Interrupted;
            return summary;
        }

        if (count > 0) --count;
        if (count == 0) break;
        out_ << std::setw(3) << cycle << ' ' << when.date << ' ' << when.tod
             << " Waiting to run next test cycle.\n\n";
        ++cycle;
        if (!watch_.sleep_for(s_.delay)) {
            stop_on_interrupt();
            summary.status = RunStatus::Interrupted;
            return summary;
        }
    }
    DateTod when = date_and_tod();
    out_ << std::setw(3) << cycle << ' ' << when.date << ' ' << when.tod << ' '
         << summary.cycles_run << " gwmon test cycles completed.\n";
    return summary;
}
}  // namespace gwmon
