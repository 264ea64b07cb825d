#pragma once
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace gwmon {
constexpr const char* kVersion = "1.0.0";
constexpr const char* kDefaultParamsFile = "gwmon_params.csv";

struct Params {
    std::string vpnname{"VPN Gateway"};
    std::string vpnurlip;
    std::string username;
    std::string password;
    std::string targets{"gwmon_targets.csv"};
    int cycles{200};  // negative: run until interrupted
    int delay{1800};  // seconds between cycles
    std::string datalog{"gwmon_datalog.csv"};
    bool quiet{false};

    int gateway_pings{2};
    int target_pings{2};
    int ping_timeout_ms{1000};
    int web_timeout_ms{5000};
    int command_delay_ms{500};
    int session_timeout_s{120};
    std::string client_path{"/opt/cisco/anyconnect/bin/vpn"};
    std::string log_level{"info"};
};

// Sets one parameter by its file/flag name (case-insensitive). Returns false
// for unknown names; throws ConfigError for values that do not parse.
bool set_param(Params& p, const std::string& name, const std::string& value);

enum class ParamsFile { Loaded, Missing };

// name,value lines. Throws ConfigError when the file exists but cannot be
// read or has a malformed line.
ParamsFile load_params_file(const std::string& path, Params& p);

// Range checks that apply after file and flags are merged.
void validate_params(const Params& p);

enum class CliAction { Run, Version, Help, Error };

struct CommandLine {
    CliAction action{CliAction::Run};
    std::string params_file{kDefaultParamsFile};
    std::vector<std::pair<std::string, std::string>> overrides;
    std::string error;
};

CommandLine parse_command_line(int argc, char** argv);
void apply_overrides(const CommandLine& cl, Params& p);
void print_usage(std::ostream& out);
}  // namespace gwmon
