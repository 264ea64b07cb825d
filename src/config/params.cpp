#include "params.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "../core/errors.hpp"
#include "../core/logger.hpp"
#include "csv_lines.hpp"

namespace gwmon {
namespace {
std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Spaces may be part of a credential.
bool keeps_spaces(const std::string& name) {
    std::string n = lower(name);
    return n == "username" || n == "password";
}

int to_int(const std::string& name, const std::string& value) {
    try {
        size_t pos = 0;
        int v = std::stoi(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::logic_error&) {
        throw ConfigError("parameter " + name + ": not an integer: '" + value + "'");
    }
}

bool to_bool(const std::string& name, const std::string& value) {
    std::string v = lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off" || v.empty()) return false;
    throw ConfigError("parameter " + name + ": not a boolean: '" + value + "'");
}

struct Flag {
    const char* flag;
    const char* param;
    bool takes_value;
};

const Flag kFlags[] = {
    {"--vpnname", "vpnname", true},
    {"--vpnurlip", "vpnurlip", true},
    {"--username", "username", true},
    {"--password", "password", true},
    {"--targets", "targets", true},
    {"--cycles", "cycles", true},
    {"--delay", "delay", true},
    {"--datalog", "datalog", true},
    {"--quiet", "quiet", false},
    {"--gateway-pings", "gateway_pings", true},
    {"--target-pings", "target_pings", true},
    {"--ping-timeout-ms", "ping_timeout_ms", true},
    {"--web-timeout-ms", "web_timeout_ms", true},
    {"--command-delay-ms", "command_delay_ms", true},
    {"--session-timeout", "session_timeout_s", true},
    {"--client", "client_path", true},
    {"--log-level", "log_level", true},
};
}  // namespace

bool set_param(Params& p, const std::string& raw_name, const std::string& value) {
    std::string name = lower(raw_name);
    if (name == "vpnname") p.vpnname = value;
    else if (name == "vpnurlip") p.vpnurlip = value;
    else if (name == "username") p.username = value;
    else if (name == "password") p.password = value;
    else if (name == "targets") p.targets = value;
    else if (name == "cycles") p.cycles = to_int(name, value);
    else if (name == "delay") p.delay = to_int(name, value);
    else if (name == "datalog") p.datalog = value;
    else if (name == "quiet") p.quiet = to_bool(name, value);
    else if (name == "gateway_pings") p.gateway_pings = to_int(name, value);
    else if (name == "target_pings") p.target_pings = to_int(name, value);
    else if (name == "ping_timeout_ms") p.ping_timeout_ms = to_int(name, value);
    else if (name == "web_timeout_ms") p.web_timeout_ms = to_int(name, value);
    else if (name == "command_delay_ms") p.command_delay_ms = to_int(name, value);
    else if (name == "session_timeout_s") p.session_timeout_s = to_int(name, value);
    else if (name == "client_path") p.client_path = value;
    else if (name == "log_level") p.log_level = lower(value);
    else return false;
    return true;
}

ParamsFile load_params_file(const std::string& path, Params& p) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return ParamsFile::Missing;
    std::ifstream in(path);
    if (!in.is_open()) throw ConfigError("failed to read params file " + path);
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_skippable(line)) continue;
        auto fields = split_fields(line);
        if (fields.size() < 2) {
            throw ConfigError(path + ":" + std::to_string(lineno) + ": expected name,value");
        }
        std::string value = fields[1];
        if (keeps_spaces(fields[0])) value = split_fields(line, false)[1];
        if (!set_param(p, fields[0], value)) {
            log(LogLevel::DEBUG, "ignoring unknown parameter '" + fields[0] + "'");
        }
    }
    if (in.bad()) throw ConfigError("failed to read params file " + path);
    return ParamsFile::Loaded;
}

void validate_params(const Params& p) {
    if (p.delay < 0) throw ConfigError("delay must not be negative");
    if (p.gateway_pings < 1) throw ConfigError("gateway_pings must be at least 1");
    if (p.target_pings < 1) throw ConfigError("target_pings must be at least 1");
    if (p.ping_timeout_ms <= 0) throw ConfigError("ping_timeout_ms must be positive");
    if (p.web_timeout_ms <= 0) throw ConfigError("web_timeout_ms must be positive");
    if (p.command_delay_ms < 0) throw ConfigError("command_delay_ms must not be negative");
    if (p.session_timeout_s <= 0) throw ConfigError("session_timeout_s must be positive");
    LogLevel lvl;
    if (!parse_level(p.log_level, lvl)) throw ConfigError("unknown log level " + p.log_level);
}

CommandLine parse_command_line(int argc, char** argv) {
    CommandLine cl;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-v" || a == "-V" || a == "--version") {
            cl.action = CliAction::Version;
            return cl;
        }
        if (a == "-h" || a == "--help") {
            cl.action = CliAction::Help;
            return cl;
        }
        if (a == "--params") {
            if (i + 1 >= argc) {
                cl.action = CliAction::Error;
                cl.error = "--params needs a value";
                return cl;
            }
            cl.params_file = argv[++i];
            continue;
        }
        const Flag* match = nullptr;
        for (const auto& f : kFlags) {
            if (a == f.flag) match = &f;
        }
        if (!match) {
            cl.action = CliAction::Error;
            cl.error = "unknown option " + a;
            return cl;
        }
        if (!match->takes_value) {
            cl.overrides.emplace_back(match->param, "true");
        } else if (i + 1 < argc) {
            cl.overrides.emplace_back(match->param, argv[++i]);
        } else {
            cl.action = CliAction::Error;
            cl.error = a + " needs a value";
            return cl;
        }
    }
    return cl;
}

void apply_overrides(const CommandLine& cl, Params& p) {
    for (const auto& kv : cl.overrides) {
        if (!set_param(p, kv.first, kv.second)) {
            throw ConfigError("unknown parameter " + kv.first);
        }
    }
}

void print_usage(std::ostream& out) {
    out << "Usage: gwmon [options]\n"
        << "  Ping a VPN gateway, connect through it, ping targets behind it, disconnect.\n"
        << "  Options override " << kDefaultParamsFile << " (name,value lines).\n"
        << "  -v, --version            print version and exit\n"
        << "  --params <file>          parameter file\n"
        << "  --vpnname <name>         gateway display name\n"
        << "  --vpnurlip <addr>        gateway URL or IP address (required)\n"
        << "  --username <user>        VPN username\n"
        << "  --password <pass>        VPN password\n"
        << "  --targets <file>         address,label file, re-read every cycle\n"
        << "  --cycles <n>             test cycles to run (negative: until Ctrl-C)\n"
        << "  --delay <sec>            seconds between cycles\n"
        << "  --datalog <file>         CSV result log\n"
        << "  --quiet                  no bell on failures\n"
        << "  --gateway-pings <n>      echo requests per gateway ping (default 2)\n"
        << "  --target-pings <n>       echo requests per target ping (default 2;\n"
        << "                           with 1 a target is never Warn)\n"
        << "  --ping-timeout-ms <ms>   per echo request\n"
        << "  --web-timeout-ms <ms>    for http:// targets\n"
        << "  --command-delay-ms <ms>  pause before each line sent to the VPN client\n"
        << "  --session-timeout <sec>  wait for each VPN client response\n"
        << "  --client <path>          VPN client CLI\n"
        << "  --log-level <level>      debug|info|warn|error\n";
}
}  // namespace gwmon
