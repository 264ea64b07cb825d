#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "../src/config/params.hpp"
#include "../src/core/errors.hpp"

namespace {
gwmon::CommandLine parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    static std::string prog = "gwmon";
    argv.push_back(&prog[0]);
    for (auto& a : args) argv.push_back(&a[0]);
    return gwmon::parse_command_line(static_cast<int>(argv.size()), argv.data());
}

bool rejects(const std::string& body) {
    std::string path = "/tmp/gwmon_test_bad_params.csv";
    {
        std::ofstream f(path);
        f << body;
    }
    gwmon::Params p;
    try {
        gwmon::load_params_file(path, p);
    } catch (const gwmon::ConfigError&) {
        return true;
    }
    return false;
}
}  // namespace

int main() {
    std::string dir = "/tmp/gwmon_params_test";
    std::filesystem::create_directories(dir);
    std::string path = dir + "/gwmon_params.csv";
    {
        std::ofstream f(path);
        f << "# gateway under test\n"
          << "VPNName, Office VPN\n"
          << "vpnurlip,vpn.example.com\n"
          << "\n"
          << "username,dave\r\n"
          << "password,  hunter 2 \n"
          << "cycles,-1\n"
          << "delay,600\n"
          << "quiet,yes\n"
          << "some_future_setting,42\n";
    }
    gwmon::Params p;
    if (gwmon::load_params_file(path, p) != gwmon::ParamsFile::Loaded) return 1;
    if (p.vpnname != "Office VPN" || p.vpnurlip != "vpn.example.com") return 2;
    if (p.username != "dave" || p.password != "  hunter 2 ") return 3;
    if (p.cycles != -1 || p.delay != 600 || !p.quiet) return 4;
    // Untouched values keep their defaults.
    if (p.targets != "gwmon_targets.csv" || p.datalog != "gwmon_datalog.csv") return 5;
    if (p.target_pings != 2 || p.session_timeout_s != 120) return 6;

    // Flags win over the file.
    auto cl = parse({"--params", path, "--cycles", "3", "--vpnurlip", "10.0.0.1", "--quiet"});
    if (cl.action != gwmon::CliAction::Run || cl.params_file != path) return 7;
    gwmon::Params q;
    gwmon::load_params_file(cl.params_file, q);
    gwmon::apply_overrides(cl, q);
    if (q.cycles != 3 || q.vpnurlip != "10.0.0.1" || q.vpnname != "Office VPN") return 8;
    gwmon::validate_params(q);

    if (parse({"-v"}).action != gwmon::CliAction::Version) return 9;
    if (parse({"--delay", "5", "--version"}).action != gwmon::CliAction::Version) return 10;
    if (parse({"--help"}).action != gwmon::CliAction::Help) return 11;
    if (parse({"--bogus"}).action != gwmon::CliAction::Error) return 12;
    if (parse({"--cycles"}).action != gwmon::CliAction::Error) return 13;

    gwmon::Params none;
    if (gwmon::load_params_file(dir + "/absent.csv", none) != gwmon::ParamsFile::Missing) return 14;
    if (!none.vpnurlip.empty() || none.cycles != 200) return 15;

    if (!rejects("cycles,many\n")) return 16;
    if (!rejects("quiet,perhaps\n")) return 17;
    if (!rejects("vpnurlip\n")) return 18;

    gwmon::Params bad;
    bad.delay = -5;
    try {
        gwmon::validate_params(bad);
        return 19;
    } catch (const gwmon::ConfigError&) {
    }
    bad = gwmon::Params{};
    bad.log_level = "chatty";
    try {
        gwmon::validate_params(bad);
        return 20;
    } catch (const gwmon::ConfigError&) {
    }
    return 0;
}
