#pragma once
#include <string>
#include <vector>

namespace gwmon {
enum class ReadStatus { Data, Timeout, Eof };

// One interactive child process and the text stream it produces.
class Terminal {
   public:
    virtual ~Terminal() = default;
    // SIGKILLs every process whose name is in `names`. False when the process
    // table cannot be read or a kill() is refused.
    virtual bool kill_strays(const std::vector<std::string>& names) = 0;
    // argv[0] is looked up in PATH; env entries are NAME=value additions.
    virtual bool spawn(const std::vector<std::string>& argv,
                       const std::vector<std::string>& env) = 0;
    virtual bool send_line(const std::string& line) = 0;
    // Appends whatever output is available, waiting up to timeout_ms.
    virtual ReadStatus read_some(std::string& out, int timeout_ms) = 0;
    virtual bool alive() = 0;
    // Forced kill of the child and its process group. True once it is gone.
    virtual bool terminate() = 0;
};
}  // namespace gwmon
