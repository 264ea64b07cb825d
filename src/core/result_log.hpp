#pragma once
#include <chrono>
#include <string>
#include <vector>

#include "fd.hpp"
#include "record.hpp"
#include "shutdown.hpp"

namespace gwmon {
enum class AppendError { None, Contention, Io };

// Boundary to the filesystem. Classifies failures so that contention can be
// told apart from everything else.
class Appender {
   public:
    virtual ~Appender() = default;
    virtual AppendError append(const std::string& path, const std::string& data,
                               std::string& detail) = 0;
    virtual void close() = 0;
};

// open(O_APPEND) + non-blocking exclusive flock. A held lock or EACCES/EPERM
// counts as contention.
class FileAppender : public Appender {
   public:
    AppendError append(const std::string& path, const std::string& data,
                       std::string& detail) override;
    void close() override;

   private:
    Fd fd_;
};

struct ResultLogOptions {
    int max_attempts{5};
    std::chrono::seconds retry_delay{15};
};

class ResultLog : public ResultSink {
   public:
    ResultLog(std::string path, Appender& appender, ShutdownWatch& watch,
              ResultLogOptions opts = {});
    // Good once every row is on disk; Fail when contention outlasted the
    // retry budget or an interrupt cut the retries short. Throws FatalError
    // on any other I/O failure.
    Outcome write(const std::vector<CycleRecord>& rows) override;
    void close() override;
    const std::string& path() const { return path_; }

   private:
    std::string path_;
    Appender& appender_;
    ShutdownWatch& watch_;
    ResultLogOptions opts_;
};
}  // namespace gwmon
