#include "result_log.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "errors.hpp"
#include "logger.hpp"

namespace gwmon {
AppendError FileAppender::append(const std::string& path, const std::string& data,
                                 std::string& detail) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
        int err = errno;
        detail = path + ": " + std::strerror(err);
        return (err == EACCES || err == EPERM) ? AppendError::Contention : AppendError::Io;
    }
    fd_.reset(fd);
    if (::flock(fd, LOCK_EX | LOCK_NB) < 0) {
        int err = errno;
        detail = path + ": " + std::strerror(err);
        fd_.reset();
        return err == EWOULDBLOCK ? AppendError::Contention : AppendError::Io;
    }
    if (!fd_.write_all(data)) {
        detail = path + ": " + std::strerror(errno);
        fd_.reset();
        return AppendError::Io;
    }
    // Closing drops the lock.
    fd_.reset();
    return AppendError::None;
}

void FileAppender::close() { fd_.reset(); }

ResultLog::ResultLog(std::string path, Appender& appender, ShutdownWatch& watch,
                     ResultLogOptions opts)
    : path_(std::move(path)), appender_(appender), watch_(watch), opts_(opts) {}

Outcome ResultLog::write(const std::vector<CycleRecord>& rows) {
    std::string data;
    for (const auto& r : rows) data += to_csv_line(r);

    for (int attempt = 1; attempt <= opts_.max_attempts; ++attempt) {
        std::string detail;
        AppendError err = appender_.append(path_, data, detail);
        if (err == AppendError::None) {
            if (attempt > 1) log(LogLevel::INFO, "result log has been updated: " + path_);
            return Outcome::Good;
        }
        if (err == AppendError::Io) {
            throw FatalError("failed to access result log " + detail);
        }
        if (attempt < opts_.max_attempts) {
            log(LogLevel::WARN, "cannot open result log (" + detail + "); retrying");
            if (!watch_.sleep_for(opts_.retry_delay)) {
                log(LogLevel::WARN, "interrupted while waiting for result log " + path_);
                return Outcome::Fail;
            }
        } else {
            log(LogLevel::ERROR, "unable to open result log (" + detail +
                                     "); dropping this cycle's results");
        }
    }
    return Outcome::Fail;
}

void ResultLog::close() { appender_.close(); }
}  // namespace gwmon
