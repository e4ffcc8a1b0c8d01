#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace gitchunk {

enum class LogLevel { Debug, Info, Warning, Error };

const char *to_string(LogLevel level) noexcept;

class LogSink {
  public:
    virtual ~LogSink() = default;

    virtual void write(LogLevel level, const std::string &line) = 0;
};

class StreamLogSink : public LogSink {
  public:
    explicit StreamLogSink(std::ostream &stream);

    void write(LogLevel level, const std::string &line) override;

  private:
    std::ostream &stream_;
};

// Truncates the file on construction.
class FileLogSink : public LogSink {
  public:
    explicit FileLogSink(const std::filesystem::path &path);

    void write(LogLevel level, const std::string &line) override;

  private:
    std::ofstream file_;
};

/// Formats records as "<timestamp> - <LEVEL> - <message>" and hands each one
/// to every sink. Records below the threshold are dropped.
class Logger {
  public:
    explicit Logger(LogLevel threshold = LogLevel::Info);

    void add_sink(std::unique_ptr<LogSink> sink);

    void log(LogLevel level, const std::string &message);

    void debug(const std::string &message) { log(LogLevel::Debug, message); }
    void info(const std::string &message) { log(LogLevel::Info, message); }
    void warning(const std::string &message) { log(LogLevel::Warning, message); }
    void error(const std::string &message) { log(LogLevel::Error, message); }

    LogLevel threshold() const noexcept;
    void set_threshold(LogLevel threshold) noexcept;

  private:
    LogLevel threshold_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

} // namespace gitchunk
