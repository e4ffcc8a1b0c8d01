#include "gitchunk/log.hpp"

#include "gitchunk/error.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace gitchunk {

namespace {

std::string current_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ',' << std::setfill('0') << std::setw(3)
        << millis;
    return oss.str();
}

} // namespace

const char *to_string(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

StreamLogSink::StreamLogSink(std::ostream &stream) : stream_(stream) {}

void StreamLogSink::write(LogLevel, const std::string &line) { stream_ << line << std::endl; }

FileLogSink::FileLogSink(const std::filesystem::path &path) {
    file_.open(path, std::ios::out | std::ios::trunc);
    if (!file_) {
        std::ostringstream oss;
        oss << "failed to open log file '" << path.string() << "': " << std::strerror(errno);
        throw Error(oss.str());
    }
}

void FileLogSink::write(LogLevel, const std::string &line) { file_ << line << std::endl; }

Logger::Logger(LogLevel threshold) : threshold_(threshold) {}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    if (!sink) {
        throw std::invalid_argument("log sink must not be null");
    }
    sinks_.push_back(std::move(sink));
}

void Logger::log(LogLevel level, const std::string &message) {
    if (level < threshold_ || sinks_.empty()) {
        return;
    }
    std::ostringstream oss;
    oss << current_timestamp() << " - " << to_string(level) << " - " << message;
    const auto line = oss.str();
    for (auto &sink : sinks_) {
        sink->write(level, line);
    }
}

LogLevel Logger::threshold() const noexcept { return threshold_; }

void Logger::set_threshold(LogLevel threshold) noexcept { threshold_ = threshold; }

} // namespace gitchunk
