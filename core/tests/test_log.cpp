#include "gitchunk/error.hpp"
#include "gitchunk/log.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

class RecordingSink : public gitchunk::LogSink {
  public:
    explicit RecordingSink(std::vector<std::pair<gitchunk::LogLevel, std::string>> &records)
        : records_(records) {}

    void write(gitchunk::LogLevel level, const std::string &line) override {
        records_.emplace_back(level, line);
    }

  private:
    std::vector<std::pair<gitchunk::LogLevel, std::string>> &records_;
};

bool ends_with(const std::string &text, const std::string &suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string read_all(const std::filesystem::path &path) {
    std::ifstream file(path);
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

} // namespace

int main() {
    namespace fs = std::filesystem;

    assert(std::string(gitchunk::to_string(gitchunk::LogLevel::Debug)) == "DEBUG");
    assert(std::string(gitchunk::to_string(gitchunk::LogLevel::Warning)) == "WARNING");

    std::vector<std::pair<gitchunk::LogLevel, std::string>> records;
    gitchunk::Logger logger;
    assert(logger.threshold() == gitchunk::LogLevel::Info);
    logger.add_sink(std::make_unique<RecordingSink>(records));

    logger.debug("hidden");
    logger.info("Starting");
    logger.error("Fatal error: boom");
    assert(records.size() == 2);
    assert(records[0].first == gitchunk::LogLevel::Info);
    assert(ends_with(records[0].second, " - INFO - Starting"));
    assert(ends_with(records[1].second, " - ERROR - Fatal error: boom"));
    // "YYYY-MM-DD HH:MM:SS,mmm" prefix.
    assert(records[0].second.size() > 23);
    assert(records[0].second[4] == '-');
    assert(records[0].second[10] == ' ');
    assert(records[0].second[19] == ',');

    logger.set_threshold(gitchunk::LogLevel::Debug);
    logger.debug("visible");
    assert(records.size() == 3);
    assert(ends_with(records[2].second, " - DEBUG - visible"));

    std::ostringstream console;
    gitchunk::StreamLogSink stream_sink(console);
    stream_sink.write(gitchunk::LogLevel::Info, "line one");
    stream_sink.write(gitchunk::LogLevel::Info, "line two");
    assert(console.str() == "line one\nline two\n");

    auto temp_dir = fs::temp_directory_path() / "gitchunk_log_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);
    auto log_path = temp_dir / "run.log";
    {
        std::ofstream stale(log_path);
        stale << "previous run\n";
    }
    {
        gitchunk::Logger file_logger;
        file_logger.add_sink(std::make_unique<gitchunk::FileLogSink>(log_path));
        file_logger.info("fresh");
    }
    const auto contents = read_all(log_path);
    assert(contents.find("previous run") == std::string::npos);
    assert(ends_with(contents, " - INFO - fresh\n"));

    bool threw = false;
    try {
        gitchunk::FileLogSink sink(temp_dir / "no_such_dir" / "run.log");
    } catch (const gitchunk::Error &) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        logger.add_sink(nullptr);
    } catch (const std::invalid_argument &) {
        threw = true;
    }
    assert(threw);

    fs::remove_all(temp_dir);
    return 0;
}
