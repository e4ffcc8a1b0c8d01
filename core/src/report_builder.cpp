#include "gitchunk/report_builder.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace gitchunk {

namespace {

constexpr double bytes_per_megabyte = 1024.0 * 1024.0;
constexpr int rule_width = 80;

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

} // namespace

std::string format_megabytes(std::uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << static_cast<double>(bytes) / bytes_per_megabyte;
    return oss.str();
}

std::string ReportBuilder::build(const PackResult &result, const std::filesystem::path &root,
                                 std::chrono::system_clock::time_point generated_at) {
    const auto &stats = result.stats;
    const std::string heavy_rule(rule_width, '=');
    const std::string light_rule(rule_width, '-');

    std::ostringstream oss;
    oss << heavy_rule << '\n'
        << "Git Repository Chunking Report\n"
        << "Repository: " << root.string() << '\n'
        << "Generated: " << format_timestamp(generated_at) << '\n'
        << light_rule << '\n'
        << "Summary Statistics:\n"
        << "  Total files processed: " << stats.total_files << '\n'
        << "  Successfully processed files: " << stats.successful_files << '\n'
        << "  Files that couldn't be measured: " << stats.failed_files << '\n'
        << "  Files too large (>" << format_megabytes(stats.max_chunk_size)
        << "MB): " << stats.large_files << '\n'
        << "  Total size of processable files: " << format_megabytes(stats.total_size) << "MB\n"
        << "  Total chunks created: " << stats.total_chunks << '\n'
        << light_rule << '\n';

    oss << "\nChunk Details:\n";
    for (std::size_t i = 0; i < result.chunks.size(); ++i) {
        const auto &chunk = result.chunks[i];
        oss << "\nChunk #" << (i + 1) << " (" << chunk.size() << " files, "
            << format_megabytes(chunk.total_size) << "MB):\n";
        for (const auto &file : chunk.files) {
            oss << "  - " << file.path << " (" << format_megabytes(file.size) << "MB)\n";
        }
    }

    if (stats.failed_files > 0) {
        oss << light_rule << '\n' << "\nFiles that couldn't be processed:\n";
        for (const auto &path : stats.failed_paths) {
            oss << "  - " << path << '\n';
        }
    }

    oss << heavy_rule;
    return oss.str();
}

std::string ReportBuilder::build(const PackResult &result, const std::filesystem::path &root) {
    return build(result, root, std::chrono::system_clock::now());
}

std::vector<std::string> ReportBuilder::empty_result_reasons(const PackStats &stats) {
    std::vector<std::string> reasons;
    if (stats.large_files > 0) {
        std::ostringstream oss;
        oss << "- " << stats.large_files << " files were too large (>"
            << format_megabytes(stats.max_chunk_size) << "MB)";
        reasons.push_back(oss.str());
    }
    if (stats.failed_files > 0) {
        std::ostringstream oss;
        oss << "- Couldn't get size for " << stats.failed_files << " files";
        reasons.push_back(oss.str());
    }
    return reasons;
}

} // namespace gitchunk
