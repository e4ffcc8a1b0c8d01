#include "gitchunk/chunk_packer.hpp"
#include "gitchunk/error.hpp"
#include "gitchunk/git_work_tree.hpp"
#include "gitchunk/log.hpp"
#include "gitchunk/options.hpp"
#include "gitchunk/report_builder.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

namespace {

int run(const gitchunk::Options &opts, gitchunk::Logger &logger) {
    logger.info("Starting Git Repository Chunking Tool");

    gitchunk::GitWorkTree tree(opts.repo_path);
    logger.info("Processing repository at: " + tree.root().string());

    const auto untracked = tree.untracked_files();
    if (untracked.empty()) {
        logger.info("No untracked files found in the repository.");
        return EXIT_SUCCESS;
    }
    {
        std::ostringstream oss;
        oss << "Found " << untracked.size() << " untracked items (files and folders).";
        logger.info(oss.str());
    }

    gitchunk::ChunkPacker packer(opts.max_chunk_size);
    const auto result = packer.pack(untracked, tree.root());

    for (const auto &entry : result.stats.large_entries) {
        logger.info("Skipping large file: " + entry.path + " (" +
                    gitchunk::format_megabytes(entry.size) + "MB)");
    }
    for (const auto &path : result.stats.failed_paths) {
        logger.debug("Size check failed for: " + path);
    }

    if (result.chunks.empty()) {
        logger.info("No valid chunks could be created. Possible reasons:");
        for (const auto &reason : gitchunk::ReportBuilder::empty_result_reasons(result.stats)) {
            logger.info(reason);
        }
        return EXIT_SUCCESS;
    }

    logger.info(gitchunk::ReportBuilder::build(result, tree.root()));
    logger.info("Operation completed successfully. Full report saved to " + opts.log_file.string());
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv) {
    gitchunk::Options opts;
    try {
        opts = gitchunk::parse_options(argc - 1, argv + 1);
    } catch (const gitchunk::Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        std::cerr << gitchunk::usage();
        return EXIT_FAILURE;
    }
    if (opts.show_help) {
        std::cout << gitchunk::usage();
        return EXIT_SUCCESS;
    }

    gitchunk::Logger logger(opts.verbose ? gitchunk::LogLevel::Debug : gitchunk::LogLevel::Info);
    try {
        logger.add_sink(std::make_unique<gitchunk::FileLogSink>(opts.log_file));
    } catch (const gitchunk::Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
    logger.add_sink(std::make_unique<gitchunk::StreamLogSink>(std::cerr));

    try {
        return run(opts, logger);
    } catch (const std::exception &err) {
        logger.error(std::string("Fatal error: ") + err.what());
        return EXIT_FAILURE;
    }
}
