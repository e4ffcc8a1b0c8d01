#pragma once

#include "gitchunk/chunk_packer.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace gitchunk {

struct Options {
    std::filesystem::path repo_path = ".";
    std::uint64_t max_chunk_size = kDefaultMaxChunkSize;
    std::filesystem::path log_file = "git_chunks.log";
    bool verbose = false;
    bool show_help = false;
};

// Parses the arguments after the program name. Throws Error on bad input.
Options parse_options(int argc, char **argv);

// "1048576", "512K", "25M", "2G" (binary multiples). Throws Error on
// malformed or zero values.
std::uint64_t parse_size(const std::string &text);

std::string usage();

} // namespace gitchunk
