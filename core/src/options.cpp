#include "gitchunk/options.hpp"

#include "gitchunk/error.hpp"

#include <cctype>
#include <limits>
#include <sstream>

namespace gitchunk {

std::uint64_t parse_size(const std::string &text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
        throw Error("invalid size: '" + text + "'");
    }
    std::size_t consumed = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &consumed);
    } catch (const std::out_of_range &) {
        throw Error("size out of range: '" + text + "'");
    }

    std::uint64_t multiplier = 1;
    const auto suffix = text.substr(consumed);
    if (suffix == "K" || suffix == "k") {
        multiplier = 1024ull;
    } else if (suffix == "M" || suffix == "m") {
        multiplier = 1024ull * 1024;
    } else if (suffix == "G" || suffix == "g") {
        multiplier = 1024ull * 1024 * 1024;
    } else if (!suffix.empty()) {
        throw Error("invalid size suffix in '" + text + "'");
    }

    if (value == 0) {
        throw Error("size must be > 0");
    }
    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        throw Error("size out of range: '" + text + "'");
    }
    return static_cast<std::uint64_t>(value) * multiplier;
}

Options parse_options(int argc, char **argv) {
    Options opts;
    bool have_repo_path = false;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--max-chunk-size" && i + 1 < argc) {
            opts.max_chunk_size = parse_size(argv[++i]);
        } else if (arg == "--log-file" && i + 1 < argc) {
            opts.log_file = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (!arg.empty() && arg.front() != '-' && !have_repo_path) {
            opts.repo_path = arg;
            have_repo_path = true;
        } else {
            std::ostringstream oss;
            oss << "unknown or incomplete option: " << arg;
            throw Error(oss.str());
        }
    }
    if (opts.log_file.empty()) {
        throw Error("--log-file must not be empty");
    }
    return opts;
}

std::string usage() {
    return "Usage:\n"
           "  gitchunk [<repo-path>] [--max-chunk-size <bytes>[K|M|G]] [--log-file <path>] "
           "[--verbose]\n"
           "  gitchunk --help\n";
}

} // namespace gitchunk
