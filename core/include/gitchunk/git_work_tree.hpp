#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gitchunk {

class GitWorkTree {
  public:
    // Throws Error unless root is an existing directory with a .git entry.
    explicit GitWorkTree(const std::filesystem::path &root);

    static bool is_repository(const std::filesystem::path &path);

    // Untracked paths relative to the root, in git's order, with ignored files excluded.
    std::vector<std::string> untracked_files() const;

    const std::filesystem::path &root() const noexcept;

  private:
    std::string run_git(const std::vector<std::string> &args) const;

    std::filesystem::path root_;
};

// Splits NUL-terminated git output (-z) into normalised relative paths.
std::vector<std::string> split_nul_paths(const std::string &output);

} // namespace gitchunk
