#include "gitchunk/git_work_tree.hpp"

#include "gitchunk/error.hpp"

#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>

namespace gitchunk {

namespace {

std::string errno_message(const std::string &what) {
    std::ostringstream oss;
    oss << what << ": " << std::strerror(errno);
    return oss.str();
}

} // namespace

GitWorkTree::GitWorkTree(const std::filesystem::path &root) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw Error("invalid directory path: " + root.string());
    }
    if (!is_repository(root)) {
        throw Error("the directory doesn't appear to be a git repository: " + root.string());
    }
    root_ = std::filesystem::absolute(root, ec);
    if (ec) {
        throw Error("failed to resolve '" + root.string() + "': " + ec.message());
    }
    root_ = root_.lexically_normal();
}

bool GitWorkTree::is_repository(const std::filesystem::path &path) {
    std::error_code ec;
    // .git is a file rather than a directory inside linked worktrees and submodules.
    return std::filesystem::exists(path / ".git", ec);
}

std::vector<std::string> GitWorkTree::untracked_files() const {
    return split_nul_paths(run_git({"ls-files", "--others", "--exclude-standard", "-z"}));
}

const std::filesystem::path &GitWorkTree::root() const noexcept { return root_; }

std::string GitWorkTree::run_git(const std::vector<std::string> &args) const {
    std::vector<std::string> argv_storage{"git", "-C", root_.string()};
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());
    std::vector<char *> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto &arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    int fds[2];
    if (::pipe(fds) != 0) {
        throw Error(errno_message("pipe failed"));
    }
    pid_t pid = ::fork();
    if (pid < 0) {
        auto message = errno_message("fork failed");
        ::close(fds[0]);
        ::close(fds[1]);
        throw Error(message);
    }
    if (pid == 0) {
        ::close(fds[0]);
        if (::dup2(fds[1], STDOUT_FILENO) < 0) {
            ::_exit(127);
        }
        ::close(fds[1]);
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(fds[1]);
    std::string output;
    char buffer[4096];
    while (true) {
        ssize_t rc = ::read(fds[0], buffer, sizeof(buffer));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto message = errno_message("reading git output failed");
            ::close(fds[0]);
            ::waitpid(pid, nullptr, 0);
            throw Error(message);
        }
        if (rc == 0) {
            break;
        }
        output.append(buffer, static_cast<std::size_t>(rc));
    }
    ::close(fds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw Error(errno_message("waitpid failed"));
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::ostringstream oss;
        oss << "git " << args.front() << " failed in '" << root_.string() << "'";
        if (WIFEXITED(status)) {
            oss << " with exit status " << WEXITSTATUS(status);
        }
        throw Error(oss.str());
    }
    return output;
}

std::vector<std::string> split_nul_paths(const std::string &output) {
    std::vector<std::string> paths;
    std::size_t start = 0;
    while (start < output.size()) {
        auto end = output.find('\0', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        if (end > start) {
            auto path = std::filesystem::path(output.substr(start, end - start)).lexically_normal();
            paths.push_back(path.string());
        }
        start = end + 1;
    }
    return paths;
}

} // namespace gitchunk
