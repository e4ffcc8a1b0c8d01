#include "gitchunk/size_probe.hpp"

#include <fstream>
#include <new>
#include <stdexcept>
#include <system_error>

#if defined(_WIN32)
#include <windows.h>
#else
#include <sys/stat.h>
#endif

namespace gitchunk {

std::string MetadataSizeStrategy::name() const { return "metadata"; }

// Follows symlinks and reports st_size for any file type, so FIFOs and
// devices come back as 0 without being opened.
std::optional<std::uint64_t> MetadataSizeStrategy::measure(const std::filesystem::path &path) const {
#if defined(_WIN32)
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
#else
    struct stat st;
    if (::stat(path.c_str(), &st) != 0 || st.st_size < 0) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(st.st_size);
#endif
}

std::string HandleSizeStrategy::name() const { return "handle"; }

bool HandleSizeStrategy::available() const noexcept {
#if defined(_WIN32)
    return true;
#else
    return false;
#endif
}

std::optional<std::uint64_t> HandleSizeStrategy::measure(const std::filesystem::path &path) const {
#if defined(_WIN32)
    HANDLE handle = ::CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING,
                                  0, nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        return std::nullopt;
    }
    LARGE_INTEGER size;
    const BOOL ok = ::GetFileSizeEx(handle, &size);
    ::CloseHandle(handle);
    if (!ok) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size.QuadPart);
#else
    (void)path;
    return std::nullopt;
#endif
}

ReadSizeStrategy::ReadSizeStrategy(std::size_t buffer_size) : buffer_size_(buffer_size) {
    if (buffer_size_ == 0) {
        throw std::invalid_argument("read buffer size must be > 0");
    }
}

std::string ReadSizeStrategy::name() const { return "read"; }

std::optional<std::uint64_t> ReadSizeStrategy::measure(const std::filesystem::path &path) const {
    // Opening a FIFO blocks and a device may never reach EOF.
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::vector<char> buffer(buffer_size_);
    std::uint64_t total = 0;
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto read = file.gcount();
        if (read <= 0) {
            break;
        }
        total += static_cast<std::uint64_t>(read);
    }
    if (file.bad()) {
        return std::nullopt;
    }
    return total;
}

SizeProbe::SizeProbe() {
    strategies_.reserve(3);
    strategies_.push_back(std::make_unique<MetadataSizeStrategy>());
    strategies_.push_back(std::make_unique<HandleSizeStrategy>());
    strategies_.push_back(std::make_unique<ReadSizeStrategy>());
}

SizeProbe::SizeProbe(std::vector<std::unique_ptr<SizeStrategy>> strategies)
    : strategies_(std::move(strategies)) {}

SizeResult SizeProbe::measure(const std::filesystem::path &path) const {
    for (const auto &strategy : strategies_) {
        if (!strategy->available()) {
            continue;
        }
        try {
            auto size = strategy->measure(path);
            if (size) {
                return SizeResult{*size, true, strategy->name()};
            }
        } catch (const std::bad_alloc &) {
            throw;
        } catch (const std::exception &) {
            // A std::exception from a strategy counts as a failed attempt.
            continue;
        }
    }
    return SizeResult{0, false, {}};
}

std::size_t SizeProbe::strategy_count() const noexcept { return strategies_.size(); }

} // namespace gitchunk
