#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitchunk {

struct SizeResult {
    std::uint64_t size;
    bool ok;
    // Name of the strategy that produced the size, empty when ok is false.
    std::string strategy;
};

class SizeStrategy {
  public:
    virtual ~SizeStrategy() = default;

    virtual std::string name() const = 0;

    // False when the strategy cannot run on this platform; the probe skips it.
    virtual bool available() const noexcept { return true; }

    virtual std::optional<std::uint64_t> measure(const std::filesystem::path &path) const = 0;
};

// Filesystem metadata query, does not open the file.
class MetadataSizeStrategy : public SizeStrategy {
  public:
    std::string name() const override;
    std::optional<std::uint64_t> measure(const std::filesystem::path &path) const override;
};

// Size query through an open Windows file handle. Unavailable elsewhere.
class HandleSizeStrategy : public SizeStrategy {
  public:
    std::string name() const override;
    bool available() const noexcept override;
    std::optional<std::uint64_t> measure(const std::filesystem::path &path) const override;
};

// Opens the file and counts the bytes read.
class ReadSizeStrategy : public SizeStrategy {
  public:
    explicit ReadSizeStrategy(std::size_t buffer_size = 64 * 1024);

    std::string name() const override;
    std::optional<std::uint64_t> measure(const std::filesystem::path &path) const override;

  private:
    std::size_t buffer_size_;
};

/// Measures file sizes by trying each strategy in order until one succeeds.
///
/// A file no strategy can size is reported as {0, false}. Strategies signal
/// failure with std::nullopt or a std::exception; anything else a strategy
/// throws, and std::bad_alloc, propagates to the caller.
class SizeProbe {
  public:
    // Metadata, then Windows handle, then read.
    SizeProbe();

    explicit SizeProbe(std::vector<std::unique_ptr<SizeStrategy>> strategies);

    SizeResult measure(const std::filesystem::path &path) const;

    std::size_t strategy_count() const noexcept;

  private:
    std::vector<std::unique_ptr<SizeStrategy>> strategies_;
};

} // namespace gitchunk
