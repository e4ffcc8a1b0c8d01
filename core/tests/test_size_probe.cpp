#include "gitchunk/size_probe.hpp"

#include <sys/stat.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <vector>

namespace {

class FailingStrategy : public gitchunk::SizeStrategy {
  public:
    std::string name() const override { return "failing"; }
    std::optional<std::uint64_t> measure(const std::filesystem::path &) const override {
        return std::nullopt;
    }
};

class ThrowingStrategy : public gitchunk::SizeStrategy {
  public:
    std::string name() const override { return "throwing"; }
    std::optional<std::uint64_t> measure(const std::filesystem::path &) const override {
        throw std::runtime_error("permission denied");
    }
};

class ForeignThrowStrategy : public gitchunk::SizeStrategy {
  public:
    std::string name() const override { return "foreign"; }
    std::optional<std::uint64_t> measure(const std::filesystem::path &) const override { throw 42; }
};

class UnavailableStrategy : public gitchunk::SizeStrategy {
  public:
    std::string name() const override { return "unavailable"; }
    bool available() const noexcept override { return false; }
    std::optional<std::uint64_t> measure(const std::filesystem::path &) const override {
        ++calls;
        return 1;
    }
    mutable int calls{0};
};

} // namespace

int main() {
    namespace fs = std::filesystem;
    auto temp_dir = fs::temp_directory_path() / "gitchunk_probe_test";
    fs::remove_all(temp_dir);
    fs::create_directories(temp_dir);
    auto file_path = temp_dir / "file.bin";
    {
        std::ofstream file(file_path, std::ios::binary);
        std::vector<char> data(1234, '\x01');
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
    }
    auto empty_path = temp_dir / "empty.bin";
    { std::ofstream file(empty_path, std::ios::binary); }

    gitchunk::MetadataSizeStrategy metadata;
    assert(metadata.measure(file_path).value() == 1234);
    assert(!metadata.measure(temp_dir / "missing.bin"));

    gitchunk::ReadSizeStrategy reader(100);
    assert(reader.measure(file_path).value() == 1234);
    assert(reader.measure(empty_path).value() == 0);
    assert(!reader.measure(temp_dir / "missing.bin"));

#if !defined(_WIN32)
    gitchunk::HandleSizeStrategy handle;
    assert(!handle.available());
    assert(!handle.measure(file_path));
#endif

    gitchunk::SizeProbe probe;
    assert(probe.strategy_count() == 3);
    auto result = probe.measure(file_path);
    assert(result.ok);
    assert(result.size == 1234);
    assert(result.strategy == "metadata");

    auto missing = probe.measure(temp_dir / "missing.bin");
    assert(!missing.ok);
    assert(missing.size == 0);
    assert(missing.strategy.empty());

    // Falls back past failing, throwing and unavailable strategies.
    auto unavailable_owner = std::make_unique<UnavailableStrategy>();
    const auto *unavailable = unavailable_owner.get();
    std::vector<std::unique_ptr<gitchunk::SizeStrategy>> strategies;
    strategies.push_back(std::make_unique<FailingStrategy>());
    strategies.push_back(std::make_unique<ThrowingStrategy>());
    strategies.push_back(std::move(unavailable_owner));
    strategies.push_back(std::make_unique<gitchunk::ReadSizeStrategy>());
    gitchunk::SizeProbe fallback(std::move(strategies));
    auto fallback_result = fallback.measure(file_path);
    assert(fallback_result.ok);
    assert(fallback_result.size == 1234);
    assert(fallback_result.strategy == "read");
    assert(unavailable->calls == 0);

    std::vector<std::unique_ptr<gitchunk::SizeStrategy>> only_failures;
    only_failures.push_back(std::make_unique<FailingStrategy>());
    only_failures.push_back(std::make_unique<ThrowingStrategy>());
    gitchunk::SizeProbe hopeless(std::move(only_failures));
    auto hopeless_result = hopeless.measure(file_path);
    assert(!hopeless_result.ok);
    assert(hopeless_result.size == 0);

    gitchunk::SizeProbe no_strategies(std::vector<std::unique_ptr<gitchunk::SizeStrategy>>{});
    assert(!no_strategies.measure(file_path).ok);

    // Only std::exception counts as a failed attempt.
    std::vector<std::unique_ptr<gitchunk::SizeStrategy>> foreign;
    foreign.push_back(std::make_unique<ForeignThrowStrategy>());
    foreign.push_back(std::make_unique<gitchunk::ReadSizeStrategy>());
    gitchunk::SizeProbe foreign_probe(std::move(foreign));
    bool propagated = false;
    try {
        foreign_probe.measure(file_path);
    } catch (int) {
        propagated = true;
    }
    assert(propagated);

    // Non-regular entries: sized by stat without being opened, never read.
    auto file_link = temp_dir / "file_link";
    fs::create_symlink(file_path, file_link);
    auto file_link_result = probe.measure(file_link);
    assert(file_link_result.ok);
    assert(file_link_result.size == 1234);
    assert(reader.measure(file_link).value() == 1234);

    auto fifo_path = temp_dir / "pipe";
    assert(::mkfifo(fifo_path.c_str(), 0600) == 0);
    auto fifo_result = probe.measure(fifo_path);
    assert(fifo_result.ok);
    assert(fifo_result.size == 0);
    assert(fifo_result.strategy == "metadata");
    assert(!reader.measure(fifo_path));

    auto fifo_link = temp_dir / "pipe_link";
    fs::create_symlink(fifo_path, fifo_link);
    assert(probe.measure(fifo_link).ok);
    assert(!reader.measure(fifo_link));

    if (fs::exists("/dev/zero")) {
        auto zero_link = temp_dir / "zero_link";
        fs::create_symlink("/dev/zero", zero_link);
        auto zero_result = probe.measure(zero_link);
        assert(zero_result.ok);
        assert(zero_result.size == 0);
        assert(!reader.measure(zero_link));
    }

    auto dangling = temp_dir / "dangling";
    fs::create_symlink(temp_dir / "nowhere", dangling);
    auto dangling_result = probe.measure(dangling);
    assert(!dangling_result.ok);
    assert(!reader.measure(dangling));

    fs::remove_all(temp_dir);
    return 0;
}
