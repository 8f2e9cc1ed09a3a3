#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>

#include <unistd.h>

namespace LayerGuardTest {

/// Throw-away directory tree under the system temp dir, removed on destruction
class TempTree {
public:
    TempTree() {
        static std::atomic<uint32_t> counter{0};
        const auto stamp = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        root_ = std::filesystem::temp_directory_path() /
                ("layer_guard_test_" + std::to_string(::getpid()) + "_" +
                 std::to_string(stamp) + "_" + std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(root_);
    }

    ~TempTree() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempTree(const TempTree&) = delete;
    TempTree& operator=(const TempTree&) = delete;

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

    /// Absolute path of `relative`, in the form the locator reports it
    [[nodiscard]] std::string path(const std::string& relative) const {
        return (root_ / relative).lexically_normal().generic_string();
    }

    void write(const std::string& relative, const std::string& content) const {
        const std::filesystem::path target = root_ / relative;
        std::filesystem::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        out << content;
    }

    void mkdir(const std::string& relative) const {
        std::filesystem::create_directories(root_ / relative);
    }

    [[nodiscard]] std::string read(const std::string& relative) const {
        std::ifstream in(root_ / relative, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

private:
    std::filesystem::path root_;
};

} // namespace LayerGuardTest
