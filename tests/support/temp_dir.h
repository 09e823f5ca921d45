// =============================================================================
// qzbulk - Temporary Directory (test support)
// =============================================================================

#ifndef QZB_TESTS_SUPPORT_TEMP_DIR_H
#define QZB_TESTS_SUPPORT_TEMP_DIR_H

#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <system_error>

namespace qzb::test {

/// @brief Unique directory under the system temp directory, removed with
///        everything in it on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "qzb-test") {
        static std::atomic<unsigned> counter{0};
        std::random_device random;
        path_ = std::filesystem::temp_directory_path() /
                (prefix + "-" + std::to_string(random()) + "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const {
        return path_ / name;
    }

    /// @brief Write a file below the directory, creating parents.
    std::filesystem::path writeFile(const std::string& name, const std::string& content) const {
        std::filesystem::path file = path_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

}  // namespace qzb::test

#endif  // QZB_TESTS_SUPPORT_TEMP_DIR_H
