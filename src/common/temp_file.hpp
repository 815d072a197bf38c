#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

// Uniquely named file that is removed when the object goes away.
class TempFile {
public:
    // Creates <dir>/kikitori-XXXXXX<suffix>. An empty dir means the system temp directory.
    static std::expected<TempFile, std::string> create(const std::string& dir,
                                                        std::string_view suffix);

    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    const std::string& path() const { return path_; }

    // Writes all of data and closes the descriptor, so the file can be reopened by path.
    std::expected<void, std::string> write_all(std::span<const uint8_t> data);

private:
    TempFile(int fd, std::string path) : fd_(fd), path_(std::move(path)) {}

    void release();

    int fd_ = -1;
    std::string path_;
};
