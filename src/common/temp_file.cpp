#include "temp_file.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <print>
#include <unistd.h>
#include <vector>

std::expected<TempFile, std::string> TempFile::create(const std::string& dir,
                                                      std::string_view suffix) {
    std::string base = dir.empty() ? platform::temp_dir() : dir;
    std::string tmpl = base + "/kikitori-XXXXXX" + std::string(suffix);

    // mkstemps needs a mutable char*
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return std::unexpected(std::string("failed to create temp file in ") + base + ": " +
                               std::strerror(errno));
    }
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
    return TempFile(fd, std::string(buf.data()));
}

TempFile::TempFile(TempFile&& other) noexcept
    : fd_(other.fd_), path_(std::move(other.path_)) {
    other.fd_ = -1;
    other.path_.clear();
}

TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        release();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
        other.path_.clear();
    }
    return *this;
}

TempFile::~TempFile() {
    release();
}

std::expected<void, std::string> TempFile::write_all(std::span<const uint8_t> data) {
    if (fd_ < 0) return std::unexpected("temp file is not open for writing");

    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("write to ") + path_ + " failed: " +
                                   std::strerror(errno));
        }
        off += static_cast<size_t>(n);
    }

    int rc = ::close(fd_);
    fd_ = -1;
    if (rc < 0) {
        return std::unexpected(std::string("close of ") + path_ + " failed: " +
                               std::strerror(errno));
    }
    return {};
}

void TempFile::release() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (!path_.empty()) {
        if (::unlink(path_.c_str()) < 0 && errno != ENOENT) {
            std::println(stderr, "tempfile: could not remove {}: {}", path_, std::strerror(errno));
        }
        path_.clear();
    }
}
