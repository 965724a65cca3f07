#include "temp_audio.hpp"

#include "platform/platform_paths.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <print>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace {

bool write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

} // namespace

std::expected<TempAudioFile, std::string>
TempAudioFile::create(std::istream& upload, const std::string& suffix, const std::string& dir) {
    auto base = dir.empty() ? fs::path(platform::temp_dir()) : fs::path(dir);
    std::string pattern = (base / "stt_upload_XXXXXX").string() + suffix;

    // mkstemps needs a mutable char*
    std::vector<char> tmpl(pattern.begin(), pattern.end());
    tmpl.push_back('\0');
    int fd = mkstemps(tmpl.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        return std::unexpected(std::string("mkstemps failed: ") + std::strerror(errno));
    }

    // Owns the path from here on, so every early return cleans up.
    TempAudioFile file(std::string(tmpl.data()));

    char buf[64 * 1024];
    bool ok = true;
    while (ok && upload) {
        upload.read(buf, sizeof(buf));
        auto n = upload.gcount();
        if (n > 0) ok = write_all(fd, buf, static_cast<size_t>(n));
    }
    if (!ok) {
        int err = errno;
        ::close(fd);
        return std::unexpected(std::string("write failed: ") + std::strerror(err));
    }
    if (upload.bad()) {
        ::close(fd);
        return std::unexpected("read from upload stream failed");
    }

    int sync_rc = ::fsync(fd);
    int sync_err = errno;
    if (::close(fd) != 0 || sync_rc != 0) {
        return std::unexpected(std::string("flush failed: ") +
                               std::strerror(sync_rc != 0 ? sync_err : errno));
    }

    return file;
}

TempAudioFile::~TempAudioFile() {
    remove();
}

TempAudioFile::TempAudioFile(TempAudioFile&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempAudioFile& TempAudioFile::operator=(TempAudioFile&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempAudioFile::remove() {
    if (path_.empty()) return;
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        std::println(stderr, "staging: could not remove {}: {}", path_, ec.message());
    }
    path_.clear();
}
