#pragma once

#include <expected>
#include <istream>
#include <string>

// Uploaded audio written to a uniquely named temporary file. The file is
// removed when the object is destroyed; removal errors are logged and dropped.
class TempAudioFile {
public:
    static std::expected<TempAudioFile, std::string>
        create(std::istream& upload, const std::string& suffix = ".webm",
               const std::string& dir = {});

    ~TempAudioFile();

    TempAudioFile(TempAudioFile&& other) noexcept;
    TempAudioFile& operator=(TempAudioFile&& other) noexcept;

    TempAudioFile(const TempAudioFile&) = delete;
    TempAudioFile& operator=(const TempAudioFile&) = delete;

    const std::string& path() const { return path_; }

private:
    explicit TempAudioFile(std::string path) : path_(std::move(path)) {}
    void remove();

    std::string path_;
};
