#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>

/// Sequential, buffered writer for a download destination.
/// The file is created, or truncated when it already exists.
/// Failures throw TransferError(Io).
class FileWriter {
public:
    explicit FileWriter(const std::filesystem::path& path);

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;

    void write(const char* data, size_t size);

    /// Push buffered data to the OS and close the file.
    void flush();

    uint64_t bytesWritten() const { return bytes_written_; }

private:
    std::filesystem::path path_;
    std::ofstream file_;
    uint64_t bytes_written_ = 0;
};

/// Sequential reader that hands out a file in fixed-size chunks.
/// Failures throw TransferError(Io).
class FileReader {
public:
    FileReader(const std::filesystem::path& path, size_t chunk_size);

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;

    /// Read up to min(capacity, chunk size) bytes. 0 means end of file.
    size_t read(char* buffer, size_t capacity);

    /// Size on disk at open time; nullopt if it could not be determined.
    std::optional<uint64_t> size() const { return size_; }

    uint64_t bytesRead() const { return bytes_read_; }

private:
    std::filesystem::path path_;
    std::ifstream file_;
    size_t chunk_size_;
    std::optional<uint64_t> size_;
    uint64_t bytes_read_ = 0;
};
