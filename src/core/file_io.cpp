#include "file_io.h"
#include "transfer_error.h"

#include <algorithm>
#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string lastErrno() {
    return std::error_code(errno, std::generic_category()).message();
}

} // anonymous namespace

// ── FileWriter ─────────────────────────────────────────────────

FileWriter::FileWriter(const fs::path& path)
    : path_(path)
{
    errno = 0;
    file_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
        throw TransferError(TransferErrorKind::Io,
            "failed to create file " + path_.string() + ": " + lastErrno());
    }
}

void FileWriter::write(const char* data, size_t size) {
    if (size == 0) {
        return;
    }
    errno = 0;
    file_.write(data, static_cast<std::streamsize>(size));
    if (!file_) {
        throw TransferError(TransferErrorKind::Io,
            "failed to write file " + path_.string() + ": " + lastErrno());
    }
    bytes_written_ += size;
}

void FileWriter::flush() {
    if (!file_.is_open()) {
        return;
    }
    errno = 0;
    file_.flush();
    if (!file_) {
        throw TransferError(TransferErrorKind::Io,
            "failed to flush file " + path_.string() + ": " + lastErrno());
    }
    file_.close();
    if (file_.fail()) {
        throw TransferError(TransferErrorKind::Io,
            "failed to close file " + path_.string() + ": " + lastErrno());
    }
}

// ── FileReader ─────────────────────────────────────────────────

FileReader::FileReader(const fs::path& path, size_t chunk_size)
    : path_(path)
    , chunk_size_(std::max<size_t>(1, chunk_size))
{
    std::error_code ec;
    if (fs::is_directory(path_, ec)) {
        throw TransferError(TransferErrorKind::Io,
            "failed to open file " + path_.string() + ": is a directory");
    }

    errno = 0;
    file_.open(path_, std::ios::binary | std::ios::in);
    if (!file_.is_open()) {
        throw TransferError(TransferErrorKind::Io,
            "failed to open file " + path_.string() + ": " + lastErrno());
    }

    auto size = fs::file_size(path_, ec);
    if (!ec) {
        size_ = static_cast<uint64_t>(size);
    }
}

size_t FileReader::read(char* buffer, size_t capacity) {
    if (capacity == 0 || file_.eof()) {
        return 0;
    }

    errno = 0;
    file_.read(buffer, static_cast<std::streamsize>(std::min(capacity, chunk_size_)));
    if (file_.bad()) {
        throw TransferError(TransferErrorKind::Io,
            "failed to read file " + path_.string() + ": " + lastErrno());
    }

    auto got = static_cast<size_t>(file_.gcount());
    bytes_read_ += got;
    return got;
}
