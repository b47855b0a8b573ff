#pragma once

/// @file byte_source.hpp
/// @brief Sequential byte suppliers consumed by the decoders.
///
/// A ByteSource yields one byte at a time and signals end-of-input or an
/// I/O failure through its return status; the decoder turns a failure into
/// a DecodeError carrying its own coordinate.
///
/// For files on Linux/macOS, FileSource uses memory-mapped I/O to avoid
/// copying file data. For non-seekable streams (pipes, sockets,
/// stringstreams), StreamSource reads in fixed-size chunks.

#include "config.hpp"
#include "error.hpp"

#include <cstdint>
#include <fstream>
#include <istream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#if defined(QUARRY_HAS_MMAP)
    #include <fcntl.h>
    #include <sys/mman.h>
    #include <sys/stat.h>
    #include <unistd.h>
#endif

namespace quarry {

/// @brief Outcome of a single byte pull.
enum class ReadStatus : uint8_t {
    Byte,    ///< a byte was written to the output parameter
    End,     ///< clean end of input
    Failure  ///< the underlying source failed
};

/// @brief Any sequential supplier of bytes.
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /// @brief Pull the next byte.
    virtual ReadStatus next(uint8_t& out) = 0;

    /// @brief Number of bytes handed out so far.
    [[nodiscard]] virtual size_t consumed() const noexcept = 0;
};

// =====================================================================
// In-memory bytes
// =====================================================================

/// @brief Bytes of a caller-owned buffer. The buffer must outlive the source.
class MemorySource final : public ByteSource {
public:
    explicit MemorySource(std::string_view bytes) noexcept
        : begin_(bytes.data()), ptr_(bytes.data()), end_(bytes.data() + bytes.size()) {}

    ReadStatus next(uint8_t& out) noexcept override {
        if (QUARRY_UNLIKELY(ptr_ >= end_)) return ReadStatus::End;
        out = static_cast<uint8_t>(*ptr_++);
        return ReadStatus::Byte;
    }

    [[nodiscard]] size_t consumed() const noexcept override {
        return static_cast<size_t>(ptr_ - begin_);
    }

private:
    const char* begin_;
    const char* ptr_;
    const char* end_;
};

// =====================================================================
// std::istream
// =====================================================================

/// @brief Chunked reader over a caller-owned std::istream.
class StreamSource final : public ByteSource {
public:
    explicit StreamSource(std::istream& is, size_t chunk = QUARRY_STREAM_CHUNK)
        : is_(is), buf_(chunk > 0 ? chunk : 1) {}

    ReadStatus next(uint8_t& out) override {
        if (QUARRY_UNLIKELY(pos_ >= len_)) {
            if (done_) return ReadStatus::End;
            if (!refill()) return failed_ ? ReadStatus::Failure : ReadStatus::End;
        }
        out = static_cast<uint8_t>(buf_[pos_++]);
        ++consumed_;
        return ReadStatus::Byte;
    }

    [[nodiscard]] size_t consumed() const noexcept override { return consumed_; }

private:
    bool refill() {
        pos_ = 0;
        len_ = 0;
        is_.read(buf_.data(), static_cast<std::streamsize>(buf_.size()));
        len_ = static_cast<size_t>(is_.gcount());
        if (is_.bad()) {
            failed_ = true;
            done_ = true;
            return false;
        }
        if (!is_) done_ = true;  // eof (possibly with a partial final chunk)
        return len_ > 0;
    }

    std::istream& is_;
    std::vector<char> buf_;
    size_t pos_ = 0;
    size_t len_ = 0;
    size_t consumed_ = 0;
    bool done_ = false;
    bool failed_ = false;
};

// =====================================================================
// Files
// =====================================================================

namespace detail {

#if defined(QUARRY_HAS_MMAP)

/// @brief RAII wrapper for memory-mapped file regions.
class MappedFile {
public:
    MappedFile() = default;

    /// Try to mmap the given file descriptor. Returns false on failure.
    bool open(int fd) noexcept {
        struct stat st;
        if (fstat(fd, &st) != 0 || st.st_size <= 0) return false;

        size_ = static_cast<size_t>(st.st_size);
        void* p = ::mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd, 0);
        if (p == MAP_FAILED) {
            size_ = 0;
            return false;
        }
        data_ = static_cast<const char*>(p);

        ::madvise(const_cast<char*>(data_), size_, MADV_SEQUENTIAL);
        return true;
    }

    ~MappedFile() {
        if (data_) ::munmap(const_cast<char*>(data_), size_);
    }

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    [[nodiscard]] bool is_open() const noexcept { return data_ != nullptr; }

    [[nodiscard]] std::string_view view() const noexcept {
        return {data_, size_};
    }

private:
    const char* data_ = nullptr;
    size_t size_ = 0;
};

#endif // QUARRY_HAS_MMAP

} // namespace detail

/// @brief Bytes of a file on disk.
///
/// Memory-maps the file where possible; empty files, /proc entries and
/// platforms without mmap fall back to a chunked std::ifstream reader.
/// @throws DecodeError (errc::invalid_file) if the file cannot be opened.
class FileSource final : public ByteSource {
public:
    explicit FileSource(const std::string& path) {
#if defined(QUARRY_HAS_MMAP)
        int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            throw DecodeError("cannot open file '" + path + "'", Coordinate{},
                              errc::invalid_file);
        }
        mapped_ = std::make_unique<detail::MappedFile>();
        const bool ok = mapped_->open(fd);
        ::close(fd);
        if (ok) {
            memory_ = std::make_unique<MemorySource>(mapped_->view());
            return;
        }
        mapped_.reset();
#endif
        file_ = std::make_unique<std::ifstream>(path, std::ios::binary);
        if (!*file_) {
            throw DecodeError("cannot open file '" + path + "'", Coordinate{},
                              errc::invalid_file);
        }
        stream_ = std::make_unique<StreamSource>(*file_);
    }

    ReadStatus next(uint8_t& out) override {
        if (memory_) return memory_->next(out);
        return stream_->next(out);
    }

    [[nodiscard]] size_t consumed() const noexcept override {
        return memory_ ? memory_->consumed() : stream_->consumed();
    }

    [[nodiscard]] bool is_mapped() const noexcept { return memory_ != nullptr; }

private:
#if defined(QUARRY_HAS_MMAP)
    std::unique_ptr<detail::MappedFile> mapped_;
#endif
    std::unique_ptr<MemorySource> memory_;
    std::unique_ptr<std::ifstream> file_;
    std::unique_ptr<StreamSource> stream_;
};

} // namespace quarry
