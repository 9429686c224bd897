#pragma once

#include "tusup/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace tusup::upload {

/// Receives consecutive blocks of a byte range.
using BlockSink = std::function<void(const std::uint8_t* data, std::size_t size)>;

/**
 * @brief Source of the bytes being uploaded
 */
class FileSource {
public:
    virtual ~FileSource() = default;

    /// Path used for fingerprinting.
    virtual std::string path() const = 0;

    virtual Result<std::uint64_t> length() const = 0;

    /// Streams the half-open range [start, end) to @p sink, block by block.
    virtual Result<void> open_read(std::uint64_t start, std::uint64_t end,
                                   const BlockSink& sink) const = 0;
};

class LocalFileSource : public FileSource {
public:
    static constexpr std::size_t kDefaultBlockSize = 64 * 1024;

    explicit LocalFileSource(std::filesystem::path path,
                             std::size_t block_size = kDefaultBlockSize);

    std::string path() const override { return path_.string(); }
    Result<std::uint64_t> length() const override;
    Result<void> open_read(std::uint64_t start, std::uint64_t end,
                           const BlockSink& sink) const override;

private:
    std::filesystem::path path_;
    std::size_t block_size_;
};

/// Bytes held in memory under a logical path.
class MemoryFileSource : public FileSource {
public:
    MemoryFileSource(std::string logical_path, std::vector<std::uint8_t> data)
        : path_(std::move(logical_path)), data_(std::move(data)) {}

    std::string path() const override { return path_; }
    Result<std::uint64_t> length() const override { return Ok<std::uint64_t>(data_.size()); }
    Result<void> open_read(std::uint64_t start, std::uint64_t end,
                           const BlockSink& sink) const override;

private:
    std::string path_;
    std::vector<std::uint8_t> data_;
};

/**
 * @brief Reads the next chunk of an upload on demand
 *
 * A chunk is at most max_chunk_size bytes starting at the given offset and
 * never extends past the end of the file.
 */
class ChunkReader {
public:
    ChunkReader(const FileSource& source, std::size_t max_chunk_size)
        : source_(source), max_chunk_size_(max_chunk_size) {}

    void set_max_chunk_size(std::size_t size) { max_chunk_size_ = size; }
    std::size_t max_chunk_size() const noexcept { return max_chunk_size_; }

    Result<std::vector<std::uint8_t>> read(std::uint64_t offset, std::uint64_t file_size) const;

private:
    const FileSource& source_;
    std::size_t max_chunk_size_;
};

} // namespace tusup::upload
