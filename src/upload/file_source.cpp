#include "tusup/upload/file_source.hpp"

#include <algorithm>
#include <fstream>

namespace tusup::upload {
namespace fs = std::filesystem;

LocalFileSource::LocalFileSource(fs::path path, std::size_t block_size)
    : path_(std::move(path)), block_size_(block_size == 0 ? kDefaultBlockSize : block_size) {}

Result<std::uint64_t> LocalFileSource::length() const {
    std::error_code ec;
    const auto size = fs::file_size(path_, ec);
    if (ec) {
        return Err<std::uint64_t>(io_error("Failed to stat " + path_.string() + ": " + ec.message()));
    }
    return Ok<std::uint64_t>(size);
}

Result<void> LocalFileSource::open_read(std::uint64_t start, std::uint64_t end,
                                        const BlockSink& sink) const {
    if (end < start) {
        return Err<void>(io_error("Invalid read range"));
    }

    std::ifstream input(path_, std::ios::binary);
    if (!input) {
        return Err<void>(io_error("Failed to open source file: " + path_.string()));
    }

    input.seekg(static_cast<std::streamoff>(start));
    if (!input) {
        return Err<void>(io_error("Failed to seek in " + path_.string()));
    }

    std::vector<std::uint8_t> buffer(block_size_);
    std::uint64_t remaining = end - start;
    while (remaining > 0) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, block_size_));
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(input.gcount());
        if (got == 0) {
            // File shrank underneath us; the caller sees a short chunk
            break;
        }
        sink(buffer.data(), got);
        remaining -= got;
    }

    if (input.bad()) {
        return Err<void>(io_error("Failed to read " + path_.string()));
    }
    return Ok();
}

Result<void> MemoryFileSource::open_read(std::uint64_t start, std::uint64_t end,
                                         const BlockSink& sink) const {
    if (end < start) {
        return Err<void>(io_error("Invalid read range"));
    }
    const auto first = std::min<std::uint64_t>(start, data_.size());
    const auto last = std::min<std::uint64_t>(end, data_.size());
    if (last > first) {
        sink(data_.data() + first, static_cast<std::size_t>(last - first));
    }
    return Ok();
}

Result<std::vector<std::uint8_t>> ChunkReader::read(std::uint64_t offset, std::uint64_t file_size) const {
    const std::uint64_t end = std::min<std::uint64_t>(offset + max_chunk_size_, file_size);

    std::vector<std::uint8_t> chunk;
    if (end <= offset) {
        return Ok(std::move(chunk));
    }
    chunk.reserve(static_cast<std::size_t>(end - offset));

    auto read = source_.open_read(offset, end, [&chunk](const std::uint8_t* data, std::size_t size) {
        chunk.insert(chunk.end(), data, data + size);
    });
    if (read.is_error()) {
        return Err<std::vector<std::uint8_t>>(read.error());
    }

    // A source may hand back more than asked for; never exceed the chunk bound
    if (chunk.size() > max_chunk_size_) {
        chunk.resize(max_chunk_size_);
    }
    return Ok(std::move(chunk));
}

} // namespace tusup::upload
