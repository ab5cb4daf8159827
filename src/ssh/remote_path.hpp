#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <core/types.hpp>
#include <core/constants.hpp>

// Normalise a remote path: reject any ".." segment, collapse duplicate
// slashes and "." segments, and make it absolute.
Result<std::string> validate_path(const std::string& path);

// Parent of a normalised absolute path ("/" is its own parent).
std::string parent_path(const std::string& path);

// Final component of a path ("/" for the root).
std::string base_name(const std::string& path);

// "a/b" + "c" -> "a/b/c"
std::string join_path(const std::string& dir, const std::string& name);

// Octal permission string ("0755", "755") to mode bits. Anything that is not
// 1-4 octal digits is a Resource error.
Result<unsigned long> parse_mode(const std::string& mode);

// st_mode bits to "drwxr-xr-x".
std::string mode_string(unsigned long mode);

// Permission bits to "0755".
std::string permission_string(unsigned long mode);

// Chunked stream copy shared by upload and download.
//
// The reader fills up to cap bytes and returns the count (0 at end of
// stream). The writer must consume the whole chunk; on failure it reports
// how many bytes of the chunk did land in Err's value. Progress receives the
// cumulative count after every chunk. Any failure after the copy started is
// a PartialTransfer error whose value is the bytes actually written.
using ChunkReader = std::function<Result<size_t>(char* buf, size_t cap)>;
using ChunkWriter = std::function<Result<size_t>(const char* buf, size_t len)>;

Result<uint64_t> copy_chunks(const ChunkReader& read, const ChunkWriter& write,
                             uint64_t total, const ProgressCallback& progress,
                             size_t chunk_size = TRANSFER_CHUNK_SIZE);
