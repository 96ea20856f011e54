#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>

namespace netsleuth::fs {

// Streaming open file handle.
class IFile {
public:
    virtual ~IFile() = default;

    // Read up to maxBytes into dst, returns number of bytes actually read (0 on EOF or error).
    virtual std::size_t read(void* dst, std::size_t maxBytes) = 0;

    // Write up to bytes from src, returns number of bytes actually written.
    virtual std::size_t write(const void* src, std::size_t bytes) = 0;

    // Flush buffered data to underlying storage if applicable.
    virtual bool flush() = 0;
};

// Filesystem rooted at some directory.
// All paths are POSIX-style within this FS ("/", "/dir/file", "file").
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    // Stable identifier used in log lines, e.g. "state", "mem".
    virtual std::string name() const = 0;

    virtual bool exists(const std::string& path) = 0;
    virtual bool createDirectory(const std::string& path) = 0;
    virtual bool removeFile(const std::string& path) = 0;

    // Replaces `to` if it exists.
    virtual bool rename(const std::string& from, const std::string& to) = 0;

    // Open a file using C stdio-style mode strings ("rb", "wb").
    // Returns nullptr on failure.
    virtual std::unique_ptr<IFile> open(const std::string& path, const char* mode) = 0;
};

// Reads the remainder of `file` as text.
std::string read_all(IFile& file);

// Writes all of `data`; throws std::runtime_error on a short write.
void write_all(IFile& file, const std::string& data);

} // namespace netsleuth::fs
