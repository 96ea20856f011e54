#include "netsleuth/fs/fs_stdio.h"
#include "netsleuth/core/logging.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <sys/stat.h>

namespace netsleuth::fs {

static constexpr const char* TAG = "fs";

// ----------------------
// StdioFile
// ----------------------
class StdioFile : public IFile {
public:
    explicit StdioFile(std::FILE* fp)
        : _fp(fp)
    {}

    ~StdioFile() override {
        if (_fp) {
            std::fclose(_fp);
        }
    }

    StdioFile(const StdioFile&) = delete;
    StdioFile& operator=(const StdioFile&) = delete;

    std::size_t read(void* dst, std::size_t maxBytes) override
    {
        if (!_fp || maxBytes == 0) return 0;
        return std::fread(dst, 1, maxBytes, _fp);
    }

    std::size_t write(const void* src, std::size_t bytes) override
    {
        if (!_fp || bytes == 0) return 0;
        return std::fwrite(src, 1, bytes, _fp);
    }

    bool flush() override
    {
        if (!_fp) return false;
        return std::fflush(_fp) == 0;
    }

private:
    std::FILE* _fp{};
};

// ----------------------
// StdioFileSystem
// ----------------------
class StdioFileSystem : public IFileSystem {
public:
    StdioFileSystem(std::string rootDir, std::string name)
        : _root(std::move(rootDir))
        , _name(std::move(name))
    {
        // normalise root: no trailing slash (except "/" itself)
        if (_root.size() > 1 && _root.back() == '/') {
            _root.pop_back();
        }
    }

    std::string name() const override { return _name; }

    bool exists(const std::string& path) override
    {
        struct stat st{};
        return ::stat(fullPath(path).c_str(), &st) == 0;
    }

    bool createDirectory(const std::string& path) override
    {
        const auto fp = fullPath(path);
        if (::mkdir(fp.c_str(), 0755) == 0) {
            return true;
        }
        struct stat st{};
        return errno == EEXIST && ::stat(fp.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
    }

    bool removeFile(const std::string& path) override
    {
        return std::remove(fullPath(path).c_str()) == 0;
    }

    bool rename(const std::string& from, const std::string& to) override
    {
        return std::rename(fullPath(from).c_str(), fullPath(to).c_str()) == 0;
    }

    std::unique_ptr<IFile> open(const std::string& path, const char* mode) override
    {
        const std::string full = fullPath(path);
        auto fp = std::fopen(full.c_str(), mode);

        if (!fp) {
            const int e = errno;
            NS_LOGE(TAG,
                    "open failed: fs='%s' mode='%s' path='%s' full='%s' errno=%d (%s)",
                    _name.c_str(),
                    mode ? mode : "(null)",
                    path.c_str(),
                    full.c_str(),
                    e,
                    std::strerror(e));
            return nullptr;
        }

        return std::make_unique<StdioFile>(fp);
    }

private:
    std::string fullPath(const std::string& rel) const
    {
        if (rel.empty() || rel == "/") {
            return _root;
        }
        if (rel.front() == '/') {
            return _root + rel;
        }
        return _root + "/" + rel;
    }

    std::string _root;
    std::string _name;
};

std::unique_ptr<IFileSystem>
create_stdio_filesystem(const std::string& rootDir, const std::string& name)
{
    NS_LOGI(TAG, "Creating stdio filesystem '%s' at root '%s'",
            name.c_str(), rootDir.c_str());
    return std::make_unique<StdioFileSystem>(rootDir, name);
}

std::string read_all(IFile& file)
{
    std::string out;
    std::vector<std::uint8_t> buf(1024);

    for (;;) {
        std::size_t n = file.read(buf.data(), buf.size());
        if (n == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buf.data()), n);
    }
    return out;
}

void write_all(IFile& file, const std::string& data)
{
    const auto* ptr = reinterpret_cast<const std::uint8_t*>(data.data());
    std::size_t remaining = data.size();

    while (remaining > 0) {
        std::size_t written = file.write(ptr, remaining);
        if (written == 0) {
            throw std::runtime_error("short write");
        }
        remaining -= written;
        ptr       += written;
    }
    if (!file.flush()) {
        throw std::runtime_error("flush failed");
    }
}

} // namespace netsleuth::fs
