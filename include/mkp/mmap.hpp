#pragma once

#include "mkp/utility.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <format>
#include <memory>
#include <string_view>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace makeport {

/**
 * @brief Read-only memory mapped view of a Makefile.
 *
 * Handles resource cleanup via RAII. An empty file maps to an empty view.
 */
class MappedFile {
    struct Key {
        explicit Key() = default;
    };

public:
    explicit MappedFile(Key) {
    }

    /**
     * @brief Opens and maps the specified file.
     * @param path The path to the file.
     * @return The mapping, or an error naming the path and the failing call.
     */
    static Result<std::unique_ptr<MappedFile>> open(const std::filesystem::path &path) {
        auto file = std::make_unique<MappedFile>(Key{});

        file->fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (file->fd_ == -1) {
            return std::unexpected(std::format("Failed to open {}: {}", path.string(), std::strerror(errno)));
        }

        struct stat sb;
        if (fstat(file->fd_, &sb) == -1) {
            return std::unexpected(std::format("Failed to stat {}: {}", path.string(), std::strerror(errno)));
        }
        if (!S_ISREG(sb.st_mode)) {
            return std::unexpected(std::format("Path is not a file: {}", path.string()));
        }
        file->size_ = static_cast<size_t>(sb.st_size);

        if (file->size_ == 0) {
            return file;
        }

        void *addr = mmap(nullptr, file->size_, PROT_READ, MAP_PRIVATE, file->fd_, 0);
        if (addr == MAP_FAILED) {
            return std::unexpected(std::format("Failed to mmap {}: {}", path.string(), std::strerror(errno)));
        }
        file->data_ = static_cast<char *>(addr);
        return file;
    }

    ~MappedFile() {
        if (data_) {
            munmap(data_, size_);
        }
        if (fd_ != -1) {
            close(fd_);
        }
    }

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

private:
    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace makeport
