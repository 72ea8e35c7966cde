#include "kiln/source.hpp"

#include <fcntl.h>
#include <format>
#include <stdexcept>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kiln {

MappedFile::MappedFile(const std::filesystem::path &path) {
    fd_ = open(path.c_str(), O_RDONLY);
    if (fd_ == -1)
        throw std::runtime_error("Failed to open file: " + path.string());

    struct stat sb;
    if (fstat(fd_, &sb) == -1) {
        close(fd_);
        throw std::runtime_error("Failed to stat file: " + path.string());
    }
    if (!S_ISREG(sb.st_mode)) {
        close(fd_);
        throw std::runtime_error("Not a regular file: " + path.string());
    }
    size_ = static_cast<size_t>(sb.st_size);
    if (size_ == 0)
        return;

    posix_fadvise(fd_, 0, 0, POSIX_FADV_SEQUENTIAL);
    void *addr = mmap(nullptr, size_, PROT_READ, MAP_PRIVATE, fd_, 0);
    if (addr == MAP_FAILED) {
        close(fd_);
        throw std::runtime_error("Failed to mmap file: " + path.string());
    }
    data_ = static_cast<char *>(addr);
}

MappedFile::~MappedFile() {
    if (data_)
        munmap(data_, size_);
    if (fd_ != -1)
        close(fd_);
}

Result<SourceText> MappedSourceReader::read(const std::string &file_path) const {
    try {
        auto map = std::make_shared<MappedFile>(file_path);
        std::string_view text = map->content();
        return SourceText{.owner = std::move(map), .text = text};
    } catch (const std::runtime_error &e) {
        return std::unexpected(std::string(e.what()));
    }
}

} // namespace kiln
