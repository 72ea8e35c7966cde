#pragma once

#include "kiln/utility.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace kiln {

/**
 * @brief Read-only memory mapping of a whole file.
 *
 * Empty files are not mapped; content() is then empty.
 * @throws std::runtime_error from the constructor if the file cannot be opened or mapped.
 */
class MappedFile {
public:
    explicit MappedFile(const std::filesystem::path &path);
    ~MappedFile();

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

    std::string_view content() const {
        return data_ ? std::string_view(data_, size_) : std::string_view();
    }

private:
    int fd_ = -1;
    char *data_ = nullptr;
    size_t size_ = 0;
};

/** @brief Source text plus whatever keeps it alive. */
struct SourceText {
    std::shared_ptr<const void> owner;
    std::string_view text;
};

/** @brief Supplies the UTF-8 text of a module. */
class SourceReader {
public:
    virtual ~SourceReader() = default;

    virtual Result<SourceText> read(const std::string &file_path) const = 0;
};

/** @brief Reads files through MappedFile. */
class MappedSourceReader final : public SourceReader {
public:
    Result<SourceText> read(const std::string &file_path) const override;
};

} // namespace kiln
