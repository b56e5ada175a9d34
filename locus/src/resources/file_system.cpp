#include "locus/resources/file_system.hpp"
#include "locus/error.hpp"
#include "locus/path_utils.hpp"
#include <fstream>

namespace locus {

FileSystemResource::FileSystemResource(const std::string& path)
    : path_(path_utils::clean_path(path))
    , file_(path_) {}

std::unique_ptr<std::istream> FileSystemResource::open_stream() const {
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        throw LocusError(ErrorCode::NotFound, path_,
            description() + " cannot be opened because it does not exist");
    }
    if (std::filesystem::is_directory(file_, ec)) {
        throw LocusError(ErrorCode::IOError, path_, description() + " is a directory");
    }

    auto stream = std::make_unique<std::ifstream>(file_, std::ios::binary);
    if (!*stream) {
        throw LocusError(ErrorCode::IOError, path_, "Failed to open file for reading");
    }
    return stream;
}

bool FileSystemResource::exists() const {
    std::error_code ec;
    return std::filesystem::exists(file_, ec);
}

bool FileSystemResource::readable() const {
    std::error_code ec;
    auto status = std::filesystem::status(file_, ec);
    if (ec || !std::filesystem::is_regular_file(status)) {
        return false;
    }
    // Readable by this process, not just carrying some read bit
    std::ifstream in(file_, std::ios::binary);
    return in.is_open();
}

Url FileSystemResource::get_url() const {
    return Url::from_path(file_);
}

std::uint64_t FileSystemResource::content_length() const {
    std::error_code ec;
    auto size = std::filesystem::file_size(file_, ec);
    if (ec) {
        if (!exists()) {
            throw LocusError(ErrorCode::NotFound, path_,
                description() + " cannot be resolved in the file system for checking its content length");
        }
        throw LocusError(ErrorCode::IOError, path_, "Failed to read file size: " + ec.message());
    }
    return static_cast<std::uint64_t>(size);
}

ResourcePtr FileSystemResource::create_relative(const std::string& relative_path) const {
    return std::make_shared<FileSystemResource>(path_utils::apply_relative_path(path_, relative_path));
}

std::optional<std::string> FileSystemResource::filename() const {
    return path_utils::filename(path_);
}

std::string FileSystemResource::description() const {
    std::error_code ec;
    auto absolute = std::filesystem::absolute(file_, ec);
    return "file [" + (ec ? file_ : absolute).string() + "]";
}

FileSystemContextResource::FileSystemContextResource(const std::string& path)
    : FileSystemResource(path) {}

} // namespace locus
