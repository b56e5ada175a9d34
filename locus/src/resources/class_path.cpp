#include "locus/resources/class_path.hpp"
#include "locus/error.hpp"
#include "locus/path_utils.hpp"
#include <fstream>

namespace locus {

ClassPathResource::ClassPathResource(const std::string& path, ClassPath class_path)
    : path_(path_utils::strip_leading_slash(path_utils::clean_path(path)))
    , class_path_(std::move(class_path)) {}

std::optional<std::filesystem::path> ClassPathResource::resolve_file() const {
    return class_path_.find(path_);
}

std::unique_ptr<std::istream> ClassPathResource::open_stream() const {
    auto file = resolve_file();
    if (!file) {
        throw LocusError(ErrorCode::NotFound, path_,
            description() + " cannot be opened because it does not exist");
    }
    std::error_code ec;
    if (std::filesystem::is_directory(*file, ec)) {
        throw LocusError(ErrorCode::IOError, path_, description() + " is a directory");
    }

    auto stream = std::make_unique<std::ifstream>(*file, std::ios::binary);
    if (!*stream) {
        throw LocusError(ErrorCode::IOError, file->string(), "Failed to open file for reading");
    }
    return stream;
}

bool ClassPathResource::exists() const {
    return resolve_file().has_value();
}

bool ClassPathResource::readable() const {
    auto file = resolve_file();
    std::error_code ec;
    return file && std::filesystem::is_regular_file(*file, ec);
}

bool ClassPathResource::is_file() const {
    return resolve_file().has_value();
}

Url ClassPathResource::get_url() const {
    auto file = resolve_file();
    if (!file) {
        throw LocusError(ErrorCode::NotFound, path_,
            description() + " cannot be resolved to URL because it does not exist");
    }
    return Url::from_path(*file);
}

std::filesystem::path ClassPathResource::get_file() const {
    auto file = resolve_file();
    if (!file) {
        throw LocusError(ErrorCode::NotFound, path_,
            description() + " cannot be resolved to absolute file path because it does not exist");
    }
    return std::filesystem::absolute(*file);
}

std::uint64_t ClassPathResource::content_length() const {
    auto file = resolve_file();
    std::error_code ec;
    if (file && std::filesystem::is_regular_file(*file, ec)) {
        auto size = std::filesystem::file_size(*file, ec);
        if (!ec) {
            return static_cast<std::uint64_t>(size);
        }
    }
    return AbstractResource::content_length();
}

ResourcePtr ClassPathResource::create_relative(const std::string& relative_path) const {
    return std::make_shared<ClassPathResource>(
        path_utils::apply_relative_path(path_, relative_path), class_path_);
}

std::optional<std::string> ClassPathResource::filename() const {
    return path_utils::filename(path_);
}

std::string ClassPathResource::description() const {
    return "class path resource [" + path_ + "]";
}

ClassPathContextResource::ClassPathContextResource(const std::string& path, ClassPath class_path)
    : ClassPathResource(path, std::move(class_path)) {}

ResourcePtr ClassPathContextResource::create_relative(const std::string& relative_path) const {
    return std::make_shared<ClassPathContextResource>(
        path_utils::apply_relative_path(path(), relative_path), class_path());
}

} // namespace locus
