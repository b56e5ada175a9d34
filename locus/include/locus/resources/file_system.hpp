#pragma once

#include "locus/abstract_resource.hpp"
#include "locus/context_resource.hpp"
#include <filesystem>

namespace locus {

// Resource backed by a path in the local filesystem
// Relative paths are interpreted against the process working directory.
class FileSystemResource : public AbstractResource {
public:
    explicit FileSystemResource(const std::string& path);

    // Cleaned path as given (may be relative)
    const std::string& path() const { return path_; }

    std::unique_ptr<std::istream> open_stream() const override;
    bool exists() const override;
    bool readable() const override;
    bool is_file() const override { return true; }
    Url get_url() const override;
    std::filesystem::path get_file() const override { return file_; }
    std::uint64_t content_length() const override;
    ResourcePtr create_relative(const std::string& relative_path) const override;
    std::optional<std::string> filename() const override;
    std::string description() const override;

private:
    std::string path_;
    std::filesystem::path file_;
};

// Filesystem resource that also reports its path within the loader's context
class FileSystemContextResource : public FileSystemResource, public ContextResource {
public:
    explicit FileSystemContextResource(const std::string& path);

    std::string path_within_context() const override { return path(); }
};

} // namespace locus
