#pragma once

#include "locus/abstract_resource.hpp"
#include "locus/class_path.hpp"
#include "locus/context_resource.hpp"

namespace locus {

// Resource looked up relative to the roots of a ClassPath
// The path is cleaned and one leading '/' is removed: all paths are class path relative.
class ClassPathResource : public AbstractResource {
public:
    ClassPathResource(const std::string& path, ClassPath class_path);

    const std::string& path() const { return path_; }
    const ClassPath& class_path() const { return class_path_; }

    std::unique_ptr<std::istream> open_stream() const override;
    bool exists() const override;
    bool readable() const override;
    bool is_file() const override;
    Url get_url() const override;
    std::filesystem::path get_file() const override;
    std::uint64_t content_length() const override;
    ResourcePtr create_relative(const std::string& relative_path) const override;
    std::optional<std::string> filename() const override;
    std::string description() const override;

protected:
    // File under the first class path root containing path(), if any
    std::optional<std::filesystem::path> resolve_file() const;

private:
    std::string path_;
    ClassPath class_path_;
};

// Class path resource handed out for unqualified locations by DefaultResourceLoader
class ClassPathContextResource : public ClassPathResource, public ContextResource {
public:
    ClassPathContextResource(const std::string& path, ClassPath class_path);

    std::string path_within_context() const override { return path(); }
    ResourcePtr create_relative(const std::string& relative_path) const override;
};

} // namespace locus
