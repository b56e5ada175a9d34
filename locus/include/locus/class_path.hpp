#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace locus {

// Ordered list of root directories searched for class path resources
// The first root containing a path wins.
class ClassPath {
public:
    ClassPath() = default;
    explicit ClassPath(std::vector<std::filesystem::path> roots);

    // Roots from LOCUS_CLASS_PATH (':'-separated), or the working directory if unset
    static ClassPath from_environment();

    // Parse a ':'-separated list of directories; empty entries are skipped
    static ClassPath parse(const std::string& list);

    // Find the first existing file or directory for path (relative to each root)
    std::optional<std::filesystem::path> find(const std::string& path) const;

    void add_root(std::filesystem::path root) { roots_.push_back(std::move(root)); }
    const std::vector<std::filesystem::path>& roots() const { return roots_; }
    bool empty() const { return roots_.empty(); }

    std::string to_string() const;

private:
    std::vector<std::filesystem::path> roots_;
};

} // namespace locus
