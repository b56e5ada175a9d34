#include "locus/file_system_loader.hpp"
#include "locus/path_utils.hpp"
#include "locus/resources/file_system.hpp"

namespace locus {

ResourcePtr FileSystemResourceLoader::resource_by_path(const std::string& path) {
    return std::make_shared<FileSystemContextResource>(path_utils::strip_leading_slash(path));
}

} // namespace locus
