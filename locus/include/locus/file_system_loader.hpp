#pragma once

#include "locus/loader.hpp"

namespace locus {

// Loader resolving plain and root-relative paths against the working directory
// "/foo" and "foo" both give FileSystemContextResource("foo").
// "classpath:", URL locations and protocol resolvers behave as in DefaultResourceLoader.
class FileSystemResourceLoader : public DefaultResourceLoader {
public:
    using DefaultResourceLoader::DefaultResourceLoader;

protected:
    ResourcePtr resource_by_path(const std::string& path) override;
};

} // namespace locus
