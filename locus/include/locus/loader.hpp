#pragma once

#include "locus/class_path.hpp"
#include "locus/protocol_resolver.hpp"
#include "locus/resource.hpp"
#include "locus/resources/url.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace locus {

// Turns location strings into resources
class ResourceLoader {
public:
    static constexpr const char* CLASSPATH_URL_PREFIX = "classpath:";

    virtual ~ResourceLoader() = default;

    // Resolve a location; never returns nullptr and performs no I/O
    // The caller queries or opens the returned resource
    virtual ResourcePtr get_resource(const std::string& location) = 0;

    // Class path used for "classpath:" and unqualified locations
    virtual const ClassPath& class_path() const = 0;
};

// Loader with a protocol resolver chain
//
// Resolution order for get_resource(location):
//   1. registered protocol resolvers, in registration order (first non-null wins)
//   2. "/path"           -> resource_by_path(location)
//   3. "classpath:path"  -> ClassPathResource
//   4. "scheme:rest"     -> UrlResource (file, http, https, ftp)
//   5. anything else, or an unusable URL -> resource_by_path(location)
//
// Resolvers can be added at any time from any thread; an added resolver is
// visible to every later get_resource() call. There is no removal.
class DefaultResourceLoader : public ResourceLoader {
public:
    // Class path from LOCUS_CLASS_PATH or the working directory
    DefaultResourceLoader();
    explicit DefaultResourceLoader(ClassPath class_path, UrlOptions url_options = {});
    ~DefaultResourceLoader() override;

    // Non-copyable, non-moveable
    DefaultResourceLoader(const DefaultResourceLoader&) = delete;
    DefaultResourceLoader& operator=(const DefaultResourceLoader&) = delete;
    DefaultResourceLoader(DefaultResourceLoader&&) = delete;
    DefaultResourceLoader& operator=(DefaultResourceLoader&&) = delete;

    ResourcePtr get_resource(const std::string& location) override;
    const ClassPath& class_path() const override { return class_path_; }
    const UrlOptions& url_options() const { return url_options_; }

    void add_protocol_resolver(ProtocolResolverPtr resolver);
    void add_protocol_resolver(FunctionProtocolResolver::Function fn);

    // Snapshot of the registered resolvers, in resolution order
    std::vector<ProtocolResolverPtr> protocol_resolvers() const;

protected:
    // Strategy for root-relative and unqualified paths
    // Default: a ClassPathContextResource
    virtual ResourcePtr resource_by_path(const std::string& path);

private:
    ClassPath class_path_;
    UrlOptions url_options_;

    std::vector<ProtocolResolverPtr> resolvers_;
    mutable std::mutex resolvers_mutex_;
};

} // namespace locus
