#include "locus/loader.hpp"
#include "locus/error.hpp"
#include "locus/log.hpp"
#include "locus/path_utils.hpp"
#include "locus/resources/class_path.hpp"

namespace locus {

DefaultResourceLoader::DefaultResourceLoader()
    : DefaultResourceLoader(ClassPath::from_environment()) {}

DefaultResourceLoader::DefaultResourceLoader(ClassPath class_path, UrlOptions url_options)
    : class_path_(std::move(class_path))
    , url_options_(std::move(url_options)) {}

DefaultResourceLoader::~DefaultResourceLoader() = default;

void DefaultResourceLoader::add_protocol_resolver(ProtocolResolverPtr resolver) {
    if (!resolver) {
        throw LocusError(ErrorCode::ConfigError, "ProtocolResolver must not be null");
    }
    std::lock_guard<std::mutex> lock(resolvers_mutex_);
    resolvers_.push_back(std::move(resolver));
}

void DefaultResourceLoader::add_protocol_resolver(FunctionProtocolResolver::Function fn) {
    add_protocol_resolver(std::make_shared<FunctionProtocolResolver>(std::move(fn)));
}

std::vector<ProtocolResolverPtr> DefaultResourceLoader::protocol_resolvers() const {
    std::lock_guard<std::mutex> lock(resolvers_mutex_);
    return resolvers_;
}

ResourcePtr DefaultResourceLoader::get_resource(const std::string& location) {
    // Iterate a snapshot: resolvers may call back into this loader
    for (const auto& resolver : protocol_resolvers()) {
        ResourcePtr resource = resolver->resolve(location, *this);
        if (resource) {
            return resource;
        }
    }

    if (path_utils::starts_with(location, "/")) {
        return resource_by_path(location);
    }

    if (path_utils::starts_with(location, CLASSPATH_URL_PREFIX)) {
        std::string path = location.substr(std::string(CLASSPATH_URL_PREFIX).size());
        return std::make_shared<ClassPathResource>(path, class_path_);
    }

    try {
        return std::make_shared<UrlResource>(Url::parse(location), url_options_);
    } catch (const LocusError& e) {
        if (e.code() != ErrorCode::MalformedLocation) {
            throw;
        }
        // No URL -> resolve as resource path
        LOG_VERBOSE("not a URL, resolving as path: " << location << " (" << e.message() << ")");
    }
    return resource_by_path(location);
}

ResourcePtr DefaultResourceLoader::resource_by_path(const std::string& path) {
    return std::make_shared<ClassPathContextResource>(path, class_path_);
}

} // namespace locus
