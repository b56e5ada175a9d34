#pragma once

#include "locus/resource.hpp"
#include <functional>
#include <memory>
#include <string>

namespace locus {

class ResourceLoader;

// Resolution strategy for location strings, registered on a DefaultResourceLoader
// Return nullptr when the location is not handled: the next resolver (or the
// loader's default strategy) is tried.
class ProtocolResolver {
public:
    virtual ~ProtocolResolver() = default;

    virtual ResourcePtr resolve(const std::string& location, ResourceLoader& loader) = 0;
};

using ProtocolResolverPtr = std::shared_ptr<ProtocolResolver>;

// Rewrites a location prefix and resolves the result through the same loader
//   PrefixProtocolResolver("cloud:", "classpath:"): "cloud:a.txt" -> get_resource("classpath:a.txt")
class PrefixProtocolResolver : public ProtocolResolver {
public:
    PrefixProtocolResolver(std::string prefix, std::string target);

    ResourcePtr resolve(const std::string& location, ResourceLoader& loader) override;

    const std::string& prefix() const { return prefix_; }
    const std::string& target() const { return target_; }

private:
    std::string prefix_;
    std::string target_;
};

// Adapts a callable to ProtocolResolver
class FunctionProtocolResolver : public ProtocolResolver {
public:
    using Function = std::function<ResourcePtr(const std::string&, ResourceLoader&)>;

    explicit FunctionProtocolResolver(Function fn) : fn_(std::move(fn)) {}

    ResourcePtr resolve(const std::string& location, ResourceLoader& loader) override {
        return fn_(location, loader);
    }

private:
    Function fn_;
};

} // namespace locus
