#include "locus/protocol_resolver.hpp"
#include "locus/error.hpp"
#include "locus/loader.hpp"
#include "locus/log.hpp"
#include "locus/path_utils.hpp"
#include <utility>
#include <vector>

namespace locus {

namespace {

// Nested rewrites beyond this depth are treated as a cycle
constexpr size_t MAX_REWRITE_DEPTH = 32;

// Rewrites in progress on this thread, innermost last
thread_local std::vector<std::pair<const PrefixProtocolResolver*, std::string>> g_active_rewrites;

class RewriteScope {
public:
    RewriteScope(const PrefixProtocolResolver* resolver, const std::string& location) {
        g_active_rewrites.emplace_back(resolver, location);
    }
    ~RewriteScope() { g_active_rewrites.pop_back(); }

    RewriteScope(const RewriteScope&) = delete;
    RewriteScope& operator=(const RewriteScope&) = delete;
};

} // anonymous namespace

PrefixProtocolResolver::PrefixProtocolResolver(std::string prefix, std::string target)
    : prefix_(std::move(prefix))
    , target_(std::move(target)) {
    if (prefix_.empty()) {
        throw LocusError(ErrorCode::ConfigError, "Protocol resolver prefix must not be empty");
    }
    if (path_utils::starts_with(target_, prefix_)) {
        throw LocusError(ErrorCode::ConfigError, prefix_,
            "Protocol resolver target '" + target_ + "' would resolve back to itself");
    }
}

ResourcePtr PrefixProtocolResolver::resolve(const std::string& location, ResourceLoader& loader) {
    if (!path_utils::starts_with(location, prefix_)) {
        return nullptr;
    }
    for (const auto& active : g_active_rewrites) {
        if (active.first == this && active.second == location) {
            throw LocusError(ErrorCode::ConfigError, location,
                "Protocol resolver cycle: '" + prefix_ + "' reached " + location + " again");
        }
    }
    if (g_active_rewrites.size() >= MAX_REWRITE_DEPTH) {
        throw LocusError(ErrorCode::ConfigError, location,
            "Protocol resolver rewrites nested deeper than " + std::to_string(MAX_REWRITE_DEPTH));
    }

    std::string rewritten = target_ + location.substr(prefix_.size());
    LOG_VERBOSE("rewrite " << location << " -> " << rewritten);

    RewriteScope scope(this, location);
    return loader.get_resource(rewritten);
}

} // namespace locus
