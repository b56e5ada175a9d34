#include "locus/class_path.hpp"
#include "locus/log.hpp"
#include <cstdlib>
#include <sstream>

namespace locus {

ClassPath::ClassPath(std::vector<std::filesystem::path> roots)
    : roots_(std::move(roots)) {}

ClassPath ClassPath::from_environment() {
    const char* env = std::getenv("LOCUS_CLASS_PATH");
    if (env != nullptr && env[0] != '\0') {
        return parse(env);
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        LOG_WARN("Cannot determine working directory for default class path: " << ec.message());
        return ClassPath();
    }
    return ClassPath({cwd});
}

ClassPath ClassPath::parse(const std::string& list) {
    std::vector<std::filesystem::path> roots;
    std::istringstream iss(list);
    std::string entry;
    while (std::getline(iss, entry, ':')) {
        if (!entry.empty()) {
            roots.emplace_back(entry);
        }
    }
    return ClassPath(std::move(roots));
}

std::optional<std::filesystem::path> ClassPath::find(const std::string& path) const {
    for (const auto& root : roots_) {
        auto candidate = path.empty() ? root : root / path;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec)) {
            LOG_VERBOSE("class path hit: " << path << " -> " << candidate.string());
            return candidate;
        }
    }
    return std::nullopt;
}

std::string ClassPath::to_string() const {
    std::string result;
    for (size_t i = 0; i < roots_.size(); ++i) {
        if (i > 0) {
            result += ':';
        }
        result += roots_[i].string();
    }
    return result;
}

} // namespace locus
