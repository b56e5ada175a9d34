#include "locus/path_utils.hpp"
#include <algorithm>
#include <deque>
#include <sstream>

namespace locus {
namespace path_utils {

std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream iss(path);
    std::string part;
    while (std::getline(iss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

std::string clean_path(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    std::string normalized = path;
    std::replace(normalized.begin(), normalized.end(), '\\', '/');

    // Keep a "prefix:" (e.g. "file:") out of the segment processing,
    // unless the colon belongs to a later segment
    std::string prefix;
    size_t colon_pos = normalized.find(':');
    if (colon_pos != std::string::npos && normalized.find('/') > colon_pos) {
        prefix = normalized.substr(0, colon_pos + 1);
        normalized = normalized.substr(colon_pos + 1);
    }

    bool absolute = !normalized.empty() && normalized[0] == '/';
    if (absolute) {
        prefix += '/';
        normalized = normalized.substr(1);
    }

    std::deque<std::string> kept;
    size_t pending_up = 0;
    auto parts = split_path(normalized);
    for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
        const std::string& part = *it;
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            ++pending_up;
        } else if (pending_up > 0) {
            --pending_up;
        } else {
            kept.push_front(part);
        }
    }
    for (size_t i = 0; i < pending_up; ++i) {
        kept.push_front("..");
    }

    std::string result = prefix;
    for (size_t i = 0; i < kept.size(); ++i) {
        if (i > 0) {
            result += '/';
        }
        result += kept[i];
    }
    return result;
}

std::string apply_relative_path(const std::string& path, const std::string& relative_path) {
    size_t separator = path.rfind('/');
    if (separator == std::string::npos) {
        return relative_path;
    }
    std::string new_path = path.substr(0, separator);
    if (relative_path.empty() || relative_path[0] != '/') {
        new_path += '/';
    }
    return new_path + relative_path;
}

std::optional<std::string> filename(const std::string& path) {
    if (path.empty()) {
        return std::nullopt;
    }
    size_t separator = path.rfind('/');
    if (separator == std::string::npos) {
        return path;
    }
    return path.substr(separator + 1);
}

std::string strip_leading_slash(const std::string& path) {
    if (!path.empty() && path[0] == '/') {
        return path.substr(1);
    }
    return path;
}

bool starts_with(const std::string& text, const std::string& prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

} // namespace path_utils
} // namespace locus
