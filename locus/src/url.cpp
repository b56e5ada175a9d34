#include "locus/url.hpp"
#include "locus/error.hpp"
#include "locus/path_utils.hpp"
#include <cctype>
#include <cstdio>

namespace locus {

namespace {

// Generic reference split (scheme optional), used by parse() and resolve()
struct ReferenceParts {
    std::optional<std::string> scheme;
    bool has_authority = false;
    std::string authority;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;
};

ReferenceParts split_reference(const std::string& str) {
    ReferenceParts parts;
    std::string remaining = str;

    if (Url::has_scheme(remaining)) {
        size_t colon_pos = remaining.find(':');
        parts.scheme = remaining.substr(0, colon_pos);
        remaining = remaining.substr(colon_pos + 1);
    }

    size_t hash_pos = remaining.find('#');
    if (hash_pos != std::string::npos) {
        parts.fragment = remaining.substr(hash_pos + 1);
        remaining = remaining.substr(0, hash_pos);
    }

    size_t query_pos = remaining.find('?');
    if (query_pos != std::string::npos) {
        parts.query = remaining.substr(query_pos + 1);
        remaining = remaining.substr(0, query_pos);
    }

    if (path_utils::starts_with(remaining, "//")) {
        size_t path_start = remaining.find('/', 2);
        parts.has_authority = true;
        if (path_start == std::string::npos) {
            parts.authority = remaining.substr(2);
            remaining.clear();
        } else {
            parts.authority = remaining.substr(2, path_start - 2);
            remaining = remaining.substr(path_start);
        }
    }

    parts.path = remaining;
    return parts;
}

bool is_unreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

bool is_reserved(unsigned char c) {
    switch (c) {
        case ':': case '/': case '?': case '#': case '[': case ']': case '@':
        case '!': case '$': case '&': case '\'': case '(': case ')':
        case '*': case '+': case ',': case ';': case '=':
            return true;
        default:
            return false;
    }
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_encode_path(const std::string& path) {
    std::string result;
    result.reserve(path.size());
    for (unsigned char c : path) {
        if (is_unreserved(c) || c == '/' || c == ':' || c == '@' || c == '!' || c == '$' ||
            c == '&' || c == '\'' || c == '(' || c == ')' || c == '*' || c == '+' ||
            c == ',' || c == ';' || c == '=') {
            result += static_cast<char>(c);
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            result += buf;
        }
    }
    return result;
}

} // anonymous namespace

bool Url::has_scheme(const std::string& str) {
    size_t colon_pos = str.find(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        return false;
    }

    if (!std::isalpha(static_cast<unsigned char>(str[0]))) {
        return false;
    }
    for (size_t i = 1; i < colon_pos; ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') {
            return false;
        }
    }

    // Handle Windows drive letters (C:/ etc.) - not a scheme
    if (colon_pos == 1 && str.length() > 2 && (str[2] == '/' || str[2] == '\\')) {
        return false;
    }
    return true;
}

Url Url::parse(const std::string& str) {
    if (!has_scheme(str)) {
        throw LocusError(ErrorCode::MalformedLocation, str, "no protocol");
    }

    ReferenceParts parts = split_reference(str);

    Url url;
    url.scheme_ = *parts.scheme;
    for (auto& c : url.scheme_) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    url.has_authority_ = parts.has_authority;
    url.authority_ = parts.authority;
    url.path_ = parts.path;
    url.query_ = parts.query;
    url.fragment_ = parts.fragment;
    return url;
}

Url Url::from_path(const std::filesystem::path& path) {
    std::string absolute = std::filesystem::absolute(path).generic_string();
    if (absolute.empty() || absolute[0] != '/') {
        absolute = "/" + absolute;
    }

    Url url;
    url.scheme_ = "file";
    url.path_ = percent_encode_path(absolute);
    return url;
}

std::string Url::host() const {
    std::string host = authority_;
    size_t at_pos = host.rfind('@');
    if (at_pos != std::string::npos) {
        host = host.substr(at_pos + 1);
    }
    if (!host.empty() && host[0] == '[') {
        size_t close = host.find(']');
        return close == std::string::npos ? host : host.substr(0, close + 1);
    }
    size_t port_pos = host.find(':');
    if (port_pos != std::string::npos) {
        host = host.substr(0, port_pos);
    }
    return host;
}

std::string Url::remove_dot_segments(const std::string& path) {
    std::string input = path;
    std::string output;

    auto pop_last_segment = [&output]() {
        size_t pos = output.rfind('/');
        if (pos == std::string::npos) {
            output.clear();
        } else {
            output.erase(pos);
        }
    };

    while (!input.empty()) {
        if (path_utils::starts_with(input, "../")) {
            input.erase(0, 3);
        } else if (path_utils::starts_with(input, "./")) {
            input.erase(0, 2);
        } else if (path_utils::starts_with(input, "/./")) {
            input.replace(0, 3, "/");
        } else if (input == "/.") {
            input = "/";
        } else if (path_utils::starts_with(input, "/../")) {
            input.replace(0, 4, "/");
            pop_last_segment();
        } else if (input == "/..") {
            input = "/";
            pop_last_segment();
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            size_t start = input[0] == '/' ? 1 : 0;
            size_t next = input.find('/', start);
            std::string segment = input.substr(0, next);
            output += segment;
            input.erase(0, segment.size());
        }
    }
    return output;
}

std::string Url::merge(const std::string& reference_path) const {
    if (has_authority_ && path_.empty()) {
        return "/" + reference_path;
    }
    size_t separator = path_.rfind('/');
    if (separator == std::string::npos) {
        return reference_path;
    }
    return path_.substr(0, separator + 1) + reference_path;
}

Url Url::resolve(const std::string& reference) const {
    ReferenceParts ref = split_reference(reference);

    Url target;
    if (ref.scheme) {
        target = parse(reference);
        target.path_ = remove_dot_segments(target.path_);
        return target;
    }

    target.scheme_ = scheme_;
    if (ref.has_authority) {
        target.has_authority_ = true;
        target.authority_ = ref.authority;
        target.path_ = remove_dot_segments(ref.path);
        target.query_ = ref.query;
    } else {
        target.has_authority_ = has_authority_;
        target.authority_ = authority_;
        if (ref.path.empty()) {
            target.path_ = path_;
            target.query_ = ref.query ? ref.query : query_;
        } else {
            if (ref.path[0] == '/') {
                target.path_ = remove_dot_segments(ref.path);
            } else {
                target.path_ = remove_dot_segments(merge(ref.path));
            }
            target.query_ = ref.query;
        }
    }
    target.fragment_ = ref.fragment;
    return target;
}

std::filesystem::path Url::file_path() const {
    if (scheme_ != "file") {
        throw LocusError(ErrorCode::Unresolvable, to_string(),
            "URL cannot be resolved to absolute file path because it does not reside in the file system");
    }
    return std::filesystem::path(percent_decode(path_));
}

std::string Url::to_uri() const {
    std::string str = to_string();
    std::string encoded;
    encoded.reserve(str.size());

    for (size_t i = 0; i < str.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(str[i]);
        if (c == ' ') {
            encoded += "%20";
        } else if (c == '%') {
            if (i + 2 >= str.size() || hex_value(str[i + 1]) < 0 || hex_value(str[i + 2]) < 0) {
                throw LocusError(ErrorCode::MalformedLocation, str,
                    "Invalid URI [" + str + "]: malformed escape at index " + std::to_string(i));
            }
            encoded += str.substr(i, 3);
            i += 2;
        } else if (is_unreserved(c) || is_reserved(c) || c >= 0x80) {
            encoded += static_cast<char>(c);
        } else {
            throw LocusError(ErrorCode::MalformedLocation, str,
                "Invalid URI [" + str + "]: illegal character at index " + std::to_string(i));
        }
    }
    return encoded;
}

std::string Url::to_string() const {
    std::string result = scheme_ + ":";
    if (has_authority_) {
        result += "//" + authority_;
    }
    result += path_;
    if (query_) {
        result += "?" + *query_;
    }
    if (fragment_) {
        result += "#" + *fragment_;
    }
    return result;
}

std::string percent_decode(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            int high = hex_value(text[i + 1]);
            int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                result += static_cast<char>(high * 16 + low);
                i += 2;
                continue;
            }
        }
        result += text[i];
    }
    return result;
}

} // namespace locus
