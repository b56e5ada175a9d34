#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace locus {

// URL used by URL-backed and VFS resources
// Supports:
//   - Hierarchical form: "http://host:8080/dir/file.txt?x=1#top"
//   - Opaque/path form:  "file:/abs/path", "file:relative/path", "vfs:/archive/entry"
//
// Parsing is syntactic only; whether a scheme is supported is decided by the
// resource that consumes the URL (see UrlResource).
class Url {
public:
    Url() = default;

    // Parse a string into URL
    // Throws LocusError(MalformedLocation) if there is no valid "scheme:" prefix
    static Url parse(const std::string& str);

    // Build a "file:" URL for a filesystem path (made absolute, percent-encoded)
    static Url from_path(const std::filesystem::path& path);

    // Check whether str starts with a syntactically valid "scheme:" prefix
    // Windows drive letters ("C:/", "C:\") are not schemes
    static bool has_scheme(const std::string& str);

    const std::string& scheme() const { return scheme_; }
    bool has_authority() const { return has_authority_; }
    const std::string& authority() const { return authority_; }
    const std::string& path() const { return path_; }
    const std::optional<std::string>& query() const { return query_; }
    const std::optional<std::string>& fragment() const { return fragment_; }

    // Host part of the authority (no userinfo, no port)
    std::string host() const;

    // Resolve a reference against this URL (RFC 3986 section 5.2)
    //   "http://h/a/b.txt" + "c.txt"   -> "http://h/a/c.txt"
    //   "http://h/a/b.txt" + "../c"    -> "http://h/c"
    //   "http://h/a/b.txt" + "ftp://x" -> "ftp://x"
    Url resolve(const std::string& reference) const;

    // Percent-decoded local path for "file:" URLs
    // Throws LocusError(Unresolvable) for any other scheme
    std::filesystem::path file_path() const;

    // Validate as a URI, encoding spaces as %20
    // Throws LocusError(MalformedLocation) "Invalid URI [..]" on illegal characters
    std::string to_uri() const;

    std::string to_string() const;

    bool empty() const { return scheme_.empty(); }

    bool operator==(const Url& other) const { return to_string() == other.to_string(); }
    bool operator!=(const Url& other) const { return !(*this == other); }

private:
    static std::string remove_dot_segments(const std::string& path);
    std::string merge(const std::string& reference_path) const;

    std::string scheme_;
    bool has_authority_ = false;
    std::string authority_;
    std::string path_;
    std::optional<std::string> query_;
    std::optional<std::string> fragment_;
};

// Percent-decode "%XX" escapes (invalid escapes are kept verbatim)
std::string percent_decode(const std::string& text);

} // namespace locus
