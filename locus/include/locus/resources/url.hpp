#pragma once

#include "locus/abstract_resource.hpp"
#include <set>

namespace locus {

// Transfer options for remote URLs (http, https, ftp)
struct UrlOptions {
    long connect_timeout_ms = 5000;
    long timeout_ms = 30000;          // 0 = no limit
    std::string user_agent = "locus";
    bool follow_redirects = true;
};

// Resource addressed by a URL
// "file:" URLs are answered from the local filesystem; http, https and ftp
// go through libcurl. Each query is a separate blocking request (no caching).
class UrlResource : public AbstractResource {
public:
    // Throws LocusError(MalformedLocation) for unsupported protocols
    explicit UrlResource(Url url, UrlOptions options = {});
    explicit UrlResource(const std::string& url, UrlOptions options = {});

    static const std::set<std::string>& supported_schemes();
    static bool is_supported_scheme(const std::string& scheme);

    const UrlOptions& options() const { return options_; }

    std::unique_ptr<std::istream> open_stream() const override;
    bool exists() const override;
    bool readable() const override;
    bool is_file() const override { return is_file_url(); }
    Url get_url() const override { return url_; }
    std::filesystem::path get_file() const override;
    std::uint64_t content_length() const override;
    std::int64_t last_modified() const override;
    ResourcePtr create_relative(const std::string& relative_path) const override;
    std::optional<std::string> filename() const override;
    std::string description() const override;

private:
    // Result of a HEAD-style request (no body transferred)
    struct RemoteInfo {
        bool reachable = false;
        long status = 0;
        std::int64_t length = -1;
        std::int64_t filetime = -1;
        std::string error;
    };

    bool is_file_url() const { return url_.scheme() == "file"; }
    bool is_http() const { return url_.scheme() == "http" || url_.scheme() == "https"; }
    RemoteInfo query_remote() const;
    std::string download() const;

    Url url_;
    UrlOptions options_;
};

} // namespace locus
