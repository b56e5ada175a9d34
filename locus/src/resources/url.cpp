#include "locus/resources/url.hpp"
#include "locus/error.hpp"
#include "locus/log.hpp"
#include "locus/path_utils.hpp"
#include <curl/curl.h>
#include <fstream>
#include <mutex>
#include <sstream>

namespace locus {

namespace {

// curl_global_init is not thread-safe; run it once before the first handle
void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, []() {
        CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (res != CURLE_OK) {
            LOG_ERROR("curl_global_init failed: " << curl_easy_strerror(res));
        }
    });
}

// CURL write callback for string data
size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    std::string* str = static_cast<std::string*>(userp);
    str->append(static_cast<char*>(contents), total_size);
    return total_size;
}

// RAII wrapper for CURL handle
class CurlHandle {
public:
    CurlHandle() {
        ensure_curl_initialized();
        curl_ = curl_easy_init();
        if (!curl_) {
            throw LocusError(ErrorCode::IOError, "Failed to initialize CURL");
        }
    }
    ~CurlHandle() {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
    }
    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    CURL* get() { return curl_; }
    operator CURL*() { return curl_; }

private:
    CURL* curl_ = nullptr;
};

void apply_options(CurlHandle& curl, const std::string& url, const UrlOptions& options) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, options.connect_timeout_ms);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, options.user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
}

bool is_missing_status(long status) {
    return status == 404 || status == 410;
}

} // anonymous namespace

UrlResource::UrlResource(Url url, UrlOptions options)
    : url_(std::move(url))
    , options_(std::move(options)) {
    if (!is_supported_scheme(url_.scheme())) {
        throw LocusError(ErrorCode::MalformedLocation, url_.to_string(),
            "unknown protocol: " + url_.scheme());
    }
}

UrlResource::UrlResource(const std::string& url, UrlOptions options)
    : UrlResource(Url::parse(url), std::move(options)) {}

const std::set<std::string>& UrlResource::supported_schemes() {
    static const std::set<std::string> schemes = {"file", "http", "https", "ftp"};
    return schemes;
}

bool UrlResource::is_supported_scheme(const std::string& scheme) {
    return supported_schemes().count(scheme) > 0;
}

UrlResource::RemoteInfo UrlResource::query_remote() const {
    RemoteInfo info;
    std::string url = url_.to_string();

    LOG_VERBOSE("HEAD " << url);

    CurlHandle curl;
    apply_options(curl, url, options_);
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl, CURLOPT_FILETIME, 1L);

    // Suppress output
    std::string dummy;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &dummy);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        info.error = curl_easy_strerror(res);
        if (res == CURLE_REMOTE_FILE_NOT_FOUND) {
            info.status = 404;
        }
        return info;
    }

    info.reachable = true;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &info.status);

    curl_off_t length = -1;
    if (curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length) == CURLE_OK) {
        info.length = static_cast<std::int64_t>(length);
    }
    curl_off_t filetime = -1;
    if (curl_easy_getinfo(curl, CURLINFO_FILETIME_T, &filetime) == CURLE_OK) {
        info.filetime = static_cast<std::int64_t>(filetime);
    }
    return info;
}

std::string UrlResource::download() const {
    std::string buffer;
    std::string url = url_.to_string();

    LOG_VERBOSE("GET " << url);

    CurlHandle curl;
    apply_options(curl, url, options_);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_string_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_REMOTE_FILE_NOT_FOUND) {
        throw LocusError(ErrorCode::NotFound, url, description() + " cannot be opened because it does not exist");
    }
    if (res != CURLE_OK) {
        LOG_WARN("download failed for " << url << ": " << curl_easy_strerror(res));
        throw LocusError(ErrorCode::IOError, url,
            std::string("Download failed: ") + curl_easy_strerror(res));
    }

    if (is_http()) {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (is_missing_status(status)) {
            throw LocusError(ErrorCode::NotFound, url,
                description() + " cannot be opened because it does not exist (HTTP " + std::to_string(status) + ")");
        }
        if (status >= 400) {
            throw LocusError(ErrorCode::IOError, url, "HTTP request failed with status " + std::to_string(status));
        }
    }

    LOG_VERBOSE("downloaded " << buffer.size() << " bytes");
    return buffer;
}

std::unique_ptr<std::istream> UrlResource::open_stream() const {
    if (is_file_url()) {
        auto file = get_file();
        std::error_code ec;
        if (!std::filesystem::exists(file, ec)) {
            throw LocusError(ErrorCode::NotFound, url_.to_string(),
                description() + " cannot be opened because it does not exist");
        }
        auto stream = std::make_unique<std::ifstream>(file, std::ios::binary);
        if (!*stream) {
            throw LocusError(ErrorCode::IOError, url_.to_string(), "Failed to open file for reading");
        }
        return stream;
    }
    return std::make_unique<std::istringstream>(download(), std::ios::binary);
}

bool UrlResource::exists() const {
    if (is_file_url()) {
        std::error_code ec;
        return std::filesystem::exists(get_file(), ec);
    }

    RemoteInfo info = query_remote();
    if (!info.reachable) {
        LOG_VERBOSE("exists() unreachable " << url_.to_string() << ": " << info.error);
        return false;
    }
    return !is_http() || info.status < 400;
}

bool UrlResource::readable() const {
    if (is_file_url()) {
        std::error_code ec;
        auto file = get_file();
        return std::filesystem::is_regular_file(file, ec);
    }
    return exists();
}

std::filesystem::path UrlResource::get_file() const {
    return url_.file_path();
}

std::uint64_t UrlResource::content_length() const {
    if (is_file_url()) {
        std::error_code ec;
        auto size = std::filesystem::file_size(get_file(), ec);
        if (ec) {
            throw LocusError(ErrorCode::NotFound, url_.to_string(),
                description() + " cannot be resolved in the file system for checking its content length");
        }
        return static_cast<std::uint64_t>(size);
    }

    RemoteInfo info = query_remote();
    if (!info.reachable || (is_http() && is_missing_status(info.status))) {
        throw LocusError(ErrorCode::NotFound, url_.to_string(),
            description() + " cannot be reached for checking its content length: " +
            (info.error.empty() ? "HTTP " + std::to_string(info.status) : info.error));
    }
    if (info.length >= 0) {
        return static_cast<std::uint64_t>(info.length);
    }

    // Server did not report a length: count the bytes
    return AbstractResource::content_length();
}

std::int64_t UrlResource::last_modified() const {
    if (is_file_url()) {
        return AbstractResource::last_modified();
    }

    RemoteInfo info = query_remote();
    if (!info.reachable || (is_http() && is_missing_status(info.status))) {
        throw LocusError(ErrorCode::NotFound, url_.to_string(),
            description() + " cannot be reached for checking its last-modified timestamp: " +
            (info.error.empty() ? "HTTP " + std::to_string(info.status) : info.error));
    }
    return info.filetime > 0 ? info.filetime * 1000 : 0;
}

ResourcePtr UrlResource::create_relative(const std::string& relative_path) const {
    return std::make_shared<UrlResource>(
        url_.resolve(path_utils::strip_leading_slash(relative_path)), options_);
}

std::optional<std::string> UrlResource::filename() const {
    if (url_.path().empty()) {
        return std::nullopt;
    }
    return path_utils::filename(percent_decode(url_.path()));
}

std::string UrlResource::description() const {
    return "URL [" + url_.to_string() + "]";
}

} // namespace locus
