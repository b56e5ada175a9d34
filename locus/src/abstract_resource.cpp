#include "locus/abstract_resource.hpp"
#include "locus/error.hpp"
#include "locus/log.hpp"
#include <chrono>

namespace locus {

bool AbstractResource::exists() const {
    // Try file existence first
    try {
        std::error_code ec;
        return std::filesystem::exists(get_file(), ec);
    } catch (const LocusError&) {
        // Fall back to stream existence: can we open the stream?
    }

    // Failures here only mean "absent"; the stream is released on scope exit
    try {
        auto stream = open_stream();
        return stream != nullptr;
    } catch (const std::exception& e) {
        LOG_VERBOSE("exists() stream check failed for " << description() << ": " << e.what());
        return false;
    } catch (...) {
        LOG_VERBOSE("exists() stream check failed for " << description() << ": unknown exception");
        return false;
    }
}

bool AbstractResource::readable() const {
    return exists();
}

Url AbstractResource::get_url() const {
    throw LocusError(ErrorCode::Unresolvable, description(),
        description() + " cannot be resolved to URL");
}

std::string AbstractResource::get_uri() const {
    Url url = get_url();
    return url.to_uri();
}

std::filesystem::path AbstractResource::get_file() const {
    throw LocusError(ErrorCode::Unresolvable, description(),
        description() + " cannot be resolved to absolute file path");
}

std::uint64_t AbstractResource::content_length() const {
    std::unique_ptr<std::istream> stream = open_stream();

    std::uint64_t size = 0;
    char buf[256];
    while (stream->read(buf, sizeof(buf)) || stream->gcount() > 0) {
        size += static_cast<std::uint64_t>(stream->gcount());
    }
    if (stream->bad()) {
        throw LocusError(ErrorCode::IOError, description(), "Failed to read stream for content length");
    }
    return size;
}

std::int64_t AbstractResource::last_modified() const {
    std::filesystem::path file_to_check = file_for_last_modified_check();
    std::int64_t last_modified = file_last_modified_millis(file_to_check);
    std::error_code ec;
    if (last_modified == 0 && !std::filesystem::exists(file_to_check, ec)) {
        throw LocusError(ErrorCode::NotFound, description(),
            description() + " cannot be resolved in the file system for checking its last-modified timestamp");
    }
    return last_modified;
}

std::filesystem::path AbstractResource::file_for_last_modified_check() const {
    return get_file();
}

ResourcePtr AbstractResource::create_relative(const std::string& relative_path) const {
    throw LocusError(ErrorCode::Unresolvable, relative_path,
        "Cannot create a relative resource for " + description());
}

bool AbstractResource::equals(const Resource& other) const {
    return this == &other || other.description() == description();
}

std::size_t AbstractResource::hash() const {
    return std::hash<std::string>{}(description());
}

std::int64_t file_last_modified_millis(const std::filesystem::path& path) {
    std::error_code ec;
    auto file_time = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return 0;
    }

    // file_time_type has no portable epoch in C++17: shift through now()
    auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        file_time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        system_time.time_since_epoch()).count();
}

} // namespace locus
