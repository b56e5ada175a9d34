#pragma once

#include "locus/url.hpp"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>

namespace locus {

class Resource;
using ResourcePtr = std::shared_ptr<Resource>;

// Descriptor of addressable content (a file, a class path entry, a URL, a VFS node)
// Resources are immutable and constructed without I/O; every query below
// touches the backing store when it is called.
//
// Shared fallback behaviour lives in AbstractResource; implement against that
// rather than this interface directly.
class Resource {
public:
    virtual ~Resource() = default;

    // Open a fresh stream over the content
    // Throws LocusError(NotFound) if the content is absent, LocusError(IOError) on failure
    // The caller owns the stream; it is closed when the pointer is released
    virtual std::unique_ptr<std::istream> open_stream() const = 0;

    // Whether the content is currently present
    virtual bool exists() const = 0;

    // Whether a stream can likely be opened (never true for absent content)
    virtual bool readable() const = 0;

    // Whether this handle wraps an already-open, single-use stream
    virtual bool is_open() const = 0;

    // Whether the content maps to a path in the real filesystem
    virtual bool is_file() const = 0;

    // Throws LocusError(Unresolvable) if not URL-addressable
    virtual Url get_url() const = 0;

    // Throws LocusError(MalformedLocation) if the URL is not a valid URI
    virtual std::string get_uri() const = 0;

    // Throws LocusError(Unresolvable) if not backed by the filesystem
    virtual std::filesystem::path get_file() const = 0;

    // Content length in bytes
    virtual std::uint64_t content_length() const = 0;

    // Last-modified timestamp in milliseconds since the epoch
    // Throws LocusError(NotFound) if the backing file is absent
    virtual std::int64_t last_modified() const = 0;

    // Resource for a path relative to this one
    // Throws LocusError(Unresolvable) if this kind of resource has no path concept
    virtual ResourcePtr create_relative(const std::string& relative_path) const = 0;

    // Last path segment, or nullopt if the backing store has no path concept
    virtual std::optional<std::string> filename() const = 0;

    // Human-readable identity, used for equality, hashing and diagnostics
    virtual std::string description() const = 0;

    virtual bool equals(const Resource& other) const = 0;
    virtual std::size_t hash() const = 0;

    std::string to_string() const { return description(); }
};

inline bool operator==(const Resource& a, const Resource& b) { return a.equals(b); }
inline bool operator!=(const Resource& a, const Resource& b) { return !a.equals(b); }

inline std::ostream& operator<<(std::ostream& os, const Resource& resource) {
    return os << resource.description();
}

} // namespace locus

namespace std {

template <>
struct hash<locus::Resource> {
    size_t operator()(const locus::Resource& resource) const { return resource.hash(); }
};

} // namespace std
