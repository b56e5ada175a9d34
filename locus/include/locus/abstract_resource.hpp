#pragma once

#include "locus/resource.hpp"

namespace locus {

// Base for concrete resources
// Provides the fallback chain for everything except open_stream() and description():
//   exists()         -> get_file() exists; else a stream can be opened
//   readable()       -> exists()
//   get_url/get_file -> Unresolvable
//   get_uri()        -> get_url().to_uri()
//   content_length() -> bytes counted by reading the stream in 256-byte chunks
//   last_modified()  -> timestamp of file_for_last_modified_check()
//   create_relative  -> Unresolvable
//   equals/hash      -> description()
class AbstractResource : public Resource {
public:
    bool exists() const override;
    bool readable() const override;
    bool is_open() const override { return false; }
    bool is_file() const override { return false; }
    Url get_url() const override;
    std::string get_uri() const override;
    std::filesystem::path get_file() const override;
    std::uint64_t content_length() const override;
    std::int64_t last_modified() const override;
    ResourcePtr create_relative(const std::string& relative_path) const override;
    std::optional<std::string> filename() const override { return std::nullopt; }
    bool equals(const Resource& other) const override;
    std::size_t hash() const override;

protected:
    // File whose timestamp last_modified() reports (default: get_file())
    virtual std::filesystem::path file_for_last_modified_check() const;
};

// Modification time of path in milliseconds since the epoch, 0 if unavailable
std::int64_t file_last_modified_millis(const std::filesystem::path& path);

} // namespace locus
