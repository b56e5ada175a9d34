#pragma once

#include "locus/abstract_resource.hpp"
#include <cstddef>
#include <mutex>
#include <vector>

namespace locus {

// Resource wrapping an already-open stream
// The stream can be taken exactly once; a second open_stream() throws IOError.
// Do not share across concurrent readers.
// Equal only to a resource wrapping the same stream object.
class InputStreamResource : public AbstractResource {
public:
    explicit InputStreamResource(std::unique_ptr<std::istream> stream,
                                 std::string description = "resource loaded through InputStream");

    std::unique_ptr<std::istream> open_stream() const override;
    bool exists() const override { return true; }
    bool is_open() const override { return true; }
    std::string description() const override;
    bool equals(const Resource& other) const override;
    std::size_t hash() const override;

private:
    mutable std::mutex mutex_;
    mutable std::unique_ptr<std::istream> stream_;
    mutable bool read_;
    const std::istream* identity_;  // survives handing out the stream
    std::string description_;
};

// In-memory content; every open_stream() reads the same bytes
// Equality and hash follow the bytes, not the description.
class ByteArrayResource : public AbstractResource {
public:
    explicit ByteArrayResource(std::vector<std::byte> data,
                               std::string description = "resource loaded from byte array");
    explicit ByteArrayResource(const std::string& data,
                               std::string description = "resource loaded from byte array");

    const std::vector<std::byte>& data() const { return data_; }

    std::unique_ptr<std::istream> open_stream() const override;
    bool exists() const override { return true; }
    std::uint64_t content_length() const override { return data_.size(); }
    std::string description() const override;
    bool equals(const Resource& other) const override;
    std::size_t hash() const override;

private:
    std::vector<std::byte> data_;
    std::string description_;
};

} // namespace locus
