#pragma once

#include "locus/abstract_resource.hpp"
#include <cstdint>
#include <memory>

namespace locus {

// Opaque node handle owned by an external virtual-filesystem provider
using VfsHandle = std::shared_ptr<const void>;

// The whole contract required from a virtual-filesystem provider
// Implementations may throw any std::exception; VfsResource wraps those into
// LocusError(AdapterFailure) and keeps the original as the cause.
class VfsAdapter {
public:
    virtual ~VfsAdapter() = default;

    virtual std::unique_ptr<std::istream> open_stream(const VfsHandle& handle) const = 0;
    virtual bool exists(const VfsHandle& handle) const = 0;
    virtual bool readable(const VfsHandle& handle) const = 0;
    virtual std::string url(const VfsHandle& handle) const = 0;
    virtual std::string uri(const VfsHandle& handle) const = 0;
    virtual std::filesystem::path file(const VfsHandle& handle) const = 0;
    virtual std::uint64_t size(const VfsHandle& handle) const = 0;
    virtual std::int64_t last_modified(const VfsHandle& handle) const = 0;

    // Direct child lookup; throws if no such child
    virtual VfsHandle child(const VfsHandle& handle, const std::string& path) const = 0;

    // Node addressed by a URL; throws if none
    virtual VfsHandle relative(const std::string& url) const = 0;

    virtual std::string name(const VfsHandle& handle) const = 0;

    // Native handle identity
    virtual bool equal(const VfsHandle& a, const VfsHandle& b) const = 0;
    virtual std::size_t hash(const VfsHandle& handle) const = 0;
    virtual std::string describe(const VfsHandle& handle) const = 0;
};

// Resource delegating every operation to a VfsAdapter
// Equality follows the adapter's handle equality, not the description; resources
// from adapters of different types are never equal.
class VfsResource : public AbstractResource {
public:
    // Throws LocusError(AdapterFailure) if handle or adapter is null
    VfsResource(VfsHandle handle, std::shared_ptr<const VfsAdapter> adapter);

    const VfsHandle& handle() const { return handle_; }
    const std::shared_ptr<const VfsAdapter>& adapter() const { return adapter_; }

    std::unique_ptr<std::istream> open_stream() const override;
    bool exists() const override;
    bool readable() const override;
    Url get_url() const override;
    std::string get_uri() const override;
    std::filesystem::path get_file() const override;
    std::uint64_t content_length() const override;
    std::int64_t last_modified() const override;
    ResourcePtr create_relative(const std::string& relative_path) const override;
    std::optional<std::string> filename() const override;
    std::string description() const override;
    bool equals(const Resource& other) const override;
    std::size_t hash() const override;

private:
    template <typename Fn>
    auto delegate(const char* operation, Fn&& fn) const -> decltype(fn());

    VfsHandle handle_;
    std::shared_ptr<const VfsAdapter> adapter_;
};

} // namespace locus
