#include "locus/resources/vfs.hpp"
#include "locus/error.hpp"
#include "locus/log.hpp"
#include "locus/path_utils.hpp"
#include <typeinfo>

namespace locus {

VfsResource::VfsResource(VfsHandle handle, std::shared_ptr<const VfsAdapter> adapter)
    : handle_(std::move(handle))
    , adapter_(std::move(adapter)) {
    if (!adapter_) {
        throw LocusError(ErrorCode::AdapterFailure, "VfsAdapter must not be null");
    }
    if (!handle_) {
        throw LocusError(ErrorCode::AdapterFailure, "VirtualFile must not be null");
    }
}

// Provider exceptions become AdapterFailure; LocusError passes through unchanged
template <typename Fn>
auto VfsResource::delegate(const char* operation, Fn&& fn) const -> decltype(fn()) {
    try {
        return fn();
    } catch (const LocusError&) {
        throw;
    } catch (const std::exception& e) {
        throw LocusError(ErrorCode::AdapterFailure, description(),
            std::string("VFS ") + operation + " failed: " + e.what(), std::current_exception());
    }
}

std::unique_ptr<std::istream> VfsResource::open_stream() const {
    return delegate("open_stream", [this]() { return adapter_->open_stream(handle_); });
}

bool VfsResource::exists() const {
    return delegate("exists", [this]() { return adapter_->exists(handle_); });
}

bool VfsResource::readable() const {
    return delegate("readable", [this]() { return adapter_->readable(handle_); });
}

Url VfsResource::get_url() const {
    try {
        return Url::parse(adapter_->url(handle_));
    } catch (const std::exception& e) {
        throw LocusError(ErrorCode::AdapterFailure, description(),
            "Failed to obtain URL for file " + adapter_->describe(handle_) + ": " + e.what(),
            std::current_exception());
    }
}

std::string VfsResource::get_uri() const {
    try {
        return adapter_->uri(handle_);
    } catch (const std::exception& e) {
        throw LocusError(ErrorCode::AdapterFailure, description(),
            "Failed to obtain URI for " + adapter_->describe(handle_) + ": " + e.what(),
            std::current_exception());
    }
}

std::filesystem::path VfsResource::get_file() const {
    return delegate("get_file", [this]() { return adapter_->file(handle_); });
}

std::uint64_t VfsResource::content_length() const {
    return delegate("size", [this]() { return adapter_->size(handle_); });
}

std::int64_t VfsResource::last_modified() const {
    return delegate("last_modified", [this]() { return adapter_->last_modified(handle_); });
}

ResourcePtr VfsResource::create_relative(const std::string& relative_path) const {
    if (!path_utils::starts_with(relative_path, ".") && relative_path.find('/') != std::string::npos) {
        try {
            VfsHandle child = delegate("child", [&]() { return adapter_->child(handle_, relative_path); });
            return std::make_shared<VfsResource>(std::move(child), adapter_);
        } catch (const LocusError& e) {
            // fall back to URL-relative lookup
            LOG_VERBOSE("VFS child lookup failed for " << relative_path << ": " << e.what());
        }
    }

    std::string target = get_url().resolve(relative_path).to_string();
    VfsHandle node = delegate("relative", [&]() { return adapter_->relative(target); });
    return std::make_shared<VfsResource>(std::move(node), adapter_);
}

std::optional<std::string> VfsResource::filename() const {
    return delegate("name", [this]() { return adapter_->name(handle_); });
}

std::string VfsResource::description() const {
    return "VFS resource [" + adapter_->describe(handle_) + "]";
}

bool VfsResource::equals(const Resource& other) const {
    if (this == &other) {
        return true;
    }
    auto* vfs = dynamic_cast<const VfsResource*>(&other);
    if (vfs == nullptr) {
        return false;
    }
    // Handles are only comparable by the kind of adapter that produced them
    if (adapter_ != vfs->adapter_ && typeid(*adapter_) != typeid(*vfs->adapter_)) {
        return false;
    }
    return adapter_->equal(handle_, vfs->handle_);
}

std::size_t VfsResource::hash() const {
    return adapter_->hash(handle_);
}

} // namespace locus
