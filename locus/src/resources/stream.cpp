#include "locus/resources/stream.hpp"
#include "locus/error.hpp"
#include <functional>
#include <sstream>
#include <string_view>

namespace locus {

InputStreamResource::InputStreamResource(std::unique_ptr<std::istream> stream, std::string description)
    : stream_(std::move(stream))
    , read_(false)
    , identity_(stream_.get())
    , description_(std::move(description)) {
    if (!stream_) {
        throw LocusError(ErrorCode::IOError, description_, "InputStream must not be null");
    }
}

std::unique_ptr<std::istream> InputStreamResource::open_stream() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (read_) {
        throw LocusError(ErrorCode::IOError, description_,
            "InputStream has already been read - do not use InputStreamResource if a stream needs to be read multiple times");
    }
    read_ = true;
    return std::move(stream_);
}

std::string InputStreamResource::description() const {
    return "InputStream resource [" + description_ + "]";
}

bool InputStreamResource::equals(const Resource& other) const {
    auto* stream = dynamic_cast<const InputStreamResource*>(&other);
    return stream != nullptr && stream->identity_ == identity_;
}

std::size_t InputStreamResource::hash() const {
    return std::hash<const void*>{}(identity_);
}

ByteArrayResource::ByteArrayResource(std::vector<std::byte> data, std::string description)
    : data_(std::move(data))
    , description_(std::move(description)) {}

ByteArrayResource::ByteArrayResource(const std::string& data, std::string description)
    : data_(reinterpret_cast<const std::byte*>(data.data()),
            reinterpret_cast<const std::byte*>(data.data()) + data.size())
    , description_(std::move(description)) {}

std::unique_ptr<std::istream> ByteArrayResource::open_stream() const {
    std::string content(reinterpret_cast<const char*>(data_.data()), data_.size());
    return std::make_unique<std::istringstream>(std::move(content), std::ios::binary);
}

std::string ByteArrayResource::description() const {
    return "Byte array resource [" + description_ + "]";
}

bool ByteArrayResource::equals(const Resource& other) const {
    if (this == &other) {
        return true;
    }
    auto* bytes = dynamic_cast<const ByteArrayResource*>(&other);
    return bytes != nullptr && bytes->data_ == data_;
}

std::size_t ByteArrayResource::hash() const {
    std::string_view view(reinterpret_cast<const char*>(data_.data()), data_.size());
    return std::hash<std::string_view>{}(view);
}

} // namespace locus
