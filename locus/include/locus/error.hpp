#pragma once

#include <exception>
#include <string>

namespace locus {

enum class ErrorCode {
    NotFound,           // Content absent where presence was required
    Unresolvable,       // Operation not supported by this kind of resource
    MalformedLocation,  // URL/URI syntax invalid or unknown protocol
    AdapterFailure,     // Wrapped failure from a virtual-filesystem provider
    IOError,            // Stream or transport failure on present content
    ConfigError         // YAML config parsing error
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:          return "NotFound";
        case ErrorCode::Unresolvable:      return "Unresolvable";
        case ErrorCode::MalformedLocation: return "MalformedLocation";
        case ErrorCode::AdapterFailure:    return "AdapterFailure";
        case ErrorCode::IOError:           return "IOError";
        case ErrorCode::ConfigError:       return "ConfigError";
        default:                           return "Unknown";
    }
}

class LocusError : public std::exception {
public:
    LocusError(ErrorCode code, const std::string& message)
        : code_(code), message_(message), location_() {
        build_what();
    }

    LocusError(ErrorCode code, const std::string& location, const std::string& message)
        : code_(code), message_(message), location_(location) {
        build_what();
    }

    // Keeps the original exception, e.g. the one thrown by a VFS provider
    LocusError(ErrorCode code, const std::string& location, const std::string& message,
               std::exception_ptr cause)
        : code_(code), message_(message), location_(location), cause_(std::move(cause)) {
        build_what();
    }

    ErrorCode code() const noexcept { return code_; }
    const char* what() const noexcept override { return what_.c_str(); }
    const std::string& message() const noexcept { return message_; }
    const std::string& location() const noexcept { return location_; }

    // Null unless this error wraps another one
    const std::exception_ptr& cause() const noexcept { return cause_; }

    [[noreturn]] void rethrow_cause() const {
        if (cause_) {
            std::rethrow_exception(cause_);
        }
        throw *this;
    }

private:
    void build_what() {
        what_ = std::string("[locus::") + error_code_to_string(code_) + "] " + message_;
        if (!location_.empty()) {
            what_ += " (location: " + location_ + ")";
        }
        if (cause_) {
            try {
                std::rethrow_exception(cause_);
            } catch (const std::exception& e) {
                what_ += std::string("; caused by: ") + e.what();
            } catch (...) {
                what_ += "; caused by: unknown exception";
            }
        }
    }

    ErrorCode code_;
    std::string message_;
    std::string location_;
    std::exception_ptr cause_;
    std::string what_;
};

} // namespace locus
