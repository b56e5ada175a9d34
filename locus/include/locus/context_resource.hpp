#pragma once

#include <string>

namespace locus {

// Implemented by resources loaded relative to an enclosing context
// (the class path, or the working directory of a FileSystemResourceLoader)
// Collaborators dynamic_cast to this to tell them apart from absolute resources.
class ContextResource {
public:
    virtual ~ContextResource() = default;

    // Path within the enclosing context
    virtual std::string path_within_context() const = 0;
};

} // namespace locus
