#pragma once

#include <stdexcept>
#include <string>

namespace konduit {

// Search attempted before a successful build (or after a build with zero chunks).
class IndexNotBuilt : public std::runtime_error {
public:
    IndexNotBuilt() : std::runtime_error("index not built: run build() with non-empty pages first") {}
};

// An embedding or pair-scoring backend failed or answered with a malformed payload.
class CapabilityError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace konduit
