#pragma once
#include <stdexcept>
#include <string>

namespace clausefind {

// Nothing to index: no pages, or every page blank after normalization.
// The caller can recover by supplying another document.
class InputError : public std::runtime_error {
public:
    explicit InputError(const std::string& what) : std::runtime_error(what) {}
};

// Dense embedding backend could not produce vectors. Caught inside index
// construction, which falls back to TF-IDF.
class BackendUnavailable : public std::runtime_error {
public:
    explicit BackendUnavailable(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace clausefind
