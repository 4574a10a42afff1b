#ifndef STASH_META_ERROR_HPP
#define STASH_META_ERROR_HPP

#include <stdexcept>
#include <string>

namespace stash::meta {

class MetadataError : public std::runtime_error {
public:
    explicit MetadataError(const std::string& message)
        : std::runtime_error(message) {}
};

// Metadata object header cannot be parsed or is inconsistent
class CorruptHeader : public MetadataError {
public:
    explicit CorruptHeader(const std::string& message)
        : MetadataError("Corrupt metadata header: " + message) {}
};

// Field stream or record inside it cannot be decoded
class CorruptRecord : public MetadataError {
public:
    explicit CorruptRecord(const std::string& message)
        : MetadataError("Corrupt metadata record: " + message) {}
};

} // namespace stash::meta

#endif // STASH_META_ERROR_HPP
