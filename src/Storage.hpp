#ifndef STORAGE_HPP
#define STORAGE_HPP

#include <string>
#include <memory>
#include <optional>

#include "BodyStream.hpp"

// Key/value store for serialized cache entries. The storage owns the
// persisted bytes; callers get copies.
class Storage {
public:
    virtual ~Storage() = default;

    virtual std::optional<std::string> get(const std::string & key) = 0;
    virtual void set(const std::string & key, const std::string & value) = 0;

    // removing a missing key is a no-op
    virtual void remove(const std::string & key) = 0;

    virtual void close() {}
};

// Storage that keeps the body apart from the metadata under the same
// key, so a body can be streamed instead of loaded with the metadata.
class SeparateBodyStorage : public Storage {
public:
    struct StoredEntry {
        std::string metadata;
        std::unique_ptr<BodyStream> body;
    };

    // nullptr when no body is stored
    virtual std::unique_ptr<BodyStream> getBody(const std::string & key) = 0;
    virtual void setBody(const std::string & key, const std::string & body) = 0;

    // Metadata and body from the same write; nullopt unless both exist.
    virtual std::optional<StoredEntry> getEntry(const std::string & key) = 0;

    // Replaces metadata and body together: getEntry() sees the old pair
    // or the new one, never one of each.
    virtual void setEntry(const std::string & key, const std::string & metadata,
                          const std::string & body) = 0;

    // remove() deletes metadata and body
};

#endif
