#ifndef CACHECONTROLLER_HPP
#define CACHECONTROLLER_HPP

#include <string>
#include <map>
#include <memory>
#include <optional>

#include "CacheConfig.hpp"
#include "CacheEntry.hpp"
#include "Logger.hpp"
#include "Request.hpp"
#include "Response.hpp"
#include "Serializer.hpp"
#include "Storage.hpp"

// Decides what is served from storage, what is stored and what a 304
// turns into. Holds the storage by reference; the caller keeps it alive.
class CacheController {
public:
    CacheController(Storage & storage,
                    const CacheConfig & config = CacheConfig(),
                    std::unique_ptr<Serializer> serializer = nullptr);

    // A fresh stored response, or nullptr if the request has to go to
    // the network.
    std::unique_ptr<Response> cachedRequest(const Request & request);

    // If-None-Match (only with cacheEtags) / If-Modified-Since for
    // revalidating a stored entry
    std::map<std::string, std::string> conditionalHeaders(const Request & request);

    // Store a network response whose full body is known. Returns STORED
    // or PASSTHROUGH. Storage failures are logged, never thrown.
    CacheState cacheResponse(const Request & request, const Response & response,
                             const std::string & body = "");

    // Merge a 304 into the stored entry and return the refreshed stored
    // response. Without a stored entry the 304 comes back unchanged.
    std::unique_ptr<Response> updateCachedResponse(const Request & request,
                                                   std::unique_ptr<Response> response);

    static std::string cacheUrl(const std::string & url);

    // drop every stored response for url; true if anything was stored
    bool invalidate(const std::string & url);

    Storage & getStorage() { return storage; }
    const CacheConfig & getConfig() const { return config; }

private:
    struct Lookup {
        std::string key;
        CacheEntry entry;
        // separate-body storages only
        std::unique_ptr<BodyStream> body;
    };

    Storage & storage;
    SeparateBodyStorage * separate;
    CacheConfig config;
    std::unique_ptr<Serializer> serializer;
    static inline Logger & logger = Logger::getInstance();

    std::optional<Lookup> lookup(const Request & request);
    std::optional<std::string> load(int id, const std::string & key);
    void store(const std::string & key, const CacheEntry & entry, const std::string * body);
    void storeEntry(const Request & request, const Response & response, const std::string & body);
    void purge(int id, const std::string & key);
    // consumes found.body
    std::unique_ptr<Response> toResponse(Lookup & found, CacheState state);
};

#endif
