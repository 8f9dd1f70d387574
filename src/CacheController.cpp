#include "CacheController.hpp"
#include "CacheControl.hpp"
#include "CacheKey.hpp"

#include <algorithm>
#include <ctime>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>

using namespace std;

CacheController::CacheController(Storage & storage,
    const CacheConfig & config,
    unique_ptr<Serializer> serializer)
:   storage(storage),
    separate(dynamic_cast<SeparateBodyStorage *>(&storage)),
    config(config),
    serializer(std::move(serializer)) {
    this->config.validate();
    if (!this->serializer) {
        this->serializer = make_unique<WireSerializer>();
    }
}

string CacheController::cacheUrl(const string & url) {
    return CacheKey::cacheUrl(url);
}

optional<string> CacheController::load(int id, const string & key) {
    try {
        return storage.get(key);
    }
    catch (const exception & e) {
        // an unreadable entry is a miss
        logger.error(id, "failed to read cache key " + key + ": " + e.what());
        return nullopt;
    }
}

void CacheController::purge(int id, const string & key) {
    try {
        storage.remove(key);
        logger.debug(id, "purged " + key);
    }
    catch (const exception & e) {
        logger.error(id, "failed to purge cache key " + key + ": " + e.what());
    }
}

optional<CacheController::Lookup> CacheController::lookup(const Request & request) {
    const int id = request.getId();
    string key = CacheKey::derive(request.getMethod(), request.getUrl());
    optional<string> data = load(id, key);
    if (!data) {
        logger.debug(id, "no cache entry for " + request.getUrl());
        return nullopt;
    }

    if (serializer->isChoice(*data)) {
        optional<CacheChoice> choice = serializer->loadsChoice(*data);
        if (!choice) {
            return nullopt;
        }
        VaryValues values = CacheKey::collectVaryValues(request.getHeaders(), choice->varyNames);
        key = CacheKey::derive(request.getMethod(), request.getUrl(), values);
        data = load(id, key);
        if (!data) {
            logger.debug(id, "no stored variant of " + request.getUrl() + " for this request");
            return nullopt;
        }
    }

    unique_ptr<BodyStream> body;
    if (separate) {
        // read again together with the body, so both come from one write
        optional<SeparateBodyStorage::StoredEntry> stored;
        try {
            stored = separate->getEntry(key);
        }
        catch (const exception & e) {
            logger.error(id, "failed to open cached body: " + string(e.what()));
        }
        if (!stored) {
            logger.debug(id, "cache entry for " + request.getUrl() + " has no body");
            return nullopt;
        }
        data = std::move(stored->metadata);
        body = std::move(stored->body);
    }

    optional<CacheEntry> entry = serializer->loads(*data);
    if (!entry) {
        logger.debug(id, "cache entry for " + request.getUrl() + " could not be decoded");
        return nullopt;
    }

    vector<string> varyNames = CacheKey::varyHeaderNames(entry->getHeaders());
    if (find(varyNames.begin(), varyNames.end(), "*") != varyNames.end()) {
        return nullopt;
    }
    if (!entry->varyMatches(request.getHeaders())) {
        logger.debug(id, "stored Vary values do not match the request");
        return nullopt;
    }

    Lookup found{key, *entry, std::move(body)};
    return optional<Lookup>(std::move(found));
}

unique_ptr<Response> CacheController::toResponse(Lookup & found, CacheState state) {
    unique_ptr<BodyStream> body = std::move(found.body);
    if (!body) {
        body = make_unique<StringBodyStream>(found.entry.getBody());
    }
    auto response = make_unique<Response>(found.entry.getStatus(), found.entry.getHeaders(),
                                          std::move(body), found.entry.getReason());
    response->setVersion(found.entry.getVersion());
    response->setCacheState(state);
    return response;
}

unique_ptr<Response> CacheController::cachedRequest(const Request & request) {
    const int id = request.getId();
    CacheDirectives cc = parseCacheControl(request.getHeaders());

    if (cc.noCache) {
        logger.debug(id, "request has no-cache, not serving from cache");
        return nullptr;
    }
    if (cc.maxAge && *cc.maxAge == 0) {
        logger.debug(id, "request has max-age=0, not serving from cache");
        return nullptr;
    }

    optional<Lookup> found = lookup(request);
    if (!found) {
        return nullptr;
    }
    const CacheEntry & entry = found->entry;

    if (entry.isPermanentRedirect()) {
        logger.debug(id, "serving permanent redirect from cache");
        return toResponse(*found, HIT_FRESH);
    }

    optional<time_t> date = entry.getDate();
    if (!date) {
        logger.debug(id, "cached response has no usable Date header");
        if (entry.getETag().empty()) {
            purge(id, found->key);
        }
        return nullptr;
    }

    time_t now = time(nullptr);
    long currentAge = max(0L, static_cast<long>(now - *date));

    CacheDirectives stored = parseCacheControl(entry.getHeaders());
    long freshness = 0;
    if (stored.maxAge) {
        freshness = *stored.maxAge;
    } else if (entry.hasHeader("Expires")) {
        optional<time_t> expires = parseHttpDate(entry.getHeader("Expires"));
        if (expires) {
            freshness = max(0L, static_cast<long>(*expires - *date));
        }
    }

    if (cc.maxAge) {
        freshness = *cc.maxAge;
    }
    if (cc.minFresh) {
        currentAge += *cc.minFresh;
    }

    logger.debug(id, "freshness lifetime " + to_string(freshness) + ", current age " + to_string(currentAge));
    if (freshness > currentAge) {
        logger.info(id, "in cache, valid: " + request.getUrl());
        return toResponse(*found, HIT_FRESH);
    }

    // stale without a validator cannot be revalidated
    if (entry.getETag().empty()) {
        purge(id, found->key);
    }
    logger.info(id, "in cache, requires validation: " + request.getUrl());
    return nullptr;
}

map<string, string> CacheController::conditionalHeaders(const Request & request) {
    map<string, string> headers;
    optional<Lookup> found = lookup(request);
    if (!found) {
        return headers;
    }
    string etag = found->entry.getETag();
    if (config.cacheEtags && !etag.empty()) {
        headers["If-None-Match"] = etag;
    }
    string lastModified = found->entry.getLastModified();
    if (!lastModified.empty()) {
        headers["If-Modified-Since"] = lastModified;
    }
    return headers;
}

void CacheController::store(const string & key, const CacheEntry & entry, const string * body) {
    if (!separate) {
        storage.set(key, serializer->dumps(entry));
        return;
    }
    CacheEntry metadata = entry;
    metadata.setBody("");
    if (body) {
        separate->setEntry(key, serializer->dumps(metadata), *body);
    } else {
        // a refresh keeps the stored body
        separate->set(key, serializer->dumps(metadata));
    }
}

void CacheController::storeEntry(const Request & request, const Response & response, const string & body) {
    const int id = request.getId();
    const string & method = request.getMethod();
    const string & url = request.getUrl();

    CacheEntry entry = CacheEntry::fromResponse(response, separate ? "" : body);
    entry.setStoredAt(time(nullptr));

    string primary = CacheKey::derive(method, url);
    optional<string> existing = load(id, primary);
    optional<CacheChoice> choice;
    if (existing && serializer->isChoice(*existing)) {
        choice = serializer->loadsChoice(*existing);
    }

    vector<string> varyNames = CacheKey::varyHeaderNames(response.getHeaders());
    if (varyNames.empty()) {
        // a plain entry replaces whatever variants were stored before
        if (choice) {
            for (const string & variant : choice->variantKeys) {
                storage.remove(variant);
            }
        }
        store(primary, entry, &body);
        logger.debug(id, "stored " + url + " under " + primary);
        return;
    }

    VaryValues values = CacheKey::collectVaryValues(request.getHeaders(), varyNames);
    entry.setVary(values);
    string key = CacheKey::derive(method, url, values);
    store(key, entry, &body);

    if (!choice || choice->varyNames != varyNames) {
        if (choice) {
            for (const string & variant : choice->variantKeys) {
                if (variant != key) {
                    storage.remove(variant);
                }
            }
        } else if (existing) {
            storage.remove(primary);
        }
        choice = CacheChoice();
        choice->varyNames = varyNames;
    }
    choice->addVariant(key);
    storage.set(primary, serializer->dumpsChoice(*choice));
    logger.debug(id, "stored variant of " + url + " under " + key);
}

CacheState CacheController::cacheResponse(const Request & request, const Response & response, const string & body) {
    const int id = request.getId();
    const int status = response.getStatus();

    if (status == 304) {
        return PASSTHROUGH;
    }
    if (!config.isCacheableMethod(request.getMethod())) {
        logger.debug(id, request.getMethod() + " responses are not cached");
        return PASSTHROUGH;
    }
    if (!config.isCacheableStatus(status)) {
        logger.debug(id, "status " + to_string(status) + " is not cacheable");
        return PASSTHROUGH;
    }

    if (isPermanentRedirectStatus(status)) {
        // stored without its body; the origin's Content-Length is kept as is
        try {
            storeEntry(request, response, "");
            logger.info(id, "cached permanent redirect " + request.getUrl());
            return STORED;
        }
        catch (const exception & e) {
            logger.error(id, "failed to store redirect for " + request.getUrl() + ": " + e.what());
            return PASSTHROUGH;
        }
    }

    string contentLength = headerValue(response.getHeaders(), http::field::content_length);
    if (!contentLength.empty()) {
        bool matches = false;
        try {
            matches = boost::lexical_cast<size_t>(boost::trim_copy(contentLength)) == body.size();
        }
        catch (const boost::bad_lexical_cast &) {
            matches = false;
        }
        if (!matches) {
            logger.warning(id, "body length does not match Content-Length, not caching");
            return PASSTHROUGH;
        }
    }

    try {
        CacheDirectives cc = parseCacheControl(response.getHeaders());
        CacheDirectives requestCc = parseCacheControl(request.getHeaders());
        if (cc.noStore || requestCc.noStore) {
            logger.info(id, "not cacheable because no-store");
            return PASSTHROUGH;
        }

        vector<string> varyNames = CacheKey::varyHeaderNames(response.getHeaders());
        if (find(varyNames.begin(), varyNames.end(), "*") != varyNames.end()) {
            logger.info(id, "not cacheable because Vary: *");
            return PASSTHROUGH;
        }

        bool hasETag = !headerValue(response.getHeaders(), http::field::etag).empty();
        bool hasDate = response.hasHeader("Date");
        bool hasExpires = !headerValue(response.getHeaders(), http::field::expires).empty();

        if (config.cacheEtags && hasETag) {
            storeEntry(request, response, body);
            logger.info(id, "cached, but requires re-validation: " + request.getUrl());
            return STORED;
        }
        if (hasDate && ((cc.maxAge && *cc.maxAge > 0) || hasExpires)) {
            storeEntry(request, response, body);
            logger.info(id, "cached, expires by freshness headers: " + request.getUrl());
            return STORED;
        }
        logger.info(id, "not cacheable because no freshness information or validator");
    }
    catch (const exception & e) {
        logger.error(id, "failed to store response for " + request.getUrl() + ": " + e.what());
    }
    return PASSTHROUGH;
}

unique_ptr<Response> CacheController::updateCachedResponse(const Request & request, unique_ptr<Response> response) {
    const int id = request.getId();
    optional<Lookup> found = lookup(request);
    if (!found) {
        logger.debug(id, "304 without a stored entry for " + request.getUrl());
        return response;
    }

    found->entry.mergeHeaders(response->getHeaders());
    found->entry.setStatus(200);
    found->entry.setStoredAt(time(nullptr));
    try {
        store(found->key, found->entry, nullptr);
    }
    catch (const exception & e) {
        logger.error(id, "failed to refresh cache entry: " + string(e.what()));
    }
    logger.info(id, "revalidated " + request.getUrl());
    return toResponse(*found, HIT_STALE_REVALIDATING);
}

bool CacheController::invalidate(const string & url) {
    bool found = false;
    for (const string & method : config.cacheableMethods) {
        string primary = CacheKey::derive(method, url);
        optional<string> data = load(-1, primary);
        if (!data) {
            continue;
        }
        found = true;
        try {
            if (serializer->isChoice(*data)) {
                optional<CacheChoice> choice = serializer->loadsChoice(*data);
                if (choice) {
                    for (const string & variant : choice->variantKeys) {
                        storage.remove(variant);
                    }
                }
            }
            storage.remove(primary);
        }
        catch (const exception & e) {
            logger.error("failed to invalidate " + url + ": " + e.what());
        }
    }
    if (found) {
        logger.info("invalidated " + url);
    }
    return found;
}
