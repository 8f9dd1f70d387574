#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <string>
#include <set>

#include "Logger.hpp"

struct CacheConfig {
    // only responses to these request methods are looked up and stored
    std::set<std::string> cacheableMethods = {"GET"};

    // keep ETag responses and send If-None-Match on revalidation
    bool cacheEtags = true;

    // a successful request with one of these drops the stored entry
    std::set<std::string> invalidatingMethods = {"PUT", "PATCH", "DELETE"};

    std::set<int> cacheableStatusCodes = {200, 203, 300, 301, 308};

    std::string logPath;
    Logger::Level logLevel = Logger::INFO;

    // throws std::invalid_argument
    void validate() const;

    bool isCacheableMethod(const std::string & method) const;
    bool isInvalidatingMethod(const std::string & method) const;
    bool isCacheableStatus(int status) const;
};

// Read an INI file:
//
//   [cache]
//   cacheable_methods = GET, HEAD
//   cache_etags = true
//   invalidating_methods = PUT, PATCH, DELETE
//   cacheable_status_codes = 200, 203, 300, 301, 308
//
//   [log]
//   path = /var/log/cachelayer/
//   level = info
//
// Missing keys keep their defaults. Throws std::invalid_argument on a
// malformed value and std::runtime_error if the file cannot be read.
CacheConfig loadConfig(const std::string & path);

// apply logPath and logLevel to the Logger singleton
void applyLogging(const CacheConfig & config);

#endif
