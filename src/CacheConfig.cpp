#include "CacheConfig.hpp"

#include <cctype>
#include <stdexcept>
#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>

using namespace std;
namespace pt = boost::property_tree;

static set<string> parseMethodList(const string & key, const string & value) {
    set<string> methods;
    vector<string> parts;
    boost::split(parts, value, boost::is_any_of(","));
    for (string & part : parts) {
        boost::trim(part);
        if (part.empty()) {
            continue;
        }
        for (char c : part) {
            if (!isalpha(static_cast<unsigned char>(c))) {
                throw invalid_argument("invalid method '" + part + "' in " + key);
            }
        }
        methods.insert(boost::to_upper_copy(part));
    }
    return methods;
}

static set<int> parseStatusList(const string & key, const string & value) {
    set<int> codes;
    vector<string> parts;
    boost::split(parts, value, boost::is_any_of(","));
    for (string & part : parts) {
        boost::trim(part);
        if (part.empty()) {
            continue;
        }
        int code;
        try {
            code = boost::lexical_cast<int>(part);
        }
        catch (const boost::bad_lexical_cast &) {
            throw invalid_argument("invalid status code '" + part + "' in " + key);
        }
        if (code < 100 || code > 599) {
            throw invalid_argument("status code out of range in " + key + ": " + part);
        }
        codes.insert(code);
    }
    return codes;
}

static bool parseBool(const string & key, string value) {
    boost::to_lower(value);
    boost::trim(value);
    if (value == "true" || value == "yes" || value == "on" || value == "1") return true;
    if (value == "false" || value == "no" || value == "off" || value == "0") return false;
    throw invalid_argument("invalid boolean for " + key + ": " + value);
}

void CacheConfig::validate() const {
    if (cacheableMethods.empty()) {
        throw invalid_argument("cacheable_methods must not be empty");
    }
}

bool CacheConfig::isCacheableMethod(const string & method) const {
    return cacheableMethods.count(method) > 0;
}

bool CacheConfig::isInvalidatingMethod(const string & method) const {
    return invalidatingMethods.count(method) > 0;
}

bool CacheConfig::isCacheableStatus(int status) const {
    return cacheableStatusCodes.count(status) > 0;
}

CacheConfig loadConfig(const string & path) {
    pt::ptree tree;
    try {
        pt::read_ini(path, tree);
    }
    catch (const pt::ini_parser_error & e) {
        throw runtime_error("Failed to read config " + path + ": " + e.what());
    }

    CacheConfig config;
    if (auto v = tree.get_optional<string>("cache.cacheable_methods")) {
        config.cacheableMethods = parseMethodList("cacheable_methods", *v);
    }
    if (auto v = tree.get_optional<string>("cache.cache_etags")) {
        config.cacheEtags = parseBool("cache_etags", *v);
    }
    if (auto v = tree.get_optional<string>("cache.invalidating_methods")) {
        config.invalidatingMethods = parseMethodList("invalidating_methods", *v);
    }
    if (auto v = tree.get_optional<string>("cache.cacheable_status_codes")) {
        config.cacheableStatusCodes = parseStatusList("cacheable_status_codes", *v);
    }
    if (auto v = tree.get_optional<string>("log.path")) {
        config.logPath = boost::trim_copy(*v);
    }
    if (auto v = tree.get_optional<string>("log.level")) {
        config.logLevel = Logger::parseLevel(boost::trim_copy(*v));
    }

    config.validate();
    return config;
}

void applyLogging(const CacheConfig & config) {
    Logger & logger = Logger::getInstance();
    logger.setLevel(config.logLevel);
    if (!config.logPath.empty()) {
        logger.setLogPath(config.logPath);
    }
}
