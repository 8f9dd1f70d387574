#include "Serializer.hpp"
#include "Logger.hpp"

#include <cctype>
#include <sstream>
#include <vector>
#include <boost/asio/buffer.hpp>
#include <boost/beast/http.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/algorithm/string.hpp>

using namespace std;

static Logger & logger = Logger::getInstance();

static const string CRLF = "\r\n";
static const string ABSENT_MARKER = "X-Vary-Absent";

// split "a,b,c" and check the field count
static bool splitTag(const string & line, vector<string> & parts, size_t expected) {
    boost::split(parts, line, boost::is_any_of(","));
    return parts.size() == expected;
}

static bool isNumber(const string & s) {
    if (s.empty() || s.size() > 19) return false;
    size_t start = (s[0] == '-') ? 1 : 0;
    if (start == s.size()) return false;
    for (size_t i = start; i < s.size(); i++) {
        if (!isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// read lines "Name: value" until an empty line; pos is left after it
static bool readLines(const string & data, size_t & pos, vector<pair<string, string>> & lines) {
    while (true) {
        size_t end = data.find(CRLF, pos);
        if (end == string::npos) {
            return false;
        }
        if (end == pos) {
            pos = end + CRLF.size();
            return true;
        }
        string line = data.substr(pos, end - pos);
        size_t colon = line.find(':');
        if (colon == string::npos || colon == 0) {
            return false;
        }
        lines.emplace_back(line.substr(0, colon), boost::trim_copy(line.substr(colon + 1)));
        pos = end + CRLF.size();
    }
}

string WireSerializer::dumps(const CacheEntry & entry) {
    http::response<http::empty_body> res;
    res.result(entry.getStatus());
    res.version(entry.getVersion());
    res.reason(entry.getReason());
    for (const auto & field : entry.getHeaders()) {
        res.insert(field.name_string(), field.value());
    }

    string out = string(VERSION_TAG) + "," + to_string(static_cast<long long>(entry.getStoredAt())) +
                 "," + to_string(entry.getBody().size()) + CRLF;
    for (const auto & pair : entry.getVary()) {
        if (pair.second) {
            out += pair.first + ": " + *pair.second + CRLF;
        } else {
            out += ABSENT_MARKER + ": " + pair.first + CRLF;
        }
    }
    out += CRLF;
    // status line, headers and the blank line that ends them
    out += boost::lexical_cast<string>(res.base());
    out += entry.getBody();
    return out;
}

optional<CacheEntry> WireSerializer::loads(const string & data) {
    if (data.empty()) {
        return nullopt;
    }
    try {
        optional<CacheEntry> entry = parse(data);
        if (!entry) {
            logger.warning("Cache entry deserialization failed, entry ignored");
        }
        return entry;
    }
    catch (const exception & e) {
        logger.warning("Cache entry deserialization failed (" + string(e.what()) + "), entry ignored");
        return nullopt;
    }
}

optional<CacheEntry> WireSerializer::parse(const string & data) {
    size_t lineEnd = data.find(CRLF);
    if (lineEnd == string::npos) {
        return nullopt;
    }
    vector<string> tag;
    if (!splitTag(data.substr(0, lineEnd), tag, 3) || tag[0] != VERSION_TAG) {
        logger.debug("unknown cache entry version");
        return nullopt;
    }
    if (!isNumber(tag[1]) || !isNumber(tag[2]) || tag[2][0] == '-') {
        return nullopt;
    }
    time_t storedAt = static_cast<time_t>(stoll(tag[1]));
    size_t bodyLength = static_cast<size_t>(stoull(tag[2]));

    size_t pos = lineEnd + CRLF.size();
    vector<pair<string, string>> varyLines;
    if (!readLines(data, pos, varyLines)) {
        return nullopt;
    }
    VaryValues vary;
    for (const auto & line : varyLines) {
        if (line.first == ABSENT_MARKER) {
            vary[boost::to_lower_copy(line.second)] = nullopt;
        } else {
            vary[boost::to_lower_copy(line.first)] = line.second;
        }
    }

    if (data.size() < pos + bodyLength) {
        return nullopt;
    }
    string head = data.substr(pos, data.size() - pos - bodyLength);
    if (!boost::ends_with(head, CRLF + CRLF)) {
        return nullopt;
    }

    http::response_parser<http::empty_body> parser;
    // the body is framed by the length above, not by the head
    parser.skip(true);
    parser.header_limit(1024 * 1024);
    boost::system::error_code ec;
    size_t used = parser.put(boost::asio::buffer(head.data(), head.size()), ec);
    if (ec || !parser.is_header_done() || used != head.size()) {
        logger.debug("failed to parse stored head: " + ec.message());
        return nullopt;
    }

    const auto & res = parser.get();
    http::fields headers;
    for (const auto & field : res.base()) {
        headers.insert(field.name_string(), field.value());
    }
    CacheEntry entry(res.result_int(), string(res.reason()), headers,
                     data.substr(data.size() - bodyLength), storedAt);
    entry.setVersion(res.version());
    entry.setVary(vary);
    return entry;
}

string WireSerializer::dumpsChoice(const CacheChoice & choice) {
    string out = string(CHOICE_TAG) + "," + to_string(choice.variantKeys.size()) + CRLF;
    out += "Vary: " + boost::join(choice.varyNames, ", ") + CRLF;
    for (const string & key : choice.variantKeys) {
        out += "Variant: " + key + CRLF;
    }
    out += CRLF;
    return out;
}

optional<CacheChoice> WireSerializer::loadsChoice(const string & data) {
    size_t lineEnd = data.find(CRLF);
    if (lineEnd == string::npos) {
        return nullopt;
    }
    vector<string> tag;
    if (!splitTag(data.substr(0, lineEnd), tag, 2) || tag[0] != CHOICE_TAG || !isNumber(tag[1])) {
        logger.warning("Cache choice record deserialization failed, record ignored");
        return nullopt;
    }
    size_t pos = lineEnd + CRLF.size();
    vector<pair<string, string>> lines;
    if (!readLines(data, pos, lines) || pos != data.size()) {
        logger.warning("Cache choice record deserialization failed, record ignored");
        return nullopt;
    }

    CacheChoice choice;
    for (const auto & line : lines) {
        if (boost::iequals(line.first, "Vary")) {
            vector<string> names;
            boost::split(names, line.second, boost::is_any_of(","));
            for (string & name : names) {
                boost::trim(name);
                if (!name.empty()) choice.varyNames.push_back(boost::to_lower_copy(name));
            }
        } else if (boost::iequals(line.first, "Variant")) {
            choice.variantKeys.push_back(line.second);
        }
    }
    if (choice.varyNames.empty() || choice.variantKeys.size() != stoull(tag[1])) {
        logger.warning("Cache choice record deserialization failed, record ignored");
        return nullopt;
    }
    return choice;
}

bool WireSerializer::isChoice(const string & data) const {
    return boost::starts_with(data, string(CHOICE_TAG) + ",");
}
