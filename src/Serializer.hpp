#ifndef SERIALIZER_HPP
#define SERIALIZER_HPP

#include <string>
#include <optional>

#include "CacheEntry.hpp"

// Turns entries into storage bytes and back. loads() returns nullopt
// for anything it cannot read; it never throws.
class Serializer {
public:
    virtual ~Serializer() = default;

    virtual std::string dumps(const CacheEntry & entry) = 0;
    virtual std::optional<CacheEntry> loads(const std::string & data) = 0;

    virtual std::string dumpsChoice(const CacheChoice & choice) = 0;
    virtual std::optional<CacheChoice> loadsChoice(const std::string & data) = 0;

    // true if data holds a choice record rather than an entry
    virtual bool isChoice(const std::string & data) const = 0;
};

// Text framing around an HTTP/1.1 response head:
//
//   cc=4,<stored-at>,<body-length>\r\n
//   <vary lines>\r\n
//   <status line and headers>\r\n
//   <body>
class WireSerializer : public Serializer {
public:
    static constexpr const char * VERSION_TAG = "cc=4";
    static constexpr const char * CHOICE_TAG = "cc=choice";

    std::string dumps(const CacheEntry & entry) override;
    std::optional<CacheEntry> loads(const std::string & data) override;

    std::string dumpsChoice(const CacheChoice & choice) override;
    std::optional<CacheChoice> loadsChoice(const std::string & data) override;

    bool isChoice(const std::string & data) const override;

private:
    std::optional<CacheEntry> parse(const std::string & data);
};

#endif
