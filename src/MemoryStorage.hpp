#ifndef MEMORYSTORAGE_HPP
#define MEMORYSTORAGE_HPP

#include <string>
#include <unordered_map>
#include <list>

#include "Logger.hpp"
#include "Storage.hpp"

// In-process storage with a byte budget. Not synchronized: callers that
// share an instance between threads must serialize access themselves.
class MemoryStorage : public Storage {
private:
    struct Item {
        std::string value;
        std::list<std::string>::iterator order;
    };

    std::unordered_map<std::string, Item> items;
    // oldest first
    std::list<std::string> insertion_order;
    size_t max_size;
    size_t current_size;
    static inline Logger & logger = Logger::getInstance();

    void evictOldestEntry();
    void erase(std::unordered_map<std::string, Item>::iterator it);

public:
    explicit MemoryStorage(size_t max_size = 10 * 1024 * 1024); // Default 10MB

    std::optional<std::string> get(const std::string & key) override;
    void set(const std::string & key, const std::string & value) override;
    void remove(const std::string & key) override;
    void close() override;

    size_t getCurrentSize() const { return current_size; }
    size_t getMaxSize() const { return max_size; }
    size_t count() const { return items.size(); }
};

#endif
