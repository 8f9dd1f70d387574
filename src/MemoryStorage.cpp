#include "MemoryStorage.hpp"

using namespace std;

MemoryStorage::MemoryStorage(size_t max_size) : max_size(max_size), current_size(0) {}

optional<string> MemoryStorage::get(const string & key) {
    auto it = items.find(key);
    if (it == items.end()) {
        return nullopt;
    }
    return it->second.value;
}

void MemoryStorage::set(const string & key, const string & value) {
    size_t entry_size = key.size() + value.size();

    // if the entry is too large, do not store it at all
    if (entry_size > max_size) {
        logger.warning("Entry too large for memory storage (" + to_string(entry_size) + " bytes)");
        return;
    }

    // if the entry already exists, remove the old entry
    auto it = items.find(key);
    if (it != items.end()) {
        erase(it);
    }

    // ensure there is enough space
    while (current_size + entry_size > max_size && !items.empty()) {
        evictOldestEntry();
    }

    insertion_order.push_back(key);
    items[key] = Item{value, prev(insertion_order.end())};
    current_size += entry_size;
    logger.debug("memory storage now has " + to_string(items.size()) + " entries");
}

void MemoryStorage::remove(const string & key) {
    auto it = items.find(key);
    if (it != items.end()) {
        erase(it);
    }
}

void MemoryStorage::close() {
    items.clear();
    insertion_order.clear();
    current_size = 0;
}

void MemoryStorage::erase(unordered_map<string, Item>::iterator it) {
    current_size -= it->first.size() + it->second.value.size();
    insertion_order.erase(it->second.order);
    items.erase(it);
}

void MemoryStorage::evictOldestEntry() {
    if (insertion_order.empty()) {
        return;
    }
    const string oldest = insertion_order.front();
    logger.info("evicted " + oldest + " from memory storage");
    remove(oldest);
}
