#ifndef CACHESTATE_HPP
#define CACHESTATE_HPP

// How a response came to the caller.
enum CacheState {
    MISS,                   // nothing usable stored, fetched from the network
    HIT_FRESH,              // served from storage without contacting the origin
    HIT_STALE_REVALIDATING, // stored entry confirmed by a 304
    STORED,                 // fetched and handed to storage
    PASSTHROUGH,            // fetched, not eligible for storage
    INVALIDATED             // unsafe method succeeded, entry removed
};

const char * cacheStateName(CacheState state);

#endif
