#ifndef CACHINGADAPTER_HPP
#define CACHINGADAPTER_HPP

#include <memory>

#include "CacheConfig.hpp"
#include "CacheController.hpp"
#include "Heuristic.hpp"
#include "Logger.hpp"
#include "Request.hpp"
#include "Response.hpp"
#include "Serializer.hpp"
#include "Storage.hpp"
#include "Transport.hpp"

// Sits between a client and its transport: answers from storage when
// it can, revalidates stale entries and stores what comes back.
class CachingAdapter {
public:
    // a null storage means an in-memory one
    CachingAdapter(std::unique_ptr<Transport> transport,
                   std::unique_ptr<Storage> storage = nullptr,
                   const CacheConfig & config = CacheConfig(),
                   std::unique_ptr<Heuristic> heuristic = nullptr,
                   std::unique_ptr<Serializer> serializer = nullptr);
    ~CachingAdapter();

    CachingAdapter(const CachingAdapter &) = delete;
    CachingAdapter & operator=(const CachingAdapter &) = delete;

    // Transport errors reach the caller unchanged. Throws
    // std::logic_error after close(). A returned body stores itself
    // when fully read; read after the adapter is gone it is only passed
    // through.
    std::unique_ptr<Response> send(const Request & request);

    // closes the storage; idempotent
    void close();

    CacheController & getController() { return *controller; }
    Storage & getStorage() { return *storage; }

private:
    std::unique_ptr<Transport> transport;
    std::unique_ptr<Storage> storage;
    // shared so pending captures can tell when it is gone
    std::shared_ptr<CacheController> controller;
    std::unique_ptr<Heuristic> heuristic;
    CacheConfig config;
    bool closed;
    static inline Logger & logger = Logger::getInstance();

    std::unique_ptr<Response> handleNetworkResponse(const Request & request,
                                                    std::unique_ptr<Response> response);
};

#endif
