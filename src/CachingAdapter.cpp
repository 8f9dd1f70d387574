#include "CachingAdapter.hpp"
#include "CaptureStream.hpp"
#include "MemoryStorage.hpp"

#include <stdexcept>

CachingAdapter::CachingAdapter(std::unique_ptr<Transport> transport,
    std::unique_ptr<Storage> storage,
    const CacheConfig & config,
    std::unique_ptr<Heuristic> heuristic,
    std::unique_ptr<Serializer> serializer)
:   transport(std::move(transport)),
    storage(std::move(storage)),
    heuristic(std::move(heuristic)),
    config(config),
    closed(false) {
    if (!this->transport) {
        throw std::invalid_argument("CachingAdapter needs a transport");
    }
    if (!this->storage) {
        this->storage = std::make_unique<MemoryStorage>();
    }
    controller = std::make_shared<CacheController>(*this->storage, config, std::move(serializer));
}

CachingAdapter::~CachingAdapter() {
    close();
    // before the storage it refers to
    controller.reset();
}

void CachingAdapter::close() {
    if (closed) {
        return;
    }
    closed = true;
    try {
        storage->close();
    }
    catch (const std::exception & e) {
        logger.error("failed to close cache storage: " + std::string(e.what()));
    }
}

std::unique_ptr<Response> CachingAdapter::send(const Request & request) {
    if (closed) {
        throw std::logic_error("CachingAdapter used after close()");
    }
    const int id = request.getId();
    const bool cacheable = config.isCacheableMethod(request.getMethod());

    Request outgoing = request;
    if (cacheable) {
        std::unique_ptr<Response> cached = controller->cachedRequest(request);
        if (cached) {
            logger.info(id, "served from cache: " + request.getUrl());
            return cached;
        }
        std::map<std::string, std::string> conditional = controller->conditionalHeaders(request);
        if (!conditional.empty()) {
            logger.debug(id, "revalidating " + request.getUrl());
            outgoing.setHeaders(conditional);
        }
    }

    std::unique_ptr<Response> response = transport->send(outgoing);
    response->setCacheState(cacheable ? MISS : PASSTHROUGH);
    if (cacheable) {
        response = handleNetworkResponse(request, std::move(response));
    }

    if (config.isInvalidatingMethod(request.getMethod()) && response->getStatus() < 400) {
        if (controller->invalidate(request.getUrl())) {
            response->setCacheState(INVALIDATED);
        }
    }
    return response;
}

std::unique_ptr<Response> CachingAdapter::handleNetworkResponse(const Request & request,
                                                               std::unique_ptr<Response> response) {
    const int id = request.getId();
    if (heuristic) {
        heuristic->apply(*response);
    }

    const int status = response->getStatus();
    if (status == 304) {
        // nothing to keep from a 304 body; free the connection first
        response->readBody();
        response->release();
        std::unique_ptr<Response> merged = controller->updateCachedResponse(request, std::move(response));
        if (!merged->fromCache()) {
            merged->setCacheState(PASSTHROUGH);
        }
        return merged;
    }

    if (isPermanentRedirectStatus(status)) {
        response->setCacheState(controller->cacheResponse(request, *response, ""));
        return response;
    }

    if (!config.isCacheableStatus(status)) {
        logger.debug(id, "status " + std::to_string(status) + " is not cacheable");
        response->setCacheState(PASSTHROUGH);
        return response;
    }

    // the commit may run after the response is gone, so it keeps its own
    // copy of the head
    auto head = std::make_shared<Response>(status, response->getHeaders(), nullptr, response->getReason());
    head->setVersion(response->getVersion());
    std::weak_ptr<CacheController> owner = controller;
    Request key = request;
    auto capture = std::make_unique<CaptureStream>(response->takeBody(),
        [owner, key, head](const std::string & body) {
            std::shared_ptr<CacheController> cache = owner.lock();
            if (!cache) {
                logger.debug(key.getId(), "adapter is gone, not caching " + key.getUrl());
                return;
            }
            cache->cacheResponse(key, *head, body);
        });
    response->setBody(std::move(capture));
    return response;
}
