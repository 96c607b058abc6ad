#pragma once

#include "Resource.hpp"

namespace Server
{

/**
 * A resource whose handlers are ordinary functions, for requests that can be answered without waiting on anything.
 *
 * Requests must not have a body: getMaxRequestLength() stays zero, and the (empty) body is read before the handler is
 * called so that the server rejects one that isn't.
 */
class SynchronousResource : public Resource
{
public:
    ~SynchronousResource() override;
    using Resource::Resource;

    Awaitable<void> operator()(Response &response, Request &request) override;

    /**
     * Handle a request. Override the verbs the resource supports; the rest fail with ErrorKind::UnsupportedType.
     */
    virtual void getSync(Response &response, const Request &request);
    virtual void postSync(Response &response, const Request &request);
};

} // namespace Server
