#pragma once

#include "Resource.hpp"

#include "log/Log.hpp"

#include <memory>
#include <string>

/**
 * @defgroup server Server
 *
 * The resource tree and the HTTP server that serves it.
 */
/// @addtogroup server
/// @{

/**
 * The protocol-independent side of serving requests, and the HTTP server built on it.
 *
 * The streaming, HLS and API endpoints are Resource subclasses that live elsewhere.
 */
namespace Server
{

class Path;
class Request;
class Response;

/**
 * Routes requests to resources, by path, and turns what the resources throw into error responses.
 *
 * HttpServer subclasses this with the networking. Tests subclass it to make requests directly.
 */
class Server
{
public:
    virtual ~Server();

    /**
     * Construct a resource at a path.
     *
     * @tparam ResourceType A subclass of Resource.
     * @param path Where to put it. Nothing can be there already, either at the path, under it or above it.
     * @param args The resource's constructor arguments.
     * @return The new resource, which the server also keeps.
     * @throws std::runtime_error If the path is taken.
     */
    template <typename ResourceType, typename... Args>
    std::shared_ptr<ResourceType> addResource(const Path &path, Args &&...args)
    {
        std::shared_ptr<Resource> &node = getOrCreateLeafNode(path);
        auto resource = std::make_shared<ResourceType>(std::forward<Args>(args)...);
        logResourceAdded(path);
        node = resource;
        return resource;
    }

protected:
    explicit Server(Log::Log &log);

    /**
     * Handle a request, including any exception thrown while handling it.
     *
     * @param response The response object for the request.
     * @param request The request object. The path for this is manipulated so that when it's passed to the Resource, the
     *                path is relative to that resource.
     * @param requestLog Where to log errors from handling the request.
     */
    Awaitable<void> operator()(Response &response, Request &request, Log::Context &requestLog) const;

    Log::Log &log;

    /**
     * Where changes to the resource tree are logged.
     */
    Log::Context logContext;

private:
    /**
     * Find the empty slot for a new resource, creating the intermediate nodes on the way.
     *
     * @throws std::runtime_error If the path is taken, as for addResource.
     */
    std::shared_ptr<Resource> &getOrCreateLeafNode(const Path &path);

    void logResourceAdded(const Path &path);

    /**
     * The root of the resource tree. Null until the first resource is added.
     */
    std::shared_ptr<Resource> root;
};

} // namespace Server

/// @}
