#pragma once

#include "remote/RemoteObject.hpp"
#include "server/SynchronousResource.hpp"

namespace Remote
{

class Catalog;

} // namespace Remote

/**
 * @defgroup api API
 *
 * Stuff (e.g: resources) that implement the API that the server exposes via HTTP.
 */
/// @addtogroup api
/// @{

/**
 * Stuff (e.g: resources) that implement the API that the server exposes via HTTP.
 */
namespace Api
{

/**
 * A resource that does something with the object whose ID is the request path.
 */
class ObjectResource : public Server::SynchronousResource
{
public:
    ~ObjectResource() override;
    explicit ObjectResource(const Remote::Catalog &catalog) : catalog(catalog) {}

    bool getAllowNonEmptyPath() const noexcept override;

protected:
    /**
     * Get the object a request is about.
     *
     * @throws Server::Error If the path isn't the ID of an object.
     */
    Remote::RemoteObject getObject(const Server::Request &request) const;

    /**
     * Write a JSON reply.
     */
    static void writeJson(Server::Response &response, const std::string &json);

private:
    const Remote::Catalog &catalog;
};

} // namespace Api

/// @}
