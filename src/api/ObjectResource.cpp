#include "ObjectResource.hpp"

#include "cache/DiskCache.hpp"
#include "remote/Catalog.hpp"
#include "server/Request.hpp"
#include "server/Response.hpp"

Api::ObjectResource::~ObjectResource() = default;

bool Api::ObjectResource::getAllowNonEmptyPath() const noexcept
{
    return true;
}

Remote::RemoteObject Api::ObjectResource::getObject(const Server::Request &request) const
{
    if (request.getPath().size() != 1) {
        throw Server::Error(Server::ErrorKind::NotFound);
    }
    const std::string &id = request.getPath().front();
    try {
        Cache::DiskCache::checkId(id);
    }
    catch (const std::invalid_argument &e) {
        throw Server::Error(Server::ErrorKind::BadRequest, e.what());
    }

    std::optional<Remote::RemoteObject> object = catalog.resolve(id);
    if (!object) {
        throw Server::Error(Server::ErrorKind::NotFound);
    }
    return *object;
}

void Api::ObjectResource::writeJson(Server::Response &response, const std::string &json)
{
    response.setCacheKind(Server::CacheKind::none);
    response.setMimeType("application/json");
    response << json;
}
