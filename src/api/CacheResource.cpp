#include "CacheResource.hpp"

#include "cache/DiskCache.hpp"
#include "server/Error.hpp"
#include "util/json.hpp"

Api::CacheResource::~CacheResource() = default;

void Api::CacheResource::getSync(Server::Response &response, const Server::Request &request)
{
    writeStatus(response, getObject(request));
}

void Api::CacheResource::postSync(Server::Response &response, const Server::Request &request)
{
    Remote::RemoteObject object = getObject(request);
    if (!cache.getEnabled()) {
        throw Server::Error(Server::ErrorKind::Conflict, "The cache is disabled.");
    }
    cache.warm(object);
    writeStatus(response, object);
}

void Api::CacheResource::writeStatus(Server::Response &response, const Remote::RemoteObject &object) const
{
    nlohmann::json j;
    j["cached"] = cache.isCached(object.id, object.size);
    writeJson(response, Json::dump(j));
}
