#pragma once

#include "ObjectResource.hpp"

namespace Cache
{

class DiskCache;

} // namespace Cache

namespace Api
{

/**
 * Reports whether an object is cached (GET), or starts caching it (POST).
 *
 * The reply is `{ "cached": bool }`. POST doesn't wait for the object to be cached.
 */
class CacheResource final : public ObjectResource
{
public:
    ~CacheResource() override;
    explicit CacheResource(const Remote::Catalog &catalog, Cache::DiskCache &cache) :
        ObjectResource(catalog), cache(cache)
    {
    }

    void getSync(Server::Response &response, const Server::Request &request) override;
    void postSync(Server::Response &response, const Server::Request &request) override;

private:
    void writeStatus(Server::Response &response, const Remote::RemoteObject &object) const;

    Cache::DiskCache &cache;
};

} // namespace Api
