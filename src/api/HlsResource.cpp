#include "HlsResource.hpp"

#include "hls/Pipeline.hpp"
#include "util/json.hpp"

Api::HlsResource::~HlsResource() = default;

void Api::HlsResource::getSync(Server::Response &response, const Server::Request &request)
{
    writeStatus(response, getObject(request));
}

void Api::HlsResource::postSync(Server::Response &response, const Server::Request &request)
{
    Remote::RemoteObject object = getObject(request);
    pipeline.ensure(object);
    writeStatus(response, object);
}

void Api::HlsResource::writeStatus(Server::Response &response, const Remote::RemoteObject &object) const
{
    nlohmann::json j;
    j["ready"] = pipeline.isReady(object.id);
    j["url"] = pipeline.urlFor(object.id);
    writeJson(response, Json::dump(j));
}
