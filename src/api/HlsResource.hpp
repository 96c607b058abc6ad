#pragma once

#include "ObjectResource.hpp"

namespace Hls
{

class Pipeline;

} // namespace Hls

namespace Api
{

/**
 * Reports whether an object has an HLS playlist (GET), or starts transcoding it if not (POST).
 *
 * The reply is `{ "ready": bool, "url": string }`.
 */
class HlsResource final : public ObjectResource
{
public:
    ~HlsResource() override;
    explicit HlsResource(const Remote::Catalog &catalog, Hls::Pipeline &pipeline) :
        ObjectResource(catalog), pipeline(pipeline)
    {
    }

    void getSync(Server::Response &response, const Server::Request &request) override;
    void postSync(Server::Response &response, const Server::Request &request) override;

private:
    void writeStatus(Server::Response &response, const Remote::RemoteObject &object) const;

    Hls::Pipeline &pipeline;
};

} // namespace Api
