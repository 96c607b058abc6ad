#include "SynchronousResource.hpp"

#include "Request.hpp"

#include "util/asio.hpp"

Server::SynchronousResource::~SynchronousResource() = default;

Awaitable<void> Server::SynchronousResource::operator()(Response &response, Request &request)
{
    // Throws if there's a body, since the limit is zero.
    co_await request.readAll();

    switch (request.getType()) {
        case Request::Type::get:
            getSync(response, request);
            break;
        case Request::Type::post:
            postSync(response, request);
            break;
        case Request::Type::options:
            co_await optionsAsync(response, request);
            break;
    }
}

void Server::SynchronousResource::getSync(Response &, const Request &)
{
    unsupportedHttpVerb("GET");
}

void Server::SynchronousResource::postSync(Response &, const Request &)
{
    unsupportedHttpVerb("POST");
}
