#include "Resource.hpp"

#include "Error.hpp"
#include "Request.hpp"
#include "Response.hpp"

#include "util/asio.hpp"

#include <utility>

Server::Resource::~Resource() = default;

bool Server::Resource::getAllowNonEmptyPath() const noexcept
{
    return false;
}

size_t Server::Resource::getMaxRequestLength() const noexcept
{
    return 0;
}

Awaitable<void> Server::Resource::getAsync(Response &, Request &)
{
    unsupportedHttpVerb("GET");
}

Awaitable<void> Server::Resource::postAsync(Response &, Request &)
{
    unsupportedHttpVerb("POST");
}

Awaitable<void> Server::Resource::optionsAsync(Response &response, Request &)
{
    // This is mostly for CORS preflight. 200 is an acceptable response to OPTIONS.
    response.setHeader(boost::beast::http::field::allow, "OPTIONS, GET, HEAD, POST");
    response.setHeader(boost::beast::http::field::access_control_allow_methods, "OPTIONS, GET, HEAD, POST");
    response.setHeader(boost::beast::http::field::access_control_allow_headers, "Range");
    response.setCacheKind(CacheKind::none);
    co_return;
}

Awaitable<void> Server::Resource::operator()(Response &response, Request &request)
{
    switch (request.getType()) {
        case Request::Type::get: return getAsync(response, request);
        case Request::Type::post: return postAsync(response, request);
        case Request::Type::options: return optionsAsync(response, request);
    }
    std::unreachable();
}

void Server::Resource::unsupportedHttpVerb(const std::string &verb) const
{
    throw Error(ErrorKind::UnsupportedType, verb + " is not supported by this resource");
}
