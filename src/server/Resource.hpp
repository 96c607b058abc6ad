#pragma once

#include "util/awaitable.hpp"

#include <cstddef>
#include <string>

namespace Server
{

class Request;
class Response;

/**
 * Something the server can route requests to.
 *
 * A resource registered at `/stream` gets `GET /stream/abc` with a request path of `abc`, if it accepts non-empty
 * paths.
 */
class Resource
{
public:
    virtual ~Resource();
    Resource() = default;

    /**
     * Per-verb handlers. The defaults fail with ErrorKind::UnsupportedType, except for OPTIONS, which answers CORS
     * preflights.
     *
     * @param request Its path is relative to this resource.
     */
    virtual Awaitable<void> getAsync(Response &response, Request &request);
    virtual Awaitable<void> postAsync(Response &response, Request &request);
    virtual Awaitable<void> optionsAsync(Response &response, Request &request);

    /// Calls the handler for the request's verb.
    virtual Awaitable<void> operator()(Response &response, Request &request);

    /// The longest request body this resource accepts. Zero unless overridden.
    virtual size_t getMaxRequestLength() const noexcept;

    /**
     * Whether requests for paths below this resource are routed to it.
     *
     * When false (the default), only requests for exactly this resource's path reach it.
     */
    virtual bool getAllowNonEmptyPath() const noexcept;

protected:
    /// Fail the request with ErrorKind::UnsupportedType.
    [[noreturn]] void unsupportedHttpVerb(const std::string &verb) const;
};

} // namespace Server
