#pragma once

#include <string>
#include <string_view>

namespace Server
{

/**
 * The ways a resource can refuse a request.
 *
 * Each maps to one HTTP status (in HttpServer). The HTTP layer can still produce statuses of its own, e.g: for a
 * request it couldn't parse.
 */
enum class ErrorKind
{
    /// 400: the request doesn't make sense for this resource, e.g: an object ID with a '/' in it.
    BadRequest,

    /// 403.
    Forbidden,

    /// 404: no such resource, object, or file.
    NotFound,

    /// 405: the resource doesn't handle this Request::Type.
    UnsupportedType,

    /// 409: the request is valid, but not right now. Asking to warm the cache while it's disabled is one of these.
    Conflict,

    /**
     * 416: the Range header starts at or after the end of the object.
     *
     * The response has to say how big the object is in its Content-Range header, so the resource sets that header
     * before throwing.
     */
    RangeNotSatisfiable,

    /// 503: the object exists but there's no client free to read it, and no download API to fall back on.
    Unavailable,

    /// 500: anything else.
    Internal
};

/**
 * Thrown from a resource to fail the request.
 *
 * When nothing has been written to the response yet, the response is turned into an error response with this kind and
 * message. Otherwise, all that can be done is to log it and cut the response short.
 */
struct Error final
{
    Error(ErrorKind kind, std::string_view message = {}) : kind(kind), message(message) {}
    Error(ErrorKind kind, const char *message) : kind(kind), message(message) {}
    Error(ErrorKind kind, std::string message) : kind(kind), message(std::move(message)) {}

    ErrorKind kind;

    /// Sent as the body of the error response. Empty for the bare status text.
    std::string message;
};

} // namespace Server
