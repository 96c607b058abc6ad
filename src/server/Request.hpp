#pragma once

#include "Path.hpp"

#include "util/awaitable.hpp"

#include <boost/beast/http/field.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Server
{

/**
 * A request for a resource: its type, its path relative to the resource handling it, some headers, and a body.
 *
 * HttpServer fills these in from HTTP requests. Tests make their own.
 */
class Request
{
public:
    enum class Type
    {
        /**
         * GET, and also HEAD. The response tells the two apart (Response::getBodyDiscarded).
         */
        get,

        post,

        /**
         * OPTIONS, which is answered with the allowed methods.
         */
        options
    };

    /**
     * The headers resources can see. HttpServer passes on the ones resources use, such as Range.
     */
    using Headers = std::map<boost::beast::http::field, std::string>;

    virtual ~Request();
    explicit Request(Path path, Type type, Headers headers = {}) :
        path(std::move(path)), type(type), headers(std::move(headers))
    {
    }

    /**
     * Remove the first part of the path, as the request is passed from a tree node to its child.
     */
    void popPathPart()
    {
        path.pop_front();
    }

    const Path &getPath() const
    {
        return path;
    }

    Type getType() const
    {
        return type;
    }

    /**
     * @return The header's value, or std::nullopt if the request didn't have it.
     */
    std::optional<std::string_view> getHeader(boost::beast::http::field field) const;

    /**
     * Read the next piece of the body.
     *
     * @return The data, or nothing at the end of the body.
     * @throws Error BadRequest, if the body is longer than the limit set with setMaxLength.
     */
    Awaitable<std::vector<std::byte>> readSome();

    /**
     * Read the rest of the body.
     */
    Awaitable<std::vector<std::byte>> readAll();

    /**
     * Limit the length of the body. The default is 0, so only resources that set a limit get a body.
     */
    void setMaxLength(size_t bytes)
    {
        maxLength = bytes;
        checkMaxLength();
    }

protected:
    /**
     * Get the next piece of the body, or nothing at the end of it.
     */
    virtual Awaitable<std::vector<std::byte>> doReadSome() = 0;

private:
    void checkMaxLength() const;

    Path path;
    const Type type;
    const Headers headers;

    size_t bytesRead = 0;
    size_t maxLength = 0;
};

} // namespace Server
