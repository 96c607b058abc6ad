#pragma once

#include "CacheKind.hpp"
#include "Error.hpp"

#include "util/awaitable.hpp"

#include <boost/beast/http/field.hpp>

#include <cassert>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace Server
{

/**
 * The response a Resource writes to.
 *
 * A resource first describes the response (error, partial content, length, MIME type, caching, extra headers), and
 * then writes the body. The description is sent with the first flush, so none of the setters may be called once the
 * body has been started. Flushing with no body written sends just the headers.
 *
 * HttpServer turns this into an HTTP response. Tests record what was written instead.
 */
class Response
{
public:
    virtual ~Response();

    Response(const Response &) = delete;
    Response &operator=(const Response &) = delete;

    /**
     * Determine whether anything has been written or flushed, after which the headers can't be changed.
     */
    bool getWriteStarted() const
    {
        return writeStarted;
    }

    void setError(ErrorKind kind)
    {
        beforeWrite();
        errorKind = kind;
    }

    /**
     * Make this an error response, with a plain text message as the body.
     *
     * Any partial content flag or declared length is forgotten. Nothing but flush should be called afterwards.
     */
    void setErrorAndMessage(ErrorKind kind, std::string_view message = {});

    /**
     * Set how long clients may cache the response. The default is CacheKind::fixed.
     */
    void setCacheKind(CacheKind kind)
    {
        beforeWrite();
        cacheKind = kind;
    }

    /**
     * Set the Content-Type. By default there isn't one.
     */
    void setMimeType(std::string type)
    {
        beforeWrite();
        mimeType = std::move(type);
    }

    /**
     * Mark the body as a range of the resource, rather than all of it (206 Partial Content).
     */
    void setPartial()
    {
        beforeWrite();
        partial = true;
    }

    /**
     * Declare how many bytes the body will have, which must then be written exactly.
     *
     * Without this, the length is only sent when the whole body is written before the first flush.
     */
    void setContentLength(uint64_t length)
    {
        beforeWrite();
        contentLength = length;
    }

    /**
     * Set a header that the response has no setter of its own for, like Content-Range.
     */
    void setHeader(boost::beast::http::field name, std::string value)
    {
        beforeWrite();
        extraHeaders[name] = std::move(value);
    }

    /**
     * Determine whether the body will be dropped, as for a HEAD request.
     *
     * Resources can skip producing the body in that case, once the headers are set.
     */
    virtual bool getBodyDiscarded() const
    {
        return false;
    }

    /**
     * Give up on a response whose body has been started but can't be finished.
     *
     * The transport makes sure the client can tell the body is truncated. For HTTP, the connection is closed.
     */
    void abort()
    {
        aborted = true;
    }

    bool getAborted() const
    {
        return aborted;
    }

    /**
     * Append to the body.
     *
     * The data may be buffered until the next flush.
     */
    Response &operator<<(std::vector<std::byte> data)
    {
        writeBody(std::move(data));
        writeStarted = true; // After writeBody, so it can tell the first write apart.
        return *this;
    }

    Response &operator<<(std::span<const std::byte> data)
    {
        return (*this) << std::vector<std::byte>(data.begin(), data.end());
    }

    Response &operator<<(std::string_view string)
    {
        return (*this) << std::as_bytes(std::span(string.data(), string.size()));
    }

    /**
     * Wait until what's been written so far has been sent, or mostly sent.
     *
     * Resources that produce a long body call this as they go, so the body isn't all held in memory.
     *
     * @param end Whether this is the end of the body. Only Server::operator() passes true, after the resource returns.
     */
    Awaitable<void> flush(bool end = false);

protected:
    Response() = default;

    /* What the resource set, for the transport to send with the first flush. */

    std::optional<ErrorKind> getErrorKind() const
    {
        return errorKind;
    }

    CacheKind getCacheKind() const
    {
        return cacheKind;
    }

    const std::string &getMimeType() const
    {
        return mimeType;
    }

    bool getPartial() const
    {
        return partial;
    }

    std::optional<uint64_t> getContentLength() const
    {
        return contentLength;
    }

    const std::map<boost::beast::http::field, std::string> &getExtraHeaders() const
    {
        return extraHeaders;
    }

private:
    void beforeWrite() const
    {
        assert(!getWriteStarted());
    }

    /**
     * Take some body data.
     */
    virtual void writeBody(std::vector<std::byte> data) = 0;

    /**
     * Send what writeBody took, and the headers if they haven't been sent.
     */
    virtual Awaitable<void> flushBody(bool end) = 0;

    std::optional<ErrorKind> errorKind;
    CacheKind cacheKind = CacheKind::fixed;
    std::string mimeType;
    std::optional<uint64_t> contentLength;
    std::map<boost::beast::http::field, std::string> extraHeaders;
    bool partial = false;
    bool writeStarted = false;
    bool aborted = false;
};

} // namespace Server
