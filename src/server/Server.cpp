#include "Server.hpp"

#include "Request.hpp"
#include "Response.hpp"

#include "log/Log.hpp"
#include "util/asio.hpp"

#include <cassert>
#include <map>
#include <optional>
#include <stdexcept>

/// @addtogroup server
/// @{
/// @defgroup server_implementation Implementation
/// @}

/// @addtogroup server_implementation
/// @{

namespace
{

/**
 * Get the name of an error kind, for the log.
 */
const char *getErrorKindString(Server::ErrorKind kind)
{
    switch (kind) {
        case Server::ErrorKind::BadRequest: return "Bad request";
        case Server::ErrorKind::Forbidden: return "Forbidden";
        case Server::ErrorKind::NotFound: return "Not found";
        case Server::ErrorKind::UnsupportedType: return "Unsupported request type";
        case Server::ErrorKind::Conflict: return "Conflict";
        case Server::ErrorKind::RangeNotSatisfiable: return "Range not satisfiable";
        case Server::ErrorKind::Unavailable: return "Unavailable";
        case Server::ErrorKind::Internal: return "Internal";
    }
    return "Unknown";
}

/**
 * Apply a resource's restrictions to a request it's about to handle.
 */
void checkResourceRestrictions(const Server::Resource &resource, Server::Request &request)
{
    if (!resource.getAllowNonEmptyPath() && !request.getPath().empty()) {
        throw Server::Error(Server::ErrorKind::NotFound);
    }

    request.setMaxLength(resource.getMaxRequestLength());
}

/**
 * An intermediate node of the resource tree, such as "/stream" or "/hls", which hands requests on to its children.
 */
class TreeResource final : public Server::Resource
{
public:
    ~TreeResource() override = default;

    /**
     * Pass the request to the child named by the path's first part, with that part removed.
     */
    Awaitable<void> operator()(Server::Response &response, Server::Request &request) override
    {
        /* There's no listing of a node's children. */
        if (request.getPath().empty()) {
            throw Server::Error(Server::ErrorKind::Forbidden);
        }

        auto it = children.find(request.getPath().front());
        if (it == children.end()) {
            throw Server::Error(Server::ErrorKind::NotFound);
        }

        std::shared_ptr<Resource> child = it->second;
        assert(child);

        request.popPathPart();
        checkResourceRestrictions(*child, request);
        co_await (*child)(response, request);
    }

    /**
     * Get the slot for a child, creating an empty one if there isn't one.
     */
    std::shared_ptr<Server::Resource> &operator[](std::string_view child)
    {
        return children[std::string(child)];
    }

    bool getAllowNonEmptyPath() const noexcept override
    {
        return true;
    }

    bool empty() const
    {
        return children.empty();
    }

    /**
     * Remove empty slots, and nodes left with no children, after adding a resource failed part way.
     */
    void prune()
    {
        for (auto it = children.begin(); it != children.end();) {
            if (!it->second) {
                children.erase(it++);
                continue;
            }
            if (auto *tree = dynamic_cast<TreeResource *>(it->second.get())) {
                tree->prune();
                if (tree->empty()) {
                    children.erase(it++);
                    continue;
                }
            }
            ++it;
        }
    }

private:
    std::map<std::string, std::shared_ptr<Server::Resource>> children;
};

} // namespace

/// @}

Server::Server::~Server() = default;

Server::Server::Server(Log::Log &log) : log(log), logContext(log("server"))
{
}

Awaitable<void> Server::Server::operator()(Response &response, Request &request, Log::Context &requestLog) const
{
    std::optional<Error> error;
    try {
        std::shared_ptr<Resource> currentRoot = root;
        if (!currentRoot) {
            throw Error(ErrorKind::NotFound);
        }
        checkResourceRestrictions(*currentRoot, request);
        co_await (*currentRoot)(response, request);
        co_await response.flush(true);
        co_return;
    }
    catch (const Error &e) {
        requestLog << "error" << (response.getWriteStarted() ? Log::Level::error : Log::Level::info)
                   << getErrorKindString(e.kind) << (response.getWriteStarted() ? " after writing started" : "")
                   << (e.message.empty() ? "" : ": ") << e.message;
        error = e;
    }
    catch (const std::exception &e) {
        // The client only gets a generic internal error, since the message could say anything.
        requestLog << "error" << Log::Level::error << "Exception"
                   << (response.getWriteStarted() ? " after writing started" : "") << ": " << e.what();
        error = Error(ErrorKind::Internal);
    }

    /* Once the status has been sent, all that can be done is to cut the body short. */
    if (response.getWriteStarted()) {
        response.abort();
        co_return;
    }
    response.setErrorAndMessage(error->kind, error->message);
    co_await response.flush(true);
}

std::shared_ptr<Server::Resource> &Server::Server::getOrCreateLeafNode(const Path &path)
{
    std::shared_ptr<Resource> *node = &root;
    for (size_t i = 0; i < path.size(); ++i) {
        if (!*node) {
            *node = std::make_shared<TreeResource>();
        }

        auto *tree = dynamic_cast<TreeResource *>(node->get());
        if (!tree) {
            // Undo any nodes created on the way here.
            if (auto *rootTree = dynamic_cast<TreeResource *>(root.get())) {
                rootTree->prune();
            }
            throw std::runtime_error("Cannot add \"" + (std::string)path + "\" inside another server resource.");
        }
        node = &(*tree)[path[i]];
    }

    if (dynamic_cast<TreeResource *>(node->get())) {
        throw std::runtime_error("Path \"" + (std::string)path + "\" already has server resources under it.");
    }
    if (*node) {
        throw std::runtime_error("Path \"" + (std::string)path + "\" points to existing server resource.");
    }
    return *node;
}

void Server::Server::logResourceAdded(const Path &path)
{
    logContext << "added" << Log::Level::info << (std::string)path;
}
