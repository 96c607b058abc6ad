#pragma once

#include <cstdint>
#include <string>

/**
 * @defgroup remote Remote Objects
 *
 * The interface to the message backend that stores the objects we stream.
 */
/// @addtogroup remote
/// @{

/**
 * Stuff for talking to the message backend.
 */
namespace Remote
{

/**
 * A streamable object stored as an attachment in the message backend.
 *
 * This is resolved once per request. Everything downstream of resolution uses this rather than the attachment it came
 * from.
 */
struct RemoteObject final
{
    /**
     * The stable identifier used for cache paths and URLs.
     */
    std::string id;

    /**
     * The size in bytes. This might be stale until a client has been asked for the object's handle.
     */
    uint64_t size = 0;

    /**
     * The container (e.g: channel) that holds the message that references the object.
     */
    std::string containerRef;

    /**
     * Where the object is within the container.
     */
    std::string locator;

    std::string mimeType;

    /**
     * The file name to present to clients.
     */
    std::string name;

    /**
     * Whether this is a directory-like entry rather than something with content.
     */
    bool folder = false;

    bool operator==(const RemoteObject &) const = default;
};

} // namespace Remote

/// @}
