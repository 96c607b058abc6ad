#pragma once

#include "RemoteObject.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace Remote
{

/**
 * A file sent as a generic document.
 */
struct Document final
{
    uint64_t size = 0;
    std::optional<std::string> mimeType;
    std::optional<std::string> fileName;
};

/**
 * A file sent as a video.
 */
struct Video final
{
    uint64_t size = 0;
    std::optional<std::string> mimeType;
    std::optional<std::string> fileName;
};

/**
 * A file sent as audio.
 */
struct Audio final
{
    uint64_t size = 0;
    std::optional<std::string> mimeType;
    std::optional<std::string> fileName;
};

/**
 * A photo. The backend doesn't report a MIME type or file name for these.
 */
struct Photo final
{
    uint64_t size = 0;
};

/**
 * The media a message carries.
 */
using Media = std::variant<Document, Video, Audio, Photo>;

/**
 * An entry from the catalog that describes where an object is in the backend and what kind of media it is.
 */
struct Attachment final
{
    std::string id;
    std::string containerRef;
    std::string locator;

    /**
     * The name given to the entry by the catalog. If empty, the media's file name (if any) is used.
     */
    std::string name;

    bool folder = false;
    Media media;

    /**
     * Get the object this attachment describes.
     *
     * This resolves all the differences between the kinds of media, so nothing else has to.
     */
    RemoteObject normalize() const;
};

} // namespace Remote
