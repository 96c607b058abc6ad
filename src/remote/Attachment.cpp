#include "Attachment.hpp"

namespace
{

/**
 * The details that differ between kinds of media.
 */
struct MediaDetails final
{
    uint64_t size;
    std::string mimeType;
    std::optional<std::string> fileName;
};

/**
 * Get the details of a kind of media that has its own MIME type and file name.
 *
 * @param defaultMimeType The MIME type to use if the backend didn't supply one.
 */
template <typename T>
MediaDetails getDetails(const T &media, const char *defaultMimeType)
{
    return { media.size, media.mimeType.value_or(defaultMimeType), media.fileName };
}

MediaDetails getDetails(const Remote::Media &media)
{
    struct Visitor final
    {
        MediaDetails operator()(const Remote::Document &document) const
        {
            return getDetails(document, "application/octet-stream");
        }
        MediaDetails operator()(const Remote::Video &video) const
        {
            return getDetails(video, "video/mp4");
        }
        MediaDetails operator()(const Remote::Audio &audio) const
        {
            return getDetails(audio, "audio/mpeg");
        }
        MediaDetails operator()(const Remote::Photo &photo) const
        {
            return { photo.size, "image/jpeg", std::nullopt };
        }
    };
    return std::visit(Visitor{}, media);
}

} // namespace

Remote::RemoteObject Remote::Attachment::normalize() const
{
    MediaDetails details = getDetails(media);

    /* Pick a name. Fall back to the ID so there's always something for Content-Disposition. */
    std::string objectName = name;
    if (objectName.empty()) {
        objectName = details.fileName.value_or(id);
    }

    return {
        .id = id,
        .size = details.size,
        .containerRef = containerRef,
        .locator = locator,
        .mimeType = std::move(details.mimeType),
        .name = std::move(objectName),
        .folder = folder
    };
}
