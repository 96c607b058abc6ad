#include "JsonCatalog.hpp"

#include "util/json.hpp"
#include "util/util.hpp"

#include <stdexcept>

namespace Remote
{

/// Deserializes a Document.
static void from_json(const nlohmann::json &j, Document &out)
{
    Json::ObjectDeserializer d(j);
    d(out.size, "size", true);
    d(out.mimeType, "mimeType");
    d(out.fileName, "fileName");
    d();
}

/// Deserializes a Video.
static void from_json(const nlohmann::json &j, Video &out)
{
    Json::ObjectDeserializer d(j);
    d(out.size, "size", true);
    d(out.mimeType, "mimeType");
    d(out.fileName, "fileName");
    d();
}

/// Deserializes an Audio.
static void from_json(const nlohmann::json &j, Audio &out)
{
    Json::ObjectDeserializer d(j);
    d(out.size, "size", true);
    d(out.mimeType, "mimeType");
    d(out.fileName, "fileName");
    d();
}

/// Deserializes a Photo.
static void from_json(const nlohmann::json &j, Photo &out)
{
    Json::ObjectDeserializer d(j);
    d(out.size, "size", true);
    d();
}

/// Deserializes an Attachment, including whichever kind of media it has.
static void from_json(const nlohmann::json &j, Attachment &out)
{
    Json::ObjectDeserializer d(j);
    d(out.id, "id", true);
    d(out.containerRef, "container", true);
    d(out.locator, "locator", true);
    d(out.name, "name");
    d(out.folder, "folder");

    /* Exactly one kind of media is allowed. */
    std::optional<Document> document;
    std::optional<Video> video;
    std::optional<Audio> audio;
    std::optional<Photo> photo;
    d(document, "document");
    d(video, "video");
    d(audio, "audio");
    d(photo, "photo");
    d();

    int count = (int)document.has_value() + (int)video.has_value() + (int)audio.has_value() + (int)photo.has_value();
    if (count != 1) {
        throw std::runtime_error("Catalog entry \"" + out.id + "\" must have exactly one kind of media.");
    }
    if (document) {
        out.media = std::move(*document);
    }
    else if (video) {
        out.media = std::move(*video);
    }
    else if (audio) {
        out.media = std::move(*audio);
    }
    else {
        out.media = *photo;
    }
}

} // namespace Remote

Remote::JsonCatalog::~JsonCatalog() = default;

Remote::JsonCatalog::JsonCatalog(const std::filesystem::path &path) :
    JsonCatalog(parse([&path]() {
        std::vector<std::byte> data = Util::readFile(path);
        return std::string((const char *)data.data(), data.size());
    }()))
{
}

Remote::JsonCatalog::JsonCatalog(std::vector<Attachment> attachments)
{
    for (const Attachment &attachment: attachments) {
        auto [it, inserted] = objects.emplace(attachment.id, attachment.normalize());
        if (!inserted) {
            throw std::runtime_error("Duplicate catalog entry \"" + attachment.id + "\".");
        }
    }
}

Remote::JsonCatalog Remote::JsonCatalog::fromJson(std::string_view jsonString)
{
    return JsonCatalog(parse(jsonString));
}

std::vector<Remote::Attachment> Remote::JsonCatalog::parse(std::string_view jsonString)
{
    nlohmann::json j = Json::parse(jsonString, true);
    std::vector<Attachment> attachments;
    Json::ObjectDeserializer d(j);
    d(attachments, "objects", true);
    d();
    return attachments;
}

std::optional<Remote::RemoteObject> Remote::JsonCatalog::resolve(std::string_view id) const
{
    auto it = objects.find(id);
    if (it == objects.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Remote::JsonCatalog::updateSize(std::string_view id, uint64_t size)
{
    auto it = objects.find(id);
    if (it != objects.end()) {
        it->second.size = size;
    }
}
