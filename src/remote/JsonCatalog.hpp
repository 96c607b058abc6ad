#pragma once

#include "Attachment.hpp"
#include "Catalog.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace Remote
{

/**
 * A catalog loaded from a JSON file of attachments.
 *
 * The file is an object with an "objects" key, which is a list of attachments. Each attachment has "id", "container",
 * "locator", and optionally "name" and "folder" keys, along with exactly one of "document", "video", "audio", or
 * "photo" describing its media. Size corrections are kept in memory only.
 */
class JsonCatalog final : public Catalog
{
public:
    ~JsonCatalog() override;

    /**
     * Load the catalog from a file.
     *
     * @throws Json::ObjectDeserializer::Exception, std::runtime_error if the file isn't a valid catalog.
     */
    explicit JsonCatalog(const std::filesystem::path &path);

    /**
     * Load the catalog from a JSON string.
     */
    static JsonCatalog fromJson(std::string_view jsonString);

    std::optional<RemoteObject> resolve(std::string_view id) const override;
    void updateSize(std::string_view id, uint64_t size) override;

    /**
     * Get the number of objects in the catalog.
     */
    size_t size() const
    {
        return objects.size();
    }

private:
    explicit JsonCatalog(std::vector<Attachment> attachments);

    /**
     * Parse the attachments from the catalog's JSON representation.
     */
    static std::vector<Attachment> parse(std::string_view jsonString);

    std::map<std::string, RemoteObject, std::less<>> objects;
};

} // namespace Remote
