#pragma once

#include "RemoteObject.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace Remote
{

/**
 * Looks up the objects that can be streamed.
 *
 * The catalog owns the metadata for objects. Size corrections found by probing the backend get pushed back to it.
 */
class Catalog
{
public:
    virtual ~Catalog();

    /**
     * Find an object by ID.
     *
     * @return The normalized object, or std::nullopt if there's no such object.
     */
    virtual std::optional<RemoteObject> resolve(std::string_view id) const = 0;

    /**
     * Record that the object's real size differs from what the catalog said.
     */
    virtual void updateSize(std::string_view id, uint64_t size) = 0;

protected:
    Catalog() = default;
};

} // namespace Remote
