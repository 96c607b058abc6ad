#pragma once

#include <nlohmann/json.hpp>

#include <functional>
#include <initializer_list>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

/// @addtogroup util
/// @{

/**
 * Namespace for JSON stuff.
 */
namespace Json
{

/**
 * A tool for deserializing a JSON object.
 *
 * This keeps track of the keys that are asked for, so it can reject objects with keys that weren't asked for. When
 * deserializing a member fails in a nested ObjectDeserializer, the failure is reported with the whole path to the
 * problem, e.g: "cache.workers" or "objects[3].video.size".
 */
class ObjectDeserializer final
{
private:
    /**
     * An enum value and its name.
     *
     * Using this gives a unified type to give to convertWithIntNameMap, and thus generates much less redundant code for
     * conversion of enums.
     */
    struct IntName
    {
        template <typename T> requires(std::is_enum_v<T>)
        IntName(T value, const char *name) : value((int)value), name(name) {}

        int value;
        const char *name;
    };

public:
    /**
     * An exception object that's thrown if deserialization failed.
     */
    class Exception final : public std::runtime_error
    {
    public:
        ~Exception() override;

        /**
         * Get the path to the key that's the problem, or std::nullopt if it's the object itself.
         */
        const std::optional<std::string> &getKey() const
        {
            return key;
        }

        /**
         * Get an explanation of the exception.
         */
        const std::string &getMessage() const
        {
            return message;
        }

    private:
        friend class ObjectDeserializer;
        explicit Exception(std::optional<std::string> key, std::string_view message);

        /**
         * Get this exception, as seen from the object that contains the one it came from.
         *
         * @param outerKey The key (or array index, like "[3]") of the object this exception came from.
         */
        Exception nest(std::string_view outerKey) const;

        const std::optional<std::string> key;
        const std::string message;
    };

    ~ObjectDeserializer();

    /**
     * Check to make sure a JSON value is an object, and throw an exception if not.
     *
     * @param j The JSON value to deserialize.
     */
    explicit ObjectDeserializer(const nlohmann::json &j);

    /**
     * Initialize a value from a JSON object, leaving it unchanged if it does not exist.
     *
     * @param dst The object to initialize.
     * @param key The name of the value in j.
     * @param required Throw an exception if the key does not exist.
     */
    template <typename T>
    void operator()(T &dst, const char *key, bool required = false)
    {
        convertWithLambda(key, required, [&dst](const nlohmann::json &j2) {
            dst = j2.get<typename UnwrapOptional<T>::type>();
        });
    }

    /**
     * Initialize a vector from a JSON array, leaving it unchanged if it does not exist.
     *
     * Failures in the elements are reported with the element's index.
     */
    template <typename T>
    void operator()(std::vector<T> &dst, const char *key, bool required = false)
    {
        convertWithLambda(key, required, [&dst](const nlohmann::json &j2) {
            if (!j2.is_array()) {
                throw Exception(std::nullopt, "Value is not an array.");
            }
            std::vector<T> result;
            result.reserve(j2.size());
            for (size_t i = 0; i < j2.size(); i++) {
                try {
                    result.push_back(j2[i].get<T>());
                }
                catch (const Exception &e) {
                    throw e.nest("[" + std::to_string(i) + "]");
                }
            }
            dst = std::move(result);
        });
    }

    /**
     * Initialize an enum value from a JSON string, leaving it unchanged if it does not exist.
     *
     * @param dst The object to initialize.
     * @param key The name of the value in j.
     * @param required Throw an exception if the key does not exist.
     * @param values A mapping between string and corresponding enum value.
     */
    template <typename T> requires(std::is_enum_v<T>)
    void operator()(T &dst, const char *key, bool required, const std::initializer_list<IntName> &values)
    {
        std::optional<int> result = convertWithIntNameMap(key, required, values);
        if (result) {
            dst = (T)*result;
        }
    }
    template <typename T> requires(std::is_enum_v<T>)
    void operator()(T &dst, const char *key, const std::initializer_list<IntName> &values)
    {
        (*this)(dst, key, false, values);
    }

    /**
     * Check the elements of the JSON object to make sure every element is in the set of valid keys.
     */
    void operator()() const;

private:
    /**
     * Get the JSON value's iterator for a given key directly.
     *
     * @param key The name of the value in j.
     * @param required Throw an exception if the key does not exist.
     * @return The JSON value's iterator, or the end iterator if the key doesn't exist.
     */
    nlohmann::json::const_iterator getIteratorForKey(const char *key, bool required);

    /**
     * Convert from a JSON value to a C++ value using a lambda.
     *
     * @param key The name of the value in j.
     * @param required Throw an exception if the key does not exist.
     * @param fn The function to convert from JSON value to C++ value.
     */
    void convertWithLambda(const char *key, bool required, const std::function<void (const nlohmann::json &)> &fn);

    /**
     * Converts from a string and a map between integer and string to the corresponding integer.
     *
     * @param key The name of the value in j.
     * @param required Throw an exception if the key does not exist.
     * @param values A mapping between string and corresponding enum value.
     * @return The integer value corresponding to the string if converted, and std::nullopt if the key does not exist.
     */
    std::optional<int> convertWithIntNameMap(const char *key, bool required,
                                             const std::initializer_list<IntName> &values);

    /**
     * Remove std::optional from a type.
     */
    template <typename T> struct UnwrapOptional final { using type = T; };
    template <typename T> struct UnwrapOptional<std::optional<T>> final { using type = T; };

    const nlohmann::json &j;
    std::set<std::string, std::less<>> validKeys;
};

/**
 * Parse a JSON string.
 *
 * This avoids code-generating an entire JSON parser repeatedly.
 *
 * @param jsonString The string representation of a JSON value.
 * @param allowComments Whether or not to allow comments, as the config and catalog files do.
 * @return The parsed JSON value.
 */
nlohmann::json parse(std::string_view jsonString, bool allowComments = false);

/**
 * Dump a JSON value to a compact string.
 *
 * As with parse, this avoids code-generating an entire JSON serializer repeatedly.
 */
std::string dump(const nlohmann::json &json);

} // namespace Json

/// @}
