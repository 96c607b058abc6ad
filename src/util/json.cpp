#include "json.hpp"

using namespace std::string_literals;

Json::ObjectDeserializer::Exception::~Exception() = default;
Json::ObjectDeserializer::Exception::Exception(std::optional<std::string> key, std::string_view message) :
    std::runtime_error(key ? "Error parsing JSON object at key \"" + *key + "\": " + std::string(message) :
                             ("Error parsing JSON object: " + std::string(message))),
    key(std::move(key)), message(message)
{
}

Json::ObjectDeserializer::Exception Json::ObjectDeserializer::Exception::nest(std::string_view outerKey) const
{
    std::string path(outerKey);
    if (key) {
        path += (key->starts_with('[') ? "" : ".") + *key;
    }
    return Exception(std::move(path), message);
}

Json::ObjectDeserializer::~ObjectDeserializer() = default;

Json::ObjectDeserializer::ObjectDeserializer(const nlohmann::json &j) : j(j)
{
    if (!j.is_object()) {
        throw Exception(std::nullopt, "Value is not an object.");
    }
}

void Json::ObjectDeserializer::operator()() const
{
    for (const auto &[key, value]: j.items()) {
        if (!validKeys.contains(key)) {
            throw Exception(key, "Unknown key.");
        }
    }
}

nlohmann::json::const_iterator Json::ObjectDeserializer::getIteratorForKey(const char *key, bool required)
{
    /* Record that we've asked for this key so operator() doesn't complain about it. */
    validKeys.insert(key);

    auto it = j.find(key);
    if (required && it == j.end()) {
        throw Exception(key, "Required key not found.");
    }
    return it;
}

void Json::ObjectDeserializer::convertWithLambda(const char *key, bool required,
                                                 const std::function<void (const nlohmann::json &)> &fn)
{
    auto it = getIteratorForKey(key, required);
    if (it == j.end()) {
        return;
    }

    try {
        fn(*it);
    }
    catch (const Exception &e) {
        // From a nested object.
        throw e.nest(key);
    }
    catch (const nlohmann::json::type_error &e) {
        throw Exception(key, "Value has incorrect type: "s + e.what() + ".");
    }
    catch (const nlohmann::json::out_of_range &e) {
        throw Exception(key, "Value is out of range: "s + e.what() + ".");
    }
}

std::optional<int> Json::ObjectDeserializer::convertWithIntNameMap(const char *key, bool required,
                                                                   const std::initializer_list<IntName> &values)
{
    auto it = getIteratorForKey(key, required);
    if (it == j.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw Exception(key, "Value is not a string.");
    }
    std::string string = it->get<std::string>();

    for (auto [value, name]: values) {
        if (string == name) {
            return value;
        }
    }

    /* List the alternatives. */
    std::string possibleValues;
    for (auto [value, name]: values) {
        possibleValues += (possibleValues.empty() ? "\""s : ", \""s) + name + "\"";
    }
    throw Exception(key, "Value is \"" + string + "\", not any of: " + possibleValues + ".");
}

nlohmann::json Json::parse(std::string_view jsonString, bool allowComments)
{
    return nlohmann::json::parse(jsonString, nullptr, true, allowComments);
}

std::string Json::dump(const nlohmann::json &json)
{
    return json.dump();
}
