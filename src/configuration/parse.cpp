#include "configuration.hpp"

#include "util/json.hpp"

#include <algorithm>
#include <filesystem>

/// @addtogroup configuration
/// @{
/// @defgroup configuration_implementation Implementation
/// @}

/// @addtogroup configuration_implementation
/// @{

using namespace std::string_literals;

namespace
{

/**
 * The largest number of parallel workers a fetch may use.
 */
constexpr unsigned int maxFetchWorkers = 8;

/**
 * Bounds on the target chunk size of a fetch.
 */
constexpr unsigned int minFetchChunkSize = 4 << 10;
constexpr unsigned int maxFetchChunkSize = 32 << 20;

/**
 * Get an exception for a configuration parse error.
 *
 * @param message The what() message for the exception.
 */
[[nodiscard]] auto parseException(std::string_view message)
{
    return Config::ParseException("Error parsing configuration: " + std::string(message));
}

/**
 * Get an exception for a configuration parse error at a given key.
 *
 * @param key The key in the configuration that is the problem.
 * @param message The reason this key is a problem.
 */
[[nodiscard]] auto parseException(const char *key, std::string_view message)
{
    std::string messageStr(message);
    return Config::ParseException(key ? "Error parsing configuration at key \""s + key + "\": " + messageStr :
                                        ("Error parsing configuration at root: " + messageStr));
}

/**
 * Clamp the parameters of a fetch mode to the range the fetch engine supports.
 */
void clampFetchMode(Config::FetchMode &mode)
{
    mode.workers = std::clamp(mode.workers, 1u, maxFetchWorkers);
    mode.chunkSize = std::clamp(mode.chunkSize, minFetchChunkSize, maxFetchChunkSize);
}

} // namespace

/// @}

// It's annoying that these have to be in the right namespace, and thus end up mis-documented.
namespace Config
{

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Network &out)
{
    Json::ObjectDeserializer d(j);
    d(out.port, "port");
    d();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Http &out)
{
    Json::ObjectDeserializer d(j);
    d(out.origin, "origin");
    d(out.cacheNonLiveTime, "cacheNonLiveTime");
    d();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Log &out)
{
    Json::ObjectDeserializer d(j);
    d(out.path, "path");
    d(out.print, "print");
    d(out.level, "level", {
        { ::Log::Level::debug, "debug" },
        { ::Log::Level::info, "info" },
        { ::Log::Level::warning, "warning" },
        { ::Log::Level::error, "error" },
        { ::Log::Level::fatal, "fatal" }
    });
    d();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Cache &out)
{
    Json::ObjectDeserializer d(j);
    d(out.enabled, "enabled");
    d(out.root, "root");
    d(out.maxSizeGb, "maxSizeGb");
    d(out.warmDelay, "warmDelay");
    d(out.workers, "workers");
    d(out.chunkSize, "chunkSize");
    d(out.hls, "hls");
    d();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, FetchMode &out)
{
    Json::ObjectDeserializer d(j);
    d(out.workers, "workers");
    d(out.chunkSize, "chunkSize");
    d();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Fetch &out)
{
    Json::ObjectDeserializer d(j);
    d(out.parallel, "parallel");
    d(out.stream, "stream");
    d(out.download, "download");
    d(out.probeTimeout, "probeTimeout");
    d();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Transcode &out)
{
    Json::ObjectDeserializer d(j);
    d(out.enabled, "enabled");
    d(out.ffmpeg, "ffmpeg");
    d(out.ffprobe, "ffprobe");
    d(out.segmentDuration, "segmentDuration");
    d(out.sourceWaitTimeout, "sourceWaitTimeout");
    d();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, BackendClient &out)
{
    /* Deserialize the short-hand form. */
    if (j.is_string()) {
        out.name = j.get<std::string>();
        return;
    }

    /* Deserialize the long form. */
    Json::ObjectDeserializer d(j);
    d(out.name, "name", true);
    d(out.fallback, "fallback");
    d(out.containers, "containers");
    d();
}

/// @ingroup configuration_implementation
static void from_json(const nlohmann::json &j, Backend &out)
{
    Json::ObjectDeserializer d(j);
    d(out.root, "root", true);
    d(out.clients, "clients");
    d();
}

} // namespace Config

Config::ParseException::~ParseException() = default;

Config::Root Config::Root::fromJson(std::string_view jsonString)
{
    /* Try to parse the string into a JSON value. */
    nlohmann::json j;
    try {
        j = Json::parse(jsonString, true);
    }
    catch (const nlohmann::json::parse_error &e) {
        throw parseException(e.what());
    }

    /* Deserialize the JSON value. */
    Config::Root root;

    // Any nlohmann::json exceptions this would raise should be handled by the from_json() implementations above.
    try {
        Json::ObjectDeserializer d(j);
        d(root.network, "network");
        d(root.http, "http");
        d(root.log, "log");
        d(root.cache, "cache");
        d(root.fetch, "fetch");
        d(root.transcode, "transcode");
        d(root.backend, "backend", true);
        d(root.catalog, "catalog", true);
        d(root.blockingThreads, "blockingThreads");
        d();
    }
    catch (const Json::ObjectDeserializer::Exception &e) {
        throw parseException(e.getKey() ? e.getKey()->c_str() : nullptr, e.getMessage());
    }

    /* Finish off. */
    root.jsonRepresentation = jsonString;
    root.validate();
    return root;
}

void Config::Root::validate()
{
    /* Reject things we can't do anything useful with. */
    if (backend.clients.empty()) {
        throw parseException("backend.clients", "At least one client is required.");
    }
    for (const BackendClient &client: backend.clients) {
        if (client.name.empty()) {
            throw parseException("backend.clients", "Client names must not be empty.");
        }
    }
    if (blockingThreads == 0) {
        throw parseException("blockingThreads", "At least one blocking thread is required.");
    }
    if (transcode.segmentDuration == 0) {
        throw parseException("transcode.segmentDuration", "Segment duration must be positive.");
    }
    if (cache.workers == 0) {
        throw parseException("cache.workers", "At least one worker is required.");
    }
    if (cache.chunkSize == 0) {
        throw parseException("cache.chunkSize", "Chunk size must be positive.");
    }

    /* Fill in the environment-dependent cache root. */
    if (cache.root.empty()) {
        cache.root = (std::filesystem::temp_directory_path() / "streamvault_cache").string();
    }

    /* Keep the fetch engine within the limits it supports. */
    clampFetchMode(fetch.stream);
    clampFetchMode(fetch.download);
}
