#pragma once

#include "log/Level.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

/**
 * @defgroup configuration Configuration
 *
 * The configuration system.
 */
/// @addtogroup configuration
/// @{

/**
 * Contains the streaming service configuration.
 */
namespace Config
{

/**
 * An exception that's thrown when the configuration could not be parsed.
 */
class ParseException final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
    ~ParseException() override;
};

/**
 * The network key.
 */
struct Network final
{
    uint16_t port = 8080;

    bool operator==(const Network &) const;
};

/**
 * The http key.
 */
struct Http final
{
    std::optional<std::string> origin;
    unsigned int cacheNonLiveTime = 600;

    bool operator==(const Http &) const;
};

/**
 * The log key.
 */
struct Log final
{
    std::string path;
    bool print = true;
    ::Log::Level level = ::Log::Level::info;

    bool operator==(const Log &) const;
};

/**
 * The cache key.
 */
struct Cache final
{
    bool enabled = true;

    /**
     * The cache root. If empty, this becomes streamvault_cache in the system temporary directory.
     */
    std::string root;

    /**
     * The cache budget in GiB. Anything less than or equal to zero disables trimming.
     */
    double maxSizeGb = 20.0;

    /**
     * Seconds between a cache-miss stream and the background warm it schedules.
     */
    unsigned int warmDelay = 6;

    unsigned int workers = 2;
    unsigned int chunkSize = 4 << 20;

    /**
     * Whether HLS source acquisition may use and populate the cache.
     */
    bool hls = true;

    /**
     * Get the budget in bytes.
     *
     * @return The budget, or 0 if trimming is disabled.
     */
    uint64_t getMaxSizeBytes() const;

    bool operator==(const Cache &) const;
};

/**
 * The fetch.stream and fetch.download keys.
 */
struct FetchMode final
{
    unsigned int workers = 7;
    unsigned int chunkSize = 512 << 10;

    bool operator==(const FetchMode &) const;
};

/**
 * The fetch key.
 */
struct Fetch final
{
    bool parallel = true;
    FetchMode stream;
    FetchMode download = { .workers = 7, .chunkSize = 8 << 20 };

    /**
     * Timeout for access probes in milliseconds.
     */
    unsigned int probeTimeout = 5000;

    bool operator==(const Fetch &) const;
};

/**
 * The transcode key.
 */
struct Transcode final
{
    bool enabled = true;
    std::string ffmpeg = "ffmpeg";
    std::string ffprobe = "ffprobe";
    unsigned int segmentDuration = 6;

    /**
     * How long to wait, in milliseconds, for an in-flight cache warm to produce the transcode source.
     */
    unsigned int sourceWaitTimeout = 30000;

    bool operator==(const Transcode &) const;
};

/**
 * An element of the backend.clients key.
 */
struct BackendClient final
{
    std::string name;

    /**
     * Whether this client is only a fallback that's used after the round-robin pool members.
     */
    bool fallback = false;

    /**
     * The containers this client can access. Empty means all of them.
     */
    std::vector<std::string> containers;

    bool operator==(const BackendClient &) const;
};

/**
 * The backend key.
 */
struct Backend final
{
    std::string root;
    std::vector<BackendClient> clients = { BackendClient{ .name = "client0" } };

    bool operator==(const Backend &) const;
};

/**
 * The root of the configuration.
 */
struct Root final
{
    /**
     * Load configuration from a JSON formatted string.
     *
     * @param jsonString The configuration object as a JSON formatted string.
     */
    static Root fromJson(std::string_view jsonString);

    // The json this object was originally decoded from. If it was mutated afterwards, this will not be in sync.
    std::string jsonRepresentation;

    Network network;
    Http http;
    Log log;
    Cache cache;
    Fetch fetch;
    Transcode transcode;
    Backend backend;

    /**
     * Path of the JSON catalog file.
     */
    std::string catalog;

    unsigned int blockingThreads = 4;

    bool operator==(const Root &) const;

    /**
     * Validate a loaded configuration, and fill in the values that depend on the environment.
     */
    void validate();
};

} // namespace Config

/// @}
