#include "configuration/configuration.hpp"

/**
 * @file
 *
 * These are expensive and used repeatedly (in the tests, and elsewhere), so don't keep code-generating them repeatedly.
 */

bool Config::Network::operator==(const Network &) const = default;
bool Config::Http::operator==(const Http &) const = default;
bool Config::Log::operator==(const Log &) const = default;
bool Config::Cache::operator==(const Cache &) const = default;
bool Config::FetchMode::operator==(const FetchMode &) const = default;
bool Config::Fetch::operator==(const Fetch &) const = default;
bool Config::Transcode::operator==(const Transcode &) const = default;
bool Config::BackendClient::operator==(const BackendClient &) const = default;
bool Config::Backend::operator==(const Backend &) const = default;
bool Config::Root::operator==(const Root &) const = default;

uint64_t Config::Cache::getMaxSizeBytes() const
{
    if (maxSizeGb <= 0) {
        return 0;
    }
    return (uint64_t)(maxSizeGb * 1024.0 * 1024.0 * 1024.0);
}
