#pragma once

namespace Server
{

/**
 * How long clients and proxies may keep a response.
 */
enum class CacheKind
{
    /**
     * Must not be cached.
     *
     * This is for anything that can change from one request to the next: object streams (whose cache state and size
     * can change), the management API, and HLS playlists while a transcode is writing them.
     */
    none,

    /**
     * Not expected to change, and cached for the configured http.cacheNonLiveTime.
     *
     * This is the default. It suits finished HLS segments, and errors such as a request for an unknown object.
     */
    fixed
};

} // namespace Server
