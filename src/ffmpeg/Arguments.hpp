#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * @defgroup ffmpeg FFmpeg
 *
 * Contains stuff for interacting with FFmpeg.
 */
/// @addtogroup ffmpeg
/// @{

/**
 * Contains stuff for interacting with FFmpeg.
 */
namespace Ffmpeg
{

/**
 * Represents arguments to give to ffmpeg.
 *
 * This object should be given to Process.
 */
class Arguments final
{
public:
    /**
     * Generate arguments to transcode a file into three HLS renditions (1080p, 720p, and 480p) with a master playlist.
     *
     * The renditions go in v0, v1, and v2 under the workspace. These directories must already exist.
     *
     * @param source The file to transcode.
     * @param workspace The directory to write the playlists and segments into.
     * @param segmentDuration The target segment duration in seconds.
     * @param hasAudio Whether to give each rendition a copy of the first audio stream.
     */
    static Arguments hlsMultiRendition(const std::filesystem::path &source, const std::filesystem::path &workspace,
                                       unsigned int segmentDuration, bool hasAudio);

    /**
     * Generate arguments to segment a file into HLS without re-encoding it.
     *
     * @param source The file to segment.
     * @param workspace The directory to write index.m3u8 and the segments into.
     * @param segmentDuration The target segment duration in seconds.
     */
    static Arguments hlsCopy(const std::filesystem::path &source, const std::filesystem::path &workspace,
                             unsigned int segmentDuration);

    /**
     * Generate arguments to transcode a file into a single HLS rendition.
     *
     * This is slow, but works with sources whose codecs can't be put into HLS as they are.
     *
     * @param source The file to transcode.
     * @param workspace The directory to write index.m3u8 and the segments into.
     * @param segmentDuration The target segment duration in seconds.
     */
    static Arguments hlsTranscode(const std::filesystem::path &source, const std::filesystem::path &workspace,
                                  unsigned int segmentDuration);

    ~Arguments();

    // It's not that we can't copy. Just that we shouldn't.
    Arguments(const Arguments &) = delete;
    Arguments(Arguments &&other) = default; // Move construction is fine :)
    Arguments &operator=(const Arguments &) = delete;
    Arguments &operator=(Arguments &&other) = delete;

    /**
     * Get the arguments that should give given to the ffmpeg process.
     */
    const std::vector<std::string> &getFfmpegArguments() const
    {
        return ffmpegArguments;
    }

    /**
     * Get the playlist that exists once ffmpeg has succeeded.
     */
    const std::filesystem::path &getPlaylist() const
    {
        return playlist;
    }

private:
    Arguments() = default;

    std::vector<std::string> ffmpegArguments;
    std::filesystem::path playlist;
};

} // namespace Ffmpeg

/// @}
