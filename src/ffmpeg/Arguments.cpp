#include "Arguments.hpp"

using namespace std::string_literals;

namespace
{

/**
 * Append a vector of strings to another.
 *
 * I think this is only needed until libstdc++ catch up with C++23.
 *
 * @param dst The vector to append to.
 * @param src The vector to append.
 */
void append(std::vector<std::string> &dst, const std::vector<std::string> &src)
{
    dst.insert(dst.end(), src.begin(), src.end());
}

/**
 * Global arguments to put before everything else. These are process-global, and are for things like loglevel config.
 */
std::vector<std::string> getGlobalArgs()
{
    return {
        // Don't print "Last message repeated n times", just print the message n times (`repeat`).
        // Prefix every message with its loglevel, so we know how to shut it up (`level`).
        // Set the loglevel to `info`.
        "-loglevel", "repeat+level+info",

        // Stop ffmpeg from listening to stdin (which it does by default even if stdin isn't actually connected...).
        "-nostdin",

        // Overwrite whatever a previous attempt left behind.
        "-y"
    };
}

/**
 * Arguments for the HLS muxer.
 *
 * @param segmentPattern Where to write the segments.
 */
std::vector<std::string> getHlsArgs(unsigned int segmentDuration, const std::filesystem::path &segmentPattern)
{
    return {
        "-f", "hls",
        "-hls_time", std::to_string(segmentDuration),
        "-hls_list_size", "0", // Keep every segment in the playlist, since this is video on demand.
        "-hls_flags", "independent_segments",
        "-hls_segment_filename", segmentPattern.string()
    };
}

/**
 * The settings of one rendition of the multi-rendition transcode.
 */
struct Rendition final
{
    int width;
    int height;
    const char *bitrate;
    const char *maxRate;
    const char *bufferSize;
};

constexpr Rendition renditions[] = {
    { 1920, 1080, "4500k", "5000k", "10000k" },
    { 1280, 720, "2500k", "3000k", "6000k" },
    { 854, 480, "1200k", "1500k", "3000k" }
};

} // namespace

Ffmpeg::Arguments::~Arguments() = default;

Ffmpeg::Arguments Ffmpeg::Arguments::hlsMultiRendition(const std::filesystem::path &source,
                                                       const std::filesystem::path &workspace,
                                                       unsigned int segmentDuration, bool hasAudio)
{
    Arguments result;
    result.playlist = workspace / "master.m3u8";
    std::vector<std::string> &args = result.ffmpegArguments;
    append(args, getGlobalArgs());
    append(args, { "-i", source.string() });

    /* Split the video, and scale each copy. */
    std::string filterComplex = "[0:v]split=" + std::to_string(std::size(renditions));
    for (size_t i = 0; i < std::size(renditions); i++) {
        filterComplex += "[v" + std::to_string(i + 1) + "]";
    }
    for (size_t i = 0; i < std::size(renditions); i++) {
        const Rendition &rendition = renditions[i];
        std::string n = std::to_string(i + 1);
        filterComplex += ";[v" + n + "]scale=w=" + std::to_string(rendition.width) + ":h=" +
                         std::to_string(rendition.height) + ":force_original_aspect_ratio=decrease[v" + n + "out]";
    }
    append(args, { "-filter_complex", filterComplex });

    /* Map the scaled videos, and (if there is one) a copy of the audio for each. */
    for (size_t i = 0; i < std::size(renditions); i++) {
        append(args, { "-map", "[v" + std::to_string(i + 1) + "out]" });
    }
    if (hasAudio) {
        for (size_t i = 0; i < std::size(renditions); i++) {
            append(args, { "-map", "0:a:0?" });
        }
    }

    /* Video encoding. */
    for (size_t i = 0; i < std::size(renditions); i++) {
        const Rendition &rendition = renditions[i];
        std::string n = std::to_string(i);
        append(args, {
            "-c:v:" + n, "libx264",
            "-preset", "veryfast",
            "-b:v:" + n, rendition.bitrate,
            "-maxrate:v:" + n, rendition.maxRate,
            "-bufsize:v:" + n, rendition.bufferSize
        });
    }

    /* Audio encoding, and which streams go in each variant. */
    std::string variantMap;
    if (hasAudio) {
        append(args, { "-c:a", "aac", "-b:a", "128k" });
    }
    for (size_t i = 0; i < std::size(renditions); i++) {
        std::string n = std::to_string(i);
        variantMap += (i == 0 ? "v:"s : " v:"s) + n + (hasAudio ? ",a:" + n : ""s);
    }

    /* Output. */
    append(args, getHlsArgs(segmentDuration, workspace / "v%v" / "seg_%05d.ts"));
    append(args, {
        "-master_pl_name", "master.m3u8",
        "-var_stream_map", variantMap,
        (workspace / "v%v" / "index.m3u8").string()
    });
    return result;
}

Ffmpeg::Arguments Ffmpeg::Arguments::hlsCopy(const std::filesystem::path &source,
                                             const std::filesystem::path &workspace, unsigned int segmentDuration)
{
    Arguments result;
    result.playlist = workspace / "index.m3u8";
    append(result.ffmpegArguments, getGlobalArgs());
    append(result.ffmpegArguments, { "-i", source.string(), "-c", "copy" });
    append(result.ffmpegArguments, getHlsArgs(segmentDuration, workspace / "seg_%05d.ts"));
    result.ffmpegArguments.emplace_back(result.playlist.string());
    return result;
}

Ffmpeg::Arguments Ffmpeg::Arguments::hlsTranscode(const std::filesystem::path &source,
                                                  const std::filesystem::path &workspace,
                                                  unsigned int segmentDuration)
{
    Arguments result;
    result.playlist = workspace / "index.m3u8";
    append(result.ffmpegArguments, getGlobalArgs());
    append(result.ffmpegArguments, {
        "-i", source.string(),
        "-c:v", "libx264",
        "-preset", "veryfast",
        "-crf", "23",
        "-c:a", "aac"
    });
    append(result.ffmpegArguments, getHlsArgs(segmentDuration, workspace / "seg_%05d.ts"));
    result.ffmpegArguments.emplace_back(result.playlist.string());
    return result;
}
