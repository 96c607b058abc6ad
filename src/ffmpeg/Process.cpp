#include "Process.hpp"

#include "Arguments.hpp"
#include "log.hpp"

#include "util/asio.hpp"

namespace
{

/**
 * Escape a character so it's unambiguous when displayed in a string.
 */
const char *escapeChar(char c)
{
    switch (c) {
        case '\\': return "\\\\";
        case '"': return "\\\"";
    }
    return nullptr;
}

/**
 * Format an array of arguments for display as a single string.
 */
std::string getArgumentsForLog(std::span<const std::string> arguments)
{
    std::string result;
    for (const std::string &argument: arguments) {
        result += '"';
        for (char c: argument) {
            if (const char *s = escapeChar(c)) {
                result += s;
            }
            else {
                result += c;
            }
        }
        result += "\" ";
    }
    if (!result.empty()) {
        result.resize(result.size() - 1); // Remove the trailing space.
    }
    return result;
}

/**
 * Handle a line from ffmpeg's stderr.
 */
void handleFfmpegStderrLine(Log::Context &log, std::string_view line)
{
    /* Ignore empty lines. */
    if (line.empty()) {
        return;
    }

    // Interpret ffmpeg's log-level system.
    Ffmpeg::ParsedFfmpegLogLine parsedLine = line;

    /* Write to the log. */
    if (parsedLine.source.empty()) {
        log << "stderr" << parsedLine.level << parsedLine.message;
    }
    else {
        log << "stderr" << parsedLine.level << "[" << parsedLine.source << "] " << parsedLine.message;
    }
}

} // namespace

Ffmpeg::Process::Process(IOContext &ioc, Log::Log &log, std::string_view executable, const Arguments &arguments) :
    log(log("ffmpeg")), subprocess(ioc, executable, std::span(arguments.getFfmpegArguments()),
               { .standardOutput = false })
{
    /* Log the arguments given to ffmpeg. */
    this->log << "arguments" << Log::Level::info << getArgumentsForLog(arguments.getFfmpegArguments());
}

Awaitable<int> Ffmpeg::Process::wait()
{
    try {
        /* Read the logging that ffmpeg emits, keeping the start of it. */
        while (std::optional<std::string> line = co_await subprocess.getStderr().readLine()) {
            if (stderrHead.size() < stderrHeadLength) {
                stderrHead += (stderrHead.empty() ? "" : "\n") + *line;
                if (stderrHead.size() > stderrHeadLength) {
                    stderrHead.resize(stderrHeadLength);
                }
            }
            handleFfmpegStderrLine(log, *line);
        }

        /* Wait for ffmpeg to terminate. */
        co_return co_await subprocess.wait(false);
    }
    catch (const std::exception &e) {
        // Don't leave ffmpeg running if we're not going to wait for it.
        log << "exception" << Log::Level::warning << e.what();
        subprocess.kill();
        throw;
    }
}
