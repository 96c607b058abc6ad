#include "Item.hpp"

#include "util/json.hpp"

#include <cstdio>
#include <ctime>
#include <sstream>

namespace
{

/// Times are stored in log files as integer microseconds.
using StoredDuration = std::chrono::microseconds;

template <typename Duration>
Duration fromStored(StoredDuration::rep rep)
{
    return std::chrono::duration_cast<Duration>(StoredDuration(rep));
}

template <typename Duration>
StoredDuration::rep toStored(Duration d)
{
    return std::chrono::duration_cast<StoredDuration>(d).count();
}

/// ANSI SGR parameters for each level.
const char *getLevelColour(Log::Level level)
{
    switch (level) {
        case Log::Level::debug: return "37;1";
        case Log::Level::info: return "32;1";
        case Log::Level::warning: return "33;1";
        case Log::Level::error: return "31;1";
        case Log::Level::fatal: return "31";
    }
    return "0";
}

/**
 * Writes text to a stream, wrapped in an ANSI colour sequence if colour is on.
 */
struct Painter final
{
    template <typename T>
    void operator()(std::ostream &out, const char *sgr, const T &text) const
    {
        if (colour) {
            out << "\x1b[" << sgr << "m" << text << "\x1b[m";
        }
        else {
            out << text;
        }
    }

    bool colour;
};

/// e.g: "2024-05-01 12:00:00.123", in UTC.
std::string formatSystemTime(std::chrono::system_clock::time_point tp)
{
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm tm;
    if (!gmtime_r(&seconds, &tm)) {
        return "(bad time)";
    }

    // Taken relative to the seconds rather than tp, since to_time_t is allowed to round.
    long long ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(tp - std::chrono::system_clock::from_time_t(seconds))
            .count();
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d %02d:%02d:%02d.%03lld", tm.tm_year + 1900, tm.tm_mon + 1,
             tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, ms);
    return buffer;
}

/// e.g: "12.345 s".
std::string formatElapsed(std::chrono::steady_clock::duration d)
{
    long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%lld.%03lld s", ms / 1000, ms % 1000);
    return buffer;
}

} // namespace

namespace Log
{

static void from_json(const nlohmann::json &j, Item &out)
{
    StoredDuration::rep logTime = 0;
    StoredDuration::rep contextTime = 0;
    StoredDuration::rep systemTime = 0;

    Json::ObjectDeserializer d(j);
    d(logTime, "logTime");
    d(contextTime, "contextTime");
    d(systemTime, "systemTime");
    d(out.level, "level", {
        { Level::debug, "debug" },
        { Level::info, "info" },
        { Level::warning, "warning" },
        { Level::error, "error" },
        { Level::fatal, "fatal" }
    });
    d(out.kind, "kind", false);
    d(out.message, "message");
    d(out.contextName, "context");
    d(out.contextIndex, "index");
    d();

    out.logTime = fromStored<std::chrono::steady_clock::duration>(logTime);
    out.contextTime = fromStored<std::chrono::steady_clock::duration>(contextTime);
    out.systemTime = std::chrono::system_clock::time_point(fromStored<std::chrono::system_clock::duration>(systemTime));
}

static void to_json(nlohmann::json &j, const Item &in)
{
    // Since C++20, the system_clock epoch is the Unix epoch.
    j = nlohmann::json::object();
    j["logTime"] = toStored(in.logTime);
    j["contextTime"] = toStored(in.contextTime);
    j["systemTime"] = toStored(in.systemTime.time_since_epoch());
    j["level"] = std::string(getLevelName(in.level));
    if (!in.kind.empty()) {
        j["kind"] = in.kind;
    }
    j["message"] = in.message;
    j["context"] = in.contextName;
    j["index"] = in.contextIndex;
}

} // namespace Log

Log::Item Log::Item::fromJsonString(std::string_view jsonString)
{
    return Json::parse(jsonString).get<Log::Item>();
}

std::string Log::Item::toJsonString() const
{
    return Json::dump(*this);
}

std::string Log::Item::format(bool colour) const
{
    Painter paint{colour};
    std::ostringstream out;

    paint(out, "34", formatSystemTime(systemTime));
    out << ' ';

    std::string levelName(getLevelName(level));
    levelName[0] = (char)(levelName[0] - 'a' + 'A');
    paint(out, getLevelColour(level), levelName);
    out << ' ';

    paint(out, "36;1", contextName);
    out << '[' << contextIndex << "] +";
    paint(out, "34", formatElapsed(contextTime));
    out << ": ";

    if (!kind.empty()) {
        out << '[';
        paint(out, "35;1", kind);
        out << "] ";
    }
    out << message;
    return out.str();
}
