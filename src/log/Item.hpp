#pragma once

#include "Level.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace Log
{

/**
 * One line of the log.
 *
 * FileLog stores these as JSON lines, and the server prints them to stderr in a human readable form.
 */
struct Item final
{
    /// Decode a line written by toJsonString. Times come back rounded to the microsecond.
    static Item fromJsonString(std::string_view jsonString);

    /// Encode as one line of JSON.
    std::string toJsonString() const;

    /**
     * Render for a terminal, as `<UTC time> <Level> <context>[<index>] +<context time>: [<kind>] <message>`.
     *
     * @param colour Colour the level with ANSI escape sequences.
     */
    std::string format(bool colour = false) const;

    /* When. */

    /// Since the Log was created.
    std::chrono::steady_clock::duration logTime{0};

    /// Since the item's Context was created, which is how long the connection or job had been running.
    std::chrono::steady_clock::duration contextTime{0};

    std::chrono::system_clock::time_point systemTime{std::chrono::system_clock::duration{0}};

    /* What. */

    Level level = Level::info;

    /// A tag for picking out one sort of event, such as "fallback" or "trim". Often empty.
    std::string kind;

    std::string message;

    /* Where. */

    std::string contextName;

    /// Tells apart contexts with the same name: the first "connection" is 0, the next is 1, and so on.
    size_t contextIndex = 0;

    bool operator==(const Item &) const = default;
};

} // namespace Log
