#pragma once

#include "Log.hpp"

#include <deque>

namespace Log
{

/**
 * A log that keeps everything in memory.
 *
 * This is the default when no log file is configured, and is what tests use to look at what was logged.
 */
class MemoryLog final : public Log
{
public:
    ~MemoryLog() override;
    explicit MemoryLog(IOContext &ioc, Level minLevel, bool print);

    /**
     * Get the items that have been stored so far.
     */
    const std::deque<Item> &getItems() const
    {
        return items;
    }

    /**
     * Count the stored items of a given kind at or above a given level.
     */
    size_t count(std::string_view kind, Level minLevel = Level::debug) const;

private:
    Awaitable<void> store(Item item) override;

    /**
     * The in-memory storage of the log.
     *
     * This is a std::deque rather than a std::vector so that every store is constant-time (rather than just amortized,
     * which would cause the program to occasionally stall).
     */
    std::deque<Item> items;
};

} // namespace Log
