#pragma once

#include "Item.hpp"
#include "util/awaitable.hpp"

#include <deque>
#include <map>
#include <sstream>

class IOContext;

/**
 * @defgroup log Logging
 *
 * Structured, per-context logging.
 */
/// @addtogroup log
/// @{

/**
 * Logging related stuff.
 *
 * Each subsystem (the cache, the transcoder, each HTTP connection) writes to its own named context, so that the output
 * of concurrent work can be told apart.
 */
namespace Log
{

class Log;

/**
 * A named stream of log items, belonging to a Log.
 *
 * One is made for each unit of work worth following on its own: a connection, a warm job, an ffmpeg run. Items are
 * written with, e.g:
 *
 *     context << Level::warning << "Cache warm failed for " << id;
 *     context << "fallback" << Level::info << "Parallel fetch failed, using a single stream.";
 *
 * The creation and destruction of a context are logged too, so the lifetime of the work shows up in the log.
 */
class Context final
{
private:
    /**
     * A log item whose message is still being streamed in. It's written to the log when it's destroyed.
     */
    class PendingItem final
    {
    public:
        ~PendingItem();

        PendingItem(const PendingItem &) = delete;
        PendingItem(PendingItem &&) = delete;
        PendingItem &operator=(const PendingItem &) = delete;
        PendingItem &operator=(PendingItem &&) = delete;

        template <typename T>
        PendingItem &operator<<(T &&value)
        {
            message << std::forward<T>(value);
            return *this;
        }

    private:
        friend class Context;

        explicit PendingItem(Context &context, Level level, std::string_view kind);

        const std::chrono::steady_clock::time_point steadyTime;
        const std::chrono::system_clock::time_point systemTime;

        Context &context;
        const Level level;
        std::string kind;
        std::ostringstream message;
    };

    /**
     * The result of `context << "kind"`, waiting for a Level.
     */
    struct KindedItem final
    {
        PendingItem operator<<(Level level)
        {
            return PendingItem(context, level, kind);
        }

        Context &context;
        std::string_view kind;
    };

public:
    ~Context();

    Context(const Context &) = delete;
    Context(Context &&) = delete;
    Context &operator=(const Context &) = delete;
    Context &operator=(Context &&) = delete;

    /**
     * Start a log item with no kind.
     *
     * @return A stream for the message. The item is written when the returned object goes out of scope, which is the
     *         end of the statement when it isn't stored.
     */
    PendingItem operator<<(Level level)
    {
        return PendingItem(*this, level, {});
    }

    /**
     * Start a log item of the given kind, such as "probe" or "request". Follow it with a Level.
     */
    KindedItem operator<<(std::string_view kind)
    {
        return {*this, kind};
    }

private:
    friend class Log;

    /**
     * @param log The Log this context writes to.
     * @param name The name of the context. Names can be shared, in which case the index tells contexts apart.
     * @param index The number of contexts with this name that were created before this one.
     */
    explicit Context(Log &log, std::string name, size_t index);

    /**
     * Make an item for this context, with the times filled in.
     */
    Item makeItem(std::chrono::steady_clock::time_point steadyTime, std::chrono::system_clock::time_point systemTime,
                  Level level, std::string kind, std::string message) const;

    /**
     * Write a finished item to the log.
     */
    void write(PendingItem &item);

    const std::chrono::steady_clock::time_point creationTime;

    Log &log;
    const std::string name;
    const size_t index;
};

/**
 * Collects log items from its contexts and stores them.
 *
 * Creating a log item never suspends: items are queued and handed to store() one at a time, in order, by a coroutine
 * on the IOContext. Subclasses decide where they go (a file, memory for tests).
 */
class Log
{
public:
    virtual ~Log();

    Log(const Log &) = delete;
    Log(Log &&) = delete;
    Log &operator=(const Log &) = delete;
    Log &operator=(Log &&) = delete;

    /**
     * Create a new context.
     *
     * @param name The context name, which must not be empty.
     */
    Context operator()(std::string_view name);

    /**
     * Get the number of items logged so far, including those still queued.
     */
    size_t size() const
    {
        return writtenItems + queue.size();
    }

protected:
    /**
     * @param minLevel Items below this level are dropped.
     * @param print Also print each item to stderr, as it's logged.
     */
    explicit Log(Level minLevel, bool print, IOContext &ioc);

    /**
     * Get the number of items that store() has finished with.
     */
    size_t getWrittenItemCount() const
    {
        return writtenItems;
    }

    IOContext &ioc;

private:
    friend class Context;

    /**
     * Store an item. Calls are never concurrent, and come in the order the items were logged.
     */
    virtual Awaitable<void> store(Item item) = 0;

    /**
     * Log an item, unless it's below the minimum level.
     */
    void append(Item item);

    /**
     * Queue an item for storage, starting the drain coroutine if it isn't already running.
     */
    void enqueue(Item item);

    /**
     * Store queued items until there are none left.
     */
    Awaitable<void> drain();

    const std::chrono::steady_clock::time_point steadyCreationTime;

    const Level minLevel;
    const bool print;

    size_t writtenItems = 0;

    /**
     * The index to give the next context of each name.
     */
    std::map<std::string, size_t, std::less<>> contextNextIndices;

    /**
     * Items that haven't been stored yet. The front one is being stored whenever the queue isn't empty.
     */
    std::deque<Item> queue;
};

} // namespace Log

/// @}
