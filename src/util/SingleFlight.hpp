#pragma once

#include "log/Log.hpp"
#include "util/awaitable.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

class IOContext;

namespace Util
{

/**
 * A registry of keyed background tasks, of which at most one per key runs at a time.
 *
 * This is what owns "fire and forget" work such as cache warms and transcodes: the task runs whether or not anyone is
 * waiting for it, requests that want the result can join it with a timeout, and everything can be cancelled when the
 * process shuts down.
 */
class SingleFlight final
{
public:
    /**
     * Cancel everything that's still running.
     */
    ~SingleFlight();

    /**
     * @param log Where to write exceptions that escape a task.
     * @param name The name of the log context.
     */
    explicit SingleFlight(IOContext &ioc, Log::Log &log, std::string_view name);

    SingleFlight(const SingleFlight &) = delete;
    SingleFlight &operator=(const SingleFlight &) = delete;

    /**
     * Start a task for a key, unless one is already running for it.
     *
     * @param key The key identifying the work.
     * @param fn The task. It's only called if this returns true. Exceptions from it are logged and dropped.
     * @return True if a new task was started, and false if the key already had one.
     */
    bool start(const std::string &key, std::function<Awaitable<void>()> fn);

    /**
     * Determine whether a task is running for a key.
     */
    bool isRunning(const std::string &key) const;

    /**
     * Wait for the task for a key to finish.
     *
     * The task isn't affected by the wait timing out.
     *
     * @param key The key identifying the work.
     * @param timeout The longest time to wait for.
     * @return True if there's no longer a task running for the key (including if there never was one), and false if
     *         the timeout elapsed first.
     */
    Awaitable<bool> join(const std::string &key, std::chrono::steady_clock::duration timeout) const;

    /**
     * Get the number of tasks that are running.
     */
    size_t size() const;

    /**
     * Cancel every running task.
     *
     * Tasks see this as an operation_aborted error from whatever they're awaiting. No new tasks can be started
     * afterwards.
     */
    void cancelAll();

    /**
     * Wait until no tasks are running.
     *
     * After cancelAll, this is what makes it safe to destroy whatever the tasks refer to.
     */
    Awaitable<void> drain() const;

private:
    struct Task;
    struct Registry;

    IOContext &ioc;

    /**
     * The state shared with the running tasks, which can outlive this object by a little during shutdown.
     */
    std::shared_ptr<Registry> registry;
};

} // namespace Util
