#include "SingleFlight.hpp"

#include "util/asio.hpp"
#include "util/Event.hpp"

#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/cancellation_signal.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/system/system_error.hpp>

#include <map>
#include <mutex>

struct Util::SingleFlight::Task final
{
    explicit Task(IOContext &ioc) : done(ioc) {}

    /**
     * Notified once the task has finished.
     */
    Event done;

    /**
     * Used to cancel the task.
     */
    boost::asio::cancellation_signal cancel;

    bool finished = false;
};

struct Util::SingleFlight::Registry final
{
    Registry(Log::Log &log, std::string_view name) : logContext(log(name)) {}

    /**
     * Remove a task from the map and tell anything that's waiting for it.
     */
    void finish(const std::string &key, const std::shared_ptr<Task> &task)
    {
        {
            std::lock_guard lock(mutex);
            auto it = tasks.find(key);
            if (it != tasks.end() && it->second == task) {
                tasks.erase(it);
            }
        }
        task->finished = true;
        task->done.notifyAll();
    }

    mutable std::mutex mutex;
    std::map<std::string, std::shared_ptr<Task>> tasks;
    bool cancelled = false;
    Log::Context logContext;
};

Util::SingleFlight::~SingleFlight()
{
    cancelAll();
}

Util::SingleFlight::SingleFlight(IOContext &ioc, Log::Log &log, std::string_view name) :
    ioc(ioc), registry(std::make_shared<Registry>(log, name))
{
}

bool Util::SingleFlight::start(const std::string &key, std::function<Awaitable<void>()> fn)
{
    /* Check and insert while holding the lock. Nothing in here suspends. */
    std::shared_ptr<Task> task;
    {
        std::lock_guard lock(registry->mutex);
        if (registry->cancelled || registry->tasks.contains(key)) {
            return false;
        }
        task = std::make_shared<Task>(ioc);
        registry->tasks.emplace(key, task);
    }

    /* Run the task, with a cancellation slot we can use to stop it. */
    boost::asio::co_spawn((boost::asio::io_context &)ioc,
                          [registry = registry, key, task, fn = std::move(fn)]() -> Awaitable<void> {
        try {
            co_await fn();
        }
        catch (const boost::system::system_error &e) {
            if (e.code() == boost::asio::error::operation_aborted) {
                registry->logContext << "cancelled" << Log::Level::info << key;
            }
            else {
                registry->logContext << "exception" << Log::Level::error << key << ": " << e.what();
            }
        }
        catch (const std::exception &e) {
            registry->logContext << "exception" << Log::Level::error << key << ": " << e.what();
        }
        registry->finish(key, task);
    }, boost::asio::bind_cancellation_slot(task->cancel.slot(), boost::asio::detached));
    return true;
}

bool Util::SingleFlight::isRunning(const std::string &key) const
{
    std::lock_guard lock(registry->mutex);
    return registry->tasks.contains(key);
}

Awaitable<bool> Util::SingleFlight::join(const std::string &key, std::chrono::steady_clock::duration timeout) const
{
    /* Find the task, if there is one. */
    std::shared_ptr<Task> task;
    {
        std::lock_guard lock(registry->mutex);
        auto it = registry->tasks.find(key);
        if (it == registry->tasks.end()) {
            co_return true;
        }
        task = it->second;
    }

    /* Wait until it's done or we run out of time. */
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!task->finished) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            co_return false;
        }
        co_await task->done.waitFor(deadline - now);
    }
    co_return true;
}

size_t Util::SingleFlight::size() const
{
    std::lock_guard lock(registry->mutex);
    return registry->tasks.size();
}

void Util::SingleFlight::cancelAll()
{
    std::map<std::string, std::shared_ptr<Task>> tasks;
    {
        std::lock_guard lock(registry->mutex);
        registry->cancelled = true;
        tasks = registry->tasks;
    }
    for (auto &[key, task]: tasks) {
        task->cancel.emit(boost::asio::cancellation_type::terminal);
    }
}

Awaitable<void> Util::SingleFlight::drain() const
{
    while (true) {
        std::shared_ptr<Task> task;
        {
            std::lock_guard lock(registry->mutex);
            if (registry->tasks.empty()) {
                co_return;
            }
            task = registry->tasks.begin()->second;
        }
        while (!task->finished) {
            co_await task->done.wait();
        }
    }
}
