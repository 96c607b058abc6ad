#include "Log.hpp"

#include "util/asio.hpp"

#include <cstdio>
#include <stdexcept>

Log::Context::PendingItem::~PendingItem()
{
    context.write(*this);
}

Log::Context::PendingItem::PendingItem(Context &context, Level level, std::string_view kind) :
    steadyTime(std::chrono::steady_clock::now()), systemTime(std::chrono::system_clock::now()),
    context(context), level(level), kind(kind)
{
}

Log::Context::~Context()
{
    log.append(makeItem(std::chrono::steady_clock::now(), std::chrono::system_clock::now(), Level::info,
                        "log context", "destroyed"));
}

Log::Context::Context(Log &log, std::string name, size_t index) :
    creationTime(std::chrono::steady_clock::now()), log(log), name(std::move(name)), index(index)
{
    log.append(makeItem(creationTime, std::chrono::system_clock::now(), Level::info, "log context", "created"));
}

Log::Item Log::Context::makeItem(std::chrono::steady_clock::time_point steadyTime,
                                 std::chrono::system_clock::time_point systemTime, Level level, std::string kind,
                                 std::string message) const
{
    return {
        .logTime = steadyTime - log.steadyCreationTime,
        .contextTime = steadyTime - creationTime,
        .systemTime = systemTime,
        .level = level,
        .kind = std::move(kind),
        .message = std::move(message),
        .contextName = name,
        .contextIndex = index
    };
}

void Log::Context::write(PendingItem &item)
{
    log.append(makeItem(item.steadyTime, item.systemTime, item.level, std::move(item.kind), item.message.str()));
}

Log::Log::~Log() = default;

Log::Log::Log(Level minLevel, bool print, IOContext &ioc) :
    ioc(ioc), steadyCreationTime(std::chrono::steady_clock::now()), minLevel(minLevel), print(print)
{
}

Log::Context Log::Log::operator()(std::string_view name)
{
    if (name.empty()) {
        throw std::invalid_argument("Log contexts must have a name.");
    }

    auto it = contextNextIndices.find(name);
    if (it == contextNextIndices.end()) {
        it = contextNextIndices.emplace(std::string(name), 0).first;
    }
    return Context(*this, it->first, it->second++);
}

void Log::Log::append(Item item)
{
    /* The log's own creation is recorded lazily, since store can't be called from the constructor. */
    if (writtenItems == 0 && queue.empty() && minLevel <= Level::info) {
        enqueue({
            .systemTime = std::chrono::system_clock::now(),
            .level = Level::info,
            .kind = "log",
            .message = "created"
        });
    }

    if (item.level >= minLevel) {
        enqueue(std::move(item));
    }
}

void Log::Log::enqueue(Item item)
{
    if (print) {
        fprintf(stderr, "%s\n", item.format(true).c_str());
    }

    queue.emplace_back(std::move(item));

    // A non-empty queue before this item means drain is already running, and will get to it.
    if (queue.size() == 1) {
        spawnDetached(ioc, [this]() -> Awaitable<void> {
            return drain();
        });
    }
}

Awaitable<void> Log::Log::drain()
{
    while (!queue.empty()) {
        try {
            co_await store(std::move(queue.front()));
        }
        catch (const std::exception &e) {
            fprintf(stderr, "Error storing log item: %s\n", e.what());
        }

        // Only pop once stored, so an empty queue always means nothing is running.
        queue.pop_front();
        writtenItems++;
    }
}
