#include "MemoryLog.hpp"

#include "util/asio.hpp"

Log::MemoryLog::~MemoryLog() = default;
Log::MemoryLog::MemoryLog(IOContext &ioc, Level minLevel, bool print) : Log(minLevel, print, ioc) {}

size_t Log::MemoryLog::count(std::string_view kind, Level minLevel) const
{
    size_t result = 0;
    for (const Item &item: items) {
        if (item.kind == kind && item.level >= minLevel) {
            result++;
        }
    }
    return result;
}

Awaitable<void> Log::MemoryLog::store(Item item)
{
    items.emplace_back(std::move(item));
    co_return;
}
