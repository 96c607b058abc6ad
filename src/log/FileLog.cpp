#include "FileLog.hpp"

#include "util/asio.hpp"

#include <cassert>

Log::FileLog::~FileLog() = default;

Log::FileLog::FileLog(IOContext &ioc, Util::BlockingPool &blockingPool, const std::filesystem::path &path,
                      Level minLevel, bool print) :
    Log(minLevel, print, ioc), file(ioc, blockingPool, path, Util::File::Mode::write)
{
}

Awaitable<void> Log::FileLog::store(Item item)
{
    std::string jsonString = item.toJsonString();
    assert(jsonString.find('\n') == std::string::npos); // The JSON encoding should not contain any newlines.
    jsonString += "\n";
    co_await file.write(jsonString);
}
