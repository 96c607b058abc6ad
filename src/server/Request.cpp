#include "Request.hpp"

#include "Error.hpp"

#include "util/asio.hpp"
#include "util/util.hpp"

Server::Request::~Request() = default;

std::optional<std::string_view> Server::Request::getHeader(boost::beast::http::field field) const
{
    auto it = headers.find(field);
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

Awaitable<std::vector<std::byte>> Server::Request::readSome()
{
    std::vector<std::byte> data = co_await doReadSome();
    bytesRead += data.size();
    checkMaxLength();
    co_return data;
}

Awaitable<std::vector<std::byte>> Server::Request::readAll()
{
    std::vector<std::vector<std::byte>> dataParts;
    while (true) {
        std::vector<std::byte> data = co_await readSome();
        if (data.empty()) {
            break;
        }
        dataParts.emplace_back(std::move(data));
    }
    co_return Util::concatenate(std::move(dataParts));
}

void Server::Request::checkMaxLength() const
{
    if (bytesRead > maxLength) {
        throw Error(ErrorKind::BadRequest, "Request body is longer than the limit of " + std::to_string(maxLength) +
                                           " bytes.");
    }
}
