#include "Path.hpp"

#include <algorithm>

namespace
{

/**
 * Get the value of a hexadecimal digit, or -1 if it isn't one.
 */
int hexValue(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

void checkCharacters(std::string_view path)
{
    for (char c: path) {
        // Restricting paths to printable ASCII rules out overlong UTF-8 encodings of '/' and '.'.
        if (c < 0x20 || c > 0x7E) {
            throw Server::Path::Exception("Path contains a character that is not printable ASCII.");
        }
        if (c == '\\' || c == ':') {
            throw Server::Path::Exception("Path contains bad character.");
        }
    }
}

} // namespace

Server::Path::~Path() = default;
Server::Path::Path(const Path &) = default;
Server::Path &Server::Path::operator=(const Path &) = default;

Server::Path::Path(std::string_view path)
{
    checkCharacters(path);

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = std::min(path.find('/', start), path.size());
        std::string_view part = path.substr(start, end - start);
        start = end + 1;

        if (part.empty() || part == ".") {
            continue;
        }
        if (part.find_first_not_of('.') == std::string_view::npos) {
            throw Exception("Path not allowed to contain parent dots.");
        }
        parts.emplace_back(part);
    }
}

Server::Path Server::Path::fromTarget(std::string_view target)
{
    target = target.substr(0, target.find_first_of("?#"));

    std::string decoded;
    decoded.reserve(target.size());
    for (size_t i = 0; i < target.size(); i++) {
        if (target[i] != '%') {
            decoded += target[i];
            continue;
        }
        if (i + 2 >= target.size()) {
            throw Exception("Path contains a truncated percent escape.");
        }
        int high = hexValue(target[i + 1]);
        int low = hexValue(target[i + 2]);
        if (high < 0 || low < 0) {
            throw Exception("Path contains a malformed percent escape.");
        }
        decoded += (char)(high * 16 + low);
        i += 2;
    }

    return Path(std::string_view(decoded));
}

bool Server::Path::operator==(const Path &) const noexcept = default;
std::strong_ordering Server::Path::operator<=>(const Path &) const noexcept = default;

Server::Path Server::Path::operator/(const Path &rhs) const
{
    Path result(*this);
    result.parts.insert(result.parts.end(), rhs.parts.begin(), rhs.parts.end());
    return result;
}

Server::Path::operator std::string() const
{
    std::string result;
    for (const std::string &part: parts) {
        if (!result.empty()) {
            result += '/';
        }
        result += part;
    }
    return result;
}

Server::Path::operator std::filesystem::path() const
{
    std::filesystem::path result;
    for (const std::string &part: parts) {
        result /= part;
    }
    return result;
}
