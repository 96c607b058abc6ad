#pragma once

#include <cassert>
#include <compare>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace Server
{

/**
 * A canonical, relative path to a resource, as a list of parts.
 *
 * Paths are checked as they're made, so a Path can be appended to a directory on disk without escaping it: there are
 * no ".." parts, no empty or "." parts, and nothing that isn't printable ASCII.
 */
class Path final
{
public:
    /**
     * Thrown when a string isn't an acceptable path.
     */
    class Exception final : public std::runtime_error
    {
    public:
        explicit Exception(const char *msg) : std::runtime_error(msg) {}
    };

    ~Path();
    Path(const Path &);
    Path(Path &&) = default;
    Path &operator=(const Path &);
    Path &operator=(Path &&) = default;

    /**
     * Parse a '/'-separated path.
     *
     * Leading, trailing and repeated separators are ignored, as are "." parts.
     *
     * @throws Exception If a part consists only of dots (other than "."), or the path contains a backslash, a colon or
     *                   anything that isn't printable ASCII.
     */
    Path(std::string_view path);
    template <typename T> Path(const T &path) : Path(std::string_view(path)) {}

    /**
     * Parse the target of an HTTP request, like "/stream/My%20Movie?x=1".
     *
     * The query and fragment are dropped, and percent escapes are decoded before the path is checked.
     *
     * @throws Exception If an escape is malformed, or the decoded path isn't acceptable.
     */
    static Path fromTarget(std::string_view target);

    /**
     * Append rhs to this path.
     */
    Path operator/(const Path &rhs) const;

    bool operator==(const Path &) const noexcept;
    std::strong_ordering operator<=>(const Path &) const noexcept;

    /**
     * Join the parts with '/'.
     */
    operator std::string() const;

    operator std::filesystem::path() const;

    /**
     * Get the only part of a single-part path.
     */
    const std::string &operator*() const
    {
        assert(parts.size() == 1);
        return parts[0];
    }

    /**
     * Get a part, counting from the outermost.
     */
    const std::string &operator[](size_t index) const
    {
        assert(index < parts.size());
        return parts[index];
    }

    bool empty() const
    {
        return parts.empty();
    }

    size_t size() const
    {
        return parts.size();
    }

    const std::string &front() const
    {
        return parts.front();
    }

    const std::string &back() const
    {
        return parts.back();
    }

    /**
     * Remove the outermost part, as a request is passed down to a child resource.
     */
    void pop_front()
    {
        parts.erase(parts.begin());
    }

private:
    Path() = default;

    std::vector<std::string> parts;
};

} // namespace Server
