#pragma once

#include <stdexcept>

namespace Remote
{

/**
 * Thrown when a backend read finished before providing all the bytes that were asked for.
 */
class ShortReadError final : public std::runtime_error
{
public:
    ~ShortReadError() override;
    using runtime_error::runtime_error;
};

/**
 * Thrown when the backend fails an operation, e.g: because the object doesn't exist or the request is invalid.
 */
class BackendError final : public std::runtime_error
{
public:
    ~BackendError() override;
    using runtime_error::runtime_error;
};

} // namespace Remote
