#include "Exceptions.hpp"

Remote::ShortReadError::~ShortReadError() = default;
Remote::BackendError::~BackendError() = default;
