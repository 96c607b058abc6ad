#include "Catalog.hpp"

Remote::Catalog::~Catalog() = default;
