#include "BlockingPool.hpp"

#include <cassert>

Util::BlockingPool::~BlockingPool()
{
    pool.join();
}

Util::BlockingPool::BlockingPool(size_t threads) : pool(threads)
{
    assert(threads > 0);
}
