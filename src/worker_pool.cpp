#include "corpusflux/worker_pool.hpp"

namespace corpusflux
{

std::size_t effective_threads(std::size_t configured)
{
    if (configured > 0)
    {
        return configured;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

std::size_t selector_wave_size(std::size_t threads, std::size_t configured)
{
    if (configured > 0)
    {
        return configured;
    }
    return std::max<std::size_t>(5, threads / 2);
}

} // namespace corpusflux
