#include <stdexcept>
#include "BatchSchedule.hpp"

std::vector<BatchRange> BatchSchedule::create(int n_samples, int batch_size)
{
    if (n_samples < 1)
    {
        throw std::invalid_argument("Need at least 1 observation");
    }
    if (batch_size < 1)
    {
        throw std::invalid_argument("batch_size must be at least 1");
    }

    int n_full = n_samples / batch_size;
    int remainder = n_samples - batch_size * n_full;

    std::vector<BatchRange> batches;
    batches.reserve(n_full + 1);

    int start_idx = 0;
    for (int batch = 0; batch < n_full; ++batch)
    {
        BatchRange range = {start_idx, batch_size};
        batches.push_back(range);
        start_idx += batch_size;
    }

    if (remainder > 0)
    {
        BatchRange range = {start_idx, remainder};
        batches.push_back(range);
    }

    return batches;
}
