#ifndef BATCH_SCHEDULE_HPP
#define BATCH_SCHEDULE_HPP

#include <vector>

struct BatchRange
{
    int start;
    int size;
};

class BatchSchedule
{
public:
    // floor(n / batch_size) full batches in order, then one remainder batch
    // over the last n % batch_size examples. No remainder batch when
    // batch_size divides n.
    static std::vector<BatchRange> create(int n_samples, int batch_size);
};

#endif // BATCH_SCHEDULE_HPP
