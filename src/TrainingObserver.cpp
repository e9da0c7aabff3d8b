#include "TrainingObserver.hpp"

TrainingObserver makeStreamReporter(std::ostream &out)
{
    std::ostream *stream = &out;
    return [stream](int, double loss)
    {
        std::streamsize previous = stream->precision(10);
        *stream << "Loss = " << loss << std::endl;
        stream->precision(previous);
    };
}
