#ifndef TRAINING_OBSERVER_HPP
#define TRAINING_OBSERVER_HPP

#include <functional>
#include <ostream>

// Called with the 0-based iteration (or epoch) and the diagnostic loss.
typedef std::function<void(int, double)> TrainingObserver;

// Observer writing one "Loss = <value>" line per report to the given stream.
// The stream must outlive the observer.
TrainingObserver makeStreamReporter(std::ostream &out);

#endif // TRAINING_OBSERVER_HPP
