#include <stdexcept>
#include <string>
#include "PredictionResult.hpp"

PredictionResult::PredictionResult(const MatrixXd &output_probabilities)
    : probabilities(output_probabilities), classes(output_probabilities.rows()),
      max_probabilities(output_probabilities.rows())
{
    if (output_probabilities.cols() == 0)
    {
        throw std::invalid_argument("Probabilities must have at least one column");
    }

    for (int i = 0; i < probabilities.rows(); ++i)
    {
        Index best;
        max_probabilities(i) = probabilities.row(i).maxCoeff(&best);
        classes(i) = static_cast<int>(best);
    }
}

MatrixXd PredictionResult::getProbabilities() const
{
    return probabilities;
}

VectorXi PredictionResult::getClasses() const
{
    return classes;
}

VectorXd PredictionResult::getMaxProbabilities() const
{
    return max_probabilities;
}

int PredictionResult::getClass(int row) const
{
    if (row < 0 || row >= classes.size())
    {
        throw std::out_of_range("Row " + std::to_string(row) + " out of range");
    }
    return classes(row);
}

double PredictionResult::getMaxProbability(int row) const
{
    if (row < 0 || row >= max_probabilities.size())
    {
        throw std::out_of_range("Row " + std::to_string(row) + " out of range");
    }
    return max_probabilities(row);
}

std::vector<int> PredictionResult::getTiedClasses(int row) const
{
    double max_value = getMaxProbability(row);

    std::vector<int> tied;
    for (int j = 0; j < probabilities.cols(); ++j)
    {
        if (probabilities(row, j) == max_value)
        {
            tied.push_back(j);
        }
    }
    return tied;
}

int PredictionResult::size() const
{
    return static_cast<int>(classes.size());
}
