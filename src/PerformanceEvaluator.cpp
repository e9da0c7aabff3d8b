#include <cmath>
#include <cfloat>
#include <stdexcept>
#include "PerformanceEvaluator.hpp"

using namespace std;

// Calculate classification accuracy
double PerformanceEvaluator::calculateAccuracy(const VectorXi &predictions, const VectorXd &true_labels)
{
    if (predictions.size() != true_labels.size())
    {
        throw std::invalid_argument("Predictions and true labels must have the same size");
    }
    if (predictions.size() == 0)
    {
        throw std::invalid_argument("Predictions cannot be empty");
    }

    int correct = 0;
    for (int i = 0; i < predictions.size(); ++i)
    {
        if (predictions(i) == (int)true_labels(i))
        {
            correct++;
        }
    }

    return (double)correct / predictions.size();
}

// Fraction of rows whose predicted class is the argmax of the target row
double PerformanceEvaluator::calculateArgmaxAccuracy(const VectorXi &predicted_classes, const MatrixXd &targets)
{
    if (predicted_classes.size() != targets.rows())
    {
        throw std::invalid_argument("Predicted classes and targets must have the same number of rows");
    }
    if (targets.rows() == 0)
    {
        throw std::invalid_argument("Targets cannot be empty");
    }

    VectorXi expected = rowArgmax(targets);
    int correct = 0;
    for (int i = 0; i < expected.size(); ++i)
    {
        if (predicted_classes(i) == expected(i))
        {
            correct++;
        }
    }

    return (double)correct / expected.size();
}

// Mean binary cross-entropy
double PerformanceEvaluator::calculateBinaryCrossEntropy(const VectorXd &probabilities, const VectorXd &true_labels)
{
    if (probabilities.size() != true_labels.size())
    {
        throw std::invalid_argument("Probabilities and true labels must have the same size");
    }
    if (probabilities.size() == 0)
    {
        throw std::invalid_argument("Probabilities cannot be empty");
    }

    // Clip to avoid log(0)
    const double eps = DBL_EPSILON;
    ArrayXd p = probabilities.array().max(eps).min(1.0 - eps);
    ArrayXd y = true_labels.array();

    return (-y * p.log() - (1.0 - y) * (1.0 - p).log()).mean();
}

// Sum of squared differences normalized by the number of examples
double PerformanceEvaluator::calculateMeanSquaredError(const MatrixXd &outputs, const MatrixXd &targets)
{
    if (outputs.rows() != targets.rows() || outputs.cols() != targets.cols())
    {
        throw std::invalid_argument("Outputs and targets must have the same shape");
    }
    if (targets.rows() == 0)
    {
        throw std::invalid_argument("Targets cannot be empty");
    }

    return (outputs - targets).squaredNorm() / targets.rows();
}

VectorXi PerformanceEvaluator::rowArgmax(const MatrixXd &M)
{
    VectorXi classes(M.rows());
    for (int i = 0; i < M.rows(); ++i)
    {
        Index best;
        M.row(i).maxCoeff(&best);
        classes(i) = static_cast<int>(best);
    }
    return classes;
}
