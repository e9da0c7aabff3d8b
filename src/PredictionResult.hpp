#ifndef PREDICTION_RESULT_HPP
#define PREDICTION_RESULT_HPP

#include <Eigen/Dense>
#include <vector>

using namespace Eigen;

// Argmax view over a network's output probabilities, one entry per row.
class PredictionResult
{
private:
    MatrixXd probabilities;
    VectorXi classes;       // first index of the row maximum
    VectorXd max_probabilities;

public:
    explicit PredictionResult(const MatrixXd &output_probabilities);

    MatrixXd getProbabilities() const;
    VectorXi getClasses() const;
    VectorXd getMaxProbabilities() const;

    int getClass(int row) const;
    double getMaxProbability(int row) const;

    // Every class index that attains the row maximum
    std::vector<int> getTiedClasses(int row) const;

    int size() const;
};

#endif // PREDICTION_RESULT_HPP
