#ifndef PERFORMANCE_EVALUATOR_HPP
#define PERFORMANCE_EVALUATOR_HPP

#include <Eigen/Dense>

using namespace Eigen;

class PerformanceEvaluator
{
public:
    // Classification metrics
    static double calculateAccuracy(const VectorXi &predictions, const VectorXd &true_labels);
    static double calculateArgmaxAccuracy(const VectorXi &predicted_classes, const MatrixXd &targets);

    // Losses reported during training
    static double calculateBinaryCrossEntropy(const VectorXd &probabilities, const VectorXd &true_labels);
    static double calculateMeanSquaredError(const MatrixXd &outputs, const MatrixXd &targets);

private:
    static VectorXi rowArgmax(const MatrixXd &M);
};

#endif // PERFORMANCE_EVALUATOR_HPP
