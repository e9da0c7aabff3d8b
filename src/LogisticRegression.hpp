#ifndef LOGISTIC_REGRESSION_HPP
#define LOGISTIC_REGRESSION_HPP

#include <Eigen/Dense>
#include "TrainingObserver.hpp"

using namespace Eigen;

class LogisticRegression
{
private:
    VectorXd W; // weights, W(0) is the bias
    int num_iterations;
    double learning_rate;
    int report_interval;
    TrainingObserver observer;
    bool is_fitted;

    // Helper methods
    static VectorXd sigmoid(const VectorXd &z);
    VectorXd gradient(const MatrixXd &X_b, const VectorXd &y_hat, const VectorXd &y) const;

public:
    // Constructor
    LogisticRegression(int number_of_iterations, double alpha);

    // Full-batch gradient descent for exactly number_of_iterations steps.
    // X is not bias-augmented; weights are reset to zero on every call.
    void fit(const MatrixXd &X, const VectorXd &y);

    // Observer receives the cross-entropy every report_interval iterations
    void setObserver(const TrainingObserver &training_observer);
    void setReportInterval(int interval);

    // Getters
    VectorXd getWeights() const;
    int getNumIterations() const;
    double getLearningRate() const;
    int getReportInterval() const;
    bool isFitted() const;

    // Prediction methods. X_b must already carry the bias column
    // (see DesignMatrix::addBias).
    VectorXd predict_proba(const MatrixXd &X_b) const;
    VectorXi predict(const MatrixXd &X_b, double threshold = 0.5) const;
};

#endif // LOGISTIC_REGRESSION_HPP
