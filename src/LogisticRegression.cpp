#include <stdexcept>
#include "LogisticRegression.hpp"
#include "DesignMatrix.hpp"
#include "PerformanceEvaluator.hpp"

using namespace std;

// Unclamped on purpose: overflow in exp() saturates to 0 or 1
VectorXd LogisticRegression::sigmoid(const VectorXd &z)
{
    return (1.0 / (1.0 + (-z.array()).exp())).matrix();
}

// d(BCE)/dW = X^T (y_hat - y) / n
VectorXd LogisticRegression::gradient(const MatrixXd &X_b, const VectorXd &y_hat, const VectorXd &y) const
{
    return X_b.transpose() * (y_hat - y) / static_cast<double>(y.size());
}

// Constructor
LogisticRegression::LogisticRegression(int number_of_iterations, double alpha)
    : num_iterations(number_of_iterations), learning_rate(alpha),
      report_interval(100), is_fitted(false)
{
    if (number_of_iterations < 1)
    {
        throw std::invalid_argument("number_of_iterations must be positive");
    }
    if (!(alpha > 0.0))
    {
        throw std::invalid_argument("learning_rate must be positive");
    }
}

// Main fitting method
void LogisticRegression::fit(const MatrixXd &X, const VectorXd &y)
{
    if (X.rows() != y.rows())
    {
        throw std::invalid_argument("X and y must have the same number of rows");
    }
    if (X.rows() == 0)
    {
        throw std::invalid_argument("Need at least 1 observation");
    }

    MatrixXd X_b = DesignMatrix::addBias(X);
    W = VectorXd::Zero(X_b.cols());
    is_fitted = true;

    for (int iter = 0; iter < num_iterations; ++iter)
    {
        VectorXd y_hat = sigmoid(X_b * W);
        W -= learning_rate * gradient(X_b, y_hat, y);

        if (observer && iter % report_interval == 0)
        {
            // Loss after this iteration's update
            observer(iter, PerformanceEvaluator::calculateBinaryCrossEntropy(sigmoid(X_b * W), y));
        }
    }
}

void LogisticRegression::setObserver(const TrainingObserver &training_observer)
{
    observer = training_observer;
}

void LogisticRegression::setReportInterval(int interval)
{
    if (interval < 1)
    {
        throw std::invalid_argument("report_interval must be positive");
    }
    report_interval = interval;
}

// Getter methods
VectorXd LogisticRegression::getWeights() const
{
    return W;
}

int LogisticRegression::getNumIterations() const
{
    return num_iterations;
}

double LogisticRegression::getLearningRate() const
{
    return learning_rate;
}

int LogisticRegression::getReportInterval() const
{
    return report_interval;
}

bool LogisticRegression::isFitted() const
{
    return is_fitted;
}

// Prediction methods
VectorXd LogisticRegression::predict_proba(const MatrixXd &X_b) const
{
    if (!is_fitted)
    {
        throw std::runtime_error("Model has not been fitted yet");
    }

    if (X_b.cols() != W.size())
    {
        throw std::invalid_argument("Input matrix columns must match number of weights (add the bias column first)");
    }

    return sigmoid(X_b * W);
}

VectorXi LogisticRegression::predict(const MatrixXd &X_b, double threshold) const
{
    VectorXd probs = predict_proba(X_b);
    VectorXi predictions(probs.size());
    for (int i = 0; i < probs.size(); ++i)
    {
        predictions(i) = (probs(i) >= threshold) ? 1 : 0;
    }
    return predictions;
}
