#include <cmath>
#include <random>
#include <vector>
#include <stdexcept>
#include "OneHiddenLayerNetwork.hpp"
#include "BatchSchedule.hpp"
#include "DesignMatrix.hpp"
#include "PerformanceEvaluator.hpp"

using namespace std;

// Constructor
OneHiddenLayerNetwork::OneHiddenLayerNetwork(int number_of_neurons, int batch,
                                             const std::string &hidden_name,
                                             const std::string &out_name,
                                             int epochs, double alpha)
    : n_hidden(number_of_neurons), batch_size(batch),
      hidden_activation(Activation::fromName(hidden_name)),
      output_activation(Activation::fromName(out_name)),
      n_epochs(epochs), learning_rate(alpha),
      seed(-1), report_interval(100), is_fitted(false)
{
    if (number_of_neurons < 1)
    {
        throw std::invalid_argument("number_of_neurons must be positive");
    }
    if (batch < 1)
    {
        throw std::invalid_argument("batch_size must be positive");
    }
    if (epochs < 1)
    {
        throw std::invalid_argument("epochs must be positive");
    }
    if (!(alpha > 0.0))
    {
        throw std::invalid_argument("learning_rate must be positive");
    }
}

// He-style initialisation: N(0, 1) * sqrt(2 / fan_in), bias row included
void OneHiddenLayerNetwork::initializeWeights(int n_inputs, int n_outputs)
{
    std::mt19937 rng;
    if (seed != -1)
    {
        rng.seed(seed);
    }
    else
    {
        std::random_device rd;
        rng.seed(rd());
    }
    std::normal_distribution<double> normal(0.0, 1.0);

    W_h.resize(n_inputs, n_hidden);
    double hidden_scale = std::sqrt(2.0 / n_inputs);
    for (int i = 0; i < W_h.rows(); ++i)
    {
        for (int j = 0; j < W_h.cols(); ++j)
        {
            W_h(i, j) = normal(rng) * hidden_scale;
        }
    }

    W_out.resize(n_hidden + 1, n_outputs);
    double output_scale = std::sqrt(2.0 / (n_hidden + 1));
    for (int i = 0; i < W_out.rows(); ++i)
    {
        for (int j = 0; j < W_out.cols(); ++j)
        {
            W_out(i, j) = normal(rng) * output_scale;
        }
    }
}

// Returns the output activations; a_h receives the hidden activations
MatrixXd OneHiddenLayerNetwork::forward(const Ref<const MatrixXd> &X_b, MatrixXd &a_h) const
{
    a_h = hidden_activation.apply(X_b * W_h);
    MatrixXd a_h_b = DesignMatrix::addBias(a_h);
    return output_activation.apply(a_h_b * W_out);
}

void OneHiddenLayerNetwork::forwardBackward(const Ref<const MatrixXd> &X_b, const Ref<const MatrixXd> &Y)
{
    MatrixXd a_h;
    MatrixXd a_o = forward(X_b, a_h);
    MatrixXd a_h_b = DesignMatrix::addBias(a_h);
    const double m = static_cast<double>(X_b.rows());

    // dLoss/dz_o with the factor 2 from the squared error
    MatrixXd delta_out = (2.0 * (a_o - Y).array() * output_activation.derivative(a_o).array()).matrix();
    MatrixXd d_out = learning_rate * (a_h_b.transpose() * delta_out) / m;

    // Bias row of W_out has no upstream input, so it is not propagated back
    MatrixXd delta_hidden = ((delta_out * W_out.bottomRows(n_hidden).transpose()).array() *
                             hidden_activation.derivative(a_h).array())
                                .matrix();
    MatrixXd d_hidden = learning_rate * (X_b.transpose() * delta_hidden) / m;

    W_out -= d_out;
    W_h -= d_hidden;
}

// Main fitting method
void OneHiddenLayerNetwork::fit(const MatrixXd &X, const MatrixXd &Y)
{
    if (X.rows() != Y.rows())
    {
        throw std::invalid_argument("X and Y must have the same number of rows");
    }
    if (X.rows() == 0)
    {
        throw std::invalid_argument("Need at least 1 observation");
    }
    if (Y.cols() == 0)
    {
        throw std::invalid_argument("Y must have at least one column");
    }

    MatrixXd X_b = DesignMatrix::addBias(X);
    initializeWeights(static_cast<int>(X_b.cols()), static_cast<int>(Y.cols()));
    is_fitted = true;

    std::vector<BatchRange> batches = BatchSchedule::create(static_cast<int>(X_b.rows()), batch_size);

    for (int epoch = 0; epoch < n_epochs; ++epoch)
    {
        for (size_t b = 0; b < batches.size(); ++b)
        {
            forwardBackward(X_b.middleRows(batches[b].start, batches[b].size),
                            Y.middleRows(batches[b].start, batches[b].size));
        }

        if (observer && epoch % report_interval == 0)
        {
            observer(epoch, PerformanceEvaluator::calculateMeanSquaredError(predict_proba(X_b), Y));
        }
    }
}

void OneHiddenLayerNetwork::setSeed(int random_seed)
{
    seed = random_seed;
}

void OneHiddenLayerNetwork::setObserver(const TrainingObserver &training_observer)
{
    observer = training_observer;
}

void OneHiddenLayerNetwork::setReportInterval(int interval)
{
    if (interval < 1)
    {
        throw std::invalid_argument("report_interval must be positive");
    }
    report_interval = interval;
}

// Getter methods
MatrixXd OneHiddenLayerNetwork::getHiddenWeights() const
{
    return W_h;
}

MatrixXd OneHiddenLayerNetwork::getOutputWeights() const
{
    return W_out;
}

int OneHiddenLayerNetwork::getNumHidden() const
{
    return n_hidden;
}

int OneHiddenLayerNetwork::getBatchSize() const
{
    return batch_size;
}

int OneHiddenLayerNetwork::getNumEpochs() const
{
    return n_epochs;
}

double OneHiddenLayerNetwork::getLearningRate() const
{
    return learning_rate;
}

Activation OneHiddenLayerNetwork::getHiddenActivation() const
{
    return hidden_activation;
}

Activation OneHiddenLayerNetwork::getOutputActivation() const
{
    return output_activation;
}

int OneHiddenLayerNetwork::getSeed() const
{
    return seed;
}

int OneHiddenLayerNetwork::getReportInterval() const
{
    return report_interval;
}

bool OneHiddenLayerNetwork::isFitted() const
{
    return is_fitted;
}

// Prediction methods
MatrixXd OneHiddenLayerNetwork::predict_proba(const MatrixXd &X_b) const
{
    if (!is_fitted)
    {
        throw std::runtime_error("Model has not been fitted yet");
    }

    if (X_b.cols() != W_h.rows())
    {
        throw std::invalid_argument("Input matrix columns must match hidden weight rows (add the bias column first)");
    }

    MatrixXd a_h;
    return forward(X_b, a_h);
}

PredictionResult OneHiddenLayerNetwork::predict(const MatrixXd &X_b) const
{
    return PredictionResult(predict_proba(X_b));
}
