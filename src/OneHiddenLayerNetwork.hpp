#ifndef ONE_HIDDEN_LAYER_NETWORK_HPP
#define ONE_HIDDEN_LAYER_NETWORK_HPP

#include <Eigen/Dense>
#include <string>
#include "Activation.hpp"
#include "PredictionResult.hpp"
#include "TrainingObserver.hpp"

using namespace Eigen;

// Hidden layer + output layer trained with mini-batch gradient descent on
// the squared error. Row 0 of both weight matrices holds the bias.
class OneHiddenLayerNetwork
{
private:
    int n_hidden;
    int batch_size;
    Activation hidden_activation;
    Activation output_activation;
    int n_epochs;
    double learning_rate;

    MatrixXd W_h;   // (features + 1) x n_hidden
    MatrixXd W_out; // (n_hidden + 1) x outputs

    int seed;
    int report_interval;
    TrainingObserver observer;
    bool is_fitted;

    void initializeWeights(int n_inputs, int n_outputs);
    MatrixXd forward(const Ref<const MatrixXd> &X_b, MatrixXd &a_h) const;
    void forwardBackward(const Ref<const MatrixXd> &X_b, const Ref<const MatrixXd> &Y);

public:
    // Unknown activation names throw std::invalid_argument
    OneHiddenLayerNetwork(int number_of_neurons, int batch_size = 20,
                          const std::string &hidden_activation = "relu",
                          const std::string &out_activation = "sigmoid",
                          int epochs = 100, double learning_rate = 0.1);

    // X is (examples x features) without the bias column, Y is (examples x outputs).
    // Weights are redrawn on every call.
    void fit(const MatrixXd &X, const MatrixXd &Y);

    // -1 seeds the initialisation from std::random_device
    void setSeed(int random_seed);
    void setObserver(const TrainingObserver &training_observer);
    void setReportInterval(int interval);

    // Getters
    MatrixXd getHiddenWeights() const;
    MatrixXd getOutputWeights() const;
    int getNumHidden() const;
    int getBatchSize() const;
    int getNumEpochs() const;
    double getLearningRate() const;
    Activation getHiddenActivation() const;
    Activation getOutputActivation() const;
    int getSeed() const;
    int getReportInterval() const;
    bool isFitted() const;

    // Prediction methods. X_b must already carry the bias column.
    MatrixXd predict_proba(const MatrixXd &X_b) const;
    PredictionResult predict(const MatrixXd &X_b) const;
};

#endif // ONE_HIDDEN_LAYER_NETWORK_HPP
