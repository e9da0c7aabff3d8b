#ifndef ACTIVATION_HPP
#define ACTIVATION_HPP

#include <Eigen/Dense>
#include <string>

using namespace Eigen;

enum class ActivationType
{
    Relu,
    Tanh,
    Sigmoid
};

class Activation
{
private:
    ActivationType type;

public:
    explicit Activation(ActivationType activation_type);

    // Accepts "relu", "tanh" or "sigmoid"
    static Activation fromName(const std::string &name);

    // Element-wise activation of a layer's linear combination
    MatrixXd apply(const MatrixXd &z) const;

    // Derivative expressed through the activation OUTPUT, not its input:
    //   relu:    1 where output > 0, else 0
    //   tanh:    1 - output^2
    //   sigmoid: output * (1 - output)
    MatrixXd derivative(const MatrixXd &output) const;

    ActivationType getType() const;
    std::string getName() const;
};

#endif // ACTIVATION_HPP
