#include <stdexcept>
#include "Activation.hpp"

Activation::Activation(ActivationType activation_type) : type(activation_type)
{
}

Activation Activation::fromName(const std::string &name)
{
    if (name == "relu")
    {
        return Activation(ActivationType::Relu);
    }
    else if (name == "tanh")
    {
        return Activation(ActivationType::Tanh);
    }
    else if (name == "sigmoid")
    {
        return Activation(ActivationType::Sigmoid);
    }

    throw std::invalid_argument("Unknown activation: " + name + ". Use 'relu', 'tanh' or 'sigmoid'");
}

MatrixXd Activation::apply(const MatrixXd &z) const
{
    switch (type)
    {
    case ActivationType::Relu:
        return z.array().max(0.0).matrix();
    case ActivationType::Tanh:
        return z.array().tanh().matrix();
    case ActivationType::Sigmoid:
        return (1.0 / (1.0 + (-z.array()).exp())).matrix();
    }
    throw std::logic_error("Unhandled activation type");
}

MatrixXd Activation::derivative(const MatrixXd &output) const
{
    switch (type)
    {
    case ActivationType::Relu:
        // Subgradient convention: 0 at output == 0
        return (output.array() > 0.0).cast<double>().matrix();
    case ActivationType::Tanh:
        return (1.0 - output.array().square()).matrix();
    case ActivationType::Sigmoid:
        return (output.array() * (1.0 - output.array())).matrix();
    }
    throw std::logic_error("Unhandled activation type");
}

ActivationType Activation::getType() const
{
    return type;
}

std::string Activation::getName() const
{
    switch (type)
    {
    case ActivationType::Relu:
        return "relu";
    case ActivationType::Tanh:
        return "tanh";
    case ActivationType::Sigmoid:
        return "sigmoid";
    }
    throw std::logic_error("Unhandled activation type");
}
