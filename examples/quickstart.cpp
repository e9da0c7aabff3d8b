#include <iostream>
#include <stdexcept>
#include "DesignMatrix.hpp"
#include "LogisticRegression.hpp"
#include "OneHiddenLayerNetwork.hpp"
#include "PerformanceEvaluator.hpp"
#include "PredictionResult.hpp"
#include "TrainingObserver.hpp"

int main()
{
    try
    {
        // Logistic regression on two separable points
        MatrixXd X(2, 2);
        X << 1.0, 1.0,
            -1.0, -1.0;
        VectorXd y(2);
        y << 1.0, 0.0;

        LogisticRegression logreg(500, 0.1);
        logreg.setObserver(makeStreamReporter(std::cout));
        logreg.fit(X, y);

        VectorXi labels = logreg.predict(DesignMatrix::addBias(X));
        std::cout << "Logistic regression weights: " << logreg.getWeights().transpose() << "\n";
        std::cout << "Training accuracy: " << PerformanceEvaluator::calculateAccuracy(labels, y) << "\n\n";

        // One hidden layer network on XOR
        MatrixXd X_xor(4, 2);
        X_xor << 0, 0,
                 0, 1,
                 1, 0,
                 1, 1;
        MatrixXd Y_xor(4, 2);
        Y_xor << 1, 0,
                 0, 1,
                 0, 1,
                 1, 0;

        OneHiddenLayerNetwork net(8, 4, "tanh", "sigmoid", 2000, 0.5);
        net.setSeed(1);
        net.setReportInterval(500);
        net.setObserver(makeStreamReporter(std::cout));
        net.fit(X_xor, Y_xor);

        PredictionResult result = net.predict(DesignMatrix::addBias(X_xor));
        for (int i = 0; i < result.size(); ++i)
        {
            std::cout << "Input " << X_xor.row(i) << ": max probability is class " << result.getClass(i)
                      << " with probability " << result.getMaxProbability(i) << "\n";
        }
        std::cout << "Training accuracy: "
                  << PerformanceEvaluator::calculateArgmaxAccuracy(result.getClasses(), Y_xor) << "\n";
    }
    catch (const std::exception &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
