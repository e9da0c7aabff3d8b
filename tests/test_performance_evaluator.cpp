#include <cmath>
#include <cfloat>
#include <vector>
#include <iostream>
#include <stdexcept>
#include "DesignMatrix.hpp"
#include "PerformanceEvaluator.hpp"
#include "PredictionResult.hpp"
#include "tests/helpers.h"

static void test_accuracy() {
    TEST_HEADER("binary accuracy");
    VectorXi predictions(4);
    predictions << 1, 0, 1, 1;
    VectorXd labels(4);
    labels << 1, 0, 0, 1;
    EXPECT_CLOSE(PerformanceEvaluator::calculateAccuracy(predictions, labels), 0.75, 1e-12, "3 of 4");

    VectorXd short_labels(3);
    short_labels << 1, 0, 0;
    EXPECT_THROWS(PerformanceEvaluator::calculateAccuracy(predictions, short_labels), std::invalid_argument, "size mismatch");
}

static void test_argmax_accuracy() {
    TEST_HEADER("argmax accuracy against one-hot targets");
    MatrixXd targets(3, 3);
    targets << 0, 1, 0,
               1, 0, 0,
               0, 0, 1;
    VectorXi classes(3);
    classes << 1, 2, 2;
    EXPECT_CLOSE(PerformanceEvaluator::calculateArgmaxAccuracy(classes, targets), 2.0 / 3.0, 1e-12, "2 of 3");
}

static void test_binary_cross_entropy() {
    TEST_HEADER("binary cross-entropy");
    VectorXd p(2);
    p << 0.5, 0.5;
    VectorXd y(2);
    y << 1.0, 0.0;
    EXPECT_CLOSE(PerformanceEvaluator::calculateBinaryCrossEntropy(p, y), std::log(2.0), 1e-12, "uninformed prediction");

    VectorXd perfect(2);
    perfect << 1.0, 0.0;
    EXPECT_CLOSE(PerformanceEvaluator::calculateBinaryCrossEntropy(perfect, y), 0.0, 1e-12, "perfect prediction");

    VectorXd wrong(1);
    wrong << 0.0;
    VectorXd one(1);
    one << 1.0;
    double clipped = PerformanceEvaluator::calculateBinaryCrossEntropy(wrong, one);
    EXPECT_TRUE(std::isfinite(clipped), "log(0) is clipped");
    EXPECT_CLOSE(clipped, -std::log(DBL_EPSILON), 1e-9, "clipped at DBL_EPSILON");
}

static void test_mean_squared_error() {
    TEST_HEADER("squared error normalised by example count");
    MatrixXd outputs(2, 2);
    outputs << 1, 0,
               0, 1;
    MatrixXd targets = MatrixXd::Zero(2, 2);
    EXPECT_CLOSE(PerformanceEvaluator::calculateMeanSquaredError(outputs, targets), 1.0, 1e-12, "sum 2 over 2 rows");
    EXPECT_THROWS(PerformanceEvaluator::calculateMeanSquaredError(outputs, MatrixXd::Zero(2, 3)), std::invalid_argument, "shape mismatch");
}

static void test_prediction_result() {
    TEST_HEADER("prediction result argmax and ties");
    MatrixXd probs(3, 2);
    probs << 0.2, 0.8,
             0.5, 0.5,
             0.9, 0.1;
    PredictionResult result(probs);

    EXPECT_TRUE(result.size() == 3, "three rows");
    EXPECT_TRUE(result.getClass(0) == 1, "row 0 class");
    EXPECT_TRUE(result.getClass(1) == 0, "row 1 first of the tie");
    EXPECT_TRUE(result.getClass(2) == 0, "row 2 class");
    EXPECT_CLOSE(result.getMaxProbability(0), 0.8, 1e-12, "row 0 probability");

    std::vector<int> tied = result.getTiedClasses(1);
    EXPECT_TRUE(tied.size() == 2 && tied[0] == 0 && tied[1] == 1, "row 1 ties both classes");
    EXPECT_TRUE(result.getTiedClasses(0).size() == 1, "row 0 has a unique maximum");

    EXPECT_THROWS(result.getClass(3), std::out_of_range, "row out of range");
}

static void test_design_matrix() {
    TEST_HEADER("bias column is prepended");
    MatrixXd X(2, 2);
    X << 3, 4,
         5, 6;
    MatrixXd expected(2, 3);
    expected << 1, 3, 4,
                1, 5, 6;
    expect_matrix_close(DesignMatrix::addBias(X), expected, 0.0, "augmented matrix");
    expect_matrix_close(DesignMatrix::addBias(X.bottomRows(1)), expected.bottomRows(1), 0.0, "augmented block");
}

int main() {
    try {
        test_accuracy();
        test_argmax_accuracy();
        test_binary_cross_entropy();
        test_mean_squared_error();
        test_prediction_result();
        test_design_matrix();
        return report_results("test_performance_evaluator");
    } catch (const std::exception& e) {
        std::cerr << "\nEXCEPTION: " << e.what() << "\n";
        return 2;
    }
}
