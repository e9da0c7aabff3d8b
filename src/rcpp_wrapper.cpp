#include <Rcpp.h>
#include <RcppEigen.h>
#ifdef _OPENMP
#include <omp.h>
#endif
#include "DesignMatrix.hpp"
#include "LogisticRegression.hpp"
#include "OneHiddenLayerNetwork.hpp"
#include "PredictionResult.hpp"
#include "TrainingObserver.hpp"

// [[Rcpp::depends(RcppEigen)]]
// [[Rcpp::plugins(cpp11)]]

using namespace Rcpp;
using namespace Eigen;

// Model handles carry their class name as the external pointer tag
static const char *LOGISTIC_REGRESSION_TAG = "LogisticRegression";
static const char *ONE_HIDDEN_LAYER_NETWORK_TAG = "OneHiddenLayerNetwork";

template <typename T>
XPtr<T> checkedModel(SEXP model_ptr, const char *tag)
{
    if (TYPEOF(model_ptr) != EXTPTRSXP || R_ExternalPtrTag(model_ptr) != Rf_install(tag))
    {
        stop(std::string("model is not a ") + tag);
    }

    XPtr<T> model(model_ptr);
    if (model.get() == NULL)
    {
        // External pointers do not survive saveRDS()/readRDS()
        stop("model pointer is no longer valid; refit the model");
    }
    return model;
}

// C++ function for logistic regression by gradient descent
// [[Rcpp::export]]
List logistic_regression_fit(
    NumericMatrix X_r,
    NumericVector y_r,
    int number_of_iterations = 1000,
    double learning_rate = 0.1,
    bool verbose = true,
    int report_interval = 100)
{
    try
    {
        // Convert R objects to Eigen
        Map<MatrixXd> X_eigen(as<Map<MatrixXd>>(X_r));
        Map<VectorXd> y_eigen(as<Map<VectorXd>>(y_r));

        // Validate inputs
        if (X_eigen.rows() != y_eigen.rows())
        {
            stop("X and y must have the same number of rows");
        }

        XPtr<LogisticRegression> model(new LogisticRegression(number_of_iterations, learning_rate), true,
                                       Rf_install(LOGISTIC_REGRESSION_TAG));
        model->setReportInterval(report_interval);
        if (verbose)
        {
            model->setObserver(makeStreamReporter(Rcout));
        }

        model->fit(X_eigen, y_eigen);

        VectorXd w = model->getWeights();
        NumericVector weights(w.data(), w.data() + w.size());

        return List::create(
            Named("model") = model,
            Named("weights") = weights,
            Named("n_observations") = X_eigen.rows(),
            Named("n_features") = X_eigen.cols(),
            Named("number_of_iterations") = number_of_iterations,
            Named("learning_rate") = learning_rate);
    }
    catch (const std::exception &e)
    {
        stop("C++ error: " + std::string(e.what()));
    }
}

// C++ function for logistic regression predictions
// [[Rcpp::export]]
NumericVector logistic_regression_predict(
    SEXP model_ptr,
    NumericMatrix X_new,
    std::string type = "class",
    double threshold = 0.5,
    bool add_bias = true)
{
    try
    {
        XPtr<LogisticRegression> model = checkedModel<LogisticRegression>(model_ptr, LOGISTIC_REGRESSION_TAG);
        Map<MatrixXd> X_eigen(as<Map<MatrixXd>>(X_new));
        MatrixXd X_b = add_bias ? DesignMatrix::addBias(X_eigen) : MatrixXd(X_eigen);

        int n_obs = X_b.rows();
        NumericVector predictions(n_obs);

        if (type == "prob")
        {
            VectorXd probs = model->predict_proba(X_b);
            for (int i = 0; i < n_obs; ++i)
            {
                predictions[i] = probs(i);
            }
        }
        else if (type == "class")
        {
            VectorXi classes = model->predict(X_b, threshold);
            for (int i = 0; i < n_obs; ++i)
            {
                predictions[i] = classes(i);
            }
        }
        else
        {
            stop("type must be 'class' or 'prob'");
        }

        return predictions;
    }
    catch (const std::exception &e)
    {
        stop("C++ error in prediction: " + std::string(e.what()));
    }
}

// C++ function for the one-hidden-layer network
// [[Rcpp::export]]
List one_hidden_layer_fit(
    NumericMatrix X_r,
    NumericMatrix Y_r,
    int number_of_neurons,
    int batch_size = 20,
    std::string hidden_activation = "relu",
    std::string out_activation = "sigmoid",
    int epochs = 100,
    double learning_rate = 0.1,
    int seed = -1,
    bool verbose = true,
    int report_interval = 100,
    int n_threads = -1)
{
#ifdef _OPENMP
    int original_threads = omp_get_max_threads();
#endif
    try
    {
        // Convert R objects to Eigen
        Map<MatrixXd> X_eigen(as<Map<MatrixXd>>(X_r));
        Map<MatrixXd> Y_eigen(as<Map<MatrixXd>>(Y_r));

        // Validate inputs
        if (X_eigen.rows() != Y_eigen.rows())
        {
            stop("X and Y must have the same number of rows");
        }

// Configure OpenMP threads used by Eigen's matrix products
#ifdef _OPENMP
        if (n_threads > 0)
        {
            omp_set_num_threads(n_threads);
        }
        else if (n_threads == 0)
        {
            // n_threads = 0 means serial execution
            omp_set_num_threads(1);
        }
// n_threads = -1 (default) uses OpenMP default (all available threads)
#endif

        XPtr<OneHiddenLayerNetwork> model(
            new OneHiddenLayerNetwork(number_of_neurons, batch_size, hidden_activation,
                                      out_activation, epochs, learning_rate),
            true, Rf_install(ONE_HIDDEN_LAYER_NETWORK_TAG));
        model->setSeed(seed);
        model->setReportInterval(report_interval);
        if (verbose)
        {
            model->setObserver(makeStreamReporter(Rcout));
        }

        model->fit(X_eigen, Y_eigen);

// Restore original thread count
#ifdef _OPENMP
        omp_set_num_threads(original_threads);
#endif

        return List::create(
            Named("model") = model,
            Named("hidden_weights") = wrap(model->getHiddenWeights()),
            Named("output_weights") = wrap(model->getOutputWeights()),
            Named("hidden_activation") = model->getHiddenActivation().getName(),
            Named("out_activation") = model->getOutputActivation().getName(),
            Named("n_observations") = X_eigen.rows(),
            Named("n_features") = X_eigen.cols(),
            Named("n_outputs") = Y_eigen.cols());
    }
    catch (const std::exception &e)
    {
#ifdef _OPENMP
        omp_set_num_threads(original_threads);
#endif
        stop("C++ error: " + std::string(e.what()));
    }
}

// C++ function for network predictions
// [[Rcpp::export]]
SEXP one_hidden_layer_predict(
    SEXP model_ptr,
    NumericMatrix X_new,
    std::string type = "class",
    bool add_bias = true)
{
    try
    {
        XPtr<OneHiddenLayerNetwork> model = checkedModel<OneHiddenLayerNetwork>(model_ptr, ONE_HIDDEN_LAYER_NETWORK_TAG);
        Map<MatrixXd> X_eigen(as<Map<MatrixXd>>(X_new));
        MatrixXd X_b = add_bias ? DesignMatrix::addBias(X_eigen) : MatrixXd(X_eigen);

        if (type == "prob")
        {
            return wrap(model->predict_proba(X_b));
        }
        else if (type == "class")
        {
            PredictionResult result = model->predict(X_b);
            VectorXi classes = result.getClasses();
            VectorXd probabilities = result.getMaxProbabilities();

            IntegerVector classes_r(classes.size());
            for (int i = 0; i < classes.size(); ++i)
            {
                classes_r[i] = classes(i) + 1; // 1-based for R
            }

            return List::create(
                Named("class") = classes_r,
                Named("probability") = wrap(probabilities));
        }

        stop("type must be 'class' or 'prob'");
    }
    catch (const std::exception &e)
    {
        stop("C++ error in prediction: " + std::string(e.what()));
    }
    return R_NilValue;
}
