#include "DesignMatrix.hpp"

MatrixXd DesignMatrix::addBias(const Ref<const MatrixXd> &X)
{
    MatrixXd X_b(X.rows(), X.cols() + 1);
    X_b.col(0) = VectorXd::Ones(X.rows());
    X_b.rightCols(X.cols()) = X;
    return X_b;
}
