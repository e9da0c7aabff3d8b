#ifndef DESIGN_MATRIX_HPP
#define DESIGN_MATRIX_HPP

#include <Eigen/Dense>

using namespace Eigen;

class DesignMatrix
{
public:
    // Prepend a column of ones so the bias is an ordinary weight (row 0).
    // Takes a Ref to avoid creating temporaries when passing block expressions.
    static MatrixXd addBias(const Ref<const MatrixXd> &X);
};

#endif // DESIGN_MATRIX_HPP
