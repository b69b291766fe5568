/* -----------------------------------------------------------------------------
 * SUNDIALS Copyright Start
 * Copyright (c) 2002-2024, Lawrence Livermore National Security
 * and Southern Methodist University.
 * All rights reserved.
 *
 * See the top-level LICENSE and NOTICE files for details.
 *
 * SPDX-License-Identifier: BSD-3-Clause
 * SUNDIALS Copyright End
 * -----------------------------------------------------------------------------
 * Tensor-product grid assembly
 * ---------------------------------------------------------------------------*/

#include "spectral_rcd.hpp"

// Column index follows x and row index follows y:
//
//   X(i,j) = x_j,  Y(i,j) = y_i,  D2x = Dx Dx,  D2y = Dy Dy
int AssembleGrid(const RealMatrix& Dx, const RealVector& x, const RealMatrix& Dy,
                 const RealVector& y, Grid2D& grid)
{
  if (x.size() == 0 || y.size() == 0)
  {
    cerr << "ERROR: AssembleGrid: empty node vector" << endl;
    return RCD_INVALID_DIMENSION;
  }

  if (Dx.rows() != x.size() || Dx.cols() != x.size())
  {
    cerr << "ERROR: AssembleGrid: Dx is " << Dx.rows() << " x " << Dx.cols()
         << " but x has " << x.size() << " nodes" << endl;
    return RCD_SHAPE_MISMATCH;
  }

  if (Dy.rows() != y.size() || Dy.cols() != y.size())
  {
    cerr << "ERROR: AssembleGrid: Dy is " << Dy.rows() << " x " << Dy.cols()
         << " but y has " << y.size() << " nodes" << endl;
    return RCD_SHAPE_MISMATCH;
  }

  const sunindextype nx = x.size();
  const sunindextype ny = y.size();

  grid.X = RealVector::Ones(ny) * x.transpose();
  grid.Y = y * RealVector::Ones(nx).transpose();

  grid.D2x.noalias() = Dx * Dx;
  grid.D2y.noalias() = Dy * Dy;

  return RCD_SUCCESS;
}
