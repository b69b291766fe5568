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
 * Chebyshev collocation operators and the shared spectral context
 * ---------------------------------------------------------------------------*/

#include "spectral_rcd.hpp"

// Chebyshev differentiation matrix on the Gauss-Lobatto nodes
//
//   x_k = cos(pi k / n),  k = 0, ..., n
//
// Off-diagonal entries are c_i / c_j / (x_i - x_j) with the weights
// c_k = (2 at k = 0,n else 1) * (-1)^k. The diagonal is the negative sum of the
// remaining row entries, so D annihilates constants.
int ChebyshevDiff(sunindextype n, RealMatrix& D, RealVector& x)
{
  if (n < 0)
  {
    cerr << "ERROR: ChebyshevDiff: invalid resolution " << n << endl;
    return RCD_INVALID_DIMENSION;
  }

  // Single node, no differentiation possible
  if (n == 0)
  {
    D = RealMatrix::Zero(1, 1);
    x = RealVector::Ones(1);
    return RCD_SUCCESS;
  }

  const sunindextype nnodes = n + 1;

  x.resize(nnodes);
  RealVector c(nnodes);
  for (sunindextype k = 0; k < nnodes; k++)
  {
    x(k) = cos(PI * static_cast<sunrealtype>(k) / static_cast<sunrealtype>(n));
    c(k) = ((k == 0 || k == n) ? TWO : ONE) * ((k % 2 == 0) ? ONE : -ONE);
  }

  D.resize(nnodes, nnodes);
  for (sunindextype i = 0; i < nnodes; i++)
  {
    sunrealtype rowsum = ZERO;
    for (sunindextype j = 0; j < nnodes; j++)
    {
      if (i == j) { continue; }
      D(i, j) = c(i) / c(j) / (x(i) - x(j));
      rowsum += D(i, j);
    }
    D(i, i) = -rowsum;
  }

  return RCD_SUCCESS;
}

// Build D, x, D2 and the coordinate matrices for resolution n
int SetupSpectralContext(sunindextype n, SpectralContext& sctx)
{
  RealMatrix D;
  RealVector x;
  int flag = ChebyshevDiff(n, D, x);
  if (check_flag(flag, "ChebyshevDiff")) { return flag; }

  // Same nodes in both directions on the square domain
  Grid2D grid;
  flag = AssembleGrid(D, x, D, x, grid);
  if (check_flag(flag, "AssembleGrid")) { return flag; }

  sctx.n  = n;
  sctx.D  = std::move(D);
  sctx.x  = std::move(x);
  sctx.D2 = std::move(grid.D2x);
  sctx.X  = std::move(grid.X);
  sctx.Y  = std::move(grid.Y);

  return RCD_SUCCESS;
}
