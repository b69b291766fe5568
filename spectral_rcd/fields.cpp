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
 * Coefficient and initial condition fields sampled on the grid
 * ---------------------------------------------------------------------------*/

#include "spectral_rcd.hpp"

int SampleField(const FieldFn& fn, const SpectralContext& sctx, RealMatrix& out)
{
  if (!fn)
  {
    cerr << "ERROR: SampleField: field is not set" << endl;
    return RCD_ILLEGAL_INPUT;
  }

  out = fn(sctx.X, sctx.Y);

  if (out.rows() != sctx.X.rows() || out.cols() != sctx.X.cols())
  {
    cerr << "ERROR: SampleField: field returned " << out.rows() << " x "
         << out.cols() << ", expected " << sctx.X.rows() << " x "
         << sctx.X.cols() << endl;
    return RCD_SHAPE_MISMATCH;
  }

  return RCD_SUCCESS;
}

FieldFn ConstantField(sunrealtype value)
{
  return [value](const RealMatrix& X, const RealMatrix& Y) -> RealMatrix
  { return RealMatrix::Constant(X.rows(), X.cols(), value); };
}

// amplitude * exp(-((x - x0)^2 + (y - y0)^2) / (2 sigma^2))
FieldFn GaussianBump(sunrealtype amplitude, sunrealtype x0, sunrealtype y0,
                     sunrealtype sigma)
{
  const sunrealtype scale = ONE / (TWO * sigma * sigma);
  return [amplitude, x0, y0, scale](const RealMatrix& X,
                                    const RealMatrix& Y) -> RealMatrix
  {
    const RealMatrix r2 =
      ((X.array() - x0).square() + (Y.array() - y0).square()).matrix();
    return (amplitude * (-scale * r2.array()).exp()).matrix();
  };
}

FieldFn WithBoundaryValues(FieldFn interior, FieldFn boundary)
{
  return [interior, boundary](const RealMatrix& X,
                              const RealMatrix& Y) -> RealMatrix
  {
    RealMatrix W = interior(X, Y);
    RealMatrix G = boundary(X, Y);

    // Leave a mismatched result for SampleField to reject
    if (W.rows() != G.rows() || W.cols() != G.cols()) { return G; }

    const sunindextype last_row = W.rows() - 1;
    const sunindextype last_col = W.cols() - 1;

    W.row(0)        = G.row(0);
    W.row(last_row) = G.row(last_row);
    W.col(0)        = G.col(0);
    W.col(last_col) = G.col(last_col);

    return W;
  };
}
