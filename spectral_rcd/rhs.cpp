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
 * Right hand side of the semi-discrete reaction-convection-diffusion system
 * ---------------------------------------------------------------------------*/

#include "spectral_rcd.hpp"

static bool same_shape(const RealMatrix& M, sunindextype nnodes)
{
  return (M.rows() == nnodes) && (M.cols() == nnodes);
}

int SetupUserData(const SpectralContext& sctx, sunrealtype mu,
                  const RealMatrix& A, const RealMatrix& V1,
                  const RealMatrix& V2, UserData& udata)
{
  const sunindextype nnodes = sctx.nodes();

  if (!same_shape(A, nnodes) || !same_shape(V1, nnodes) ||
      !same_shape(V2, nnodes))
  {
    cerr << "ERROR: SetupUserData: coefficient fields must be " << nnodes
         << " x " << nnodes << endl;
    return RCD_SHAPE_MISMATCH;
  }

  udata.sctx = &sctx;
  udata.mu   = mu;
  udata.A    = A;
  udata.V1   = V1;
  udata.V2   = V2;
  udata.work = RealMatrix::Zero(nnodes, nnodes);
  udata.term = RealMatrix::Zero(nnodes, nnodes);

  return RCD_SUCCESS;
}

// Diffusion: mu * (W D2x^T + D2y W)
void DiffusionTerm(const SpectralContext& sctx, sunrealtype mu,
                   const Eigen::Ref<const RealMatrix>& W,
                   Eigen::Ref<RealMatrix> f)
{
  f.noalias() = W * sctx.D2.transpose();
  f.noalias() += sctx.D2 * W;
  f *= mu;
}

// Convection in advective form: (W Dx^T) o V1 + (Dy W) o V2
void ConvectionTerm(const SpectralContext& sctx, const RealMatrix& V1,
                    const RealMatrix& V2, const Eigen::Ref<const RealMatrix>& W,
                    Eigen::Ref<RealMatrix> f, RealMatrix& work)
{
  work.noalias() = W * sctx.D.transpose();
  f              = work.cwiseProduct(V1);
  work.noalias() = sctx.D * W;
  f += work.cwiseProduct(V2);
}

// Reaction: A o W
void ReactionTerm(const RealMatrix& A, const Eigen::Ref<const RealMatrix>& W,
                  Eigen::Ref<RealMatrix> f)
{
  f = A.cwiseProduct(W);
}

// The border keeps whatever values it started with
void ApplyBoundaryFreeze(Eigen::Ref<RealMatrix> f)
{
  const sunindextype last_row = f.rows() - 1;
  const sunindextype last_col = f.cols() - 1;

  f.row(0).setZero();
  f.row(last_row).setZero();
  f.col(0).setZero();
  f.col(last_col).setZero();
}

int ComputeRhs(sunrealtype t, const Eigen::Ref<const RealMatrix>& W,
               UserData& udata, Eigen::Ref<RealMatrix> Wdot)
{
  if (udata.sctx == nullptr)
  {
    cerr << "ERROR: ComputeRhs: problem data is not set up" << endl;
    return RCD_ILLEGAL_INPUT;
  }

  const SpectralContext& sctx = *(udata.sctx);
  const sunindextype nnodes   = sctx.nodes();

  if (W.rows() != nnodes || W.cols() != nnodes || Wdot.rows() != nnodes ||
      Wdot.cols() != nnodes)
  {
    cerr << "ERROR: ComputeRhs: state must be " << nnodes << " x " << nnodes
         << endl;
    return RCD_SHAPE_MISMATCH;
  }

  // Compute diffusion
  DiffusionTerm(sctx, udata.mu, W, Wdot);

  // Subtract convection
  ConvectionTerm(sctx, udata.V1, udata.V2, W, udata.term, udata.work);
  Wdot -= udata.term;

  // Add reaction
  ReactionTerm(udata.A, W, udata.term);
  Wdot += udata.term;

  ApplyBoundaryFreeze(Wdot);

  return RCD_SUCCESS;
}

// Reaction-convection-diffusion RHS function
int f_rcd(sunrealtype t, N_Vector y, N_Vector f, void* user_data)
{
  // Access problem data
  UserData* udata = (UserData*)user_data;

  SUNDIALS_CXX_MARK_FUNCTION(udata->prof);

  // Access data arrays
  sunrealtype* ydata = N_VGetArrayPointer(y);
  if (check_ptr(ydata, "N_VGetArrayPointer")) { return -1; }
  sunrealtype* fdata = N_VGetArrayPointer(f);
  if (check_ptr(fdata, "N_VGetArrayPointer")) { return -1; }

  // View the vectors as (n+1) x (n+1) matrices
  const sunindextype nnodes = udata->sctx->nodes();
  Eigen::Map<const RealMatrix> W(ydata, nnodes, nnodes);
  Eigen::Map<RealMatrix> Wdot(fdata, nnodes, nnodes);

  int flag = ComputeRhs(t, W, *udata, Wdot);
  if (check_flag(flag, "ComputeRhs")) { return -1; }

  return 0;
}
