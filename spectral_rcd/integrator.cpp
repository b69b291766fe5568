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
 * Adaptive explicit time integration with ERKStep
 * ---------------------------------------------------------------------------*/

#include "spectral_rcd.hpp"

// -----------------------------------------------------------------------------
// Setup the integrator
// -----------------------------------------------------------------------------

int SetupERK(SUNContext ctx, UserData& udata, const IntegratorOptions& iopts,
             N_Vector y, void** arkode_mem)
{
  // Create ERKStep memory
  *arkode_mem = ERKStepCreate(f_rcd, ZERO, y, ctx);
  if (check_ptr(*arkode_mem, "ERKStepCreate")) { return RCD_SUNDIALS_FAIL; }

  // Specify tolerances
  int flag = ARKodeSStolerances(*arkode_mem, iopts.rtol, iopts.atol);
  if (check_flag(flag, "ARKodeSStolerances")) { return RCD_SUNDIALS_FAIL; }

  // Attach user data
  flag = ARKodeSetUserData(*arkode_mem, &udata);
  if (check_flag(flag, "ARKodeSetUserData")) { return RCD_SUNDIALS_FAIL; }

  // Select method order
  flag = ARKodeSetOrder(*arkode_mem, iopts.order);
  if (check_flag(flag, "ARKodeSetOrder")) { return RCD_SUNDIALS_FAIL; }

  // Set fixed step size
  if (iopts.fixed_h > ZERO)
  {
    flag = ARKodeSetFixedStep(*arkode_mem, iopts.fixed_h);
    if (check_flag(flag, "ARKodeSetFixedStep")) { return RCD_SUNDIALS_FAIL; }
  }

  // Set max steps between outputs
  flag = ARKodeSetMaxNumSteps(*arkode_mem, iopts.maxsteps);
  if (check_flag(flag, "ARKodeSetMaxNumSteps")) { return RCD_SUNDIALS_FAIL; }

  return RCD_SUCCESS;
}

int GetIntegratorStats(void* arkode_mem, IntegratorStats& stats)
{
  int flag = ARKodeGetNumSteps(arkode_mem, &stats.nst);
  if (check_flag(flag, "ARKodeGetNumSteps")) { return RCD_SUNDIALS_FAIL; }
  flag = ARKodeGetNumStepAttempts(arkode_mem, &stats.nst_a);
  if (check_flag(flag, "ARKodeGetNumStepAttempts")) { return RCD_SUNDIALS_FAIL; }
  flag = ARKodeGetNumErrTestFails(arkode_mem, &stats.netf);
  if (check_flag(flag, "ARKodeGetNumErrTestFails")) { return RCD_SUNDIALS_FAIL; }
  flag = ARKodeGetNumRhsEvals(arkode_mem, 0, &stats.nfe);
  if (check_flag(flag, "ARKodeGetNumRhsEvals")) { return RCD_SUNDIALS_FAIL; }

  return RCD_SUCCESS;
}

// -----------------------------------------------------------------------------
// Evolve the problem over the reporting grid t_k = k * dt, k = 0, ..., nt-1
// -----------------------------------------------------------------------------

int Integrate(const SpectralContext& sctx, sunrealtype mu, sunrealtype dt,
              int nt, const RealMatrix& A, const RealMatrix& V1,
              const RealMatrix& V2, const RealMatrix& W0,
              const IntegratorOptions& iopts, SUNContext ctx, Trajectory& traj)
{
  traj = Trajectory();

  // Input checks
  if (mu < ZERO || !(dt > ZERO) || nt < 1)
  {
    cerr << "ERROR: Integrate: requires mu >= 0, dt > 0 and nt >= 1 (mu = "
         << mu << ", dt = " << dt << ", nt = " << nt << ")" << endl;
    return RCD_ILLEGAL_INPUT;
  }

  if (iopts.order < 2 || iopts.order > 9 || iopts.maxsteps < 0 ||
      !(iopts.rtol >= ZERO) || !(iopts.atol >= ZERO))
  {
    cerr << "ERROR: Integrate: invalid integrator options" << endl;
    return RCD_ILLEGAL_INPUT;
  }

  const sunindextype nnodes = sctx.nodes();
  if (W0.rows() != nnodes || W0.cols() != nnodes)
  {
    cerr << "ERROR: Integrate: initial condition is " << W0.rows() << " x "
         << W0.cols() << ", expected " << nnodes << " x " << nnodes << endl;
    return RCD_SHAPE_MISMATCH;
  }

  UserData udata;
  int flag = SetupUserData(sctx, mu, A, V1, V2, udata);
  if (check_flag(flag, "SetupUserData")) { return flag; }

  flag = SUNContext_GetProfiler(ctx, &udata.prof);
  if (check_flag(flag, "SUNContext_GetProfiler")) { return RCD_SUNDIALS_FAIL; }

  // Initial snapshot
  traj.times.reserve(nt);
  traj.states.reserve(nt);
  traj.times.push_back(ZERO);
  traj.states.push_back(W0);
  traj.t_reached  = ZERO;
  traj.last_state = W0;

  if (nt == 1) { return RCD_SUCCESS; }

  // Create state vector and set initial condition
  N_Vector y = N_VNew_Serial(sctx.neq(), ctx);
  if (check_ptr(y, "N_VNew_Serial")) { return RCD_SUNDIALS_FAIL; }

  sunrealtype* ydata = N_VGetArrayPointer(y);
  Eigen::Map<RealMatrix> W(ydata, nnodes, nnodes);
  W = W0;

  void* arkode_mem = nullptr;
  flag = SetupERK(ctx, udata, iopts, y, &arkode_mem);
  if (check_flag(flag, "SetupERK"))
  {
    ARKodeFree(&arkode_mem);
    N_VDestroy(y);
    return flag;
  }

  int retval    = RCD_SUCCESS;
  sunrealtype t = ZERO;

  for (int k = 1; k < nt; k++)
  {
    const sunrealtype tout = static_cast<sunrealtype>(k) * dt;

    // Stop at output time (do not interpolate output)
    flag = ARKodeSetStopTime(arkode_mem, tout);
    if (check_flag(flag, "ARKodeSetStopTime"))
    {
      retval = RCD_SUNDIALS_FAIL;
      break;
    }

    SUNDIALS_MARK_BEGIN(udata.prof, "Evolve");
    flag = ARKodeEvolve(arkode_mem, tout, y, &t, ARK_NORMAL);
    SUNDIALS_MARK_END(udata.prof, "Evolve");

    traj.arkode_flag = flag;
    traj.t_reached   = t;
    traj.last_state  = W;

    if (flag < 0)
    {
      cerr << "ERROR: ARKodeEvolve returned " << flag << " at t = " << t
           << ", requested t = " << tout << endl;
      retval = RCD_INTEGRATION_FAILURE;
      break;
    }

    traj.times.push_back(tout);
    traj.states.push_back(W);
  }

  flag = GetIntegratorStats(arkode_mem, traj.stats);
  if (check_flag(flag, "GetIntegratorStats") && retval == RCD_SUCCESS)
  {
    retval = flag;
  }

  // Clean up
  ARKodeFree(&arkode_mem);
  N_VDestroy(y);

  return retval;
}
