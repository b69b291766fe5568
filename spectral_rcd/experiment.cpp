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
 * Bind an experiment configuration to the solver
 * ---------------------------------------------------------------------------*/

#include "spectral_rcd.hpp"

int RunExperiment(const SpectralContext& sctx, const ExperimentConfig& config,
                  const IntegratorOptions& iopts, SUNContext ctx,
                  Trajectory& traj)
{
  // Sample the fields once, they are held fixed during the run
  RealMatrix A, V1, V2, W0;

  int flag = SampleField(config.reaction, sctx, A);
  if (check_flag(flag, "SampleField (reaction)")) { return flag; }

  flag = SampleField(config.velocity_x, sctx, V1);
  if (check_flag(flag, "SampleField (velocity_x)")) { return flag; }

  flag = SampleField(config.velocity_y, sctx, V2);
  if (check_flag(flag, "SampleField (velocity_y)")) { return flag; }

  flag = SampleField(config.initial_condition, sctx, W0);
  if (check_flag(flag, "SampleField (initial_condition)")) { return flag; }

  flag = Integrate(sctx, config.mu, config.dt, config.nt, A, V1, V2, W0, iopts,
                   ctx, traj);
  if (check_flag(flag, "Integrate")) { return flag; }

  return RCD_SUCCESS;
}
