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
 * This example simulates scalar transport (e.g. heat from a fire front) by the
 * 2D reaction-convection-diffusion equation
 *
 *   u_t = mu*(u_xx + u_yy) - (vx*u_x + vy*u_y) + a*u
 *
 * for (x,y) in [-1,1]^2 with the Gaussian bump initial condition
 *
 *   u(x,y,0) = amplitude * exp(-((x-x0)^2 + (y-y0)^2) / (2*sigma^2)).
 *
 * The boundary values of the initial condition are held fixed in time. With
 * --dirichlet <value> the initial border is replaced by <value> first.
 *
 * Space is discretized by Chebyshev collocation on the (n+1) x (n+1)
 * Gauss-Lobatto grid and the resulting ODE system is evolved with an adaptive
 * explicit Runge-Kutta method (ERKStep), reporting the solution at
 * t = 0, dt, ..., (nt-1)*dt.
 *
 * Several command line options are available to change the problem parameters
 * and integrator settings. Use the flag --help for more information.
 * ---------------------------------------------------------------------------*/

#include <chrono>

#include "spectral_rcd.hpp"

int main(int argc, char* argv[])
{
  // SUNDIALS context object for this simulation
  sundials::Context ctx;

  // -----------------
  // Setup the problem
  // -----------------

  UserOptions uopts;

  vector<string> args(argv + 1, argv + argc);

  int flag = ReadInputs(args, uopts);
  if (flag < 0)
  {
    cerr << "ERROR: ReadInputs returned " << RCDGetReturnFlagName(flag) << endl;
    return 1;
  }
  if (flag > 0) { return 0; }

  if (uopts.output)
  {
    flag = PrintSetup(uopts);
    if (check_flag(flag, "PrintSetup")) { return 1; }
  }

  // Operators and grid
  SpectralContext sctx;
  flag = SetupSpectralContext(uopts.n, sctx);
  if (check_flag(flag, "SetupSpectralContext")) { return 1; }

  // Experiment configuration
  ExperimentConfig config;
  config.mu         = uopts.mu;
  config.dt         = uopts.dt;
  config.nt         = uopts.nt;
  config.reaction   = ConstantField(uopts.a);
  config.velocity_x = ConstantField(uopts.vx);
  config.velocity_y = ConstantField(uopts.vy);

  FieldFn bump = GaussianBump(uopts.amplitude, uopts.x0, uopts.y0, uopts.sigma);
  if (uopts.dirichlet)
  {
    config.initial_condition = WithBoundaryValues(bump,
                                                  ConstantField(uopts.bc_value));
  }
  else { config.initial_condition = bump; }

  // ----------------------
  // Evolve problem in time
  // ----------------------

  Trajectory traj;

  auto solver_start = chrono::high_resolution_clock::now();
  flag = RunExperiment(sctx, config, uopts.integrator, ctx, traj);
  auto solver_end = chrono::high_resolution_clock::now();
  sunrealtype solve_time =
    chrono::duration<sunrealtype>(solver_end - solver_start).count();

  if (flag == RCD_INTEGRATION_FAILURE)
  {
    cerr << "ERROR: integration failed at t = " << traj.t_reached << " after "
         << traj.states.size() << " of " << uopts.nt << " outputs" << endl;
  }
  else if (check_flag(flag, "RunExperiment")) { return 1; }

  // Reference solution with a tighter relative tolerance
  sunrealtype max_error = ZERO;
  if (uopts.calc_error && flag == RCD_SUCCESS)
  {
    IntegratorOptions ref_opts = uopts.integrator;
    ref_opts.rtol /= SUN_RCONST(100.0);

    Trajectory ref;
    int ref_flag = RunExperiment(sctx, config, ref_opts, ctx, ref);
    if (check_flag(ref_flag, "RunExperiment (reference)")) { return 1; }

    for (size_t k = 0; k < traj.states.size(); k++)
    {
      const sunrealtype ref_norm = ref.states[k].lpNorm<Eigen::Infinity>();
      const sunrealtype err =
        (traj.states[k] - ref.states[k]).lpNorm<Eigen::Infinity>();
      if (ref_norm > ZERO) { max_error = max(max_error, err / ref_norm); }
    }
  }

  // ------
  // Output
  // ------

  UserOutput uout;
  uout.output = uopts.output;

  int oflag = uout.open(sctx, static_cast<int>(traj.states.size()));
  if (check_flag(oflag, "UserOutput::open")) { return 1; }

  for (size_t k = 0; k < traj.states.size(); k++)
  {
    oflag = uout.write(traj.times[k], traj.states[k]);
    if (check_flag(oflag, "UserOutput::write")) { return 1; }
  }

  oflag = uout.close();
  if (check_flag(oflag, "UserOutput::close")) { return 1; }

  if (uopts.output)
  {
    cout << "Final integrator statistics:" << endl;
    cout << "  Total solve time   = " << setprecision(2) << solve_time << endl;
    if (uopts.calc_error)
    {
      cout << "  Max relative error = " << setprecision(2) << max_error << endl;
    }
    OutputStats(traj.stats);
  }

  return (flag == RCD_SUCCESS) ? 0 : 1;
}

//---- end of file ----
