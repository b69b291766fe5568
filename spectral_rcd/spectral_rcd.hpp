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
 * Shared header file for the 2D reaction-convection-diffusion problem
 *
 *   u_t = mu*(u_xx + u_yy) - (v1*u_x + v2*u_y) + a*u,  (x,y) in [-1,1]^2
 *
 * discretized in space by Chebyshev collocation on a tensor-product
 * Chebyshev-Gauss-Lobatto grid and advanced in time with ARKODE.
 * ---------------------------------------------------------------------------*/

#ifndef SPECTRAL_RCD_HPP
#define SPECTRAL_RCD_HPP

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "arkode/arkode_erkstep.h"
#include "nvector/nvector_serial.h"
#include "sundials/sundials_core.hpp"

// Macros for problem constants
#define PI   SUN_RCONST(3.141592653589793238462643383279502884197169)
#define ZERO SUN_RCONST(0.0)
#define ONE  SUN_RCONST(1.0)
#define TWO  SUN_RCONST(2.0)

#define WIDTH (10 + numeric_limits<sunrealtype>::digits10)

// Return flags
#define RCD_SUCCESS              0
#define RCD_INVALID_DIMENSION   -1
#define RCD_SHAPE_MISMATCH      -2
#define RCD_INTEGRATION_FAILURE -3
#define RCD_ILLEGAL_INPUT       -4
#define RCD_SUNDIALS_FAIL       -5

using namespace std;

// Dense matrix and vector types over the SUNDIALS real type (column-major)
using RealMatrix = Eigen::Matrix<sunrealtype, Eigen::Dynamic, Eigen::Dynamic>;
using RealVector = Eigen::Matrix<sunrealtype, Eigen::Dynamic, 1>;

// Coefficient field: maps the coordinate matrices (X, Y) to a matrix of values
using FieldFn = function<RealMatrix(const RealMatrix& X, const RealMatrix& Y)>;

// -----------------------------------------------------------------------------
// Spectral discretization
// -----------------------------------------------------------------------------

// Tensor-product grid and second-derivative operators
struct Grid2D
{
  RealMatrix X;   // X(i,j) = x_j
  RealMatrix Y;   // Y(i,j) = y_i
  RealMatrix D2x; // Dx * Dx
  RealMatrix D2y; // Dy * Dy
};

// Immutable operators and grid for a fixed resolution N, shared read-only by
// every experiment at that resolution
struct SpectralContext
{
  sunindextype n = 0; // polynomial degree, (n+1) nodes per direction

  RealMatrix D;  // first derivative matrix
  RealVector x;  // Chebyshev-Gauss-Lobatto nodes, decreasing
  RealMatrix D2; // D * D

  // Coordinate matrices
  RealMatrix X;
  RealMatrix Y;

  sunindextype nodes() const { return n + 1; }
  sunindextype neq() const { return (n + 1) * (n + 1); }
};

// Build the Chebyshev differentiation matrix and nodes
int ChebyshevDiff(sunindextype n, RealMatrix& D, RealVector& x);

// Build X, Y, D2x, D2y from two 1D operators
int AssembleGrid(const RealMatrix& Dx, const RealVector& x, const RealMatrix& Dy,
                 const RealVector& y, Grid2D& grid);

// Build the shared context for resolution n
int SetupSpectralContext(sunindextype n, SpectralContext& sctx);

// -----------------------------------------------------------------------------
// Problem data for the RHS
// -----------------------------------------------------------------------------

struct UserData
{
  // Operators and grid (not owned)
  const SpectralContext* sctx = nullptr;

  // Profiler from the SUNDIALS context (may be null)
  SUNProfiler prof = nullptr;

  // Diffusion coefficient
  sunrealtype mu = ZERO;

  // Reaction rate and velocity fields, sampled once
  RealMatrix A;
  RealMatrix V1;
  RealMatrix V2;

  // Workspace for the convection and reaction terms
  RealMatrix work;
  RealMatrix term;
};

// Validate coefficient shapes and allocate the RHS workspace
int SetupUserData(const SpectralContext& sctx, sunrealtype mu,
                  const RealMatrix& A, const RealMatrix& V1,
                  const RealMatrix& V2, UserData& udata);

// Spatial operator terms
void DiffusionTerm(const SpectralContext& sctx, sunrealtype mu,
                   const Eigen::Ref<const RealMatrix>& W,
                   Eigen::Ref<RealMatrix> f);

void ConvectionTerm(const SpectralContext& sctx, const RealMatrix& V1,
                    const RealMatrix& V2, const Eigen::Ref<const RealMatrix>& W,
                    Eigen::Ref<RealMatrix> f, RealMatrix& work);

void ReactionTerm(const RealMatrix& A, const Eigen::Ref<const RealMatrix>& W,
                  Eigen::Ref<RealMatrix> f);

// Zero the rate of change on the first/last rows and columns
void ApplyBoundaryFreeze(Eigen::Ref<RealMatrix> f);

// Wdot = diffusion - convection + reaction, with the border frozen
int ComputeRhs(sunrealtype t, const Eigen::Ref<const RealMatrix>& W,
               UserData& udata, Eigen::Ref<RealMatrix> Wdot);

// ODE right hand side function provided to ARKODE
int f_rcd(sunrealtype t, N_Vector y, N_Vector f, void* user_data);

// -----------------------------------------------------------------------------
// Time integration
// -----------------------------------------------------------------------------

struct IntegratorOptions
{
  // Relative and absolute tolerances
  sunrealtype rtol = SUN_RCONST(1.e-6);
  sunrealtype atol = SUN_RCONST(1.e-9);

  // ERK method order
  int order = 4;

  // Step size selection (ZERO = adaptive steps)
  sunrealtype fixed_h = ZERO;

  int maxsteps = 100000; // max steps between outputs
};

struct IntegratorStats
{
  long int nst   = 0; // time steps
  long int nst_a = 0; // step attempts
  long int netf  = 0; // error test fails
  long int nfe   = 0; // rhs evals
};

struct Trajectory
{
  // Reported instants and snapshots, times[k] = k * dt
  vector<sunrealtype> times;
  vector<RealMatrix> states;

  // Furthest time reached and the state there
  sunrealtype t_reached = ZERO;
  RealMatrix last_state;

  // Last ARKODE flag and integrator statistics
  int arkode_flag = 0;
  IntegratorStats stats;
};

// Create and configure the ERKStep integrator
int SetupERK(SUNContext ctx, UserData& udata, const IntegratorOptions& iopts,
             N_Vector y, void** arkode_mem);

// Read integrator statistics
int GetIntegratorStats(void* arkode_mem, IntegratorStats& stats);

// Advance W0 over nt instants spaced by dt
int Integrate(const SpectralContext& sctx, sunrealtype mu, sunrealtype dt,
              int nt, const RealMatrix& A, const RealMatrix& V1,
              const RealMatrix& V2, const RealMatrix& W0,
              const IntegratorOptions& iopts, SUNContext ctx, Trajectory& traj);

// -----------------------------------------------------------------------------
// Fields and experiments
// -----------------------------------------------------------------------------

struct ExperimentConfig
{
  sunrealtype mu = ZERO; // diffusion coefficient
  sunrealtype dt = ZERO; // spacing of the reported instants
  int nt         = 1;    // number of reported instants

  FieldFn reaction;
  FieldFn velocity_x;
  FieldFn velocity_y;
  FieldFn initial_condition;
};

// Evaluate a field once on the grid
int SampleField(const FieldFn& fn, const SpectralContext& sctx, RealMatrix& out);

FieldFn ConstantField(sunrealtype value);

FieldFn GaussianBump(sunrealtype amplitude, sunrealtype x0, sunrealtype y0,
                     sunrealtype sigma);

// Interior values from one field, border values from another
FieldFn WithBoundaryValues(FieldFn interior, FieldFn boundary);

// Sample the configured fields and integrate
int RunExperiment(const SpectralContext& sctx, const ExperimentConfig& config,
                  const IntegratorOptions& iopts, SUNContext ctx,
                  Trajectory& traj);

// -----------------------------------------------------------------------------
// Driver options and output
// -----------------------------------------------------------------------------

struct UserOptions
{
  // Resolution
  sunindextype n = 10;

  // Experiment parameters
  sunrealtype mu = SUN_RCONST(0.8);
  sunrealtype dt = SUN_RCONST(1.0e-2);
  int nt         = 5;

  // Constant reaction rate and wind
  sunrealtype a  = ZERO;
  sunrealtype vx = ZERO;
  sunrealtype vy = ZERO;

  // Gaussian bump initial condition
  sunrealtype amplitude = SUN_RCONST(100.0);
  sunrealtype x0        = ZERO;
  sunrealtype y0        = ZERO;
  sunrealtype sigma     = SUN_RCONST(0.15);

  // Dirichlet boundary value (replaces the initial border when set)
  bool dirichlet        = false;
  sunrealtype bc_value  = ZERO;

  IntegratorOptions integrator;

  bool calc_error = false;

  int output = 1; // 0 = none, 1 = stats, 2 = disk
};

struct UserOutput
{
  int output = 1;     // 0 = no output, 1 = stats output, 2 = output to disk
  string fname = "spectral_rcd_2d.out";
  ofstream uout;      // output file stream

  int open(const SpectralContext& sctx, int nt);
  int write(sunrealtype t, const RealMatrix& W);
  int close();
};

// Parse command line inputs, returns 1 if --help was given
int ReadInputs(vector<string>& args, UserOptions& uopts);

void InputHelp();

int PrintSetup(const UserOptions& uopts);

int OutputStats(const IntegratorStats& stats);

// Interior maximum and rms norm of a snapshot
sunrealtype InteriorMax(const RealMatrix& W);
sunrealtype RmsNorm(const RealMatrix& W);

// -----------------------------------------------------------------------------
// Utility functions
// -----------------------------------------------------------------------------

const char* RCDGetReturnFlagName(int flag);

// Check function return flag
static inline int check_flag(int flag, const string funcname)
{
  if (flag < 0)
  {
    cerr << "ERROR: " << funcname << " returned " << flag << endl;
    return 1;
  }
  return 0;
}

// Check if a function returned a NULL pointer
static inline int check_ptr(const void* ptr, const string funcname)
{
  if (ptr) { return 0; }
  cerr << "ERROR: " << funcname << " returned NULL" << endl;
  return 1;
}

#endif
