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
 * Command line options, setup printing, and return flag names
 * ---------------------------------------------------------------------------*/

#include "spectral_rcd.hpp"

// A key without a value is left in args and reported as unknown

static void find_arg(vector<string>& args, const string key, sunrealtype& dest)
{
  auto it = find(args.begin(), args.end(), key);
  if (it != args.end() && (it + 1) != args.end())
  {
#if defined(SUNDIALS_SINGLE_PRECISION)
    dest = stof(*(it + 1));
#elif defined(SUNDIALS_DOUBLE_PRECISION)
    dest = stod(*(it + 1));
#elif defined(SUNDIALS_EXTENDED_PRECISION)
    dest = stold(*(it + 1));
#endif
    args.erase(it, it + 2);
  }
}

#if defined(SUNDIALS_INT64_T)
static void find_arg(vector<string>& args, const string key, sunindextype& dest)
{
  auto it = find(args.begin(), args.end(), key);
  if (it != args.end() && (it + 1) != args.end())
  {
    dest = stoll(*(it + 1));
    args.erase(it, it + 2);
  }
}
#endif

static void find_arg(vector<string>& args, const string key, int& dest)
{
  auto it = find(args.begin(), args.end(), key);
  if (it != args.end() && (it + 1) != args.end())
  {
    dest = stoi(*(it + 1));
    args.erase(it, it + 2);
  }
}

static void find_arg(vector<string>& args, const string key, bool& dest,
                     bool store = true)
{
  auto it = find(args.begin(), args.end(), key);
  if (it != args.end())
  {
    dest = store;
    args.erase(it);
  }
}

// Print command line options
void InputHelp()
{
  cout << endl;
  cout << "Command line options:" << endl;
  cout << "  --n <int>             : polynomial degree, (n+1)^2 grid nodes\n";
  cout << "  --mu <real>           : diffusion coefficient\n";
  cout << "  --dt <real>           : spacing of output times\n";
  cout << "  --nt <int>            : number of output times (including t = 0)\n";
  cout << "  --a <real>            : constant reaction rate\n";
  cout << "  --vx <real>           : constant x velocity\n";
  cout << "  --vy <real>           : constant y velocity\n";
  cout << "  --amplitude <real>    : initial Gaussian bump amplitude\n";
  cout << "  --x0 <real>           : initial Gaussian bump x center\n";
  cout << "  --y0 <real>           : initial Gaussian bump y center\n";
  cout << "  --sigma <real>        : initial Gaussian bump width\n";
  cout << "  --dirichlet <real>    : hold the boundary at this value\n";
  cout << "  --rtol <real>         : relative tolerance\n";
  cout << "  --atol <real>         : absolute tolerance\n";
  cout << "  --order <int>         : ERK method order\n";
  cout << "  --fixed_h <real>      : fixed step size\n";
  cout << "  --maxsteps <int>      : max steps between outputs\n";
  cout << "  --calc_error          : compare against a tighter tolerance run\n";
  cout << "  --output <int>        : output level (0 = none, 1 = stats, 2 = disk)\n";
  cout << "  --help                : print options and exit\n";
}

int ReadInputs(vector<string>& args, UserOptions& uopts)
{
  if (find(args.begin(), args.end(), "--help") != args.end())
  {
    InputHelp();
    return 1;
  }

  // Problem parameters
  find_arg(args, "--n", uopts.n);
  find_arg(args, "--mu", uopts.mu);
  find_arg(args, "--dt", uopts.dt);
  find_arg(args, "--nt", uopts.nt);
  find_arg(args, "--a", uopts.a);
  find_arg(args, "--vx", uopts.vx);
  find_arg(args, "--vy", uopts.vy);
  find_arg(args, "--amplitude", uopts.amplitude);
  find_arg(args, "--x0", uopts.x0);
  find_arg(args, "--y0", uopts.y0);
  find_arg(args, "--sigma", uopts.sigma);

  auto it = find(args.begin(), args.end(), "--dirichlet");
  if (it != args.end() && (it + 1) != args.end())
  {
    uopts.dirichlet = true;
    find_arg(args, "--dirichlet", uopts.bc_value);
  }

  // Integrator options
  find_arg(args, "--rtol", uopts.integrator.rtol);
  find_arg(args, "--atol", uopts.integrator.atol);
  find_arg(args, "--order", uopts.integrator.order);
  find_arg(args, "--fixed_h", uopts.integrator.fixed_h);
  find_arg(args, "--maxsteps", uopts.integrator.maxsteps);
  find_arg(args, "--calc_error", uopts.calc_error);
  find_arg(args, "--output", uopts.output);

  // Check for unparsed inputs
  if (args.size() > 0)
  {
    cerr << "ERROR: Unknown inputs: ";
    for (auto i = args.begin(); i != args.end(); ++i) { cerr << *i << ' '; }
    cerr << endl;
    return RCD_ILLEGAL_INPUT;
  }

  // Input checks
  if (uopts.n < 0)
  {
    cerr << "ERROR: n must be non-negative" << endl;
    return RCD_INVALID_DIMENSION;
  }

  if (uopts.mu < ZERO || uopts.dt <= ZERO || uopts.nt < 1)
  {
    cerr << "ERROR: requires mu >= 0, dt > 0 and nt >= 1" << endl;
    return RCD_ILLEGAL_INPUT;
  }

  if (uopts.sigma <= ZERO)
  {
    cerr << "ERROR: sigma must be positive" << endl;
    return RCD_ILLEGAL_INPUT;
  }

  if (uopts.integrator.order < 2 || uopts.integrator.order > 9)
  {
    cerr << "ERROR: Invalid ERK order " << uopts.integrator.order << endl;
    return RCD_ILLEGAL_INPUT;
  }

  if (uopts.output < 0 || uopts.output > 2)
  {
    cerr << "ERROR: Invalid output level" << endl;
    return RCD_ILLEGAL_INPUT;
  }

  return RCD_SUCCESS;
}

// Print user options
int PrintSetup(const UserOptions& uopts)
{
  cout << endl;
  cout << "Problem parameters and options:" << endl;
  cout << " --------------------------------- " << endl;
  cout << "  n                = " << uopts.n << endl;
  cout << "  nodes            = " << (uopts.n + 1) << " x " << (uopts.n + 1)
       << endl;
  cout << "  mu               = " << uopts.mu << endl;
  cout << "  a                = " << uopts.a << endl;
  cout << "  vx               = " << uopts.vx << endl;
  cout << "  vy               = " << uopts.vy << endl;
  cout << "  dt               = " << uopts.dt << endl;
  cout << "  nt               = " << uopts.nt << endl;
  cout << "  tf               = " << (uopts.nt - 1) * uopts.dt << endl;
  cout << " --------------------------------- " << endl;
  cout << "  amplitude        = " << uopts.amplitude << endl;
  cout << "  x0               = " << uopts.x0 << endl;
  cout << "  y0               = " << uopts.y0 << endl;
  cout << "  sigma            = " << uopts.sigma << endl;
  if (uopts.dirichlet)
  {
    cout << "  boundary         = Dirichlet, " << uopts.bc_value << endl;
  }
  else { cout << "  boundary         = initial values held" << endl; }
  cout << " --------------------------------- " << endl;
  cout << "  integrator       = ERK" << endl;
  cout << "  order            = " << uopts.integrator.order << endl;
  cout << "  rtol             = " << uopts.integrator.rtol << endl;
  cout << "  atol             = " << uopts.integrator.atol << endl;
  cout << "  fixed h          = " << uopts.integrator.fixed_h << endl;
  cout << "  max steps        = " << uopts.integrator.maxsteps << endl;
  cout << " --------------------------------- " << endl;
  if (uopts.calc_error) { cout << "  reference solver = ERK, rtol / 100" << endl; }
  cout << "  output           = " << uopts.output << endl;
  cout << " --------------------------------- " << endl;
  cout << endl;

  return 0;
}

// Print ERK integrator statistics
int OutputStats(const IntegratorStats& stats)
{
  cout << "  Steps              = " << stats.nst << endl;
  cout << "  Step attempts      = " << stats.nst_a << endl;
  cout << "  Error test fails   = " << stats.netf << endl;
  cout << "  RHS evals          = " << stats.nfe << endl;

  return 0;
}

sunrealtype InteriorMax(const RealMatrix& W)
{
  if (W.rows() < 3 || W.cols() < 3) { return W.maxCoeff(); }
  return W.block(1, 1, W.rows() - 2, W.cols() - 2).maxCoeff();
}

sunrealtype RmsNorm(const RealMatrix& W)
{
  return sqrt(W.squaredNorm() / static_cast<sunrealtype>(W.size()));
}

const char* RCDGetReturnFlagName(int flag)
{
  switch (flag)
  {
  case RCD_SUCCESS: return "RCD_SUCCESS";
  case RCD_INVALID_DIMENSION: return "RCD_INVALID_DIMENSION";
  case RCD_SHAPE_MISMATCH: return "RCD_SHAPE_MISMATCH";
  case RCD_INTEGRATION_FAILURE: return "RCD_INTEGRATION_FAILURE";
  case RCD_ILLEGAL_INPUT: return "RCD_ILLEGAL_INPUT";
  case RCD_SUNDIALS_FAIL: return "RCD_SUNDIALS_FAIL";
  default: return "NONE";
  }
}
