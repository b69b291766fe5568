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
 * Status and trajectory output
 * ---------------------------------------------------------------------------*/

#include "spectral_rcd.hpp"

// Initialize output
int UserOutput::open(const SpectralContext& sctx, int nt)
{
  // Header for status output
  if (output)
  {
    cout << scientific;
    cout << setprecision(numeric_limits<sunrealtype>::digits10);
    cout << "          t           ";
    cout << "          ||u||_rms      ";
    cout << "      max interior u     " << endl;
    cout << " -----------------------------------------------------------------"
         << "-----" << endl;
  }

  // Open output stream and output problem information
  if (output >= 2)
  {
    uout.open(fname);
    if (!uout.is_open())
    {
      cerr << "ERROR: Unable to open " << fname << endl;
      return RCD_ILLEGAL_INPUT;
    }

    uout << scientific;
    uout << setprecision(numeric_limits<sunrealtype>::digits10);
    uout << "# title 2D Reaction-Convection-Diffusion (Chebyshev collocation)"
         << endl;
    uout << "# nvar 1" << endl;
    uout << "# vars u" << endl;
    uout << "# nt " << nt << endl;
    uout << "# n " << sctx.n << endl;
    uout << "# x";
    for (sunindextype k = 0; k < sctx.nodes(); k++) { uout << " " << sctx.x(k); }
    uout << endl;
  }

  return 0;
}

// Write output
int UserOutput::write(sunrealtype t, const RealMatrix& W)
{
  if (output)
  {
    cout << setw(22) << t << setw(25) << RmsNorm(W) << setw(25)
         << InteriorMax(W) << endl;

    // Write solution to disk, column-major
    if (output >= 2)
    {
      uout << t;
      for (sunindextype k = 0; k < W.size(); k++)
      {
        uout << setw(WIDTH) << W.data()[k];
      }
      uout << endl;
    }
  }

  return 0;
}

// Finalize output
int UserOutput::close()
{
  // Footer for status output
  if (output)
  {
    cout << " -----------------------------------------------------------------"
         << "-----" << endl;
    cout << endl;
  }

  // Close output streams
  if (output >= 2) { uout.close(); }

  return 0;
}
