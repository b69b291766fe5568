// Tests for field sampling, experiment runs and command line parsing

#include <gtest/gtest.h>

#include "spectral_rcd.hpp"

namespace {

class ExperimentTest : public ::testing::Test
{
protected:
  void SetUp() override { ASSERT_EQ(SetupSpectralContext(8, sctx), RCD_SUCCESS); }

  ExperimentConfig Config() const
  {
    ExperimentConfig config;
    config.mu                = 0.5;
    config.dt                = 0.02;
    config.nt                = 4;
    config.reaction          = ConstantField(0.1);
    config.velocity_x        = ConstantField(0.3);
    config.velocity_y        = ConstantField(-0.2);
    config.initial_condition = GaussianBump(2.0, 0.1, -0.1, 0.5);
    return config;
  }

  sundials::Context sunctx;
  SpectralContext sctx;
  IntegratorOptions iopts;
};

TEST_F(ExperimentTest, SampleFieldEvaluatesOnGrid)
{
  FieldFn fn = [](const RealMatrix& X, const RealMatrix& Y) -> RealMatrix
  { return (X + 2.0 * Y).eval(); };

  RealMatrix out;
  ASSERT_EQ(SampleField(fn, sctx, out), RCD_SUCCESS);
  ASSERT_EQ(out.rows(), sctx.nodes());
  ASSERT_EQ(out.cols(), sctx.nodes());
  EXPECT_DOUBLE_EQ(out(2, 5), sctx.x(5) + 2.0 * sctx.x(2));
}

TEST_F(ExperimentTest, SampleFieldRejectsBadFields)
{
  RealMatrix out;

  FieldFn empty;
  EXPECT_EQ(SampleField(empty, sctx, out), RCD_ILLEGAL_INPUT);

  FieldFn small = [](const RealMatrix& X, const RealMatrix& Y) -> RealMatrix
  { return RealMatrix::Zero(3, 3); };
  EXPECT_EQ(SampleField(small, sctx, out), RCD_SHAPE_MISMATCH);
}

TEST_F(ExperimentTest, ConstantAndGaussianFields)
{
  RealMatrix C;
  ASSERT_EQ(SampleField(ConstantField(-1.5), sctx, C), RCD_SUCCESS);
  EXPECT_EQ(C.minCoeff(), -1.5);
  EXPECT_EQ(C.maxCoeff(), -1.5);

  const sunrealtype sigma = 0.4;
  RealMatrix G;
  ASSERT_EQ(SampleField(GaussianBump(3.0, 0.2, -0.3, sigma), sctx, G),
            RCD_SUCCESS);
  for (sunindextype i = 0; i < sctx.nodes(); i++)
  {
    for (sunindextype j = 0; j < sctx.nodes(); j++)
    {
      const sunrealtype dx = sctx.X(i, j) - 0.2;
      const sunrealtype dy = sctx.Y(i, j) + 0.3;
      EXPECT_NEAR(G(i, j),
                  3.0 * exp(-(dx * dx + dy * dy) / (2.0 * sigma * sigma)),
                  1.0e-14);
    }
  }
}

TEST_F(ExperimentTest, WithBoundaryValuesReplacesBorder)
{
  RealMatrix W;
  ASSERT_EQ(SampleField(WithBoundaryValues(GaussianBump(1.0, 0.0, 0.0, 0.6),
                                           ConstantField(4.0)),
                        sctx, W),
            RCD_SUCCESS);

  RealMatrix bump;
  ASSERT_EQ(SampleField(GaussianBump(1.0, 0.0, 0.0, 0.6), sctx, bump),
            RCD_SUCCESS);

  const sunindextype m = sctx.n;
  for (sunindextype i = 0; i <= m; i++)
  {
    for (sunindextype j = 0; j <= m; j++)
    {
      const bool border = (i == 0 || j == 0 || i == m || j == m);
      EXPECT_EQ(W(i, j), border ? 4.0 : bump(i, j));
    }
  }

  // A boundary field of the wrong shape is reported by the sampler
  FieldFn small = [](const RealMatrix& X, const RealMatrix& Y) -> RealMatrix
  { return RealMatrix::Zero(2, 2); };
  EXPECT_EQ(SampleField(WithBoundaryValues(ConstantField(1.0), small), sctx, W),
            RCD_SHAPE_MISMATCH);
}

TEST_F(ExperimentTest, RunExperimentMatchesIntegrate)
{
  const ExperimentConfig config = Config();

  Trajectory from_config;
  ASSERT_EQ(RunExperiment(sctx, config, iopts, sunctx, from_config), RCD_SUCCESS);

  RealMatrix A, V1, V2, W0;
  ASSERT_EQ(SampleField(config.reaction, sctx, A), RCD_SUCCESS);
  ASSERT_EQ(SampleField(config.velocity_x, sctx, V1), RCD_SUCCESS);
  ASSERT_EQ(SampleField(config.velocity_y, sctx, V2), RCD_SUCCESS);
  ASSERT_EQ(SampleField(config.initial_condition, sctx, W0), RCD_SUCCESS);

  Trajectory direct;
  ASSERT_EQ(Integrate(sctx, config.mu, config.dt, config.nt, A, V1, V2, W0,
                      iopts, sunctx, direct),
            RCD_SUCCESS);

  ASSERT_EQ(from_config.states.size(), direct.states.size());
  for (size_t k = 0; k < direct.states.size(); k++)
  {
    EXPECT_EQ(from_config.times[k], direct.times[k]);
    EXPECT_TRUE(from_config.states[k].isApprox(direct.states[k], 1.0e-14));
  }
}

TEST_F(ExperimentTest, DirichletBorderIsHeld)
{
  ExperimentConfig config = Config();
  config.initial_condition = WithBoundaryValues(GaussianBump(5.0, 0.0, 0.0, 0.3),
                                                ConstantField(2.0));

  Trajectory traj;
  ASSERT_EQ(RunExperiment(sctx, config, iopts, sunctx, traj), RCD_SUCCESS);
  ASSERT_EQ(traj.states.size(), static_cast<size_t>(config.nt));

  const sunindextype m = sctx.n;
  for (const auto& W : traj.states)
  {
    for (sunindextype k = 0; k <= m; k++)
    {
      EXPECT_DOUBLE_EQ(W(0, k), 2.0);
      EXPECT_DOUBLE_EQ(W(m, k), 2.0);
      EXPECT_DOUBLE_EQ(W(k, 0), 2.0);
      EXPECT_DOUBLE_EQ(W(k, m), 2.0);
    }
  }
}

TEST_F(ExperimentTest, PropagatesFieldErrors)
{
  ExperimentConfig config = Config();
  config.velocity_y       = FieldFn();

  Trajectory traj;
  EXPECT_EQ(RunExperiment(sctx, config, iopts, sunctx, traj), RCD_ILLEGAL_INPUT);

  config    = Config();
  config.dt = 0.0;
  EXPECT_EQ(RunExperiment(sctx, config, iopts, sunctx, traj), RCD_ILLEGAL_INPUT);
}

TEST(ReadInputsTest, ParsesOptions)
{
  vector<string> args = {"--n",       "12",  "--mu",     "0.5", "--nt",
                         "7",         "--dirichlet",     "1.5", "--rtol",
                         "1e-8",      "--order",         "5",   "--calc_error",
                         "--output",  "0"};

  UserOptions uopts;
  ASSERT_EQ(ReadInputs(args, uopts), RCD_SUCCESS);

  EXPECT_EQ(uopts.n, 12);
  EXPECT_DOUBLE_EQ(uopts.mu, 0.5);
  EXPECT_EQ(uopts.nt, 7);
  EXPECT_TRUE(uopts.dirichlet);
  EXPECT_DOUBLE_EQ(uopts.bc_value, 1.5);
  EXPECT_DOUBLE_EQ(uopts.integrator.rtol, 1.0e-8);
  EXPECT_EQ(uopts.integrator.order, 5);
  EXPECT_TRUE(uopts.calc_error);
  EXPECT_EQ(uopts.output, 0);

  // Untouched defaults
  EXPECT_DOUBLE_EQ(uopts.dt, 1.0e-2);
  EXPECT_DOUBLE_EQ(uopts.sigma, 0.15);
  EXPECT_TRUE(args.empty());
}

TEST(ReadInputsTest, HelpReturnsPositive)
{
  vector<string> args = {"--n", "4", "--help"};
  UserOptions uopts;
  EXPECT_EQ(ReadInputs(args, uopts), 1);
}

TEST(ReadInputsTest, RejectsBadInputs)
{
  {
    vector<string> args = {"--bogus", "3"};
    UserOptions uopts;
    EXPECT_EQ(ReadInputs(args, uopts), RCD_ILLEGAL_INPUT);
  }
  {
    vector<string> args = {"--dt"};
    UserOptions uopts;
    EXPECT_EQ(ReadInputs(args, uopts), RCD_ILLEGAL_INPUT);
  }
  {
    vector<string> args = {"--n", "-2"};
    UserOptions uopts;
    EXPECT_EQ(ReadInputs(args, uopts), RCD_INVALID_DIMENSION);
  }
  {
    vector<string> args = {"--nt", "0"};
    UserOptions uopts;
    EXPECT_EQ(ReadInputs(args, uopts), RCD_ILLEGAL_INPUT);
  }
  {
    vector<string> args = {"--sigma", "0"};
    UserOptions uopts;
    EXPECT_EQ(ReadInputs(args, uopts), RCD_ILLEGAL_INPUT);
  }
  {
    vector<string> args = {"--output", "3"};
    UserOptions uopts;
    EXPECT_EQ(ReadInputs(args, uopts), RCD_ILLEGAL_INPUT);
  }
}

TEST(ReturnFlagNameTest, NamesEveryFlag)
{
  EXPECT_STREQ(RCDGetReturnFlagName(RCD_SUCCESS), "RCD_SUCCESS");
  EXPECT_STREQ(RCDGetReturnFlagName(RCD_SHAPE_MISMATCH), "RCD_SHAPE_MISMATCH");
  EXPECT_STREQ(RCDGetReturnFlagName(RCD_INTEGRATION_FAILURE),
               "RCD_INTEGRATION_FAILURE");
  EXPECT_STREQ(RCDGetReturnFlagName(42), "NONE");
}

TEST(SnapshotNormTest, InteriorMaxSkipsBorder)
{
  RealMatrix W = RealMatrix::Zero(4, 4);
  W(0, 0) = 10.0;
  W(1, 2) = 3.0;
  EXPECT_EQ(InteriorMax(W), 3.0);

  RealMatrix ones = RealMatrix::Ones(3, 3);
  EXPECT_DOUBLE_EQ(RmsNorm(2.0 * ones), 2.0);
}

} // namespace
