#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <vector>

#include "Bounds.h"
#include "StepSizes.h"

using namespace treestat;
using namespace treestat::numdiff;
using treestat::tree::ParamTree;
using treestat::tree::TreeSpec;

namespace
{
  const double kInf = std::numeric_limits<double>::infinity();
}

TEST_CASE("Bounds validation", "[Bounds]")
{
  SECTION("Default bounds are unbounded")
  {
    Bounds b;
    REQUIRE(b.isUnbounded());
    REQUIRE(b.lower(3) == -kInf);
    REQUIRE(b.upper(3) == kInf);
    REQUIRE_NOTHROW(b.validate({ 1.0, 2.0 }));
  }

  SECTION("lower > upper is rejected")
  {
    REQUIRE_THROWS_AS(Bounds({ 0.0, 2.0 }, { 1.0, 1.0 }), InvalidBoundsError);
  }

  SECTION("NaN bounds are rejected")
  {
    REQUIRE_THROWS_AS(Bounds({ std::nan("") }, { 1.0 }), InvalidBoundsError);
  }

  SECTION("Length mismatch is rejected")
  {
    REQUIRE_THROWS_AS(Bounds({ 0.0 }, { 1.0, 2.0 }), InvalidBoundsError);

    Bounds b({ 0.0, 0.0 }, { 1.0, 1.0 });
    REQUIRE_THROWS_AS(b.validate({ 0.5 }), InvalidBoundsError);
  }

  SECTION("Params outside the box are rejected")
  {
    Bounds b({ 0.0, 0.0 }, { 1.0, 1.0 });
    REQUIRE_NOTHROW(b.validate({ 0.0, 1.0 }));
    REQUIRE_THROWS_AS(b.validate({ -0.1, 0.5 }), InvalidBoundsError);
    REQUIRE_THROWS_AS(b.validate({ 0.5, 1.5 }), InvalidBoundsError);
  }
}

TEST_CASE("Bounds from trees", "[Bounds]")
{
  TreeSpec spec(ParamTree::mapping({ { "a", 1.0 }, { "b", ParamTree::vector({ 1.0, 2.0 }) } }));

  SECTION("Matching lower tree, missing upper tree")
  {
    Bounds b = Bounds::fromTrees(spec,
				 ParamTree::mapping({ { "a", 0.0 }, { "b", ParamTree::vector({ -1.0, -2.0 }) } }),
				 std::nullopt);
    REQUIRE(b.size() == 3);
    REQUIRE(b.lowerValues() == std::vector<double>{ 0.0, -1.0, -2.0 });
    REQUIRE(b.upper(2) == kInf);
  }

  SECTION("Subset tree leaves the other keys unbounded")
  {
    Bounds b = Bounds::fromTrees(spec, ParamTree::mapping({ { "a", 0.0 } }), std::nullopt);
    REQUIRE(b.size() == 3);
    REQUIRE(b.lower(0) == 0.0);
    REQUIRE(b.lower(1) == -kInf);
    REQUIRE(b.lower(2) == -kInf);
    REQUIRE(b.upper(0) == kInf);

    Bounds u = Bounds::fromTrees(spec, std::nullopt,
				 ParamTree::mapping({ { "b", ParamTree::vector({ 5.0, 6.0 }) } }));
    REQUIRE(u.upperValues() == std::vector<double>{ kInf, 5.0, 6.0 });
    REQUIRE_NOTHROW(u.validate({ 1.0, 2.0, 3.0 }));
  }

  SECTION("Subset of a sequence covers its leading elements")
  {
    TreeSpec seqSpec(ParamTree::sequence({ 1.0, 2.0, 3.0 }));
    Bounds b = Bounds::fromTrees(seqSpec, ParamTree::sequence({ 0.0 }), std::nullopt);
    REQUIRE(b.lowerValues() == std::vector<double>{ 0.0, -kInf, -kInf });

    REQUIRE_THROWS_AS(Bounds::fromTrees(seqSpec, ParamTree::sequence({ 0.0, 0.0, 0.0, 0.0 }),
					std::nullopt),
		      InvalidBoundsError);
  }

  SECTION("Unknown keys are rejected")
  {
    REQUIRE_THROWS_AS(Bounds::fromTrees(spec, ParamTree::mapping({ { "c", 0.0 } }), std::nullopt),
		      InvalidBoundsError);
  }

  SECTION("Leaf of the wrong shape is rejected")
  {
    REQUIRE_THROWS_AS(Bounds::fromTrees(spec,
					ParamTree::mapping({ { "b", ParamTree::vector({ 0.0, 0.0, 0.0 }) } }),
					std::nullopt),
		      InvalidBoundsError);
    REQUIRE_THROWS_AS(Bounds::fromTrees(spec, ParamTree::sequence({ 0.0 }), std::nullopt),
		      InvalidBoundsError);
  }

  SECTION("Crossed tree bounds")
  {
    REQUIRE_THROWS_AS(Bounds::fromTrees(spec,
					ParamTree::mapping({ { "a", 2.0 }, { "b", ParamTree::vector({ 0.0, 0.0 }) } }),
					ParamTree::mapping({ { "a", 1.0 }, { "b", ParamTree::vector({ 1.0, 1.0 }) } })),
		      InvalidBoundsError);
  }
}

TEST_CASE("Relative step rule", "[StepSizes]")
{
  const double scale = firstDerivativeScale();

  REQUIRE(scale == Catch::Approx(std::sqrt(std::numeric_limits<double>::epsilon())));
  REQUIRE(secondDerivativeScale() == Catch::Approx(std::cbrt(std::numeric_limits<double>::epsilon())));

  SECTION("Small |x| uses the absolute scale")
  {
    REQUIRE(relativeStep(0.0, scale, 1e-12) == Catch::Approx(scale));
    REQUIRE(relativeStep(0.5, scale, 1e-12) == Catch::Approx(scale).epsilon(1e-6));
  }

  SECTION("Large |x| scales the step")
  {
    REQUIRE(relativeStep(1000.0, scale, 1e-12) == Catch::Approx(1000.0 * scale).epsilon(1e-6));
    REQUIRE(relativeStep(-1000.0, scale, 1e-12) == Catch::Approx(1000.0 * scale).epsilon(1e-6));
  }

  SECTION("minStep floors the step")
  {
    REQUIRE(relativeStep(0.0, scale, 1e-3) == 1e-3);
  }

  SECTION("Steps are exactly representable at x")
  {
    const double x = 0.1;
    const double h = relativeStep(x, scale, 1e-12);
    REQUIRE((x + h) - x == h);
  }
}

TEST_CASE("nominalSteps honours an override", "[StepSizes]")
{
  std::vector<double> x{ 1.0, 2.0 };
  REQUIRE(nominalSteps(x, 0.1, 1e-8, std::vector<double>{ 0.5, 0.25 }) == std::vector<double>{ 0.5, 0.25 });
  REQUIRE_THROWS_AS(nominalSteps(x, 0.1, 1e-8, std::vector<double>{ 0.5 }), std::invalid_argument);
  REQUIRE_THROWS_AS(nominalSteps(x, 0.1, 1e-8, std::vector<double>{ 0.5, 0.0 }), std::invalid_argument);
  REQUIRE_THROWS_AS(nominalSteps(x, 0.1, 0.0, std::nullopt), std::invalid_argument);
}

TEST_CASE("fitStep keeps every stencil inside the bounds", "[StepSizes]")
{
  const double h = 0.1;

  SECTION("Unbounded central stays central")
  {
    CoordinateStep s = fitStep(0.0, h, -kInf, kInf, Stencil::Central, 1e-8, 1.0, 0);
    REQUIRE(s.stencil == Stencil::Central);
    REQUIRE(s.step == h);
  }

  SECTION("At the lower bound central becomes forward")
  {
    CoordinateStep s = fitStep(0.0, h, 0.0, 1.0, Stencil::Central, 1e-8, 1.0, 0);
    REQUIRE(s.stencil == Stencil::Forward);
  }

  SECTION("At the upper bound central becomes backward")
  {
    CoordinateStep s = fitStep(1.0, h, 0.0, 1.0, Stencil::Central, 1e-8, 1.0, 0);
    REQUIRE(s.stencil == Stencil::Backward);
  }

  SECTION("A one-sided request switches sides when needed")
  {
    REQUIRE(fitStep(1.0, h, 0.0, 1.0, Stencil::Forward, 1e-8, 1.0, 0).stencil == Stencil::Backward);
    REQUIRE(fitStep(0.0, h, 0.0, 1.0, Stencil::Backward, 1e-8, 1.0, 0).stencil == Stencil::Forward);
  }

  SECTION("A narrow box shrinks the step to the larger side")
  {
    CoordinateStep s = fitStep(0.01, h, 0.0, 0.05, Stencil::Central, 1e-8, 1.0, 0);
    REQUIRE(s.stencil == Stencil::Forward);
    REQUIRE(s.step <= 0.04);
    REQUIRE(s.step == Catch::Approx(0.04));
    REQUIRE(0.01 + s.step <= 0.05);
  }

  SECTION("Reach two halves the available step")
  {
    CoordinateStep s = fitStep(0.0, h, 0.0, 0.1, Stencil::Central, 1e-8, 2.0, 0);
    REQUIRE(s.stencil == Stencil::Forward);
    REQUIRE(s.step == Catch::Approx(0.05));
    REQUIRE(0.0 + 2.0 * s.step <= 0.1);
  }

  SECTION("A degenerate box is infeasible")
  {
    REQUIRE_THROWS_AS(fitStep(1.0, h, 1.0, 1.0, Stencil::Central, 1e-8, 1.0, 3), InfeasibleStepError);
    REQUIRE_THROWS_AS(fitStep(1.0, h, 1.0, 1.0 + 1e-10, Stencil::Forward, 1e-8, 1.0, 3), InfeasibleStepError);
  }
}

TEST_CASE("Richardson tableau", "[StepSizes]")
{
  SECTION("One estimate is returned unchanged")
  {
    REQUIRE(richardsonExtrapolate({ 1.25 }, 2.0, 2) == 1.25);
  }

  SECTION("Central estimates lose their h^2 term")
  {
    // D(h) = 3 + 2 h^2 at h = 1 and h = 1/2
    REQUIRE(richardsonExtrapolate({ 5.0, 3.5 }, 2.0, 2) == Catch::Approx(3.0));
  }

  SECTION("One-sided estimates lose their h and h^2 terms")
  {
    // D(h) = 1 + h + h^2 at h = 1, 1/2, 1/4
    REQUIRE(richardsonExtrapolate({ 3.0, 1.75, 1.3125 }, 2.0, 1) == Catch::Approx(1.0));
  }

  SECTION("NaN estimates propagate")
  {
    REQUIRE(std::isnan(richardsonExtrapolate({ 1.0, std::nan("") }, 2.0, 2)));
  }

  SECTION("Bad arguments")
  {
    REQUIRE_THROWS_AS(richardsonExtrapolate({}, 2.0, 2), std::invalid_argument);
    REQUIRE_THROWS_AS(richardsonExtrapolate({ 1.0, 2.0 }, 1.0, 2), std::invalid_argument);
    REQUIRE_THROWS_AS(richardsonExtrapolate({ 1.0, 2.0 }, 2.0, 0), std::invalid_argument);
  }
}
