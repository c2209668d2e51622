#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "Differentiation.h"
#include "NullCollector.h"

using namespace treestat;
using namespace treestat::numdiff;
using treestat::tree::ParamTree;
using treestat::tree::flatten;

namespace
{
  double sumOfSquares(const std::vector<double>& x)
  {
    double s = 0.0;
    for (double v : x)
      s += v * v;
    return s;
  }

  // f(params) = params . params over every leaf
  ParamTree dotSelf(const ParamTree& params)
  {
    return ParamTree(sumOfSquares(flatten(params).values));
  }

  std::vector<double> testPoint(std::size_t d)
  {
    std::vector<double> x(d);
    for (std::size_t i = 0; i < d; ++i)
      x[i] = 0.3 * static_cast<double>(i) - 0.7;
    return x;
  }

  class RecordingObserver : public diagnostics::IDerivativeObserver
  {
  public:
    void onDerivativeComputed(const diagnostics::DerivativeRecord& record) override
    {
      std::lock_guard<std::mutex> lk(m_mutex);
      m_records.push_back(record);
    }

    std::vector<diagnostics::DerivativeRecord> m_records;

  private:
    std::mutex m_mutex;
  };
}

TEST_CASE("Gradient of x.x is 2x", "[Differentiation][first]")
{
  for (std::size_t d : { 1u, 5u, 10u })
    {
      std::vector<double> x = testPoint(d);

      for (FirstDerivativeMethod method : { FirstDerivativeMethod::Central,
					    FirstDerivativeMethod::Forward,
					    FirstDerivativeMethod::Backward })
	{
	  NumdiffOptions options;
	  options.method = method;

	  DerivativeResult r = firstDerivative(dotSelf, ParamTree::vector(x), options);

	  REQUIRE(r.derivative().isArray());
	  const std::vector<double>& g = r.derivative().asArray().values;
	  REQUIRE(g.size() == d);
	  for (std::size_t i = 0; i < d; ++i)
	    REQUIRE(std::fabs(g[i] - 2.0 * x[i]) < 1e-4);
	}
    }
}

TEST_CASE("Gradient keeps the params tree shape", "[Differentiation][first]")
{
  ParamTree params = ParamTree::mapping({
      { "a", 1.5 },
      { "b", ParamTree::sequence({ ParamTree::vector({ -1.0, 2.0 }), ParamTree(0.25) }) },
      { "t", ParamTree::labeledBlock({ "r1", "r2" }, { "c" }, { 3.0, -3.0 }) } });

  DerivativeResult r = firstDerivative(dotSelf, params);

  const ParamTree& g = r.derivative();
  REQUIRE(g.at("a").asScalar() == Catch::Approx(3.0).margin(1e-5));
  REQUIRE(g.at("b").at(0).asArray().values[1] == Catch::Approx(4.0).margin(1e-5));
  REQUIRE(g.at("b").at(1).asScalar() == Catch::Approx(0.5).margin(1e-5));
  REQUIRE(g.at("t").asLabeledBlock().rowLabels == std::vector<std::string>{ "r1", "r2" });
  REQUIRE(g.at("t").asLabeledBlock().at(1, 0) == Catch::Approx(-6.0).margin(1e-5));

  // base point plus two points per coordinate
  REQUIRE(r.numEvaluations() == 1 + 2 * 6);
  REQUIRE(r.steps().size() == 6);
  REQUIRE(r.baseValue().has_value());
  REQUIRE(r.baseValue()->asScalar() == Catch::Approx(1.5 * 1.5 + 1 + 4 + 0.0625 + 18));
}

TEST_CASE("Forward differences share the base evaluation", "[Differentiation][first]")
{
  NumdiffOptions options;
  options.method = FirstDerivativeMethod::Forward;

  DerivativeResult r = firstDerivative(dotSelf, ParamTree::vector(testPoint(4)), options);
  REQUIRE(r.numEvaluations() == 5);
  for (Stencil s : r.stencils())
    REQUIRE(s == Stencil::Forward);
}

TEST_CASE("Bounds force one-sided differences and are never violated", "[Differentiation][bounds]")
{
  const std::vector<double> x{ 0.0, 0.5, 1.0 };
  const std::vector<double> lower{ 0.0, 0.0, 0.0 };
  const std::vector<double> upper{ 1.0, 1.0, 1.0 };

  std::mutex m;
  std::vector<std::vector<double>> visited;
  auto f = [&](const ParamTree& p) {
    std::vector<double> v = flatten(p).values;
    {
      std::lock_guard<std::mutex> lk(m);
      visited.push_back(v);
    }
    return ParamTree(sumOfSquares(v));
  };

  NumdiffOptions options;
  options.bounds = Bounds(lower, upper);

  SECTION("First derivative")
  {
    DerivativeResult r = firstDerivative(f, ParamTree::vector(x), options);

    REQUIRE(r.stencils()[0] == Stencil::Forward);
    REQUIRE(r.stencils()[1] == Stencil::Central);
    REQUIRE(r.stencils()[2] == Stencil::Backward);

    const std::vector<double>& g = r.derivative().asArray().values;
    for (std::size_t i = 0; i < 3; ++i)
      {
	REQUIRE(std::isfinite(g[i]));
	REQUIRE(std::fabs(g[i] - 2.0 * x[i]) < 1e-4);
      }
  }

  SECTION("Second derivative")
  {
    DerivativeResult r = secondDerivative(f, ParamTree::vector(x), options);

    REQUIRE(r.stencils()[0] == Stencil::Forward);
    REQUIRE(r.stencils()[2] == Stencil::Backward);

    const tree::Matrix& h = r.matrix();
    for (std::size_t i = 0; i < 3; ++i)
      for (std::size_t j = 0; j < 3; ++j)
	REQUIRE(h(i, j) == Catch::Approx(i == j ? 2.0 : 0.0).margin(1e-3));
  }

  for (const auto& v : visited)
    for (std::size_t i = 0; i < v.size(); ++i)
      {
	REQUIRE(v[i] >= lower[i]);
	REQUIRE(v[i] <= upper[i]);
      }
  REQUIRE_FALSE(visited.empty());
}

TEST_CASE("Bounds errors", "[Differentiation][bounds]")
{
  NumdiffOptions options;

  SECTION("Params outside the bounds")
  {
    options.bounds = Bounds({ 0.0 }, { 1.0 });
    REQUIRE_THROWS_AS(firstDerivative(dotSelf, ParamTree::vector({ 2.0 }), options), InvalidBoundsError);
  }

  SECTION("Bounds of the wrong length")
  {
    options.bounds = Bounds({ 0.0, 0.0 }, { 1.0, 1.0 });
    REQUIRE_THROWS_AS(firstDerivative(dotSelf, ParamTree::vector({ 0.5 }), options), InvalidBoundsError);
  }

  SECTION("A zero-width box leaves no room for a step")
  {
    options.bounds = Bounds({ 1.0 }, { 1.0 });
    REQUIRE_THROWS_AS(firstDerivative(dotSelf, ParamTree::vector({ 1.0 }), options), InfeasibleStepError);
    REQUIRE_THROWS_AS(secondDerivative(dotSelf, ParamTree::vector({ 1.0 }), options), InfeasibleStepError);
  }
}

TEST_CASE("Hessian of x.x is 2I", "[Differentiation][second]")
{
  for (std::size_t d : { 1u, 5u, 10u })
    {
      std::vector<double> x = testPoint(d);

      for (SecondDerivativeMethod method : { SecondDerivativeMethod::CentralCross,
					     SecondDerivativeMethod::Forward })
	{
	  NumdiffOptions options;
	  options.secondMethod = method;

	  DerivativeResult r = secondDerivative(dotSelf, ParamTree::vector(x), options);

	  REQUIRE(r.derivative().isArray());
	  REQUIRE(r.derivative().asArray().shape == std::vector<std::size_t>{ d, d });

	  const tree::Matrix& h = r.matrix();
	  for (std::size_t i = 0; i < d; ++i)
	    for (std::size_t j = 0; j < d; ++j)
	      {
		REQUIRE(h(i, j) == Catch::Approx(i == j ? 2.0 : 0.0).margin(1e-4));
		REQUIRE(h(i, j) == h(j, i));
	      }
	}
    }
}

TEST_CASE("Hessian divides by the offsets the points realize", "[Differentiation][second]")
{
  // Near 1e6 doubles are 2^-33 apart, so a step of 1.6e-10 lands on one
  // spacing and twice the step on three.
  const double c = 1e6;
  auto f = [c](const ParamTree& p) {
    const auto& t = p.asArray().values;
    const double u = t[0] - c;
    const double v = t[1] - c;
    return ParamTree(u * u + v * v + u * v);
  };

  NumdiffOptions options;
  options.minStep = 1e-12;
  options.baseStep = std::vector<double>{ 1.6e-10, 1.6e-10 };

  for (SecondDerivativeMethod method : { SecondDerivativeMethod::CentralCross,
					 SecondDerivativeMethod::Forward })
    {
      options.secondMethod = method;
      DerivativeResult r = secondDerivative(f, ParamTree::vector({ c, c }), options);

      const tree::Matrix& h = r.matrix();
      REQUIRE(h(0, 0) == Catch::Approx(2.0).epsilon(1e-9));
      REQUIRE(h(1, 1) == Catch::Approx(2.0).epsilon(1e-9));
      REQUIRE(h(0, 1) == Catch::Approx(1.0).epsilon(1e-9));
      REQUIRE(h(1, 0) == h(0, 1));
    }
}

TEST_CASE("Hessian evaluations are deduplicated", "[Differentiation][second]")
{
  const std::size_t d = 4;
  std::atomic<std::size_t> calls{ 0 };
  auto f = [&calls](const ParamTree& p) {
    ++calls;
    return dotSelf(p);
  };

  SECTION("Central cross")
  {
    DerivativeResult r = secondDerivative(f, ParamTree::vector(testPoint(d)));
    // base, 2 diagonal points per coordinate, 4 points per off-diagonal pair
    REQUIRE(r.numEvaluations() == 1 + 2 * d + 4 * d * (d - 1) / 2);
    REQUIRE(calls.load() == r.numEvaluations());
  }

  SECTION("Forward")
  {
    NumdiffOptions options;
    options.secondMethod = SecondDerivativeMethod::Forward;
    DerivativeResult r = secondDerivative(f, ParamTree::vector(testPoint(d)), options);
    // base, x+h_i, x+2h_i, x+h_i+h_j
    REQUIRE(r.numEvaluations() == 1 + 2 * d + d * (d - 1) / 2);
    REQUIRE(calls.load() == r.numEvaluations());
  }
}

TEST_CASE("Hessian keeps block structure over trees", "[Differentiation][second]")
{
  // f = a^2 * b0 + b1^2
  auto f = [](const ParamTree& p) {
    const double a = p.at("a").asScalar();
    const auto& b = p.at("b").asArray().values;
    return ParamTree(a * a * b[0] + b[1] * b[1]);
  };
  ParamTree params = ParamTree::mapping({ { "a", 2.0 }, { "b", ParamTree::vector({ 3.0, 1.0 }) } });

  DerivativeResult r = secondDerivative(f, params);
  const ParamTree& h = r.derivative();

  REQUIRE(h.at("a").at("a").asScalar() == Catch::Approx(6.0).margin(1e-3));
  REQUIRE(h.at("a").at("b").asArray().values[0] == Catch::Approx(4.0).margin(1e-3));
  REQUIRE(h.at("a").at("b").asArray().values[1] == Catch::Approx(0.0).margin(1e-3));
  REQUIRE(h.at("b").at("a").asArray().values[0] == Catch::Approx(4.0).margin(1e-3));
  REQUIRE(h.at("b").at("b").asArray().shape == std::vector<std::size_t>{ 2, 2 });
  REQUIRE(h.at("b").at("b").asArray().values[3] == Catch::Approx(2.0).margin(1e-3));
}

TEST_CASE("Second derivative needs a scalar function", "[Differentiation][second]")
{
  auto f = [](const ParamTree& p) { return p; };
  REQUIRE_THROWS_AS(secondDerivative(f, ParamTree::vector({ 1.0, 2.0 })), TreeStructureError);
}

TEST_CASE("Jacobian of a linear map equals its matrix", "[Differentiation][jacobian]")
{
  // y = A x, A is 3x2
  const double A[3][2] = { { 1.0, 2.0 }, { -3.0, 0.5 }, { 0.0, 4.0 } };
  auto f = [&A](const ParamTree& p) {
    const auto& x = p.asArray().values;
    std::vector<double> y(3);
    for (std::size_t i = 0; i < 3; ++i)
      y[i] = A[i][0] * x[0] + A[i][1] * x[1];
    return ParamTree::vector(y);
  };

  DerivativeResult r = firstDerivative(f, ParamTree::vector({ 0.7, -1.2 }));

  REQUIRE(r.derivative().isArray());
  REQUIRE(r.derivative().asArray().shape == std::vector<std::size_t>{ 3, 2 });
  for (std::size_t i = 0; i < 3; ++i)
    for (std::size_t j = 0; j < 2; ++j)
      REQUIRE(r.matrix()(i, j) == Catch::Approx(A[i][j]).margin(1e-6));
}

TEST_CASE("Jacobian of a tree-valued function", "[Differentiation][jacobian]")
{
  auto f = [](const ParamTree& p) {
    const double x = p.at("x").asScalar();
    const double y = p.at("y").asScalar();
    return ParamTree::mapping({ { "sum", x + y }, { "prod", ParamTree::vector({ x * y, 3.0 * x }) } });
  };
  ParamTree params = ParamTree::mapping({ { "x", 2.0 }, { "y", 5.0 } });

  DerivativeResult r = firstDerivative(f, params);
  const ParamTree& j = r.derivative();

  REQUIRE(j.at("sum").at("x").asScalar() == Catch::Approx(1.0).margin(1e-6));
  REQUIRE(j.at("prod").at("x").asArray().values[0] == Catch::Approx(5.0).margin(1e-6));
  REQUIRE(j.at("prod").at("x").asArray().values[1] == Catch::Approx(3.0).margin(1e-6));
  REQUIRE(j.at("prod").at("y").asArray().values[0] == Catch::Approx(2.0).margin(1e-6));
}

TEST_CASE("Function outputs must keep one structure", "[Differentiation][first]")
{
  auto f = [](const ParamTree& p) {
    const double x = p.asArray().values[0];
    if (x > 1.0)
      return ParamTree::vector({ x, x });
    return ParamTree(x);
  };
  REQUIRE_THROWS_AS(firstDerivative(f, ParamTree::vector({ 1.0 })), TreeStructureError);
}

TEST_CASE("Non-finite central quotients fall back to one-sided ones", "[Differentiation][first]")
{
  // log is undefined for x <= 0, so the backward point at the origin yields NaN
  auto f = [](const ParamTree& p) {
    const double x = p.asArray().values[0];
    return ParamTree(x > 0.0 ? std::log(x) : std::numeric_limits<double>::quiet_NaN());
  };

  NumdiffOptions options;
  options.baseStep = std::vector<double>{ 1e-3 };
  DerivativeResult r = firstDerivative(f, ParamTree::vector({ 1e-3 }), options);

  REQUIRE(r.stencils()[0] == Stencil::Forward);
  REQUIRE(std::isfinite(r.derivative().asArray().values[0]));
  REQUIRE(r.derivative().asArray().values[0] == Catch::Approx(std::log(2.0) / 1e-3).epsilon(1e-6));
}

TEST_CASE("Each output keeps its own fallback", "[Differentiation][first]")
{
  // output 1 is undefined above 1, output 2 below 1
  auto f = [](const ParamTree& p) {
    const double t = p.asArray().values[0];
    const double nan = std::numeric_limits<double>::quiet_NaN();
    return ParamTree::vector({ t * t, t > 1.0 ? nan : 3.0 * t, t < 1.0 ? nan : 5.0 * t });
  };

  DerivativeResult r = firstDerivative(f, ParamTree::vector({ 1.0 }));

  REQUIRE(r.matrix()(0, 0) == Catch::Approx(2.0).margin(1e-6));
  REQUIRE(r.matrix()(1, 0) == Catch::Approx(3.0).margin(1e-6));
  REQUIRE(r.matrix()(2, 0) == Catch::Approx(5.0).margin(1e-6));

  // the first output in flat order that fell back went backward
  REQUIRE(r.stencils().size() == 1);
  REQUIRE(r.stencils()[0] == Stencil::Backward);
}

TEST_CASE("Richardson extrapolation reduces truncation error", "[Differentiation][richardson]")
{
  const double x = 1.0;

  auto expOf = [](const ParamTree& p) {
    return ParamTree(std::exp(p.asArray().values[0]));
  };
  auto sinOf = [](const ParamTree& p) {
    return ParamTree(std::sin(p.asArray().values[0]));
  };

  NumdiffOptions single;
  single.baseStep = std::vector<double>{ 0.1 };
  NumdiffOptions extrapolated = single;
  extrapolated.nSteps = 3;

  SECTION("Central first derivative")
  {
    const double e1 = std::fabs(firstDerivative(expOf, ParamTree::vector({ x }), single).matrix()(0, 0) - std::exp(x));
    DerivativeResult r = firstDerivative(expOf, ParamTree::vector({ x }), extrapolated);
    const double e3 = std::fabs(r.matrix()(0, 0) - std::exp(x));

    REQUIRE(e1 > 1e-3);
    REQUIRE(e3 < 1e-6);
    // base point plus two points per step
    REQUIRE(r.numEvaluations() == 1 + 2 * 3);
    REQUIRE(r.steps()[0] == 0.1);
  }

  SECTION("Forward first derivative")
  {
    single.method = FirstDerivativeMethod::Forward;
    extrapolated.method = FirstDerivativeMethod::Forward;
    const double e1 = std::fabs(firstDerivative(expOf, ParamTree::vector({ x }), single).matrix()(0, 0) - std::exp(x));
    const double e3 = std::fabs(firstDerivative(expOf, ParamTree::vector({ x }), extrapolated).matrix()(0, 0) - std::exp(x));

    REQUIRE(e1 > 0.1);
    REQUIRE(e3 < 1e-4);
  }

  single.baseStep = std::vector<double>{ 0.05 };
  extrapolated.baseStep = single.baseStep;

  SECTION("Central second derivative")
  {
    const double e1 = std::fabs(secondDerivative(sinOf, ParamTree::vector({ 0.5 }), single).matrix()(0, 0) + std::sin(0.5));
    const double e3 = std::fabs(secondDerivative(sinOf, ParamTree::vector({ 0.5 }), extrapolated).matrix()(0, 0) + std::sin(0.5));

    REQUIRE(e1 > 1e-4);
    REQUIRE(e3 < 1e-7);
  }

  SECTION("Forward second derivative")
  {
    single.secondMethod = SecondDerivativeMethod::Forward;
    extrapolated.secondMethod = SecondDerivativeMethod::Forward;
    const double e1 = std::fabs(secondDerivative(sinOf, ParamTree::vector({ 0.5 }), single).matrix()(0, 0) + std::sin(0.5));
    const double e3 = std::fabs(secondDerivative(sinOf, ParamTree::vector({ 0.5 }), extrapolated).matrix()(0, 0) + std::sin(0.5));

    REQUIRE(e1 > 1e-2);
    REQUIRE(e3 < 1e-4);
  }
}

TEST_CASE("A supplied base value is not evaluated again", "[Differentiation]")
{
  const ParamTree params = ParamTree::vector({ 1.0, -2.0, 0.5 });
  std::atomic<std::size_t> calls{ 0 };
  std::atomic<std::size_t> baseCalls{ 0 };
  auto f = [&](const ParamTree& p) {
    ++calls;
    if (p == params)
      ++baseCalls;
    return dotSelf(p);
  };

  NumdiffOptions plain;
  NumdiffOptions known;
  known.f0 = dotSelf(params);
  known.returnFunctionValues = true;

  SECTION("First derivative")
  {
    DerivativeResult expected = firstDerivative(dotSelf, params, plain);
    DerivativeResult r = firstDerivative(f, params, known);

    REQUIRE(baseCalls.load() == 0);
    REQUIRE(r.numEvaluations() == 2 * 3);
    REQUIRE(calls.load() == r.numEvaluations());
    REQUIRE(r.matrix() == expected.matrix());
    REQUIRE(*r.baseValue() == *known.f0);
    REQUIRE(r.functionValues().size() == r.numEvaluations());
  }

  SECTION("Second derivative")
  {
    known.secondMethod = SecondDerivativeMethod::Forward;
    plain.secondMethod = SecondDerivativeMethod::Forward;
    DerivativeResult expected = secondDerivative(dotSelf, params, plain);
    DerivativeResult r = secondDerivative(f, params, known);

    REQUIRE(baseCalls.load() == 0);
    REQUIRE(r.numEvaluations() == expected.numEvaluations() - 1);
    REQUIRE(r.matrix() == expected.matrix());
  }

  SECTION("A base value of another structure is rejected")
  {
    known.f0 = ParamTree::vector({ 1.0, 2.0 });
    REQUIRE_THROWS_AS(firstDerivative(f, params, known), TreeStructureError);
  }
}

TEST_CASE("Step options are validated", "[Differentiation]")
{
  NumdiffOptions options;

  SECTION("nSteps of zero")
  {
    options.nSteps = 0;
    REQUIRE_THROWS_AS(firstDerivative(dotSelf, ParamTree::vector({ 1.0 }), options), std::invalid_argument);
  }

  SECTION("stepRatio not above one")
  {
    options.nSteps = 2;
    options.stepRatio = 1.0;
    REQUIRE_THROWS_AS(secondDerivative(dotSelf, ParamTree::vector({ 1.0 }), options), std::invalid_argument);
  }
}

TEST_CASE("Empty params never call the function", "[Differentiation]")
{
  std::atomic<int> calls{ 0 };
  auto f = [&calls](const ParamTree&) {
    ++calls;
    return ParamTree(1.0);
  };

  DerivativeResult first = firstDerivative(f, ParamTree::mapping());
  DerivativeResult second = secondDerivative(f, ParamTree::sequence());

  REQUIRE(calls.load() == 0);
  REQUIRE(first.numEvaluations() == 0);
  REQUIRE(second.numEvaluations() == 0);
  REQUIRE(first.derivative() == ParamTree::mapping());
  REQUIRE(second.derivative() == ParamTree::sequence());
  REQUIRE_FALSE(first.baseValue().has_value());
}

TEST_CASE("Function exceptions propagate unchanged", "[Differentiation]")
{
  auto f = [](const ParamTree& p) -> ParamTree {
    if (p.asArray().values[1] > 2.0)
      throw std::domain_error("model failed");
    return dotSelf(p);
  };

  NumdiffOptions options;
  SECTION("Inline")
  {
    options.nCores = 1;
    REQUIRE_THROWS_AS(firstDerivative(f, ParamTree::vector({ 1.0, 2.0, 3.0 }), options), std::domain_error);
  }
  SECTION("Thread pool")
  {
    options.nCores = 3;
    REQUIRE_THROWS_AS(secondDerivative(f, ParamTree::vector({ 1.0, 2.0, 1.0 }), options), std::domain_error);
  }
}

TEST_CASE("Parallel evaluation matches serial evaluation", "[Differentiation][parallel]")
{
  auto f = [](const ParamTree& p) {
    const auto& x = p.asArray().values;
    double s = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i)
      s += std::sin(x[i]) * static_cast<double>(i + 1) + x[i] * x[(i + 1) % x.size()];
    return ParamTree(s);
  };
  ParamTree params = ParamTree::vector(testPoint(6));

  NumdiffOptions serial;
  NumdiffOptions parallel;
  parallel.nCores = 4;

  REQUIRE(firstDerivative(f, params, serial).matrix() == firstDerivative(f, params, parallel).matrix());
  REQUIRE(secondDerivative(f, params, serial).matrix() == secondDerivative(f, params, parallel).matrix());
}

TEST_CASE("Function values are returned on request", "[Differentiation]")
{
  NumdiffOptions options;
  options.method = FirstDerivativeMethod::Forward;
  options.returnFunctionValues = true;

  DerivativeResult r = firstDerivative(dotSelf, ParamTree::vector({ 1.0, 2.0 }), options);

  REQUIRE(r.functionValues().size() == r.numEvaluations());
  REQUIRE(r.functionValues()[0].params == ParamTree::vector({ 1.0, 2.0 }));
  REQUIRE(r.functionValues()[0].value.asScalar() == Catch::Approx(5.0));
  for (const FunctionEvaluation& e : r.functionValues())
    REQUIRE(e.value == dotSelf(e.params));

  NumdiffOptions quiet;
  REQUIRE(firstDerivative(dotSelf, ParamTree::vector({ 1.0, 2.0 }), quiet).functionValues().empty());
}

TEST_CASE("Observer receives one record per call", "[Differentiation][diagnostics]")
{
  auto observer = std::make_shared<RecordingObserver>();
  NumdiffOptions options;
  options.observer = observer;
  options.bounds = Bounds({ 0.0, -5.0 }, { 5.0, 5.0 });

  firstDerivative(dotSelf, ParamTree::vector({ 0.0, 1.0 }), options);
  secondDerivative(dotSelf, ParamTree::vector({ 0.0, 1.0 }), options);

  REQUIRE(observer->m_records.size() == 2);

  const auto& first = observer->m_records[0];
  REQUIRE(first.getOrder() == diagnostics::DerivativeOrder::First);
  REQUIRE(first.getRequestedMethod() == "central");
  REQUIRE(first.getParamDim() == 2);
  REQUIRE(first.getOutputDim() == 1);
  REQUIRE(first.getNumEvaluations() == 4);
  REQUIRE(first.getNumFallbackCoordinates() == 1);
  REQUIRE(first.getNumWorkers() == 1);

  const auto& second = observer->m_records[1];
  REQUIRE(second.getOrder() == diagnostics::DerivativeOrder::Second);
  REQUIRE(second.getRequestedMethod() == "central_cross");

  NumdiffOptions nullOptions;
  nullOptions.observer = std::make_shared<diagnostics::NullCollector>();
  REQUIRE_NOTHROW(firstDerivative(dotSelf, ParamTree::vector({ 1.0 }), nullOptions));
}

TEST_CASE("Typed convenience wrappers", "[Differentiation][TreeTraits]")
{
  auto f = [](const std::map<std::string, double>& p) {
    return p.at("x") * p.at("x") * p.at("y");
  };
  std::map<std::string, double> params{ { "x", 3.0 }, { "y", 2.0 } };

  DerivativeResult g = firstDerivativeOf(f, params);
  auto grad = tree::fromTree<std::map<std::string, double>>(g.derivative());
  REQUIRE(grad.at("x") == Catch::Approx(12.0).margin(1e-5));
  REQUIRE(grad.at("y") == Catch::Approx(9.0).margin(1e-5));

  DerivativeResult h = secondDerivativeOf(f, params);
  REQUIRE(h.derivative().at("x").at("y").asScalar() == Catch::Approx(6.0).margin(1e-3));
}

TEST_CASE("Method names parse and print", "[Differentiation]")
{
  REQUIRE(parseFirstDerivativeMethod("backward") == FirstDerivativeMethod::Backward);
  REQUIRE(parseSecondDerivativeMethod("central_cross") == SecondDerivativeMethod::CentralCross);
  REQUIRE(std::string(toString(SecondDerivativeMethod::Forward)) == "forward");
  REQUIRE_THROWS_AS(parseFirstDerivativeMethod("sideways"), std::invalid_argument);
  REQUIRE_THROWS_AS(parseSecondDerivativeMethod("central"), std::invalid_argument);
}
