// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "Differentiation.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <stdexcept>
#include <utility>

#include "TreeSpec.h"
#include "BlockSpec.h"
#include "ParallelExecutors.h"
#include "ParallelFor.h"
#include "DerivativeRecord.h"

namespace treestat
{
  namespace numdiff
  {
    using tree::ParamTree;
    using tree::TreeSpec;
    using tree::Matrix;

    namespace
    {
      constexpr std::size_t kNoPoint = std::numeric_limits<std::size_t>::max();

      /**
       * Distinct evaluation points in the order they were first requested.
       * Point 0 is always the unperturbed params.
       */
      class EvaluationPlan
      {
      public:
	EvaluationPlan(const std::vector<double>& x, const Bounds& bounds)
	  : m_x(x),
	    m_bounds(bounds)
	{
	  add({});
	}

	// x moved by the given offsets; offsets on the same coordinate add up.
	std::size_t add(const std::vector<std::pair<std::size_t, double>>& offsets)
	{
	  std::vector<double> p(m_x);
	  for (const auto& o : offsets)
	    p[o.first] += o.second;

	  // guards against rounding only; steps were already fitted to the bounds
	  for (const auto& o : offsets)
	    p[o.first] = std::clamp(p[o.first], m_bounds.lower(o.first), m_bounds.upper(o.first));

	  auto it = m_index.find(p);
	  if (it != m_index.end())
	    return it->second;

	  const std::size_t idx = m_points.size();
	  m_index.emplace(p, idx);
	  m_points.push_back(std::move(p));
	  return idx;
	}

	const std::vector<std::vector<double>>& points() const
	{
	  return m_points;
	}

      private:
	const std::vector<double>&                  m_x;
	const Bounds&                               m_bounds;
	std::vector<std::vector<double>>            m_points;
	std::map<std::vector<double>, std::size_t>  m_index;
      };

      struct Evaluations
      {
	std::vector<ParamTree>           outputs;
	std::vector<std::vector<double>> flatOutputs;
	TreeSpec                         outputSpec;
	std::size_t                      numWorkers;
	// 1 when the base value was supplied instead of evaluated
	std::size_t                      firstEvaluated;

	std::size_t numEvaluated() const
	{
	  return outputs.size() - firstEvaluated;
	}
      };

      Evaluations evaluatePlan(const DerivativeFunction& func,
			       const TreeSpec& paramsSpec,
			       const EvaluationPlan& plan,
			       const NumdiffOptions& options)
      {
	const auto& points = plan.points();
	std::vector<ParamTree> outputs(points.size());

	std::size_t first = 0;
	if (options.f0)
	  {
	    outputs[0] = *options.f0;
	    first = 1;
	  }

	auto executor = concurrency::makeExecutor(options.nCores);
	concurrency::parallel_for(points.size() - first, *executor, [&](std::size_t k) {
	    const std::size_t i = k + first;
	    outputs[i] = func(paramsSpec.unflatten(points[i]));
	  });

	TreeSpec outputSpec(outputs[0]);
	std::vector<std::vector<double>> flat(outputs.size());
	for (std::size_t k = 0; k < outputs.size(); ++k)
	  flat[k] = outputSpec.flattenLike(outputs[k]);

	return Evaluations{ std::move(outputs), std::move(flat), std::move(outputSpec),
			    executor->numWorkers(), first };
      }

      void validateOptions(const NumdiffOptions& options)
      {
	if (options.nCores == 0)
	  throw std::invalid_argument("numdiff: nCores must be at least 1");
	if (!(options.minStep > 0.0))
	  throw std::invalid_argument("numdiff: minStep must be positive");
	if (options.nSteps == 0)
	  throw std::invalid_argument("numdiff: nSteps must be at least 1");
	if (!(options.stepRatio > 1.0) || !std::isfinite(options.stepRatio))
	  throw std::invalid_argument("numdiff: stepRatio must be a finite number above 1");
      }

      // Multiplier of the first step for step number s.
      double shrinkFactor(const NumdiffOptions& options, std::size_t s)
      {
	return std::pow(options.stepRatio, -static_cast<double>(s));
      }

      std::vector<FunctionEvaluation> collectFunctionValues(const NumdiffOptions& options,
							    const TreeSpec& paramsSpec,
							    const EvaluationPlan& plan,
							    const Evaluations& ev)
      {
	std::vector<FunctionEvaluation> values;
	if (!options.returnFunctionValues)
	  return values;

	values.reserve(ev.numEvaluated());
	for (std::size_t k = ev.firstEvaluated; k < ev.outputs.size(); ++k)
	  values.push_back(FunctionEvaluation{ paramsSpec.unflatten(plan.points()[k]), ev.outputs[k] });
	return values;
      }

      std::size_t countFallbacks(const std::vector<Stencil>& used, Stencil requested)
      {
	return static_cast<std::size_t>(std::count_if(used.begin(), used.end(),
						      [requested](Stencil s) { return s != requested; }));
      }

      void notify(const NumdiffOptions& options,
		  diagnostics::DerivativeOrder order,
		  const char* method,
		  std::size_t paramDim,
		  std::size_t outputDim,
		  std::size_t numEvaluations,
		  std::size_t numFallbacks,
		  const std::vector<double>& steps,
		  std::size_t numWorkers)
      {
	if (!options.observer)
	  return;

	double minStep = 0.0;
	double maxStep = 0.0;
	if (!steps.empty())
	  {
	    auto mm = std::minmax_element(steps.begin(), steps.end());
	    minStep = *mm.first;
	    maxStep = *mm.second;
	  }

	options.observer->onDerivativeComputed(
	  diagnostics::DerivativeRecord(order, method, paramDim, outputDim, numEvaluations,
					numFallbacks, minStep, maxStep, numWorkers));
      }

      DerivativeResult emptyResult(const NumdiffOptions& options,
				   diagnostics::DerivativeOrder order,
				   const char* method,
				   const TreeSpec& paramsSpec)
      {
	notify(options, order, method, 0, 0, 0, 0, {}, 0);
	return DerivativeResult(paramsSpec.skeleton(), Matrix(0, 0), {}, {}, 0,
				std::nullopt, {});
      }

      /**
       * Pick the first finite quotient in the order the stencil prefers:
       * central, then forward, then backward. Unavailable quotients are NaN.
       */
      std::pair<double, Stencil> consolidate(Stencil stencil,
					     double central,
					     double forward,
					     double backward)
      {
	std::vector<std::pair<double, Stencil>> candidates;
	switch (stencil)
	  {
	  case Stencil::Central:
	    candidates = { { central, Stencil::Central },
			   { forward, Stencil::Forward },
			   { backward, Stencil::Backward } };
	    break;
	  case Stencil::Forward:
	    candidates = { { forward, Stencil::Forward } };
	    break;
	  case Stencil::Backward:
	    candidates = { { backward, Stencil::Backward } };
	    break;
	  }

	for (const auto& c : candidates)
	  if (std::isfinite(c.first))
	    return c;
	return candidates.front();
      }

      Stencil toStencil(FirstDerivativeMethod m)
      {
	switch (m)
	  {
	  case FirstDerivativeMethod::Central:  return Stencil::Central;
	  case FirstDerivativeMethod::Forward:  return Stencil::Forward;
	  case FirstDerivativeMethod::Backward: return Stencil::Backward;
	  }
	return Stencil::Central;
      }

      struct Term
      {
	std::size_t point;
	double      coefficient;
      };

      // Coefficients already include the division by the realized offsets.
      struct PairStencil
      {
	std::size_t       i;
	std::size_t       j;
	std::vector<Term> terms;
	unsigned          errorOrder;
      };
    }

    const char* toString(FirstDerivativeMethod m)
    {
      switch (m)
	{
	case FirstDerivativeMethod::Central:  return "central";
	case FirstDerivativeMethod::Forward:  return "forward";
	case FirstDerivativeMethod::Backward: return "backward";
	}
      return "unknown";
    }

    const char* toString(SecondDerivativeMethod m)
    {
      switch (m)
	{
	case SecondDerivativeMethod::CentralCross: return "central_cross";
	case SecondDerivativeMethod::Forward:      return "forward";
	}
      return "unknown";
    }

    FirstDerivativeMethod parseFirstDerivativeMethod(const std::string& name)
    {
      if (name == "central")
	return FirstDerivativeMethod::Central;
      if (name == "forward")
	return FirstDerivativeMethod::Forward;
      if (name == "backward")
	return FirstDerivativeMethod::Backward;
      throw std::invalid_argument("unknown first derivative method '" + name + "'");
    }

    SecondDerivativeMethod parseSecondDerivativeMethod(const std::string& name)
    {
      if (name == "central_cross")
	return SecondDerivativeMethod::CentralCross;
      if (name == "forward")
	return SecondDerivativeMethod::Forward;
      throw std::invalid_argument("unknown second derivative method '" + name + "'");
    }

    DerivativeResult firstDerivative(const DerivativeFunction& func,
				     const ParamTree& params,
				     const NumdiffOptions& options)
    {
      validateOptions(options);

      tree::FlatTree flat = tree::flatten(params);
      const std::vector<double>& x = flat.values;
      const std::size_t d = x.size();

      const Bounds bounds = options.bounds.value_or(Bounds());
      bounds.validate(x);

      const char* method = toString(options.method);
      if (d == 0)
	return emptyResult(options, diagnostics::DerivativeOrder::First, method, flat.spec);

      const Stencil requested = toStencil(options.method);
      const std::vector<double> nominal =
	nominalSteps(x, firstDerivativeScale(), options.minStep, options.baseStep);

      std::vector<CoordinateStep> chosen;
      chosen.reserve(d);
      for (std::size_t i = 0; i < d; ++i)
	chosen.push_back(fitStep(x[i], nominal[i], bounds.lower(i), bounds.upper(i),
				 requested, options.minStep, 1.0, i));

      const std::size_t nSteps = options.nSteps;
      EvaluationPlan plan(x, bounds);
      std::vector<std::vector<std::size_t>> plus(nSteps, std::vector<std::size_t>(d, kNoPoint));
      std::vector<std::vector<std::size_t>> minus(nSteps, std::vector<std::size_t>(d, kNoPoint));
      for (std::size_t s = 0; s < nSteps; ++s)
	{
	  const double shrink = shrinkFactor(options, s);
	  for (std::size_t i = 0; i < d; ++i)
	    {
	      const double h = chosen[i].step * shrink;
	      if (chosen[i].stencil != Stencil::Backward)
		plus[s][i] = plan.add({ { i, h } });
	      if (chosen[i].stencil != Stencil::Forward)
		minus[s][i] = plan.add({ { i, -h } });
	    }
	}

      Evaluations ev = evaluatePlan(func, flat.spec, plan, options);
      const auto& f = ev.flatOutputs;
      const auto& points = plan.points();
      const std::size_t m = ev.outputSpec.totalDim();
      constexpr double nan = std::numeric_limits<double>::quiet_NaN();

      Matrix jacobian(m, d);
      std::vector<Stencil> used(d);
      std::vector<double> steps(d);
      std::vector<double> central(nSteps);
      std::vector<double> forward(nSteps);
      std::vector<double> backward(nSteps);

      for (std::size_t i = 0; i < d; ++i)
	{
	  used[i]  = chosen[i].stencil;
	  steps[i] = chosen[i].step;

	  bool fellBack = false;
	  for (std::size_t k = 0; k < m; ++k)
	    {
	      const double f0 = f[0][k];
	      for (std::size_t s = 0; s < nSteps; ++s)
		{
		  const std::size_t up = plus[s][i];
		  const std::size_t down = minus[s][i];

		  // quotients use the realized perturbation, not the nominal step
		  const double hp = up != kNoPoint ? points[up][i] - x[i] : 0.0;
		  const double hm = down != kNoPoint ? x[i] - points[down][i] : 0.0;

		  forward[s]  = up != kNoPoint ? (f[up][k] - f0) / hp : nan;
		  backward[s] = down != kNoPoint ? (f0 - f[down][k]) / hm : nan;
		  central[s]  = (up != kNoPoint && down != kNoPoint)
		    ? (f[up][k] - f[down][k]) / (hp + hm) : nan;
		}

	      const auto picked = consolidate(chosen[i].stencil,
					      richardsonExtrapolate(central, options.stepRatio, 2),
					      richardsonExtrapolate(forward, options.stepRatio, 1),
					      richardsonExtrapolate(backward, options.stepRatio, 1));
	      jacobian(k, i) = picked.first;

	      if (!fellBack && picked.second != chosen[i].stencil)
		{
		  used[i]  = picked.second;
		  fellBack = true;
		}
	    }
	}

      ParamTree derivative;
      if (m == 1)
	derivative = flat.spec.unflatten(jacobian.data);
      else
	derivative = tree::outerProductStructure(ev.outputSpec, flat.spec).toTree(jacobian);

      const std::size_t numEvaluations = ev.numEvaluated();
      notify(options, diagnostics::DerivativeOrder::First, method, d, m, numEvaluations,
	     countFallbacks(used, requested), steps, ev.numWorkers);

      std::vector<FunctionEvaluation> values = collectFunctionValues(options, flat.spec, plan, ev);
      ParamTree baseValue = ev.outputs[0];

      return DerivativeResult(std::move(derivative), std::move(jacobian), std::move(steps),
			      std::move(used), numEvaluations, std::move(baseValue),
			      std::move(values));
    }

    DerivativeResult secondDerivative(const DerivativeFunction& func,
				      const ParamTree& params,
				      const NumdiffOptions& options)
    {
      validateOptions(options);

      tree::FlatTree flat = tree::flatten(params);
      const std::vector<double>& x = flat.values;
      const std::size_t d = x.size();

      const Bounds bounds = options.bounds.value_or(Bounds());
      bounds.validate(x);

      const char* method = toString(options.secondMethod);
      if (d == 0)
	return emptyResult(options, diagnostics::DerivativeOrder::Second, method, flat.spec);

      const Stencil requested = options.secondMethod == SecondDerivativeMethod::CentralCross
	? Stencil::Central : Stencil::Forward;
      const std::vector<double> nominal =
	nominalSteps(x, secondDerivativeScale(), options.minStep, options.baseStep);

      // Every stencil below moves a coordinate by at most two steps.
      std::vector<CoordinateStep> chosen;
      chosen.reserve(d);
      for (std::size_t i = 0; i < d; ++i)
	chosen.push_back(fitStep(x[i], nominal[i], bounds.lower(i), bounds.upper(i),
				 requested, options.minStep, 2.0, i));

      // Signed step for the one-sided stencil; central coordinates paired with
      // a one-sided coordinate step upward, which fits since 2h fits both ways.
      std::vector<double> delta(d);
      for (std::size_t i = 0; i < d; ++i)
	delta[i] = chosen[i].stencil == Stencil::Backward ? -chosen[i].step : chosen[i].step;

      const std::size_t nSteps = options.nSteps;
      EvaluationPlan plan(x, bounds);
      const std::size_t base = 0;
      auto offset = [&plan, &x](std::size_t point, std::size_t c) {
	return plan.points()[point][c] - x[c];
      };

      // pairs[s] holds the stencils of step number s, all in the same pair order
      std::vector<std::vector<PairStencil>> pairs(nSteps);
      for (std::size_t s = 0; s < nSteps; ++s)
	{
	  const double shrink = shrinkFactor(options, s);
	  pairs[s].reserve(d * (d + 1) / 2);

	  for (std::size_t i = 0; i < d; ++i)
	    for (std::size_t j = i; j < d; ++j)
	      {
		const bool centralPair = chosen[i].stencil == Stencil::Central
		  && chosen[j].stencil == Stencil::Central;
		PairStencil p{ i, j, {}, centralPair ? 2u : 1u };

		if (centralPair && i == j)
		  {
		    const double h = chosen[i].step * shrink;
		    const std::size_t up = plan.add({ { i, 2.0 * h } });
		    const std::size_t down = plan.add({ { i, -2.0 * h } });
		    const double a = offset(up, i);
		    const double b = -offset(down, i);
		    p.terms = { { up, 2.0 / (a * (a + b)) },
				{ base, -2.0 / (a * b) },
				{ down, 2.0 / (b * (a + b)) } };
		  }
		else if (centralPair)
		  {
		    const double hi = chosen[i].step * shrink;
		    const double hj = chosen[j].step * shrink;
		    const std::size_t pp = plan.add({ { i, hi }, { j, hj } });
		    const std::size_t pm = plan.add({ { i, hi }, { j, -hj } });
		    const std::size_t mp = plan.add({ { i, -hi }, { j, hj } });
		    const std::size_t mm = plan.add({ { i, -hi }, { j, -hj } });
		    const double w = 1.0 / ((offset(pp, i) - offset(mp, i)) * (offset(pp, j) - offset(pm, j)));
		    p.terms = { { pp, w }, { pm, -w }, { mp, -w }, { mm, w } };
		  }
		else if (i == j)
		  {
		    const double di = delta[i] * shrink;
		    const std::size_t two = plan.add({ { i, 2.0 * di } });
		    const std::size_t one = plan.add({ { i, di } });
		    const double e1 = offset(one, i);
		    const double e2 = offset(two, i);
		    p.terms = { { two, 2.0 / (e2 * (e2 - e1)) },
				{ one, -2.0 / (e1 * (e2 - e1)) },
				{ base, 2.0 / (e1 * e2) } };
		  }
		else
		  {
		    const double di = delta[i] * shrink;
		    const double dj = delta[j] * shrink;
		    const std::size_t both = plan.add({ { i, di }, { j, dj } });
		    const std::size_t onlyI = plan.add({ { i, di } });
		    const std::size_t onlyJ = plan.add({ { j, dj } });
		    const double w = 1.0 / (offset(onlyI, i) * offset(onlyJ, j));
		    p.terms = { { both, w }, { onlyI, -w }, { onlyJ, -w }, { base, w } };
		  }

		pairs[s].push_back(std::move(p));
	      }
	}

      Evaluations ev = evaluatePlan(func, flat.spec, plan, options);
      if (ev.outputSpec.totalDim() != 1)
	throw TreeStructureError("secondDerivative: the function must return a single number but returned "
				 + std::to_string(ev.outputSpec.totalDim()) + " values");

      Matrix hessian(d, d);
      std::vector<double> estimates(nSteps);
      for (std::size_t q = 0; q < pairs[0].size(); ++q)
	{
	  for (std::size_t s = 0; s < nSteps; ++s)
	    {
	      double sum = 0.0;
	      for (const Term& t : pairs[s][q].terms)
		sum += t.coefficient * ev.flatOutputs[t.point][0];
	      estimates[s] = sum;
	    }

	  const PairStencil& p = pairs[0][q];
	  const double value = richardsonExtrapolate(estimates, options.stepRatio, p.errorOrder);
	  hessian(p.i, p.j) = value;
	  hessian(p.j, p.i) = value;
	}

      std::vector<double> steps(d);
      std::vector<Stencil> used(d);
      for (std::size_t i = 0; i < d; ++i)
	{
	  steps[i] = chosen[i].step;
	  used[i]  = chosen[i].stencil;
	}

      ParamTree derivative = tree::outerProductStructure(flat.spec, flat.spec).toTree(hessian);

      const std::size_t numEvaluations = ev.numEvaluated();
      notify(options, diagnostics::DerivativeOrder::Second, method, d, 1, numEvaluations,
	     countFallbacks(used, requested), steps, ev.numWorkers);

      std::vector<FunctionEvaluation> values = collectFunctionValues(options, flat.spec, plan, ev);
      ParamTree baseValue = ev.outputs[base];

      return DerivativeResult(std::move(derivative), std::move(hessian), std::move(steps),
			      std::move(used), numEvaluations, std::move(baseValue),
			      std::move(values));
    }
  }
}
