#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/mean.hpp>
#include <boost/accumulators/statistics/variance.hpp>
#include <boost/accumulators/statistics/count.hpp>

namespace treestat
{
  namespace statistics
  {
    // Scale factor making the MAD a consistent estimator of the normal sigma.
    constexpr double MAD_NORMAL_SCALE = 1.4826;

    struct SampleMoments
    {
      std::size_t count;
      double      mean;
      double      stdDev;   // ddof = 1; NaN when count < 2
    };

    inline SampleMoments sampleMoments(const std::vector<double>& values)
    {
      using namespace boost::accumulators;

      accumulator_set<double, stats<tag::count, tag::mean, tag::variance>> acc;
      for (double v : values)
	acc(v);

      const std::size_t n = count(acc);
      if (n == 0)
	throw std::invalid_argument("sampleMoments: empty input");

      // boost's variance divides by n
      const double sd = (n < 2)
	? std::nan("")
	: std::sqrt(variance(acc) * static_cast<double>(n) / static_cast<double>(n - 1));

      return SampleMoments{ n, mean(acc), sd };
    }

    /**
     * @brief Hyndman-Fan type 7 quantile (the R and NumPy default).
     *
     * h = (n-1)p + 1, result = x[floor(h)] + (h - floor(h)) (x[floor(h)+1] - x[floor(h)])
     * on the 1-based order statistics. Two nth_element passes, input untouched.
     * p <= 0 gives the minimum and p >= 1 the maximum.
     */
    inline double quantileType7(const std::vector<double>& s, double p)
    {
      if (s.empty())
	throw std::invalid_argument("quantileType7: empty input");
      if (s.size() == 1)
	return s.front();
      if (p <= 0.0)
	return *std::min_element(s.begin(), s.end());
      if (p >= 1.0)
	return *std::max_element(s.begin(), s.end());

      const double nd = static_cast<double>(s.size());
      const double h  = (nd - 1.0) * p + 1.0;
      std::size_t  i1 = static_cast<std::size_t>(std::floor(h));
      if (i1 < 1)         i1 = 1;
      if (i1 >= s.size()) i1 = s.size() - 1;
      const double frac = h - static_cast<double>(i1);

      std::vector<double> w(s.begin(), s.end());
      std::nth_element(w.begin(), w.begin() + static_cast<std::ptrdiff_t>(i1 - 1), w.end());
      const double x0 = w[i1 - 1];

      // Everything after position i1-1 is >= x0, so the next order statistic
      // is the minimum of that tail.
      const double x1 = *std::min_element(w.begin() + static_cast<std::ptrdiff_t>(i1), w.end());

      return x0 + (x1 - x0) * frac;
    }

    inline double median(const std::vector<double>& s)
    {
      return quantileType7(s, 0.5);
    }

    // Median absolute deviation from the median (unscaled).
    inline double medianAbsoluteDeviation(const std::vector<double>& s)
    {
      const double m = median(s);

      std::vector<double> dev;
      dev.reserve(s.size());
      for (double v : s)
	dev.push_back(std::fabs(v - m));

      return median(dev);
    }

    inline double robustStdDev(const std::vector<double>& s)
    {
      return MAD_NORMAL_SCALE * medianAbsoluteDeviation(s);
    }
  }
}
