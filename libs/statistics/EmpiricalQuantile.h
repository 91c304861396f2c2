#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <vector>

namespace labormodel
{
  namespace stats
  {
    /**
     * @brief Hyndman-Fan type-7 quantile of an already sorted sample.
     *
     * Linear interpolation between order statistics at h = (n - 1) * p, the
     * same convention as R's default and numpy.percentile. Works for any
     * arithmetic element type; the result is always a double.
     *
     * @throws std::invalid_argument on an empty sample.
     */
    template <typename T>
    double quantileOnSorted(const std::vector<T>& sorted, double p)
    {
      if (sorted.empty())
	throw std::invalid_argument("quantileOnSorted: empty sample");

      if (p <= 0.0)
	return static_cast<double>(sorted.front());
      if (p >= 1.0)
	return static_cast<double>(sorted.back());

      const double h = p * static_cast<double>(sorted.size() - 1);
      const std::size_t i0 = static_cast<std::size_t>(std::floor(h));
      const std::size_t i1 = std::min(i0 + 1, sorted.size() - 1);
      const double w = h - static_cast<double>(i0);

      const double v0 = static_cast<double>(sorted[i0]);
      const double v1 = static_cast<double>(sorted[i1]);
      return v0 + (v1 - v0) * w;
    }

    // Unsorted convenience overload; takes a copy.
    template <typename T>
    double quantile(std::vector<T> sample, double p)
    {
      std::sort(sample.begin(), sample.end());
      return quantileOnSorted(sample, p);
    }
  }
}
