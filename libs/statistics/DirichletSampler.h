#pragma once

#include <cmath>
#include <cstddef>
#include <algorithm>
#include <random>
#include <stdexcept>
#include <vector>
#include "RngUtils.h"

namespace labormodel
{
  namespace stats
  {
    /**
     * @brief Draws probability vectors from Dirichlet(alpha).
     *
     * Uses the gamma representation: X_i ~ Gamma(alpha_i, 1), p_i = X_i / sum(X).
     * Each draw lies on the simplex (non-negative, sums to one within
     * floating point error).
     *
     * With very small concentrations every gamma variate can underflow to
     * zero at once. That draw is replaced by a single vertex of the simplex
     * picked with probability alpha_i / sum(alpha), which is the limiting
     * distribution of the Dirichlet as all alpha_i shrink together.
     */
    class DirichletSampler
    {
    public:
      explicit DirichletSampler(std::vector<double> alpha)
	: mAlpha(std::move(alpha)),
	  mAlphaSum(0.0)
      {
	if (mAlpha.empty())
	  throw std::invalid_argument("DirichletSampler: concentration vector is empty");

	for (double a : mAlpha)
	  {
	    if (!(a > 0.0) || !std::isfinite(a))
	      throw std::invalid_argument("DirichletSampler: concentration parameters must be positive and finite");
	    mAlphaSum += a;
	  }

	mGammas.reserve(mAlpha.size());
	for (double a : mAlpha)
	  mGammas.emplace_back(a, 1.0);
      }

      /**
       * @brief E[p_i] = alpha_i / sum(alpha).
       */
      std::vector<double> expectedShares() const
      {
	std::vector<double> shares(mAlpha.size());
	for (std::size_t i = 0; i < mAlpha.size(); ++i)
	  shares[i] = mAlpha[i] / mAlphaSum;
	return shares;
      }

      template <typename Rng>
      std::vector<double> sample(Rng& rng)
      {
	auto& eng = rng_utils::get_engine(rng);

	std::vector<double> draw(mAlpha.size());
	double total = 0.0;
	for (std::size_t i = 0; i < mGammas.size(); ++i)
	  {
	    draw[i] = mGammas[i](eng);
	    total += draw[i];
	  }

	if (total > 0.0 && std::isfinite(total))
	  {
	    for (double& x : draw)
	      x /= total;
	    return draw;
	  }

	std::fill(draw.begin(), draw.end(), 0.0);
	const double u = rng_utils::get_random_uniform_01(rng) * mAlphaSum;
	double cumulative = 0.0;
	std::size_t chosen = mAlpha.size() - 1;
	for (std::size_t i = 0; i < mAlpha.size(); ++i)
	  {
	    cumulative += mAlpha[i];
	    if (u < cumulative)
	      {
		chosen = i;
		break;
	      }
	  }
	draw[chosen] = 1.0;
	return draw;
      }

    private:
      std::vector<double> mAlpha;
      double mAlphaSum;
      std::vector<std::gamma_distribution<double>> mGammas;
    };
  }
}
