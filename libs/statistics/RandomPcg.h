#pragma once

#include "pcg_random.hpp"
#include "randutils.hpp"
#include <array>
#include <cstdint>

namespace labormodel
{
  namespace stats
  {
    /**
     * @brief PCG32 generator behind the randutils front end.
     *
     * Always seeded from an explicit 64-bit value so that every Monte Carlo
     * draw in an inference run can be reproduced from the run's master seed.
     * Not thread safe; each labor-market cell owns its own instance.
     */
    class RandomPcg
    {
    public:
      using Engine = pcg32;

      explicit RandomPcg(uint64_t seed)
      {
	seed_u64(seed);
      }

      void seed_u64(uint64_t seed)
      {
	std::array<uint32_t, 2> seed_data =
	  {
	    static_cast<uint32_t>(seed),
	    static_cast<uint32_t>(seed >> 32)
	  };

	randutils::seed_seq_fe128 seq(seed_data.begin(), seed_data.end());
	mRandGen.seed(seq);
      }

      double uniform01()
      {
	return mRandGen.uniform(0.0, 1.0);
      }

      Engine& engine()
      {
	return mRandGen.engine();
      }

    private:
      randutils::random_generator<pcg32> mRandGen;
    };
  }
}
