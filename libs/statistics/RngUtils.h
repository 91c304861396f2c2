#pragma once

#include <cstdint>
#include <cstddef>
#include <type_traits>
#include <random>
#include <string>
#include <vector>
#include <initializer_list>

namespace labormodel
{
  namespace rng_utils
  {

    // --- Detection: does Rng have .engine()? (e.g., randutils::random_generator) ---
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Return a reference to the underlying engine, whether wrapped or direct.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    /**
     * @brief Get a random double in [0, 1).
     */
    template <typename Rng>
    inline double get_random_uniform_01(Rng& rng)
    {
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      return dist(get_engine(rng));
    }

    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x) {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    // Combine several 64-bit values into one seed
    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts) {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts) h = splitmix64(h ^ v);
      return h;
    }

    /**
     * @brief FNV-1a over the bytes of a string.
     *
     * Metro area codes are strings; std::hash<std::string> is not stable
     * across standard library implementations, so seeds derived from it would
     * not reproduce between builds.
     */
    inline uint64_t stable_string_hash64(const std::string& s) noexcept
    {
      uint64_t h = 0xcbf29ce484222325ull;
      for (unsigned char c : s)
	{
	  h ^= static_cast<uint64_t>(c);
	  h *= 0x100000001b3ull;
	}
      return h;
    }

    // Master seed plus an immutable list of 64-bit tags. The tags carry no
    // meaning here; callers decide what they encode.
    class CRNKey
    {
    public:
      CRNKey(uint64_t masterSeed, std::vector<uint64_t> tags = {})
	: m_masterSeed(masterSeed), m_tags(std::move(tags))
      {}

      CRNKey with_tags(std::initializer_list<uint64_t> tags) const
      {
	auto t = m_tags; t.insert(t.end(), tags.begin(), tags.end());
	return CRNKey(m_masterSeed, std::move(t));
      }

      uint64_t masterSeed() const noexcept
      {
	return m_masterSeed;
      }

      const std::vector<uint64_t>& tags() const noexcept
      {
	return m_tags;
      }

      // Derive a 64-bit seed for a given replicate index (replicate is just another tag)
      uint64_t make_seed_for(std::size_t replicate) const
      {
	uint64_t h = m_masterSeed;
	for (auto v : m_tags) h = hash_combine64({h, v});
	h = hash_combine64({h, static_cast<uint64_t>(replicate)});
	return h;
      }

    private:
      uint64_t m_masterSeed;
      std::vector<uint64_t> m_tags;
    };

    /**
     * @brief Seed for one (metro area, canonical role) cell.
     *
     * Depends only on the master seed and the cell identity, never on the
     * order in which cells are scheduled, so a batch run on N threads draws
     * the same samples as a sequential one.
     */
    inline uint64_t make_cell_seed(uint64_t masterSeed,
				   const std::string& metroAreaId,
				   int canonicalRoleId)
    {
      return CRNKey(masterSeed)
	.with_tags({stable_string_hash64(metroAreaId),
		    static_cast<uint64_t>(static_cast<int64_t>(canonicalRoleId))})
	.make_seed_for(0);
    }
  } // namespace rng_utils
} // namespace labormodel
