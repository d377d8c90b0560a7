#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <type_traits>
#include <utility>
#include <vector>

#include "pcg_random.hpp"
#include "randutils.hpp"

namespace psepower
{
  namespace rng_utils
  {
    /// Engine used for every simulated replication.
    using SimulationRng = randutils::random_generator<pcg32>;

    // --- Detection: does Rng have .engine()? (randutils::random_generator does) ---
    template <typename T, typename = void>
    struct has_engine_method : std::false_type {};

    template <typename T>
    struct has_engine_method<T, std::void_t<decltype(std::declval<T&>().engine())>> : std::true_type {};

    // Underlying URBG, whether the caller passed a randutils wrapper or a bare engine.
    template <typename Rng>
    inline auto& get_engine(Rng& rng)
    {
      if constexpr (has_engine_method<Rng>::value)
	return rng.engine();
      else
	return rng;
    }

    /**
     * @brief Random index in [0, hiExclusive).
     * @pre hiExclusive > 0 (returns 0 otherwise)
     */
    template <typename Rng>
    inline std::size_t get_random_index(Rng& rng, std::size_t hiExclusive)
    {
      if (hiExclusive == 0)
	return 0;

      std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
      return dist(get_engine(rng));
    }

    template <typename Rng>
    inline double get_random_uniform_01(Rng& rng)
    {
      std::uniform_real_distribution<double> dist(0.0, 1.0);
      return dist(get_engine(rng));
    }

    /**
     * @brief Bernoulli(p) draw. p outside [0,1] is clamped.
     *
     * One uniform is consumed for every call with 0 < p < 1, none otherwise.
     */
    template <typename Rng>
    inline bool bernoulli(Rng& rng, double p)
    {
      if (p <= 0.0)
	return false;
      if (p >= 1.0)
	return true;
      return get_random_uniform_01(rng) < p;
    }

    // N(mean, sd^2). sd == 0 returns mean without consuming the stream.
    template <typename Rng>
    inline double draw_normal(Rng& rng, double mean, double sd)
    {
      if (sd == 0.0)
	return mean;

      std::normal_distribution<double> dist(mean, sd);
      return dist(get_engine(rng));
    }

    // Simple 64-bit splitmix hash (deterministic, good avalanche)
    inline uint64_t splitmix64(uint64_t x)
    {
      x += 0x9e3779b97f4a7c15ull;
      x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
      x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
      return x ^ (x >> 31);
    }

    inline uint64_t hash_combine64(std::initializer_list<uint64_t> parts)
    {
      uint64_t h = 0x6a09e667f3bcc909ull;
      for (auto v : parts)
	h = splitmix64(h ^ v);
      return h;
    }

    /**
     * @brief Derives one independent seed per replication from a run seed.
     *
     * seed(r) = hash(runSeed, tags..., r). The derived value depends only on
     * the run seed, the tags and the replication index, never on which worker
     * thread runs the replication or in what order.
     */
    class ReplicationSeeder
    {
    public:
      explicit ReplicationSeeder(uint64_t runSeed, std::vector<uint64_t> tags = {})
	: m_runSeed(runSeed),
	  m_tags(std::move(tags))
      {}

      ReplicationSeeder with_tag(uint64_t tag) const
      {
	auto t = m_tags;
	t.push_back(tag);
	return ReplicationSeeder(m_runSeed, std::move(t));
      }

      uint64_t make_seed_for(std::size_t replication) const
      {
	uint64_t h = m_runSeed;
	for (auto v : m_tags)
	  h = hash_combine64({h, v});
	return hash_combine64({h, static_cast<uint64_t>(replication)});
      }

      uint64_t runSeed() const noexcept
      {
	return m_runSeed;
      }

    private:
      uint64_t m_runSeed;
      std::vector<uint64_t> m_tags;
    };

    // Seeds a randutils generator deterministically from a 64-bit value.
    inline void seed_u64(SimulationRng& rng, uint64_t seed)
    {
      std::array<uint32_t, 2> seed_data =
	{
	  static_cast<uint32_t>(seed),
	  static_cast<uint32_t>(seed >> 32)
	};

      randutils::seed_seq_fe128 seq(seed_data.begin(), seed_data.end());
      rng.seed(seq);
    }

    inline SimulationRng make_replication_rng(const ReplicationSeeder& seeder, std::size_t replication)
    {
      SimulationRng rng;
      seed_u64(rng, seeder.make_seed_for(replication));
      return rng;
    }

    // Fresh run seed from system entropy, for runs started without --seed.
    inline uint64_t make_entropy_seed()
    {
      randutils::auto_seed_128 entropy;
      std::array<uint32_t, 2> words{};
      entropy.generate(words.begin(), words.end());
      return (static_cast<uint64_t>(words[1]) << 32) | words[0];
    }
  } // namespace rng_utils
} // namespace psepower
