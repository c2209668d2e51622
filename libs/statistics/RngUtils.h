#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>

namespace treestat
{
  namespace statistics
  {
    namespace rng_utils
    {
      using Engine = std::mt19937_64;

      // Simple 64-bit splitmix hash (deterministic, good avalanche)
      inline std::uint64_t splitmix64(std::uint64_t x)
      {
	x += 0x9e3779b97f4a7c15ull;
	x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ull;
	x = (x ^ (x >> 27)) * 0x94d049bb133111ebull;
	return x ^ (x >> 31);
      }

      // Combine several 64-bit values into one seed
      inline std::uint64_t hashCombine64(std::initializer_list<std::uint64_t> parts)
      {
	std::uint64_t h = 0x6a09e667f3bcc909ull;
	for (auto v : parts)
	  h = splitmix64(h ^ v);
	return h;
      }

      /**
       * @brief Expand a 64-bit seed into an eight word std::seed_seq.
       *
       * Nearby seeds (1, 2, 3...) produce unrelated engine states because
       * each word passes through a differently offset splitmix64 round.
       */
      inline std::seed_seq makeSeedSeq(std::uint64_t seed64)
      {
	const std::uint64_t s0 = seed64;
	const std::uint64_t s1 = splitmix64(s0);
	const std::uint64_t s2 = splitmix64(s0 ^ 0x9e3779b97f4a7c15ull);
	const std::uint64_t s3 = splitmix64(s0 + 0xd1342543de82ef95ull);
	const std::uint64_t s4 = splitmix64(s1 ^ 0x94d049bb133111ebull);
	const std::uint64_t s5 = splitmix64(s2 + 0xbf58476d1ce4e5b9ull);
	const std::uint64_t s6 = splitmix64(s3 ^ 0x6a09e667f3bcc909ull);
	const std::uint64_t s7 = splitmix64(s4 + 0x243f6a8885a308d3ull);

	const std::uint64_t mix = (s3 ^ s5 ^ s6 ^ s7);

	std::array<std::uint32_t, 8> words = {
	  static_cast<std::uint32_t>(s0), static_cast<std::uint32_t>(s0 >> 32),
	  static_cast<std::uint32_t>(s1), static_cast<std::uint32_t>(s1 >> 32),
	  static_cast<std::uint32_t>(s2), static_cast<std::uint32_t>(s2 >> 32),
	  static_cast<std::uint32_t>(mix), static_cast<std::uint32_t>(mix >> 32)
	};

	return std::seed_seq(words.begin(), words.end());
      }

      inline Engine makeEngine(std::uint64_t seed64)
      {
	std::seed_seq sseq = makeSeedSeq(seed64);
	return Engine(sseq);
      }

      // Fresh nondeterministic seed, used when the caller does not supply one.
      inline std::uint64_t randomSeed()
      {
	std::random_device rd;
	const std::uint64_t hi = static_cast<std::uint64_t>(rd());
	const std::uint64_t lo = static_cast<std::uint64_t>(rd());
	return hashCombine64({ hi, lo });
      }

      /**
       * @brief Random index in [0, hiExclusive).
       *
       * Uses std::uniform_int_distribution on the engine to avoid modulo bias.
       *
       * @pre hiExclusive > 0
       */
      template <typename Rng>
      inline std::size_t getRandomIndex(Rng& rng, std::size_t hiExclusive)
      {
	if (hiExclusive == 0)
	  return 0;

	std::uniform_int_distribution<std::size_t> dist(0, hiExclusive - 1);
	return dist(rng);
      }
    } // namespace rng_utils
  } // namespace statistics
} // namespace treestat
