#pragma once
/**
 * @file uid_utils.hpp
 * @brief Identity tokens for safeframe host sessions.
 *
 * ## Token format
 *
 * A token is a double in [0, 1), matching the numeric identities a safeframe
 * creative expects in the `i` envelope field and the `uid` payload field.
 *
 * Properties:
 *   - Practically unique per page load: 53 bits of randomness per token
 *   - Not a security boundary: tokens only let the creative recognise its host
 *
 * Sessions take a TokenSource by reference so tests can inject fixed values.
 */

#include <chrono>
#include <cstdint>
#include <exception>
#include <random>

namespace sfhost::uid
{

namespace detail
{

/// Returns a 64-bit seed.
/// Prefers std::random_device; falls back to a high-res-clock+Knuth hash when it
/// reports no entropy or throws.
inline uint64_t random_seed()
{
    try
    {
        std::random_device rd;
        if (rd.entropy() > 0.0)
        {
            return (static_cast<uint64_t>(rd()) << 32U) ^ rd();
        }
    }
    catch (const std::exception &)
    {
        // fall through to the clock-based seed
    }
    const auto ns = static_cast<uint64_t>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());
    // Knuth multiplicative hash step (good avalanche)
    return (ns ^ (ns >> 17U)) * 2654435761ULL;
}

} // namespace detail

/**
 * @class TokenSource
 * @brief Source of numeric identity tokens.
 */
class TokenSource
{
  public:
    virtual ~TokenSource() = default;

    /// Returns the next token, a value in [0, 1).
    virtual double next_token() = 0;
};

/**
 * @class RandomTokenSource
 * @brief Production token source backed by a seeded 64-bit Mersenne Twister.
 */
class RandomTokenSource final : public TokenSource
{
  public:
    RandomTokenSource() : m_engine(detail::random_seed()) {}
    explicit RandomTokenSource(uint64_t seed) : m_engine(seed) {}

    double next_token() override { return m_dist(m_engine); }

  private:
    std::mt19937_64 m_engine;
    std::uniform_real_distribution<double> m_dist{0.0, 1.0};
};

} // namespace sfhost::uid
