#pragma once

#include <array>
#include <cstddef>
#include <random>
#include "market_clock.hpp"

namespace exchange_sim {

enum class MacroFactor : size_t { RISK_ON = 0, USD, RATES, ENERGY, METALS, CRYPTO, VOL };

constexpr size_t kFactorCount = 7;
using FactorVector = std::array<double, kFactorCount>;

inline constexpr size_t idx(MacroFactor f) { return static_cast<size_t>(f); }

const char* to_string(MacroFactor f);

/**
 * AR(1) parameters of one latent factor.
 */
struct FactorParams {
    double persistence;
    double noise_scale;
    double jump_prob;
    double jump_scale;
    double clamp_abs;
};

/**
 * Shared latent macro factors, evolved once per tick and read by every
 * instrument's return equation through its loading vector.
 *
 * f' = clamp(f * persistence + N(0,1) * noise + jump, +/-clamp_abs)
 *
 * Deterministic spillovers run after the independent step. Session hours
 * scale risk-on/vol (US hours) and usd/rates (London overlap) in the
 * returned view only; the AR(1) state itself is never rescaled.
 */
class MacroFactorProcess {
public:
    MacroFactorProcess();

    const FactorVector& step(std::mt19937_64& rng, const SessionFlags& session);

    const FactorVector& values() const { return effective_; }
    const FactorVector& state() const { return values_; }
    void set_state(const FactorVector& v) { values_ = v; effective_ = v; }
    const FactorParams& params(MacroFactor f) const { return params_[idx(f)]; }

    static double dot(const FactorVector& loadings, const FactorVector& factors);

private:
    void apply_spillovers();
    void apply_session(const SessionFlags& session);
    void clamp_all(FactorVector& v) const;

    std::array<FactorParams, kFactorCount> params_;
    FactorVector values_{};
    FactorVector effective_{};
};

} // namespace exchange_sim
