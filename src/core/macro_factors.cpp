#include "macro_factors.hpp"
#include "utils.hpp"

namespace exchange_sim {

const char* to_string(MacroFactor f) {
    switch (f) {
        case MacroFactor::RISK_ON: return "risk_on";
        case MacroFactor::USD: return "usd";
        case MacroFactor::RATES: return "rates";
        case MacroFactor::ENERGY: return "energy";
        case MacroFactor::METALS: return "metals";
        case MacroFactor::CRYPTO: return "crypto";
        case MacroFactor::VOL: return "vol";
    }
    return "unknown";
}

MacroFactorProcess::MacroFactorProcess() {
    //                                   persistence noise   jump_p  jump_sz clamp
    params_[idx(MacroFactor::RISK_ON)] = {0.985,      0.0009, 0.004,  0.004,  0.020};
    params_[idx(MacroFactor::USD)]     = {0.990,      0.0005, 0.003,  0.0025, 0.012};
    params_[idx(MacroFactor::RATES)]   = {0.992,      0.0004, 0.003,  0.002,  0.010};
    params_[idx(MacroFactor::ENERGY)]  = {0.980,      0.0011, 0.006,  0.006,  0.025};
    params_[idx(MacroFactor::METALS)]  = {0.985,      0.0008, 0.004,  0.004,  0.018};
    params_[idx(MacroFactor::CRYPTO)]  = {0.975,      0.0016, 0.008,  0.009,  0.035};
    params_[idx(MacroFactor::VOL)]     = {0.970,      0.0012, 0.006,  0.007,  0.030};
}

const FactorVector& MacroFactorProcess::step(std::mt19937_64& rng, const SessionFlags& session) {
    std::normal_distribution<double> normal(0.0, 1.0);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    for (size_t i = 0; i < kFactorCount; ++i) {
        const auto& p = params_[i];
        double next = values_[i] * p.persistence + normal(rng) * p.noise_scale;
        if (unit(rng) < p.jump_prob) {
            next += normal(rng) * p.jump_scale;
        }
        values_[i] = next;
    }
    clamp_all(values_);
    apply_spillovers();
    clamp_all(values_);
    effective_ = values_;
    apply_session(session);
    clamp_all(effective_);
    return effective_;
}

void MacroFactorProcess::apply_spillovers() {
    double risk_on = values_[idx(MacroFactor::RISK_ON)];
    double usd = values_[idx(MacroFactor::USD)];
    values_[idx(MacroFactor::CRYPTO)] += risk_on * 0.035;
    values_[idx(MacroFactor::ENERGY)] += usd * -0.02;
    values_[idx(MacroFactor::METALS)] += usd * -0.02;
    values_[idx(MacroFactor::VOL)] += risk_on * -0.04;
}

void MacroFactorProcess::apply_session(const SessionFlags& session) {
    if (session.us_hours) {
        effective_[idx(MacroFactor::RISK_ON)] *= 1.25;
        effective_[idx(MacroFactor::VOL)] *= 1.2;
    }
    if (session.london_overlap) {
        effective_[idx(MacroFactor::USD)] *= 1.2;
        effective_[idx(MacroFactor::RATES)] *= 1.15;
    }
}

void MacroFactorProcess::clamp_all(FactorVector& v) const {
    for (size_t i = 0; i < kFactorCount; ++i) {
        double c = params_[i].clamp_abs;
        v[i] = utils::clamp(v[i], -c, c);
    }
}

double MacroFactorProcess::dot(const FactorVector& loadings, const FactorVector& factors) {
    double sum = 0.0;
    for (size_t i = 0; i < kFactorCount; ++i) sum += loadings[i] * factors[i];
    return sum;
}

} // namespace exchange_sim
