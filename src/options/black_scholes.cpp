// src/options/black_scholes.cpp

#include "histshard/options/black_scholes.hpp"
#include <algorithm>
#include <cmath>
#include <string>

namespace histshard {

namespace {
// Constants for numerical calculations
constexpr double SQRT_2PI = 2.506628274631000502415765284811045253006;
constexpr int MAX_ITERATIONS = 100;
constexpr double PRICE_EPSILON = 1e-10;
constexpr double DAYS_PER_YEAR = 365.0;

// Standard normal cumulative distribution function
double norm_cdf(double x) {
    return 0.5 * (1.0 + std::erf(x / std::sqrt(2.0)));
}

// Standard normal probability density function
double norm_pdf(double x) {
    return std::exp(-0.5 * x * x) / SQRT_2PI;
}

struct D1D2 {
    double d1;
    double d2;
};

D1D2 compute_d(double spot, double strike, double years, double volatility, double rate) {
    double sqrt_t = std::sqrt(years);
    double d1 = (std::log(spot / strike) + (rate + 0.5 * volatility * volatility) * years) /
                (volatility * sqrt_t);
    return {d1, d1 - volatility * sqrt_t};
}

}  // anonymous namespace

double BlackScholes::year_fraction(int64_t days_to_expiry) {
    if (days_to_expiry <= 0) {
        return 1.0 / DAYS_PER_YEAR;
    }
    return static_cast<double>(days_to_expiry) / DAYS_PER_YEAR;
}

double BlackScholes::intrinsic_value(OptionType type, double spot, double strike) {
    if (type == OptionType::CALL) {
        return std::max(spot - strike, 0.0);
    }
    return std::max(strike - spot, 0.0);
}

double BlackScholes::price(OptionType type, double spot, double strike, double years,
                           double volatility, double rate) {
    if (years <= 0.0 || volatility <= 0.0) {
        return intrinsic_value(type, spot, strike);
    }

    auto d = compute_d(spot, strike, years, volatility, rate);
    double discount = std::exp(-rate * years);

    if (type == OptionType::CALL) {
        return spot * norm_cdf(d.d1) - strike * discount * norm_cdf(d.d2);
    }
    return strike * discount * norm_cdf(-d.d2) - spot * norm_cdf(-d.d1);
}

Greeks BlackScholes::greeks(OptionType type, double spot, double strike, double years,
                            double volatility, double rate) {
    Greeks greeks;
    greeks.implied_volatility = volatility;
    greeks.reference_price = spot;

    if (years <= 0.0 || volatility <= 0.0 || spot <= 0.0 || strike <= 0.0) {
        return greeks;
    }

    double sqrt_t = std::sqrt(years);
    auto d = compute_d(spot, strike, years, volatility, rate);
    double discount = std::exp(-rate * years);
    double pdf_d1 = norm_pdf(d.d1);

    double annual_theta;
    if (type == OptionType::CALL) {
        greeks.delta = norm_cdf(d.d1);
        annual_theta = (-spot * volatility * pdf_d1) / (2 * sqrt_t) -
                       rate * strike * discount * norm_cdf(d.d2);
        greeks.rho = strike * years * discount * norm_cdf(d.d2) / 100.0;
    } else {
        greeks.delta = norm_cdf(d.d1) - 1.0;
        annual_theta = (-spot * volatility * pdf_d1) / (2 * sqrt_t) +
                       rate * strike * discount * norm_cdf(-d.d2);
        greeks.rho = -strike * years * discount * norm_cdf(-d.d2) / 100.0;
    }

    greeks.gamma = pdf_d1 / (spot * volatility * sqrt_t);
    greeks.theta = annual_theta / DAYS_PER_YEAR;
    greeks.vega = spot * sqrt_t * pdf_d1 / 100.0;
    greeks.model_price = price(type, spot, strike, years, volatility, rate);
    return greeks;
}

Result<double> BlackScholes::implied_volatility(OptionType type, double target_price,
                                                double spot, double strike, double years,
                                                double rate, double tolerance) {
    if (!(target_price > 0.0) || spot <= 0.0 || strike <= 0.0 || years <= 0.0) {
        return make_error<double>(ErrorCode::IV_CONVERGENCE_FAILED,
                                  "Implied volatility undefined for non-positive inputs",
                                  "BlackScholes");
    }

    double low = MIN_VOLATILITY;
    double high = MAX_VOLATILITY;
    double price_low = price(type, spot, strike, years, low, rate);
    double price_high = price(type, spot, strike, years, high, rate);

    // Price is monotone in volatility; a target outside the bracket has no solution
    if (target_price < price_low - PRICE_EPSILON || target_price > price_high + PRICE_EPSILON) {
        return make_error<double>(ErrorCode::IV_CONVERGENCE_FAILED,
                                  "Price " + std::to_string(target_price) +
                                      " outside model bounds [" + std::to_string(price_low) +
                                      ", " + std::to_string(price_high) + "]",
                                  "BlackScholes");
    }

    double vol = 0.2;
    for (int i = 0; i < MAX_ITERATIONS; ++i) {
        double diff = price(type, spot, strike, years, vol, rate) - target_price;

        if (std::abs(diff) < PRICE_EPSILON) {
            return Result<double>(vol);
        }

        if (diff > 0.0) {
            high = vol;
        } else {
            low = vol;
        }

        if (high - low < tolerance) {
            return Result<double>(0.5 * (low + high));
        }

        double vega = spot * std::sqrt(years) * norm_pdf(compute_d(spot, strike, years, vol, rate).d1);
        double next = vega > PRICE_EPSILON ? vol - diff / vega : 0.5 * (low + high);
        if (!(next > low && next < high)) {
            next = 0.5 * (low + high);
        }

        if (std::abs(next - vol) < tolerance * 0.5) {
            return Result<double>(next);
        }
        vol = next;
    }

    return make_error<double>(ErrorCode::IV_CONVERGENCE_FAILED,
                              "Implied volatility did not converge after " +
                                  std::to_string(MAX_ITERATIONS) + " iterations",
                              "BlackScholes");
}

}  // namespace histshard
