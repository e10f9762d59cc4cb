// include/histshard/options/black_scholes.hpp
#pragma once

#include <cstdint>
#include "histshard/core/error.hpp"
#include "histshard/options/option_contract.hpp"

namespace histshard {

/**
 * @brief Closed-form European option pricing (Black-Scholes, no dividends)
 */
class BlackScholes {
public:
    static constexpr double MIN_VOLATILITY = 1e-4;
    static constexpr double MAX_VOLATILITY = 5.0;
    static constexpr double DEFAULT_IV_TOLERANCE = 1e-6;

    /**
     * @brief Time to expiry in years, floored at one day
     * @param days_to_expiry Calendar days until expiration
     * @return days / 365, or 1 / 365 when days_to_expiry <= 0
     */
    static double year_fraction(int64_t days_to_expiry);

    /**
     * @brief Intrinsic value: max(S - K, 0) for calls, max(K - S, 0) for puts
     */
    static double intrinsic_value(OptionType type, double spot, double strike);

    /**
     * @brief Theoretical option price
     * @param type Call or put
     * @param spot Underlying price
     * @param strike Strike price
     * @param years Time to expiry in years
     * @param volatility Annualized volatility
     * @param rate Continuously compounded risk-free rate
     */
    static double price(OptionType type, double spot, double strike, double years,
                        double volatility, double rate);

    /**
     * @brief Sensitivities at the given volatility
     * @return Greeks with theta per day, vega and rho per 1% move
     */
    static Greeks greeks(OptionType type, double spot, double strike, double years,
                         double volatility, double rate);

    /**
     * @brief Invert the model for volatility
     *
     * Newton steps on vega, falling back to bisection whenever a step leaves the
     * current bracket, within [MIN_VOLATILITY, MAX_VOLATILITY].
     *
     * @param target_price Observed option price
     * @param tolerance Absolute volatility tolerance
     * @return Implied volatility or IV_CONVERGENCE_FAILED
     */
    static Result<double> implied_volatility(OptionType type, double target_price, double spot,
                                             double strike, double years, double rate,
                                             double tolerance = DEFAULT_IV_TOLERANCE);
};

}  // namespace histshard
