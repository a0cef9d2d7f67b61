#include "volatility_model.hpp"
#include "errors.hpp"
#include "../models/black_scholes.hpp"
#include "../utils/statistics.hpp"
#include <cmath>
#include <limits>

namespace optval {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kTwoPi = 6.283185307179586;

constexpr double kAlphaMin = 0.01;
constexpr double kAlphaMax = 0.30;
constexpr double kBetaMin = 0.50;
constexpr double kBetaMax = 0.98;
constexpr double kGridStep = 0.01;
constexpr double kMaxPersistence = 0.999;

} // namespace

PriceHistory VolatilityModel::buildHistory(const std::string& symbol,
                                           const std::vector<PriceBar>& bars,
                                           double iv_multiplier) {
    std::vector<HistoryRow> rows(bars.size());
    std::vector<double> returns(bars.size(), kNaN);

    for (size_t i = 0; i < bars.size(); ++i) {
        rows[i].bar = bars[i];
        if (i > 0 && bars[i - 1].close != 0) {
            returns[i] = (bars[i].close - bars[i - 1].close) / bars[i - 1].close;
        }
        rows[i].daily_return = returns[i];
    }

    auto hv_20 = rollingVolatility(returns, 20);
    auto hv_30 = rollingVolatility(returns, 30);
    auto hv_60 = rollingVolatility(returns, 60);

    for (size_t i = 0; i < rows.size(); ++i) {
        rows[i].hv_20 = hv_20[i];
        rows[i].hv_30 = hv_30[i];
        rows[i].hv_60 = hv_60[i];
        rows[i].iv_estimate = std::isfinite(hv_30[i])
            ? BlackScholes::impliedVolFromHistorical(hv_30[i], iv_multiplier)
            : kNaN;
    }

    return PriceHistory(symbol, std::move(rows));
}

std::vector<double> VolatilityModel::rollingVolatility(const std::vector<double>& returns,
                                                       size_t window, double annualization) {
    std::vector<double> result(returns.size(), kNaN);
    if (window < 2) return result;

    double scale = std::sqrt(annualization);
    for (size_t i = window - 1; i < returns.size(); ++i) {
        std::vector<double> slice(returns.begin() + (i + 1 - window), returns.begin() + i + 1);

        bool complete = true;
        for (double r : slice) {
            if (!std::isfinite(r)) {
                complete = false;
                break;
            }
        }
        if (complete) {
            result[i] = Statistics::stdDev(slice) * scale;
        }
    }
    return result;
}

double ConstantVolatilityEstimator::forecastVolatility(const std::vector<double>& returns) const {
    return Statistics::populationStdDev(returns);
}

GarchFit Garch11Estimator::fit(const std::vector<double>& returns) const {
    if (returns.size() < 3) {
        throw NumericalFitError("GARCH(1,1) needs at least 3 observations");
    }

    double avg = Statistics::mean(returns);
    std::vector<double> residuals(returns.size());
    for (size_t i = 0; i < returns.size(); ++i) {
        residuals[i] = returns[i] - avg;
    }

    double sample_variance = Statistics::populationStdDev(residuals);
    sample_variance *= sample_variance;
    if (!std::isfinite(sample_variance) || sample_variance <= 0) {
        throw NumericalFitError("GARCH(1,1) requires a positive finite sample variance");
    }

    double best_ll = -std::numeric_limits<double>::infinity();
    double best_alpha = kNaN;
    double best_beta = kNaN;

    // Coarse grid over the stationary region
    for (double alpha = kAlphaMin; alpha <= kAlphaMax + 1e-12; alpha += kGridStep) {
        for (double beta = kBetaMin; beta <= kBetaMax + 1e-12; beta += kGridStep) {
            if (alpha + beta >= kMaxPersistence) continue;

            double ll = logLikelihood(residuals, sample_variance, alpha, beta, nullptr);
            if (std::isfinite(ll) && ll > best_ll) {
                best_ll = ll;
                best_alpha = alpha;
                best_beta = beta;
            }
        }
    }

    if (!std::isfinite(best_ll)) {
        throw NumericalFitError("GARCH(1,1) likelihood is not finite on the parameter grid");
    }

    // Local pattern search with a shrinking step
    for (double step = kGridStep / 2; step > 1e-4; step /= 2) {
        bool improved = true;
        while (improved) {
            improved = false;
            const double moves[4][2] = {{step, 0}, {-step, 0}, {0, step}, {0, -step}};
            for (const auto& move : moves) {
                double alpha = best_alpha + move[0];
                double beta = best_beta + move[1];
                if (alpha <= 0 || beta <= 0 || alpha + beta >= kMaxPersistence) continue;

                double ll = logLikelihood(residuals, sample_variance, alpha, beta, nullptr);
                if (std::isfinite(ll) && ll > best_ll + 1e-12) {
                    best_ll = ll;
                    best_alpha = alpha;
                    best_beta = beta;
                    improved = true;
                }
            }
        }
    }

    GarchFit result;
    result.alpha = best_alpha;
    result.beta = best_beta;
    result.omega = sample_variance * (1.0 - best_alpha - best_beta);
    result.log_likelihood = logLikelihood(residuals, sample_variance, best_alpha, best_beta,
                                          &result.last_variance);
    result.last_residual = residuals.back();
    return result;
}

double Garch11Estimator::forecastVolatility(const std::vector<double>& returns) const {
    GarchFit f = fit(returns);
    double next_variance = f.omega + f.alpha * f.last_residual * f.last_residual +
                           f.beta * f.last_variance;
    if (!std::isfinite(next_variance) || next_variance <= 0) {
        throw NumericalFitError("GARCH(1,1) produced a non-positive variance forecast");
    }
    return std::sqrt(next_variance);
}

double Garch11Estimator::logLikelihood(const std::vector<double>& residuals,
                                       double sample_variance, double alpha, double beta,
                                       double* last_variance) {
    double omega = sample_variance * (1.0 - alpha - beta);
    double variance = sample_variance;
    double ll = 0.0;

    for (size_t t = 0; t < residuals.size(); ++t) {
        if (t > 0) {
            variance = omega + alpha * residuals[t - 1] * residuals[t - 1] + beta * variance;
        }
        if (variance <= 0 || !std::isfinite(variance)) {
            return -std::numeric_limits<double>::infinity();
        }
        ll += -0.5 * (std::log(kTwoPi) + std::log(variance) +
                      residuals[t] * residuals[t] / variance);
    }

    if (last_variance) {
        *last_variance = variance;
    }
    return ll;
}

} // namespace optval
