#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace optval {

double Statistics::mean(const std::vector<double>& data) {
    if (data.empty()) return 0.0;
    return std::accumulate(data.begin(), data.end(), 0.0) / data.size();
}

double Statistics::stdDev(const std::vector<double>& data) {
    if (data.size() < 2) return 0.0;

    double avg = mean(data);
    double sum_sq = 0.0;
    for (double value : data) {
        sum_sq += (value - avg) * (value - avg);
    }
    return std::sqrt(sum_sq / (data.size() - 1));
}

double Statistics::populationStdDev(const std::vector<double>& data) {
    if (data.empty()) return 0.0;

    double avg = mean(data);
    double sum_sq = 0.0;
    for (double value : data) {
        sum_sq += (value - avg) * (value - avg);
    }
    return std::sqrt(sum_sq / data.size());
}

double Statistics::percentile(std::vector<double> data, double p) {
    if (data.empty()) return 0.0;

    std::sort(data.begin(), data.end());

    if (p <= 0) return data.front();
    if (p >= 1) return data.back();

    double index = p * (data.size() - 1);
    size_t lower = static_cast<size_t>(std::floor(index));
    size_t upper = static_cast<size_t>(std::ceil(index));

    if (lower == upper) {
        return data[lower];
    }

    double weight = index - lower;
    return data[lower] * (1.0 - weight) + data[upper] * weight;
}

double Statistics::tailMean(const std::vector<double>& data, double threshold) {
    double sum = 0.0;
    size_t count = 0;
    for (double value : data) {
        if (value <= threshold) {
            sum += value;
            ++count;
        }
    }
    return count == 0 ? threshold : sum / count;
}

std::vector<double> Statistics::returnsFromEquity(const std::vector<double>& equity_curve) {
    std::vector<double> returns;
    if (equity_curve.size() < 2) return returns;

    returns.reserve(equity_curve.size() - 1);
    for (size_t i = 1; i < equity_curve.size(); ++i) {
        if (equity_curve[i - 1] != 0) {
            returns.push_back((equity_curve[i] - equity_curve[i - 1]) / equity_curve[i - 1]);
        }
    }
    return returns;
}

std::vector<double> Statistics::finiteOnly(const std::vector<double>& data) {
    std::vector<double> clean;
    clean.reserve(data.size());
    for (double value : data) {
        if (std::isfinite(value)) {
            clean.push_back(value);
        }
    }
    return clean;
}

double Statistics::normalCdf(double x) {
    return 0.5 * std::erfc(-x / std::sqrt(2.0));
}

double Statistics::normalPdf(double x) {
    constexpr double inv_sqrt_2pi = 0.3989422804014327;
    return inv_sqrt_2pi * std::exp(-0.5 * x * x);
}

double Statistics::normalQuantile(double p) {
    // Acklam's rational approximation, relative error below 1.15e-9
    if (p <= 0.0) return -INFINITY;
    if (p >= 1.0) return INFINITY;

    static const double a[] = {
        -3.969683028665376e+01, 2.209460984245205e+02,
        -2.759285104469687e+02, 1.383577518672690e+02,
        -3.066479806614716e+01, 2.506628277459239e+00
    };
    static const double b[] = {
        -5.447609879822406e+01, 1.615858368580409e+02,
        -1.556989798598866e+02, 6.680131188771972e+01,
        -1.328068155288572e+01
    };
    static const double c[] = {
        -7.784894002430293e-03, -3.223964580411365e-01,
        -2.400758277161838e+00, -2.549732539343734e+00,
         4.374664141464968e+00,  2.938163982698783e+00
    };
    static const double d[] = {
         7.784695709041462e-03, 3.224671290700398e-01,
         2.445134137142996e+00, 3.754408661907416e+00
    };

    constexpr double p_low = 0.02425;
    constexpr double p_high = 1.0 - p_low;

    double q, r;
    if (p < p_low) {
        q = std::sqrt(-2.0 * std::log(p));
        return (((((c[0]*q+c[1])*q+c[2])*q+c[3])*q+c[4])*q+c[5]) /
               ((((d[0]*q+d[1])*q+d[2])*q+d[3])*q+1);
    } else if (p <= p_high) {
        q = p - 0.5;
        r = q * q;
        return (((((a[0]*r+a[1])*r+a[2])*r+a[3])*r+a[4])*r+a[5])*q /
               (((((b[0]*r+b[1])*r+b[2])*r+b[3])*r+b[4])*r+1);
    } else {
        q = std::sqrt(-2.0 * std::log(1.0 - p));
        return -(((((c[0]*q+c[1])*q+c[2])*q+c[3])*q+c[4])*q+c[5]) /
                ((((d[0]*q+d[1])*q+d[2])*q+d[3])*q+1);
    }
}

} // namespace optval
