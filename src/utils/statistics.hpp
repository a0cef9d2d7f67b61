#pragma once

#include <vector>

namespace optval {

class Statistics {
public:
    static double mean(const std::vector<double>& data);

    // Sample standard deviation (n - 1 denominator)
    static double stdDev(const std::vector<double>& data);

    // Population standard deviation (n denominator)
    static double populationStdDev(const std::vector<double>& data);

    // Percentile with linear interpolation between order statistics, p in [0, 1]
    static double percentile(std::vector<double> data, double p);

    // Mean of all values at or below the threshold; returns threshold if none
    static double tailMean(const std::vector<double>& data, double threshold);

    // Period-over-period returns; steps from a zero value are skipped
    static std::vector<double> returnsFromEquity(const std::vector<double>& equity_curve);

    // Drop NaN and infinite values
    static std::vector<double> finiteOnly(const std::vector<double>& data);

    // Standard normal distribution
    static double normalCdf(double x);
    static double normalPdf(double x);
    static double normalQuantile(double p);
};

} // namespace optval
