///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "stats.hpp"
#include <algorithm>
#include <cmath>


///////////////////////////
///     STATISTICS      ///
///////////////////////////
double mean(const std::vector<double>& values) {
    if (values.empty()) return 0.0;
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / (double)values.size();
}

double median(std::vector<double> values) {
    if (values.empty()) return 0.0;
    std::sort(values.begin(), values.end());
    size_t n = values.size();
    if (n % 2 == 0) return (values[n / 2 - 1] + values[n / 2]) / 2.0;
    return values[n / 2];
}

double standardDeviation(const std::vector<double>& values) {
    if (values.size() < 2) return 0.0;
    double m = mean(values);
    double variance = 0.0;
    for (double v : values) variance += (v - m) * (v - m);
    variance /= (double)values.size();
    return std::sqrt(variance);
}
