#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <vector>


///////////////////////////
///     STATISTICS      ///
///////////////////////////
/// Arithmetic mean; 0 for an empty sample.
double mean(const std::vector<double>& values);

/// Median; 0 for an empty sample.
double median(std::vector<double> values);

/// Population standard deviation; 0 for fewer than two values.
double standardDeviation(const std::vector<double>& values);
