#pragma once
#include <string>
#include <vector>
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 helpers.hpp - Small numeric and classification helpers
-------------------------------------------------------------------------------
Pure functions shared by the aggregator, the ML layer and analytics. None of
them touch the record store.

Naming convention:
  - mean_of / sample_std / pearson -> descriptive statistics
  - round_to / clamp_to            -> scalar shaping
  - *_category / *_range / risk_*  -> fixed bin tables used in reports

Return values:
  - mean_of and sample_std return 0 for empty input.
  - pearson returns 0 when the correlation is undefined (fewer than two
    points, or a constant series).
-------------------------------------------------------------------------------
*/

// ==========================
// Statistics
// ==========================

double mean_of(const std::vector<double>& v);

/// Sample standard deviation (n-1). 0 for fewer than two values.
double sample_std(const std::vector<double>& v);

/// Pearson correlation of two equal-length series.
double pearson(const std::vector<double>& x, const std::vector<double>& y);

// ==========================
// Scalars
// ==========================

double round_to(double v, int decimals);
double clamp_to(double v, double lo, double hi);

// ==========================
// Bin tables
// ==========================

/// Ground-truth risk rule over (avg_marks, avg_mood).
RiskLevel risk_level_for(double avg_marks, double avg_mood);

/// Excellent >= 80, Good >= 60, Average >= 40, else Poor.
std::string performance_category(double avg_marks);

/// "90-100%", "75-89%", "60-74%" or "<60%".
std::string attendance_range(double attendance);

/// Fixed strength bins, e.g. "Moderate positive correlation".
std::string interpret_correlation(double r);
