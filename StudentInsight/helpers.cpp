#include "helpers.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

/*
-------------------------------------------------------------------------------
 helpers.cpp - Numeric helpers
-------------------------------------------------------------------------------
Complexity notes
  - Everything here is a single pass (or two) over the input, O(n).

Safety
  - Degenerate inputs (empty, single value, zero variance) give 0 rather than
    NaN so report fields stay printable.
-------------------------------------------------------------------------------
*/

double mean_of(const std::vector<double>& v) {
    if (v.empty()) return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

double sample_std(const std::vector<double>& v) {
    if (v.size() < 2) return 0.0;
    const double m = mean_of(v);
    double ss = 0.0;
    for (double x : v) ss += (x - m) * (x - m);
    return std::sqrt(ss / static_cast<double>(v.size() - 1));
}

double pearson(const std::vector<double>& x, const std::vector<double>& y) {
    const std::size_t n = std::min(x.size(), y.size());
    if (n < 2) return 0.0;

    double mx = 0.0, my = 0.0;
    for (std::size_t i = 0; i < n; ++i) { mx += x[i]; my += y[i]; }
    mx /= static_cast<double>(n);
    my /= static_cast<double>(n);

    double sxy = 0.0, sxx = 0.0, syy = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double dx = x[i] - mx;
        const double dy = y[i] - my;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }
    if (sxx <= 0.0 || syy <= 0.0) return 0.0;
    return clamp_to(sxy / std::sqrt(sxx * syy), -1.0, 1.0);
}

double round_to(double v, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(v * scale) / scale;
}

double clamp_to(double v, double lo, double hi) {
    return std::max(lo, std::min(hi, v));
}

RiskLevel risk_level_for(double avg_marks, double avg_mood) {
    if (avg_marks >= 75 && avg_mood >= 4) return RiskLevel::Low;
    if (avg_marks < 50 || avg_mood <= 2) return RiskLevel::High;
    return RiskLevel::Medium;
}

std::string performance_category(double avg_marks) {
    if (avg_marks >= 80) return "Excellent";
    if (avg_marks >= 60) return "Good";
    if (avg_marks >= 40) return "Average";
    return "Poor";
}

std::string attendance_range(double attendance) {
    if (attendance >= 90) return "90-100%";
    if (attendance >= 75) return "75-89%";
    if (attendance >= 60) return "60-74%";
    return "<60%";
}

std::string interpret_correlation(double r) {
    if (r >= 0.7)  return "Strong positive correlation";
    if (r >= 0.4)  return "Moderate positive correlation";
    if (r >= 0.2)  return "Weak positive correlation";
    if (r > -0.2)  return "No significant correlation";
    if (r > -0.4)  return "Weak negative correlation";
    if (r > -0.7)  return "Moderate negative correlation";
    return "Strong negative correlation";
}
