#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "models.hpp"
#include "sentiment.hpp"
#include "services.hpp"

/*
-------------------------------------------------------------------------------
 analytics.hpp - Population statistics, correlations and recommendations
-------------------------------------------------------------------------------
AnalyticsService is stateless apart from the shared SentimentScorer. Every
report is computed from the RecordSource on demand.

Reports that can be empty return std::optional:
  - class_analytics(dept)        nullopt when no student has academic records
  - mental_health_trends(dept)   nullopt when no behavior record matches
  - student_performance_trends   nullopt when the student has no records

Correlations are Pearson r rounded to 3 decimals; an undefined correlation
(under two points, or a constant series) is reported as 0.
-------------------------------------------------------------------------------
*/

struct AtRiskStudent {
    std::string student_id;
    std::string name;
    std::string department;
    double avg_marks{ 0.0 };
    double avg_mood{ 0.0 };
};

struct ClassStatistics {
    std::size_t total_students{ 0 };
    double avg_marks{ 0.0 };
    double marks_std{ 0.0 };
    double avg_attendance{ 0.0 };
    double avg_mood{ 0.0 };
};

struct ClassAnalytics {
    std::map<std::string, std::size_t> performance_distribution;   // Excellent/Good/Average/Poor
    std::map<std::string, std::size_t> risk_distribution;          // Low/Medium/High
    std::vector<AtRiskStudent> at_risk_students;
    ClassStatistics statistics;
};

struct AttendancePoint {
    double attendance{ 0.0 };
    double marks{ 0.0 };
};

struct AttendanceCorrelationReport {
    double correlation_coefficient{ 0.0 };
    std::string interpretation;
    std::map<std::string, double> range_wise_average;   // only ranges with records
    std::vector<AttendancePoint> data_points;           // at most 100
};

struct StressCorrelationReport {
    std::map<std::string, double> correlations;          // mood_vs_marks, sleep_vs_marks, ...
    std::map<std::string, std::string> interpretations;
    std::vector<std::string> insights;
};

struct DailyTrend {
    std::string date;   // YYYY-MM-DD
    double avg_mood{ 0.0 };
    double avg_study_hours{ 0.0 };
    double avg_sleep_hours{ 0.0 };
};

struct ConcerningCase {
    std::string student_id;
    int mood_score{ 0 };
    std::string date;
    std::optional<std::string> text_feedback;
    Sentiment sentiment{ Sentiment::Neutral };
    std::vector<std::string> stress_indicators;
};

struct TrendReport {
    std::map<std::string, std::size_t> sentiment_distribution;
    std::map<int, std::size_t> mood_distribution;   // ascending by score
    std::vector<DailyTrend> time_trends;             // ascending by date
    std::vector<ConcerningCase> concerning_cases;
    std::vector<std::string> common_stress_indicators;
    double average_polarity{ 0.0 };
};

// Per-student averages the recommendation rules look at.
struct TrendSummary {
    double avg_marks{ 0.0 };
    double avg_attendance{ 0.0 };
    double avg_mood{ 3.0 };
    double avg_study_hours{ 5.0 };
    double avg_sleep_hours{ 6.0 };
};

struct CheckInTrend {
    std::string date;
    int mood_score{ 0 };
    double study_hours{ 0.0 };
    double sleep_hours{ 0.0 };
    Sentiment sentiment{ Sentiment::Neutral };
    double polarity{ 0.0 };
};

struct StudentTrends {
    TrendSummary summary;
    std::vector<AcademicRecord> academics;
    std::vector<CheckInTrend> mental_trends;
};

struct DepartmentSummary {
    std::string department;
    std::size_t student_count{ 0 };
    double avg_marks{ 0.0 };
    double avg_attendance{ 0.0 };
    double avg_mood{ 0.0 };
    std::size_t high_risk_count{ 0 };
};

class AnalyticsService {
public:
    AnalyticsService(const RecordSource& source, SentimentScorer& scorer);

    std::optional<ClassAnalytics> class_analytics(const std::optional<std::string>& department = std::nullopt) const;

    AttendanceCorrelationReport attendance_marks_correlation() const;
    StressCorrelationReport stress_marks_correlation() const;

    std::optional<TrendReport> mental_health_trends(const std::optional<std::string>& department = std::nullopt) const;

    std::optional<StudentTrends> student_performance_trends(const std::string& student_id) const;

    /// Ordered by department name.
    std::vector<DepartmentSummary> department_summary() const;

    /// Empty for an unknown student.
    std::vector<Recommendation> generate_recommendations(const std::string& student_id) const;

private:
    const RecordSource& source_;
    SentimentScorer& scorer_;
};

/// The rule table behind generate_recommendations. Rules fire in a fixed
/// order and any number of them may apply.
std::vector<Recommendation> generate_recommendations(const TrendSummary& summary);

/// Insight sentences for the four wellbeing correlations.
std::vector<std::string> correlation_insights(const std::map<std::string, double>& correlations);
