#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

/*
-------------------------------------------------------------------------------
 models.hpp - Core domain structs
-------------------------------------------------------------------------------
Defines plain data structures shared by every layer of StudentInsight:
  - Student, AcademicRecord, BehaviorRecord (rows read from the record store)
  - FeatureVector / StudentSummary (derived per-student aggregates)
  - SentimentResult (scored free text)
  - PerformancePrediction / RiskPrediction / Recommendation (outputs)

These are simple value types with public fields. Records are immutable once
written; derived values are recomputed on demand and never stored.
-------------------------------------------------------------------------------
*/

// A row in the user directory. Only role "student" takes part in analytics.
struct Student {
    std::string student_id;   // primary key-like, e.g. S001
    std::string name;
    std::string email;
    std::string role{ "student" };
    std::string department;
};

// One academic snapshot for a student. All scores are 0..100.
struct AcademicRecord {
    std::string student_id;       // foreign key -> Student
    double marks{ 0.0 };
    double attendance{ 0.0 };
    double assignment_score{ 0.0 };
    std::string recorded_at;      // "YYYY-MM-DD HH:MM:SS"
};

// One wellbeing check-in for a student.
struct BehaviorRecord {
    std::string student_id;       // foreign key -> Student
    int mood_score{ 3 };          // 1..5
    double sleep_hours{ 0.0 };
    double study_hours{ 0.0 };
    std::optional<std::string> text_feedback;
    std::string recorded_at;      // "YYYY-MM-DD HH:MM:SS"
};

// Six model inputs, always in this order. See feature_names().
struct FeatureVector {
    double avg_attendance{ 0.0 };
    double avg_assignment{ 0.0 };
    double avg_internal{ 0.0 };   // mean marks, stands in for internal assessment
    double avg_mood{ 3.0 };
    double avg_study_hours{ 5.0 };
    double avg_sleep_hours{ 6.0 };

    std::vector<double> as_row() const {
        return { avg_attendance, avg_assignment, avg_internal,
                 avg_mood, avg_study_hours, avg_sleep_hours };
    }
};

constexpr std::size_t kFeatureCount = 6;

inline const std::vector<std::string>& feature_names() {
    static const std::vector<std::string> names = {
        "avg_attendance", "avg_assignment", "avg_internal",
        "avg_mood", "avg_study_hours", "avg_sleep_hours"
    };
    return names;
}

// Aggregated view of one student: the model features plus the raw mean marks
// used as regression target and by the risk rule.
struct StudentSummary {
    std::string student_id;
    FeatureVector features;
    double avg_marks{ 0.0 };
};

enum class Sentiment { Positive, Neutral, Negative };

inline const char* to_string(Sentiment s) {
    switch (s) {
    case Sentiment::Positive: return "Positive";
    case Sentiment::Negative: return "Negative";
    default:                  return "Neutral";
    }
}

struct SentimentResult {
    Sentiment sentiment{ Sentiment::Neutral };
    double polarity{ 0.0 };       // -1..1
    double subjectivity{ 0.0 };   // 0..1
    std::vector<std::string> stress_indicators;
    std::vector<std::string> positive_indicators;
    double confidence{ 0.5 };
};

// Ordinal risk classes; the numeric value is the classifier's class index.
enum class RiskLevel { Low = 0, Medium = 1, High = 2 };

inline const char* to_string(RiskLevel r) {
    switch (r) {
    case RiskLevel::Low:  return "Low";
    case RiskLevel::High: return "High";
    default:              return "Medium";
    }
}

using FeatureImportance = std::map<std::string, double>;

struct PerformancePrediction {
    std::string student_id;
    double predicted_score{ 0.0 };   // 0..100, rounded to 2 decimals
    FeatureVector current_features;
    FeatureImportance feature_importance;
    std::string interpretation;
};

struct RiskPrediction {
    std::string student_id;
    RiskLevel risk_level{ RiskLevel::Medium };
    std::map<std::string, double> probabilities;   // "Low"/"Medium"/"High", sums to 1
    FeatureVector current_features;
    FeatureImportance feature_importance;
    std::string interpretation;
};

struct Recommendation {
    std::string type;       // academic, attendance, mental_health, ...
    std::string priority;   // low, medium, high, urgent
    std::string title;
    std::string description;
    std::vector<std::string> action_items;
};
