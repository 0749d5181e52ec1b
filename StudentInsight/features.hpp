#pragma once
#include <string>
#include <vector>
#include "models.hpp"
#include "services.hpp"

/*
-------------------------------------------------------------------------------
 features.hpp - Feature aggregation
-------------------------------------------------------------------------------
Turns a student's raw records into the six-value FeatureVector the models
consume, plus the mean marks used as regression label.

  - No academic records   -> NoDataError (the student is unknown to the models)
  - No behavior records   -> mood=3, study=5, sleep=6 (academics-only students
                             must still be predictable)
-------------------------------------------------------------------------------
*/

constexpr double kDefaultMood = 3.0;
constexpr double kDefaultStudyHours = 5.0;
constexpr double kDefaultSleepHours = 6.0;

/// Pure aggregation over already-fetched records.
StudentSummary aggregate_records(const std::string& student_id,
    const std::vector<AcademicRecord>& academics,
    const std::vector<BehaviorRecord>& behaviors);

/// Fetch the student's records from `source` and aggregate them.
StudentSummary aggregate_features(const RecordSource& source, const std::string& student_id);

/// Aggregates for every student with academic records (optionally one
/// department). Students without academics are skipped.
std::vector<StudentSummary> aggregate_population(const RecordSource& source,
    const std::optional<std::string>& department = std::nullopt);

struct TrainingSet {
    std::vector<std::vector<double>> features;   // rows in feature_names() order
    std::vector<double> marks_labels;
    std::vector<int> risk_labels;                // RiskLevel as int
    std::vector<std::string> student_ids;

    std::size_t size() const { return features.size(); }
    bool empty() const { return features.empty(); }
};

TrainingSet build_training_set(const RecordSource& source);
