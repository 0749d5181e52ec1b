#pragma once
#include <optional>
#include <string>
#include "ml_service.hpp"
#include "models.hpp"
#include "services.hpp"

/*
-------------------------------------------------------------------------------
 checkin.hpp - Student questionnaire check-in
-------------------------------------------------------------------------------
A check-in answers indirect wellbeing questions (1..5 each) plus the current
academic numbers. It is stored as one behavior record and one academic record,
then both models are asked for a fresh prediction.

    mood = round((concentration + confidence + (6 - fatigue)) / 3)
-------------------------------------------------------------------------------
*/

struct CheckIn {
    double marks{ 0.0 };
    double attendance{ 0.0 };
    double assignment_score{ 0.0 };
    int concentration{ 3 };    // 1..5
    int confidence{ 3 };       // 1..5
    int mental_fatigue{ 3 };   // 1..5, higher is worse
    double sleep_hours{ 0.0 };
    double study_hours{ 0.0 };
    std::optional<std::string> text;
};

struct CheckInResult {
    int mood_score{ 3 };
    std::string sentiment_label;
    std::optional<PerformancePrediction> prediction;
    std::optional<RiskPrediction> risk;
};

int check_in_mood(int concentration, int confidence, int mental_fatigue);

/// Throws InvalidInputError for out-of-range answers and StorageError when
/// the records cannot be written (e.g. unknown student).
CheckInResult submit_check_in(RecordStore& store, MlService& ml,
    const std::string& student_id, const CheckIn& in);
