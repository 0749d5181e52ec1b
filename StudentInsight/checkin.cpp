#include "checkin.hpp"
#include <cmath>
#include "errors.hpp"
#include "log.hpp"
#include "validation.hpp"

int check_in_mood(int concentration, int confidence, int mental_fatigue) {
    require_in_range(concentration, 1, 5, "concentration");
    require_in_range(confidence, 1, 5, "confidence");
    require_in_range(mental_fatigue, 1, 5, "mental_fatigue");
    const double avg = (concentration + confidence + (6 - mental_fatigue)) / 3.0;
    return static_cast<int>(std::lround(avg));
}

CheckInResult submit_check_in(RecordStore& store, MlService& ml,
    const std::string& student_id, const CheckIn& in) {
    if (!is_valid_student_id(student_id))
        throw InvalidInputError("invalid student id: " + student_id);

    CheckInResult res;
    res.mood_score = check_in_mood(in.concentration, in.confidence, in.mental_fatigue);

    BehaviorRecord b;
    b.student_id = student_id;
    b.mood_score = res.mood_score;
    b.sleep_hours = in.sleep_hours;
    b.study_hours = in.study_hours;
    if (in.text && !trim(*in.text).empty()) b.text_feedback = trim(*in.text);

    AcademicRecord a;
    a.student_id = student_id;
    a.marks = in.marks;
    a.attendance = in.attendance;
    a.assignment_score = in.assignment_score;

    validate_behavior_record(b);
    validate_academic_record(a);

    // Without free text, score a sentence built from the answers.
    const std::string text = b.text_feedback ? *b.text_feedback
        : "Concentration: " + std::to_string(in.concentration) +
          ", Confidence: " + std::to_string(in.confidence) +
          ", Fatigue: " + std::to_string(in.mental_fatigue);
    res.sentiment_label = to_string(ml.analyze_sentiment(text).result.sentiment);

    store.add_check_in(b, a);
    log_info("check-in stored for " + student_id + " (mood " + std::to_string(res.mood_score) + ")");

    res.prediction = ml.predict_performance(student_id);
    res.risk = ml.classify_risk(student_id);
    return res;
}
