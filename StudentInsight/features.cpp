#include "features.hpp"
#include "errors.hpp"
#include "helpers.hpp"

StudentSummary aggregate_records(const std::string& student_id,
    const std::vector<AcademicRecord>& academics,
    const std::vector<BehaviorRecord>& behaviors) {
    if (academics.empty())
        throw NoDataError("no academic records for student " + student_id);

    std::vector<double> marks, attendance, assignment;
    for (const auto& a : academics) {
        marks.push_back(a.marks);
        attendance.push_back(a.attendance);
        assignment.push_back(a.assignment_score);
    }

    StudentSummary s;
    s.student_id = student_id;
    s.avg_marks = mean_of(marks);
    s.features.avg_attendance = mean_of(attendance);
    s.features.avg_assignment = mean_of(assignment);
    s.features.avg_internal = s.avg_marks;

    if (behaviors.empty()) {
        s.features.avg_mood = kDefaultMood;
        s.features.avg_study_hours = kDefaultStudyHours;
        s.features.avg_sleep_hours = kDefaultSleepHours;
        return s;
    }

    std::vector<double> mood, study, sleep;
    for (const auto& b : behaviors) {
        mood.push_back(static_cast<double>(b.mood_score));
        study.push_back(b.study_hours);
        sleep.push_back(b.sleep_hours);
    }
    s.features.avg_mood = mean_of(mood);
    s.features.avg_study_hours = mean_of(study);
    s.features.avg_sleep_hours = mean_of(sleep);
    return s;
}

StudentSummary aggregate_features(const RecordSource& source, const std::string& student_id) {
    return aggregate_records(student_id,
        source.list_academic_records(student_id),
        source.list_behavior_records(student_id));
}

std::vector<StudentSummary> aggregate_population(const RecordSource& source,
    const std::optional<std::string>& department) {
    std::vector<StudentSummary> out;
    for (const auto& st : source.list_students(department)) {
        auto academics = source.list_academic_records(st.student_id);
        if (academics.empty()) continue;
        out.push_back(aggregate_records(st.student_id, academics,
            source.list_behavior_records(st.student_id)));
    }
    return out;
}

TrainingSet build_training_set(const RecordSource& source) {
    TrainingSet ts;
    for (const auto& s : aggregate_population(source)) {
        ts.features.push_back(s.features.as_row());
        ts.marks_labels.push_back(s.avg_marks);
        ts.risk_labels.push_back(static_cast<int>(risk_level_for(s.avg_marks, s.features.avg_mood)));
        ts.student_ids.push_back(s.student_id);
    }
    return ts;
}
