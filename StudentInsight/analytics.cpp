#include "analytics.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include "features.hpp"
#include "helpers.hpp"
#include "log.hpp"

namespace {

constexpr std::size_t kMaxDataPoints = 100;

std::string one_decimal(double v) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(1) << v;
    return os.str();
}

std::string date_part(const std::string& recorded_at) {
    return recorded_at.substr(0, 10);
}

// Students that have academic records, with their aggregates.
struct Aggregated {
    Student student;
    StudentSummary summary;
};

std::vector<Aggregated> aggregate_students(const RecordSource& source,
    const std::optional<std::string>& department) {
    std::vector<Aggregated> out;
    for (const auto& st : source.list_students(department)) {
        auto academics = source.list_academic_records(st.student_id);
        if (academics.empty()) continue;
        out.push_back({ st, aggregate_records(st.student_id, academics,
            source.list_behavior_records(st.student_id)) });
    }
    return out;
}

} // namespace

AnalyticsService::AnalyticsService(const RecordSource& source, SentimentScorer& scorer)
    : source_(source), scorer_(scorer) {}

// ============================================================
// Class analytics
// ============================================================

std::optional<ClassAnalytics> AnalyticsService::class_analytics(const std::optional<std::string>& department) const {
    const auto data = aggregate_students(source_, department);
    if (data.empty()) return std::nullopt;

    ClassAnalytics a;
    std::vector<double> marks, attendance, mood;
    for (const auto& d : data) {
        const double m = d.summary.avg_marks;
        const double md = d.summary.features.avg_mood;
        marks.push_back(m);
        attendance.push_back(d.summary.features.avg_attendance);
        mood.push_back(md);

        ++a.performance_distribution[performance_category(m)];
        const RiskLevel risk = risk_level_for(m, md);
        ++a.risk_distribution[to_string(risk)];
        if (risk == RiskLevel::High)
            a.at_risk_students.push_back({ d.student.student_id, d.student.name, d.student.department, m, md });
    }

    a.statistics.total_students = data.size();
    a.statistics.avg_marks = mean_of(marks);
    a.statistics.marks_std = sample_std(marks);
    a.statistics.avg_attendance = mean_of(attendance);
    a.statistics.avg_mood = mean_of(mood);
    return a;
}

// ============================================================
// Correlations
// ============================================================

AttendanceCorrelationReport AnalyticsService::attendance_marks_correlation() const {
    std::vector<double> attendance, marks;
    std::map<std::string, std::vector<double>> by_range;
    AttendanceCorrelationReport r;

    for (const auto& st : source_.list_students()) {
        for (const auto& rec : source_.list_academic_records(st.student_id)) {
            attendance.push_back(rec.attendance);
            marks.push_back(rec.marks);
            by_range[attendance_range(rec.attendance)].push_back(rec.marks);
            if (r.data_points.size() < kMaxDataPoints)
                r.data_points.push_back({ rec.attendance, rec.marks });
        }
    }

    const double corr = pearson(attendance, marks);
    r.correlation_coefficient = round_to(corr, 3);
    r.interpretation = interpret_correlation(corr);
    for (const auto& kv : by_range) r.range_wise_average[kv.first] = mean_of(kv.second);
    return r;
}

StressCorrelationReport AnalyticsService::stress_marks_correlation() const {
    std::vector<double> marks, attendance, mood, sleep, study;
    for (const auto& s : aggregate_population(source_)) {
        marks.push_back(s.avg_marks);
        attendance.push_back(s.features.avg_attendance);
        mood.push_back(s.features.avg_mood);
        sleep.push_back(s.features.avg_sleep_hours);
        study.push_back(s.features.avg_study_hours);
    }

    StressCorrelationReport r;
    r.correlations["mood_vs_marks"] = round_to(pearson(mood, marks), 3);
    r.correlations["sleep_vs_marks"] = round_to(pearson(sleep, marks), 3);
    r.correlations["study_vs_marks"] = round_to(pearson(study, marks), 3);
    r.correlations["mood_vs_attendance"] = round_to(pearson(mood, attendance), 3);
    for (const auto& kv : r.correlations) r.interpretations[kv.first] = interpret_correlation(kv.second);
    r.insights = correlation_insights(r.correlations);
    return r;
}

std::vector<std::string> correlation_insights(const std::map<std::string, double>& correlations) {
    auto value = [&](const char* key) {
        auto it = correlations.find(key);
        return it == correlations.end() ? 0.0 : it->second;
    };

    std::vector<std::string> insights;
    if (value("mood_vs_marks") > 0.3)
        insights.push_back("Students with higher mood scores tend to perform better academically. "
            "Mental health support could improve academic outcomes.");
    if (value("sleep_vs_marks") > 0.3)
        insights.push_back("Better sleep habits are associated with higher academic performance. "
            "Sleep hygiene should be promoted.");
    if (value("study_vs_marks") > 0.5)
        insights.push_back("Study hours show strong correlation with marks. "
            "Encouraging productive study habits is beneficial.");
    if (value("mood_vs_attendance") > 0.4)
        insights.push_back("Students with better mental health show higher attendance. "
            "Early mental health intervention could reduce absenteeism.");
    if (insights.empty())
        insights.push_back("Continue monitoring patterns as more data becomes available for deeper insights.");
    return insights;
}

// ============================================================
// Mental health trends
// ============================================================

std::optional<TrendReport> AnalyticsService::mental_health_trends(const std::optional<std::string>& department) const {
    std::vector<BehaviorRecord> rows;
    for (const auto& st : source_.list_students(department)) {
        auto recs = source_.list_behavior_records(st.student_id);
        rows.insert(rows.end(), recs.begin(), recs.end());
    }
    if (rows.empty()) return std::nullopt;

    std::vector<std::string> texts;
    texts.reserve(rows.size());
    for (const auto& b : rows) texts.push_back(b.text_feedback.value_or(""));
    const BatchSentimentSummary batch = scorer_.analyze_batch(texts);

    TrendReport t;
    t.sentiment_distribution["Positive"] = batch.positive_count;
    t.sentiment_distribution["Neutral"] = batch.neutral_count;
    t.sentiment_distribution["Negative"] = batch.negative_count;
    t.common_stress_indicators = batch.common_stress_indicators;
    t.average_polarity = batch.average_polarity;

    struct DaySums { double mood{ 0 }, study{ 0 }, sleep{ 0 }; std::size_t n{ 0 }; };
    std::map<std::string, DaySums> by_date;

    for (const auto& b : rows) {
        ++t.mood_distribution[b.mood_score];

        auto& d = by_date[date_part(b.recorded_at)];
        d.mood += b.mood_score;
        d.study += b.study_hours;
        d.sleep += b.sleep_hours;
        ++d.n;

        if (b.mood_score <= 2) {
            const SentimentResult s = scorer_.analyze(b.text_feedback);
            t.concerning_cases.push_back({ b.student_id, b.mood_score, date_part(b.recorded_at),
                b.text_feedback, s.sentiment, s.stress_indicators });
        }
    }

    for (const auto& kv : by_date) {
        const double n = static_cast<double>(kv.second.n);
        t.time_trends.push_back({ kv.first, kv.second.mood / n, kv.second.study / n, kv.second.sleep / n });
    }
    return t;
}

// ============================================================
// Per-student trends and recommendations
// ============================================================

std::optional<StudentTrends> AnalyticsService::student_performance_trends(const std::string& student_id) const {
    StudentTrends t;
    t.academics = source_.list_academic_records(student_id);
    const auto behaviors = source_.list_behavior_records(student_id);
    if (t.academics.empty() && behaviors.empty()) return std::nullopt;

    if (!t.academics.empty()) {
        const StudentSummary s = aggregate_records(student_id, t.academics, behaviors);
        t.summary.avg_marks = s.avg_marks;
        t.summary.avg_attendance = s.features.avg_attendance;
    }

    if (!behaviors.empty()) {
        std::vector<double> mood, study, sleep;
        for (const auto& b : behaviors) {
            mood.push_back(b.mood_score);
            study.push_back(b.study_hours);
            sleep.push_back(b.sleep_hours);

            const SentimentResult s = scorer_.analyze(b.text_feedback);
            t.mental_trends.push_back({ date_part(b.recorded_at), b.mood_score,
                b.study_hours, b.sleep_hours, s.sentiment, s.polarity });
        }
        t.summary.avg_mood = mean_of(mood);
        t.summary.avg_study_hours = mean_of(study);
        t.summary.avg_sleep_hours = mean_of(sleep);
    }
    return t;
}

std::vector<Recommendation> AnalyticsService::generate_recommendations(const std::string& student_id) const {
    const auto trends = student_performance_trends(student_id);
    if (!trends) {
        log_debug("no records for " + student_id + ", no recommendations");
        return {};
    }
    return ::generate_recommendations(trends->summary);
}

std::vector<Recommendation> generate_recommendations(const TrendSummary& s) {
    std::vector<Recommendation> out;

    if (s.avg_marks < 60) {
        out.push_back({ "academic", "high", "Improve Academic Performance",
            "Your average marks (" + one_decimal(s.avg_marks) + "%) need improvement. "
            "Consider forming study groups and utilizing tutoring services.",
            { "Schedule regular tutoring sessions",
              "Join or form a study group",
              "Create a structured study schedule",
              "Seek help from professors during office hours" } });
    }

    if (s.avg_attendance < 75) {
        out.push_back({ "attendance", "high", "Improve Attendance",
            "Your attendance (" + one_decimal(s.avg_attendance) + "%) is below the recommended threshold. "
            "Regular attendance is correlated with better academic performance.",
            { "Set multiple alarms for morning classes",
              "Partner with a classmate for accountability",
              "Address any underlying issues affecting attendance" } });
    }

    if (s.avg_mood <= 2) {
        out.push_back({ "mental_health", "urgent", "Seek Mental Health Support",
            "Your recent mood indicators suggest you may be experiencing significant stress. "
            "Please consider reaching out to campus counseling services.",
            { "Schedule an appointment with a campus counselor",
              "Talk to a trusted friend, family member, or mentor",
              "Practice stress-reduction techniques like meditation",
              "Helpline: Campus Wellness Center" } });
    }
    else if (s.avg_mood <= 3) {
        out.push_back({ "wellness", "medium", "Focus on Well-being",
            "Consider incorporating wellness activities into your routine to maintain a healthy balance.",
            { "Take regular breaks during study sessions",
              "Engage in physical activity",
              "Maintain social connections" } });
    }

    if (s.avg_sleep_hours < 6) {
        out.push_back({ "health", "medium", "Improve Sleep Habits",
            "You're averaging " + one_decimal(s.avg_sleep_hours) + " hours of sleep. "
            "Adults need 7-9 hours for optimal cognitive function.",
            { "Set a consistent bedtime",
              "Limit screen time before bed",
              "Create a relaxing pre-sleep routine",
              "Avoid caffeine in the evening" } });
    }

    if (s.avg_study_hours < 4) {
        out.push_back({ "study_habits", "medium", "Increase Study Time",
            "Consider increasing your study hours from " + one_decimal(s.avg_study_hours) +
            " hours to at least 4-6 hours daily.",
            { "Use the Pomodoro technique for focused study",
              "Identify and minimize distractions",
              "Create a dedicated study space" } });
    }

    if (s.avg_marks >= 80 && s.avg_mood >= 4) {
        out.push_back({ "positive", "low", "Keep Up the Great Work!",
            "Your academic performance and well-being indicators are excellent. "
            "Continue maintaining your healthy habits.",
            { "Consider mentoring other students",
              "Explore advanced opportunities like research",
              "Maintain your work-life balance" } });
    }

    return out;
}

// ============================================================
// Department summary
// ============================================================

std::vector<DepartmentSummary> AnalyticsService::department_summary() const {
    std::map<std::string, std::vector<Aggregated>> groups;
    for (auto& d : aggregate_students(source_, std::nullopt))
        groups[d.student.department].push_back(std::move(d));

    std::vector<DepartmentSummary> out;
    for (const auto& kv : groups) {
        DepartmentSummary ds;
        ds.department = kv.first;
        ds.student_count = kv.second.size();

        std::vector<double> marks, attendance, mood;
        for (const auto& d : kv.second) {
            marks.push_back(d.summary.avg_marks);
            attendance.push_back(d.summary.features.avg_attendance);
            mood.push_back(d.summary.features.avg_mood);
            if (risk_level_for(d.summary.avg_marks, d.summary.features.avg_mood) == RiskLevel::High)
                ++ds.high_risk_count;
        }
        ds.avg_marks = mean_of(marks);
        ds.avg_attendance = mean_of(attendance);
        ds.avg_mood = mean_of(mood);
        out.push_back(std::move(ds));
    }
    return out;
}
