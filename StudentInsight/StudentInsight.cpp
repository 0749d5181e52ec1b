/*
-------------------------------------------------------------------------------
 StudentInsight.cpp
-------------------------------------------------------------------------------
 Purpose:
   Console front end for the StudentInsight analytics and risk engine.
   This is the main entry point (contains main()), driving a menu workflow
   over an SQLite record store, the two student models and the analytics
   reports.

 Start-up:
   StudentInsight [config-file]      (default: insight.conf, optional)
   - opens/creates the database from InsightConfig::db_path
   - creates tables and seeds the demo cohort when enabled and empty
   - restores saved models from InsightConfig::model_dir if present;
     otherwise the first prediction trains them

 User input model:
   - All text fields are validated with helpers in validation.hpp
   - Numeric entry uses prompt_number_or_back; text uses prompt_until_valid_or_back
   - Most prompts support special control responses from InputCtl:
       * Back  -> cancel current action and return to the menu
       * Exit  -> exit the app immediately (we set choice = 0 and break)

 Errors:
   Every action runs inside one try block. InsightError subclasses are shown
   to the user and the menu continues.
-------------------------------------------------------------------------------
*/

#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include "analytics.hpp"
#include "checkin.hpp"
#include "config.hpp"
#include "db.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "ml_service.hpp"
#include "sentiment.hpp"
#include "validation.hpp"

// Prints the big ASCII art welcome banner once at startup.
static void showWelcome() {
    std::cout << "=====================================================\n";
    std::cout << "                        WELCOME                      \n";
    std::cout << "=====================================================\n";
    std::cout << "          StudentInsight Analytics & Risk Engine     \n";
    std::cout << "-----------------------------------------------------\n";
    std::cout << "   Predictions, wellbeing trends, recommendations    \n";
    std::cout << "=====================================================\n\n";
}

// ---- output helpers --------------------------------------------------------

static void print_features(const FeatureVector& f) {
    std::cout << std::fixed << std::setprecision(2)
        << "  Attendance: " << f.avg_attendance
        << "  Assignment: " << f.avg_assignment
        << "  Marks: " << f.avg_internal << "\n"
        << "  Mood: " << f.avg_mood
        << "  Study h: " << f.avg_study_hours
        << "  Sleep h: " << f.avg_sleep_hours << "\n";
}

static void print_importance(const FeatureImportance& imp) {
    if (imp.empty()) { std::cout << "  (model not trained)\n"; return; }
    for (const auto& kv : imp)
        std::cout << "  " << std::left << std::setw(18) << kv.first << std::right
                  << std::fixed << std::setprecision(3) << kv.second << "\n";
}

static void print_metrics(const TrainingMetrics& m) {
    std::cout << std::fixed << std::setprecision(3)
        << "Trained on " << m.rows << " students.\n"
        << "  Performance predictor: MSE " << m.performance_predictor.mse
        << "  RMSE " << m.performance_predictor.rmse
        << "  R2 " << m.performance_predictor.r2 << "\n"
        << "  Risk classifier: accuracy " << m.risk_classifier.accuracy << "\n";
    for (const auto& kv : m.risk_classifier.per_class)
        std::cout << "    " << std::left << std::setw(7) << kv.first << std::right
                  << " precision " << kv.second.precision
                  << "  recall " << kv.second.recall
                  << "  f1 " << kv.second.f1
                  << "  support " << kv.second.support << "\n";
}

static void print_probabilities(const std::map<std::string, double>& p) {
    for (const char* k : { "Low", "Medium", "High" }) {
        auto it = p.find(k);
        std::cout << "  " << std::left << std::setw(7) << k << std::right
                  << std::fixed << std::setprecision(1) << (it == p.end() ? 0.0 : it->second * 100.0) << "%\n";
    }
}

static void print_list(const char* title, const std::vector<std::string>& items) {
    std::cout << title;
    if (items.empty()) { std::cout << " none\n"; return; }
    for (std::size_t i = 0; i < items.size(); ++i) std::cout << (i ? ", " : " ") << items[i];
    std::cout << "\n";
}

// Splits "S001, S002 S003" into ids.
static std::vector<std::string> split_ids(std::string line) {
    for (auto& c : line) if (c == ',') c = ' ';
    std::istringstream is(line);
    std::vector<std::string> ids;
    std::string id;
    while (is >> id) ids.push_back(id);
    return ids;
}

//-----------------------------------------
int main(int argc, char** argv) {
    const std::string config_path = argc > 1 ? argv[1] : "insight.conf";

    InsightConfig cfg;
    try {
        cfg = load_config(config_path);
    }
    catch (const InsightError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return 1;
    }
    set_log_level(cfg.log_level);

    showWelcome();

    // --- Database bootstrap -------------------------------------------------
    sqlite3* db = nullptr;

    // Open or create the SQLite file. If this fails, we cannot continue.
    if (!db_open(db, cfg.db_path)) {
        std::cout << "Could not open database.\n";
        return 1;
    }

    // Initialize schema and seed the demo cohort on first run. If this fails,
    // bail out to avoid running with a partial/unknown schema.
    if (!db_init_and_seed(db, cfg.seed_demo_data)) {
        std::cout << "Could not initialize database.\n";
        db_close(db);
        return 1;
    }

    SqliteRecordStore store(db);
    ModelRegistry registry(cfg);
    SentimentScorer scorer;
    MlService ml(store, registry, scorer, cfg.model_dir);
    AnalyticsService analytics(store, scorer);

    try {
        if (ml.load_models()) log_info("restored saved models from " + cfg.model_dir);
    }
    catch (const InsightError& e) {
        log_warn(std::string("ignoring saved models: ") + e.what());
    }

    // --- Menu loop ----------------------------------------------------------
    int choice = -1;

    // Utility to reset the cin state and discard the rest of the current line.
    auto clear_input = [] {
        std::cin.clear();
        std::cin.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
        };

    while (choice != 0) {
        DbCounts counts;
        if (!db_get_counts(db, counts)) log_warn("could not read live counts");
        std::cout
            << "=====================================================\n"
            << "                      MAIN MENU                      \n"
            << "=====================================================\n"
            << "  Students: " << std::setw(3) << counts.students
            << "  Academic: " << std::setw(4) << counts.academic_records
            << "  Check-ins: " << std::setw(4) << counts.behavior_records << "\n"
            << "-----------------------------------------------------\n"
            << " MODELS:                                             \n"
            << "  [1]  Train models      [2]  Model status           \n"
            << "  [3]  Predict score     [4]  Classify risk          \n"
            << "  [5]  Batch predict     [6]  Analyze text           \n"
            << "-----------------------------------------------------\n"
            << " ANALYTICS:                                          \n"
            << "  [7]  Class analytics   [8]  Attendance vs marks    \n"
            << "  [9]  Wellbeing vs marks [10] Mental health trends  \n"
            << "  [11] Recommendations   [12] Student trends         \n"
            << "  [13] Department summary                            \n"
            << "-----------------------------------------------------\n"
            << " RECORDS:                                            \n"
            << "  [14] Submit check-in   [15] Add student            \n"
            << "-----------------------------------------------------\n"
            << "  [0]  EXIT                                          \n"
            << "=====================================================\n"
            << "  CHOICE: ";

        // At end of input, leave.
        if (!(std::cin >> choice)) {
            if (std::cin.eof()) break;
            clear_input();
            continue;
        }
        clear_input();

        try {
            // ---- 1) Train models -------------------------------------------
            if (choice == 1) {
                print_metrics(ml.train_models());
                std::cout << "Models saved to " << cfg.model_dir << ".\n";
            }

            // ---- 2) Model status -------------------------------------------
            else if (choice == 2) {
                const ModelInfo info = ml.model_info();
                for (const ModelSummary* m : { &info.performance_predictor, &info.risk_classifier }) {
                    std::cout << m->model_type << ": " << m->status << "\n";
                    print_importance(m->feature_importance);
                }
                std::cout << "Training passes this session: " << info.training_passes << "\n";
                if (info.training_metrics) print_metrics(*info.training_metrics);
            }

            // ---- 3) Predict performance ------------------------------------
            else if (choice == 3) {
                std::string id;
                auto p = prompt_until_valid_or_back("Student ID", id, is_valid_student_id, "Use S + 3-6 digits (e.g. S001).");
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                const auto pred = ml.predict_performance(id);
                if (!pred) { std::cout << "Student not found (no academic records).\n"; continue; }
                std::cout << "Predicted score: " << std::fixed << std::setprecision(2) << pred->predicted_score << "\n";
                print_features(pred->current_features);
                std::cout << "Feature importance:\n";
                print_importance(pred->feature_importance);
                std::cout << pred->interpretation << "\n";
            }

            // ---- 4) Classify risk ------------------------------------------
            else if (choice == 4) {
                std::string id;
                auto p = prompt_until_valid_or_back("Student ID", id, is_valid_student_id, "Use S + 3-6 digits (e.g. S001).");
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                const auto risk = ml.classify_risk(id);
                if (!risk) { std::cout << "Student not found (no academic records).\n"; continue; }
                std::cout << "Risk level: " << to_string(risk->risk_level) << "\n";
                print_probabilities(risk->probabilities);
                print_features(risk->current_features);
                std::cout << risk->interpretation << "\n";
            }

            // ---- 5) Batch predict ------------------------------------------
            else if (choice == 5) {
                std::string line;
                std::cout << "Student IDs (comma or space separated): ";
                if (!read_line(line)) { choice = 0; break; }
                const auto batch = ml.batch_predict(split_ids(line));
                for (const auto& e : batch.predictions)
                    std::cout << "  " << e.student_id << "  score " << std::fixed << std::setprecision(2)
                              << e.predicted_score << "  risk " << to_string(e.risk_level) << "\n";
                std::cout << "Processed: " << batch.total_processed << "\n";
            }

            // ---- 6) Analyze text -------------------------------------------
            else if (choice == 6) {
                std::string text;
                auto p = prompt_optional_text_or_back("Text", text);
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                const SentimentReport r = ml.analyze_sentiment(text);
                std::cout << "Sentiment: " << to_string(r.result.sentiment)
                          << std::fixed << std::setprecision(3)
                          << "  polarity " << r.result.polarity
                          << "  subjectivity " << r.result.subjectivity
                          << "  confidence " << r.result.confidence << "\n";
                print_list("Stress indicators:", r.result.stress_indicators);
                print_list("Positive indicators:", r.result.positive_indicators);
                std::cout << "Mental health score: " << r.mental_health_score << "/10 (" << r.mental_health_label << ")\n";
            }

            // ---- 7) Class analytics ----------------------------------------
            else if (choice == 7) {
                std::string dept;
                auto p = prompt_optional_text_or_back("Department (Enter=all)", dept);
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                const auto a = analytics.class_analytics(dept.empty() ? std::nullopt : std::optional<std::string>(dept));
                if (!a) { std::cout << "No data for that selection.\n"; continue; }
                const auto& s = a->statistics;
                std::cout << std::fixed << std::setprecision(2)
                    << "Students: " << s.total_students << "  mean marks " << s.avg_marks
                    << " (sd " << s.marks_std << ")  attendance " << s.avg_attendance
                    << "  mood " << s.avg_mood << "\n";
                std::cout << "Performance:";
                for (const auto& kv : a->performance_distribution) std::cout << "  " << kv.first << "=" << kv.second;
                std::cout << "\nRisk:";
                for (const auto& kv : a->risk_distribution) std::cout << "  " << kv.first << "=" << kv.second;
                std::cout << "\nHigh-risk students:\n";
                for (const auto& r : a->at_risk_students)
                    std::cout << "  " << r.student_id << "  " << std::left << std::setw(16) << r.name << std::right
                              << "  marks " << r.avg_marks << "  mood " << r.avg_mood << "\n";
            }

            // ---- 8) Attendance vs marks ------------------------------------
            else if (choice == 8) {
                const auto r = analytics.attendance_marks_correlation();
                std::cout << "r = " << std::fixed << std::setprecision(3) << r.correlation_coefficient
                          << "  (" << r.interpretation << ")\n";
                for (const auto& kv : r.range_wise_average)
                    std::cout << "  " << std::left << std::setw(8) << kv.first << std::right
                              << std::setprecision(2) << kv.second << "\n";
                std::cout << "Data points: " << r.data_points.size() << "\n";
            }

            // ---- 9) Wellbeing vs marks -------------------------------------
            else if (choice == 9) {
                const auto r = analytics.stress_marks_correlation();
                for (const auto& kv : r.correlations)
                    std::cout << "  " << std::left << std::setw(20) << kv.first << std::right
                              << std::fixed << std::setprecision(3) << kv.second
                              << "  " << r.interpretations.at(kv.first) << "\n";
                for (const auto& i : r.insights) std::cout << "  * " << i << "\n";
            }

            // ---- 10) Mental health trends ----------------------------------
            else if (choice == 10) {
                std::string dept;
                auto p = prompt_optional_text_or_back("Department (Enter=all)", dept);
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                const auto t = analytics.mental_health_trends(dept.empty() ? std::nullopt : std::optional<std::string>(dept));
                if (!t) { std::cout << "No check-ins for that selection.\n"; continue; }
                std::cout << "Sentiment:";
                for (const auto& kv : t->sentiment_distribution) std::cout << "  " << kv.first << "=" << kv.second;
                std::cout << "\nMood:";
                for (const auto& kv : t->mood_distribution) std::cout << "  " << kv.first << "=" << kv.second;
                std::cout << "\nAverage polarity: " << std::fixed << std::setprecision(3) << t->average_polarity << "\n";
                for (const auto& d : t->time_trends)
                    std::cout << "  " << d.date << std::setprecision(2) << "  mood " << d.avg_mood
                              << "  study " << d.avg_study_hours << "  sleep " << d.avg_sleep_hours << "\n";
                std::cout << "Concerning cases: " << t->concerning_cases.size() << "\n";
                for (const auto& c : t->concerning_cases)
                    std::cout << "  " << c.student_id << "  " << c.date << "  mood " << c.mood_score
                              << "  " << to_string(c.sentiment) << "\n";
                print_list("Stress indicators:", t->common_stress_indicators);
            }

            // ---- 11) Recommendations ---------------------------------------
            else if (choice == 11) {
                std::string id;
                auto p = prompt_until_valid_or_back("Student ID", id, is_valid_student_id, "Use S + 3-6 digits (e.g. S001).");
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                const auto recs = analytics.generate_recommendations(id);
                if (recs.empty()) std::cout << "No recommendations.\n";
                for (const auto& r : recs) {
                    std::cout << "[" << r.priority << "] " << r.title << " (" << r.type << ")\n  " << r.description << "\n";
                    for (const auto& a : r.action_items) std::cout << "    - " << a << "\n";
                }
            }

            // ---- 12) Student trends ----------------------------------------
            else if (choice == 12) {
                std::string id;
                auto p = prompt_until_valid_or_back("Student ID", id, is_valid_student_id, "Use S + 3-6 digits (e.g. S001).");
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                const auto t = analytics.student_performance_trends(id);
                if (!t) { std::cout << "No records for that student.\n"; continue; }
                std::cout << std::fixed << std::setprecision(2)
                    << "Marks " << t->summary.avg_marks << "  attendance " << t->summary.avg_attendance
                    << "  mood " << t->summary.avg_mood << "  study " << t->summary.avg_study_hours
                    << "  sleep " << t->summary.avg_sleep_hours << "\n";
                for (const auto& a : t->academics)
                    std::cout << "  " << a.recorded_at << "  marks " << a.marks << "  attendance " << a.attendance << "\n";
                for (const auto& m : t->mental_trends)
                    std::cout << "  " << m.date << "  mood " << m.mood_score << "  " << to_string(m.sentiment)
                              << " (" << std::setprecision(3) << m.polarity << std::setprecision(2) << ")\n";
            }

            // ---- 13) Department summary ------------------------------------
            else if (choice == 13) {
                for (const auto& d : analytics.department_summary())
                    std::cout << "  " << std::left << std::setw(18) << d.department << std::right
                              << std::fixed << std::setprecision(2)
                              << " students " << d.student_count << "  marks " << d.avg_marks
                              << "  attendance " << d.avg_attendance << "  mood " << d.avg_mood
                              << "  high risk " << d.high_risk_count << "\n";
            }

            // ---- 14) Submit check-in ---------------------------------------
            else if (choice == 14) {
                std::string id;
                auto p = prompt_until_valid_or_back("Student ID", id, is_valid_student_id, "Use S + 3-6 digits (e.g. S001).");
                if (p == InputCtl::Back) continue;
                if (p == InputCtl::Exit) { choice = 0; break; }

                CheckIn in;
                InputCtl r = InputCtl::Ok;
                if (r == InputCtl::Ok) r = prompt_number_or_back("Marks", in.marks, 0, 100);
                if (r == InputCtl::Ok) r = prompt_number_or_back("Attendance %", in.attendance, 0, 100);
                if (r == InputCtl::Ok) r = prompt_number_or_back("Assignment score", in.assignment_score, 0, 100);
                if (r == InputCtl::Ok) r = prompt_scale_or_back("Concentration", in.concentration, 1, 5);
                if (r == InputCtl::Ok) r = prompt_scale_or_back("Confidence", in.confidence, 1, 5);
                if (r == InputCtl::Ok) r = prompt_scale_or_back("Mental fatigue", in.mental_fatigue, 1, 5);
                if (r == InputCtl::Ok) r = prompt_number_or_back("Sleep hours", in.sleep_hours, 0, 24);
                if (r == InputCtl::Ok) r = prompt_number_or_back("Study hours", in.study_hours, 0, 24);
                std::string text;
                if (r == InputCtl::Ok) r = prompt_optional_text_or_back("How are you feeling?", text);
                if (r == InputCtl::Back) continue;
                if (r == InputCtl::Exit) { choice = 0; break; }

                if (!text.empty()) in.text = text;

                const CheckInResult res = submit_check_in(store, ml, id, in);
                std::cout << "Check-in saved. Mood score " << res.mood_score
                          << ", sentiment " << res.sentiment_label << ".\n";
                if (res.prediction)
                    std::cout << "Predicted score: " << std::fixed << std::setprecision(2)
                              << res.prediction->predicted_score << "\n";
                if (res.risk) std::cout << res.risk->interpretation << "\n";
            }

            // ---- 15) Add student -------------------------------------------
            else if (choice == 15) {
                Student s;

                auto r1 = prompt_until_valid_or_back(
                    "Student ID (e.g. S013)", s.student_id, is_valid_student_id,
                    "Invalid id. Use S + 3-6 digits (e.g. S013)."
                );
                if (r1 == InputCtl::Back) continue;
                if (r1 == InputCtl::Exit) { choice = 0; break; }

                auto r2 = prompt_until_valid_or_back(
                    "Name", s.name, is_valid_name,
                    "Invalid name. Letters/spaces only (2-40)."
                );
                if (r2 == InputCtl::Back) continue;
                if (r2 == InputCtl::Exit) { choice = 0; break; }

                auto r3 = prompt_until_valid_or_back(
                    "Email", s.email, is_valid_email,
                    "Invalid email."
                );
                if (r3 == InputCtl::Back) continue;
                if (r3 == InputCtl::Exit) { choice = 0; break; }

                auto r4 = prompt_until_valid_or_back(
                    "Department", s.department, is_valid_department,
                    "Department required (max 60 chars)."
                );
                if (r4 == InputCtl::Back) continue;
                if (r4 == InputCtl::Exit) { choice = 0; break; }

                store.add_student(s);
                std::cout << "Student added (saved to DB).\n";
            }

            // ---- Unknown option guard --------------------------------------
            else if (choice != 0) {
                std::cout << "Unknown option.\n";
            }
        }
        catch (const InsightError& e) {
            std::cout << "Error: " << e.what() << "\n";
        }
    }

    // --- Shutdown -----------------------------------------------------------
    db_close(db);   // Always close the DB before exiting the program.
    return 0;
}
