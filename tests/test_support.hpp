#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include "config.hpp"
#include "services.hpp"

/*
-------------------------------------------------------------------------------
 test_support.hpp - Shared fixtures for the unit tests
-------------------------------------------------------------------------------
  - demo_data():   the same twelve-student cohort db_init_and_seed() inserts,
                   held in a DataStore
  - small_forest:  few trees so tests train quickly
  - TempDir:       scratch directory removed on destruction
-------------------------------------------------------------------------------
*/

namespace test_support {

inline ForestParams small_forest(int max_depth = 6) { return ForestParams{ 15, max_depth, 42 }; }

inline void add_academics(DataStore& d, const std::string& id, double m1, double a1, double s1,
    double m2, double a2, double s2) {
    add_academic_record(d, { id, m1, a1, s1, "2026-01-15 09:00:00" });
    add_academic_record(d, { id, m2, a2, s2, "2026-02-15 09:00:00" });
}

inline void add_checkins(DataStore& d, const std::string& id,
    int mood1, double sleep1, double study1, const char* text1,
    int mood2, double sleep2, double study2, const char* text2) {
    auto text = [](const char* t) { return t ? std::optional<std::string>(t) : std::nullopt; };
    add_behavior_record(d, { id, mood1, sleep1, study1, text(text1), "2026-01-20 18:00:00" });
    add_behavior_record(d, { id, mood2, sleep2, study2, text(text2), "2026-02-20 18:00:00" });
}

// Risk classes: Low S001 S004 S007 S009, Medium S002 S005 S010 S011,
// High S003 S006 S008 S012. S012 has no check-ins.
inline DataStore demo_data() {
    DataStore d;
    add_student(d, { "S001", "Ava Patel", "ava@school.test", "student", "Computer Science" });
    add_student(d, { "S002", "Leo Grant", "leo@school.test", "student", "Computer Science" });
    add_student(d, { "S003", "Mia Chen", "mia@school.test", "student", "Computer Science" });
    add_student(d, { "S004", "Noah Reyes", "noah@school.test", "student", "Mechanical" });
    add_student(d, { "S005", "Zoe Adams", "zoe@school.test", "student", "Mechanical" });
    add_student(d, { "S006", "Omar Haddad", "omar@school.test", "student", "Mechanical" });
    add_student(d, { "S007", "Lily Moore", "lily@school.test", "student", "Business" });
    add_student(d, { "S008", "Ethan Brooks", "ethan@school.test", "student", "Business" });
    add_student(d, { "S009", "Sara Lind", "sara@school.test", "student", "Business" });
    add_student(d, { "S010", "Ravi Nair", "ravi@school.test", "student", "Computer Science" });
    add_student(d, { "S011", "Emma Stone", "emma@school.test", "student", "Business" });
    add_student(d, { "S012", "Jack Olsen", "jack@school.test", "student", "Mechanical" });
    add_student(d, { "T001", "Grace King", "grace@school.test", "teacher", "Computer Science" });

    add_academics(d, "S001", 88, 95, 90, 92, 93, 94);
    add_academics(d, "S002", 72, 85, 75, 68, 80, 70);
    add_academics(d, "S003", 45, 62, 50, 40, 58, 42);
    add_academics(d, "S004", 81, 90, 84, 85, 92, 88);
    add_academics(d, "S005", 58, 70, 60, 62, 74, 65);
    add_academics(d, "S006", 35, 55, 40, 48, 60, 50);
    add_academics(d, "S007", 77, 88, 80, 79, 90, 82);
    add_academics(d, "S008", 65, 78, 68, 70, 82, 72);
    add_academics(d, "S009", 90, 97, 92, 94, 98, 95);
    add_academics(d, "S010", 55, 66, 58, 52, 64, 55);
    add_academics(d, "S011", 70, 84, 73, 74, 86, 76);
    add_academics(d, "S012", 49, 72, 52, 44, 68, 47);

    add_checkins(d, "S001", 5, 7.5, 6, "I feel confident and motivated about my project", 4, 8, 5.5, "Great week, learning a lot");
    add_checkins(d, "S002", 3, 6.5, 4.5, "Okay week, a bit tired but managing", 3, 6, 4, "Deadlines are stressful but I am coping");
    add_checkins(d, "S003", 2, 4.5, 2, "I am overwhelmed and anxious about exams", 1, 4, 1.5, "Cannot sleep, feeling hopeless and exhausted");
    add_checkins(d, "S004", 4, 7, 5, "Enjoying the lab work, feeling good", 5, 7.5, 6, "Proud of my progress this month");
    add_checkins(d, "S005", 3, 6, 3.5, nullptr, 4, 6.5, 4, "Things are getting better");
    add_checkins(d, "S006", 2, 5, 2.5, "Struggling to keep up and feeling lost", 3, 5.5, 3, "A little less worried now");
    add_checkins(d, "S007", 4, 7, 5, "Good balance between study and rest", 4, 7.5, 5, "Happy with my grades");
    add_checkins(d, "S008", 2, 5, 4, "Too much pressure, I feel burnt out", 2, 5.5, 4.5, "Still stressed and tired");
    add_checkins(d, "S009", 5, 8, 6, "Excited and inspired by the course", 5, 8, 6.5, "Everything is going great");
    add_checkins(d, "S010", 3, 6, 3, "Average week", 3, 6.5, 3.5, nullptr);
    add_checkins(d, "S011", 4, 7, 4.5, "Feeling positive about the term", 3, 6.5, 4, "A bit busy but fine");
    return d;
}

class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{ 0 };
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
            ("student_insight_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string str() const { return path_.string(); }
    std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

} // namespace test_support
