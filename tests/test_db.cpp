#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "db.hpp"
#include "errors.hpp"
#include "ml_service.hpp"
#include "test_support.hpp"

using test_support::TempDir;
using test_support::small_forest;

namespace {

// Captures std::cerr for the lifetime of the object.
class CerrCapture {
public:
    CerrCapture() : old_(std::cerr.rdbuf(buf_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(old_); }
    std::string str() const { return buf_.str(); }

private:
    std::ostringstream buf_;
    std::streambuf* old_;
};

class DbTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(db_open(db_, ":memory:"));
        ASSERT_TRUE(db_init_and_seed(db_, true));
    }
    void TearDown() override { db_close(db_); }

    sqlite3* db_ = nullptr;
};

} // namespace

TEST_F(DbTest, SeedsDemoCohort) {
    DbCounts c;
    ASSERT_TRUE(db_get_counts(db_, c));
    EXPECT_EQ(c.students, 12);
    EXPECT_EQ(c.academic_records, 24);
    EXPECT_EQ(c.behavior_records, 22);
}

TEST_F(DbTest, InitIsIdempotent) {
    ASSERT_TRUE(db_init_and_seed(db_, true));
    SqliteRecordStore store(db_);
    EXPECT_EQ(store.counts().academic_records, 24);
}

TEST(Db, InitWithoutSeedLeavesTablesEmpty) {
    sqlite3* db = nullptr;
    ASSERT_TRUE(db_open(db, ":memory:"));
    ASSERT_TRUE(db_init_and_seed(db, false));
    DbCounts c;
    ASSERT_TRUE(db_get_counts(db, c));
    EXPECT_EQ(c.students, 0);
    EXPECT_EQ(c.behavior_records, 0);
    db_close(db);
}

TEST_F(DbTest, ListsOnlyStudentsOrderedById) {
    SqliteRecordStore store(db_);
    const auto all = store.list_students();
    ASSERT_EQ(all.size(), 12u);
    EXPECT_EQ(all.front().student_id, "S001");
    EXPECT_EQ(all.back().student_id, "S012");
    for (const auto& s : all) EXPECT_EQ(s.role, "student");

    const auto cs = store.list_students(std::string("Computer Science"));
    std::vector<std::string> ids;
    for (const auto& s : cs) ids.push_back(s.student_id);
    EXPECT_EQ(ids, (std::vector<std::string>{ "S001", "S002", "S003", "S010" }));
}

TEST_F(DbTest, RecordsComeBackInTimeOrder) {
    SqliteRecordStore store(db_);
    const auto academics = store.list_academic_records("S002");
    ASSERT_EQ(academics.size(), 2u);
    EXPECT_DOUBLE_EQ(academics[0].marks, 72);
    EXPECT_DOUBLE_EQ(academics[1].marks, 68);
    EXPECT_EQ(academics[0].recorded_at, "2026-01-15 09:00:00");

    const auto behaviors = store.list_behavior_records("S005");
    ASSERT_EQ(behaviors.size(), 2u);
    EXPECT_FALSE(behaviors[0].text_feedback.has_value());
    ASSERT_TRUE(behaviors[1].text_feedback.has_value());
    EXPECT_EQ(*behaviors[1].text_feedback, "Things are getting better");

    EXPECT_TRUE(store.list_behavior_records("S012").empty());
    EXPECT_TRUE(store.list_academic_records("S999").empty());
}

TEST_F(DbTest, InsertStampsMissingTimestamp) {
    SqliteRecordStore store(db_);
    BehaviorRecord b;
    b.student_id = "S012";
    b.mood_score = 2;
    b.sleep_hours = 5;
    b.study_hours = 3;
    store.add_behavior_record(b);

    const auto rows = store.list_behavior_records("S012");
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].recorded_at.size(), 19u);
    EXPECT_FALSE(rows[0].text_feedback.has_value());

    store.add_academic_record({ "S012", 51, 75, 55, "2026-03-15 09:00:00" });
    EXPECT_EQ(store.list_academic_records("S012").size(), 3u);
}

TEST_F(DbTest, UnknownStudentIsRejected) {
    SqliteRecordStore store(db_);
    EXPECT_THROW(store.add_academic_record({ "S999", 50, 50, 50, "" }), StorageError);

    BehaviorRecord b;
    b.student_id = "S999";
    EXPECT_THROW(store.add_behavior_record(b), StorageError);
    EXPECT_FALSE(db_add_academic_record(db_, { "S999", 50, 50, 50, "" }));
}

TEST_F(DbTest, CheckInIsAllOrNothing) {
    SqliteRecordStore store(db_);
    BehaviorRecord b;
    b.student_id = "S001";
    b.mood_score = 4;
    b.sleep_hours = 7;
    b.study_hours = 5;

    // behavior row goes in first, then the academic row hits the foreign key
    EXPECT_THROW(store.add_check_in(b, { "S999", 60, 80, 70, "" }), StorageError);
    std::string error;
    EXPECT_FALSE(db_add_check_in(db_, b, { "S999", 60, 80, 70, "" }, error));
    EXPECT_FALSE(error.empty());
    EXPECT_EQ(store.list_behavior_records("S001").size(), 2u);
    EXPECT_EQ(store.counts().behavior_records, 22);

    store.add_check_in(b, { "S001", 60, 80, 70, "" });
    EXPECT_EQ(store.list_behavior_records("S001").size(), 3u);
    EXPECT_EQ(store.list_academic_records("S001").size(), 3u);
}

TEST_F(DbTest, MoodOutsideScaleIsRejected) {
    BehaviorRecord b;
    b.student_id = "S001";
    b.mood_score = 9;
    EXPECT_FALSE(db_add_behavior_record(db_, b));
}

TEST_F(DbTest, DuplicateStudentIsRejected) {
    SqliteRecordStore store(db_);
    store.add_student({ "S013", "New Kid", "new@school.test", "student", "Business" });
    EXPECT_EQ(store.counts().students, 13);
    EXPECT_THROW(store.add_student({ "S013", "Other", "o@school.test", "student", "Business" }), StorageError);
}

TEST_F(DbTest, PredictionsOverSqliteStore) {
    SqliteRecordStore store(db_);
    ModelRegistry registry(small_forest(), small_forest());
    SentimentScorer scorer;
    TempDir dir;
    MlService service(store, registry, scorer, dir.str());

    const auto p = service.predict_performance("S001");
    ASSERT_TRUE(p.has_value());
    EXPECT_GT(p->predicted_score, 60.0);
    EXPECT_EQ(registry.training_passes(), 1u);
    EXPECT_EQ(registry.last_metrics()->rows, 12u);

    EXPECT_FALSE(service.classify_risk("T001").has_value());
}

TEST(Db, OpenFailureGoesThroughTheLogger) {
    sqlite3* db = nullptr;
    {
        CerrCapture cap;
        EXPECT_FALSE(db_open(db, "/student_insight_missing_dir/insight.db"));
        EXPECT_NE(cap.str().find("[ERROR] Failed to open DB"), std::string::npos);
    }
    EXPECT_EQ(db, nullptr);
}

TEST_F(DbTest, SqlErrorsGoThroughTheLogger) {
    ASSERT_EQ(sqlite3_exec(db_, "BEGIN;", nullptr, nullptr, nullptr), SQLITE_OK);
    BehaviorRecord b;
    b.student_id = "S001";
    b.mood_score = 3;
    std::string error;
    {
        // a nested BEGIN fails inside the check-in helper
        CerrCapture cap;
        EXPECT_FALSE(db_add_check_in(db_, b, { "S001", 50, 50, 50, "" }, error));
        EXPECT_NE(cap.str().find("[ERROR] SQL error:"), std::string::npos);
    }
    EXPECT_FALSE(error.empty());
    ASSERT_EQ(sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr), SQLITE_OK);
}
