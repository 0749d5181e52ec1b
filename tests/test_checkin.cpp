#include <gtest/gtest.h>
#include "checkin.hpp"
#include "errors.hpp"
#include "test_support.hpp"

using test_support::TempDir;
using test_support::demo_data;
using test_support::small_forest;

namespace {

class CheckInTest : public ::testing::Test {
protected:
    CheckInTest()
        : data_(demo_data()), store_(data_),
          registry_(small_forest(), small_forest()),
          service_(store_, registry_, scorer_, dir_.str()) {}

    static CheckIn struggling_week() {
        CheckIn in;
        in.marks = 55;
        in.attendance = 70;
        in.assignment_score = 60;
        in.concentration = 2;
        in.confidence = 2;
        in.mental_fatigue = 5;
        in.sleep_hours = 5;
        in.study_hours = 3;
        in.text = std::string("I feel overwhelmed and tired");
        return in;
    }

    TempDir dir_;
    DataStore data_;
    MemoryRecordStore store_;
    SentimentScorer scorer_;
    ModelRegistry registry_;
    MlService service_;
};

} // namespace

TEST(CheckInMood, AveragesAnswersWithFatigueInverted) {
    EXPECT_EQ(check_in_mood(4, 4, 2), 4);
    EXPECT_EQ(check_in_mood(1, 1, 5), 1);
    EXPECT_EQ(check_in_mood(5, 5, 1), 5);
    EXPECT_EQ(check_in_mood(3, 4, 2), 4);
    EXPECT_EQ(check_in_mood(2, 3, 4), 2);
}

TEST(CheckInMood, AnswersMustBeOnTheScale) {
    EXPECT_THROW(check_in_mood(0, 3, 3), InvalidInputError);
    EXPECT_THROW(check_in_mood(3, 6, 3), InvalidInputError);
    EXPECT_THROW(check_in_mood(3, 3, 9), InvalidInputError);
}

TEST_F(CheckInTest, StoresRecordsAndPredicts) {
    const CheckInResult r = submit_check_in(store_, service_, "S012", struggling_week());

    EXPECT_EQ(r.mood_score, 2);
    EXPECT_EQ(r.sentiment_label, "Negative");
    ASSERT_TRUE(r.prediction.has_value());
    ASSERT_TRUE(r.risk.has_value());
    EXPECT_EQ(r.prediction->student_id, "S012");

    const auto behaviors = store_.list_behavior_records("S012");
    ASSERT_EQ(behaviors.size(), 1u);
    EXPECT_EQ(behaviors[0].mood_score, 2);
    ASSERT_TRUE(behaviors[0].text_feedback.has_value());
    EXPECT_EQ(*behaviors[0].text_feedback, "I feel overwhelmed and tired");
    EXPECT_EQ(store_.list_academic_records("S012").size(), 3u);

    // the new check-in replaces the default wellbeing features
    EXPECT_DOUBLE_EQ(r.prediction->current_features.avg_mood, 2.0);
    EXPECT_DOUBLE_EQ(r.prediction->current_features.avg_sleep_hours, 5.0);
}

TEST_F(CheckInTest, WithoutTextScoresTheAnswers) {
    CheckIn in = struggling_week();
    in.text.reset();
    in.concentration = 4;
    in.confidence = 4;
    in.mental_fatigue = 2;

    const CheckInResult r = submit_check_in(store_, service_, "S001", in);
    EXPECT_EQ(r.mood_score, 4);
    EXPECT_EQ(r.sentiment_label,
        to_string(scorer_.analyze("Concentration: 4, Confidence: 4, Fatigue: 2").sentiment));
    const auto behaviors = store_.list_behavior_records("S001");
    ASSERT_EQ(behaviors.size(), 3u);
    EXPECT_FALSE(behaviors.back().text_feedback.has_value());
}

TEST_F(CheckInTest, BlankTextIsStoredAsMissing) {
    CheckIn in = struggling_week();
    in.text = std::string("   ");
    submit_check_in(store_, service_, "S001", in);
    EXPECT_FALSE(store_.list_behavior_records("S001").back().text_feedback.has_value());
}

TEST_F(CheckInTest, InvalidInputWritesNothing) {
    CheckIn bad_scale = struggling_week();
    bad_scale.concentration = 6;
    EXPECT_THROW(submit_check_in(store_, service_, "S012", bad_scale), InvalidInputError);

    CheckIn bad_marks = struggling_week();
    bad_marks.marks = 120;
    EXPECT_THROW(submit_check_in(store_, service_, "S012", bad_marks), InvalidInputError);

    CheckIn bad_sleep = struggling_week();
    bad_sleep.sleep_hours = 30;
    EXPECT_THROW(submit_check_in(store_, service_, "S012", bad_sleep), InvalidInputError);

    EXPECT_THROW(submit_check_in(store_, service_, "12", struggling_week()), InvalidInputError);

    EXPECT_TRUE(store_.list_behavior_records("S012").empty());
    EXPECT_EQ(store_.list_academic_records("S012").size(), 2u);
    EXPECT_EQ(registry_.training_passes(), 0u);
}

TEST_F(CheckInTest, UnknownStudentIsAStorageError) {
    EXPECT_THROW(submit_check_in(store_, service_, "S999", struggling_week()), StorageError);
    EXPECT_TRUE(store_.list_academic_records("S999").empty());
}

TEST_F(CheckInTest, MemoryStoreWritesBothRecordsOrNeither) {
    BehaviorRecord b;
    b.student_id = "S001";
    b.mood_score = 3;
    EXPECT_THROW(store_.add_check_in(b, { "S999", 50, 50, 50, "" }), StorageError);
    EXPECT_EQ(store_.list_behavior_records("S001").size(), 2u);
    EXPECT_EQ(store_.list_academic_records("S001").size(), 2u);
}
