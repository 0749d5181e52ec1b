#include <gtest/gtest.h>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "helpers.hpp"
#include "ml_service.hpp"
#include "test_support.hpp"

using test_support::TempDir;
using test_support::demo_data;
using test_support::small_forest;

namespace {

class MlServiceTest : public ::testing::Test {
protected:
    MlServiceTest()
        : data_(demo_data()), store_(data_),
          registry_(small_forest(), small_forest()),
          service_(store_, registry_, scorer_, dir_.str()) {}

    TempDir dir_;
    DataStore data_;
    MemoryRecordStore store_;
    SentimentScorer scorer_;
    ModelRegistry registry_;
    MlService service_;
};

} // namespace

TEST(ModelStatus, Names) {
    EXPECT_STREQ(to_string(ModelStatus::Untrained), "untrained");
    EXPECT_STREQ(to_string(ModelStatus::Training), "training");
    EXPECT_STREQ(to_string(ModelStatus::Trained), "trained");
}

TEST(Interpretation, PredictionBands) {
    EXPECT_EQ(interpret_prediction(85), "Excellent performance expected. Keep up the great work!");
    EXPECT_EQ(interpret_prediction(60), "Good performance expected. Consider focusing on weaker areas.");
    EXPECT_EQ(interpret_prediction(45), "Average performance expected. Additional effort and support recommended.");
    EXPECT_EQ(interpret_prediction(12), "Below average performance predicted. Immediate intervention recommended.");
}

TEST(Interpretation, RiskUsesTopProbability) {
    const std::map<std::string, double> p = { { "Low", 0.1 }, { "Medium", 0.2 }, { "High", 0.7 } };
    EXPECT_EQ(interpret_risk(RiskLevel::High, p),
        "High risk detected with 70.0% confidence. Immediate attention required.");
    EXPECT_EQ(interpret_risk(RiskLevel::Medium, { { "Low", 0.4 }, { "Medium", 0.6 }, { "High", 0.0 } }),
        "Medium risk detected with 60.0% confidence. Monitor progress closely.");
    EXPECT_EQ(interpret_risk(RiskLevel::Low, { { "Low", 0.875 }, { "Medium", 0.125 }, { "High", 0.0 } }),
        "Low risk with 87.5% confidence. Student is performing well.");
}

TEST_F(MlServiceTest, FirstPredictionTrainsOnce) {
    EXPECT_EQ(registry_.status(ModelKind::Performance), ModelStatus::Untrained);

    const auto p = service_.predict_performance("S001");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(registry_.training_passes(), 1u);
    EXPECT_EQ(registry_.status(ModelKind::Performance), ModelStatus::Trained);
    EXPECT_EQ(registry_.status(ModelKind::Risk), ModelStatus::Trained);

    const auto again = service_.predict_performance("S001");
    const auto risk = service_.classify_risk("S002");
    ASSERT_TRUE(again.has_value());
    ASSERT_TRUE(risk.has_value());
    EXPECT_EQ(registry_.training_passes(), 1u);
    EXPECT_DOUBLE_EQ(again->predicted_score, p->predicted_score);

    // lazy training persists the fresh models
    EXPECT_TRUE(std::filesystem::exists(ModelRegistry::artifact_path(dir_.str(), ModelKind::Performance)));
    EXPECT_TRUE(std::filesystem::exists(ModelRegistry::artifact_path(dir_.str(), ModelKind::Risk)));
}

TEST_F(MlServiceTest, PredictionCarriesFeaturesAndImportance) {
    const auto p = service_.predict_performance("S012");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->student_id, "S012");
    EXPECT_GE(p->predicted_score, 0.0);
    EXPECT_LE(p->predicted_score, 100.0);
    EXPECT_DOUBLE_EQ(p->predicted_score, round_to(p->predicted_score, 2));
    EXPECT_DOUBLE_EQ(p->current_features.avg_mood, 3.0);
    EXPECT_EQ(p->feature_importance.size(), kFeatureCount);
    EXPECT_EQ(p->interpretation, interpret_prediction(p->predicted_score));

    const auto r = service_.classify_risk("S003");
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->probabilities.size(), 3u);
    EXPECT_EQ(r->interpretation, interpret_risk(r->risk_level, r->probabilities));
}

TEST_F(MlServiceTest, UnknownStudentDoesNotTrain) {
    EXPECT_FALSE(service_.predict_performance("S999").has_value());
    EXPECT_FALSE(service_.classify_risk("S999").has_value());
    EXPECT_EQ(registry_.training_passes(), 0u);
    EXPECT_FALSE(registry_.is_trained(ModelKind::Performance));
}

TEST_F(MlServiceTest, BatchSkipsUnknownStudents) {
    const BatchPrediction b = service_.batch_predict({ "S001", "S999" });
    ASSERT_EQ(b.predictions.size(), 1u);
    EXPECT_EQ(b.total_processed, 1u);
    EXPECT_EQ(b.predictions[0].student_id, "S001");
    EXPECT_EQ(b.predictions[0].risk_probabilities.size(), 3u);
    EXPECT_EQ(registry_.training_passes(), 1u);
}

TEST_F(MlServiceTest, ConcurrentFirstPredictionsShareOneTraining) {
    std::vector<std::thread> workers;
    std::vector<int> ok(6, 0);
    for (int i = 0; i < 6; ++i) {
        workers.emplace_back([this, &ok, i] {
            if (i % 2 == 0) ok[i] = service_.predict_performance("S00" + std::to_string(i + 1)).has_value();
            else ok[i] = service_.classify_risk("S00" + std::to_string(i + 1)).has_value();
        });
    }
    for (auto& t : workers) t.join();

    for (int v : ok) EXPECT_EQ(v, 1);
    EXPECT_EQ(registry_.training_passes(), 1u);
}

TEST_F(MlServiceTest, ExplicitTrainingReportsMetrics) {
    const TrainingMetrics m = service_.train_models();
    EXPECT_EQ(m.rows, 12u);
    EXPECT_EQ(m.performance_predictor.test_rows, 3u);
    EXPECT_EQ(m.risk_classifier.per_class.size(), 3u);
    EXPECT_EQ(registry_.training_passes(), 1u);

    service_.train_models();
    EXPECT_EQ(registry_.training_passes(), 2u);

    const ModelInfo info = service_.model_info();
    EXPECT_TRUE(info.performance_predictor.is_trained);
    EXPECT_EQ(info.performance_predictor.status, "trained");
    EXPECT_EQ(info.performance_predictor.model_type, "RandomForestRegressor");
    EXPECT_EQ(info.risk_classifier.model_type, "RandomForestClassifier");
    EXPECT_EQ(info.risk_classifier.feature_importance.size(), kFeatureCount);
    ASSERT_TRUE(info.training_metrics.has_value());
    EXPECT_EQ(info.training_metrics->rows, 12u);
    EXPECT_EQ(info.training_passes, 2u);
}

TEST_F(MlServiceTest, UntrainedModelInfo) {
    const ModelInfo info = service_.model_info();
    EXPECT_FALSE(info.performance_predictor.is_trained);
    EXPECT_EQ(info.performance_predictor.status, "untrained");
    EXPECT_TRUE(info.performance_predictor.feature_importance.empty());
    EXPECT_FALSE(info.training_metrics.has_value());
}

TEST_F(MlServiceTest, SavedModelsLoadWithoutRetraining) {
    service_.train_models();
    const auto before = service_.predict_performance("S004");
    ASSERT_TRUE(before.has_value());

    ModelRegistry fresh(small_forest(), small_forest());
    MlService reloaded(store_, fresh, scorer_, dir_.str());
    ASSERT_TRUE(reloaded.load_models());
    EXPECT_TRUE(fresh.is_trained(ModelKind::Performance));
    EXPECT_TRUE(fresh.is_trained(ModelKind::Risk));

    const auto after = reloaded.predict_performance("S004");
    ASSERT_TRUE(after.has_value());
    EXPECT_DOUBLE_EQ(after->predicted_score, before->predicted_score);
    EXPECT_EQ(fresh.training_passes(), 0u);
}

TEST_F(MlServiceTest, LoadFromEmptyDirectory) {
    EXPECT_FALSE(service_.load_models());
    EXPECT_FALSE(registry_.is_trained(ModelKind::Risk));
}

TEST_F(MlServiceTest, EmptyStoreFailsTrainingAndRollsBack) {
    DataStore empty;
    MemoryRecordStore empty_store(empty);
    MlService svc(empty_store, registry_, scorer_, dir_.str());
    EXPECT_THROW(svc.train_models(), NoDataError);
    EXPECT_EQ(registry_.status(ModelKind::Performance), ModelStatus::Untrained);
    EXPECT_EQ(registry_.status(ModelKind::Risk), ModelStatus::Untrained);
    EXPECT_EQ(registry_.training_passes(), 0u);
}

TEST(ModelRegistry, FailedRetrainKeepsTrainedModels) {
    DataStore data = demo_data();
    MemoryRecordStore store(data);
    ModelRegistry registry(small_forest(), small_forest());
    registry.train_all(build_training_set(store));

    const FeatureVector f = aggregate_features(store, "S001").features;
    const double before = registry.predict_performance(f);

    EXPECT_THROW(registry.train_all(TrainingSet{}), NoDataError);
    EXPECT_EQ(registry.status(ModelKind::Performance), ModelStatus::Trained);
    EXPECT_DOUBLE_EQ(registry.predict_performance(f), before);
    EXPECT_EQ(registry.training_passes(), 1u);
}

TEST(ModelRegistry, ThrowingBuilderRestoresStatus) {
    ModelRegistry registry(small_forest(), small_forest());
    EXPECT_THROW(registry.ensure_trained(ModelKind::Risk, []() -> TrainingSet { throw std::runtime_error("boom"); }),
        std::runtime_error);
    EXPECT_EQ(registry.status(ModelKind::Risk), ModelStatus::Untrained);
    EXPECT_EQ(registry.status(ModelKind::Performance), ModelStatus::Untrained);

    // the registry is idle again, so a later run is not blocked
    DataStore data = demo_data();
    MemoryRecordStore store(data);
    EXPECT_TRUE(registry.ensure_trained(ModelKind::Risk, [&] { return build_training_set(store); }).has_value());
    EXPECT_TRUE(registry.is_trained(ModelKind::Risk));
}

TEST(ModelRegistry, EnsureTrainedSkipsTrainedModel) {
    DataStore data = demo_data();
    MemoryRecordStore store(data);
    ModelRegistry registry(small_forest(), small_forest());

    int builds = 0;
    auto build = [&] { ++builds; return build_training_set(store); };
    EXPECT_TRUE(registry.ensure_trained(ModelKind::Performance, build).has_value());
    EXPECT_FALSE(registry.ensure_trained(ModelKind::Performance, build).has_value());
    EXPECT_FALSE(registry.ensure_trained(ModelKind::Risk, build).has_value());
    EXPECT_EQ(builds, 1);
}

TEST(ModelRegistry, UntrainedPredictionThrows) {
    ModelRegistry registry(small_forest(), small_forest());
    EXPECT_THROW(registry.predict_performance(FeatureVector{}), NotTrainedError);
    EXPECT_THROW(registry.classify_risk(FeatureVector{}), NotTrainedError);
}

TEST(MlServiceSentiment, ReportsMentalHealth) {
    DataStore data;
    MemoryRecordStore store(data);
    ModelRegistry registry(small_forest(), small_forest());
    SentimentScorer scorer;
    TempDir dir;
    MlService service(store, registry, scorer, dir.str());

    const SentimentReport r = service.analyze_sentiment("I am stressed and anxious about exams");
    EXPECT_EQ(r.result.sentiment, Sentiment::Negative);
    EXPECT_EQ(r.mental_health_score, mental_health_score(r.result));
    EXPECT_EQ(r.mental_health_label, mental_health_label(r.mental_health_score));
    // 5.5 - 0.375 * 2.5 - 2 * 0.5 = 3.5625
    EXPECT_EQ(r.mental_health_score, 4);
    EXPECT_EQ(r.mental_health_label, "Fair - Monitor closely");
}
