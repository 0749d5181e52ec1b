#pragma once
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "config.hpp"
#include "features.hpp"
#include "models.hpp"
#include "predictors.hpp"
#include "sentiment.hpp"
#include "services.hpp"

/*
-------------------------------------------------------------------------------
 ml_service.hpp - Model lifecycle and student-level predictions
-------------------------------------------------------------------------------
ModelRegistry owns the two models and their lifecycle:

    Untrained --train/lazy--> Training --ok--> Trained
        ^                        |
        +------- failure --------+   (a Trained model stays Trained)

A training run always refits both models from one TrainingSet. Only one run
is in flight at a time; ensure_trained() callers arriving while a run is in
progress wait for it instead of starting another. Freshly fitted models are
swapped in under the lock, so predictions never see a half-trained model.

MlService turns a student id into predictions using a RecordSource and a
registry. Students without academic records yield std::nullopt, and are left
out of batch results.
-------------------------------------------------------------------------------
*/

enum class ModelStatus { Untrained, Training, Trained };

const char* to_string(ModelStatus s);

enum class ModelKind { Performance, Risk };

struct TrainingMetrics {
    RegressionMetrics performance_predictor;
    ClassificationMetrics risk_classifier;
    std::size_t rows{ 0 };
};

class ModelRegistry {
public:
    ModelRegistry(ForestParams regressor, ForestParams classifier);
    explicit ModelRegistry(const InsightConfig& cfg);

    /// Fit both models on `ts`. Waits for an in-flight run first.
    TrainingMetrics train_all(const TrainingSet& ts);

    /// Train both models with `build()` unless `kind` is already trained.
    /// Returns the metrics when this call ran the training.
    std::optional<TrainingMetrics> ensure_trained(ModelKind kind,
        const std::function<TrainingSet()>& build);

    /// Writes every trained model into `dir`.
    void save_all(const std::string& dir) const;

    /// Restores whichever artifacts exist in `dir`. Returns true if at least
    /// one model was loaded.
    bool load_all(const std::string& dir);

    double predict_performance(const FeatureVector& f) const;
    RiskOutcome classify_risk(const FeatureVector& f) const;

    FeatureImportance feature_importance(ModelKind kind) const;
    ModelStatus status(ModelKind kind) const;
    bool is_trained(ModelKind kind) const { return status(kind) == ModelStatus::Trained; }

    std::size_t training_passes() const;
    std::optional<TrainingMetrics> last_metrics() const;

    static std::string artifact_path(const std::string& dir, ModelKind kind);

private:
    TrainingMetrics run_training(std::unique_lock<std::mutex>& lk,
        const std::function<TrainingSet()>& build);
    void wait_idle(std::unique_lock<std::mutex>& lk) const;

    ForestParams regressor_params_;
    ForestParams classifier_params_;

    mutable std::mutex mtx_;
    mutable std::condition_variable idle_;
    PerformancePredictor performance_;
    RiskClassifier risk_;
    ModelStatus performance_status_{ ModelStatus::Untrained };
    ModelStatus risk_status_{ ModelStatus::Untrained };
    std::size_t passes_{ 0 };
    std::optional<TrainingMetrics> last_metrics_;
};

struct SentimentReport {
    SentimentResult result;
    int mental_health_score{ 0 };
    std::string mental_health_label;
};

struct BatchEntry {
    std::string student_id;
    double predicted_score{ 0.0 };
    RiskLevel risk_level{ RiskLevel::Medium };
    std::map<std::string, double> risk_probabilities;
};

struct BatchPrediction {
    std::vector<BatchEntry> predictions;
    std::size_t total_processed{ 0 };
};

struct ModelSummary {
    bool is_trained{ false };
    std::string status;
    std::string model_type;
    FeatureImportance feature_importance;
};

struct ModelInfo {
    ModelSummary performance_predictor;
    ModelSummary risk_classifier;
    std::optional<TrainingMetrics> training_metrics;
    std::size_t training_passes{ 0 };
};

class MlService {
public:
    MlService(const RecordSource& source, ModelRegistry& registry,
        SentimentScorer& scorer, std::string model_dir);

    /// Build the training set, fit both models and persist them.
    TrainingMetrics train_models();

    /// Restore saved models from the model directory.
    bool load_models();

    std::optional<PerformancePrediction> predict_performance(const std::string& student_id);
    std::optional<RiskPrediction> classify_risk(const std::string& student_id);

    /// Unknown students are skipped; total_processed counts the results.
    BatchPrediction batch_predict(const std::vector<std::string>& student_ids);

    SentimentReport analyze_sentiment(const std::string& text);

    ModelInfo model_info() const;

private:
    void ensure_trained(ModelKind kind);

    const RecordSource& source_;
    ModelRegistry& registry_;
    SentimentScorer& scorer_;
    std::string model_dir_;
};

/// Banded text for a predicted score (80 / 60 / 40).
std::string interpret_prediction(double score);

/// "High risk detected with 87.0% confidence. ..."
std::string interpret_risk(RiskLevel level, const std::map<std::string, double>& probabilities);
