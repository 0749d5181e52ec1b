#include "ml_service.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>
#include "errors.hpp"
#include "helpers.hpp"
#include "log.hpp"

const char* to_string(ModelStatus s) {
    switch (s) {
    case ModelStatus::Training: return "training";
    case ModelStatus::Trained:  return "trained";
    default:                    return "untrained";
    }
}

// ============================================================
// ModelRegistry
// ============================================================

ModelRegistry::ModelRegistry(ForestParams regressor, ForestParams classifier)
    : regressor_params_(regressor), classifier_params_(classifier),
      performance_(regressor), risk_(classifier) {}

ModelRegistry::ModelRegistry(const InsightConfig& cfg)
    : ModelRegistry(cfg.regressor, cfg.classifier) {}

std::string ModelRegistry::artifact_path(const std::string& dir, ModelKind kind) {
    const char* file = kind == ModelKind::Performance ? "performance_predictor.model" : "risk_classifier.model";
    return (std::filesystem::path(dir) / file).string();
}

void ModelRegistry::wait_idle(std::unique_lock<std::mutex>& lk) const {
    idle_.wait(lk, [this] {
        return performance_status_ != ModelStatus::Training && risk_status_ != ModelStatus::Training;
    });
}

TrainingMetrics ModelRegistry::run_training(std::unique_lock<std::mutex>& lk,
    const std::function<TrainingSet()>& build) {
    const ModelStatus prev_performance = performance_status_;
    const ModelStatus prev_risk = risk_status_;
    performance_status_ = ModelStatus::Training;
    risk_status_ = ModelStatus::Training;
    lk.unlock();

    PerformancePredictor performance(regressor_params_);
    RiskClassifier risk(classifier_params_);
    TrainingMetrics metrics;
    try {
        const TrainingSet ts = build();
        log_info("training models on " + std::to_string(ts.size()) + " students");
        metrics.rows = ts.size();
        metrics.performance_predictor = performance.train(ts.features, ts.marks_labels);
        metrics.risk_classifier = risk.train(ts.features, ts.risk_labels);
    }
    catch (...) {
        lk.lock();
        performance_status_ = prev_performance;
        risk_status_ = prev_risk;
        idle_.notify_all();
        throw;
    }

    lk.lock();
    performance_ = std::move(performance);
    risk_ = std::move(risk);
    performance_status_ = ModelStatus::Trained;
    risk_status_ = ModelStatus::Trained;
    ++passes_;
    last_metrics_ = metrics;
    idle_.notify_all();

    log_info("models trained: r2=" + std::to_string(metrics.performance_predictor.r2) +
        " accuracy=" + std::to_string(metrics.risk_classifier.accuracy));
    return metrics;
}

TrainingMetrics ModelRegistry::train_all(const TrainingSet& ts) {
    std::unique_lock<std::mutex> lk(mtx_);
    wait_idle(lk);
    return run_training(lk, [&ts] { return ts; });
}

std::optional<TrainingMetrics> ModelRegistry::ensure_trained(ModelKind kind,
    const std::function<TrainingSet()>& build) {
    std::unique_lock<std::mutex> lk(mtx_);
    wait_idle(lk);
    const ModelStatus s = kind == ModelKind::Performance ? performance_status_ : risk_status_;
    if (s == ModelStatus::Trained) return std::nullopt;

    log_info(std::string("lazy training: ") +
        (kind == ModelKind::Performance ? "performance predictor" : "risk classifier") + " is untrained");
    return run_training(lk, build);
}

void ModelRegistry::save_all(const std::string& dir) const {
    std::unique_lock<std::mutex> lk(mtx_);
    wait_idle(lk);

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) throw StorageError("cannot create model directory " + dir + ": " + ec.message());

    if (performance_status_ == ModelStatus::Trained)
        performance_.save(artifact_path(dir, ModelKind::Performance));
    if (risk_status_ == ModelStatus::Trained)
        risk_.save(artifact_path(dir, ModelKind::Risk));
    log_debug("saved models to " + dir);
}

bool ModelRegistry::load_all(const std::string& dir) {
    std::unique_lock<std::mutex> lk(mtx_);
    wait_idle(lk);

    PerformancePredictor performance(regressor_params_);
    RiskClassifier risk(classifier_params_);
    const bool got_performance = performance.load(artifact_path(dir, ModelKind::Performance));
    const bool got_risk = risk.load(artifact_path(dir, ModelKind::Risk));

    if (got_performance) {
        performance_ = std::move(performance);
        performance_status_ = ModelStatus::Trained;
    }
    if (got_risk) {
        risk_ = std::move(risk);
        risk_status_ = ModelStatus::Trained;
    }
    if (!got_performance && !got_risk) log_info("no saved models in " + dir);
    return got_performance || got_risk;
}

double ModelRegistry::predict_performance(const FeatureVector& f) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return performance_.predict(f);
}

RiskOutcome ModelRegistry::classify_risk(const FeatureVector& f) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return risk_.predict(f);
}

FeatureImportance ModelRegistry::feature_importance(ModelKind kind) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return kind == ModelKind::Performance ? performance_.feature_importance() : risk_.feature_importance();
}

ModelStatus ModelRegistry::status(ModelKind kind) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return kind == ModelKind::Performance ? performance_status_ : risk_status_;
}

std::size_t ModelRegistry::training_passes() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return passes_;
}

std::optional<TrainingMetrics> ModelRegistry::last_metrics() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return last_metrics_;
}

// ============================================================
// Interpretation texts
// ============================================================

std::string interpret_prediction(double score) {
    if (score >= 80) return "Excellent performance expected. Keep up the great work!";
    if (score >= 60) return "Good performance expected. Consider focusing on weaker areas.";
    if (score >= 40) return "Average performance expected. Additional effort and support recommended.";
    return "Below average performance predicted. Immediate intervention recommended.";
}

std::string interpret_risk(RiskLevel level, const std::map<std::string, double>& probabilities) {
    double confidence = 0.0;
    for (const auto& kv : probabilities) confidence = std::max(confidence, kv.second);

    std::ostringstream pct;
    pct << std::fixed << std::setprecision(1) << confidence * 100.0 << '%';

    switch (level) {
    case RiskLevel::High:
        return "High risk detected with " + pct.str() + " confidence. Immediate attention required.";
    case RiskLevel::Medium:
        return "Medium risk detected with " + pct.str() + " confidence. Monitor progress closely.";
    default:
        return "Low risk with " + pct.str() + " confidence. Student is performing well.";
    }
}

// ============================================================
// MlService
// ============================================================

MlService::MlService(const RecordSource& source, ModelRegistry& registry,
    SentimentScorer& scorer, std::string model_dir)
    : source_(source), registry_(registry), scorer_(scorer), model_dir_(std::move(model_dir)) {}

TrainingMetrics MlService::train_models() {
    const TrainingSet ts = build_training_set(source_);
    TrainingMetrics m = registry_.train_all(ts);
    registry_.save_all(model_dir_);
    return m;
}

bool MlService::load_models() {
    return registry_.load_all(model_dir_);
}

void MlService::ensure_trained(ModelKind kind) {
    const auto trained = registry_.ensure_trained(kind, [this] { return build_training_set(source_); });
    if (!trained) return;
    try {
        registry_.save_all(model_dir_);
    }
    catch (const StorageError& e) {
        // the in-memory models are usable; only persistence failed
        log_error(std::string("could not save models after lazy training: ") + e.what());
    }
}

std::optional<PerformancePrediction> MlService::predict_performance(const std::string& student_id) {
    StudentSummary summary;
    try {
        summary = aggregate_features(source_, student_id);
    }
    catch (const NoDataError& e) {
        log_debug(e.what());
        return std::nullopt;
    }

    ensure_trained(ModelKind::Performance);
    const double score = registry_.predict_performance(summary.features);

    PerformancePrediction p;
    p.student_id = student_id;
    p.predicted_score = round_to(score, 2);
    p.current_features = summary.features;
    p.feature_importance = registry_.feature_importance(ModelKind::Performance);
    p.interpretation = interpret_prediction(score);
    return p;
}

std::optional<RiskPrediction> MlService::classify_risk(const std::string& student_id) {
    StudentSummary summary;
    try {
        summary = aggregate_features(source_, student_id);
    }
    catch (const NoDataError& e) {
        log_debug(e.what());
        return std::nullopt;
    }

    ensure_trained(ModelKind::Risk);
    const RiskOutcome outcome = registry_.classify_risk(summary.features);

    RiskPrediction r;
    r.student_id = student_id;
    r.risk_level = outcome.level;
    r.probabilities = outcome.probabilities;
    r.current_features = summary.features;
    r.feature_importance = registry_.feature_importance(ModelKind::Risk);
    r.interpretation = interpret_risk(outcome.level, outcome.probabilities);
    return r;
}

BatchPrediction MlService::batch_predict(const std::vector<std::string>& student_ids) {
    BatchPrediction out;
    for (const auto& id : student_ids) {
        const auto perf = predict_performance(id);
        if (!perf) continue;
        const auto risk = classify_risk(id);
        if (!risk) continue;

        BatchEntry e;
        e.student_id = id;
        e.predicted_score = perf->predicted_score;
        e.risk_level = risk->risk_level;
        e.risk_probabilities = risk->probabilities;
        out.predictions.push_back(std::move(e));
    }
    out.total_processed = out.predictions.size();
    return out;
}

SentimentReport MlService::analyze_sentiment(const std::string& text) {
    SentimentReport r;
    r.result = scorer_.analyze(text);
    r.mental_health_score = mental_health_score(r.result);
    r.mental_health_label = mental_health_label(r.mental_health_score);
    return r;
}

ModelInfo MlService::model_info() const {
    ModelInfo info;
    info.performance_predictor.status = to_string(registry_.status(ModelKind::Performance));
    info.performance_predictor.is_trained = registry_.is_trained(ModelKind::Performance);
    info.performance_predictor.model_type = PerformancePredictor::model_type();
    info.performance_predictor.feature_importance = registry_.feature_importance(ModelKind::Performance);

    info.risk_classifier.status = to_string(registry_.status(ModelKind::Risk));
    info.risk_classifier.is_trained = registry_.is_trained(ModelKind::Risk);
    info.risk_classifier.model_type = RiskClassifier::model_type();
    info.risk_classifier.feature_importance = registry_.feature_importance(ModelKind::Risk);

    info.training_metrics = registry_.last_metrics();
    info.training_passes = registry_.training_passes();
    return info;
}
