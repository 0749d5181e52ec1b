#include "predictors.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <map>
#include <utility>
#include "errors.hpp"
#include "helpers.hpp"
#include "log.hpp"
#include "validation.hpp"

namespace {

constexpr double kTestFraction = 0.2;
constexpr const char* kArtifactFormat = "StudentInsightModel";
constexpr const char* kArtifactVersion = "1";

const char* const kRiskNames[RiskClassifier::kClassCount] = { "Low", "Medium", "High" };

void check_rows(const Matrix& X, std::size_t n_labels, const char* who) {
    if (X.empty()) throw NoDataError(std::string(who) + ": no training rows");
    if (X.size() != n_labels) throw InvalidInputError(std::string(who) + ": feature/label count mismatch");
    for (const auto& row : X) validate_feature_row(row);
}

FeatureImportance to_importance_map(const std::vector<double>& values) {
    FeatureImportance out;
    const auto& names = feature_names();
    for (std::size_t j = 0; j < names.size() && j < values.size(); ++j) out[names[j]] = values[j];
    return out;
}

void write_artifact(const std::string& path, const char* model_name,
    const StandardScaler& scaler, const RandomForest& forest) {
    std::ofstream ofs(path);
    if (!ofs) throw StorageError("cannot open model artifact for writing: " + path);

    ofs.precision(17);
    ofs << "format=" << kArtifactFormat << "\n";
    ofs << "version=" << kArtifactVersion << "\n";
    ofs << "model_name=" << model_name << "\n";
    ofs << "feature_count=" << kFeatureCount << "\n";
    ofs << "is_trained=1\n";
    ofs << "body\n";
    scaler.write(ofs);
    forest.write(ofs);
    if (!ofs) throw StorageError("failed writing model artifact: " + path);
}

// Returns false when the file does not exist. Commits into scaler/forest only
// after the whole artifact parsed.
bool read_artifact(const std::string& path, const char* model_name,
    StandardScaler& scaler, RandomForest& forest) {
    if (!std::filesystem::exists(path)) return false;

    std::ifstream ifs(path);
    if (!ifs) throw StorageError("cannot open model artifact: " + path);

    std::map<std::string, std::string> kv;
    std::string line;
    bool body = false;
    while (std::getline(ifs, line)) {
        if (line == "body") { body = true; break; }
        const auto eq = line.find('=');
        if (eq == std::string::npos) throw InvalidInputError("model artifact: malformed header line: " + line);
        kv[line.substr(0, eq)] = line.substr(eq + 1);
    }
    if (!body) throw InvalidInputError("model artifact: missing body: " + path);

    auto require = [&](const std::string& key) -> const std::string& {
        auto it = kv.find(key);
        if (it == kv.end()) throw InvalidInputError("model artifact: missing field: " + key);
        return it->second;
    };
    if (require("format") != kArtifactFormat) throw InvalidInputError("model artifact: unknown format");
    if (require("version") != kArtifactVersion) throw InvalidInputError("model artifact: unsupported version");
    if (require("model_name") != model_name) throw InvalidInputError("model artifact: model_name mismatch");
    if (require("feature_count") != std::to_string(kFeatureCount))
        throw InvalidInputError("model artifact: feature_count mismatch");
    if (require("is_trained") != "1") throw InvalidInputError("model artifact: model marked untrained");

    StandardScaler s;
    s.read(ifs);
    RandomForest f = forest;
    f.read(ifs);
    if (!f.fitted() || f.feature_count() != kFeatureCount)
        throw InvalidInputError("model artifact: forest is empty or has the wrong width");

    scaler = std::move(s);
    forest = std::move(f);
    return true;
}

} // namespace

// ============================================================
// Metrics
// ============================================================

RegressionMetrics regression_metrics(const std::vector<double>& truth, const std::vector<double>& predicted) {
    RegressionMetrics m;
    if (truth.empty() || truth.size() != predicted.size()) return m;

    const double n = static_cast<double>(truth.size());
    const double mean = mean_of(truth);
    double ss_res = 0.0, ss_tot = 0.0;
    for (std::size_t i = 0; i < truth.size(); ++i) {
        ss_res += (truth[i] - predicted[i]) * (truth[i] - predicted[i]);
        ss_tot += (truth[i] - mean) * (truth[i] - mean);
    }
    m.mse = ss_res / n;
    m.rmse = std::sqrt(m.mse);
    if (ss_tot > 0) m.r2 = 1.0 - ss_res / ss_tot;
    else m.r2 = ss_res == 0.0 ? 1.0 : 0.0;
    return m;
}

ClassificationMetrics classification_metrics(const std::vector<int>& truth, const std::vector<int>& predicted) {
    ClassificationMetrics m;
    const int k = RiskClassifier::kClassCount;
    std::vector<double> tp(k, 0), pred_count(k, 0), support(k, 0);
    double correct = 0;

    const std::size_t n = std::min(truth.size(), predicted.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int t = truth[i], p = predicted[i];
        if (t >= 0 && t < k) support[t] += 1;
        if (p >= 0 && p < k) pred_count[p] += 1;
        if (t == p) {
            correct += 1;
            if (t >= 0 && t < k) tp[t] += 1;
        }
    }
    m.accuracy = n ? correct / static_cast<double>(n) : 0.0;

    for (int c = 0; c < k; ++c) {
        ClassMetrics cm;
        cm.precision = pred_count[c] > 0 ? tp[c] / pred_count[c] : 0.0;
        cm.recall = support[c] > 0 ? tp[c] / support[c] : 0.0;
        cm.f1 = (cm.precision + cm.recall) > 0
            ? 2.0 * cm.precision * cm.recall / (cm.precision + cm.recall) : 0.0;
        cm.support = static_cast<std::size_t>(support[c]);
        m.per_class[kRiskNames[c]] = cm;
    }
    return m;
}

// ============================================================
// PerformancePredictor
// ============================================================

PerformancePredictor::PerformancePredictor(ForestParams params)
    : params_(params), forest_(TreeTask::Regression, params) {}

RegressionMetrics PerformancePredictor::train(const Matrix& X, const std::vector<double>& y) {
    check_rows(X, y.size(), "PerformancePredictor::train");

    const auto split = train_test_split(X.size(), kTestFraction, params_.seed);
    // Tiny sets have no held-out rows; evaluate on the training rows instead.
    const auto& eval_idx = split.test.empty() ? split.train : split.test;

    const Matrix X_train = select_rows(X, split.train);
    const auto y_train = select_items(y, split.train);

    StandardScaler scaler;
    scaler.fit(X_train);
    RandomForest forest(TreeTask::Regression, params_);
    forest.fit(scaler.transform(X_train), y_train);

    std::vector<double> truth, predicted;
    for (auto i : eval_idx) {
        truth.push_back(y[i]);
        predicted.push_back(forest.predict_value(scaler.transform_row(X[i])));
    }

    scaler_ = std::move(scaler);
    forest_ = std::move(forest);
    trained_ = true;

    RegressionMetrics m = regression_metrics(truth, predicted);
    m.train_rows = split.train.size();
    m.test_rows = split.test.size();
    log_debug("performance predictor trained on " + std::to_string(m.train_rows) + " rows, r2=" + std::to_string(m.r2));
    return m;
}

double PerformancePredictor::predict(const FeatureVector& features) const {
    return predict_row(features.as_row());
}

double PerformancePredictor::predict_row(const std::vector<double>& row) const {
    if (!trained_) throw NotTrainedError("PerformancePredictor: model not trained yet");
    validate_feature_row(row);
    return clamp_to(forest_.predict_value(scaler_.transform_row(row)), 0.0, 100.0);
}

FeatureImportance PerformancePredictor::feature_importance() const {
    if (!trained_) return {};
    return to_importance_map(forest_.feature_importances());
}

void PerformancePredictor::save(const std::string& path) const {
    if (!trained_) throw NotTrainedError("PerformancePredictor::save: model not trained");
    write_artifact(path, "PerformancePredictor", scaler_, forest_);
}

bool PerformancePredictor::load(const std::string& path) {
    if (!read_artifact(path, "PerformancePredictor", scaler_, forest_)) return false;
    trained_ = true;
    return true;
}

// ============================================================
// RiskClassifier
// ============================================================

RiskClassifier::RiskClassifier(ForestParams params)
    : params_(params), forest_(TreeTask::Classification, params, kClassCount) {}

ClassificationMetrics RiskClassifier::train(const Matrix& X, const std::vector<int>& y) {
    check_rows(X, y.size(), "RiskClassifier::train");
    for (int label : y)
        if (label < 0 || label >= kClassCount)
            throw InvalidInputError("RiskClassifier::train: label out of range: " + std::to_string(label));

    const auto split = stratified_split(y, kTestFraction, params_.seed);
    const auto& eval_idx = split.test.empty() ? split.train : split.test;

    const Matrix X_train = select_rows(X, split.train);
    std::vector<double> y_train;
    for (auto i : split.train) y_train.push_back(static_cast<double>(y[i]));

    StandardScaler scaler;
    scaler.fit(X_train);
    RandomForest forest(TreeTask::Classification, params_, kClassCount);
    forest.fit(scaler.transform(X_train), y_train);

    std::vector<int> truth, predicted;
    for (auto i : eval_idx) {
        const auto p = forest.predict_proba(scaler.transform_row(X[i]));
        truth.push_back(y[i]);
        predicted.push_back(static_cast<int>(std::max_element(p.begin(), p.end()) - p.begin()));
    }

    scaler_ = std::move(scaler);
    forest_ = std::move(forest);
    trained_ = true;

    ClassificationMetrics m = classification_metrics(truth, predicted);
    m.train_rows = split.train.size();
    m.test_rows = split.test.size();
    log_debug("risk classifier trained on " + std::to_string(m.train_rows) + " rows, accuracy=" + std::to_string(m.accuracy));
    return m;
}

RiskOutcome RiskClassifier::predict(const FeatureVector& features) const {
    return predict_row(features.as_row());
}

RiskOutcome RiskClassifier::predict_row(const std::vector<double>& row) const {
    if (!trained_) throw NotTrainedError("RiskClassifier: model not trained yet");
    validate_feature_row(row);

    const auto p = forest_.predict_proba(scaler_.transform_row(row));
    RiskOutcome out;
    // first maximum wins, so ties resolve to the lower risk class
    out.level = static_cast<RiskLevel>(std::max_element(p.begin(), p.end()) - p.begin());
    for (int c = 0; c < kClassCount; ++c) out.probabilities[kRiskNames[c]] = p[static_cast<std::size_t>(c)];
    return out;
}

FeatureImportance RiskClassifier::feature_importance() const {
    if (!trained_) return {};
    return to_importance_map(forest_.feature_importances());
}

void RiskClassifier::save(const std::string& path) const {
    if (!trained_) throw NotTrainedError("RiskClassifier::save: model not trained");
    write_artifact(path, "RiskClassifier", scaler_, forest_);
}

bool RiskClassifier::load(const std::string& path) {
    if (!read_artifact(path, "RiskClassifier", scaler_, forest_)) return false;
    trained_ = true;
    return true;
}
