#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>
#include "config.hpp"
#include "forest.hpp"
#include "models.hpp"

/*
-------------------------------------------------------------------------------
 predictors.hpp - The two student models
-------------------------------------------------------------------------------
PerformancePredictor  six features -> expected average marks (0..100)
RiskClassifier        six features -> Low / Medium / High + probabilities

Both follow the same contract:
  - train(X, y) splits 80/20 (seeded), fits a StandardScaler on the training
    rows only, fits the forest and returns held-out metrics
  - predict(...) throws NotTrainedError until train() or load() succeeded
  - save(path) / load(path) use one text artifact per model; load() of a
    missing file returns false and leaves the model untouched

Input checks:
  - zero training rows            -> NoDataError
  - a row that is not six values  -> InvalidInputError
-------------------------------------------------------------------------------
*/

struct RegressionMetrics {
    double mse{ 0.0 };
    double rmse{ 0.0 };
    double r2{ 0.0 };
    std::size_t train_rows{ 0 };
    std::size_t test_rows{ 0 };
};

struct ClassMetrics {
    double precision{ 0.0 };
    double recall{ 0.0 };
    double f1{ 0.0 };
    std::size_t support{ 0 };
};

struct ClassificationMetrics {
    double accuracy{ 0.0 };
    std::map<std::string, ClassMetrics> per_class;   // keyed "Low" / "Medium" / "High"
    std::size_t train_rows{ 0 };
    std::size_t test_rows{ 0 };
};

struct RiskOutcome {
    RiskLevel level{ RiskLevel::Medium };
    std::map<std::string, double> probabilities;
};

class PerformancePredictor {
public:
    explicit PerformancePredictor(ForestParams params = ForestParams{ 100, 10, 42 });

    RegressionMetrics train(const Matrix& X, const std::vector<double>& y);

    double predict(const FeatureVector& features) const;
    double predict_row(const std::vector<double>& row) const;

    /// Empty while untrained.
    FeatureImportance feature_importance() const;

    void save(const std::string& path) const;
    bool load(const std::string& path);

    bool is_trained() const { return trained_; }
    static const char* model_type() { return "RandomForestRegressor"; }

private:
    ForestParams params_;
    StandardScaler scaler_;
    RandomForest forest_;
    bool trained_{ false };
};

class RiskClassifier {
public:
    static constexpr int kClassCount = 3;

    explicit RiskClassifier(ForestParams params = ForestParams{ 100, 8, 42 });

    /// Labels are RiskLevel values as int (0 Low, 1 Medium, 2 High).
    ClassificationMetrics train(const Matrix& X, const std::vector<int>& y);

    RiskOutcome predict(const FeatureVector& features) const;
    RiskOutcome predict_row(const std::vector<double>& row) const;

    FeatureImportance feature_importance() const;

    void save(const std::string& path) const;
    bool load(const std::string& path);

    bool is_trained() const { return trained_; }
    static const char* model_type() { return "RandomForestClassifier"; }

private:
    ForestParams params_;
    StandardScaler scaler_;
    RandomForest forest_;
    bool trained_{ false };
};

/// Same metric definitions the models report, usable on their own.
RegressionMetrics regression_metrics(const std::vector<double>& truth, const std::vector<double>& predicted);
ClassificationMetrics classification_metrics(const std::vector<int>& truth, const std::vector<int>& predicted);
