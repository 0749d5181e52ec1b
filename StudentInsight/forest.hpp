#pragma once
#include <cstddef>
#include <iosfwd>
#include <random>
#include <vector>
#include "config.hpp"

/*
-------------------------------------------------------------------------------
 forest.hpp - Random forests, feature scaling and data splits
-------------------------------------------------------------------------------
The two student models are bagged ensembles of CART trees:
  - regression trees split on variance reduction, leaves hold the mean label
  - classification trees split on Gini impurity, leaves hold class fractions

Each tree is grown on a bootstrap sample. Regression trees consider every
feature at each split; classification trees consider sqrt(n_features)
randomly chosen ones. Feature importance is the mean (over trees) of the
normalized impurity decrease attributed to each feature.

StandardScaler centres and scales columns with statistics from the training
rows only. Both scaler and forest round-trip through a plain text stream
(see write/read) so a model artifact is one file.
-------------------------------------------------------------------------------
*/

using Matrix = std::vector<std::vector<double>>;

enum class TreeTask { Regression, Classification };

class StandardScaler {
public:
    void fit(const Matrix& X);
    std::vector<double> transform_row(const std::vector<double>& row) const;
    Matrix transform(const Matrix& X) const;
    bool fitted() const { return !mean_.empty(); }

    void write(std::ostream& out) const;
    void read(std::istream& in);

private:
    std::vector<double> mean_;
    std::vector<double> scale_;
};

struct TreeNode {
    int feature{ -1 };          // -1 marks a leaf
    double threshold{ 0.0 };    // go left when x[feature] <= threshold
    int left{ -1 };
    int right{ -1 };
    std::vector<double> value;  // {mean} or per-class fractions
};

class DecisionTree {
public:
    DecisionTree(TreeTask task, int max_depth, std::size_t max_features, int n_classes);

    /// Grow the tree on the rows listed in `sample` (duplicates allowed).
    void fit(const Matrix& X, const std::vector<double>& y,
        const std::vector<std::size_t>& sample, std::mt19937& rng);

    const std::vector<double>& leaf_value(const std::vector<double>& row) const;

    /// Raw impurity decrease per feature, weighted by node size.
    const std::vector<double>& impurity_decrease() const { return importance_; }

    const std::vector<TreeNode>& nodes() const { return nodes_; }

    /// Restore a tree read back from a model artifact.
    void restore(std::vector<TreeNode> nodes, std::vector<double> impurity_decrease);

private:
    int build(const Matrix& X, const std::vector<double>& y,
        std::vector<std::size_t>& idx, std::size_t begin, std::size_t end,
        int depth, std::mt19937& rng);
    std::vector<double> node_value(const std::vector<double>& y,
        const std::vector<std::size_t>& idx, std::size_t begin, std::size_t end) const;
    double impurity(const std::vector<double>& value, const std::vector<double>& y,
        const std::vector<std::size_t>& idx, std::size_t begin, std::size_t end) const;

    TreeTask task_;
    int max_depth_;
    std::size_t max_features_;
    int n_classes_;
    std::vector<TreeNode> nodes_;
    std::vector<double> importance_;
};

class RandomForest {
public:
    RandomForest(TreeTask task, ForestParams params, int n_classes = 0);

    /// Labels are class indices (0..n_classes-1) for classification.
    void fit(const Matrix& X, const std::vector<double>& y);

    double predict_value(const std::vector<double>& row) const;
    std::vector<double> predict_proba(const std::vector<double>& row) const;

    std::vector<double> feature_importances() const;

    bool fitted() const { return !trees_.empty(); }
    std::size_t tree_count() const { return trees_.size(); }
    std::size_t feature_count() const { return n_features_; }

    void write(std::ostream& out) const;
    void read(std::istream& in);

private:
    TreeTask task_;
    ForestParams params_;
    int n_classes_;
    std::size_t n_features_{ 0 };
    std::vector<DecisionTree> trees_;
};

struct SplitIndices {
    std::vector<std::size_t> train;
    std::vector<std::size_t> test;
};

/// Shuffled split with ceil(n * test_fraction) test rows. With fewer than two
/// rows everything goes to train.
SplitIndices train_test_split(std::size_t n, double test_fraction, unsigned seed);

/// Per-class split preserving class proportions; every class keeps at least
/// one training row.
SplitIndices stratified_split(const std::vector<int>& labels, double test_fraction, unsigned seed);

Matrix select_rows(const Matrix& X, const std::vector<std::size_t>& idx);

template <typename T>
std::vector<T> select_items(const std::vector<T>& v, const std::vector<std::size_t>& idx) {
    std::vector<T> out;
    out.reserve(idx.size());
    for (auto i : idx) out.push_back(v[i]);
    return out;
}
