#include "forest.hpp"
#include <algorithm>
#include <cmath>
#include <istream>
#include <map>
#include <numeric>
#include <ostream>
#include <string>
#include <utility>
#include "errors.hpp"

namespace {

constexpr double kImpurityEps = 1e-12;

// upper bounds on counts read back from a model artifact
constexpr std::size_t kMaxArtifactLength = 100000;
constexpr std::size_t kMaxArtifactTrees = 10000;

struct SplitCandidate {
    int feature{ -1 };
    double threshold{ 0.0 };
    double child_impurity{ 0.0 };   // weighted sum n_left*i_left + n_right*i_right
};

double gini(const std::vector<double>& counts, double n) {
    if (n <= 0) return 0.0;
    double g = 1.0;
    for (double c : counts) g -= (c / n) * (c / n);
    return g;
}

void expect_token(std::istream& in, const std::string& want) {
    std::string tok;
    if (!(in >> tok) || tok != want)
        throw InvalidInputError("model artifact: expected '" + want + "', got '" + tok + "'");
}

template <typename T>
T read_value(std::istream& in, const char* what) {
    T v{};
    if (!(in >> v)) throw InvalidInputError(std::string("model artifact: cannot read ") + what);
    return v;
}

void write_doubles(std::ostream& out, const std::vector<double>& v) {
    out << v.size();
    for (double d : v) out << ' ' << d;
}

std::vector<double> read_doubles(std::istream& in, const char* what) {
    const auto n = read_value<std::size_t>(in, what);
    if (n > kMaxArtifactLength) throw InvalidInputError(std::string("model artifact: bad length for ") + what);
    std::vector<double> v(n);
    for (auto& d : v) d = read_value<double>(in, what);
    return v;
}

} // namespace

// ============================================================
// StandardScaler
// ============================================================

void StandardScaler::fit(const Matrix& X) {
    if (X.empty() || X.front().empty())
        throw NoDataError("StandardScaler::fit: no rows");

    const std::size_t cols = X.front().size();
    mean_.assign(cols, 0.0);
    scale_.assign(cols, 0.0);

    for (const auto& row : X)
        for (std::size_t j = 0; j < cols; ++j) mean_[j] += row[j];
    for (auto& m : mean_) m /= static_cast<double>(X.size());

    for (const auto& row : X)
        for (std::size_t j = 0; j < cols; ++j) scale_[j] += (row[j] - mean_[j]) * (row[j] - mean_[j]);
    for (auto& s : scale_) {
        s = std::sqrt(s / static_cast<double>(X.size()));
        if (s < kImpurityEps) s = 1.0;   // constant column: centre only
    }
}

std::vector<double> StandardScaler::transform_row(const std::vector<double>& row) const {
    if (!fitted()) throw NotTrainedError("StandardScaler: not fitted");
    if (row.size() != mean_.size())
        throw InvalidInputError("StandardScaler: expected " + std::to_string(mean_.size()) +
            " features, got " + std::to_string(row.size()));

    std::vector<double> out(row.size());
    for (std::size_t j = 0; j < row.size(); ++j) out[j] = (row[j] - mean_[j]) / scale_[j];
    return out;
}

Matrix StandardScaler::transform(const Matrix& X) const {
    Matrix out;
    out.reserve(X.size());
    for (const auto& row : X) out.push_back(transform_row(row));
    return out;
}

void StandardScaler::write(std::ostream& out) const {
    out << "scaler\nmean ";
    write_doubles(out, mean_);
    out << "\nscale ";
    write_doubles(out, scale_);
    out << '\n';
}

void StandardScaler::read(std::istream& in) {
    expect_token(in, "scaler");
    expect_token(in, "mean");
    auto mean = read_doubles(in, "scaler mean");
    expect_token(in, "scale");
    auto scale = read_doubles(in, "scaler scale");
    if (mean.size() != scale.size())
        throw InvalidInputError("model artifact: scaler mean/scale size mismatch");
    for (double s : scale)
        if (!(s > 0.0)) throw InvalidInputError("model artifact: non-positive scale");
    mean_ = std::move(mean);
    scale_ = std::move(scale);
}

// ============================================================
// DecisionTree
// ============================================================

DecisionTree::DecisionTree(TreeTask task, int max_depth, std::size_t max_features, int n_classes)
    : task_(task), max_depth_(max_depth), max_features_(max_features), n_classes_(n_classes) {}

std::vector<double> DecisionTree::node_value(const std::vector<double>& y,
    const std::vector<std::size_t>& idx, std::size_t begin, std::size_t end) const {
    const double n = static_cast<double>(end - begin);
    if (task_ == TreeTask::Regression) {
        double s = 0.0;
        for (std::size_t i = begin; i < end; ++i) s += y[idx[i]];
        return { s / n };
    }
    std::vector<double> frac(static_cast<std::size_t>(n_classes_), 0.0);
    for (std::size_t i = begin; i < end; ++i) frac[static_cast<std::size_t>(y[idx[i]])] += 1.0;
    for (auto& f : frac) f /= n;
    return frac;
}

double DecisionTree::impurity(const std::vector<double>& value, const std::vector<double>& y,
    const std::vector<std::size_t>& idx, std::size_t begin, std::size_t end) const {
    if (task_ == TreeTask::Classification) {
        double g = 1.0;
        for (double p : value) g -= p * p;
        return g;
    }
    const double m = value.front();
    double ss = 0.0;
    for (std::size_t i = begin; i < end; ++i) ss += (y[idx[i]] - m) * (y[idx[i]] - m);
    return ss / static_cast<double>(end - begin);
}

void DecisionTree::fit(const Matrix& X, const std::vector<double>& y,
    const std::vector<std::size_t>& sample, std::mt19937& rng) {
    if (sample.empty()) throw NoDataError("DecisionTree::fit: empty sample");
    nodes_.clear();
    importance_.assign(X.front().size(), 0.0);
    std::vector<std::size_t> idx = sample;
    build(X, y, idx, 0, idx.size(), 0, rng);
}

int DecisionTree::build(const Matrix& X, const std::vector<double>& y,
    std::vector<std::size_t>& idx, std::size_t begin, std::size_t end,
    int depth, std::mt19937& rng) {
    const int node_id = static_cast<int>(nodes_.size());
    nodes_.push_back(TreeNode{});
    nodes_[node_id].value = node_value(y, idx, begin, end);

    const std::size_t n = end - begin;
    const double node_impurity = impurity(nodes_[node_id].value, y, idx, begin, end);
    if (depth >= max_depth_ || n < 2 || node_impurity <= kImpurityEps)
        return node_id;

    const std::size_t n_features = X.front().size();
    std::vector<std::size_t> order(n_features);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);

    SplitCandidate best;
    double best_score = node_impurity * static_cast<double>(n) - kImpurityEps;
    std::size_t visited = 0;
    std::vector<std::pair<double, double>> col(n);   // (x, y)

    for (std::size_t f : order) {
        if (visited >= max_features_) break;
        for (std::size_t i = 0; i < n; ++i) col[i] = { X[idx[begin + i]][f], y[idx[begin + i]] };
        std::sort(col.begin(), col.end(),
            [](const std::pair<double, double>& a, const std::pair<double, double>& b) { return a.first < b.first; });
        if (col.front().first == col.back().first) continue;   // constant here, does not count
        ++visited;

        if (task_ == TreeTask::Regression) {
            double total = 0.0, total_sq = 0.0;
            for (const auto& p : col) { total += p.second; total_sq += p.second * p.second; }
            double left = 0.0, left_sq = 0.0;
            for (std::size_t i = 0; i + 1 < n; ++i) {
                left += col[i].second;
                left_sq += col[i].second * col[i].second;
                if (col[i].first == col[i + 1].first) continue;
                const double nl = static_cast<double>(i + 1);
                const double nr = static_cast<double>(n - i - 1);
                const double right = total - left, right_sq = total_sq - left_sq;
                // n * variance == sum of squares minus n * mean^2
                const double score = (left_sq - left * left / nl) + (right_sq - right * right / nr);
                if (score < best_score) {
                    best_score = score;
                    best.feature = static_cast<int>(f);
                    best.threshold = (col[i].first + col[i + 1].first) / 2.0;
                    if (best.threshold >= col[i + 1].first) best.threshold = col[i].first;
                    best.child_impurity = score;
                }
            }
        }
        else {
            std::vector<double> total(static_cast<std::size_t>(n_classes_), 0.0);
            for (const auto& p : col) total[static_cast<std::size_t>(p.second)] += 1.0;
            std::vector<double> left(total.size(), 0.0);
            for (std::size_t i = 0; i + 1 < n; ++i) {
                left[static_cast<std::size_t>(col[i].second)] += 1.0;
                if (col[i].first == col[i + 1].first) continue;
                const double nl = static_cast<double>(i + 1);
                const double nr = static_cast<double>(n - i - 1);
                std::vector<double> right(total.size());
                for (std::size_t c = 0; c < total.size(); ++c) right[c] = total[c] - left[c];
                const double score = nl * gini(left, nl) + nr * gini(right, nr);
                if (score < best_score) {
                    best_score = score;
                    best.feature = static_cast<int>(f);
                    best.threshold = (col[i].first + col[i + 1].first) / 2.0;
                    if (best.threshold >= col[i + 1].first) best.threshold = col[i].first;
                    best.child_impurity = score;
                }
            }
        }
    }

    if (best.feature < 0) return node_id;

    const auto f = static_cast<std::size_t>(best.feature);
    const double thr = best.threshold;
    auto mid_it = std::partition(idx.begin() + static_cast<std::ptrdiff_t>(begin),
        idx.begin() + static_cast<std::ptrdiff_t>(end),
        [&](std::size_t row) { return X[row][f] <= thr; });
    const auto mid = static_cast<std::size_t>(mid_it - idx.begin());
    if (mid == begin || mid == end) return node_id;

    importance_[f] += node_impurity * static_cast<double>(n) - best.child_impurity;

    const int left_id = build(X, y, idx, begin, mid, depth + 1, rng);
    const int right_id = build(X, y, idx, mid, end, depth + 1, rng);
    nodes_[node_id].feature = best.feature;
    nodes_[node_id].threshold = thr;
    nodes_[node_id].left = left_id;
    nodes_[node_id].right = right_id;
    return node_id;
}

const std::vector<double>& DecisionTree::leaf_value(const std::vector<double>& row) const {
    if (nodes_.empty()) throw NotTrainedError("DecisionTree: not fitted");
    std::size_t i = 0;
    while (nodes_[i].feature >= 0) {
        const auto f = static_cast<std::size_t>(nodes_[i].feature);
        i = static_cast<std::size_t>(row[f] <= nodes_[i].threshold ? nodes_[i].left : nodes_[i].right);
    }
    return nodes_[i].value;
}

void DecisionTree::restore(std::vector<TreeNode> nodes, std::vector<double> impurity_decrease) {
    const int count = static_cast<int>(nodes.size());
    if (count == 0) throw InvalidInputError("model artifact: empty tree");
    for (int i = 0; i < count; ++i) {
        const auto& nd = nodes[static_cast<std::size_t>(i)];
        if (nd.value.empty()) throw InvalidInputError("model artifact: node without value");
        if (nd.feature < 0) continue;
        if (static_cast<std::size_t>(nd.feature) >= impurity_decrease.size() ||
            nd.left <= i || nd.right <= i || nd.left >= count || nd.right >= count)
            throw InvalidInputError("model artifact: corrupt tree node " + std::to_string(i));
    }
    nodes_ = std::move(nodes);
    importance_ = std::move(impurity_decrease);
}

// ============================================================
// RandomForest
// ============================================================

RandomForest::RandomForest(TreeTask task, ForestParams params, int n_classes)
    : task_(task), params_(params), n_classes_(n_classes) {}

void RandomForest::fit(const Matrix& X, const std::vector<double>& y) {
    if (X.empty()) throw NoDataError("RandomForest::fit: no training rows");
    if (X.size() != y.size()) throw InvalidInputError("RandomForest::fit: X/y length mismatch");
    if (params_.n_trees <= 0 || params_.max_depth <= 0)
        throw InvalidInputError("RandomForest::fit: n_trees and max_depth must be positive");

    n_features_ = X.front().size();
    for (const auto& row : X)
        if (row.size() != n_features_) throw InvalidInputError("RandomForest::fit: ragged feature matrix");
    if (task_ == TreeTask::Classification) {
        for (double label : y)
            if (label < 0 || label >= n_classes_ || label != std::floor(label))
                throw InvalidInputError("RandomForest::fit: class label out of range");
    }

    const std::size_t max_features = task_ == TreeTask::Regression
        ? n_features_
        : std::max<std::size_t>(1, static_cast<std::size_t>(std::sqrt(static_cast<double>(n_features_))));

    std::mt19937 master(params_.seed);
    std::uniform_int_distribution<std::size_t> pick(0, X.size() - 1);

    trees_.clear();
    trees_.reserve(static_cast<std::size_t>(params_.n_trees));
    for (int t = 0; t < params_.n_trees; ++t) {
        std::vector<std::size_t> sample(X.size());
        for (auto& s : sample) s = pick(master);
        std::mt19937 tree_rng(master());
        DecisionTree tree(task_, params_.max_depth, max_features, n_classes_);
        tree.fit(X, y, sample, tree_rng);
        trees_.push_back(std::move(tree));
    }
}

double RandomForest::predict_value(const std::vector<double>& row) const {
    if (!fitted()) throw NotTrainedError("RandomForest: not fitted");
    if (task_ != TreeTask::Regression) throw InvalidInputError("RandomForest: not a regressor");
    double s = 0.0;
    for (const auto& t : trees_) s += t.leaf_value(row).front();
    return s / static_cast<double>(trees_.size());
}

std::vector<double> RandomForest::predict_proba(const std::vector<double>& row) const {
    if (!fitted()) throw NotTrainedError("RandomForest: not fitted");
    if (task_ != TreeTask::Classification) throw InvalidInputError("RandomForest: not a classifier");
    std::vector<double> p(static_cast<std::size_t>(n_classes_), 0.0);
    for (const auto& t : trees_) {
        const auto& leaf = t.leaf_value(row);
        for (std::size_t c = 0; c < p.size() && c < leaf.size(); ++c) p[c] += leaf[c];
    }
    const double total = std::accumulate(p.begin(), p.end(), 0.0);
    if (total > 0)
        for (auto& v : p) v /= total;
    return p;
}

std::vector<double> RandomForest::feature_importances() const {
    std::vector<double> imp(n_features_, 0.0);
    if (trees_.empty()) return imp;

    for (const auto& t : trees_) {
        const auto& raw = t.impurity_decrease();
        const double s = std::accumulate(raw.begin(), raw.end(), 0.0);
        if (s <= 0) continue;
        for (std::size_t j = 0; j < imp.size() && j < raw.size(); ++j) imp[j] += raw[j] / s;
    }
    const double s = std::accumulate(imp.begin(), imp.end(), 0.0);
    if (s > 0)
        for (auto& v : imp) v /= s;
    return imp;
}

void RandomForest::write(std::ostream& out) const {
    out << "forest " << (task_ == TreeTask::Regression ? "regression" : "classification")
        << ' ' << n_classes_ << ' ' << n_features_ << ' ' << trees_.size() << '\n';
    for (const auto& t : trees_) {
        out << "tree " << t.nodes().size() << '\n';
        for (const auto& nd : t.nodes()) {
            out << nd.feature << ' ' << nd.threshold << ' ' << nd.left << ' ' << nd.right << ' ';
            write_doubles(out, nd.value);
            out << '\n';
        }
        out << "importance ";
        write_doubles(out, t.impurity_decrease());
        out << '\n';
    }
}

void RandomForest::read(std::istream& in) {
    expect_token(in, "forest");
    const auto task = read_value<std::string>(in, "forest task");
    const TreeTask want = task == "regression" ? TreeTask::Regression : TreeTask::Classification;
    if (want != task_) throw InvalidInputError("model artifact: forest task mismatch");
    const auto n_classes = read_value<int>(in, "class count");
    const auto n_features = read_value<std::size_t>(in, "feature count");
    const auto n_trees = read_value<std::size_t>(in, "tree count");
    if (n_classes != n_classes_) throw InvalidInputError("model artifact: class count mismatch");
    if (n_features > kMaxArtifactLength) throw InvalidInputError("model artifact: bad feature count");
    if (n_trees > kMaxArtifactTrees) throw InvalidInputError("model artifact: bad tree count");

    std::vector<DecisionTree> trees;
    for (std::size_t t = 0; t < n_trees; ++t) {
        expect_token(in, "tree");
        const auto n_nodes = read_value<std::size_t>(in, "node count");
        if (n_nodes > kMaxArtifactLength) throw InvalidInputError("model artifact: bad node count");
        std::vector<TreeNode> nodes(n_nodes);
        for (auto& nd : nodes) {
            nd.feature = read_value<int>(in, "node feature");
            nd.threshold = read_value<double>(in, "node threshold");
            nd.left = read_value<int>(in, "node left");
            nd.right = read_value<int>(in, "node right");
            nd.value = read_doubles(in, "node value");
        }
        expect_token(in, "importance");
        auto imp = read_doubles(in, "tree importance");
        if (imp.size() != n_features) throw InvalidInputError("model artifact: importance size mismatch");

        DecisionTree tree(task_, params_.max_depth, n_features, n_classes_);
        tree.restore(std::move(nodes), std::move(imp));
        trees.push_back(std::move(tree));
    }
    n_features_ = n_features;
    trees_ = std::move(trees);
}

// ============================================================
// Splits
// ============================================================

SplitIndices train_test_split(std::size_t n, double test_fraction, unsigned seed) {
    std::vector<std::size_t> idx(n);
    std::iota(idx.begin(), idx.end(), 0);
    std::mt19937 rng(seed);
    std::shuffle(idx.begin(), idx.end(), rng);

    std::size_t n_test = 0;
    if (n >= 2) {
        n_test = static_cast<std::size_t>(std::ceil(static_cast<double>(n) * test_fraction - 1e-9));
        n_test = std::min(n_test, n - 1);
    }

    SplitIndices s;
    s.test.assign(idx.begin(), idx.begin() + static_cast<std::ptrdiff_t>(n_test));
    s.train.assign(idx.begin() + static_cast<std::ptrdiff_t>(n_test), idx.end());
    return s;
}

SplitIndices stratified_split(const std::vector<int>& labels, double test_fraction, unsigned seed) {
    std::map<int, std::vector<std::size_t>> by_class;
    for (std::size_t i = 0; i < labels.size(); ++i) by_class[labels[i]].push_back(i);

    std::mt19937 rng(seed);
    SplitIndices s;
    for (auto& kv : by_class) {
        auto& members = kv.second;
        std::shuffle(members.begin(), members.end(), rng);
        const std::size_t n_c = members.size();
        auto n_test = static_cast<std::size_t>(std::floor(static_cast<double>(n_c) * test_fraction + 0.5));
        n_test = std::min(n_test, n_c - 1);
        s.test.insert(s.test.end(), members.begin(), members.begin() + static_cast<std::ptrdiff_t>(n_test));
        s.train.insert(s.train.end(), members.begin() + static_cast<std::ptrdiff_t>(n_test), members.end());
    }
    std::shuffle(s.train.begin(), s.train.end(), rng);
    std::shuffle(s.test.begin(), s.test.end(), rng);
    return s;
}

Matrix select_rows(const Matrix& X, const std::vector<std::size_t>& idx) {
    return select_items(X, idx);
}
