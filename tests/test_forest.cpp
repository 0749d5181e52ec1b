#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <set>
#include <sstream>
#include "errors.hpp"
#include "forest.hpp"

namespace {

// y = 2x on x = 0..49, plus a constant second column.
void linear_data(Matrix& X, std::vector<double>& y) {
    for (int i = 0; i < 50; ++i) {
        X.push_back({ static_cast<double>(i), 1.0 });
        y.push_back(2.0 * i);
    }
}

// class 0 for negative x, class 1 for positive x
void separable_data(Matrix& X, std::vector<double>& y) {
    for (int i = 1; i <= 10; ++i) {
        X.push_back({ -static_cast<double>(i), 3.0 });
        y.push_back(0);
        X.push_back({ static_cast<double>(i), 3.0 });
        y.push_back(1);
    }
}

} // namespace

TEST(StandardScaler, CentresAndScalesColumns) {
    StandardScaler s;
    EXPECT_FALSE(s.fitted());
    EXPECT_THROW(s.transform_row({ 1, 2 }), NotTrainedError);

    s.fit({ { 1, 10 }, { 3, 10 } });
    ASSERT_TRUE(s.fitted());
    const auto row = s.transform_row({ 1, 10 });
    EXPECT_DOUBLE_EQ(row[0], -1.0);
    EXPECT_DOUBLE_EQ(row[1], 0.0);   // constant column is only centred
    EXPECT_THROW(s.transform_row({ 1, 2, 3 }), InvalidInputError);
}

TEST(StandardScaler, EmptyFitIsNoData) {
    StandardScaler s;
    EXPECT_THROW(s.fit({}), NoDataError);
}

TEST(StandardScaler, TextRoundTrip) {
    StandardScaler s;
    s.fit({ { 1.5, 10 }, { 3.25, 12 }, { 7, 13 } });
    std::stringstream ss;
    ss.precision(17);
    s.write(ss);

    StandardScaler back;
    back.read(ss);
    EXPECT_EQ(back.transform_row({ 2, 11 }), s.transform_row({ 2, 11 }));
}

TEST(Splits, TrainTestSizes) {
    const SplitIndices s = train_test_split(10, 0.2, 42);
    EXPECT_EQ(s.test.size(), 2u);
    EXPECT_EQ(s.train.size(), 8u);

    std::set<std::size_t> all(s.train.begin(), s.train.end());
    all.insert(s.test.begin(), s.test.end());
    EXPECT_EQ(all.size(), 10u);

    EXPECT_EQ(train_test_split(15, 0.2, 42).test.size(), 3u);
    EXPECT_EQ(train_test_split(2, 0.2, 42).test.size(), 1u);
    EXPECT_TRUE(train_test_split(1, 0.2, 42).test.empty());
    EXPECT_EQ(train_test_split(1, 0.2, 42).train.size(), 1u);
}

TEST(Splits, SameSeedSameSplit) {
    EXPECT_EQ(train_test_split(30, 0.2, 7).test, train_test_split(30, 0.2, 7).test);
}

TEST(Splits, StratifiedKeepsClassProportions) {
    const std::vector<int> labels = { 0, 0, 0, 0, 0, 1, 1, 1, 1, 1 };
    const SplitIndices s = stratified_split(labels, 0.2, 42);
    ASSERT_EQ(s.test.size(), 2u);
    EXPECT_NE(labels[s.test[0]], labels[s.test[1]]);
    EXPECT_EQ(s.train.size(), 8u);
}

TEST(Splits, StratifiedSingletonClassStaysInTrain) {
    const std::vector<int> labels = { 0, 0, 0, 0, 0, 2 };
    const SplitIndices s = stratified_split(labels, 0.2, 42);
    EXPECT_EQ(s.test.size(), 1u);
    EXPECT_NE(std::find(s.train.begin(), s.train.end(), 5u), s.train.end());
}

TEST(RandomForest, RegressionTracksTarget) {
    Matrix X;
    std::vector<double> y;
    linear_data(X, y);

    RandomForest f(TreeTask::Regression, ForestParams{ 20, 10, 42 });
    EXPECT_FALSE(f.fitted());
    f.fit(X, y);
    EXPECT_EQ(f.tree_count(), 20u);
    EXPECT_EQ(f.feature_count(), 2u);

    EXPECT_NEAR(f.predict_value({ 10, 1 }), 20.0, 5.0);
    EXPECT_NEAR(f.predict_value({ 40, 1 }), 80.0, 5.0);
    EXPECT_LT(f.predict_value({ 5, 1 }), f.predict_value({ 45, 1 }));
}

TEST(RandomForest, ImportanceIgnoresConstantFeature) {
    Matrix X;
    std::vector<double> y;
    linear_data(X, y);

    RandomForest f(TreeTask::Regression, ForestParams{ 10, 6, 42 });
    f.fit(X, y);
    const auto imp = f.feature_importances();
    ASSERT_EQ(imp.size(), 2u);
    EXPECT_NEAR(imp[0], 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(imp[1], 0.0);
}

TEST(RandomForest, ClassifierSeparatesClasses) {
    Matrix X;
    std::vector<double> y;
    separable_data(X, y);

    RandomForest f(TreeTask::Classification, ForestParams{ 20, 4, 42 }, 2);
    f.fit(X, y);
    const auto neg = f.predict_proba({ -5, 3 });
    const auto pos = f.predict_proba({ 5, 3 });
    ASSERT_EQ(neg.size(), 2u);
    EXPECT_GT(neg[0], 0.9);
    EXPECT_GT(pos[1], 0.9);
    EXPECT_NEAR(std::accumulate(neg.begin(), neg.end(), 0.0), 1.0, 1e-9);
    EXPECT_THROW(f.predict_value({ 1, 3 }), InvalidInputError);
}

TEST(RandomForest, RejectsBadInput) {
    RandomForest f(TreeTask::Classification, ForestParams{ 5, 3, 42 }, 2);
    EXPECT_THROW(f.predict_proba({ 1, 2 }), NotTrainedError);
    EXPECT_THROW(f.fit({}, {}), NoDataError);
    EXPECT_THROW(f.fit({ { 1, 2 }, { 3 } }, { 0, 1 }), InvalidInputError);
    EXPECT_THROW(f.fit({ { 1, 2 }, { 3, 4 } }, { 0, 5 }), InvalidInputError);
    EXPECT_THROW(f.fit({ { 1, 2 } }, { 0, 1 }), InvalidInputError);
}

TEST(RandomForest, SameSeedSameModel) {
    Matrix X;
    std::vector<double> y;
    linear_data(X, y);

    RandomForest a(TreeTask::Regression, ForestParams{ 8, 5, 3 });
    RandomForest b(TreeTask::Regression, ForestParams{ 8, 5, 3 });
    a.fit(X, y);
    b.fit(X, y);
    EXPECT_DOUBLE_EQ(a.predict_value({ 17.5, 1 }), b.predict_value({ 17.5, 1 }));
}

TEST(RandomForest, TextRoundTripPredictsIdentically) {
    Matrix X;
    std::vector<double> y;
    separable_data(X, y);

    RandomForest f(TreeTask::Classification, ForestParams{ 6, 4, 42 }, 2);
    f.fit(X, y);
    std::stringstream ss;
    ss.precision(17);
    f.write(ss);

    RandomForest back(TreeTask::Classification, ForestParams{ 6, 4, 42 }, 2);
    back.read(ss);
    EXPECT_EQ(back.tree_count(), f.tree_count());
    for (double x : { -7.0, -0.5, 0.5, 7.0 })
        EXPECT_EQ(back.predict_proba({ x, 3 }), f.predict_proba({ x, 3 }));
    EXPECT_EQ(back.feature_importances(), f.feature_importances());
}

TEST(RandomForest, MalformedArtifactThrows) {
    RandomForest f(TreeTask::Regression, ForestParams{ 6, 4, 42 });

    std::istringstream wrong_task("forest classification 3 6 1\n");
    EXPECT_THROW(f.read(wrong_task), InvalidInputError);

    std::istringstream truncated("forest regression 0 2 1\ntree 3\n-1 0 -1 -1 1 ");
    EXPECT_THROW(f.read(truncated), InvalidInputError);

    std::istringstream bad_child("forest regression 0 1 1\ntree 1\n0 0.5 4 5 1 2\nimportance 1 0\n");
    EXPECT_THROW(f.read(bad_child), InvalidInputError);

    std::istringstream huge_node_count("forest regression 0 2 1\ntree 99999999999999\n");
    EXPECT_THROW(f.read(huge_node_count), InvalidInputError);

    std::istringstream huge_tree_count("forest regression 0 2 99999999999999\n");
    EXPECT_THROW(f.read(huge_tree_count), InvalidInputError);

    EXPECT_FALSE(f.fitted());
}
