/// @file dataset_test.cpp
/// @brief Tests for the in-memory dataset model

#include <gtest/gtest.h>

#include "common/error.h"
#include "drift/dataset.h"

namespace drifter::drift {
namespace {

Column NumericColumn(std::string name, std::vector<double> values) {
    Column column{std::move(name), {}};
    for (double v : values) {
        column.values.emplace_back(v);
    }
    return column;
}

TEST(DatasetTest, CreatePreservesColumnOrder) {
    auto dataset = Dataset::Create("reference", {
        NumericColumn("zeta", {1, 2, 3}),
        NumericColumn("alpha", {4, 5, 6}),
        NumericColumn("mid", {7, 8, 9}),
    });
    ASSERT_TRUE(dataset.ok()) << dataset.status();

    EXPECT_EQ(dataset->Name(), "reference");
    EXPECT_EQ(dataset->RowCount(), 3u);
    EXPECT_EQ(dataset->ColumnCount(), 3u);
    EXPECT_EQ(dataset->ColumnNames(), (std::vector<std::string>{"zeta", "alpha", "mid"}));
}

TEST(DatasetTest, FindColumn) {
    auto dataset = Dataset::Create("d", {NumericColumn("a", {1}), NumericColumn("b", {2})});
    ASSERT_TRUE(dataset.ok());

    const Column* b = dataset->FindColumn("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(b->name, "b");
    EXPECT_TRUE(dataset->HasColumn("a"));
    EXPECT_FALSE(dataset->HasColumn("c"));
    EXPECT_EQ(dataset->FindColumn("c"), nullptr);
}

TEST(DatasetTest, RejectsDuplicateColumns) {
    auto dataset = Dataset::Create("d", {NumericColumn("a", {1}), NumericColumn("a", {2})});
    ASSERT_FALSE(dataset.ok());
    EXPECT_EQ(GetErrorCode(dataset.status()), ErrorCode::kInvalidArgument);
}

TEST(DatasetTest, RejectsUnequalLengths) {
    auto dataset = Dataset::Create("d", {NumericColumn("a", {1, 2}), NumericColumn("b", {3})});
    ASSERT_FALSE(dataset.ok());
    EXPECT_EQ(dataset.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(DatasetTest, RejectsEmptyColumnName) {
    auto dataset = Dataset::Create("d", {NumericColumn("", {1})});
    EXPECT_FALSE(dataset.ok());
}

TEST(DatasetTest, EmptyDatasetIsValid) {
    auto dataset = Dataset::Create("empty", {});
    ASSERT_TRUE(dataset.ok());
    EXPECT_EQ(dataset->RowCount(), 0u);
    EXPECT_TRUE(dataset->ColumnNames().empty());
}

TEST(ValueTest, KeysShareIntegralAndFractionalForms) {
    EXPECT_EQ(ValueToKey(Value{1.0}), "1");
    EXPECT_EQ(ValueToKey(Value{2.5}), "2.5");
    EXPECT_EQ(ValueToKey(Value{std::string("red")}), "red");
    EXPECT_EQ(ValueToKey(Value{}), "");
}

TEST(ValueTest, Predicates) {
    EXPECT_TRUE(IsMissing(Value{}));
    EXPECT_FALSE(IsMissing(Value{0.0}));
    EXPECT_TRUE(IsNumber(Value{3.0}));
    EXPECT_FALSE(IsNumber(Value{std::string("3")}));
}

}  // namespace
}  // namespace drifter::drift
