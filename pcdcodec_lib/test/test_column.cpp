#include <gtest/gtest.h>

#include "pcdcodec/column.hpp"

TEST(Column, FromVector) {
  using namespace PcdCodec;

  const auto column = Column::FromVector(std::vector<uint16_t>{1, 2, 3, 4, 5, 6}, 3);
  EXPECT_EQ(column.type(), FieldType::UINT16);
  EXPECT_EQ(column.count(), 3u);
  EXPECT_EQ(column.points(), 2u);
  EXPECT_EQ(column.elements(), 6u);
  EXPECT_EQ(column.byteSize(), 12u);
  EXPECT_EQ(column.storage(), Column::Storage::OWNED);
  EXPECT_EQ(column.at<uint16_t>(4), 5);
  EXPECT_EQ(column.typedData<uint16_t>()[5], 6);

  EXPECT_THROW(column.at<int16_t>(0), std::invalid_argument);
  EXPECT_THROW(column.at<uint16_t>(6), std::out_of_range);
  EXPECT_THROW(Column::FromVector(std::vector<float>{1, 2}, 3), std::invalid_argument);
}

TEST(Column, BorrowedMemory) {
  using namespace PcdCodec;

  auto owner = std::make_shared<std::vector<uint8_t>>(12, 0);
  const float value = 2.5f;
  memcpy(owner->data() + 4, &value, sizeof(float));

  auto view = Column::Borrow(FieldType::FLOAT32, 1, 2, owner->data() + 4, owner, Column::Storage::MAPPED);
  const uint8_t* expected_data = owner->data() + 4;
  owner.reset();

  // the column keeps the memory alive
  EXPECT_EQ(view.data(), expected_data);
  EXPECT_EQ(view.at<float>(0), 2.5f);
  EXPECT_TRUE(view.isView());
  EXPECT_THROW(view.mutableData(), std::logic_error);

  const auto copy = Column::FromVector(std::vector<float>{2.5f, 0.0f});
  EXPECT_TRUE(view.sameValues(copy));
  EXPECT_FALSE(view.sameValues(Column::FromVector(std::vector<float>{2.5f})));
}

TEST(ColumnSet, Lookup) {
  using namespace PcdCodec;

  ColumnSet columns;
  columns.add("x", std::vector<float>{1, 2});
  columns.add("label", std::vector<int32_t>{-1, 1});

  EXPECT_EQ(columns.size(), 2u);
  EXPECT_EQ(columns.names(), (std::vector<std::string>{"x", "label"}));
  EXPECT_TRUE(columns.contains("label"));
  EXPECT_EQ(columns.find("y"), nullptr);
  EXPECT_THROW(columns.at("y"), std::out_of_range);
  EXPECT_EQ(columns.at("label").at<int32_t>(0), -1);
  EXPECT_EQ(columns[0].first, "x");
}
