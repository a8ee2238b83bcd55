#include "scaffold/batch/batch.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace scaffold;

TEST(BatchRun, MixedRowsKeepOrder) {
  std::vector<batch::Input> Inputs{
      {.Text = "hello", .Number = 10},
      {.Text = "", .Number = 10},
      {.Text = "test", .Number = -1},
      {.Text = "world", .Number = 5},
  };

  auto Outcomes = batch::run(Inputs);
  ASSERT_EQ(Outcomes.size(), 4u);

  EXPECT_TRUE(Outcomes[0].ok());
  ASSERT_TRUE(Outcomes[0].Result.has_value());
  EXPECT_EQ(Outcomes[0].Result->Text, "processed_hello");
  EXPECT_EQ(Outcomes[0].Result->Number, 20);
  EXPECT_FALSE(Outcomes[0].Error.has_value());

  EXPECT_FALSE(Outcomes[1].ok());
  EXPECT_EQ(Outcomes[1].Kind, "EmptyInput");
  ASSERT_TRUE(Outcomes[1].Error.has_value());
  EXPECT_NE(Outcomes[1].Error->find("empty"), std::string::npos);
  EXPECT_FALSE(Outcomes[1].Result.has_value());

  EXPECT_FALSE(Outcomes[2].ok());
  EXPECT_EQ(Outcomes[2].Kind, "NegativeNumber");
  ASSERT_TRUE(Outcomes[2].Error.has_value());
  EXPECT_NE(Outcomes[2].Error->find("non-negative"), std::string::npos);

  EXPECT_TRUE(Outcomes[3].ok());
  EXPECT_EQ(Outcomes[3].Result->Number, 10);
}

TEST(BatchRun, EmptyTable) {
  EXPECT_TRUE(batch::run(std::vector<batch::Input>{}).empty());
}

TEST(BatchParse, ReadsRows) {
  auto Inputs = batch::parse(
      R"([{"Text":"hello","Number":42},{"Text":"","Number":3}])");
  ASSERT_TRUE(Inputs.has_value()) << Inputs.error().Message;
  ASSERT_EQ(Inputs->size(), 2u);
  EXPECT_EQ((*Inputs)[0].Text, "hello");
  EXPECT_EQ((*Inputs)[0].Number, 42);
  EXPECT_EQ((*Inputs)[1].Text, "");
  EXPECT_EQ((*Inputs)[1].Number, 3);
}

TEST(BatchParse, EmptyArray) {
  auto Inputs = batch::parse("[]");
  ASSERT_TRUE(Inputs.has_value());
  EXPECT_TRUE(Inputs->empty());
}

TEST(BatchParse, MalformedJson) {
  auto Inputs = batch::parse(R"([{"Text":"hello","Number":)");
  ASSERT_FALSE(Inputs.has_value());
  EXPECT_NE(Inputs.error().Message.find("Failed to parse batch input"),
            std::string::npos);
}

TEST(BatchParse, MissingNumberIsRejected) {
  auto Inputs = batch::parse(R"([{"Text":"hello"}])");
  EXPECT_FALSE(Inputs.has_value());
}

TEST(BatchParse, MissingTextIsRejected) {
  auto Inputs = batch::parse(R"([{"Number":3}])");
  EXPECT_FALSE(Inputs.has_value());
}

TEST(BatchParse, OutOfRangeNumberIsRejected) {
  auto Inputs = batch::parse(R"([{"Text":"a","Number":3000000000}])");
  EXPECT_FALSE(Inputs.has_value());
}

TEST(BatchParse, NonIntegerNumberIsRejected) {
  auto Inputs = batch::parse(R"([{"Text":"hello","Number":"ten"}])");
  EXPECT_FALSE(Inputs.has_value());
}

TEST(BatchSerialize, SuccessRowOmitsErrorFields) {
  auto Outcome = batch::run(batch::Input{.Text = "hello", .Number = 42});
  auto Json = batch::serialize(Outcome);
  ASSERT_TRUE(Json.has_value());

  EXPECT_NE(Json->find(R"("Status":"ok")"), std::string::npos);
  EXPECT_NE(Json->find(R"("Text":"processed_hello")"), std::string::npos);
  EXPECT_NE(Json->find(R"("Number":84)"), std::string::npos);
  EXPECT_EQ(Json->find("Error"), std::string::npos);
  EXPECT_EQ(Json->find("Kind"), std::string::npos);
}

TEST(BatchSerialize, ErrorRowCarriesKindAndMessage) {
  auto Outcome = batch::run(batch::Input{.Text = "", .Number = 1});
  auto Json = batch::serialize(Outcome);
  ASSERT_TRUE(Json.has_value());

  EXPECT_NE(Json->find(R"("Status":"error")"), std::string::npos);
  EXPECT_NE(Json->find(R"("Kind":"EmptyInput")"), std::string::npos);
  EXPECT_NE(Json->find("empty"), std::string::npos);
  EXPECT_EQ(Json->find("Result"), std::string::npos);
}

TEST(BatchSerialize, Table) {
  auto Inputs = batch::parse(R"([{"Text":"a","Number":1},{"Text":"b","Number":-2}])");
  ASSERT_TRUE(Inputs.has_value());
  auto Json = batch::serialize(batch::run(*Inputs));
  ASSERT_TRUE(Json.has_value());
  EXPECT_EQ(Json->front(), '[');
  EXPECT_EQ(Json->back(), ']');
  EXPECT_NE(Json->find(R"("Text":"processed_a")"), std::string::npos);
  EXPECT_NE(Json->find(R"("Kind":"NegativeNumber")"), std::string::npos);
}
