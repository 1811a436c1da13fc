#include <initializer_list>
#include <vector>

#include <gtest/gtest.h>

#include <AddressValidator.h>

using namespace gate_dial;

class AddressValidatorTest : public ::testing::Test {
protected:
  AddressValidatorTest() : map(cfg), validator(map, cfg) {}

  ValidationError check(std::initializer_list<int> symbols) {
    std::vector<int> v(symbols);
    return validator.validate(v.data(), v.size(), out);
  }

  GateConfig cfg;
  SymbolMap map;
  AddressValidator validator;
  Address out;
};

TEST_F(AddressValidatorTest, AcceptsSevenSymbolAddress) {
  EXPECT_EQ(check({27, 7, 15, 32, 12, 30, 1}), ValidationError::None);
  ASSERT_EQ(out.length, 7);
  EXPECT_EQ(out.symbols[0], 27);
  EXPECT_EQ(out.symbols[6], 1);
}

TEST_F(AddressValidatorTest, AcceptsNineSymbolAddress) {
  EXPECT_EQ(check({2, 3, 4, 5, 6, 7, 8, 9, 1}), ValidationError::None);
  EXPECT_EQ(out.length, 9);
}

TEST_F(AddressValidatorTest, RejectsDuplicateSymbol) {
  EXPECT_EQ(check({2, 2, 3, 4, 5, 6}), ValidationError::DuplicateSymbol);
}

TEST_F(AddressValidatorTest, RejectsShortAddress) { EXPECT_EQ(check({2, 3, 1}), ValidationError::TooShort); }

TEST_F(AddressValidatorTest, RejectsEmptyAddress) {
  EXPECT_EQ(validator.validate(nullptr, 0, out), ValidationError::TooShort);
}

TEST_F(AddressValidatorTest, RejectsLongAddress) {
  EXPECT_EQ(check({2, 3, 4, 5, 6, 7, 8, 9, 10, 1}), ValidationError::TooLong);
}

TEST_F(AddressValidatorTest, RejectsUnknownSymbol) {
  EXPECT_EQ(check({2, 3, 40, 5, 6, 1}), ValidationError::UnknownSymbol);
  EXPECT_EQ(check({2, 3, 0, 5, 6, 1}), ValidationError::UnknownSymbol);
}

TEST_F(AddressValidatorTest, RejectsMissingOrigin) {
  EXPECT_EQ(check({2, 3, 4, 5, 6, 7}), ValidationError::MissingOrigin);
}

TEST_F(AddressValidatorTest, RejectsMisplacedOrigin) {
  EXPECT_EQ(check({1, 2, 3, 4, 5, 6}), ValidationError::MisplacedOrigin);
  EXPECT_EQ(check({2, 3, 1, 4, 5, 6}), ValidationError::MisplacedOrigin);
}

TEST_F(AddressValidatorTest, LengthIsCheckedBeforeMembership) {
  EXPECT_EQ(check({99, 98}), ValidationError::TooShort);
}

TEST_F(AddressValidatorTest, OutputUntouchedOnFailure) {
  out.length = 0;
  EXPECT_NE(check({2, 2, 3, 4, 5, 1}), ValidationError::None);
  EXPECT_EQ(out.length, 0);
}

TEST(AddressValidatorLeading, OriginFirstWhenConfiguredLeading) {
  GateConfig cfg;
  cfg.originPlacement = OriginPlacement::Leading;
  SymbolMap map(cfg);
  AddressValidator validator(map, cfg);
  Address out;

  const int leading[] = {1, 2, 3, 4, 5, 6};
  const int trailing[] = {2, 3, 4, 5, 6, 1};
  EXPECT_EQ(validator.validate(leading, 6, out), ValidationError::None);
  EXPECT_EQ(validator.validate(trailing, 6, out), ValidationError::MisplacedOrigin);
}

TEST(AddressValidatorLength, ConfiguredMinimumApplies) {
  GateConfig cfg;
  cfg.minAddressLength = 7;
  SymbolMap map(cfg);
  AddressValidator validator(map, cfg);
  Address out;

  const int six[] = {2, 3, 4, 5, 6, 1};
  EXPECT_EQ(validator.validate(six, 6, out), ValidationError::TooShort);
}
