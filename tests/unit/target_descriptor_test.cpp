#include <gtest/gtest.h>

#include "lumen/common/diagnostic.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::target {
namespace {

class TargetDescriptorTest : public ::testing::Test {};

TEST_F(TargetDescriptorTest, HostHasEverything) {
  auto host = TargetDescriptor::Host();
  EXPECT_EQ(host.Kind(), TargetKind::kHostExecution);
  EXPECT_EQ(host.Mode(), TargetMode::kHosted);
  EXPECT_EQ(host.Extensions(), ExtensionSet::All());
  EXPECT_TRUE(host.HasWideMultiply());
  EXPECT_EQ(host.MaxIntegerWidth(), 128U);
  EXPECT_EQ(host.Name(), "host");
  EXPECT_EQ(host.FeatureString(), "");
}

TEST_F(TargetDescriptorTest, DefaultEmbeddedIsRv32imacPic) {
  auto target = TargetDescriptor::DefaultEmbedded();
  EXPECT_EQ(target.Kind(), TargetKind::kEmbeddedIsa);
  EXPECT_EQ(target.Mode(), TargetMode::kFreestanding);
  EXPECT_EQ(target.Name(), "rv32imac");
  EXPECT_TRUE(target.IsPositionIndependent());
  EXPECT_EQ(target.FeatureString(), "+m,+a,+c,-f,-d");
  EXPECT_EQ(target.PointerWidth(), 32U);
  EXPECT_EQ(target.MaxIntegerWidth(), 64U);
}

TEST_F(TargetDescriptorTest, WideMultiplyFollowsM) {
  auto base = TargetDescriptor::Embedded(ExtensionSet{}, false);
  EXPECT_FALSE(base.HasWideMultiply());
  auto with_m = TargetDescriptor::Embedded(
      ExtensionSet{}.With(Extension::kMultiplyDivide), false);
  EXPECT_TRUE(with_m.HasWideMultiply());
}

TEST_F(TargetDescriptorTest, ParseCanonicalStrings) {
  auto host = TargetDescriptor::Parse("host");
  ASSERT_TRUE(host.has_value());
  EXPECT_EQ(*host, TargetDescriptor::Host());

  auto base = TargetDescriptor::Parse("rv32i");
  ASSERT_TRUE(base.has_value());
  EXPECT_EQ(base->Extensions(), ExtensionSet{});

  auto full = TargetDescriptor::Parse("rv32imafd");
  ASSERT_TRUE(full.has_value());
  EXPECT_TRUE(full->Has(Extension::kDoubleFloat));
  EXPECT_FALSE(full->Has(Extension::kCompressed));
  EXPECT_EQ(full->Name(), "rv32imafd");
}

TEST_F(TargetDescriptorTest, ParseRejectsOutOfOrderExtensions) {
  auto result = TargetDescriptor::Parse("rv32icm");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, ErrorCode::kHostError);
  EXPECT_FALSE(result.error().notes.empty());
}

TEST_F(TargetDescriptorTest, ParseRejectsUnknownInput) {
  EXPECT_FALSE(TargetDescriptor::Parse("x86_64").has_value());
  EXPECT_FALSE(TargetDescriptor::Parse("rv32g").has_value());
  EXPECT_FALSE(TargetDescriptor::Parse("rv32imm").has_value());
  EXPECT_FALSE(TargetDescriptor::Parse("rv32id").has_value());
}

TEST_F(TargetDescriptorTest, WithPositionIndependence) {
  auto target = TargetDescriptor::DefaultEmbedded().WithPositionIndependence(
      false);
  EXPECT_FALSE(target.IsPositionIndependent());
  EXPECT_EQ(target.Name(), "rv32imac");
}

TEST_F(TargetDescriptorTest, ExtensionSetWithout) {
  auto set = ExtensionSet::All().Without(Extension::kAtomics);
  EXPECT_FALSE(set.Has(Extension::kAtomics));
  EXPECT_TRUE(set.Has(Extension::kMultiplyDivide));
  EXPECT_EQ(ExtensionLetter(Extension::kAtomics), "a");
}

}  // namespace
}  // namespace lumen::target
