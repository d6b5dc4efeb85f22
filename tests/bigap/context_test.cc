#include <sstream>
#include <stdexcept>
#include <string>

#include <gmock/gmock.h>

#include "bigap/bigap.h"
#include "bigap/context_io.h"

using ::testing::HasSubstr;
using ::testing::UnorderedElementsAre;

namespace bigap {
namespace {
template <typename T> std::string to_string(const T &value) {
  std::stringstream ss;
  ss << value;
  return ss.str();
}
} // namespace

TEST(ContextTest, AllPresetNamesCanBeInstantiated) {
  EXPECT_THAT(get_preset_names(), UnorderedElementsAre("default", "fast", "strong"));
  for (const std::string &name : get_preset_names()) {
    EXPECT_NO_THROW(create_context_by_preset_name(name)) << name;
  }
}

TEST(ContextTest, UnknownPresetNameThrows) {
  EXPECT_THROW(create_context_by_preset_name("eco"), std::runtime_error);
}

TEST(ContextTest, DefaultContext) {
  const Context ctx = create_default_context();
  EXPECT_EQ(ctx.bisection.num_iterations, 20);
  EXPECT_EQ(ctx.bisection.max_depth, 100);
  EXPECT_EQ(ctx.bisection.min_partition_size, 16);
  EXPECT_EQ(ctx.bisection.leaf_ordering, LeafOrdering::SORTED_BY_ID);
  EXPECT_FALSE(ctx.debug.validate_permutation);
}

TEST(ContextTest, PresetsTradeSpeedForQuality) {
  const Context fast = create_fast_context();
  const Context def = create_default_context();
  const Context strong = create_strong_context();

  EXPECT_LT(fast.bisection.num_iterations, def.bisection.num_iterations);
  EXPECT_LT(def.bisection.num_iterations, strong.bisection.num_iterations);
  EXPECT_GT(fast.bisection.min_partition_size, def.bisection.min_partition_size);
  EXPECT_GT(def.bisection.min_partition_size, strong.bisection.min_partition_size);

  EXPECT_EQ(fast.bisection.gain_model, def.bisection.gain_model);
  EXPECT_EQ(strong.bisection.gain_model, def.bisection.gain_model);
}

TEST(ContextTest, GainModelNames) {
  const auto models = get_gain_models();
  EXPECT_EQ(models.at("default"), GainModel::DEFAULT);
  EXPECT_EQ(models.at("approx-1"), GainModel::APPROX_1);
  EXPECT_EQ(models.at("approx_1"), GainModel::APPROX_1);
  EXPECT_EQ(models.at("approx-2"), GainModel::APPROX_2);
  EXPECT_EQ(models.at("approx_2"), GainModel::APPROX_2);

  EXPECT_EQ(to_string(GainModel::DEFAULT), "default");
  EXPECT_EQ(to_string(GainModel::APPROX_1), "approx-1");
  EXPECT_EQ(to_string(GainModel::APPROX_2), "approx-2");
}

TEST(ContextTest, LeafOrderingNames) {
  const auto orderings = get_leaf_orderings();
  EXPECT_EQ(orderings.at("sorted"), LeafOrdering::SORTED_BY_ID);
  EXPECT_EQ(orderings.at("keep"), LeafOrdering::KEEP);

  EXPECT_EQ(to_string(LeafOrdering::SORTED_BY_ID), "sorted-by-id");
  EXPECT_EQ(to_string(LeafOrdering::KEEP), "keep");
}

TEST(ContextTest, PrintsBisectionContext) {
  std::stringstream ss;
  print(create_strong_context().bisection, ss);
  EXPECT_THAT(ss.str(), HasSubstr("Local search rounds:          40"));
  EXPECT_THAT(ss.str(), HasSubstr("Leaf ordering:                sorted-by-id"));
}
} // namespace bigap
