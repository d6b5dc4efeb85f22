#include <cstdint>
#include <numeric>
#include <span>
#include <vector>

#include <gmock/gmock.h>

#include "bigap-common/datastructures/static_array.h"

using ::testing::Each;
using ::testing::ElementsAre;
using ::testing::Eq;

namespace bigap {
TEST(StaticArrayTest, DefaultConstructedArrayIsEmpty) {
  StaticArray<int> array;
  EXPECT_TRUE(array.empty());
  EXPECT_EQ(array.size(), 0);
}

TEST(StaticArrayTest, ElementsAreValueInitialized) {
  StaticArray<int> array(100);
  EXPECT_EQ(array.size(), 100);
  EXPECT_THAT(array, Each(Eq(0)));
}

TEST(StaticArrayTest, ElementsAreInitializedWithValue) {
  StaticArray<int> array(100, 42);
  EXPECT_THAT(array, Each(Eq(42)));
}

TEST(StaticArrayTest, ElementsAreInitializedWithValueOfElementType) {
  const std::uint32_t size = 5;
  const std::uint32_t value = 0xFFFFFFFFu;
  StaticArray<std::uint32_t> array(size, value);
  EXPECT_EQ(array.size(), 5);
  EXPECT_THAT(array, Each(Eq(value)));
}

TEST(StaticArrayTest, LargeArraysAreInitializedInParallel) {
  StaticArray<std::uint32_t> array(static_array::kParallelInitThreshold * 4, 7u);
  EXPECT_THAT(array, Each(Eq(7u)));

  StaticArray<std::uint32_t> seq_array(
      static_array::kParallelInitThreshold * 4, 7u, static_array::seq
  );
  EXPECT_THAT(seq_array, Each(Eq(7u)));
}

TEST(StaticArrayTest, CreateFromInitializerListAndVector) {
  const StaticArray<int> from_list = static_array::create<int>({1, 2, 3});
  EXPECT_THAT(from_list, ElementsAre(1, 2, 3));

  const std::vector<int> vec = {4, 5, 6};
  const StaticArray<int> from_vector = static_array::create(vec);
  EXPECT_THAT(from_vector, ElementsAre(4, 5, 6));
}

TEST(StaticArrayTest, ResizeDiscardsOldContents) {
  StaticArray<int> array(10, 1);
  array.resize(20, 2);
  EXPECT_EQ(array.size(), 20);
  EXPECT_THAT(array, Each(Eq(2)));
}

TEST(StaticArrayTest, MoveLeavesSourceEmpty) {
  StaticArray<int> array(10, 3);
  StaticArray<int> moved(std::move(array));
  EXPECT_EQ(moved.size(), 10);
  EXPECT_TRUE(array.empty());
}

TEST(StaticArrayTest, FreeReleasesMemory) {
  StaticArray<int> array(10);
  array.free();
  EXPECT_TRUE(array.empty());
  EXPECT_EQ(array.data(), nullptr);
}

TEST(StaticArrayTest, ConvertsToSpan) {
  StaticArray<int> array(5);
  std::iota(array.begin(), array.end(), 0);
  std::span<const int> span = array;
  EXPECT_THAT(span, ElementsAre(0, 1, 2, 3, 4));
}
} // namespace bigap
