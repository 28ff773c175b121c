#include "estimate/PatchSampler.hpp"

#include <gtest/gtest.h>
#include <vector>

namespace gatvst {
namespace {

TEST(PatchSamplerTest, CoversFrameWithNonOverlappingGrid) {
  auto sampler = PatchSampler::create(64, 64, 8, 8);
  ASSERT_TRUE(sampler.has_value());
  EXPECT_EQ(sampler->rows(), 8);
  EXPECT_EQ(sampler->cols(), 8);
  EXPECT_EQ(sampler->size(), 64u);
  EXPECT_EQ((*sampler)[0], (Patch{0, 0, 8}));
  EXPECT_EQ((*sampler)[1], (Patch{0, 8, 8}));
  EXPECT_EQ((*sampler)[8], (Patch{8, 0, 8}));
  EXPECT_EQ((*sampler)[63], (Patch{56, 56, 8}));
}

TEST(PatchSamplerTest, DiscardsTrailingPartialPatches) {
  auto sampler = PatchSampler::create(70, 50, 8, 8);
  ASSERT_TRUE(sampler.has_value());
  EXPECT_EQ(sampler->rows(), 8);
  EXPECT_EQ(sampler->cols(), 6);

  for (const Patch &p : *sampler) {
    EXPECT_LE(p.row + p.size, 70);
    EXPECT_LE(p.col + p.size, 50);
    EXPECT_EQ(p.size, 8);
  }
}

TEST(PatchSamplerTest, OverlappingStride) {
  auto sampler = PatchSampler::create(16, 16, 8, 4);
  ASSERT_TRUE(sampler.has_value());
  EXPECT_EQ(sampler->size(), 9u);
  EXPECT_EQ((*sampler)[8], (Patch{8, 8, 8}));
}

TEST(PatchSamplerTest, PatchLargerThanFrameYieldsNothing) {
  auto sampler = PatchSampler::create(6, 20, 8, 8);
  ASSERT_TRUE(sampler.has_value());
  EXPECT_TRUE(sampler->empty());
  EXPECT_TRUE(sampler->begin() == sampler->end());
}

TEST(PatchSamplerTest, RejectsNonPositiveArguments) {
  for (auto result :
       {PatchSampler::create(0, 10, 2, 2), PatchSampler::create(10, -1, 2, 2),
        PatchSampler::create(10, 10, 0, 2),
        PatchSampler::create(10, 10, 2, 0)}) {
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ProcessError::Code::INVALID_ARGUMENT);
  }
}

TEST(PatchSamplerTest, SequenceIsRestartableAndMatchesIndexing) {
  auto sampler = PatchSampler::create(40, 24, 5, 3);
  ASSERT_TRUE(sampler.has_value());

  std::vector<Patch> first(sampler->begin(), sampler->end());
  std::vector<Patch> second(sampler->begin(), sampler->end());
  ASSERT_EQ(first.size(), sampler->size());
  EXPECT_EQ(first, second);
  for (std::size_t i = 0; i < first.size(); ++i) {
    EXPECT_EQ(first[i], (*sampler)[i]);
  }
}

} // namespace
} // namespace gatvst
