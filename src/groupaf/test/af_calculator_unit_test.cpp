#include <gtest/gtest.h>

#include <algorithm>
#include <random>

#include "af_calculator.h"
#include "genotype_normalizer.h"
#include "grpaf_exception.h"

using namespace grpaf;

static constexpr int32_t s_missing = k_missing_allele;

class AfCalculatorUnitTest : public ::testing::Test
{
protected:
    void SetUp() override { _rng.seed(20231018); }

    GenotypeVector random_calls(size_t n);

    std::mt19937 _rng;
};

GenotypeVector AfCalculatorUnitTest::random_calls(size_t n)
{
    std::uniform_int_distribution<int32_t> kind(0, 3);
    std::uniform_int_distribution<int32_t> allele(-1, 1);
    GenotypeVector result;
    for (size_t i = 0; i < n; ++i) {
        switch (kind(_rng)) {
            case 0: result.push_back(NormalizedGenotype::missing()); break;
            case 1: result.push_back(NormalizedGenotype::hemizygous(std::max(allele(_rng), 0))); break;
            default: result.push_back(NormalizedGenotype::diploid(allele(_rng), allele(_rng))); break;
        }
    }
    return result;
}

TEST_F(AfCalculatorUnitTest, testHetAndHomAlt)
{
    GenotypeVector calls{NormalizedGenotype::diploid(0, 1), NormalizedGenotype::diploid(1, 1)};
    AfStats st = AfCalculator::calculate(calls);
    EXPECT_EQ(1u, st.ac[0]);
    EXPECT_EQ(3u, st.ac[1]);
    EXPECT_EQ(4u, st.an);
    EXPECT_EQ(1u, st.n_het);
    EXPECT_EQ(1u, st.n_homalt);
    EXPECT_EQ(0u, st.n_homref);
    EXPECT_DOUBLE_EQ(0.75, st.af);
    EXPECT_EQ(1u, st.mac);
    EXPECT_DOUBLE_EQ(0.25, st.maf);
}

TEST_F(AfCalculatorUnitTest, testFullyMissingCall)
{
    GenotypeVector calls{NormalizedGenotype::diploid(s_missing, s_missing), NormalizedGenotype::missing()};
    AfStats st = AfCalculator::calculate(calls);
    EXPECT_EQ(2u, st.n_miss);
    EXPECT_EQ(0u, st.an);
    EXPECT_EQ(0u, st.ac[0]);
    EXPECT_EQ(0u, st.ac[1]);
}

TEST_F(AfCalculatorUnitTest, testHemizygousRef)
{
    AfStats st = AfCalculator::calculate({NormalizedGenotype::hemizygous(0)});
    EXPECT_EQ(1u, st.an);
    EXPECT_EQ(1u, st.ac[0]);
    EXPECT_EQ(1u, st.n_hemi);
    EXPECT_DOUBLE_EQ(0.0, st.af);
    EXPECT_EQ(0u, st.mac);
}

TEST_F(AfCalculatorUnitTest, testPartiallyMissingDiploid)
{
    AfStats st = AfCalculator::calculate({NormalizedGenotype::diploid(s_missing, 1), NormalizedGenotype::diploid(0, s_missing)});
    EXPECT_EQ(2u, st.an);
    EXPECT_EQ(1u, st.ac[0]);
    EXPECT_EQ(1u, st.ac[1]);
    EXPECT_EQ(2u, st.n_hemi);
    EXPECT_EQ(0u, st.n_miss);
    EXPECT_EQ(0u, st.n_het);
}

TEST_F(AfCalculatorUnitTest, testEmptyGroup)
{
    AfStats st = AfCalculator::calculate({});
    EXPECT_EQ(0u, st.classified());
    EXPECT_EQ(0u, st.an);
    EXPECT_DOUBLE_EQ(0.0, st.af);
    EXPECT_DOUBLE_EQ(0.0, st.maf);
    EXPECT_EQ(0u, st.mac);
}

TEST_F(AfCalculatorUnitTest, testRejectsAlleleAboveAlt)
{
    EXPECT_THROW(AfCalculator::calculate({NormalizedGenotype::diploid(0, 2)}), FormatError);
    EXPECT_THROW(AfCalculator::calculate({NormalizedGenotype::hemizygous(3)}), FormatError);
}

TEST_F(AfCalculatorUnitTest, testCountInvariants)
{
    for (size_t n : {1u, 2u, 7u, 50u, 301u}) {
        GenotypeVector calls = random_calls(n);
        AfStats st = AfCalculator::calculate(calls);
        ASSERT_EQ(n, st.classified()) << "n = " << n;
        ASSERT_EQ(st.an, st.ac[0] + st.ac[1]) << "n = " << n;
        ASSERT_EQ(std::min(st.ac[0], st.ac[1]), st.mac) << "n = " << n;
        if (st.an == 0) {
            ASSERT_EQ(0.0, st.af);
            ASSERT_EQ(0.0, st.maf);
        }
        else {
            ASSERT_DOUBLE_EQ(double(st.ac[1]) / st.an, st.af);
            ASSERT_DOUBLE_EQ(double(st.mac) / st.an, st.maf);
        }
    }
}

TEST_F(AfCalculatorUnitTest, testOrderIndependence)
{
    GenotypeVector calls = random_calls(200);
    AfStats expected = AfCalculator::calculate(calls);
    for (int32_t round = 0; round < 10; ++round) {
        std::shuffle(calls.begin(), calls.end(), _rng);
        AfStats actual = AfCalculator::calculate(calls);
        ASSERT_EQ(expected.af, actual.af) << "round = " << round;
        ASSERT_EQ(expected.ac, actual.ac);
        ASSERT_EQ(expected.n_het, actual.n_het);
        ASSERT_EQ(expected.n_hemi, actual.n_hemi);
        ASSERT_EQ(expected.n_miss, actual.n_miss);
    }
}
