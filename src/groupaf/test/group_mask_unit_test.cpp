#include <gtest/gtest.h>

#include "group_mask.h"
#include "grpaf_exception.h"

using namespace grpaf;

class GroupMaskUnitTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        _samples = {"A", "B", "C", "D"};
        _membership.add("C", "eur");
        _membership.add("A", "eur");
        _membership.add("X", "eur");
        _membership.add("D", "afr");
        _membership.add("D", "afr");
        _membership.add("B", "eas");
    }

    SampleOrder _samples;
    GroupMembership _membership;
};

TEST_F(GroupMaskUnitTest, testGroupOrderFollowsLabels)
{
    ASSERT_EQ((std::vector<std::string>{"eur", "afr", "eas"}), _membership.groups);
    EXPECT_EQ(3u, _membership.declared_count("eur"));
    EXPECT_EQ(2u, _membership.declared_count("afr"));
    EXPECT_EQ(0u, _membership.declared_count("amr"));
}

TEST_F(GroupMaskUnitTest, testBuild)
{
    GroupMasks masks = GroupMaskBuilder::build(_samples, _membership);
    ASSERT_EQ(3u, masks.size());

    EXPECT_EQ("eur", masks[0].group);
    EXPECT_EQ((std::vector<bool>{true, false, true, false}), masks[0].selected);
    EXPECT_EQ(2u, masks[0].size);
    EXPECT_EQ(3u, masks[0].declared);

    EXPECT_EQ("afr", masks[1].group);
    EXPECT_EQ((std::vector<bool>{false, false, false, true}), masks[1].selected);
    EXPECT_EQ(1u, masks[1].size);
    EXPECT_EQ(2u, masks[1].declared);

    EXPECT_EQ((std::vector<bool>{false, true, false, false}), masks[2].selected);
}

TEST_F(GroupMaskUnitTest, testMasksAlignWithSampleOrder)
{
    GroupMasks masks = GroupMaskBuilder::build(_samples, _membership);
    for (const GroupMask& m : masks) {
        EXPECT_EQ(_samples.size(), m.selected.size()) << m.group;
    }
}

TEST_F(GroupMaskUnitTest, testAbsentSamples)
{
    _membership.add("X", "afr");
    _membership.add("Y", "afr");
    std::vector<std::string> absent = GroupMaskBuilder::absent_samples(_samples, _membership);
    EXPECT_EQ((std::vector<std::string>{"X", "Y"}), absent);
    EXPECT_TRUE(GroupMaskBuilder::absent_samples({"A", "B", "C", "D", "X", "Y"}, _membership).empty());
}

TEST_F(GroupMaskUnitTest, testStrictRejectsAbsentSample)
{
    try {
        GroupMaskBuilder::check_consistency(_samples, _membership, true);
        FAIL() << "expected ConsistencyError";
    }
    catch (const ConsistencyError& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("X"));
    }
}

TEST_F(GroupMaskUnitTest, testLenientReportsAbsentSample)
{
    std::vector<std::string> absent;
    EXPECT_NO_THROW(absent = GroupMaskBuilder::check_consistency(_samples, _membership, false));
    EXPECT_EQ((std::vector<std::string>{"X"}), absent);
}

TEST_F(GroupMaskUnitTest, testStrictAcceptsConsistentLabels)
{
    std::vector<std::string> absent{"unset"};
    EXPECT_NO_THROW(absent = GroupMaskBuilder::check_consistency({"A", "B", "C", "D", "X"}, _membership, true));
    EXPECT_TRUE(absent.empty());
}

TEST_F(GroupMaskUnitTest, testNoSamples)
{
    GroupMasks masks = GroupMaskBuilder::build({}, _membership);
    ASSERT_EQ(3u, masks.size());
    EXPECT_TRUE(masks[0].selected.empty());
    EXPECT_EQ(0u, masks[0].size);
}
