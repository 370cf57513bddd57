#ifndef GRPAF_GROUP_MASK_H_
#define GRPAF_GROUP_MASK_H_
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace grpaf
{

typedef std::vector<std::string> SampleOrder;

/*!
 * @brief group -> declared samples, as read from the label source
 * groups keeps first-appearance order; samples may hold duplicates, one entry per label row
 */
typedef struct GroupMembership
{
    std::vector<std::string> groups;
    std::unordered_map<std::string, std::vector<std::string>> samples;

    void add(const std::string& sample, const std::string& group)
    {
        auto it = samples.find(group);
        if (it == samples.end()) {
            groups.push_back(group);
            it = samples.emplace(group, std::vector<std::string>{}).first;
        }
        it->second.push_back(sample);
    }

    /*! @return label rows declared for group, 0 when unknown */
    uint32_t declared_count(const std::string& group) const
    {
        auto it = samples.find(group);
        return it == samples.end() ? 0 : static_cast<uint32_t>(it->second.size());
    }

    bool empty() const { return groups.empty(); }
} GroupMembership, *pGroupMembership;

/*!
 * @brief per group inclusion vector aligned index for index with SampleOrder
 * @param selected: selected[i] is true iff SampleOrder[i] belongs to the group
 * @param size: number of selected samples
 * @param declared: label rows for the group, used in header descriptions
 */
typedef struct GroupMask
{
    std::string group;
    std::vector<bool> selected;
    uint32_t size{0};
    uint32_t declared{0};
} GroupMask, *pGroupMask;

typedef std::vector<GroupMask> GroupMasks;

class GroupMaskBuilder
{
    /* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
public:
    /*!
     * @brief one mask per group, in membership group order
     * label samples that do not appear in sample_order select nothing
     */
    static GroupMasks build(const SampleOrder& sample_order, const GroupMembership& membership);

    /*!
     * @brief label-declared samples missing from sample_order, each reported once, in label order
     */
    static std::vector<std::string> absent_samples(const SampleOrder& sample_order, const GroupMembership& membership);

    /*!
     * @brief label samples absent from sample_order
     * @param strict in| raise instead of returning when any sample is absent
     * @return absent samples, empty when the labels and the sample order agree
     * @throw ConsistencyError in strict mode, naming every absent sample
     */
    static std::vector<std::string> check_consistency(const SampleOrder& sample_order, const GroupMembership& membership, bool strict);
};

}  // namespace grpaf

#endif  // GRPAF_GROUP_MASK_H_
