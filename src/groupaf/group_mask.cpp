#include "group_mask.h"

#include <unordered_set>
#include <utility>

#include "grpaf_exception.h"

namespace grpaf
{

static std::unordered_map<std::string, std::vector<size_t>> index_samples(const SampleOrder& sample_order)
{
    std::unordered_map<std::string, std::vector<size_t>> index;
    index.reserve(sample_order.size());
    for (size_t i = 0, len = sample_order.size(); i < len; ++i) {
        index[sample_order[i]].push_back(i);
    }
    return index;
}

GroupMasks GroupMaskBuilder::build(const SampleOrder& sample_order, const GroupMembership& membership)
{
    std::unordered_map<std::string, std::vector<size_t>> index = index_samples(sample_order);

    GroupMasks masks;
    masks.reserve(membership.groups.size());
    for (const std::string& group : membership.groups) {
        GroupMask mask;
        mask.group = group;
        mask.selected.assign(sample_order.size(), false);
        mask.declared = membership.declared_count(group);

        auto members = membership.samples.find(group);
        if (members != membership.samples.end()) {
            for (const std::string& sample : members->second) {
                auto hit = index.find(sample);
                if (hit == index.end()) {
                    continue;
                }
                for (size_t pos : hit->second) {
                    mask.selected[pos] = true;
                }
            }
        }

        for (bool b : mask.selected) {
            mask.size += b ? 1 : 0;
        }
        masks.push_back(std::move(mask));
    }
    return masks;
}

std::vector<std::string> GroupMaskBuilder::absent_samples(const SampleOrder& sample_order, const GroupMembership& membership)
{
    std::unordered_set<std::string> known{sample_order.begin(), sample_order.end()};
    std::unordered_set<std::string> reported;
    std::vector<std::string> absent;
    for (const std::string& group : membership.groups) {
        auto members = membership.samples.find(group);
        if (members == membership.samples.end()) {
            continue;
        }
        for (const std::string& sample : members->second) {
            if (known.count(sample) == 0 && reported.insert(sample).second) {
                absent.push_back(sample);
            }
        }
    }
    return absent;
}

std::vector<std::string> GroupMaskBuilder::check_consistency(const SampleOrder& sample_order, const GroupMembership& membership,
                                                             bool strict)
{
    std::vector<std::string> absent = absent_samples(sample_order, membership);
    if (strict && !absent.empty()) {
        std::string names;
        for (const std::string& sample : absent) {
            names.append(names.empty() ? "" : ",").append(sample);
        }
        throw ConsistencyError(fmt::format("building masks: {} label samples absent from the input: {}", absent.size(), names));
    }
    return absent;
}

}  // namespace grpaf
