#include "info_header_builder.h"

#include <utility>

#include "fmt/format.h"
#include "grpaf_exception.h"

namespace grpaf
{

std::string InfoDescriptor::to_header_line() const
{
    return fmt::format("##INFO=<ID={},Number={},Type={},Description=\"{}\">", id, number2str(number), type2str(type), description);
}

InfoHeaderBuilder& InfoHeaderBuilder::add_groups(const GroupMasks& masks, const InfoTagVector& tags)
{
    for (size_t gi = 0, len = masks.size(); gi < len; ++gi) {
        for (InfoTag tag : tags) {
            add(tag, gi, masks[gi].group, masks[gi].declared);
        }
    }
    return *this;
}

InfoHeaderBuilder& InfoHeaderBuilder::add(InfoTag tag, size_t group_index, const std::string& group, uint32_t declared_count)
{
    CHECK_CONDITION_THROW(finalized_, ConfigError, "descriptor {}_{} added after the header was finalized",
                          info_tag_traits(tag).name, group);
    const InfoTagTraits& traits = info_tag_traits(tag);
    InfoDescriptor d;
    d.id = fmt::format("{}_{}", traits.name, group);
    d.tag = tag;
    d.group_index = group_index;
    d.group = group;
    d.number = traits.number;
    d.type = traits.type;
    d.description = fmt::format("{} on {} {} samples", traits.name, declared_count, group);
    descriptors_.push_back(std::move(d));
    return *this;
}

InfoDescriptors InfoHeaderBuilder::finalize()
{
    CHECK_CONDITION_THROW(finalized_, ConfigError, "header descriptors finalized twice");
    finalized_ = true;
    return std::move(descriptors_);
}

}  // namespace grpaf
