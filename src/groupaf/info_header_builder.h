#ifndef GRPAF_INFO_HEADER_BUILDER_H_
#define GRPAF_INFO_HEADER_BUILDER_H_
#include <string>
#include <vector>

#include "group_mask.h"
#include "info_tag.h"

namespace grpaf
{

/*!
 * @brief one INFO declaration per (tag, group)
 * @param id: "<TAG>_<group>"
 * @param group_index: index of the group in GroupMasks
 * @param description: "<TAG> on <count> <group> samples"
 */
typedef struct InfoDescriptor
{
    std::string id;
    InfoTag tag;
    size_t group_index;
    std::string group;
    InfoNumber number;
    InfoType type;
    std::string description;

    /*! @return ##INFO=<ID=..,Number=..,Type=..,Description=".."> */
    std::string to_header_line() const;
} InfoDescriptor, *pInfoDescriptor;

typedef std::vector<InfoDescriptor> InfoDescriptors;

/*!
 * @brief collects descriptors before any variant is processed
 * finalize() hands out the immutable list, the builder cannot be used afterwards
 */
class InfoHeaderBuilder
{
    /* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
private:
    InfoDescriptors descriptors_;
    bool finalized_{false};

    /* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
public:
    /*! @brief groups outer, tags inner */
    InfoHeaderBuilder& add_groups(const GroupMasks& masks, const InfoTagVector& tags);

    InfoHeaderBuilder& add(InfoTag tag, size_t group_index, const std::string& group, uint32_t declared_count);

    InfoDescriptors finalize();
};

}  // namespace grpaf

#endif  // GRPAF_INFO_HEADER_BUILDER_H_
