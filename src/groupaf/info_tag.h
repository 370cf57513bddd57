#ifndef GRPAF_INFO_TAG_H_
#define GRPAF_INFO_TAG_H_
#include <cstdint>
#include <string>
#include <vector>

#include "af_stats.h"

namespace grpaf
{

/*! @brief one statistic per value, in canonical emission order */
enum class InfoTag : uint8_t { AF = 0, MAF, MAC, AC, AN, N_HEMI, N_MISS, N_HOMREF, N_HET, N_HOMALT, EXC_HET, HWE };

static constexpr size_t k_info_tag_count = 12;

enum class InfoNumber : uint8_t { ONE = 0, PER_ALT };

enum class InfoType : uint8_t { INTEGER = 0, FLOAT };

typedef double (*InfoValueFn)(const AfStats& st);

typedef struct InfoTagTraits
{
    InfoTag tag;
    const char* name;
    InfoNumber number;
    InfoType type;
    InfoValueFn value;
} InfoTagTraits, *pInfoTagTraits;

typedef std::vector<InfoTag> InfoTagVector;

/*! @brief static traits of tag, never null */
const InfoTagTraits& info_tag_traits(InfoTag tag);

/*! @brief every tag in canonical order */
const InfoTagVector& all_info_tags();

/*!
 * @brief parse a comma separated tag selection
 * @param tags in| "all", or names from the tag table; duplicates collapse
 * @return selected tags in canonical order
 * @throw ConfigError on an empty selection or an unknown name
 */
InfoTagVector parse_info_tags(const std::string& tags);

/*! @brief ExcHet and HWE are the only tags needing the HWE approximator */
bool needs_hwe(const InfoTagVector& tags);

/*! @brief true when id starts with "<TAG>_" for any tag, i.e. was written by an earlier annotate run */
bool is_synthesized_tag_id(const char* id);

const char* number2str(InfoNumber number);
const char* type2str(InfoType type);

}  // namespace grpaf

#endif  // GRPAF_INFO_TAG_H_
