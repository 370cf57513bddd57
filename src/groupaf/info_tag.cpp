#include "info_tag.h"

#include <algorithm>
#include <array>
#include <cstring>
#include <sstream>

#include "grpaf_exception.h"

namespace grpaf
{

static constexpr const char* s_all_sentinel = "all";

// clang-format off
static const std::array<InfoTagTraits, k_info_tag_count> s_tag_traits{{
    {InfoTag::AF,       "AF",       InfoNumber::ONE,     InfoType::FLOAT,   [](const AfStats& st) { return st.af; }},
    {InfoTag::MAF,      "MAF",      InfoNumber::ONE,     InfoType::FLOAT,   [](const AfStats& st) { return st.maf; }},
    {InfoTag::MAC,      "MAC",      InfoNumber::PER_ALT, InfoType::INTEGER, [](const AfStats& st) { return double(st.mac); }},
    {InfoTag::AC,       "AC",       InfoNumber::PER_ALT, InfoType::INTEGER, [](const AfStats& st) { return double(st.ac[1]); }},
    {InfoTag::AN,       "AN",       InfoNumber::ONE,     InfoType::INTEGER, [](const AfStats& st) { return double(st.an); }},
    {InfoTag::N_HEMI,   "N_HEMI",   InfoNumber::ONE,     InfoType::INTEGER, [](const AfStats& st) { return double(st.n_hemi); }},
    {InfoTag::N_MISS,   "N_MISS",   InfoNumber::ONE,     InfoType::INTEGER, [](const AfStats& st) { return double(st.n_miss); }},
    {InfoTag::N_HOMREF, "N_HOMREF", InfoNumber::ONE,     InfoType::INTEGER, [](const AfStats& st) { return double(st.n_homref); }},
    {InfoTag::N_HET,    "N_HET",    InfoNumber::ONE,     InfoType::INTEGER, [](const AfStats& st) { return double(st.n_het); }},
    {InfoTag::N_HOMALT, "N_HOMALT", InfoNumber::ONE,     InfoType::INTEGER, [](const AfStats& st) { return double(st.n_homalt); }},
    {InfoTag::EXC_HET,  "ExcHet",   InfoNumber::ONE,     InfoType::INTEGER, [](const AfStats& st) { return double(st.exc_het); }},
    {InfoTag::HWE,      "HWE",      InfoNumber::ONE,     InfoType::FLOAT,   [](const AfStats& st) { return st.hwe; }},
}};
// clang-format on

const InfoTagTraits& info_tag_traits(InfoTag tag) { return s_tag_traits[static_cast<size_t>(tag)]; }

const InfoTagVector& all_info_tags()
{
    static const InfoTagVector s_all = [] {
        InfoTagVector v;
        for (const InfoTagTraits& t : s_tag_traits) {
            v.push_back(t.tag);
        }
        return v;
    }();
    return s_all;
}

static std::string trim(const std::string& s)
{
    size_t b = s.find_first_not_of(" \t");
    if (b == std::string::npos) {
        return {};
    }
    size_t e = s.find_last_not_of(" \t");
    return s.substr(b, e - b + 1);
}

InfoTagVector parse_info_tags(const std::string& tags)
{
    std::array<bool, k_info_tag_count> chosen{};
    bool any = false;

    std::istringstream iss{tags};
    std::string item;
    while (std::getline(iss, item, ',')) {
        item = trim(item);
        if (item.empty()) {
            continue;
        }
        if (item == s_all_sentinel) {
            chosen.fill(true);
            any = true;
            continue;
        }
        auto it = std::find_if(s_tag_traits.begin(), s_tag_traits.end(), [&item](const InfoTagTraits& t) { return item == t.name; });
        CHECK_CONDITION_THROW(it == s_tag_traits.end(), ConfigError, "unknown tag '{}' in --tags, expected 'all' or a subset of "
                              "AF,MAF,MAC,AC,AN,N_HEMI,N_MISS,N_HOMREF,N_HET,N_HOMALT,ExcHet,HWE", item);
        chosen[static_cast<size_t>(it->tag)] = true;
        any = true;
    }
    CHECK_CONDITION_THROW(!any, ConfigError, "empty tag selection '{}'", tags);

    InfoTagVector result;
    for (const InfoTagTraits& t : s_tag_traits) {
        if (chosen[static_cast<size_t>(t.tag)]) {
            result.push_back(t.tag);
        }
    }
    return result;
}

bool needs_hwe(const InfoTagVector& tags)
{
    return std::any_of(tags.begin(), tags.end(), [](InfoTag t) { return t == InfoTag::EXC_HET || t == InfoTag::HWE; });
}

bool is_synthesized_tag_id(const char* id)
{
    if (nullptr == id) {
        return false;
    }
    for (const InfoTagTraits& t : s_tag_traits) {
        size_t len = strlen(t.name);
        if (strncmp(id, t.name, len) == 0 && id[len] == '_') {
            return true;
        }
    }
    return false;
}

const char* number2str(InfoNumber number) { return number == InfoNumber::PER_ALT ? "A" : "1"; }

const char* type2str(InfoType type) { return type == InfoType::FLOAT ? "Float" : "Integer"; }

}  // namespace grpaf
