#include "record_annotator.h"

#include <algorithm>
#include <utility>

#include "af_calculator.h"
#include "grpaf_exception.h"
#include "hwe_approximator.h"

namespace grpaf
{

RecordAnnotator::RecordAnnotator(const GroupMasks& masks, const InfoDescriptors& descriptors, bool compute_hwe)
    : masks_(masks)
    , descriptors_(descriptors)
    , compute_hwe_(compute_hwe)
{}

std::vector<AfStats> RecordAnnotator::aggregate(const GenotypeVector& genotypes, const std::string& locus) const
{
    std::vector<AfStats> result;
    result.reserve(masks_.size());
    for (const GroupMask& mask : masks_) {
        CHECK_CONDITION_THROW(mask.selected.size() != genotypes.size(), FormatError,
                              "annotating {} group {}: {} genotype calls for {} samples", locus, mask.group, genotypes.size(),
                              mask.selected.size());
        AfStats st{};
        try {
            for (size_t i = 0, len = genotypes.size(); i < len; ++i) {
                if (mask.selected[i]) {
                    AfCalculator::accumulate(genotypes[i], st);
                }
            }
        }
        catch (const FormatError& e) {
            throw FormatError(fmt::format("annotating {} group {}: {}", locus, mask.group, e.what()));
        }
        AfCalculator::finalize(st);
        if (compute_hwe_) {
            HweApproximator::annotate(st);
        }
        result.push_back(st);
    }
    return result;
}

AnnotatedValues RecordAnnotator::annotate(const GenotypeVector& genotypes, int32_t n_alt, const std::string& locus) const
{
    std::vector<AfStats> stats = aggregate(genotypes, locus);
    size_t n_values_per_alt = static_cast<size_t>(std::max(n_alt, 1));

    AnnotatedValues values;
    values.reserve(descriptors_.size());
    for (const InfoDescriptor& d : descriptors_) {
        CHECK_CONDITION_THROW(d.group_index >= stats.size(), FormatError, "annotating {}: descriptor {} refers to unknown group", locus,
                              d.id);
        double v = info_tag_traits(d.tag).value(stats[d.group_index]);
        size_t n = d.number == InfoNumber::PER_ALT ? n_values_per_alt : 1;

        InfoValue iv;
        iv.descriptor = &d;
        if (d.type == InfoType::INTEGER) {
            iv.int_values.assign(n, 0);
            iv.int_values[0] = static_cast<int32_t>(v);
        }
        else {
            iv.float_values.assign(n, 0.0f);
            iv.float_values[0] = static_cast<float>(v);
        }
        values.push_back(std::move(iv));
    }
    return values;
}

}  // namespace grpaf
