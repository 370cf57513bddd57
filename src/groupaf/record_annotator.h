#ifndef GRPAF_RECORD_ANNOTATOR_H_
#define GRPAF_RECORD_ANNOTATOR_H_
#include <string>
#include <vector>

#include "af_stats.h"
#include "genotype_normalizer.h"
#include "group_mask.h"
#include "info_header_builder.h"

namespace grpaf
{

/*!
 * @brief concrete value of one descriptor at one variant
 * exactly one of int_values / float_values is filled, according to descriptor->type
 */
typedef struct InfoValue
{
    const InfoDescriptor* descriptor{nullptr};
    std::vector<int32_t> int_values;
    std::vector<float> float_values;
} InfoValue, *pInfoValue;

typedef std::vector<InfoValue> AnnotatedValues;

/*!
 * @brief per variant: extract masked calls, aggregate, approximate HWE, emit
 * masks and descriptors are borrowed and must outlive the annotator; no state survives between variants
 */
class RecordAnnotator
{
    /* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
private:
    const GroupMasks& masks_;
    const InfoDescriptors& descriptors_;
    bool compute_hwe_;

    /* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
public:
    RecordAnnotator(const GroupMasks& masks, const InfoDescriptors& descriptors, bool compute_hwe);

    /*!
     * @brief one AfStats per group, index aligned with masks
     * @param genotypes in| one call per sample, aligned with the sample order the masks were built from
     * @param locus in| "<chrom>:<pos>", only used for error context
     * @throw FormatError naming the locus and group when a call cannot be represented
     */
    std::vector<AfStats> aggregate(const GenotypeVector& genotypes, const std::string& locus) const;

    /*!
     * @brief values for every descriptor, all or nothing
     * @param n_alt in| ALT alleles of the record, Number=A tags emit max(n_alt, 1) values
     */
    AnnotatedValues annotate(const GenotypeVector& genotypes, int32_t n_alt, const std::string& locus) const;

    const GroupMasks& masks() const { return masks_; }
    const InfoDescriptors& descriptors() const { return descriptors_; }
};

}  // namespace grpaf

#endif  // GRPAF_RECORD_ANNOTATOR_H_
