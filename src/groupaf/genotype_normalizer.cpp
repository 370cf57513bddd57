#include "genotype_normalizer.h"

#include <algorithm>
#include <cstddef>

#include "grpaf_exception.h"
#include "htslib/vcf.h"

namespace grpaf
{

static constexpr int32_t s_max_slots = 2;

NormalizedGenotype GenotypeNormalizer::normalize(const int32_t* gt, int32_t max_ploidy)
{
    std::array<int32_t, 2> alleles{k_missing_allele, k_missing_allele};
    int32_t present = 0;
    bool any_called = false;

    for (int32_t i = 0, len = std::min(max_ploidy, s_max_slots); i < len; ++i) {
        int32_t v = gt[i];
        if (v == bcf_int32_vector_end) {
            break;
        }
        // bcf_int32_missing marks a sample whose GT value is absent altogether
        if (v != bcf_int32_missing && !bcf_gt_is_missing(v)) {
            alleles[i] = bcf_gt_allele(v);
            any_called = true;
        }
        ++present;
    }

    if (!any_called) {
        return NormalizedGenotype::missing();
    }
    if (present == 1) {
        return NormalizedGenotype::hemizygous(alleles[0]);
    }
    return NormalizedGenotype::diploid(alleles[0], alleles[1]);
}

void GenotypeNormalizer::normalize_all(const int32_t* gt_arr, int32_t n_gt, int32_t n_samples, GenotypeVector& out)
{
    out.clear();
    out.reserve(static_cast<size_t>(n_samples));

    if (nullptr == gt_arr || n_gt <= 0 || n_samples <= 0) {
        out.assign(static_cast<size_t>(std::max(n_samples, 0)), NormalizedGenotype::missing());
        return;
    }

    CHECK_CONDITION_THROW(n_gt % n_samples != 0, FormatError, "GT holds {} values for {} samples", n_gt, n_samples);
    int32_t max_ploidy = n_gt / n_samples;
    for (int32_t i = 0; i < n_samples; ++i) {
        out.push_back(normalize(gt_arr + static_cast<ptrdiff_t>(i) * max_ploidy, max_ploidy));
    }
}

}  // namespace grpaf
