#ifndef GRPAF_HWE_APPROXIMATOR_H_
#define GRPAF_HWE_APPROXIMATOR_H_
#include <cstdint>
#include <utility>

#include "af_stats.h"

namespace grpaf
{

/*!
 * @brief approximate Hardy-Weinberg deviation from REF/ALT counts and the observed heterozygote count
 * p = exp(-0.5 * chi_sq) is an approximation, not the exact excess-heterozygosity test
 */
class HweApproximator
{
    /* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
public:
    /*!
     * @param ref_count in| ac[0]
     * @param alt_count in| ac[1]
     * @param het_count in| n_het
     * @return {exc_het, hwe}; exc_het is 0 when flagged (p < 1e-6), 1 otherwise; {0, 0} when no genotype can be derived
     */
    static std::pair<int32_t, double> calculate(uint32_t ref_count, uint32_t alt_count, uint32_t het_count);

    /*! @brief fill exc_het and hwe of a folded aggregate */
    static void annotate(AfStats& st);
};

}  // namespace grpaf

#endif  // GRPAF_HWE_APPROXIMATOR_H_
