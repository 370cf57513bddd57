#ifndef GRPAF_AF_CALCULATOR_H_
#define GRPAF_AF_CALCULATOR_H_
#include "af_stats.h"
#include "genotype_normalizer.h"

namespace grpaf
{

/*!
 * @brief fold one group's masked calls at one variant into AfStats
 * REF/ALT model: every allele index must be 0 or 1, any other index raises FormatError
 */
class AfCalculator
{
    /* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
public:
    static AfStats calculate(const GenotypeVector& genotypes);

    /*! @brief classify a single call into an existing fold */
    static void accumulate(const NormalizedGenotype& g, AfStats& st);

    /*! @brief af, mac and maf from the allele counts, left at zero when an == 0 */
    static void finalize(AfStats& st);

    /* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */
private:
    static void count_allele(int32_t allele, AfStats& st);
};

}  // namespace grpaf

#endif  // GRPAF_AF_CALCULATOR_H_
