#ifndef GRPAF_GENOTYPE_NORMALIZER_H_
#define GRPAF_GENOTYPE_NORMALIZER_H_
#include <array>
#include <cstdint>
#include <vector>

namespace grpaf
{

static constexpr int32_t k_missing_allele = -1;

enum class GenotypeKind : uint8_t { MISSING = 0, HEMIZYGOUS, DIPLOID };

/*!
 * @brief one sample's call reduced to at most two allele slots
 * MISSING carries no allele, HEMIZYGOUS uses alleles[0], DIPLOID keeps each slot independently (k_missing_allele when unresolved)
 */
struct NormalizedGenotype
{
    GenotypeKind kind{GenotypeKind::MISSING};
    std::array<int32_t, 2> alleles{k_missing_allele, k_missing_allele};

    static NormalizedGenotype missing() { return {}; }
    static NormalizedGenotype hemizygous(int32_t allele) { return {GenotypeKind::HEMIZYGOUS, {allele, k_missing_allele}}; }
    static NormalizedGenotype diploid(int32_t first, int32_t second) { return {GenotypeKind::DIPLOID, {first, second}}; }

    bool is_missing() const { return kind == GenotypeKind::MISSING; }

    bool operator==(const NormalizedGenotype& other) const { return kind == other.kind && alleles == other.alleles; }
    bool operator!=(const NormalizedGenotype& other) const { return !(*this == other); }
};

typedef std::vector<NormalizedGenotype> GenotypeVector;

class GenotypeNormalizer
{
public:
    /*!
     * @brief normalize one sample's GT slots in htslib encoding
     * @param gt in| first slot of the sample, as returned by bcf_get_genotypes
     * @param max_ploidy in| slots reserved per sample in the record; only the first two are read
     * @return MISSING when no slot carries an allele; one present slot gives HEMIZYGOUS; two give DIPLOID
     */
    static NormalizedGenotype normalize(const int32_t* gt, int32_t max_ploidy);

    /*!
     * @brief normalize every sample of a record
     * @param gt_arr in| bcf_get_genotypes output, nullptr when the record has no GT field
     * @param n_gt in| number of values in gt_arr
     * @param n_samples in| samples declared by the header
     * @param out out| one entry per sample, positionally aligned with the header sample order
     */
    static void normalize_all(const int32_t* gt_arr, int32_t n_gt, int32_t n_samples, GenotypeVector& out);
};

}  // namespace grpaf

#endif  // GRPAF_GENOTYPE_NORMALIZER_H_
