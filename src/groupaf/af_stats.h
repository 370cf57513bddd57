#ifndef GRPAF_AF_STATS_H_
#define GRPAF_AF_STATS_H_
#include <array>
#include <cstdint>

namespace grpaf
{

/*!
 * @brief per (variant, group) aggregate, built from a zero state for every variant and discarded after emission
 * @param ac: REF/ALT allele counts
 * @param an: allele number, total called alleles
 * @param n_hemi: calls with exactly one allele observation, partially missing diploid calls included
 * @param n_homref n_het n_homalt: fully called diploid calls by category
 * @param n_miss: calls without any allele observation
 * @param af mac maf: derived after the fold, all zero when an == 0
 * @param exc_het hwe: filled by HweApproximator when requested
 */
typedef struct AfStats
{
    std::array<uint32_t, 2> ac{0, 0};
    uint32_t an{0};
    uint32_t n_hemi{0};
    uint32_t n_homref{0};
    uint32_t n_het{0};
    uint32_t n_homalt{0};
    uint32_t n_miss{0};
    double af{0.0};
    double maf{0.0};
    uint32_t mac{0};
    int32_t exc_het{0};
    double hwe{0.0};

    /*! @return number of calls classified, equals the group size after a full fold */
    uint32_t classified() const { return n_hemi + n_homref + n_het + n_homalt + n_miss; }
} AfStats, *pAfStats;

}  // namespace grpaf

#endif  // GRPAF_AF_STATS_H_
