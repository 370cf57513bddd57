#include "af_calculator.h"

#include <algorithm>

#include "grpaf_exception.h"

namespace grpaf
{

static constexpr int32_t s_ref_index = 0;
static constexpr int32_t s_alt_index = 1;

AfStats AfCalculator::calculate(const GenotypeVector& genotypes)
{
    AfStats st{};
    for (const NormalizedGenotype& g : genotypes) {
        accumulate(g, st);
    }
    finalize(st);
    return st;
}

void AfCalculator::accumulate(const NormalizedGenotype& g, AfStats& st)
{
    switch (g.kind) {
        case GenotypeKind::MISSING: {
            st.n_miss++;
            break;
        }
        case GenotypeKind::HEMIZYGOUS: {
            count_allele(g.alleles[0], st);
            st.n_hemi++;
            break;
        }
        case GenotypeKind::DIPLOID: {
            int32_t a0 = g.alleles[0];
            int32_t a1 = g.alleles[1];
            bool called0 = a0 != k_missing_allele;
            bool called1 = a1 != k_missing_allele;
            if (called0) count_allele(a0, st);
            if (called1) count_allele(a1, st);

            if (!called0 && !called1) {
                st.n_miss++;
            }
            else if (!called0 || !called1) {
                // one slot unresolved, counted like a true hemizygous call
                st.n_hemi++;
            }
            else if (a0 == a1 && a0 == s_ref_index) {
                st.n_homref++;
            }
            else if (a0 == a1 && a0 == s_alt_index) {
                st.n_homalt++;
            }
            else {
                st.n_het++;
            }
            break;
        }
    }
}

void AfCalculator::finalize(AfStats& st)
{
    if (st.an == 0) {
        st.af = 0.0;
        st.mac = 0;
        st.maf = 0.0;
        return;
    }
    st.af = static_cast<double>(st.ac[s_alt_index]) / static_cast<double>(st.an);
    st.mac = std::min(st.ac[s_ref_index], st.ac[s_alt_index]);
    st.maf = static_cast<double>(st.mac) / static_cast<double>(st.an);
}

void AfCalculator::count_allele(int32_t allele, AfStats& st)
{
    CHECK_CONDITION_THROW(allele < s_ref_index || allele > s_alt_index, FormatError,
                          "allele index {} is outside the REF/ALT model, split multi-allelic records first", allele);
    st.an++;
    st.ac[static_cast<size_t>(allele)]++;
}

}  // namespace grpaf
