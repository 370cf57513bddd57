#include "hwe_approximator.h"

#include <algorithm>
#include <cmath>

namespace grpaf
{

static constexpr double s_flag_threshold = 1e-6;

std::pair<int32_t, double> HweApproximator::calculate(uint32_t ref_count, uint32_t alt_count, uint32_t het_count)
{
    double ac0 = ref_count;
    double ac1 = alt_count;
    double het = het_count;

    double n_homref = (ac0 - het) / 2.0;
    double n_homalt = (ac1 - het) / 2.0;
    double n = n_homref + het + n_homalt;
    if (n == 0.0) {
        return {0, 0.0};
    }

    double exp_het = 2.0 * ac0 * ac1 / (2.0 * n);
    double diff = het - exp_het;
    double chi_sq = diff * diff / std::max(exp_het, 1.0);
    double p = std::exp(-0.5 * chi_sq);
    int32_t exc_het = p < s_flag_threshold ? 0 : 1;
    return {exc_het, p};
}

void HweApproximator::annotate(AfStats& st)
{
    std::pair<int32_t, double> res = calculate(st.ac[0], st.ac[1], st.n_het);
    st.exc_het = res.first;
    st.hwe = res.second;
}

}  // namespace grpaf
