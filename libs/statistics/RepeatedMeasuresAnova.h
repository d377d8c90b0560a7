#pragma once

#include <array>
#include <cstddef>
#include <vector>

namespace psepower
{
  namespace statistics
  {
    /**
     * @brief One source-of-variation row of an ANOVA table.
     *
     * Every effect of a two-level design has one numerator degree of
     * freedom; the error term is the subject-by-effect interaction (within
     * factors) or subjects-within-groups (between factors).
     */
    struct AnovaRow
    {
      double ssEffect;
      double ssError;
      double dfEffect;
      double dfError;
      double fStatistic;
      double pValue;
      double partialEtaSquared;
    };

    /**
     * @brief ANOVA of a 2 x 2 design with repeated measures on subjects.
     *
     * `intercept` is the subject-stratum test of the grand mean. Factor A is
     * always within subjects; factor B is within subjects for
     * withinSubjectsAnova() and between subjects for mixedAnova().
     */
    struct TwoByTwoAnovaResult
    {
      AnovaRow intercept;
      AnovaRow factorA;
      AnovaRow factorB;
      AnovaRow interaction;
      std::size_t subjects;
    };

    /// pes = SS_effect / (SS_effect + SS_error)
    double partialEtaSquared(double ssEffect, double ssError);

    /// Cohen's f = sqrt(pes / (1 - pes)); infinite for pes == 1.
    double cohensFFromPartialEtaSquared(double pes);

    /// P(F > f) for F ~ F(df1, df2).
    double fDistributionUpperTail(double f, double df1, double df2);

    /**
     * @brief Fully within-subjects 2 x 2 ANOVA (no sphericity correction is
     * needed: every effect has one degree of freedom).
     *
     * @param cells One entry per subject; cells[a * 2 + b] is the subject's
     *        observation at level a of factor A and level b of factor B.
     * @throws InsufficientDesignException with fewer than two subjects or when
     *         an effect has zero residual variance.
     */
    TwoByTwoAnovaResult withinSubjectsAnova(const std::vector<std::array<double, 4>>& cells);

    /**
     * @brief Mixed 2 (B, between) x 2 (A, within) ANOVA with type III sums
     * of squares for unequal group sizes.
     *
     * @param cells  cells[i][a] is subject i's observation at level a of A.
     * @param groups groups[i] in {0, 1} is subject i's level of B.
     * @throws std::invalid_argument if the two vectors differ in length or a
     *         group index is not 0 or 1.
     * @throws InsufficientDesignException if a group is empty, there are
     *         fewer than three subjects, or an error term is zero.
     */
    TwoByTwoAnovaResult mixedAnova(const std::vector<std::array<double, 2>>& cells,
				   const std::vector<int>& groups);
  } // namespace statistics
} // namespace psepower
