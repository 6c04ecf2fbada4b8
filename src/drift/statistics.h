#pragma once

/// @file statistics.h
/// @brief Two-sample statistics and the distribution tails they need
///
/// Everything here is a pure function of its inputs. Frequency-style
/// functions work on proportions so that reference and current samples of
/// different sizes compare on equal footing.

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace drifter::drift::stats {

/// @brief Raw output of a two-sample test
struct TestStatistic {
    double statistic = 0.0;
    std::optional<double> p_value;  ///< Set for hypothesis tests only
};

// -----------------------------------------------------------------------------
// Distribution tails
// -----------------------------------------------------------------------------

/// @brief Kolmogorov distribution survival function Q_KS(lambda)
double KolmogorovSurvival(double lambda);

/// @brief Regularized lower incomplete gamma P(a, x)
double RegularizedGammaP(double a, double x);

/// @brief Upper tail of the chi-squared distribution, P(X >= x)
double ChiSquaredSurvival(double x, double degrees_of_freedom);

/// @brief Regularized incomplete beta I_x(a, b)
double RegularizedIncompleteBeta(double a, double b, double x);

/// @brief Two-sided p-value of Student's t distribution
double StudentTTwoSidedPValue(double t, double degrees_of_freedom);

/// @brief Two-sided p-value of the standard normal distribution
double NormalTwoSidedPValue(double z);

// -----------------------------------------------------------------------------
// Descriptive helpers
// -----------------------------------------------------------------------------

double Mean(const std::vector<double>& values);

/// @brief Population standard deviation (ddof = 0)
double StdDev(const std::vector<double>& values);

/// @brief Sample variance (ddof = 1); 0 for fewer than two values
double SampleVariance(const std::vector<double>& values);

/// @brief Linear-interpolated quantile of an unsorted sample, q in [0, 1]
double Quantile(std::vector<double> values, double q);

/// @brief Keep values <= Quantile(values, q); q >= 1 keeps everything
std::vector<double> TrimUpperQuantile(const std::vector<double>& values, double q);

// -----------------------------------------------------------------------------
// Binning
// -----------------------------------------------------------------------------

/// @brief Inner edges at the reference quantiles 1/n ... (n-1)/n
///
/// Duplicate edges (heavily tied samples) are collapsed, so fewer than
/// num_bins bins may result. Outer bins are open-ended.
std::vector<double> QuantileBinEdges(const std::vector<double>& reference, size_t num_bins);

/// @brief Proportion of values per bin for the given inner edges
///
/// Bin i holds values in (edge[i-1], edge[i]]; values below the first edge
/// fall in bin 0 and values above the last edge in the final bin.
std::vector<double> BinProportions(const std::vector<double>& values,
                                   const std::vector<double>& inner_edges);

/// @brief Category counts for both samples over the union of categories
///
/// A category seen in only one sample keeps a zero count on the other side.
struct MatchedCounts {
    std::vector<std::string> categories;  ///< Sorted union of categories
    std::vector<double> reference;
    std::vector<double> current;
};

MatchedCounts MatchCategories(const std::map<std::string, size_t>& reference,
                              const std::map<std::string, size_t>& current);

/// @brief Normalize counts to proportions; all-zero input stays zero
std::vector<double> ToProportions(const std::vector<double>& counts);

// -----------------------------------------------------------------------------
// Two-sample tests
// -----------------------------------------------------------------------------

/// @brief Two-sample Kolmogorov-Smirnov test with the asymptotic p-value
TestStatistic KolmogorovSmirnov(std::vector<double> reference, std::vector<double> current);

/// @brief Mann-Whitney U test, normal approximation with tie and continuity
///        correction. statistic is U of the reference sample.
TestStatistic MannWhitneyU(const std::vector<double>& reference,
                           const std::vector<double>& current);

/// @brief Welch's unequal-variance t-test on the sample means
TestStatistic WelchTTest(const std::vector<double>& reference,
                         const std::vector<double>& current);

/// @brief Pearson chi-squared on the 2 x k table of matched counts
///
/// statistic is Cramér's V = sqrt(chi2 / N), which depends on the two
/// samples' proportions only. p_value comes from chi2 with k - 1 degrees of
/// freedom.
TestStatistic ChiSquared(const std::vector<double>& reference_counts,
                         const std::vector<double>& current_counts);

/// @brief PSI = sum((cur - ref) * ln(cur / ref)) over matched bins
///
/// Zero proportions on either side are replaced by epsilon.
double PopulationStabilityIndex(const std::vector<double>& reference_proportions,
                                const std::vector<double>& current_proportions,
                                double epsilon);

/// @brief First Wasserstein distance between two empirical distributions
double WassersteinDistance(std::vector<double> reference, std::vector<double> current);

/// @brief KL(reference || current) over num_bins equal-width bins spanning
///        both samples; epsilon is added to every bin before normalizing
double KLDivergence(const std::vector<double>& reference,
                    const std::vector<double>& current,
                    size_t num_bins,
                    double epsilon);

}  // namespace drifter::drift::stats
