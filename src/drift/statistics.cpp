/// @file statistics.cpp
/// @brief Two-sample statistics implementation

#include "drift/statistics.h"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <numeric>
#include <utility>

namespace drifter::drift::stats {

namespace {

constexpr double kFloatMin = 1e-300;
constexpr double kEpsilon = 1e-14;
constexpr int kMaxIterations = 500;

/// @brief Series expansion of P(a, x), valid for x < a + 1
double GammaSeries(double a, double x) {
    double ap = a;
    double del = 1.0 / a;
    double sum = del;
    for (int n = 0; n < kMaxIterations; ++n) {
        ap += 1.0;
        del *= x / ap;
        sum += del;
        if (std::abs(del) < std::abs(sum) * kEpsilon) {
            break;
        }
    }
    return sum * std::exp(-x + a * std::log(x) - std::lgamma(a));
}

/// @brief Continued fraction for Q(a, x), valid for x >= a + 1 (modified Lentz)
double GammaContinuedFraction(double a, double x) {
    double b = x + 1.0 - a;
    double c = 1.0 / kFloatMin;
    double d = 1.0 / b;
    double h = d;
    for (int i = 1; i <= kMaxIterations; ++i) {
        double an = -i * (i - a);
        b += 2.0;
        d = an * d + b;
        if (std::abs(d) < kFloatMin) {
            d = kFloatMin;
        }
        c = b + an / c;
        if (std::abs(c) < kFloatMin) {
            c = kFloatMin;
        }
        d = 1.0 / d;
        double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < kEpsilon) {
            break;
        }
    }
    return std::exp(-x + a * std::log(x) - std::lgamma(a)) * h;
}

/// @brief Continued fraction for the incomplete beta function
double BetaContinuedFraction(double a, double b, double x) {
    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;
    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < kFloatMin) {
        d = kFloatMin;
    }
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= kMaxIterations; ++m) {
        const int m2 = 2 * m;
        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < kFloatMin) {
            d = kFloatMin;
        }
        c = 1.0 + aa / c;
        if (std::abs(c) < kFloatMin) {
            c = kFloatMin;
        }
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < kFloatMin) {
            d = kFloatMin;
        }
        c = 1.0 + aa / c;
        if (std::abs(c) < kFloatMin) {
            c = kFloatMin;
        }
        d = 1.0 / d;
        double del = d * c;
        h *= del;
        if (std::abs(del - 1.0) < kEpsilon) {
            break;
        }
    }
    return h;
}

double QuantileSorted(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    q = std::clamp(q, 0.0, 1.0);
    double pos = q * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(pos));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = pos - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

double Clamp01(double p) {
    return std::clamp(p, 0.0, 1.0);
}

}  // namespace

// =============================================================================
// Distribution tails
// =============================================================================

double KolmogorovSurvival(double lambda) {
    // Q_KS(lambda) = 2 * sum_{j>=1} (-1)^(j-1) exp(-2 j^2 lambda^2).
    // Below 0.2 the series converges slowly and the value is 1 to ~1e-11.
    if (lambda < 0.2) {
        return 1.0;
    }

    const double a2 = -2.0 * lambda * lambda;
    double fac = 2.0;
    double sum = 0.0;
    double previous_term = 0.0;
    for (int j = 1; j <= 100; ++j) {
        double term = fac * std::exp(a2 * j * j);
        sum += term;
        if (std::abs(term) <= 1e-10 * previous_term || std::abs(term) <= 1e-16 * sum) {
            return Clamp01(sum);
        }
        fac = -fac;
        previous_term = std::abs(term);
    }
    return 1.0;
}

double RegularizedGammaP(double a, double x) {
    if (x <= 0.0 || a <= 0.0) {
        return 0.0;
    }
    if (x < a + 1.0) {
        return Clamp01(GammaSeries(a, x));
    }
    return Clamp01(1.0 - GammaContinuedFraction(a, x));
}

double ChiSquaredSurvival(double x, double degrees_of_freedom) {
    if (degrees_of_freedom <= 0.0 || x <= 0.0) {
        return 1.0;
    }
    const double a = degrees_of_freedom / 2.0;
    const double half_x = x / 2.0;
    if (half_x < a + 1.0) {
        return Clamp01(1.0 - GammaSeries(a, half_x));
    }
    return Clamp01(GammaContinuedFraction(a, half_x));
}

double RegularizedIncompleteBeta(double a, double b, double x) {
    if (x <= 0.0) {
        return 0.0;
    }
    if (x >= 1.0) {
        return 1.0;
    }
    const double front = std::exp(std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b) +
                                  a * std::log(x) + b * std::log1p(-x));
    if (x < (a + 1.0) / (a + b + 2.0)) {
        return Clamp01(front * BetaContinuedFraction(a, b, x) / a);
    }
    return Clamp01(1.0 - front * BetaContinuedFraction(b, a, 1.0 - x) / b);
}

double StudentTTwoSidedPValue(double t, double degrees_of_freedom) {
    if (!std::isfinite(t)) {
        return 0.0;
    }
    if (degrees_of_freedom <= 0.0) {
        return 1.0;
    }
    const double x = degrees_of_freedom / (degrees_of_freedom + t * t);
    return RegularizedIncompleteBeta(degrees_of_freedom / 2.0, 0.5, x);
}

double NormalTwoSidedPValue(double z) {
    return Clamp01(std::erfc(std::abs(z) / std::sqrt(2.0)));
}

// =============================================================================
// Descriptive helpers
// =============================================================================

double Mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    return std::accumulate(values.begin(), values.end(), 0.0) /
           static_cast<double>(values.size());
}

double StdDev(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    const double mean = Mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return std::sqrt(sum_sq / static_cast<double>(values.size()));
}

double SampleVariance(const std::vector<double>& values) {
    if (values.size() < 2) {
        return 0.0;
    }
    const double mean = Mean(values);
    double sum_sq = 0.0;
    for (double v : values) {
        sum_sq += (v - mean) * (v - mean);
    }
    return sum_sq / static_cast<double>(values.size() - 1);
}

double Quantile(std::vector<double> values, double q) {
    std::sort(values.begin(), values.end());
    return QuantileSorted(values, q);
}

std::vector<double> TrimUpperQuantile(const std::vector<double>& values, double q) {
    if (q >= 1.0 || values.empty()) {
        return values;
    }
    const double cutoff = Quantile(values, q);
    std::vector<double> kept;
    kept.reserve(values.size());
    std::copy_if(values.begin(), values.end(), std::back_inserter(kept),
                 [cutoff](double v) { return v <= cutoff; });
    return kept;
}

// =============================================================================
// Binning
// =============================================================================

std::vector<double> QuantileBinEdges(const std::vector<double>& reference, size_t num_bins) {
    std::vector<double> edges;
    if (reference.empty() || num_bins < 2) {
        return edges;
    }

    std::vector<double> sorted = reference;
    std::sort(sorted.begin(), sorted.end());

    edges.reserve(num_bins - 1);
    for (size_t i = 1; i < num_bins; ++i) {
        edges.push_back(QuantileSorted(sorted, static_cast<double>(i) / num_bins));
    }
    edges.erase(std::unique(edges.begin(), edges.end()), edges.end());
    return edges;
}

std::vector<double> BinProportions(const std::vector<double>& values,
                                   const std::vector<double>& inner_edges) {
    std::vector<double> proportions(inner_edges.size() + 1, 0.0);
    if (values.empty()) {
        return proportions;
    }

    for (double v : values) {
        auto it = std::lower_bound(inner_edges.begin(), inner_edges.end(), v);
        proportions[static_cast<size_t>(std::distance(inner_edges.begin(), it))] += 1.0;
    }

    const double n = static_cast<double>(values.size());
    for (auto& p : proportions) {
        p /= n;
    }
    return proportions;
}

MatchedCounts MatchCategories(const std::map<std::string, size_t>& reference,
                              const std::map<std::string, size_t>& current) {
    MatchedCounts matched;

    auto ref_it = reference.begin();
    auto cur_it = current.begin();
    while (ref_it != reference.end() || cur_it != current.end()) {
        if (cur_it == current.end() ||
            (ref_it != reference.end() && ref_it->first < cur_it->first)) {
            matched.categories.push_back(ref_it->first);
            matched.reference.push_back(static_cast<double>(ref_it->second));
            matched.current.push_back(0.0);
            ++ref_it;
        } else if (ref_it == reference.end() || cur_it->first < ref_it->first) {
            matched.categories.push_back(cur_it->first);
            matched.reference.push_back(0.0);
            matched.current.push_back(static_cast<double>(cur_it->second));
            ++cur_it;
        } else {
            matched.categories.push_back(ref_it->first);
            matched.reference.push_back(static_cast<double>(ref_it->second));
            matched.current.push_back(static_cast<double>(cur_it->second));
            ++ref_it;
            ++cur_it;
        }
    }
    return matched;
}

std::vector<double> ToProportions(const std::vector<double>& counts) {
    const double total = std::accumulate(counts.begin(), counts.end(), 0.0);
    std::vector<double> proportions(counts.size(), 0.0);
    if (total <= 0.0) {
        return proportions;
    }
    for (size_t i = 0; i < counts.size(); ++i) {
        proportions[i] = counts[i] / total;
    }
    return proportions;
}

// =============================================================================
// Two-sample tests
// =============================================================================

TestStatistic KolmogorovSmirnov(std::vector<double> reference, std::vector<double> current) {
    TestStatistic result;
    if (reference.empty() || current.empty()) {
        result.p_value = 1.0;
        return result;
    }

    std::sort(reference.begin(), reference.end());
    std::sort(current.begin(), current.end());

    const double n1 = static_cast<double>(reference.size());
    const double n2 = static_cast<double>(current.size());

    // Step both empirical CDFs past each distinct value so ties move together
    size_t i = 0;
    size_t j = 0;
    double d = 0.0;
    while (i < reference.size() && j < current.size()) {
        const double x = std::min(reference[i], current[j]);
        while (i < reference.size() && reference[i] <= x) {
            ++i;
        }
        while (j < current.size() && current[j] <= x) {
            ++j;
        }
        d = std::max(d, std::abs(static_cast<double>(i) / n1 - static_cast<double>(j) / n2));
    }

    const double en = std::sqrt(n1 * n2 / (n1 + n2));
    result.statistic = d;
    result.p_value = KolmogorovSurvival((en + 0.12 + 0.11 / en) * d);
    return result;
}

TestStatistic MannWhitneyU(const std::vector<double>& reference,
                           const std::vector<double>& current) {
    TestStatistic result;
    const size_t n1 = reference.size();
    const size_t n2 = current.size();
    if (n1 == 0 || n2 == 0) {
        result.p_value = 1.0;
        return result;
    }

    // (value, from_reference)
    std::vector<std::pair<double, bool>> pooled;
    pooled.reserve(n1 + n2);
    for (double v : reference) {
        pooled.emplace_back(v, true);
    }
    for (double v : current) {
        pooled.emplace_back(v, false);
    }
    std::sort(pooled.begin(), pooled.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });

    double rank_sum_reference = 0.0;
    double tie_term = 0.0;
    size_t k = 0;
    while (k < pooled.size()) {
        size_t end = k;
        while (end + 1 < pooled.size() && pooled[end + 1].first == pooled[k].first) {
            ++end;
        }
        const double ties = static_cast<double>(end - k + 1);
        const double average_rank = (static_cast<double>(k + 1) + static_cast<double>(end + 1)) / 2.0;
        for (size_t m = k; m <= end; ++m) {
            if (pooled[m].second) {
                rank_sum_reference += average_rank;
            }
        }
        tie_term += ties * ties * ties - ties;
        k = end + 1;
    }

    const double dn1 = static_cast<double>(n1);
    const double dn2 = static_cast<double>(n2);
    const double n = dn1 + dn2;
    const double u1 = rank_sum_reference - dn1 * (dn1 + 1.0) / 2.0;
    const double mu = dn1 * dn2 / 2.0;
    const double sigma = std::sqrt(dn1 * dn2 / 12.0 * ((n + 1.0) - tie_term / (n * (n - 1.0))));

    result.statistic = u1;
    if (sigma <= 0.0) {
        result.p_value = 1.0;
        return result;
    }
    const double z = std::max(0.0, std::abs(u1 - mu) - 0.5) / sigma;
    result.p_value = NormalTwoSidedPValue(z);
    return result;
}

TestStatistic WelchTTest(const std::vector<double>& reference,
                         const std::vector<double>& current) {
    TestStatistic result;
    if (reference.size() < 2 || current.size() < 2) {
        result.p_value = 1.0;
        return result;
    }

    const double n1 = static_cast<double>(reference.size());
    const double n2 = static_cast<double>(current.size());
    const double m1 = Mean(reference);
    const double m2 = Mean(current);
    const double se1 = SampleVariance(reference) / n1;
    const double se2 = SampleVariance(current) / n2;
    const double se_sq = se1 + se2;

    if (se_sq <= 0.0) {
        result.statistic = 0.0;
        result.p_value = m1 == m2 ? 1.0 : 0.0;
        return result;
    }

    const double t = (m1 - m2) / std::sqrt(se_sq);
    const double df = se_sq * se_sq / (se1 * se1 / (n1 - 1.0) + se2 * se2 / (n2 - 1.0));

    result.statistic = t;
    result.p_value = StudentTTwoSidedPValue(t, df);
    return result;
}

TestStatistic ChiSquared(const std::vector<double>& reference_counts,
                         const std::vector<double>& current_counts) {
    TestStatistic result;
    result.p_value = 1.0;

    const size_t k = std::min(reference_counts.size(), current_counts.size());
    const double n1 = std::accumulate(reference_counts.begin(), reference_counts.begin() + k, 0.0);
    const double n2 = std::accumulate(current_counts.begin(), current_counts.begin() + k, 0.0);
    const double n = n1 + n2;
    if (n1 <= 0.0 || n2 <= 0.0) {
        return result;
    }

    double chi2 = 0.0;
    size_t populated = 0;
    for (size_t j = 0; j < k; ++j) {
        const double total = reference_counts[j] + current_counts[j];
        if (total <= 0.0) {
            continue;
        }
        ++populated;
        const double expected_ref = n1 * total / n;
        const double expected_cur = n2 * total / n;
        chi2 += (reference_counts[j] - expected_ref) * (reference_counts[j] - expected_ref) / expected_ref;
        chi2 += (current_counts[j] - expected_cur) * (current_counts[j] - expected_cur) / expected_cur;
    }

    if (populated < 2) {
        return result;
    }

    result.statistic = std::sqrt(chi2 / n);
    result.p_value = ChiSquaredSurvival(chi2, static_cast<double>(populated - 1));
    return result;
}

double PopulationStabilityIndex(const std::vector<double>& reference_proportions,
                                const std::vector<double>& current_proportions,
                                double epsilon) {
    const size_t k = std::min(reference_proportions.size(), current_proportions.size());
    double psi = 0.0;
    for (size_t i = 0; i < k; ++i) {
        const double expected = std::max(reference_proportions[i], epsilon);
        const double actual = std::max(current_proportions[i], epsilon);
        psi += (actual - expected) * std::log(actual / expected);
    }
    return psi;
}

double WassersteinDistance(std::vector<double> reference, std::vector<double> current) {
    if (reference.empty() || current.empty()) {
        return 0.0;
    }

    std::sort(reference.begin(), reference.end());
    std::sort(current.begin(), current.end());

    std::vector<double> pooled;
    pooled.reserve(reference.size() + current.size());
    std::merge(reference.begin(), reference.end(), current.begin(), current.end(),
               std::back_inserter(pooled));

    const double n1 = static_cast<double>(reference.size());
    const double n2 = static_cast<double>(current.size());

    // Integrate |F_ref - F_cur| between consecutive pooled points
    double distance = 0.0;
    for (size_t k = 0; k + 1 < pooled.size(); ++k) {
        const double width = pooled[k + 1] - pooled[k];
        if (width <= 0.0) {
            continue;
        }
        const double cdf_ref = static_cast<double>(
            std::upper_bound(reference.begin(), reference.end(), pooled[k]) - reference.begin()) / n1;
        const double cdf_cur = static_cast<double>(
            std::upper_bound(current.begin(), current.end(), pooled[k]) - current.begin()) / n2;
        distance += std::abs(cdf_ref - cdf_cur) * width;
    }
    return distance;
}

double KLDivergence(const std::vector<double>& reference,
                    const std::vector<double>& current,
                    size_t num_bins,
                    double epsilon) {
    if (reference.empty() || current.empty() || num_bins == 0) {
        return 0.0;
    }

    const auto [ref_min, ref_max] = std::minmax_element(reference.begin(), reference.end());
    const auto [cur_min, cur_max] = std::minmax_element(current.begin(), current.end());
    const double lo = std::min(*ref_min, *cur_min);
    const double hi = std::max(*ref_max, *cur_max);
    if (hi <= lo) {
        return 0.0;
    }

    const double width = (hi - lo) / static_cast<double>(num_bins);
    auto histogram = [&](const std::vector<double>& values) {
        std::vector<double> counts(num_bins, 0.0);
        for (double v : values) {
            size_t bin = static_cast<size_t>((v - lo) / width);
            counts[std::min(bin, num_bins - 1)] += 1.0;
        }
        std::vector<double> p = ToProportions(counts);
        for (auto& x : p) {
            x += epsilon;
        }
        return ToProportions(p);
    };

    const std::vector<double> p = histogram(reference);
    const std::vector<double> q = histogram(current);

    double kl = 0.0;
    for (size_t i = 0; i < num_bins; ++i) {
        kl += p[i] * std::log(p[i] / q[i]);
    }
    return std::max(kl, 0.0);
}

}  // namespace drifter::drift::stats
