/*
  Fragment 4.2.05 — Probability Utilities Selftest

  Covers Rng64 determinism, the floor/ceiling sampling rule, type-7
  quantiles, inclusive exceedance, moments and Pearson correlation.
  Framework-free; non-zero return code indicates failure.
*/

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "engine/prob/cdf.hpp"
#include "engine/prob/correlation.hpp"
#include "engine/prob/rng.hpp"
#include "engine/prob/uncertainty.hpp"

namespace aeroforge::prob {
namespace {

int g_fail_count = 0;

void expect_true(bool v, std::string_view msg) {
  if (!v) {
    ++g_fail_count;
    std::cerr << "[FAIL] " << msg << "\n";
  } else {
    std::cerr << "[ OK ] " << msg << "\n";
  }
}

bool near(double a, double b, double tol) { return std::fabs(a - b) <= tol; }

void test_rng() {
  Rng64 a(42);
  Rng64 b(42);
  Rng64 c(43);
  bool same = true;
  bool differs = false;
  for (int i = 0; i < 1000; ++i) {
    const auto x = a.next_u64();
    same = same && (x == b.next_u64());
    differs = differs || (x != c.next_u64());
  }
  expect_true(same, "same seed -> same stream");
  expect_true(differs, "different seed -> different stream");

  Rng64 fork = a;
  expect_true(fork.next_u64() == a.next_u64(), "copied stream continues identically");

  Rng64 z(0);
  expect_true(z.next_u64() != 0, "seed 0 remapped to a non-degenerate state");
  expect_true(z.seed() == 0, "seed() reports the requested seed");

  Rng64 u(7);
  bool in_open = true;
  for (int i = 0; i < 10000; ++i) {
    const double x = u.next_u01();
    in_open = in_open && x > 0.0 && x < 1.0;
  }
  expect_true(in_open, "next_u01 in (0,1)");

  Rng64 n(1234);
  const std::size_t N = 200000;
  double s = 0.0;
  double s2 = 0.0;
  for (std::size_t i = 0; i < N; ++i) {
    const double x = n.std_normal();
    s += x;
    s2 += x * x;
  }
  const double mean = s / static_cast<double>(N);
  const double var = s2 / static_cast<double>(N) - mean * mean;
  expect_true(near(mean, 0.0, 0.01), "std_normal mean ~ 0");
  expect_true(near(var, 1.0, 0.02), "std_normal variance ~ 1");
}

void test_dist_apply() {
  const DistSpec rel = relative_normal(0.25, 200.0);
  expect_true(rel.apply(450.0, 0.0) == 450.0, "Z=0 -> nominal");
  expect_true(rel.apply(450.0, 1.0) == 450.0 * 1.25, "relative: v*(1+s*Z)");
  expect_true(rel.apply(450.0, -3.0) == 200.0, "floor applied to field value");

  const DistSpec eta = relative_normal(0.10, 0.7, 0.98);
  expect_true(eta.apply(0.92, 2.0) == 0.98, "ceiling applied");
  expect_true(eta.apply(0.92, -5.0) == 0.7, "floor applied with ceiling present");

  const DistSpec ab = absolute_normal(2.0);
  expect_true(ab.apply(22.0, 1.5) == 25.0, "absolute: v + s*Z");
  expect_true(!ab.has_floor() && !ab.has_ceiling(), "absolute spec unbounded by default");

  Rng64 rng(42);
  const auto xs = sample_field(0.92, eta, 5000, rng);
  bool bounded = xs.size() == 5000;
  for (double x : xs) bounded = bounded && x >= 0.7 && x <= 0.98;
  expect_true(bounded, "sample_field honors floor and ceiling");

  Rng64 r1(9);
  Rng64 r2(9);
  expect_true(sample_field(15.0, rel, 100, r1) == sample_field(15.0, rel, 100, r2), "sample_field deterministic");
}

void test_dist_validate() {
  auto rejects = [](const DistSpec& d) {
    try {
      d.validate("harvest_power");
    } catch (const AeroforgeError& e) {
      return e.code() == ErrorCode::InvalidConfig &&
             std::string(e.what()).find("harvest_power") != std::string::npos;
    }
    return false;
  };
  expect_true(rejects(relative_normal(0.0)), "sigma = 0 rejected");
  expect_true(rejects(relative_normal(-0.1)), "sigma < 0 rejected");
  expect_true(rejects(relative_normal(std::nan(""))), "sigma NaN rejected");
  expect_true(rejects(relative_normal(0.1, 2.0, 1.0)), "floor > ceiling rejected");
  expect_true(!rejects(relative_normal(0.1, 0.0)), "floor only accepted");
}

void test_quantiles() {
  const EmpiricalCdf cdf(std::vector<double>{4.0, 1.0, 3.0, 2.0});
  expect_true(cdf.size() == 4, "size");
  expect_true(cdf.median() == 2.5, "median of 1..4 = 2.5");
  expect_true(near(cdf.quantile(0.05), 1.15, 1e-12), "p5 linear interpolation (type 7)");
  expect_true(near(cdf.quantile(0.95), 3.85, 1e-12), "p95 linear interpolation (type 7)");
  expect_true(cdf.quantile(0.0) == 1.0 && cdf.quantile(1.0) == 4.0, "quantile endpoints");

  const EmpiricalCdf one(std::vector<double>{7.0});
  expect_true(one.quantile(0.05) == 7.0 && one.median() == 7.0, "single sample quantiles");

  const EmpiricalCdf empty;
  expect_true(empty.quantile(0.5) == 0.0 && empty.exceed(1.0) == 0.0, "empty cdf -> 0");

  const EmpiricalCdf with_nan(std::vector<double>{1.0, std::nan(""), 3.0});
  expect_true(with_nan.size() == 2, "non-finite samples filtered");
}

void test_exceedance() {
  const EmpiricalCdf cdf(std::vector<double>{1.0, 2.0, 3.0, 4.0});
  expect_true(cdf.exceed(3.0) == 0.5, "P(X >= 3) inclusive");
  expect_true(cdf.exceed(3.5) == 0.25, "P(X >= 3.5)");
  expect_true(cdf.exceed(0.0) == 1.0 && cdf.exceed(5.0) == 0.0, "exceed extremes");
  expect_true(cdf.exceed_pct(2.0) == 75.0, "exceed_pct in percent");
  expect_true(cdf.cdf(2.0) == 0.5, "F(2) = 0.5");
}

void test_moments() {
  const EmpiricalCdf cdf(std::vector<double>{1.0, 2.0, 3.0, 4.0});
  const auto m = cdf.moments();
  expect_true(m.n == 4 && m.min == 1.0 && m.max == 4.0, "n/min/max");
  expect_true(near(m.mean, 2.5, 1e-12), "mean");
  expect_true(near(m.variance, 1.25, 1e-12), "population variance");
  expect_true(near(m.variance_sample, 5.0 / 3.0, 1e-12), "sample variance");
  expect_true(near(m.stddev(), std::sqrt(1.25), 1e-12), "population stddev");
  expect_true(near(m.stddev_sample(), std::sqrt(5.0 / 3.0), 1e-12), "sample stddev");
  expect_true(near(m.stddev_sample(), std::sqrt(5.0 / 3.0), 1e-12), "sample stddev");

  const auto m1 = EmpiricalCdf(std::vector<double>{3.0}).moments();
  expect_true(m1.variance_sample == 0.0, "n=1 sample variance = 0");
}

void test_pearson() {
  const std::vector<double> x{1.0, 2.0, 3.0, 4.0, 5.0};
  const std::vector<double> y{2.0, 4.0, 6.0, 8.0, 10.0};
  const std::vector<double> yneg{5.0, 4.0, 3.0, 2.0, 1.0};
  const std::vector<double> flat{1.0, 1.0, 1.0, 1.0, 1.0};
  expect_true(near(pearson(x, y), 1.0, 1e-12), "perfect positive correlation");
  expect_true(near(pearson(x, yneg), -1.0, 1e-12), "perfect negative correlation");
  expect_true(pearson(x, flat) == 0.0, "zero variance -> 0");

  bool threw = false;
  try {
    (void)pearson(x, std::vector<double>{1.0});
  } catch (const AeroforgeError& e) {
    threw = e.code() == ErrorCode::InvalidInput;
  }
  expect_true(threw, "length mismatch rejected");

  std::vector<Correlation> cs{{"a", 0.1}, {"b", -0.9}, {"c", 0.5}};
  rank_by_magnitude(cs);
  expect_true(cs[0].name == "b" && cs[1].name == "c" && cs[2].name == "a", "ranked by |r|");
}

}  // namespace
}  // namespace aeroforge::prob

int main() {
  using namespace aeroforge::prob;

  test_rng();
  test_dist_apply();
  test_dist_validate();
  test_quantiles();
  test_exceedance();
  test_moments();
  test_pearson();

  if (g_fail_count != 0) {
    std::cerr << "\n" << g_fail_count << " selftest(s) failed.\n";
    return 1;
  }
  std::cerr << "\nAll selftests passed.\n";
  return 0;
}
