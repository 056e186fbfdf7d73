#include "bench_common.hpp"

#include "inferguard/resilience/error_classifier.hpp"

#include <array>

void run_classifier_benchmark() {
  const inferguard::resilience::ErrorClassifier classifier;
  const std::array<std::string, 6> samples = {
      "rate limit status=429 retry_after=17: Too Many Requests",
      "authentication failed status=401: invalid api key",
      "api error status=503: service unavailable",
      "request timed out: Operation timed out after 30000 milliseconds",
      "insufficient_quota exceeded for this billing period",
      "something nobody has seen before",
  };

  std::size_t index = 0;
  inferguard::bench::run_bench("classify", 5000, [&] {
    (void)classifier.classify(samples[index++ % samples.size()]);
  });

  inferguard::bench::run_bench("extract_retry_after", 5000, [&] {
    (void)inferguard::resilience::ErrorClassifier::extract_retry_after(samples[0]);
  });
}
