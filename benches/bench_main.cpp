#include <iostream>

void run_startup_benchmark();
void run_config_benchmark();
void run_classifier_benchmark();
void run_cache_benchmark();
void run_admission_benchmark();
void run_orchestrator_benchmarks();

int main() {
  std::cout << "InferGuard Benchmarks\n";
  run_startup_benchmark();
  run_config_benchmark();
  run_classifier_benchmark();
  run_cache_benchmark();
  run_admission_benchmark();
  run_orchestrator_benchmarks();
  return 0;
}
