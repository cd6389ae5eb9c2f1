#include "../core/rf_models.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace rf_heatmap;

void test_indoor_path_loss()
{
  std::cout << "Testing indoor path loss..." << std::endl;
  double loss = rf_models::calculate_indoor_path_loss(10.0, 5000.0);
  std::cout << "  Indoor PL (10m, 5000MHz): " << loss << " dB (Expected ~74.43)" << std::endl;
  assert(std::abs(loss - 74.43) < 0.01);

  // Exponent 2.0 reduces to FSPL in meters/MHz form
  double fspl = rf_models::calculate_indoor_path_loss(100.0, 2400.0, rf_models::FREE_SPACE_PATH_LOSS_EXPONENT);
  std::cout << "  FSPL (100m, 2400MHz): " << fspl << " dB (Expected ~80.05)" << std::endl;
  assert(std::abs(fspl - 80.05) < 0.01);
}

void test_monotonic()
{
  std::cout << "Testing monotonic distance law..." << std::endl;
  double previous = rf_models::calculate_indoor_path_loss(0.5, 5500.0);
  for (double d = 1.0; d < 200.0; d *= 1.5)
  {
    double loss = rf_models::calculate_indoor_path_loss(d, 5500.0);
    assert(loss > previous);
    previous = loss;
  }
}

void test_distance_clamp()
{
  std::cout << "Testing distance clamp..." << std::endl;
  double at_zero = rf_models::calculate_indoor_path_loss(0.0, 5000.0);
  double at_min = rf_models::calculate_indoor_path_loss(rf_models::MIN_DISTANCE_M, 5000.0);
  assert(std::isfinite(at_zero));
  assert(at_zero == at_min);

  // 4 m horizontal, one floor of 3 m -> 5 m slant
  assert(std::abs(rf_models::calculate_3d_distance(4.0, 1, 3.0) - 5.0) < 1e-12);
  assert(rf_models::calculate_3d_distance(0.0, 0, 3.0) == rf_models::MIN_DISTANCE_M);
}

int main()
{
  test_indoor_path_loss();
  test_monotonic();
  test_distance_clamp();
  std::cout << "RF Models Verification Passed" << std::endl;
  return 0;
}
