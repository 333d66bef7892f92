#include "store/energy_model.hpp"
#include <cmath>
#include <stdexcept>

namespace wavemesh::store {

double photon_energy(double wavelength_nm) {
  if (!(wavelength_nm > 0.0)) {
    throw std::invalid_argument("Energy model: wavelength must be positive");
  }

  double wavelength_m = wavelength_nm * 1e-9;
  double frequency = SPEED_OF_LIGHT / wavelength_m;
  return PLANCK_CONSTANT * frequency;
}

double energy_cost_per_hop(uint64_t data_size, double wavelength_nm, double multiplier) {
  return photon_energy(wavelength_nm) * static_cast<double>(data_size) * multiplier;
}

double assign_wavelength(std::size_t chunk_index, std::size_t total_chunks,
                         const ChunkingParameters& params) {
  if (total_chunks <= 1) {
    return (params.min_wavelength_nm + params.max_wavelength_nm) / 2.0;
  }

  double range = params.max_wavelength_nm - params.min_wavelength_nm;
  double wavelength = params.min_wavelength_nm
      + (static_cast<double>(chunk_index) / static_cast<double>(total_chunks - 1)) * range;
  return std::round(wavelength * 100.0) / 100.0;
}

} // namespace wavemesh::store
