#ifndef WAVEMESH_STORE_ENERGY_MODEL_HPP
#define WAVEMESH_STORE_ENERGY_MODEL_HPP

#include <cstddef>
#include <cstdint>

namespace wavemesh::store {

static constexpr double PLANCK_CONSTANT = 6.62607015e-34;  // J*s
static constexpr double SPEED_OF_LIGHT = 299792458.0;     // m/s

static constexpr uint64_t DEFAULT_CHUNK_SIZE = 65536;        // 64 KiB
static constexpr double DEFAULT_MIN_WAVELENGTH_NM = 350.0;
static constexpr double DEFAULT_MAX_WAVELENGTH_NM = 1033.0;
// 100 MB across 5 hops costs roughly one unit
static constexpr double DEFAULT_ENERGY_MULTIPLIER = 1.28e9;

struct ChunkingParameters {
  uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
  double min_wavelength_nm = DEFAULT_MIN_WAVELENGTH_NM;
  double max_wavelength_nm = DEFAULT_MAX_WAVELENGTH_NM;
  double energy_multiplier = DEFAULT_ENERGY_MULTIPLIER;
};

// Energy of one photon, h * c / wavelength. Throws std::invalid_argument for a
// non-positive wavelength.
double photon_energy(double wavelength_nm);

// h * (c / wavelength) * size * multiplier. Throws std::invalid_argument for a
// non-positive wavelength.
double energy_cost_per_hop(uint64_t data_size, double wavelength_nm,
                           double multiplier = DEFAULT_ENERGY_MULTIPLIER);

// Spreads chunk wavelengths linearly over [min, max] by index, rounded to 0.01 nm.
// A single-chunk file sits at the midpoint.
double assign_wavelength(std::size_t chunk_index, std::size_t total_chunks,
                         const ChunkingParameters& params);

} // namespace wavemesh::store

#endif // WAVEMESH_STORE_ENERGY_MODEL_HPP
