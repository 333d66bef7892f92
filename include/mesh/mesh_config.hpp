#ifndef WAVEMESH_MESH_CONFIG_HPP
#define WAVEMESH_MESH_CONFIG_HPP

#include "propagation/propagation_engine.hpp"
#include "store/energy_model.hpp"

namespace wavemesh {

struct MeshConfig {
  store::ChunkingParameters chunking;
  propagation::SourceSelection source_selection = propagation::SourceSelection::NEAREST_HOLDER;
};

} // namespace wavemesh

#endif // WAVEMESH_MESH_CONFIG_HPP
