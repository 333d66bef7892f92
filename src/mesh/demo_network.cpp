#include "mesh/mesh_network.hpp"
#include <boost/log/trivial.hpp>
#include <utility>

namespace wavemesh {

namespace {

constexpr uint64_t KB = 1024;
constexpr uint64_t MB = 1048576;

struct DemoNode {
  const char* id;
  topology::NodeRole role;
  std::vector<topology::Transport> transports;
  uint64_t cache_mb;
};

struct DemoLink {
  const char* a;
  const char* b;
  topology::Transport transport;
  double signal_dbm;
  double latency_ms;
  double bandwidth_kbps;
};

struct DemoFile {
  const char* filename;
  uint64_t size;
  store::FileMetadata metadata;
  const char* shared_identity;  // files naming the same identity carry identical bytes
};

struct DemoResource {
  const char* id;
  const char* title;
  uint64_t size_kb;
  const char* category;
  int priority;
};

} // namespace

void build_demo_network(MeshNetwork& network) {
  using topology::NodeRole;
  using topology::Transport;

  const std::vector<DemoNode> nodes = {
    {"student_phone_001", NodeRole::EDGE, {Transport::BLE, Transport::WIFI}, 500},
    {"student_phone_002", NodeRole::EDGE, {Transport::BLE, Transport::WIFI}, 500},
    {"student_phone_003", NodeRole::EDGE, {Transport::WIFI, Transport::LORA}, 200},
    {"library_relay", NodeRole::RELAY, {Transport::WIFI, Transport::LORA}, 2000},
    {"dorm_cache", NodeRole::CACHE, {Transport::WIFI}, 50000},
    {"campus_gateway", NodeRole::GATEWAY, {Transport::WIFI, Transport::LORA}, 10000},
  };

  const std::vector<DemoLink> links = {
    {"student_phone_001", "student_phone_002", Transport::BLE, -65, 15, 1000},
    {"student_phone_002", "library_relay", Transport::WIFI, -45, 8, 5000},
    {"student_phone_003", "library_relay", Transport::WIFI, -50, 10, 4500},
    {"library_relay", "dorm_cache", Transport::WIFI, -40, 5, 8000},
    {"library_relay", "campus_gateway", Transport::LORA, -85, 50, 250},
    {"dorm_cache", "campus_gateway", Transport::WIFI, -35, 3, 10000},
  };

  const std::vector<DemoFile> files = {
    {"Calculus_Textbook_Chapter3.pdf", 15 * MB, {"pdf", "Differential equations and applications", "university"}, "Math_Textbook_Standard.pdf"},
    {"Math_Textbook_Standard.pdf", 15 * MB, {"pdf", "Standard mathematics textbook", "university"}, "Math_Textbook_Standard.pdf"},
    {"Asylum_Rights_Guide.pdf", 5 * MB, {"pdf", "Legal rights and asylum procedures", "refugee"}, nullptr},
    {"Safe_Routes_Map.png", 2 * MB, {"png", "Updated safe passage routes", "refugee"}, nullptr},
    {"Medical_First_Aid.pdf", 8 * MB, {"pdf", "Emergency medical procedures", "rural"}, nullptr},
    {"Market_Prices_Weekly.mp3", 3 * MB, {"mp3", "Weekly commodity price updates", "rural"}, nullptr},
    {"Emergency_Contacts.pdf", 1 * MB, {"pdf", "Crisis hotlines and shelters", "crisis"}, nullptr},
  };

  const std::vector<DemoResource> resources = {
    {"wiki_physics", "Physics - Complete Encyclopedia", 1500, "Science", 10},
    {"wiki_math", "Mathematics - Core Concepts", 1200, "Science", 9},
    {"wiki_history", "World History - 1900-2000", 2500, "Humanities", 7},
    {"edu_coding", "Introduction to Programming", 800, "Technology", 10},
    {"wiki_medicine", "Medical Encyclopedia", 3000, "Science", 8},
  };

  const std::vector<std::pair<const char*, const char*>> placements = {
    {"wiki_physics", "dorm_cache"},
    {"wiki_math", "dorm_cache"},
    {"edu_coding", "dorm_cache"},
    {"wiki_physics", "campus_gateway"},
  };

  for (const auto& node : nodes) {
    if (!network.add_node(node.id, node.role, node.cache_mb * MB, node.transports, 24.0)) {
      BOOST_LOG_TRIVIAL(error) << "Demo network: Failed to add node " << node.id;
    }
  }

  for (const auto& link : links) {
    MeshError error = network.connect(link.a, link.b, link.transport, link.signal_dbm, link.latency_ms, link.bandwidth_kbps);
    if (error != MeshError::SUCCESS) {
      BOOST_LOG_TRIVIAL(error) << "Demo network: Failed to link " << link.a << " <-> " << link.b << ": " << error;
    }
  }

  // Library lives on the dorm cache
  for (const auto& file : files) {
    std::optional<std::string> identity;
    if (file.shared_identity) {
      identity = std::string("FILE_CONTENT_") + file.shared_identity;
    }
    auto media_file = network.register_file(file.filename, file.size, file.metadata, identity);
    MeshError error = network.seed(media_file->file_id, "dorm_cache");
    if (error != MeshError::SUCCESS) {
      BOOST_LOG_TRIVIAL(warning) << "Demo network: Seeding " << file.filename << " failed: " << error;
    }
  }

  for (const auto& resource : resources) {
    network.add_resource(resource.id, resource.title, resource.size_kb * KB, resource.category, resource.priority);
  }
  for (const auto& [resource_id, node_id] : placements) {
    knowledge::PlacementResult result = network.cache_resource(resource_id, node_id);
    if (!result.ok()) {
      BOOST_LOG_TRIVIAL(warning) << "Demo network: Caching " << resource_id << " on " << node_id
                                 << " failed: " << result.error;
    }
  }

  network.addresses().block_name("wikipedia.org");
  network.addresses().block_name("signal.org");

  BOOST_LOG_TRIVIAL(info) << "Demo network: Campus mesh ready with " << nodes.size() << " nodes and "
                          << files.size() << " files and " << resources.size() << " reference works";
}

} // namespace wavemesh
