#include "logger/logger.hpp"
#include "mesh/mesh_network.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <unordered_set>

struct ProgramOptions {
  std::string log_file{"wavemesh.log"};
  wavemesh::logger::severity_level verbosity{wavemesh::logger::severity_level::info};
  bool console{true};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-l <file>] [-v <level>] [-q]\n"
        << "Optional arguments:\n"
        << "  -l, --log        Log file (default wavemesh.log)\n"
        << "  -v, --verbosity  trace, debug, info, warning, error or fatal\n"
        << "  -q, --quiet      Log to the file only\n"
        << "Example: " << program_name << " -l mesh.log -v debug\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_set<std::string> value_flags = {"-l", "--log", "-v", "--verbosity"};

  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "-q" || flag == "--quiet") {
      options.console = false;
      continue;
    }

    if (value_flags.count(flag) == 0) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    if (flag == "-l" || flag == "--log") {
      options.log_file = value;
    } else {
      auto level = wavemesh::logger::parse_severity(value);
      if (!level) {
        std::cerr << "Error: Invalid verbosity level: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
      options.verbosity = *level;
    }
  }

  options.valid = true;
  return options;
}

void print_delivery(const wavemesh::propagation::FileDeliveryReport& report, const std::string& target) {
  std::cout << "  " << report.filename << " -> " << target << ": "
            << report.successful_chunks << "/" << report.total_chunks << " chunks, "
            << report.cache_hits << " cache hits, " << report.total_hops << " hops, cost "
            << std::fixed << std::setprecision(4) << report.total_cost;
  if (report.error != wavemesh::MeshError::SUCCESS) {
    std::cout << " (" << report.error << ")";
  }
  std::cout << '\n';
}

bool run_demo() {
  try {
    wavemesh::MeshNetwork network;
    wavemesh::build_demo_network(network);

    std::cout << "Node addresses:\n";
    for (const auto& node_id : network.topology().node_ids()) {
      if (auto address = network.addresses().address_of(node_id)) {
        std::cout << "  " << std::left << std::setw(20) << node_id << address->to_routing_key() << '\n';
      }
    }

    std::cout << "Deliveries:\n";
    const std::string targets[] = {"student_phone_003", "student_phone_001", "student_phone_002"};
    for (const auto& target : targets) {
      for (const auto& media_file : network.content().files_by_category("refugee")) {
        print_delivery(network.deliver(media_file->file_id, target), target);
      }
    }
    for (const auto& media_file : network.content().files_by_category("university")) {
      print_delivery(network.deliver(media_file->file_id, "student_phone_001"), "student_phone_001");
    }

    auto sender = network.addresses().address_of("student_phone_001");
    auto recipient = network.addresses().address_of("student_phone_003");
    if (sender && recipient) {
      const auto sent = network.send_message(*sender, *recipient, "Study group at the library, 6pm", 532.0);
      std::cout << "Message " << sent.message_id << ": " << sent.error << ", " << sent.hops << " hops, "
                << std::scientific << sent.energy_cost << " J\n" << std::defaultfloat;
      for (const auto& message : network.inbox(recipient->to_routing_key())) {
        std::cout << "  inbox of " << recipient->node_id << ": "
                  << wavemesh::messaging::MessageRouter::decode(message) << '\n';
      }
    }

    std::cout << "Knowledge:\n";
    for (const auto& resource : network.knowledge().resources()) {
      auto nearest = network.find_nearest_cache(resource.resource_id, "student_phone_003");
      std::cout << "  " << std::left << std::setw(34) << resource.title
                << (nearest ? *nearest : std::string("not cached")) << '\n';
    }

    const auto stats = network.stats();
    std::cout << std::fixed << std::setprecision(2)
              << "Network statistics:\n"
              << "  files: " << stats.total_files << ", chunks: " << stats.total_chunks << '\n'
              << "  propagations: " << stats.total_propagations << ", bytes: " << stats.total_bytes << '\n'
              << "  hops: " << stats.total_hops << " (avg " << stats.avg_hops_per_propagation << ")\n"
              << "  energy: " << std::setprecision(6) << stats.total_energy << std::setprecision(2) << '\n'
              << "  cache hit rate: " << stats.cache_hit_rate << "%\n"
              << "  dedup reuse rate: " << stats.dedup_reuse_rate << "%\n";

    const auto health = network.health();
    std::cout << "Coverage:\n"
              << "  nodes: " << health.coverage.node_count << ", links: " << health.coverage.link_count
              << ", density: " << health.coverage.density << '\n'
              << "  replication factor: " << health.replication_factor << '\n'
              << "  queued messages: " << health.queued_messages << '\n'
              << "  reference works: " << health.knowledge.total_resources << ", replicated "
              << health.knowledge.avg_replication_factor << "x\n";
    for (const auto& [title, accesses] : health.knowledge.top_accessed) {
      std::cout << "    " << std::left << std::setw(34) << title << accesses << " accesses\n";
    }

    for (const auto& node_id : network.topology().node_ids()) {
      if (auto status = network.node_cache_status(node_id)) {
        std::cout << "  " << std::left << std::setw(20) << node_id << status->chunks_cached << " chunks, "
                  << status->utilization_percent << "% used\n";
      }
    }
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Demo failed: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  try {
    wavemesh::logger::init_logging(options.log_file, options.verbosity, options.console);
  } catch (const std::exception&) {
    return 1;
  }

  if (!run_demo()) {
    return 1;
  }
  return 0;
}
