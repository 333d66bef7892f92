#include <gtest/gtest.h>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include "address/address_registry.hpp"
#include "cache/node_cache.hpp"
#include "propagation/propagation_engine.hpp"
#include "routing/path_router.hpp"
#include "store/content_store.hpp"
#include "topology/topology_graph.hpp"
#include "test_utils.hpp"

using namespace wavemesh;
using namespace wavemesh::propagation;

class PropagationEngineTest : public ::testing::Test {
protected:
  static constexpr uint64_t NODE_CAPACITY = 10 * 1024 * 1024;

  test::CountingRandomSource random;
  topology::TopologyGraph graph;
  std::unique_ptr<address::AddressRegistry> registry;
  store::ContentStore content;
  cache::CacheDirectory caches;
  std::unique_ptr<routing::PathRouter> router;
  std::unique_ptr<PropagationEngine> engine;

  void SetUp() override {
    test::quiet_logging();
    registry = std::make_unique<address::AddressRegistry>(random);
    router = std::make_unique<routing::PathRouter>(graph, *registry);
    engine = std::make_unique<PropagationEngine>(content, caches, *router);

    // A-B-C-D-E-A
    for (const char* id : {"A", "B", "C", "D", "E"}) {
      add_node(id, NODE_CAPACITY);
    }
    link("A", "B");
    link("B", "C");
    link("C", "D");
    link("D", "E");
    link("E", "A");
  }

  void add_node(const std::string& id, uint64_t capacity) {
    topology::Node node;
    node.id = id;
    node.address = registry->create_address(id);
    node.cache_capacity_bytes = capacity;
    ASSERT_EQ(graph.add_node(node), MeshError::SUCCESS);
    ASSERT_TRUE(registry->register_address(node.address));
    ASSERT_TRUE(caches.create(id, capacity));
  }

  void link(const std::string& a, const std::string& b) {
    ASSERT_EQ(graph.connect(a, b, {}), MeshError::SUCCESS);
  }

  void seed(const store::MediaFilePtr& media_file, const std::string& node_id) {
    auto node_cache = caches.find(node_id);
    ASSERT_NE(node_cache, nullptr);
    for (const auto& chunk : media_file->chunks) {
      ASSERT_EQ(node_cache->admit(chunk), cache::AdmitResult::ADMITTED);
    }
  }

  store::MediaFilePtr seeded_file(const std::string& name, const std::string& holder) {
    auto media_file = content.register_file(name, test::THREE_CHUNK_FILE_SIZE);
    seed(media_file, holder);
    return media_file;
  }

  static double cost_of_single_hop(const store::MediaFilePtr& media_file) {
    return media_file->energy_cost_single_hop();
  }
};

TEST_F(PropagationEngineTest, DeliversAcrossTheRing) {
  auto media_file = seeded_file("video.mp4", "A");

  FileDeliveryReport report = engine->deliver_file(media_file->file_id, "D");
  ASSERT_TRUE(report.success());
  EXPECT_EQ(report.total_chunks, 3u);
  EXPECT_EQ(report.successful_chunks, 3u);
  EXPECT_EQ(report.cache_hits, 0u);
  EXPECT_EQ(report.total_hops, 6u);
  EXPECT_DOUBLE_EQ(report.avg_hops_per_chunk(), 2.0);
  EXPECT_NEAR(report.total_cost, 2.0 * cost_of_single_hop(media_file), report.total_cost * 1e-12);

  for (const auto& result : report.chunks) {
    EXPECT_EQ(result.path, (routing::Path{"A", "E", "D"}));
    EXPECT_EQ(result.source, "A");
    EXPECT_EQ(result.hops, 2u);
  }

  auto target_cache = caches.find("D");
  for (const auto& chunk : media_file->chunks) {
    EXPECT_TRUE(target_cache->has_chunk(chunk->content_hash()));
    EXPECT_EQ(chunk->holders(), (std::set<std::string>{"A", "D"}));
    EXPECT_EQ(chunk->total_hops(), 2u);
    ASSERT_EQ(chunk->paths().size(), 1u);
  }
  // Intermediate nodes only forward
  EXPECT_EQ(caches.find("E")->chunk_count(), 0u);

  PropagationStats stats = engine->stats();
  EXPECT_EQ(stats.total_propagations, 3u);
  EXPECT_EQ(stats.total_hops, 6u);
  EXPECT_EQ(stats.total_bytes, test::THREE_CHUNK_FILE_SIZE);
  EXPECT_EQ(stats.cache_misses, 3u);
  EXPECT_EQ(stats.cache_hits, 0u);
  EXPECT_EQ(stats.dedup_reused, 0u);
  EXPECT_NEAR(stats.total_energy, report.total_cost, report.total_cost * 1e-12);
  EXPECT_DOUBLE_EQ(stats.avg_hops_per_propagation(), 2.0);
  EXPECT_NEAR(media_file->energy_spent_all_hops(), report.total_cost, report.total_cost * 1e-12);
}

TEST_F(PropagationEngineTest, NewReplicasShortenLaterDeliveries) {
  auto media_file = seeded_file("video.mp4", "A");
  FileDeliveryReport first = engine->deliver_file(media_file->file_id, "D");
  ASSERT_TRUE(first.success());

  FileDeliveryReport second = engine->deliver_file(media_file->file_id, "E");
  ASSERT_TRUE(second.success());
  EXPECT_LE(second.total_hops, first.total_hops);
  EXPECT_EQ(second.total_hops, 3u);
  for (const auto& result : second.chunks) {
    EXPECT_EQ(result.hops, 1u);
  }

  // C is next to D, which now holds a copy
  FileDeliveryReport third = engine->deliver_file(media_file->file_id, "C");
  ASSERT_TRUE(third.success());
  for (const auto& result : third.chunks) {
    EXPECT_EQ(result.source, "D");
    EXPECT_EQ(result.hops, 1u);
  }
}

TEST_F(PropagationEngineTest, CacheHitLeavesCountersUntouched) {
  auto media_file = seeded_file("video.mp4", "A");
  ASSERT_TRUE(engine->deliver_file(media_file->file_id, "D").success());
  PropagationStats before = engine->stats();
  double spent_before = media_file->energy_spent_all_hops();

  FileDeliveryReport again = engine->deliver_file(media_file->file_id, "D");
  ASSERT_TRUE(again.success());
  EXPECT_EQ(again.cache_hits, 3u);
  EXPECT_EQ(again.total_hops, 0u);
  EXPECT_DOUBLE_EQ(again.total_cost, 0.0);
  for (const auto& result : again.chunks) {
    EXPECT_TRUE(result.cache_hit);
    EXPECT_EQ(result.path, (routing::Path{"D"}));
  }

  PropagationStats after = engine->stats();
  EXPECT_EQ(after.total_propagations, before.total_propagations);
  EXPECT_EQ(after.total_hops, before.total_hops);
  EXPECT_EQ(after.total_bytes, before.total_bytes);
  EXPECT_DOUBLE_EQ(after.total_energy, before.total_energy);
  EXPECT_EQ(after.cache_misses, before.cache_misses);
  EXPECT_EQ(after.cache_hits, before.cache_hits + 3);
  EXPECT_DOUBLE_EQ(after.cache_hit_rate(), 50.0);
  EXPECT_DOUBLE_EQ(media_file->energy_spent_all_hops(), spent_before);
}

TEST_F(PropagationEngineTest, DeliveringToAHolderIsAHit) {
  auto media_file = seeded_file("video.mp4", "A");
  DeliveryResult result = engine->deliver_chunk(media_file->chunks[0], "A");
  EXPECT_TRUE(result.ok());
  EXPECT_TRUE(result.cache_hit);
  EXPECT_EQ(result.hops, 0u);
  EXPECT_EQ(engine->stats().total_propagations, 0u);
}

TEST_F(PropagationEngineTest, UnheldContentHasNoSource) {
  auto media_file = content.register_file("orphan.bin", test::THREE_CHUNK_FILE_SIZE);

  DeliveryResult result = engine->deliver_chunk(media_file->chunks[0], "B");
  EXPECT_EQ(result.error, MeshError::NO_SOURCE);
  EXPECT_FALSE(caches.find("B")->has_chunk(media_file->chunks[0]->content_hash()));

  PropagationStats stats = engine->stats();
  EXPECT_EQ(stats.total_propagations, 0u);
  EXPECT_EQ(stats.cache_misses, 1u);
  EXPECT_DOUBLE_EQ(stats.total_energy, 0.0);
}

TEST_F(PropagationEngineTest, PartitionedTargetHasNoRoute) {
  add_node("island", NODE_CAPACITY);
  auto media_file = seeded_file("video.mp4", "A");

  FileDeliveryReport report = engine->deliver_file(media_file->file_id, "island");
  EXPECT_FALSE(report.success());
  EXPECT_EQ(report.error, MeshError::NO_ROUTE);
  EXPECT_EQ(report.successful_chunks, 0u);
  EXPECT_EQ(caches.find("island")->chunk_count(), 0u);
  EXPECT_EQ(engine->stats().total_hops, 0u);
}

TEST_F(PropagationEngineTest, FullCacheRejectsWithoutCharging) {
  add_node("tiny", 70000);
  link("tiny", "A");
  auto media_file = seeded_file("video.mp4", "A");

  FileDeliveryReport report = engine->deliver_file(media_file->file_id, "tiny");
  EXPECT_EQ(report.error, MeshError::CACHE_FULL);
  // Only the first 64 KiB chunk fits
  EXPECT_EQ(report.successful_chunks, 1u);
  EXPECT_EQ(report.total_hops, 1u);

  auto tiny = caches.find("tiny");
  EXPECT_EQ(tiny->used(), 65536u);
  EXPECT_TRUE(tiny->invariant_holds());

  PropagationStats stats = engine->stats();
  EXPECT_EQ(stats.total_propagations, 1u);
  EXPECT_EQ(stats.total_bytes, 65536u);
  EXPECT_EQ(stats.cache_misses, 3u);
}

TEST_F(PropagationEngineTest, UnknownTargetsAndFiles) {
  auto media_file = seeded_file("video.mp4", "A");

  EXPECT_EQ(engine->deliver_file(media_file->file_id, "nowhere").error, MeshError::UNKNOWN_NODE);
  EXPECT_EQ(engine->deliver_file("ffffffffffff", "B").error, MeshError::UNKNOWN_FILE);
  EXPECT_EQ(engine->deliver_chunk(nullptr, "B").error, MeshError::UNKNOWN_FILE);
  EXPECT_EQ(engine->deliver_chunk(media_file->chunks[0], "B", std::string("nowhere")).error,
            MeshError::UNKNOWN_NODE);
  EXPECT_EQ(engine->stats().total_propagations, 0u);
}

TEST_F(PropagationEngineTest, ExplicitSourceIsHonored) {
  auto media_file = seeded_file("video.mp4", "A");

  DeliveryResult result = engine->deliver_chunk(media_file->chunks[0], "D", std::string("B"));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.source, "B");
  EXPECT_EQ(result.path, (routing::Path{"B", "C", "D"}));
  EXPECT_EQ(result.hops, 2u);
}

TEST_F(PropagationEngineTest, SourceSelectionModes) {
  auto media_file = content.register_file("video.mp4", test::THREE_CHUNK_FILE_SIZE);
  const auto& chunk = *media_file->chunks[0];
  ASSERT_EQ(caches.find("A")->admit(media_file->chunks[0]), cache::AdmitResult::ADMITTED);
  ASSERT_EQ(caches.find("C")->admit(media_file->chunks[0]), cache::AdmitResult::ADMITTED);

  EXPECT_EQ(engine->select_source(chunk, "D"), "C");
  EXPECT_EQ(engine->select_source(chunk, "E"), "A");
  EXPECT_EQ(engine->select_source(chunk, "A"), "C");

  PropagationEngine first_holder(content, caches, *router, SourceSelection::FIRST_HOLDER);
  EXPECT_EQ(first_holder.select_source(chunk, "D"), "A");
  EXPECT_EQ(first_holder.select_source(chunk, "A"), "C");
}

TEST_F(PropagationEngineTest, SharedContentServesAsSource) {
  auto original = content.register_file("Calculus.pdf", test::THREE_CHUNK_FILE_SIZE, {}, std::string("textbook"));
  auto twin = content.register_file("Math_Standard.pdf", test::THREE_CHUNK_FILE_SIZE, {}, std::string("textbook"));
  seed(original, "A");

  FileDeliveryReport report = engine->deliver_file(twin->file_id, "B");
  ASSERT_TRUE(report.success());
  EXPECT_EQ(report.total_hops, 3u);
  for (const auto& result : report.chunks) {
    EXPECT_EQ(result.source, "A");
  }

  PropagationStats stats = engine->stats();
  EXPECT_EQ(stats.dedup_reused, 3u);
  EXPECT_DOUBLE_EQ(stats.dedup_reuse_rate(), 100.0);

  // B now has the bytes of both files
  FileDeliveryReport original_to_b = engine->deliver_file(original->file_id, "B");
  EXPECT_EQ(original_to_b.cache_hits, 3u);
}

TEST_F(PropagationEngineTest, ConcurrentDeliveriesKeepInvariants) {
  auto media_file = seeded_file("video.mp4", "A");
  const std::vector<std::string> targets = {"B", "C", "D", "E"};

  std::vector<std::thread> threads;
  for (const auto& target : targets) {
    for (int round = 0; round < 3; ++round) {
      threads.emplace_back([this, &media_file, target] {
        engine->deliver_file(media_file->file_id, target);
      });
    }
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto& target : targets) {
    auto target_cache = caches.find(target);
    EXPECT_TRUE(target_cache->invariant_holds());
    EXPECT_EQ(target_cache->chunk_count(), 3u);
  }

  PropagationStats stats = engine->stats();
  // Each target receives each chunk exactly once
  EXPECT_EQ(stats.total_propagations, targets.size() * 3);
  EXPECT_EQ(stats.cache_hits + stats.cache_misses, targets.size() * 3 * 3);
  EXPECT_EQ(stats.total_bytes, targets.size() * test::THREE_CHUNK_FILE_SIZE);
}

TEST_F(PropagationEngineTest, EmptyStatsRates) {
  PropagationStats stats = engine->stats();
  EXPECT_DOUBLE_EQ(stats.cache_hit_rate(), 0.0);
  EXPECT_DOUBLE_EQ(stats.dedup_reuse_rate(), 0.0);
  EXPECT_DOUBLE_EQ(stats.avg_hops_per_propagation(), 0.0);
}
