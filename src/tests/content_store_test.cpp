#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "crypto/hash.hpp"
#include "store/content_store.hpp"
#include "test_utils.hpp"

using namespace wavemesh;
using namespace wavemesh::store;

class ContentStoreTest : public ::testing::Test {
protected:
  std::unique_ptr<ContentStore> store;

  void SetUp() override {
    test::quiet_logging();
    store = std::make_unique<ContentStore>();
  }

  static std::string default_identity(const std::string& filename, uint64_t size) {
    crypto::Digest seed = crypto::sha256("FILE_CONTENT_" + filename + "_" + std::to_string(size));
    return std::string(seed.begin(), seed.end());
  }
};

TEST_F(ContentStoreTest, RejectsInvalidParameters) {
  ChunkingParameters zero_chunk;
  zero_chunk.chunk_size = 0;
  EXPECT_THROW(ContentStore{zero_chunk}, std::invalid_argument);

  ChunkingParameters inverted;
  inverted.min_wavelength_nm = 900.0;
  inverted.max_wavelength_nm = 400.0;
  EXPECT_THROW(ContentStore{inverted}, std::invalid_argument);

  ChunkingParameters non_positive;
  non_positive.min_wavelength_nm = 0.0;
  EXPECT_THROW(ContentStore{non_positive}, std::invalid_argument);
}

TEST_F(ContentStoreTest, FileIdIsFilenameDigestPrefix) {
  std::string id = ContentStore::make_file_id("Asylum_Rights_Guide.pdf");
  EXPECT_EQ(id.size(), ContentStore::FILE_ID_CHARS);
  EXPECT_EQ(id, crypto::sha256_hex(std::string("Asylum_Rights_Guide.pdf")).substr(0, 12));
}

TEST_F(ContentStoreTest, ChunksAFileIntoFixedPieces) {
  auto media_file = store->register_file("lecture.mp4", test::THREE_CHUNK_FILE_SIZE);
  ASSERT_NE(media_file, nullptr);
  ASSERT_EQ(media_file->chunks.size(), 3u);

  EXPECT_EQ(media_file->chunks[0]->size(), 65536u);
  EXPECT_EQ(media_file->chunks[1]->size(), 65536u);
  EXPECT_EQ(media_file->chunks[2]->size(), 22528u);

  for (std::size_t i = 0; i < media_file->chunks.size(); ++i) {
    const auto& chunk = media_file->chunks[i];
    EXPECT_EQ(chunk->index(), i);
    EXPECT_EQ(chunk->total_chunks(), 3u);
    EXPECT_EQ(chunk->file_id(), media_file->file_id);
    EXPECT_EQ(chunk->chunk_id(), media_file->file_id + "_chunk_" + std::to_string(i));
    EXPECT_EQ(chunk->content_hash().size(), 64u);
    EXPECT_TRUE(chunk->holders().empty());
  }

  EXPECT_DOUBLE_EQ(media_file->chunks[0]->wavelength_nm(), 350.0);
  EXPECT_DOUBLE_EQ(media_file->chunks[1]->wavelength_nm(), 691.5);
  EXPECT_DOUBLE_EQ(media_file->chunks[2]->wavelength_nm(), 1033.0);
  EXPECT_DOUBLE_EQ(media_file->chunks[0]->energy_cost_per_hop(), energy_cost_per_hop(65536, 350.0));
}

TEST_F(ContentStoreTest, ChunkHashesCoverSynthesizedBytes) {
  auto media_file = store->register_file("lecture.mp4", test::THREE_CHUNK_FILE_SIZE);
  std::string identity = default_identity("lecture.mp4", test::THREE_CHUNK_FILE_SIZE);

  EXPECT_EQ(media_file->content_hash, crypto::sha256_hex(identity));
  for (const auto& chunk : media_file->chunks) {
    auto bytes = ContentStore::synthesize_chunk(identity, chunk->index(), chunk->size());
    ASSERT_EQ(bytes.size(), chunk->size());
    EXPECT_EQ(chunk->content_hash(), crypto::sha256_hex(bytes.data(), bytes.size()));
  }
}

TEST_F(ContentStoreTest, SynthesisIsDeterministic) {
  auto first = ContentStore::synthesize_chunk("identity", 4, 1000);
  auto second = ContentStore::synthesize_chunk("identity", 4, 1000);
  auto other_index = ContentStore::synthesize_chunk("identity", 5, 1000);
  EXPECT_EQ(first.size(), 1000u);
  EXPECT_EQ(first, second);
  EXPECT_NE(first, other_index);

  // A shorter request is a prefix of a longer one
  auto prefix = ContentStore::synthesize_chunk("identity", 4, 33);
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), first.begin()));
}

TEST_F(ContentStoreTest, EmptyFileHasNoChunks) {
  auto media_file = store->register_file("empty.txt", 0);
  ASSERT_NE(media_file, nullptr);
  EXPECT_TRUE(media_file->chunks.empty());
  EXPECT_EQ(store->total_chunks(), 0u);
  EXPECT_EQ(store->file_count(), 1u);
}

TEST_F(ContentStoreTest, RejectsSizesBeyondTheChunkLimit) {
  // Near the top of the range the chunk count must not wrap to zero
  EXPECT_THROW(store->register_file("huge.bin", UINT64_MAX - 100), std::invalid_argument);
  EXPECT_THROW(store->register_file("max.bin", UINT64_MAX), std::invalid_argument);

  uint64_t just_over = ContentStore::MAX_SYNTHESIZED_CHUNKS * ChunkingParameters{}.chunk_size + 1;
  EXPECT_THROW(store->register_file("just_over.bin", just_over), std::invalid_argument);

  EXPECT_EQ(store->file_count(), 0u);
  EXPECT_EQ(store->total_chunks(), 0u);
}

TEST_F(ContentStoreTest, SingleByteChunksCountEveryByte) {
  ChunkingParameters tiny;
  tiny.chunk_size = 1;
  ContentStore tiny_store(tiny);

  auto media_file = tiny_store.register_file("bytes.bin", 5);
  ASSERT_NE(media_file, nullptr);
  EXPECT_EQ(media_file->chunks.size(), 5u);
  EXPECT_THROW(tiny_store.register_file("all.bin", UINT64_MAX), std::invalid_argument);
}

TEST_F(ContentStoreTest, ReRegisteringReturnsTheSameFile) {
  auto first = store->register_file("map.png", 1000);
  auto second = store->register_file("map.png", 5000);
  EXPECT_EQ(first, second);
  EXPECT_EQ(second->size, 1000u);
  EXPECT_EQ(store->file_count(), 1u);
  EXPECT_EQ(store->total_chunks(), 1u);
}

TEST_F(ContentStoreTest, DistinctFilesDoNotShareContent) {
  store->register_file("a.bin", test::THREE_CHUNK_FILE_SIZE);
  store->register_file("b.bin", test::THREE_CHUNK_FILE_SIZE);
  EXPECT_EQ(store->total_chunks(), 6u);
  EXPECT_EQ(store->distinct_contents(), 6u);
}

TEST_F(ContentStoreTest, SharedIdentityDeduplicates) {
  auto first = store->register_file("Calculus.pdf", test::THREE_CHUNK_FILE_SIZE, {}, std::string("textbook"));
  auto second = store->register_file("Math_Standard.pdf", test::THREE_CHUNK_FILE_SIZE, {}, std::string("textbook"));

  ASSERT_NE(first->file_id, second->file_id);
  EXPECT_EQ(first->content_hash, second->content_hash);
  EXPECT_EQ(store->total_chunks(), 6u);
  EXPECT_EQ(store->distinct_contents(), 3u);

  for (std::size_t i = 0; i < 3; ++i) {
    ASSERT_EQ(first->chunks[i]->content_hash(), second->chunks[i]->content_hash());
    auto indexed = store->chunks_with_hash(first->chunks[i]->content_hash());
    ASSERT_EQ(indexed.size(), 2u);
    EXPECT_EQ(indexed[0], first->chunks[i]);
    EXPECT_EQ(indexed[1], second->chunks[i]);
  }
}

TEST_F(ContentStoreTest, HoldersAreUnionedAcrossSharedContent) {
  auto first = store->register_file("one.pdf", 1000, {}, std::string("same"));
  auto second = store->register_file("two.pdf", 1000, {}, std::string("same"));
  first->chunks[0]->add_holder("A");
  second->chunks[0]->add_holder("B");

  EXPECT_EQ(store->holders_of(first->chunks[0]->content_hash()), (std::set<std::string>{"A", "B"}));
  EXPECT_TRUE(store->holders_of("no-such-hash").empty());

  store->forget_holder("A");
  EXPECT_EQ(store->holders_of(first->chunks[0]->content_hash()), std::set<std::string>{"B"});
}

TEST_F(ContentStoreTest, RegistersRealBytesFromStream) {
  std::string data(70000, '\0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    data[i] = static_cast<char>('a' + i % 26);
  }
  std::istringstream input(data);

  auto media_file = store->register_stream("notes.txt", input, {"txt", "Lecture notes", "university"});
  ASSERT_NE(media_file, nullptr);
  EXPECT_EQ(media_file->size, 70000u);
  EXPECT_EQ(media_file->content_hash, crypto::sha256_hex(data));
  ASSERT_EQ(media_file->chunks.size(), 2u);
  EXPECT_EQ(media_file->chunks[0]->size(), 65536u);
  EXPECT_EQ(media_file->chunks[1]->size(), 70000u - 65536u);
  EXPECT_EQ(media_file->chunks[0]->content_hash(), crypto::sha256_hex(data.data(), 65536));
  EXPECT_EQ(media_file->chunks[1]->content_hash(), crypto::sha256_hex(data.data() + 65536, 70000 - 65536));
  EXPECT_EQ(media_file->metadata.category, "university");
}

TEST_F(ContentStoreTest, IdenticalStreamsDeduplicate) {
  std::string data(65536 * 2, 'z');
  std::istringstream first(data);
  std::istringstream second(data);

  store->register_stream("copy1.bin", first);
  store->register_stream("copy2.bin", second);

  // Both chunks of both files carry the same bytes
  EXPECT_EQ(store->total_chunks(), 4u);
  EXPECT_EQ(store->distinct_contents(), 1u);
}

TEST_F(ContentStoreTest, FailedStreamThrows) {
  std::istringstream input("data");
  input.setstate(std::ios::failbit);
  EXPECT_THROW(store->register_stream("broken.bin", input), StoreError);
  EXPECT_EQ(store->file_count(), 0u);
}

TEST_F(ContentStoreTest, CategoriesAndSummary) {
  store->register_file("Asylum_Rights_Guide.pdf", 1000, {"pdf", "Legal rights", "refugee"});
  store->register_file("Safe_Routes_Map.png", 1000, {"png", "Routes", "refugee"});
  store->register_file("Market_Prices_Weekly.mp3", 1000, {"mp3", "Prices", "rural"});
  store->register_file("untagged.bin", 1000);

  EXPECT_EQ(store->files_by_category("refugee").size(), 2u);
  EXPECT_TRUE(store->files_by_category("crisis").empty());
  EXPECT_EQ(store->files().size(), 4u);

  auto summary = store->library_summary();
  EXPECT_EQ(summary["refugee"], 2u);
  EXPECT_EQ(summary["rural"], 1u);
  EXPECT_EQ(summary["university"], 0u);
  EXPECT_EQ(summary["crisis"], 0u);
  EXPECT_EQ(summary.size(), 4u);
}

TEST_F(ContentStoreTest, UnknownFileIsNull) {
  EXPECT_EQ(store->file("000000000000"), nullptr);
}

TEST_F(ContentStoreTest, ConcurrentRegistrationOfOneName) {
  std::vector<MediaFilePtr> results(8);
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([this, &results, i] {
      results[i] = store->register_file("race.bin", test::THREE_CHUNK_FILE_SIZE);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  for (const auto& result : results) {
    EXPECT_EQ(result, results[0]);
  }
  EXPECT_EQ(store->file_count(), 1u);
  EXPECT_EQ(store->total_chunks(), 3u);
  EXPECT_EQ(store->distinct_contents(), 3u);
}
