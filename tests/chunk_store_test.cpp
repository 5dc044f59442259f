#include "../core/chunk_store.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <numeric>

using namespace qrreceive;
using namespace qrreceive::test_support;
using namespace std::chrono_literals;

class ChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ErrorManager::instance().clear_stats();
        original = pattern(100, 11);
        envelopes = make_envelopes(original, original, 20);
        info = TransferInfo::from_header(envelopes[0]);
        config.memory_threshold_bytes = 1024;
        config.chunk_timeout = 10s;
    }

    Result<AddOutcome> add(ChunkStore& store, uint32_t index) {
        return store.add_chunk(index, envelopes[index].payload);
    }

    std::vector<uint8_t> original;
    std::vector<Envelope> envelopes;
    TransferInfo info;
    ChunkStoreConfig config;
};

TEST_F(ChunkStoreTest, BeginTransferMarksEveryBlockMissing) {
    ChunkStore store(config);
    EXPECT_FALSE(store.has_transfer());

    const uint64_t generation = store.begin_transfer(info);
    EXPECT_TRUE(store.has_transfer());
    EXPECT_EQ(store.generation(), generation);
    EXPECT_EQ(store.missing(), (std::vector<uint32_t>{0, 1, 2, 3, 4}));
    EXPECT_EQ(store.state(2), BlockState::PENDING);

    ChunkProgress progress = store.progress();
    EXPECT_EQ(progress.received, 0u);
    EXPECT_EQ(progress.total, 5u);
    EXPECT_FALSE(progress.complete);
}

TEST_F(ChunkStoreTest, AnyDeliveryOrderAssemblesTheSameBytes) {
    std::vector<uint32_t> order(envelopes.size());
    std::iota(order.begin(), order.end(), 0u);

    do {
        ChunkStore store(config);
        store.begin_transfer(info);
        for (uint32_t index : order) {
            ASSERT_TRUE(add(store, index).success());
            // Duplicates are absorbed
            Result<AddOutcome> again = add(store, order.front());
            ASSERT_TRUE(again.success());
            EXPECT_TRUE(again.value().duplicate);
        }
        Result<AssembledFile> assembled = store.assemble();
        ASSERT_TRUE(assembled.success());
        EXPECT_EQ(assembled.value().bytes, original);
        EXPECT_TRUE(assembled.value().size_matches);
    } while (std::next_permutation(order.begin(), order.end()));
}

TEST_F(ChunkStoreTest, AssembleFailsWhileAnyBlockIsMissing) {
    ChunkStore store(config);
    store.begin_transfer(info);
    for (uint32_t index : {0u, 1u, 3u, 4u}) {
        ASSERT_TRUE(add(store, index).success());
    }

    Result<AssembledFile> assembled = store.assemble();
    ASSERT_FALSE(assembled.success());
    EXPECT_EQ(assembled.error().code, ErrorCode::TRANSFER_INCOMPLETE);
    EXPECT_EQ(store.missing(), std::vector<uint32_t>{2});

    Result<AddOutcome> last = add(store, 2);
    ASSERT_TRUE(last.success());
    EXPECT_TRUE(last.value().progress.complete);
    EXPECT_DOUBLE_EQ(last.value().progress.ratio, 1.0);
    EXPECT_TRUE(store.assemble().success());
}

TEST_F(ChunkStoreTest, OutOfRangeIndexLeavesStateUntouched) {
    ChunkStore store(config);
    store.begin_transfer(info);
    ASSERT_TRUE(add(store, 1).success());

    Result<AddOutcome> added = store.add_chunk(5, {1, 2, 3});
    ASSERT_FALSE(added.success());
    EXPECT_EQ(added.error().code, ErrorCode::INDEX_OUT_OF_RANGE);
    EXPECT_EQ(store.progress().received, 1u);
    EXPECT_EQ(store.memory_usage(), envelopes[1].payload.size());
}

TEST_F(ChunkStoreTest, RejectsBlocksWithoutTransferOrFromOldGeneration) {
    ChunkStore store(config);
    Result<AddOutcome> early = store.add_chunk(0, {1});
    ASSERT_FALSE(early.success());
    EXPECT_EQ(early.error().code, ErrorCode::NO_ACTIVE_TRANSFER);

    const uint64_t first = store.begin_transfer(info);
    const uint64_t second = store.begin_transfer(info);
    EXPECT_GT(second, first);

    Result<AddOutcome> stale = store.add_chunk(0, envelopes[0].payload, first);
    ASSERT_FALSE(stale.success());
    EXPECT_EQ(stale.error().code, ErrorCode::STALE_TRANSFER);
    EXPECT_TRUE(store.add_chunk(0, envelopes[0].payload, second).success());

    store.reset();
    EXPECT_FALSE(store.has_transfer());
    EXPECT_FALSE(store.is_missing(1, second));
}

TEST_F(ChunkStoreTest, TimeoutsAreReportedOnce) {
    ChunkStore store(config);
    const auto start = ChunkStore::Clock::now();
    const uint64_t generation = store.begin_transfer(info, start);
    ASSERT_TRUE(add(store, 0).success());
    ASSERT_TRUE(add(store, 3).success());

    EXPECT_TRUE(store.collect_timeouts(start + 9s).empty());

    EXPECT_EQ(store.collect_timeouts(start + 10s), (std::vector<uint32_t>{1, 2, 4}));
    EXPECT_EQ(store.state(1), BlockState::AWAITING_RETRY);
    EXPECT_TRUE(store.collect_timeouts(start + 60s).empty());

    EXPECT_TRUE(store.mark_retrying(1, generation));
    EXPECT_EQ(store.state(1), BlockState::RETRYING);
    EXPECT_TRUE(store.is_missing(1, generation));
    EXPECT_TRUE(store.collect_timeouts(start + 120s).empty());
}

TEST_F(ChunkStoreTest, FailedBlockCanStillBeReceived) {
    ChunkStore store(config);
    const uint64_t generation = store.begin_transfer(info);

    EXPECT_TRUE(store.mark_failed(2, generation));
    EXPECT_EQ(store.failed(), std::vector<uint32_t>{2});
    EXPECT_FALSE(store.is_missing(2, generation));
    EXPECT_FALSE(store.mark_failed(2, generation + 1));

    ASSERT_TRUE(add(store, 2).success());
    EXPECT_EQ(store.state(2), BlockState::RECEIVED);
    EXPECT_TRUE(store.failed().empty());
    EXPECT_FALSE(store.mark_failed(2, generation));
}

TEST_F(ChunkStoreTest, SpillsEverythingOnceThresholdWouldBeExceeded) {
    auto durable = std::make_shared<MemoryDurableStore>();
    config.memory_threshold_bytes = 50;
    info.file_size = 0;
    ChunkStore store(config, durable);
    store.begin_transfer(info);

    ASSERT_TRUE(add(store, 4).success());
    ASSERT_TRUE(add(store, 0).success());
    EXPECT_FALSE(store.durable_mode());
    EXPECT_EQ(store.memory_usage(), 40u);

    // 40 + 20 > 50
    ASSERT_TRUE(add(store, 2).success());
    EXPECT_TRUE(store.durable_mode());
    EXPECT_EQ(store.memory_usage(), 0u);
    EXPECT_EQ(durable->block_count(store.transfer_id()), 3u);

    ASSERT_TRUE(add(store, 1).success());
    ASSERT_TRUE(add(store, 3).success());
    EXPECT_EQ(durable->block_count(store.transfer_id()), 5u);
    EXPECT_EQ(durable->writes(), 5u);

    Result<AssembledFile> assembled = store.assemble();
    ASSERT_TRUE(assembled.success());
    EXPECT_EQ(assembled.value().bytes, original);
}

TEST_F(ChunkStoreTest, DurableWritesOnThreadPool) {
    auto durable = std::make_shared<MemoryDurableStore>();
    boost::asio::thread_pool pool(2);
    config.memory_threshold_bytes = 10;
    {
        ChunkStore store(config, durable, &pool);
        store.begin_transfer(info);
        for (uint32_t index : {3u, 1u, 4u, 0u, 2u}) {
            ASSERT_TRUE(add(store, index).success());
        }
        EXPECT_TRUE(store.durable_mode());

        Result<AssembledFile> assembled = store.assemble();
        ASSERT_TRUE(assembled.success());
        EXPECT_EQ(assembled.value().bytes, original);
    }
    pool.join();
}

TEST_F(ChunkStoreTest, PreselectsDurableStorageForLargeDeclaredSize) {
    auto durable = std::make_shared<MemoryDurableStore>();
    config.memory_threshold_bytes = 64;
    ChunkStore store(config, durable);
    store.begin_transfer(info);

    EXPECT_TRUE(store.durable_mode());
    ASSERT_TRUE(add(store, 0).success());
    EXPECT_EQ(store.memory_usage(), 0u);
    EXPECT_EQ(durable->block_count(store.transfer_id()), 1u);
}

TEST_F(ChunkStoreTest, NewTransferDiscardsDurableBlocks) {
    auto durable = std::make_shared<MemoryDurableStore>();
    config.memory_threshold_bytes = 64;
    ChunkStore store(config, durable);
    store.begin_transfer(info);
    const std::string first_id = store.transfer_id();
    ASSERT_TRUE(add(store, 0).success());

    store.begin_transfer(info);
    EXPECT_NE(store.transfer_id(), first_id);
    EXPECT_EQ(durable->block_count(first_id), 0u);
    EXPECT_EQ(durable->discards(), 1u);
}

TEST_F(ChunkStoreTest, FailedDurableWriteReturnsBlockToMissing) {
    auto durable = std::make_shared<MemoryDurableStore>();
    config.memory_threshold_bytes = 64;
    ChunkStore store(config, durable);
    store.begin_transfer(info);
    ASSERT_TRUE(store.durable_mode());

    durable->set_fail_writes(true);
    ASSERT_TRUE(add(store, 0).success());
    durable->set_fail_writes(false);
    for (uint32_t index = 1; index < 5; ++index) {
        ASSERT_TRUE(add(store, index).success());
    }

    EXPECT_EQ(store.state(0), BlockState::PENDING);
    EXPECT_EQ(store.missing(), std::vector<uint32_t>{0});
    EXPECT_FALSE(store.is_complete());
    EXPECT_EQ(ErrorManager::instance().count(ErrorCode::FILE_IO_ERROR), 1u);

    // Due for re-acquisition right away
    EXPECT_EQ(store.collect_timeouts(ChunkStore::Clock::now()), std::vector<uint32_t>{0});

    Result<AddOutcome> again = add(store, 0);
    ASSERT_TRUE(again.success());
    EXPECT_FALSE(again.value().duplicate);
    EXPECT_TRUE(again.value().progress.complete);

    Result<AssembledFile> assembled = store.assemble();
    ASSERT_TRUE(assembled.success()) << assembled.error().to_string();
    EXPECT_EQ(assembled.value().bytes, original);
}

TEST_F(ChunkStoreTest, WriteFailureFoundAtAssemblyKeepsTransferRecoverable) {
    auto durable = std::make_shared<MemoryDurableStore>();
    config.memory_threshold_bytes = 64;
    ChunkStore store(config, durable);
    store.begin_transfer(info);
    for (uint32_t index = 0; index < 4; ++index) {
        ASSERT_TRUE(add(store, index).success());
    }
    durable->set_fail_writes(true);
    ASSERT_TRUE(add(store, 4).success());
    durable->set_fail_writes(false);
    EXPECT_TRUE(store.is_complete());

    Result<AssembledFile> failed = store.assemble();
    ASSERT_FALSE(failed.success());
    EXPECT_EQ(failed.error().code, ErrorCode::TRANSFER_INCOMPLETE);
    EXPECT_EQ(store.state(4), BlockState::PENDING);
    EXPECT_FALSE(store.is_complete());

    ASSERT_TRUE(add(store, 4).success());
    Result<AssembledFile> assembled = store.assemble();
    ASSERT_TRUE(assembled.success()) << assembled.error().to_string();
    EXPECT_EQ(assembled.value().bytes, original);
}

TEST_F(ChunkStoreTest, WithoutDurableStoreKeepsMemoryAndWarnsOnce) {
    config.memory_threshold_bytes = 30;
    ChunkStore store(config);
    store.begin_transfer(info);
    for (uint32_t index = 0; index < 5; ++index) {
        ASSERT_TRUE(add(store, index).success());
    }

    EXPECT_FALSE(store.durable_mode());
    EXPECT_EQ(store.memory_usage(), 100u);
    EXPECT_EQ(ErrorManager::instance().count(ErrorCode::OPERATION_FAILED), 1u);
    EXPECT_TRUE(store.assemble().success());
}

TEST_F(ChunkStoreTest, SizeMismatchIsAWarning) {
    info.file_size = 99;
    ChunkStore store(config);
    store.begin_transfer(info);
    for (uint32_t index = 0; index < 5; ++index) {
        ASSERT_TRUE(add(store, index).success());
    }

    Result<AssembledFile> assembled = store.assemble();
    ASSERT_TRUE(assembled.success());
    EXPECT_FALSE(assembled.value().size_matches);
    EXPECT_EQ(assembled.value().bytes, original);
    EXPECT_EQ(ErrorManager::instance().count(ErrorCode::SIZE_MISMATCH), 1u);
}

class FileDurableStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               ("qrreceive_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()) +
                "_" + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root);
    }

    void TearDown() override {
        std::filesystem::remove_all(root);
    }

    std::filesystem::path root;
};

TEST_F(FileDurableStoreTest, AssemblesInNumericIndexOrder) {
    FileDurableStore store(root.string());
    ASSERT_TRUE(store.store_block("t-1", 10, {0x0A}).success());
    ASSERT_TRUE(store.store_block("t-1", 2, {0x02}).success());
    ASSERT_TRUE(store.store_block("t-1", 1, {0x01, 0x11}).success());

    Result<std::vector<uint8_t>> assembled = store.assemble("t-1");
    ASSERT_TRUE(assembled.success()) << assembled.error().to_string();
    EXPECT_EQ(assembled.value(), (std::vector<uint8_t>{0x01, 0x11, 0x02, 0x0A}));

    ASSERT_TRUE(store.discard("t-1").success());
    EXPECT_FALSE(std::filesystem::exists(root / "t-1"));
}

TEST_F(FileDurableStoreTest, ReportsUnwritableRoot) {
    std::filesystem::create_directories(root);
    const std::filesystem::path blocker = root / "file";
    {
        std::ofstream out(blocker);
        out << "x";
    }

    FileDurableStore store(blocker.string());
    Result<void> stored = store.store_block("t", 0, {1});
    ASSERT_FALSE(stored.success());
    EXPECT_EQ(stored.error().code, ErrorCode::FILE_IO_ERROR);
}
