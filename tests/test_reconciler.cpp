#include <gtest/gtest.h>
#include "market_fixture.hpp"
#include "veilmarket/indexer/chain_data_source.hpp"
#include "veilmarket/indexer/purchase_reconciler.hpp"
#include <set>
#include <stdexcept>

using namespace veilmarket;
using namespace veilmarket::indexer;
using veilmarket::test::MarketTest;

namespace {

/// Wraps a source and fails or corrupts selected lookups
class FaultySource : public ChainDataSource {
private:
    const ChainDataSource& inner_;

public:
    bool fail_id_list = false;
    bool foreign_id_list_error = false;
    bool fail_logs = false;
    std::set<PurchaseId> failing_purchases;
    std::set<PurchaseId> foreign_purchase_errors;
    std::set<OfferId> failing_offers;
    std::set<BlockNumber> failing_blocks;
    std::set<BlockNumber> corrupt_blocks;

    explicit FaultySource(const ChainDataSource& inner) : inner_(inner) {}

    Address ledger_address() const override { return inner_.ledger_address(); }

    std::vector<PurchaseId> purchase_ids_of(const Address& buyer) const override {
        if (fail_id_list) {
            throw ReconciliationError("RPC timeout");
        }
        if (foreign_id_list_error) {
            throw std::runtime_error("connection reset");
        }
        return inner_.purchase_ids_of(buyer);
    }

    ledger::Purchase purchase(PurchaseId id) const override {
        if (failing_purchases.count(id)) {
            throw ReconciliationError("RPC timeout");
        }
        if (foreign_purchase_errors.count(id)) {
            throw std::runtime_error("connection reset");
        }
        return inner_.purchase(id);
    }

    ledger::Offer offer(OfferId id) const override {
        if (failing_offers.count(id)) {
            throw ReconciliationError("RPC timeout");
        }
        return inner_.offer(id);
    }

    std::vector<chain::LogRecord> logs(const chain::LogFilter& filter) const override {
        if (fail_logs) {
            throw ReconciliationError("Log store unreachable");
        }
        auto records = inner_.logs(filter);
        for (auto& r : records) {
            if (corrupt_blocks.count(r.block_number)) {
                r.log.data.resize(r.log.data.size() / 2);
            }
        }
        return records;
    }

    Timestamp block_timestamp(BlockNumber block) const override {
        if (failing_blocks.count(block)) {
            throw ReconciliationError("Block header unavailable");
        }
        return inner_.block_timestamp(block);
    }
};

} // anonymous namespace

// ============================================================================
// Purchase Reconciler Tests
// ============================================================================

class ReconcilerTest : public MarketTest {
protected:
    std::unique_ptr<LedgerDataSource> source_;
    std::vector<CallContext> buys_;

    void SetUp() override {
        MarketTest::SetUp();
        source_ = std::make_unique<LedgerDataSource>(*ledger_);
    }

    /// One purchase of `quantity` slots per call, each in its own block
    PurchaseId buy(OfferId id, uint64_t quantity, const Address& who) {
        CallContext ctx = call(who, 100 * quantity);
        buys_.push_back(ctx);
        return ledger_->purchase_offer(ctx, id, quantity);
    }

    PurchaseId buy_same_block(OfferId id, uint64_t quantity, const Address& who) {
        CallContext ctx = call_same_block(who, 100 * quantity);
        buys_.push_back(ctx);
        return ledger_->purchase_offer(ctx, id, quantity);
    }
};

TEST_F(ReconcilerTest, EmptyHistory) {
    PurchaseReconciler reconciler(*source_);
    PurchaseHistory history = reconciler.reconcile(buyer_);
    EXPECT_TRUE(history.items.empty());
    EXPECT_EQ(history.degraded_lookups, 0u);
}

TEST_F(ReconcilerTest, EveryPurchaseMatched) {
    OfferId a = create(100, 10, 30);
    OfferId b = create(100, 10, 30);
    buy(a, 1, buyer_);
    buy(b, 2, buyer_);
    buy(a, 3, buyer_);

    PurchaseReconciler reconciler(*source_);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), 3u);
    EXPECT_EQ(history.degraded_lookups, 0u);
    for (size_t i = 0; i < 3; ++i) {
        const auto& item = history.items[i];
        EXPECT_EQ(item.id, i + 1);
        EXPECT_EQ(item.purchase.id, item.id);
        ASSERT_TRUE(item.tx_hash.has_value());
        EXPECT_EQ(*item.tx_hash, buys_[i].tx_hash);
        ASSERT_TRUE(item.offer.has_value());
        EXPECT_EQ(item.offer->id, item.purchase.offer_id);
    }
    EXPECT_EQ(history.items[1].purchase.slots, 2u);
    EXPECT_EQ(history.items[1].offer->title, "Design review");
}

TEST_F(ReconcilerTest, OtherBuyersExcluded) {
    OfferId id = create(100, 10, 30);
    buy(id, 1, buyer_);
    buy(id, 1, other_buyer_);
    buy(id, 2, buyer_);

    PurchaseReconciler reconciler(*source_);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), 2u);
    EXPECT_EQ(history.items[0].id, 1u);
    EXPECT_EQ(history.items[1].id, 3u);
    EXPECT_EQ(*history.items[0].tx_hash, buys_[0].tx_hash);
    EXPECT_EQ(*history.items[1].tx_hash, buys_[2].tx_hash);
}

TEST_F(ReconcilerTest, IdenticalPurchasesInOneBlockEachGetOneLog) {
    OfferId id = create(100, 10, 30);
    buy(id, 1, buyer_);
    buy_same_block(id, 1, buyer_);
    buy_same_block(id, 1, buyer_);

    PurchaseReconciler reconciler(*source_);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), 3u);
    std::set<TxHash> hashes;
    for (size_t i = 0; i < 3; ++i) {
        ASSERT_TRUE(history.items[i].tx_hash.has_value());
        EXPECT_EQ(*history.items[i].tx_hash, buys_[i].tx_hash);
        hashes.insert(*history.items[i].tx_hash);
    }
    EXPECT_EQ(hashes.size(), 3u);
}

TEST_F(ReconcilerTest, MissingLogsLeaveExactlyThoseUnmatched) {
    OfferId id = create(100, 20, 30);
    const size_t n = 6;
    for (size_t i = 0; i < n; ++i) {
        buy(id, 1 + i % 2, buyer_);
    }

    FaultySource faulty(*source_);
    faulty.failing_blocks = {buys_[1].block, buys_[4].block};

    PurchaseReconciler reconciler(faulty);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), n);
    size_t matched = 0;
    for (size_t i = 0; i < n; ++i) {
        if (i == 1 || i == 4) {
            EXPECT_FALSE(history.items[i].tx_hash.has_value()) << "purchase " << i;
        } else {
            ASSERT_TRUE(history.items[i].tx_hash.has_value()) << "purchase " << i;
            EXPECT_EQ(*history.items[i].tx_hash, buys_[i].tx_hash);
            ++matched;
        }
    }
    EXPECT_EQ(matched, n - 2);
    EXPECT_EQ(history.degraded_lookups, 2u);
}

TEST_F(ReconcilerTest, MalformedLogDegradesOneRecord) {
    OfferId id = create(100, 10, 30);
    buy(id, 1, buyer_);
    buy(id, 2, buyer_);

    FaultySource faulty(*source_);
    faulty.corrupt_blocks = {buys_[0].block};

    PurchaseReconciler reconciler(faulty);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), 2u);
    EXPECT_FALSE(history.items[0].tx_hash.has_value());
    EXPECT_TRUE(history.items[1].tx_hash.has_value());
    EXPECT_EQ(history.degraded_lookups, 1u);
}

TEST_F(ReconcilerTest, FailedPurchaseLookupSkipsRecord) {
    OfferId id = create(100, 10, 30);
    buy(id, 1, buyer_);
    buy(id, 2, buyer_);
    buy(id, 3, buyer_);

    FaultySource faulty(*source_);
    faulty.failing_purchases = {2};

    PurchaseReconciler reconciler(faulty);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), 2u);
    EXPECT_EQ(history.items[0].id, 1u);
    EXPECT_EQ(history.items[1].id, 3u);
    EXPECT_EQ(*history.items[1].tx_hash, buys_[2].tx_hash);
    EXPECT_EQ(history.degraded_lookups, 1u);
}

TEST_F(ReconcilerTest, FailedOfferLookupKeepsRecord) {
    OfferId a = create(100, 10, 30);
    OfferId b = create(100, 10, 30);
    buy(a, 1, buyer_);
    buy(b, 1, buyer_);

    FaultySource faulty(*source_);
    faulty.failing_offers = {a};

    PurchaseReconciler reconciler(faulty);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), 2u);
    EXPECT_FALSE(history.items[0].offer.has_value());
    EXPECT_TRUE(history.items[0].tx_hash.has_value());
    EXPECT_TRUE(history.items[1].offer.has_value());
    EXPECT_EQ(history.degraded_lookups, 1u);
}

TEST_F(ReconcilerTest, LogStoreDownLeavesAllHashesEmpty) {
    OfferId id = create(100, 10, 30);
    buy(id, 1, buyer_);
    buy(id, 1, buyer_);

    FaultySource faulty(*source_);
    faulty.fail_logs = true;

    PurchaseReconciler reconciler(faulty);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), 2u);
    for (const auto& item : history.items) {
        EXPECT_FALSE(item.tx_hash.has_value());
        EXPECT_TRUE(item.offer.has_value());
    }
    EXPECT_EQ(history.degraded_lookups, 1u);
}

TEST_F(ReconcilerTest, IdListFailureIsFatal) {
    FaultySource faulty(*source_);
    faulty.fail_id_list = true;

    PurchaseReconciler reconciler(faulty);
    EXPECT_THROW(reconciler.reconcile(buyer_), ReconciliationError);
}

TEST_F(ReconcilerTest, ForeignLookupErrorDegradesOneRecord) {
    OfferId id = create(100, 10, 30);
    buy(id, 1, buyer_);
    buy(id, 2, buyer_);
    buy(id, 3, buyer_);

    FaultySource faulty(*source_);
    faulty.foreign_purchase_errors = {2};

    PurchaseReconciler reconciler(faulty);
    PurchaseHistory history;
    ASSERT_NO_THROW(history = reconciler.reconcile(buyer_));

    ASSERT_EQ(history.items.size(), 2u);
    EXPECT_EQ(history.items[0].id, 1u);
    EXPECT_EQ(history.items[1].id, 3u);
    EXPECT_EQ(*history.items[1].tx_hash, buys_[2].tx_hash);
    EXPECT_EQ(history.degraded_lookups, 1u);
}

TEST_F(ReconcilerTest, ForeignIdListErrorReportedAsReconciliationError) {
    FaultySource faulty(*source_);
    faulty.foreign_id_list_error = true;

    PurchaseReconciler reconciler(faulty);
    EXPECT_THROW(reconciler.reconcile(buyer_), ReconciliationError);
}

TEST_F(ReconcilerTest, LogsBeforeDeployBlockIgnored) {
    OfferId id = create(100, 10, 30);
    buy(id, 1, buyer_);
    buy(id, 1, buyer_);

    IndexerConfig config;
    config.deploy_block = buys_[1].block;

    PurchaseReconciler reconciler(*source_, config);
    PurchaseHistory history = reconciler.reconcile(buyer_);

    ASSERT_EQ(history.items.size(), 2u);
    EXPECT_FALSE(history.items[0].tx_hash.has_value());
    EXPECT_EQ(*history.items[1].tx_hash, buys_[1].tx_hash);
}

TEST_F(ReconcilerTest, ResultIndependentOfParallelism) {
    OfferId a = create(100, 50, 30);
    OfferId b = create(100, 50, 30);
    for (int i = 0; i < 20; ++i) {
        buy(i % 3 == 0 ? a : b, 1 + i % 4, buyer_);
    }

    IndexerConfig serial;
    serial.max_parallel_fetches = 1;
    IndexerConfig wide;
    wide.max_parallel_fetches = 16;

    PurchaseHistory h1 = PurchaseReconciler(*source_, serial).reconcile(buyer_);
    PurchaseHistory h2 = PurchaseReconciler(*source_, wide).reconcile(buyer_);

    ASSERT_EQ(h1.items.size(), 20u);
    ASSERT_EQ(h2.items.size(), 20u);
    for (size_t i = 0; i < 20; ++i) {
        EXPECT_EQ(h1.items[i].id, h2.items[i].id);
        EXPECT_EQ(h1.items[i].tx_hash, h2.items[i].tx_hash);
        EXPECT_EQ(*h1.items[i].tx_hash, buys_[i].tx_hash);
    }
}
