#include <benchmark/benchmark.h>
#include "veilmarket/chain/funds.hpp"
#include "veilmarket/core/log.hpp"
#include "veilmarket/crypto/coprocessor.hpp"
#include "veilmarket/indexer/chain_data_source.hpp"
#include "veilmarket/indexer/purchase_reconciler.hpp"
#include "veilmarket/ledger/offer_ledger.hpp"
#include <memory>

using namespace veilmarket;
using namespace veilmarket::ledger;

namespace {

Address tagged(uint8_t tag) {
    Address a{};
    a[19] = tag;
    return a;
}

/// Ledger with one creator and one well-funded buyer
struct Market {
    crypto::Coprocessor coprocessor;
    chain::FundsBook funds;
    std::unique_ptr<OfferLedger> ledger;
    BlockNumber block = 1;
    Timestamp now = 1'700'000'000;

    Market() : coprocessor(seeded()) {
        MarketConfig config;
        config.address = tagged(0x10);
        config.owner = tagged(0x01);
        config.treasury = tagged(0x02);
        ledger = std::make_unique<OfferLedger>(config, coprocessor, funds);
        funds.mint(tagged(0xB1), UINT64_MAX / 2);
    }

    static CoprocessorConfig seeded() {
        CoprocessorConfig config;
        config.key_seed = {'b', 'e', 'n', 'c', 'h'};
        return config;
    }

    CallContext next(const Address& sender, Amount value = 0) {
        CallContext ctx;
        ctx.sender = sender;
        ctx.value = value;
        ctx.block = ++block;
        now += 12;
        ctx.now = now;
        ctx.tx_hash[24] = static_cast<uint8_t>(block >> 8);
        ctx.tx_hash[31] = static_cast<uint8_t>(block);
        return ctx;
    }

    OfferId create(uint64_t slots) {
        OfferTerms terms{"Bench offer", "Throughput", 100, 30, slots};
        return ledger->create_offer(next(tagged(0xA1)), terms);
    }
};

} // anonymous namespace

// ============================================================================
// Ledger Benchmarks
// ============================================================================

static void BM_CreateOffer(benchmark::State& state) {
    log::set_threshold(log::Level::Off);
    Market market;

    for (auto _ : state) {
        OfferId id = market.create(10);
        benchmark::DoNotOptimize(id);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_CreateOffer);

static void BM_PurchaseOffer(benchmark::State& state) {
    log::set_threshold(log::Level::Off);
    Market market;
    OfferId id = market.create(UINT32_MAX);

    for (auto _ : state) {
        PurchaseId pid = market.ledger->purchase_offer(market.next(tagged(0xB1), 100), id, 1);
        benchmark::DoNotOptimize(pid);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PurchaseOffer);

static void BM_ExhaustFromLargeActiveSet(benchmark::State& state) {
    log::set_threshold(log::Level::Off);
    Market market;
    const size_t active = static_cast<size_t>(state.range(0));
    for (size_t i = 0; i < active; ++i) {
        market.create(1);
    }

    OfferId next_id = 1;
    OfferId last_created = active;
    for (auto _ : state) {
        if (next_id > last_created) {
            state.PauseTiming();
            for (size_t i = 0; i < active; ++i) {
                market.create(1);
            }
            last_created += active;
            state.ResumeTiming();
        }
        market.ledger->purchase_offer(market.next(tagged(0xB1), 100), next_id++, 1);
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ExhaustFromLargeActiveSet)->Arg(100)->Arg(10'000);

// ============================================================================
// Reconciliation Benchmarks
// ============================================================================

static void BM_ReconcileHistory(benchmark::State& state) {
    log::set_threshold(log::Level::Off);
    Market market;
    const size_t purchases = static_cast<size_t>(state.range(0));
    OfferId id = market.create(UINT32_MAX);
    for (size_t i = 0; i < purchases; ++i) {
        market.ledger->purchase_offer(market.next(tagged(0xB1), 100), id, 1);
    }

    indexer::LedgerDataSource source(*market.ledger);
    indexer::PurchaseReconciler reconciler(source);

    for (auto _ : state) {
        auto history = reconciler.reconcile(tagged(0xB1));
        benchmark::DoNotOptimize(history);
    }

    state.SetItemsProcessed(state.iterations() * purchases);
}
BENCHMARK(BM_ReconcileHistory)->Arg(10)->Arg(200);

BENCHMARK_MAIN();
