#include "veilmarket/indexer/purchase_reconciler.hpp"
#include "veilmarket/chain/abi.hpp"
#include "veilmarket/core/log.hpp"
#include <algorithm>
#include <deque>
#include <future>
#include <map>
#include <set>
#include <system_error>
#include <type_traits>

namespace veilmarket::indexer {

namespace {

/// Run fn over every input on std::async tasks, at most `width` in flight.
/// A lookup that throws leaves its slot empty and bumps `failures`. If no
/// thread can be started the lookup runs on the calling thread
template<typename In, typename Fn>
auto fetch_all(const std::vector<In>& inputs, size_t width, size_t& failures,
               const char* what, Fn fn)
    -> std::vector<std::optional<std::invoke_result_t<Fn&, const In&>>> {

    using Out = std::invoke_result_t<Fn&, const In&>;
    std::vector<std::optional<Out>> results(inputs.size());
    width = std::max<size_t>(width, 1);

    for (size_t begin = 0; begin < inputs.size(); begin += width) {
        size_t end = std::min(inputs.size(), begin + width);

        std::vector<std::future<Out>> futures;
        futures.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            auto task = [&fn, &inputs, i] { return fn(inputs[i]); };
            try {
                futures.push_back(std::async(std::launch::async, task));
            } catch (const std::system_error& e) {
                log::Line(log::Level::Debug, "Reconciler")
                    << "Thread start failed (" << e.what() << "), fetching inline";
                futures.push_back(std::async(std::launch::deferred, task));
            }
        }

        for (size_t i = begin; i < end; ++i) {
            try {
                results[i] = futures[i - begin].get();
            } catch (const std::exception& e) {
                ++failures;
                log::Line(log::Level::Warn, "Reconciler")
                    << what << " " << inputs[i] << " failed: " << e.what();
            }
        }
    }
    return results;
}

} // anonymous namespace

PurchaseReconciler::PurchaseReconciler(const ChainDataSource& source, IndexerConfig config)
    : source_(source), config_(config) {}

PurchaseHistory PurchaseReconciler::reconcile(const Address& buyer) const {
    PurchaseHistory history;
    size_t& degraded = history.degraded_lookups;

    // ------------------------------------------------------------------
    // Stage 1: purchase records
    // ------------------------------------------------------------------

    // Without the id list there is nothing to degrade to
    std::vector<PurchaseId> ids;
    try {
        ids = source_.purchase_ids_of(buyer);
    } catch (const VeilMarketError&) {
        throw;
    } catch (const std::exception& e) {
        throw ReconciliationError(std::string("Purchase id lookup failed: ") + e.what());
    }
    std::sort(ids.begin(), ids.end());
    ids.erase(std::unique(ids.begin(), ids.end()), ids.end());

    auto purchases = fetch_all(ids, config_.max_parallel_fetches, degraded, "Purchase",
        [this](PurchaseId id) { return source_.purchase(id); });

    std::vector<ledger::Purchase> resolved;
    resolved.reserve(ids.size());
    for (auto& p : purchases) {
        if (p) {
            resolved.push_back(std::move(*p));
        }
    }

    // ------------------------------------------------------------------
    // Stage 2: referenced offers
    // ------------------------------------------------------------------

    std::set<OfferId> distinct_offers;
    for (const auto& p : resolved) {
        distinct_offers.insert(p.offer_id);
    }
    std::vector<OfferId> offer_ids(distinct_offers.begin(), distinct_offers.end());

    auto offers = fetch_all(offer_ids, config_.max_parallel_fetches, degraded, "Offer",
        [this](OfferId id) { return source_.offer(id); });

    std::map<OfferId, ledger::Offer> offer_by_id;
    for (size_t i = 0; i < offer_ids.size(); ++i) {
        if (offers[i]) {
            offer_by_id.emplace(offer_ids[i], std::move(*offers[i]));
        }
    }

    // ------------------------------------------------------------------
    // Stage 3: purchase logs keyed by (offer, slots, total, block time)
    // ------------------------------------------------------------------

    std::map<CorrelationKey, std::deque<TxHash>> log_hashes;

    std::vector<chain::LogRecord> records;
    bool logs_available = true;
    try {
        chain::LogFilter filter;
        filter.emitter = source_.ledger_address();
        filter.topic0 = chain::topics::offer_purchased();
        filter.topic2 = chain::address_word(buyer);
        filter.from_block = config_.deploy_block;
        records = source_.logs(filter);
    } catch (const std::exception& e) {
        logs_available = false;
        ++degraded;
        log::Line(log::Level::Warn, "Reconciler")
            << "Log query for " << to_hex(buyer) << " failed: " << e.what();
    }

    if (logs_available) {
        std::sort(records.begin(), records.end(),
                  [](const chain::LogRecord& a, const chain::LogRecord& b) {
                      if (a.block_number != b.block_number) return a.block_number < b.block_number;
                      return a.log_index < b.log_index;
                  });

        std::set<BlockNumber> distinct_blocks;
        for (const auto& r : records) {
            distinct_blocks.insert(r.block_number);
        }
        std::vector<BlockNumber> blocks(distinct_blocks.begin(), distinct_blocks.end());

        auto times = fetch_all(blocks, config_.max_parallel_fetches, degraded, "Block",
            [this](BlockNumber block) { return source_.block_timestamp(block); });

        std::map<BlockNumber, Timestamp> time_of;
        for (size_t i = 0; i < blocks.size(); ++i) {
            if (times[i]) {
                time_of[blocks[i]] = *times[i];
            }
        }

        for (const auto& r : records) {
            auto ts = time_of.find(r.block_number);
            if (ts == time_of.end()) {
                // Already counted when the timestamp fetch failed
                continue;
            }

            try {
                chain::OfferPurchased event = chain::decode_offer_purchased(r.log);
                CorrelationKey key{event.offer_id, event.slots, event.total_price, ts->second};
                log_hashes[key].push_back(r.tx_hash);
            } catch (const ReconciliationError& e) {
                ++degraded;
                log::Line(log::Level::Warn, "Reconciler")
                    << "Skipping log " << r.log_index << " of block " << r.block_number
                    << ": " << e.what();
            }
        }
    }

    // ------------------------------------------------------------------
    // Stage 4: match in purchase-id order, each log used once
    // ------------------------------------------------------------------

    history.items.reserve(resolved.size());
    for (auto& p : resolved) {
        PurchaseHistoryItem item;
        item.id = p.id;

        auto offer_it = offer_by_id.find(p.offer_id);
        if (offer_it != offer_by_id.end()) {
            item.offer = offer_it->second;
        }

        CorrelationKey key{p.offer_id, p.slots, p.total_price, p.timestamp};
        auto hash_it = log_hashes.find(key);
        if (hash_it != log_hashes.end() && !hash_it->second.empty()) {
            item.tx_hash = hash_it->second.front();
            hash_it->second.pop_front();
        }

        item.purchase = std::move(p);
        history.items.push_back(std::move(item));
    }

    log::Line(log::Level::Info, "Reconciler")
        << "Reconciled " << history.items.size() << " purchase(s) for " << to_hex(buyer)
        << " (" << history.degraded_lookups << " degraded)";
    return history;
}

} // namespace veilmarket::indexer
