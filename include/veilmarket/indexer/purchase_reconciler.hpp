#pragma once

#include "veilmarket/core/types.hpp"
#include "veilmarket/indexer/chain_data_source.hpp"
#include <optional>
#include <vector>

namespace veilmarket::indexer {

// ============================================================================
// Purchase History
// ============================================================================

struct PurchaseHistoryItem {
    PurchaseId id = 0;
    ledger::Purchase purchase;
    std::optional<ledger::Offer> offer;     ///< Empty if the offer lookup failed
    std::optional<TxHash> tx_hash;          ///< Empty if no log matched
};

struct PurchaseHistory {
    std::vector<PurchaseHistoryItem> items;   ///< Ordered by purchase id
    size_t degraded_lookups = 0;              ///< Failed fetches/decodes absorbed
};

/// Composite key used to pair a Purchase record with its OfferPurchased log.
/// Two purchases with identical fields in the same block are
/// indistinguishable; each log is handed out once, in log order.
struct CorrelationKey {
    OfferId offer_id = 0;
    uint64_t slots = 0;
    Amount total_price = 0;
    Timestamp timestamp = 0;

    bool operator<(const CorrelationKey& other) const {
        if (offer_id != other.offer_id) return offer_id < other.offer_id;
        if (slots != other.slots) return slots < other.slots;
        if (total_price != other.total_price) return total_price < other.total_price;
        return timestamp < other.timestamp;
    }
};

// ============================================================================
// Purchase Reconciler
// ============================================================================

/// Rebuilds a buyer's purchase history from ledger reads and event logs.
///
/// Stages (each stage's lookups run concurrently, at most
/// max_parallel_fetches at a time):
///   1. purchase ids of the buyer, then each Purchase record
///   2. each distinct Offer referenced
///   3. OfferPurchased logs for the buyer from deploy_block, and the
///      timestamp of each distinct block
///   4. key matching, transaction hash attached on a match
///
/// Only the id-list fetch is fatal (ReconciliationError). Any other failed
/// lookup degrades its own record.
class PurchaseReconciler {
private:
    const ChainDataSource& source_;
    IndexerConfig config_;

public:
    explicit PurchaseReconciler(const ChainDataSource& source, IndexerConfig config = {});

    PurchaseHistory reconcile(const Address& buyer) const;

    const IndexerConfig& config() const { return config_; }
};

} // namespace veilmarket::indexer
