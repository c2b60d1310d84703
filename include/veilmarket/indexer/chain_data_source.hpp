#pragma once

#include "veilmarket/core/types.hpp"
#include "veilmarket/chain/events.hpp"
#include "veilmarket/ledger/offer_ledger.hpp"
#include <vector>

namespace veilmarket::indexer {

// ============================================================================
// Chain Data Source Interface
// ============================================================================

/// Read-only view of ledger state and the event log, as an RPC endpoint
/// would expose it.
///
/// Implementations must allow concurrent calls. Every method throws
/// ReconciliationError when the data is unavailable.
class ChainDataSource {
public:
    virtual ~ChainDataSource() = default;

    /// Address of the ledger whose logs are queried
    virtual Address ledger_address() const = 0;

    virtual std::vector<PurchaseId> purchase_ids_of(const Address& buyer) const = 0;
    virtual ledger::Purchase purchase(PurchaseId id) const = 0;
    virtual ledger::Offer offer(OfferId id) const = 0;

    /// Matching records in (block, log_index) order
    virtual std::vector<chain::LogRecord> logs(const chain::LogFilter& filter) const = 0;

    virtual Timestamp block_timestamp(BlockNumber block) const = 0;
};

// ============================================================================
// In-Process Adapter
// ============================================================================

/// Serves a live OfferLedger. Reads are safe while no mutation runs;
/// callers must not reconcile concurrently with ledger writes.
class LedgerDataSource : public ChainDataSource {
private:
    const ledger::OfferLedger& ledger_;

public:
    explicit LedgerDataSource(const ledger::OfferLedger& ledger) : ledger_(ledger) {}

    Address ledger_address() const override { return ledger_.address(); }

    std::vector<PurchaseId> purchase_ids_of(const Address& buyer) const override;
    ledger::Purchase purchase(PurchaseId id) const override;
    ledger::Offer offer(OfferId id) const override;
    std::vector<chain::LogRecord> logs(const chain::LogFilter& filter) const override;
    Timestamp block_timestamp(BlockNumber block) const override;
};

} // namespace veilmarket::indexer
