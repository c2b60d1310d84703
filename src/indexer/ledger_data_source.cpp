#include "veilmarket/indexer/chain_data_source.hpp"

namespace veilmarket::indexer {

std::vector<PurchaseId> LedgerDataSource::purchase_ids_of(const Address& buyer) const {
    return ledger_.purchases_by_buyer(buyer);
}

ledger::Purchase LedgerDataSource::purchase(PurchaseId id) const {
    auto record = ledger_.purchase(id);
    if (!record) {
        throw ReconciliationError("Purchase " + std::to_string(id) + " not found");
    }
    return *record;
}

ledger::Offer LedgerDataSource::offer(OfferId id) const {
    auto record = ledger_.offer(id);
    if (!record) {
        throw ReconciliationError("Offer " + std::to_string(id) + " not found");
    }
    return *record;
}

std::vector<chain::LogRecord> LedgerDataSource::logs(const chain::LogFilter& filter) const {
    return ledger_.events().query(filter);
}

Timestamp LedgerDataSource::block_timestamp(BlockNumber block) const {
    auto ts = ledger_.events().block_timestamp(block);
    if (!ts) {
        throw ReconciliationError("No timestamp for block " + std::to_string(block));
    }
    return *ts;
}

} // namespace veilmarket::indexer
