#pragma once

#include "veilmarket/core/types.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace veilmarket::chain {

// ============================================================================
// Raw Log Format
// ============================================================================

/// Topic 0 = event signature hash, topics 1..3 = indexed fields,
/// data = remaining fields as 32-byte words
struct RawLog {
    std::vector<Bytes32> topics;
    std::vector<uint8_t> data;
};

/// A log as stored by the chain, with its provenance
struct LogRecord {
    BlockNumber block_number = 0;
    TxHash tx_hash{};
    uint32_t log_index = 0;   ///< Position within its block
    Address emitter{};
    RawLog log;
};

// ============================================================================
// Ledger Events
// ============================================================================

struct OfferCreated {
    OfferId offer_id;          ///< indexed
    Address creator;           ///< indexed
    std::string title;
    Amount public_price;
    uint64_t duration;
    uint64_t slots;
};

struct OfferPurchased {
    OfferId offer_id;          ///< indexed
    Address buyer;             ///< indexed
    uint64_t slots;
    Amount total_price;
    uint64_t slots_left;
};

struct OfferDeactivated {
    OfferId offer_id;          ///< indexed
    Address by;                ///< indexed
};

/// Authoritative list of handles the upcoming cleartext must cover
struct RevealRequested {
    OfferId offer_id;          ///< indexed
    std::vector<Handle> handles;
};

struct RevealResolved {
    OfferId offer_id;          ///< indexed
    uint64_t price;
    uint64_t slots;
};

struct PlatformFeeUpdated {
    BasisPoints old_fee;
    BasisPoints new_fee;
};

struct TreasuryUpdated {
    Address old_treasury;      ///< indexed
    Address new_treasury;      ///< indexed
};

struct EmergencyWithdrawal {
    Address to;                ///< indexed
    Amount amount;
};

struct OwnershipTransferred {
    Address previous_owner;    ///< indexed
    Address new_owner;         ///< indexed
};

using LedgerEvent = std::variant<
    OfferCreated,
    OfferPurchased,
    OfferDeactivated,
    RevealRequested,
    RevealResolved,
    PlatformFeeUpdated,
    TreasuryUpdated,
    EmergencyWithdrawal,
    OwnershipTransferred
>;

/// Event signature hashes (topic 0)
namespace topics {
const Bytes32& offer_created();
const Bytes32& offer_purchased();
const Bytes32& offer_deactivated();
const Bytes32& reveal_requested();
const Bytes32& reveal_resolved();
const Bytes32& platform_fee_updated();
const Bytes32& treasury_updated();
const Bytes32& emergency_withdrawal();
const Bytes32& ownership_transferred();
} // namespace topics

/// Serialize an event into its raw log form
RawLog encode_event(const LedgerEvent& event);

/// Decoders throw ReconciliationError on a wrong topic or malformed data
OfferCreated decode_offer_created(const RawLog& log);
OfferPurchased decode_offer_purchased(const RawLog& log);
RevealRequested decode_reveal_requested(const RawLog& log);

// ============================================================================
// Event Log Store
// ============================================================================

struct LogFilter {
    std::optional<Address> emitter;
    std::optional<Bytes32> topic0;
    std::optional<Bytes32> topic1;
    std::optional<Bytes32> topic2;
    BlockNumber from_block = 0;
    std::optional<BlockNumber> to_block;   ///< Inclusive; empty = latest

    bool matches(const LogRecord& record) const;
};

/// Append-only log, plus the timestamps of blocks that emitted logs
class EventLog {
private:
    std::vector<LogRecord> records_;
    std::map<BlockNumber, Timestamp> block_times_;
    std::map<BlockNumber, uint32_t> next_log_index_;
    mutable std::mutex mutex_;

public:
    EventLog() = default;

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    /// Append a log emitted during ctx's transaction; returns its log index
    uint32_t append(const CallContext& ctx, const Address& emitter, RawLog log);

    /// Drop a log whose transaction was reverted. Returns false if absent
    bool retract(BlockNumber block, uint32_t log_index);

    /// Matching records in (block, log_index) order
    std::vector<LogRecord> query(const LogFilter& filter) const;

    std::optional<Timestamp> block_timestamp(BlockNumber block) const;

    size_t size() const;

    /// Last record in (block, log_index) order; throws std::out_of_range when empty
    LogRecord back() const;
};

} // namespace veilmarket::chain
