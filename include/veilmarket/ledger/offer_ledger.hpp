#pragma once

#include "veilmarket/core/types.hpp"
#include "veilmarket/chain/events.hpp"
#include "veilmarket/chain/funds.hpp"
#include "veilmarket/crypto/coprocessor.hpp"
#include "veilmarket/ledger/reentrancy_guard.hpp"
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace veilmarket::ledger {

// ============================================================================
// Records
// ============================================================================

/// Declassification progress of an offer's price/slots handles
enum class RevealState : uint8_t {
    Sealed,         ///< Handles private
    Declassified,   ///< Handles public, awaiting verified cleartext
    Resolved        ///< Verified cleartext written to revealed_* fields
};

/// Price, duration and slot handles, assigned once at creation
struct EncryptedOfferHandles {
    Handle price{};       ///< uint64
    Handle duration{};    ///< uint32
    Handle slots{};       ///< uint32
};

struct Offer {
    OfferId id = 0;
    Address creator{};
    std::string title;
    std::string description;
    Amount public_price = 0;
    uint64_t duration = 0;          ///< Days
    uint64_t slots = 0;             ///< Fixed at creation
    uint64_t available_slots = 0;   ///< <= slots
    bool is_active = false;
    Timestamp created_at = 0;
    Timestamp expires_at = 0;
    EncryptedOfferHandles encrypted;

    RevealState reveal_state = RevealState::Sealed;
    std::optional<uint64_t> revealed_price;
    std::optional<uint64_t> revealed_slots;
};

/// Immutable once recorded
struct Purchase {
    PurchaseId id = 0;
    OfferId offer_id = 0;
    Address buyer{};
    uint64_t slots = 0;
    Amount total_price = 0;
    Timestamp timestamp = 0;
};

struct ContractStats {
    uint64_t total_offers = 0;
    uint64_t total_purchases = 0;
    Amount total_volume = 0;
    uint64_t active_offers = 0;
};

/// Plain fields of a new offer
struct OfferTerms {
    std::string title;
    std::string description;
    Amount public_price = 0;
    uint64_t duration_days = 0;
    uint64_t slots = 0;
};

/// Handles from one EncryptedInput bundle (price, duration, slots order)
/// plus the bundle's shared proof
struct EncryptedOfferInput {
    Handle price{};
    Handle duration{};
    Handle slots{};
    std::vector<uint8_t> proof;
};

// ============================================================================
// Active Offer Set
// ============================================================================

/// Ids of purchasable offers; O(1) insert and swap-with-last erase.
/// Iteration order is not stable across erasures
class ActiveOfferSet {
private:
    std::vector<OfferId> ids_;
    std::unordered_map<OfferId, size_t> positions_;

public:
    void insert(OfferId id);

    /// Returns the position the id occupied (for restore)
    size_t erase(OfferId id);

    /// Undo an erase(): put `id` back at `position`
    void restore(OfferId id, size_t position);

    bool contains(OfferId id) const { return positions_.count(id) > 0; }
    size_t size() const { return ids_.size(); }
    const std::vector<OfferId>& ids() const { return ids_; }
};

// ============================================================================
// Offer Ledger
// ============================================================================

/// Authoritative state machine for offers and purchases.
///
/// Offers and purchases live in id-keyed arenas; the creator/buyer indices
/// and the active set hold ids only. Every mutating entry point runs under
/// a ReentrancyGuard scope. Errors are thrown before any mutation, except
/// for transfer failures, which revert the whole purchase.
class OfferLedger {
private:
    Address address_;
    Address owner_;
    Address treasury_;
    BasisPoints fee_bps_;

    crypto::Coprocessor& coprocessor_;
    chain::FundsBook& funds_;
    chain::EventLog events_;

    std::vector<Offer> offers_;          ///< offers_[id - 1]
    std::vector<Purchase> purchases_;    ///< purchases_[id - 1]
    std::unordered_map<Address, std::vector<OfferId>, ByteArrayHash> offers_by_creator_;
    std::unordered_map<Address, std::vector<PurchaseId>, ByteArrayHash> purchases_by_buyer_;
    ActiveOfferSet active_;
    ContractStats stats_;

    ReentrancyGuard guard_;

public:
    /// Throws ValidationError for a fee above kMaxFeeBps or null addresses
    OfferLedger(
        const MarketConfig& config,
        crypto::Coprocessor& coprocessor,
        chain::FundsBook& funds
    );

    OfferLedger(const OfferLedger&) = delete;
    OfferLedger& operator=(const OfferLedger&) = delete;

    // ------------------------------------------------------------------
    // Offer lifecycle
    // ------------------------------------------------------------------

    /// Plaintext variant; handles are trivial encryptions of the terms
    OfferId create_offer(const CallContext& ctx, const OfferTerms& terms);

    /// Handles imported from an encrypted bundle submitted by ctx.sender
    OfferId create_offer_encrypted(
        const CallContext& ctx,
        const OfferTerms& terms,
        const EncryptedOfferInput& input
    );

    /// Buy `quantity` slots paying ctx.value; returns the purchase id
    PurchaseId purchase_offer(const CallContext& ctx, OfferId offer_id, uint64_t quantity);

    /// Creator or owner; offer must still be active
    void deactivate_offer(const CallContext& ctx, OfferId offer_id);

    // ------------------------------------------------------------------
    // Reveal / callback
    // ------------------------------------------------------------------

    /// Creator or owner. Declassifies [price, slots] and emits
    /// RevealRequested carrying exactly that list, which is returned
    std::vector<Handle> request_reveal(const CallContext& ctx, OfferId offer_id);

    /// Verify cleartexts against the handle list rebuilt from current state;
    /// on success write revealed_price / revealed_slots
    void resolve_callback(
        const CallContext& ctx,
        OfferId offer_id,
        std::span<const uint8_t> cleartexts,
        std::span<const uint8_t> decryption_proof
    );

    // ------------------------------------------------------------------
    // Administration (owner only)
    // ------------------------------------------------------------------

    /// Wide argument so out-of-range values are rejected, not truncated
    void update_fee(const CallContext& ctx, uint64_t new_fee_bps);
    void update_treasury(const CallContext& ctx, const Address& new_treasury);

    /// Send the ledger's whole balance to the owner; returns the amount
    Amount emergency_withdraw(const CallContext& ctx);

    void transfer_ownership(const CallContext& ctx, const Address& new_owner);

    // ------------------------------------------------------------------
    // Views
    // ------------------------------------------------------------------

    // Offer and purchase views throw ReentrancyError while a mutating
    // call is in progress, e.g. from a receive hook mid-purchase

    std::optional<Offer> offer(OfferId id) const;
    std::optional<Purchase> purchase(PurchaseId id) const;
    std::vector<OfferId> active_offer_ids() const;
    std::vector<OfferId> offers_by_creator(const Address& creator) const;
    std::vector<PurchaseId> purchases_by_buyer(const Address& buyer) const;
    std::optional<EncryptedOfferHandles> encrypted_handles(OfferId id) const;
    ContractStats stats() const;

    BasisPoints platform_fee() const { return fee_bps_; }
    const Address& treasury() const { return treasury_; }
    const Address& owner() const { return owner_; }
    const Address& address() const { return address_; }
    Amount balance() const { return funds_.balance_of(address_); }

    const chain::EventLog& events() const { return events_; }

    /// fee = total * bps / 10000 without intermediate overflow
    static Amount compute_fee(Amount total, BasisPoints bps);

private:
    /// What a committed purchase changed, for reverting it
    struct PurchaseUndo {
        OfferId offer_id = 0;
        Address buyer{};
        uint64_t quantity = 0;
        Amount total = 0;
        std::optional<size_t> active_position;
    };

    void revert_purchase(const PurchaseUndo& undo);

    void require_settled() const;

    OfferId store_offer(
        const CallContext& ctx,
        const OfferTerms& terms,
        const EncryptedOfferHandles& handles
    );

    void validate_terms(const CallContext& ctx, const OfferTerms& terms) const;

    Offer& offer_ref(OfferId id);
    const Offer& offer_ref(OfferId id) const;

    void require_owner(const CallContext& ctx, const char* operation) const;
    void require_creator_or_owner(const CallContext& ctx, const Offer& offer,
                                  const char* operation) const;

    /// Returns the log index within ctx.block
    uint32_t emit(const CallContext& ctx, const chain::LedgerEvent& event);

    /// Handles declassified by request_reveal, rebuilt from offer state
    static std::vector<Handle> reveal_handles(const Offer& offer);
};

} // namespace veilmarket::ledger
