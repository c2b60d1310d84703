#include "veilmarket/ledger/offer_ledger.hpp"
#include "veilmarket/core/log.hpp"
#include <algorithm>

namespace veilmarket::ledger {

namespace {

bool mul_overflows(uint64_t a, uint64_t b, uint64_t& out) {
    return __builtin_mul_overflow(a, b, &out);
}

bool add_overflows(uint64_t a, uint64_t b, uint64_t& out) {
    return __builtin_add_overflow(a, b, &out);
}

} // anonymous namespace

// ============================================================================
// ActiveOfferSet
// ============================================================================

void ActiveOfferSet::insert(OfferId id) {
    if (contains(id)) {
        return;
    }
    positions_[id] = ids_.size();
    ids_.push_back(id);
}

size_t ActiveOfferSet::erase(OfferId id) {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        throw ValidationError("Offer " + std::to_string(id) + " is not in the active set");
    }

    size_t position = it->second;
    OfferId last = ids_.back();
    ids_[position] = last;
    positions_[last] = position;
    ids_.pop_back();
    positions_.erase(id);
    return position;
}

void ActiveOfferSet::restore(OfferId id, size_t position) {
    if (position > ids_.size()) {
        throw ValidationError("Restore position out of range");
    }

    // Inverse of the swap: whatever sits at `position` moves back to the end
    if (position == ids_.size()) {
        ids_.push_back(id);
    } else {
        OfferId displaced = ids_[position];
        ids_.push_back(displaced);
        positions_[displaced] = ids_.size() - 1;
        ids_[position] = id;
    }
    positions_[id] = position;
}

// ============================================================================
// Construction
// ============================================================================

OfferLedger::OfferLedger(
    const MarketConfig& config,
    crypto::Coprocessor& coprocessor,
    chain::FundsBook& funds
) : address_(config.address),
    owner_(config.owner),
    treasury_(config.treasury),
    fee_bps_(config.fee_bps),
    coprocessor_(coprocessor),
    funds_(funds) {

    if (is_zero(address_) || is_zero(owner_) || is_zero(treasury_)) {
        throw ValidationError("Ledger, owner and treasury addresses must be non-null");
    }
    if (fee_bps_ > kMaxFeeBps) {
        throw ValidationError("Platform fee " + std::to_string(fee_bps_) +
                              " bps exceeds maximum of " + std::to_string(kMaxFeeBps));
    }

    log::Line(log::Level::Info, "Ledger")
        << "Deployed at " << to_hex(address_) << ", owner " << to_hex(owner_)
        << ", fee " << fee_bps_ << " bps";
}

// ============================================================================
// Offer Creation
// ============================================================================

void OfferLedger::validate_terms(const CallContext& ctx, const OfferTerms& terms) const {
    if (ctx.value != 0) {
        throw ValidationError("Offer creation does not accept payment");
    }
    if (terms.title.empty()) {
        throw ValidationError("Title must not be empty");
    }
    if (terms.description.empty()) {
        throw ValidationError("Description must not be empty");
    }
    if (terms.public_price == 0) {
        throw ValidationError("Price must be positive");
    }
    if (terms.duration_days == 0) {
        throw ValidationError("Duration must be positive");
    }
    if (terms.slots == 0) {
        throw ValidationError("Slots must be positive");
    }

    // Duration and slots are also carried as 32-bit ciphertexts
    if (terms.duration_days > max_value(FheType::Uint32)) {
        throw ValidationError("Duration does not fit in 32 bits");
    }
    if (terms.slots > max_value(FheType::Uint32)) {
        throw ValidationError("Slots do not fit in 32 bits");
    }

    uint64_t lifetime = 0;
    uint64_t expires_at = 0;
    if (mul_overflows(terms.duration_days, kSecondsPerDay, lifetime) ||
        add_overflows(ctx.now, lifetime, expires_at)) {
        throw ValidationError("Offer expiry overflows");
    }
}

OfferId OfferLedger::create_offer(const CallContext& ctx, const OfferTerms& terms) {
    ReentrancyGuard::Scope scope(guard_);
    validate_terms(ctx, terms);

    EncryptedOfferHandles handles;
    handles.price = coprocessor_.trivial_encrypt(terms.public_price, FheType::Uint64);
    handles.duration = coprocessor_.trivial_encrypt(terms.duration_days, FheType::Uint32);
    handles.slots = coprocessor_.trivial_encrypt(terms.slots, FheType::Uint32);

    for (const Handle* h : {&handles.price, &handles.duration, &handles.slots}) {
        coprocessor_.allow(*h, address_);
        coprocessor_.allow(*h, ctx.sender);
    }

    return store_offer(ctx, terms, handles);
}

OfferId OfferLedger::create_offer_encrypted(
    const CallContext& ctx,
    const OfferTerms& terms,
    const EncryptedOfferInput& input
) {
    ReentrancyGuard::Scope scope(guard_);
    validate_terms(ctx, terms);

    // All three imports must verify before anything is granted or stored
    try {
        coprocessor_.verify_input(address_, ctx.sender, input.price, FheType::Uint64, input.proof);
        coprocessor_.verify_input(address_, ctx.sender, input.duration, FheType::Uint32, input.proof);
        coprocessor_.verify_input(address_, ctx.sender, input.slots, FheType::Uint32, input.proof);
    } catch (const ProofVerificationError& e) {
        log::Line(log::Level::Debug, "Ledger")
            << "Encrypted offer from " << to_hex(ctx.sender) << " rejected: " << e.what();
        throw;
    }

    EncryptedOfferHandles handles{input.price, input.duration, input.slots};
    for (const Handle* h : {&handles.price, &handles.duration, &handles.slots}) {
        coprocessor_.allow(*h, address_);
        coprocessor_.allow(*h, ctx.sender);
    }

    return store_offer(ctx, terms, handles);
}

OfferId OfferLedger::store_offer(
    const CallContext& ctx,
    const OfferTerms& terms,
    const EncryptedOfferHandles& handles
) {
    Offer offer;
    offer.id = offers_.size() + 1;
    offer.creator = ctx.sender;
    offer.title = terms.title;
    offer.description = terms.description;
    offer.public_price = terms.public_price;
    offer.duration = terms.duration_days;
    offer.slots = terms.slots;
    offer.available_slots = terms.slots;
    offer.is_active = true;
    offer.created_at = ctx.now;
    offer.expires_at = ctx.now + terms.duration_days * kSecondsPerDay;
    offer.encrypted = handles;

    OfferId id = offer.id;
    offers_.push_back(std::move(offer));
    offers_by_creator_[ctx.sender].push_back(id);
    active_.insert(id);
    stats_.total_offers++;
    stats_.active_offers++;

    emit(ctx, chain::OfferCreated{id, ctx.sender, terms.title, terms.public_price,
                                  terms.duration_days, terms.slots});

    log::Line(log::Level::Info, "Ledger")
        << "Offer " << id << " created by " << to_hex(ctx.sender)
        << " (" << terms.slots << " slots at " << terms.public_price << ")";
    return id;
}

// ============================================================================
// Purchase
// ============================================================================

Amount OfferLedger::compute_fee(Amount total, BasisPoints bps) {
    return (total / kBpsDenominator) * bps + (total % kBpsDenominator) * bps / kBpsDenominator;
}

PurchaseId OfferLedger::purchase_offer(const CallContext& ctx, OfferId offer_id, uint64_t quantity) {
    ReentrancyGuard::Scope scope(guard_);

    const Offer& current = offer_ref(offer_id);
    if (!current.is_active) {
        throw ValidationError("Offer " + std::to_string(offer_id) + " is not active");
    }
    if (quantity == 0 || quantity > current.available_slots) {
        throw ValidationError("Quantity " + std::to_string(quantity) + " outside 1.." +
                              std::to_string(current.available_slots));
    }
    if (ctx.now > current.expires_at) {
        throw ValidationError("Offer " + std::to_string(offer_id) + " has expired");
    }
    if (ctx.sender == current.creator) {
        throw ValidationError("Creator cannot purchase own offer");
    }

    Amount total = 0;
    Amount volume = 0;
    if (mul_overflows(current.public_price, quantity, total) ||
        add_overflows(stats_.total_volume, total, volume)) {
        throw ValidationError("Purchase total overflows");
    }
    if (ctx.value < total) {
        throw PaymentError("Insufficient payment: sent " + std::to_string(ctx.value) +
                           ", required " + std::to_string(total));
    }

    const Amount fee = compute_fee(total, fee_bps_);
    const Amount creator_amount = total - fee;
    const Amount refund = ctx.value - total;

    const chain::FundsBook::Checkpoint mark = funds_.checkpoint();

    if (!funds_.transfer(ctx.sender, address_, ctx.value)) {
        funds_.rollback(mark);
        throw PaymentError("Buyer " + to_hex(ctx.sender) + " cannot fund payment of " +
                           std::to_string(ctx.value));
    }

    // Effects
    PurchaseUndo undo;
    undo.offer_id = offer_id;
    undo.buyer = ctx.sender;
    undo.quantity = quantity;
    undo.total = total;

    const Address creator = current.creator;
    Offer& offer = offers_[offer_id - 1];
    offer.available_slots -= quantity;
    if (offer.available_slots == 0) {
        offer.is_active = false;
        undo.active_position = active_.erase(offer_id);
        stats_.active_offers--;
    }

    Purchase purchase;
    purchase.id = purchases_.size() + 1;
    purchase.offer_id = offer_id;
    purchase.buyer = ctx.sender;
    purchase.slots = quantity;
    purchase.total_price = total;
    purchase.timestamp = ctx.now;
    purchases_.push_back(purchase);
    purchases_by_buyer_[ctx.sender].push_back(purchase.id);
    stats_.total_purchases++;
    stats_.total_volume = volume;

    // Interactions
    const char* failed_leg = nullptr;
    if (!funds_.transfer(address_, treasury_, fee)) {
        failed_leg = "fee to treasury";
    } else if (!funds_.transfer(address_, creator, creator_amount)) {
        failed_leg = "payout to creator";
    } else if (!funds_.transfer(address_, ctx.sender, refund)) {
        failed_leg = "refund to buyer";
    }

    if (failed_leg != nullptr) {
        funds_.rollback(mark);
        revert_purchase(undo);

        log::Line(log::Level::Warn, "Ledger")
            << "Purchase of offer " << offer_id << " reverted: " << failed_leg << " failed";
        throw PaymentError(std::string("Transfer failed: ") + failed_leg);
    }

    funds_.release(mark);

    const uint32_t log_index = emit(ctx, chain::OfferPurchased{
        offer_id, ctx.sender, quantity, total, offers_[offer_id - 1].available_slots});

    // Committed inside an enclosing transfer (a hook of another contract):
    // revert with it if it rolls back
    const BlockNumber block = ctx.block;
    funds_.record_undo([this, undo, block, log_index] {
        revert_purchase(undo);
        events_.retract(block, log_index);
        log::Line(log::Level::Warn, "Ledger")
            << "Purchase of offer " << undo.offer_id << " reverted by enclosing rollback";
    });

    log::Line(log::Level::Info, "Ledger")
        << "Purchase " << purchase.id << ": " << quantity << " slot(s) of offer " << offer_id
        << " for " << total << " (fee " << fee << ")";
    return purchase.id;
}

void OfferLedger::revert_purchase(const PurchaseUndo& undo) {
    Offer& offer = offers_[undo.offer_id - 1];
    offer.available_slots += undo.quantity;
    if (undo.active_position) {
        offer.is_active = true;
        active_.restore(undo.offer_id, std::min(*undo.active_position, active_.size()));
        stats_.active_offers++;
    }

    purchases_.pop_back();
    auto& bought = purchases_by_buyer_[undo.buyer];
    bought.pop_back();
    if (bought.empty()) {
        purchases_by_buyer_.erase(undo.buyer);
    }
    stats_.total_purchases--;
    stats_.total_volume -= undo.total;
}

// ============================================================================
// Deactivation
// ============================================================================

void OfferLedger::deactivate_offer(const CallContext& ctx, OfferId offer_id) {
    ReentrancyGuard::Scope scope(guard_);

    Offer& offer = offer_ref(offer_id);
    require_creator_or_owner(ctx, offer, "deactivate");
    if (!offer.is_active) {
        throw ValidationError("Offer " + std::to_string(offer_id) + " is already inactive");
    }

    offer.is_active = false;
    active_.erase(offer_id);
    stats_.active_offers--;

    emit(ctx, chain::OfferDeactivated{offer_id, ctx.sender});
    log::Line(log::Level::Info, "Ledger")
        << "Offer " << offer_id << " deactivated by " << to_hex(ctx.sender);
}

// ============================================================================
// Administration
// ============================================================================

void OfferLedger::update_fee(const CallContext& ctx, uint64_t new_fee_bps) {
    ReentrancyGuard::Scope scope(guard_);
    require_owner(ctx, "update fee");
    if (new_fee_bps > kMaxFeeBps) {
        throw ValidationError("Platform fee " + std::to_string(new_fee_bps) +
                              " bps exceeds maximum of " + std::to_string(kMaxFeeBps));
    }

    BasisPoints old_fee = fee_bps_;
    fee_bps_ = static_cast<BasisPoints>(new_fee_bps);
    emit(ctx, chain::PlatformFeeUpdated{old_fee, fee_bps_});
    log::Line(log::Level::Info, "Ledger") << "Fee " << old_fee << " -> " << fee_bps_ << " bps";
}

void OfferLedger::update_treasury(const CallContext& ctx, const Address& new_treasury) {
    ReentrancyGuard::Scope scope(guard_);
    require_owner(ctx, "update treasury");
    if (is_zero(new_treasury)) {
        throw ValidationError("Treasury must be non-null");
    }

    Address old_treasury = treasury_;
    treasury_ = new_treasury;
    emit(ctx, chain::TreasuryUpdated{old_treasury, new_treasury});
    log::Line(log::Level::Info, "Ledger") << "Treasury now " << to_hex(new_treasury);
}

Amount OfferLedger::emergency_withdraw(const CallContext& ctx) {
    ReentrancyGuard::Scope scope(guard_);
    require_owner(ctx, "emergency withdraw");

    Amount amount = funds_.balance_of(address_);
    if (amount == 0) {
        throw ValidationError("No funds to withdraw");
    }

    chain::FundsBook::Checkpoint mark = funds_.checkpoint();
    if (!funds_.transfer(address_, owner_, amount)) {
        funds_.rollback(mark);
        throw PaymentError("Withdrawal to owner failed");
    }
    funds_.release(mark);

    const uint32_t log_index = emit(ctx, chain::EmergencyWithdrawal{owner_, amount});
    const BlockNumber block = ctx.block;
    funds_.record_undo([this, block, log_index] { events_.retract(block, log_index); });

    log::Line(log::Level::Warn, "Ledger")
        << "Emergency withdrawal of " << amount << " to " << to_hex(owner_);
    return amount;
}

void OfferLedger::transfer_ownership(const CallContext& ctx, const Address& new_owner) {
    ReentrancyGuard::Scope scope(guard_);
    require_owner(ctx, "transfer ownership");
    if (is_zero(new_owner)) {
        throw ValidationError("New owner must be non-null");
    }

    Address previous = owner_;
    owner_ = new_owner;
    emit(ctx, chain::OwnershipTransferred{previous, new_owner});
    log::Line(log::Level::Info, "Ledger")
        << "Ownership " << to_hex(previous) << " -> " << to_hex(new_owner);
}

// ============================================================================
// Views
// ============================================================================

void OfferLedger::require_settled() const {
    if (guard_.entered()) {
        throw ReentrancyError();
    }
}

std::optional<Offer> OfferLedger::offer(OfferId id) const {
    require_settled();
    if (id == 0 || id > offers_.size()) {
        return std::nullopt;
    }
    return offers_[id - 1];
}

std::optional<Purchase> OfferLedger::purchase(PurchaseId id) const {
    require_settled();
    if (id == 0 || id > purchases_.size()) {
        return std::nullopt;
    }
    return purchases_[id - 1];
}

std::vector<OfferId> OfferLedger::active_offer_ids() const {
    require_settled();
    return active_.ids();
}

std::vector<OfferId> OfferLedger::offers_by_creator(const Address& creator) const {
    require_settled();
    auto it = offers_by_creator_.find(creator);
    return it == offers_by_creator_.end() ? std::vector<OfferId>{} : it->second;
}

std::vector<PurchaseId> OfferLedger::purchases_by_buyer(const Address& buyer) const {
    require_settled();
    auto it = purchases_by_buyer_.find(buyer);
    return it == purchases_by_buyer_.end() ? std::vector<PurchaseId>{} : it->second;
}

std::optional<EncryptedOfferHandles> OfferLedger::encrypted_handles(OfferId id) const {
    require_settled();
    if (id == 0 || id > offers_.size()) {
        return std::nullopt;
    }
    return offers_[id - 1].encrypted;
}

ContractStats OfferLedger::stats() const {
    require_settled();
    return stats_;
}

// ============================================================================
// Helpers
// ============================================================================

Offer& OfferLedger::offer_ref(OfferId id) {
    if (id == 0 || id > offers_.size()) {
        throw ValidationError("Unknown offer " + std::to_string(id));
    }
    return offers_[id - 1];
}

const Offer& OfferLedger::offer_ref(OfferId id) const {
    if (id == 0 || id > offers_.size()) {
        throw ValidationError("Unknown offer " + std::to_string(id));
    }
    return offers_[id - 1];
}

void OfferLedger::require_owner(const CallContext& ctx, const char* operation) const {
    if (ctx.sender != owner_) {
        log::Line(log::Level::Debug, "Ledger")
            << to_hex(ctx.sender) << " not allowed to " << operation;
        throw AuthorizationError(std::string("Only the owner may ") + operation);
    }
}

void OfferLedger::require_creator_or_owner(
    const CallContext& ctx,
    const Offer& offer,
    const char* operation
) const {
    if (ctx.sender != offer.creator && ctx.sender != owner_) {
        log::Line(log::Level::Debug, "Ledger")
            << to_hex(ctx.sender) << " not allowed to " << operation << " offer " << offer.id;
        throw AuthorizationError(std::string("Only the creator or owner may ") + operation +
                                 " offer " + std::to_string(offer.id));
    }
}

uint32_t OfferLedger::emit(const CallContext& ctx, const chain::LedgerEvent& event) {
    return events_.append(ctx, address_, chain::encode_event(event));
}

} // namespace veilmarket::ledger
