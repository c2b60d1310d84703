#include "veilmarket/ledger/offer_ledger.hpp"
#include "veilmarket/chain/abi.hpp"
#include "veilmarket/core/log.hpp"

namespace veilmarket::ledger {

// ============================================================================
// Reveal Request
// ============================================================================

std::vector<Handle> OfferLedger::reveal_handles(const Offer& offer) {
    return {offer.encrypted.price, offer.encrypted.slots};
}

std::vector<Handle> OfferLedger::request_reveal(const CallContext& ctx, OfferId offer_id) {
    ReentrancyGuard::Scope scope(guard_);

    Offer& offer = offer_ref(offer_id);
    require_creator_or_owner(ctx, offer, "reveal");
    if (offer.reveal_state == RevealState::Resolved) {
        throw ValidationError("Offer " + std::to_string(offer_id) + " is already revealed");
    }

    std::vector<Handle> handles = reveal_handles(offer);
    for (const auto& handle : handles) {
        coprocessor_.make_publicly_decryptable(handle, address_);
    }

    // A repeat from Declassified re-announces the same list
    bool repeat = offer.reveal_state == RevealState::Declassified;
    offer.reveal_state = RevealState::Declassified;

    emit(ctx, chain::RevealRequested{offer_id, handles});
    log::Line(log::Level::Info, "Reveal")
        << (repeat ? "Re-requested" : "Requested") << " reveal of offer " << offer_id;
    return handles;
}

// ============================================================================
// Callback Verification
// ============================================================================

void OfferLedger::resolve_callback(
    const CallContext& ctx,
    OfferId offer_id,
    std::span<const uint8_t> cleartexts,
    std::span<const uint8_t> decryption_proof
) {
    ReentrancyGuard::Scope scope(guard_);

    Offer& offer = offer_ref(offer_id);
    if (offer.reveal_state != RevealState::Declassified) {
        throw ValidationError("Offer " + std::to_string(offer_id) + " has no pending reveal");
    }

    // Handle list comes from state, never from the caller
    std::vector<Handle> handles = reveal_handles(offer);
    if (!coprocessor_.verify_decryption(handles, cleartexts, decryption_proof)) {
        log::Line(log::Level::Debug, "Reveal")
            << "Rejected callback for offer " << offer_id << " from " << to_hex(ctx.sender);
        throw ProofVerificationError("Decryption proof does not match offer " +
                                     std::to_string(offer_id) + " handles");
    }

    std::vector<uint64_t> values;
    try {
        values = crypto::decode_cleartexts(cleartexts, handles.size());
    } catch (const chain::DecodeError& e) {
        throw ProofVerificationError(std::string("Signed cleartext is malformed: ") + e.what());
    }

    offer.revealed_price = values[0];
    offer.revealed_slots = values[1];
    offer.reveal_state = RevealState::Resolved;

    emit(ctx, chain::RevealResolved{offer_id, values[0], values[1]});
    log::Line(log::Level::Info, "Reveal")
        << "Offer " << offer_id << " resolved: price " << values[0] << ", slots " << values[1];
}

} // namespace veilmarket::ledger
