/**
 * Marketplace Walkthrough
 * Encrypted offer creation, purchases, reveal round trip and history
 */

#include "veilmarket/chain/funds.hpp"
#include "veilmarket/core/log.hpp"
#include "veilmarket/crypto/coprocessor.hpp"
#include "veilmarket/crypto/encrypted_input.hpp"
#include "veilmarket/indexer/chain_data_source.hpp"
#include "veilmarket/indexer/purchase_reconciler.hpp"
#include "veilmarket/ledger/offer_ledger.hpp"
#include <iostream>
#include <string>

using namespace veilmarket;

void print_header(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n";
}

int main() {
    try {
        log::set_threshold(log::Level::Info);

        const Address ledger_addr = address_from_hex("0x00000000000000000000000000000000000000c0");
        const Address owner = address_from_hex("0x00000000000000000000000000000000000000a0");
        const Address treasury = address_from_hex("0x00000000000000000000000000000000000000a1");
        const Address creator = address_from_hex("0x00000000000000000000000000000000000000b0");
        const Address buyer = address_from_hex("0x00000000000000000000000000000000000000d0");

        crypto::Coprocessor coprocessor;
        chain::FundsBook funds;
        funds.mint(buyer, 10'000);

        MarketConfig config;
        config.address = ledger_addr;
        config.owner = owner;
        config.treasury = treasury;
        config.fee_bps = 500;
        ledger::OfferLedger market(config, coprocessor, funds);

        BlockNumber block = 1;
        Timestamp now = 1'700'000'000;
        auto next = [&](const Address& sender, Amount value) {
            CallContext ctx;
            ctx.sender = sender;
            ctx.value = value;
            ctx.block = ++block;
            now += 12;
            ctx.now = now;
            ctx.tx_hash[31] = static_cast<uint8_t>(block);
            return ctx;
        };

        print_header("Step 1: Encrypt offer terms");

        crypto::EncryptedInput input(coprocessor, ledger_addr, creator);
        input.add64(100).add32(30).add32(5);
        crypto::EncryptedBundle bundle = input.encrypt();

        std::cout << "Handles:\n";
        for (const auto& h : bundle.handles) {
            std::cout << "  " << to_hex(h) << "\n";
        }
        std::cout << "Proof: " << bundle.proof.size() << " bytes\n";

        print_header("Step 2: Create offer");

        ledger::OfferTerms terms{"Logo design", "Three concepts, two revisions", 100, 30, 5};
        OfferId offer_id = market.create_offer_encrypted(
            next(creator, 0), terms,
            ledger::EncryptedOfferInput{bundle.handles[0], bundle.handles[1],
                                        bundle.handles[2], bundle.proof});
        std::cout << "Offer #" << offer_id << " active, "
                  << market.offer(offer_id)->available_slots << " slots\n";

        print_header("Step 3: Purchases");

        market.purchase_offer(next(buyer, 200), offer_id, 2);
        market.purchase_offer(next(buyer, 350), offer_id, 3);

        std::cout << "Creator balance:  " << funds.balance_of(creator) << "\n";
        std::cout << "Treasury balance: " << funds.balance_of(treasury) << "\n";
        std::cout << "Buyer balance:    " << funds.balance_of(buyer) << "\n";
        std::cout << "Offer active:     " << std::boolalpha
                  << market.offer(offer_id)->is_active << "\n";

        print_header("Step 4: Reveal round trip");

        auto handles = market.request_reveal(next(creator, 0), offer_id);
        crypto::DecryptionResult result = coprocessor.public_decrypt(handles);
        market.resolve_callback(next(owner, 0), offer_id, result.cleartexts,
                                result.decryption_proof);

        auto offer = market.offer(offer_id);
        std::cout << "Revealed price: " << offer->revealed_price.value_or(0) << "\n";
        std::cout << "Revealed slots: " << offer->revealed_slots.value_or(0) << "\n";

        print_header("Step 5: Purchase history");

        indexer::LedgerDataSource source(market);
        indexer::PurchaseReconciler reconciler(source);
        indexer::PurchaseHistory history = reconciler.reconcile(buyer);

        for (const auto& item : history.items) {
            std::cout << "  Purchase #" << item.id << ": " << item.purchase.slots
                      << " slot(s) of \"" << (item.offer ? item.offer->title : "?") << "\" for "
                      << item.purchase.total_price << ", tx "
                      << (item.tx_hash ? to_hex(*item.tx_hash) : std::string("unknown")) << "\n";
        }

        const auto& stats = market.stats();
        print_header("Summary");
        std::cout << "Offers: " << stats.total_offers << ", purchases: " << stats.total_purchases
                  << ", volume: " << stats.total_volume << ", active: " << stats.active_offers
                  << "\n";

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
