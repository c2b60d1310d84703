#pragma once

#include <gtest/gtest.h>
#include "veilmarket/chain/funds.hpp"
#include "veilmarket/core/log.hpp"
#include "veilmarket/crypto/coprocessor.hpp"
#include "veilmarket/crypto/encrypted_input.hpp"
#include "veilmarket/ledger/offer_ledger.hpp"
#include <memory>

namespace veilmarket::test {

/// Address whose last byte is `tag`
inline Address make_address(uint8_t tag) {
    Address a{};
    a[19] = tag;
    return a;
}

inline TxHash make_tx(uint64_t n) {
    TxHash h{};
    for (int i = 0; i < 8; ++i) {
        h[31 - i] = static_cast<uint8_t>(n >> (8 * i));
    }
    return h;
}

/// Coprocessor + funds + ledger with fixed actors and a simple block clock
class MarketTest : public ::testing::Test {
protected:
    const Address ledger_addr_ = make_address(0x10);
    const Address owner_ = make_address(0x01);
    const Address treasury_ = make_address(0x02);
    const Address creator_ = make_address(0xA1);
    const Address buyer_ = make_address(0xB1);
    const Address other_buyer_ = make_address(0xB2);

    static constexpr Timestamp kGenesisTime = 1'700'000'000;
    static constexpr Amount kStartingBalance = 1'000'000'000;

    std::unique_ptr<crypto::Coprocessor> coprocessor_;
    std::unique_ptr<chain::FundsBook> funds_;
    std::unique_ptr<ledger::OfferLedger> ledger_;

    BlockNumber block_ = 100;
    Timestamp now_ = kGenesisTime;
    uint64_t tx_counter_ = 0;

    void SetUp() override {
        log::set_threshold(log::Level::Off);

        CoprocessorConfig cp_config;
        cp_config.key_seed = {'t', 'e', 's', 't'};
        coprocessor_ = std::make_unique<crypto::Coprocessor>(cp_config);
        funds_ = std::make_unique<chain::FundsBook>();

        funds_->mint(buyer_, kStartingBalance);
        funds_->mint(other_buyer_, kStartingBalance);

        ledger_ = std::make_unique<ledger::OfferLedger>(market_config(), *coprocessor_, *funds_);
    }

    virtual MarketConfig market_config() const {
        MarketConfig config;
        config.address = ledger_addr_;
        config.owner = owner_;
        config.treasury = treasury_;
        config.fee_bps = 500;
        return config;
    }

    /// Context for a transaction mined in the next block
    CallContext call(const Address& sender, Amount value = 0) {
        CallContext ctx;
        ctx.sender = sender;
        ctx.value = value;
        ctx.block = ++block_;
        now_ += 12;
        ctx.now = now_;
        ctx.tx_hash = make_tx(++tx_counter_);
        return ctx;
    }

    /// Context for another transaction in the current block
    CallContext call_same_block(const Address& sender, Amount value = 0) {
        CallContext ctx;
        ctx.sender = sender;
        ctx.value = value;
        ctx.block = block_;
        ctx.now = now_;
        ctx.tx_hash = make_tx(++tx_counter_);
        return ctx;
    }

    static ledger::OfferTerms terms(Amount price = 100, uint64_t slots = 5, uint64_t days = 30) {
        ledger::OfferTerms t;
        t.title = "Design review";
        t.description = "One hour of feedback";
        t.public_price = price;
        t.duration_days = days;
        t.slots = slots;
        return t;
    }

    OfferId create(Amount price = 100, uint64_t slots = 5, uint64_t days = 30) {
        return ledger_->create_offer(call(creator_), terms(price, slots, days));
    }
};

} // namespace veilmarket::test
