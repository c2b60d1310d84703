#include "veilmarket/chain/funds.hpp"
#include "veilmarket/core/log.hpp"
#include <exception>
#include <stdexcept>

namespace veilmarket::chain {

void FundsBook::mint(const Address& account, Amount amount) {
    Amount& balance = balances_[account];
    if (balance > UINT64_MAX - amount) {
        throw ValidationError("Balance overflow for " + to_hex(account));
    }
    balance += amount;
}

Amount FundsBook::balance_of(const Address& account) const {
    auto it = balances_.find(account);
    return it == balances_.end() ? 0 : it->second;
}

void FundsBook::set_receive_hook(const Address& account, ReceiveHook hook) {
    hooks_[account] = std::move(hook);
}

void FundsBook::clear_receive_hook(const Address& account) {
    hooks_.erase(account);
}

bool FundsBook::transfer(const Address& from, const Address& to, Amount amount) {
    if (amount == 0) {
        return true;
    }

    Amount& source = balances_[from];
    if (source < amount) {
        log::Line(log::Level::Debug, "Funds")
            << "Insufficient balance in " << to_hex(from) << ": has " << source
            << ", needs " << amount;
        return false;
    }

    Amount& target = balances_[to];
    if (target > UINT64_MAX - amount) {
        log::Line(log::Level::Warn, "Funds") << "Balance overflow for " << to_hex(to);
        return false;
    }

    Checkpoint mark = checkpoint();
    source -= amount;
    target += amount;
    journal_.push_back(Leg{from, to, amount, {}});

    auto hook_it = hooks_.find(to);
    if (hook_it == hooks_.end()) {
        release(mark);
        return true;
    }

    // Hook may register hooks or transfer again; keep a copy
    ReceiveHook hook = hook_it->second;
    bool accepted = false;
    try {
        accepted = hook(from, amount);
    } catch (const std::exception& e) {
        log::Line(log::Level::Warn, "Funds")
            << "Receive hook of " << to_hex(to) << " threw: " << e.what();
        accepted = false;
    }

    if (!accepted) {
        rollback(mark);
        return false;
    }
    release(mark);
    return true;
}

FundsBook::Checkpoint FundsBook::checkpoint() {
    ++open_checkpoints_;
    return journal_.size();
}

void FundsBook::rollback(Checkpoint mark) {
    revert_to(mark);
    close_checkpoint(mark);
}

void FundsBook::release(Checkpoint mark) {
    close_checkpoint(mark);
}

void FundsBook::record_undo(std::function<void()> undo) {
    if (open_checkpoints_ == 0) {
        return;
    }
    journal_.push_back(Leg{Address{}, Address{}, 0, std::move(undo)});
}

void FundsBook::revert_to(Checkpoint mark) {
    while (journal_.size() > mark) {
        Leg leg = std::move(journal_.back());
        journal_.pop_back();

        if (leg.undo) {
            try {
                leg.undo();
            } catch (const std::exception& e) {
                log::Line(log::Level::Error, "Funds") << "Undo action failed: " << e.what();
            }
            continue;
        }

        Amount& target = balances_[leg.to];
        Amount& source = balances_[leg.from];
        if (target < leg.amount) {
            // Only possible if a leg escaped the journal while a checkpoint was open
            log::Line(log::Level::Error, "Funds")
                << "Rollback of " << leg.amount << " from " << to_hex(leg.to)
                << " exceeds its balance of " << target;
            source += target;
            target = 0;
            continue;
        }
        target -= leg.amount;
        source += leg.amount;
    }
}

void FundsBook::close_checkpoint(Checkpoint mark) {
    if (open_checkpoints_ == 0 || mark > journal_.size()) {
        throw std::invalid_argument("Funds checkpoint closed out of order");
    }
    if (--open_checkpoints_ == 0) {
        journal_.clear();
    }
}

} // namespace veilmarket::chain
