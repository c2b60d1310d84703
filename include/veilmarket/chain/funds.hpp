#pragma once

#include "veilmarket/core/types.hpp"
#include <functional>
#include <unordered_map>
#include <vector>

namespace veilmarket::chain {

// ============================================================================
// Funds Book
// ============================================================================

/// Called on the recipient after a transfer lands. Returning false (or
/// throwing) rejects the transfer. Hooks may call back into contracts.
using ReceiveHook = std::function<bool(const Address& from, Amount amount)>;

/// Native-currency balances of every account, with a transfer journal so a
/// failing operation can be reverted as a unit.
///
/// Checkpoints nest: every checkpoint() must be closed by exactly one
/// rollback() or release(), innermost first. Legs kept by an inner release
/// stay in the journal until the outermost checkpoint closes, so an outer
/// rollback also reverts them.
///
/// Single writer: callers serialize mutations.
class FundsBook {
public:
    using Checkpoint = size_t;

private:
    /// A balance move, or an undo action when `undo` is set
    struct Leg {
        Address from;
        Address to;
        Amount amount = 0;
        std::function<void()> undo;
    };

    std::unordered_map<Address, Amount, ByteArrayHash> balances_;
    std::unordered_map<Address, ReceiveHook, ByteArrayHash> hooks_;
    std::vector<Leg> journal_;
    size_t open_checkpoints_ = 0;

    void revert_to(Checkpoint mark);
    void close_checkpoint(Checkpoint mark);

public:
    FundsBook() = default;

    FundsBook(const FundsBook&) = delete;
    FundsBook& operator=(const FundsBook&) = delete;

    /// Credit new funds (genesis / faucet). Throws ValidationError on overflow
    void mint(const Address& account, Amount amount);

    Amount balance_of(const Address& account) const;

    void set_receive_hook(const Address& account, ReceiveHook hook);
    void clear_receive_hook(const Address& account);

    /// Move `amount` and run the recipient hook. Returns false, with this
    /// leg and anything the hook did reverted, if the sender is short or
    /// the hook rejects. Zero amounts succeed without invoking the hook
    bool transfer(const Address& from, const Address& to, Amount amount);

    /// Open a checkpoint; returns the journal position to roll back to
    Checkpoint checkpoint();

    /// Revert every leg recorded after `mark`, newest first, and close it
    void rollback(Checkpoint mark);

    /// Keep every leg after `mark` and close the checkpoint. The journal
    /// is only discarded once no checkpoint remains open
    void release(Checkpoint mark);

    /// Register state outside the book that must be restored if an open
    /// checkpoint is rolled back. Runs in journal order with the transfer
    /// legs. Ignored when no checkpoint is open
    void record_undo(std::function<void()> undo);

    size_t open_checkpoints() const { return open_checkpoints_; }
    size_t journal_size() const { return journal_.size(); }
};

} // namespace veilmarket::chain
