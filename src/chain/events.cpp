#include "veilmarket/chain/events.hpp"
#include "veilmarket/chain/abi.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace veilmarket::chain {

// ============================================================================
// Topics
// ============================================================================

namespace topics {

const Bytes32& offer_created() {
    static const Bytes32 t = event_topic(
        "OfferCreated(uint256,address,string,uint256,uint256,uint256)");
    return t;
}

const Bytes32& offer_purchased() {
    static const Bytes32 t = event_topic(
        "OfferPurchased(uint256,address,uint256,uint256,uint256)");
    return t;
}

const Bytes32& offer_deactivated() {
    static const Bytes32 t = event_topic("OfferDeactivated(uint256,address)");
    return t;
}

const Bytes32& reveal_requested() {
    static const Bytes32 t = event_topic("RevealRequested(uint256,bytes32[])");
    return t;
}

const Bytes32& reveal_resolved() {
    static const Bytes32 t = event_topic("RevealResolved(uint256,uint256,uint256)");
    return t;
}

const Bytes32& platform_fee_updated() {
    static const Bytes32 t = event_topic("PlatformFeeUpdated(uint256,uint256)");
    return t;
}

const Bytes32& treasury_updated() {
    static const Bytes32 t = event_topic("TreasuryUpdated(address,address)");
    return t;
}

const Bytes32& emergency_withdrawal() {
    static const Bytes32 t = event_topic("EmergencyWithdrawal(address,uint256)");
    return t;
}

const Bytes32& ownership_transferred() {
    static const Bytes32 t = event_topic("OwnershipTransferred(address,address)");
    return t;
}

} // namespace topics

// ============================================================================
// Encoding
// ============================================================================

namespace {

RawLog encode(const OfferCreated& e) {
    AbiWriter data;
    data.put_string(e.title)
        .put_uint(e.public_price)
        .put_uint(e.duration)
        .put_uint(e.slots);
    return RawLog{{topics::offer_created(), uint_word(e.offer_id), address_word(e.creator)},
                  data.take()};
}

RawLog encode(const OfferPurchased& e) {
    AbiWriter data;
    data.put_uint(e.slots)
        .put_uint(e.total_price)
        .put_uint(e.slots_left);
    return RawLog{{topics::offer_purchased(), uint_word(e.offer_id), address_word(e.buyer)},
                  data.take()};
}

RawLog encode(const OfferDeactivated& e) {
    return RawLog{{topics::offer_deactivated(), uint_word(e.offer_id), address_word(e.by)}, {}};
}

RawLog encode(const RevealRequested& e) {
    AbiWriter data;
    data.put_handles(e.handles);
    return RawLog{{topics::reveal_requested(), uint_word(e.offer_id)}, data.take()};
}

RawLog encode(const RevealResolved& e) {
    AbiWriter data;
    data.put_uint(e.price).put_uint(e.slots);
    return RawLog{{topics::reveal_resolved(), uint_word(e.offer_id)}, data.take()};
}

RawLog encode(const PlatformFeeUpdated& e) {
    AbiWriter data;
    data.put_uint(e.old_fee).put_uint(e.new_fee);
    return RawLog{{topics::platform_fee_updated()}, data.take()};
}

RawLog encode(const TreasuryUpdated& e) {
    return RawLog{{topics::treasury_updated(),
                   address_word(e.old_treasury),
                   address_word(e.new_treasury)}, {}};
}

RawLog encode(const EmergencyWithdrawal& e) {
    AbiWriter data;
    data.put_uint(e.amount);
    return RawLog{{topics::emergency_withdrawal(), address_word(e.to)}, data.take()};
}

RawLog encode(const OwnershipTransferred& e) {
    return RawLog{{topics::ownership_transferred(),
                   address_word(e.previous_owner),
                   address_word(e.new_owner)}, {}};
}

void expect_topics(const RawLog& log, const Bytes32& topic0, size_t count, const char* name) {
    if (log.topics.size() != count) {
        throw ReconciliationError(std::string(name) + ": expected " +
                                  std::to_string(count) + " topics, got " +
                                  std::to_string(log.topics.size()));
    }
    if (log.topics[0] != topic0) {
        throw ReconciliationError(std::string(name) + ": topic mismatch");
    }
}

} // anonymous namespace

RawLog encode_event(const LedgerEvent& event) {
    return std::visit([](const auto& e) { return encode(e); }, event);
}

// ============================================================================
// Decoding
// ============================================================================

OfferCreated decode_offer_created(const RawLog& log) {
    expect_topics(log, topics::offer_created(), 3, "OfferCreated");

    try {
        OfferCreated e;
        e.offer_id = word_to_uint(log.topics[1]);
        e.creator = word_to_address(log.topics[2]);

        AbiReader reader(log.data);
        e.title = reader.read_string();
        e.public_price = reader.read_uint();
        e.duration = reader.read_uint();
        e.slots = reader.read_uint();
        reader.expect_end();
        return e;
    } catch (const DecodeError& err) {
        throw ReconciliationError(std::string("OfferCreated: ") + err.what());
    }
}

OfferPurchased decode_offer_purchased(const RawLog& log) {
    expect_topics(log, topics::offer_purchased(), 3, "OfferPurchased");

    try {
        OfferPurchased e;
        e.offer_id = word_to_uint(log.topics[1]);
        e.buyer = word_to_address(log.topics[2]);

        AbiReader reader(log.data);
        e.slots = reader.read_uint();
        e.total_price = reader.read_uint();
        e.slots_left = reader.read_uint();
        reader.expect_end();
        return e;
    } catch (const DecodeError& err) {
        throw ReconciliationError(std::string("OfferPurchased: ") + err.what());
    }
}

RevealRequested decode_reveal_requested(const RawLog& log) {
    expect_topics(log, topics::reveal_requested(), 2, "RevealRequested");

    try {
        RevealRequested e;
        e.offer_id = word_to_uint(log.topics[1]);

        AbiReader reader(log.data);
        e.handles = reader.read_handles();
        reader.expect_end();
        return e;
    } catch (const DecodeError& err) {
        throw ReconciliationError(std::string("RevealRequested: ") + err.what());
    }
}

// ============================================================================
// LogFilter / EventLog
// ============================================================================

bool LogFilter::matches(const LogRecord& record) const {
    if (record.block_number < from_block) return false;
    if (to_block && record.block_number > *to_block) return false;
    if (emitter && record.emitter != *emitter) return false;

    const auto& t = record.log.topics;
    if (topic0 && (t.size() < 1 || t[0] != *topic0)) return false;
    if (topic1 && (t.size() < 2 || t[1] != *topic1)) return false;
    if (topic2 && (t.size() < 3 || t[2] != *topic2)) return false;
    return true;
}

uint32_t EventLog::append(const CallContext& ctx, const Address& emitter, RawLog log) {
    std::lock_guard<std::mutex> lock(mutex_);

    // First timestamp seen for a block is authoritative
    block_times_.emplace(ctx.block, ctx.now);

    LogRecord record;
    record.block_number = ctx.block;
    record.tx_hash = ctx.tx_hash;
    record.log_index = next_log_index_[ctx.block]++;
    record.emitter = emitter;
    record.log = std::move(log);
    const uint32_t log_index = record.log_index;

    // Blocks are expected in non-decreasing order, but keep query order
    // correct if a caller replays an older block
    if (!records_.empty() && records_.back().block_number > ctx.block) {
        auto pos = std::upper_bound(
            records_.begin(), records_.end(), ctx.block,
            [](BlockNumber b, const LogRecord& r) { return b < r.block_number; });
        records_.insert(pos, std::move(record));
    } else {
        records_.push_back(std::move(record));
    }
    return log_index;
}

bool EventLog::retract(BlockNumber block, uint32_t log_index) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(records_.rbegin(), records_.rend(), [&](const LogRecord& r) {
        return r.block_number == block && r.log_index == log_index;
    });
    if (it == records_.rend()) {
        return false;
    }
    records_.erase(std::next(it).base());
    return true;
}

std::vector<LogRecord> EventLog::query(const LogFilter& filter) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<LogRecord> result;
    for (const auto& record : records_) {
        if (filter.matches(record)) {
            result.push_back(record);
        }
    }
    return result;
}

std::optional<Timestamp> EventLog::block_timestamp(BlockNumber block) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = block_times_.find(block);
    if (it == block_times_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

LogRecord EventLog::back() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.empty()) {
        throw std::out_of_range("Event log is empty");
    }
    return records_.back();
}

} // namespace veilmarket::chain
