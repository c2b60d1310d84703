#include <gtest/gtest.h>
#include "veilmarket/chain/abi.hpp"
#include "veilmarket/chain/events.hpp"
#include <set>

using namespace veilmarket;
using namespace veilmarket::chain;

namespace {

Address addr(uint8_t tag) {
    Address a{};
    a[0] = 0xAA;
    a[19] = tag;
    return a;
}

CallContext at_block(BlockNumber block, Timestamp now, uint8_t tx) {
    CallContext ctx;
    ctx.block = block;
    ctx.now = now;
    ctx.tx_hash[31] = tx;
    return ctx;
}

} // anonymous namespace

// ============================================================================
// Word Codec Tests
// ============================================================================

TEST(AbiTest, UintWordIsBigEndian) {
    Bytes32 w = uint_word(0x0102030405060708ULL);
    for (size_t i = 0; i < 24; ++i) {
        EXPECT_EQ(w[i], 0);
    }
    EXPECT_EQ(w[24], 0x01);
    EXPECT_EQ(w[31], 0x08);
    EXPECT_EQ(word_to_uint(w), 0x0102030405060708ULL);
}

TEST(AbiTest, AddressWordLeftPadded) {
    Address a = addr(0x42);
    Bytes32 w = address_word(a);
    EXPECT_EQ(w[11], 0);
    EXPECT_EQ(w[12], 0xAA);
    EXPECT_EQ(w[31], 0x42);
    EXPECT_EQ(word_to_address(w), a);
}

TEST(AbiTest, StringPaddedToWords) {
    AbiWriter writer;
    writer.put_string("hello").put_uint(7);
    EXPECT_EQ(writer.bytes().size(), 3 * kWordSize);

    AbiReader reader(writer.bytes());
    EXPECT_EQ(reader.read_string(), "hello");
    EXPECT_EQ(reader.read_uint(), 7u);
    EXPECT_TRUE(reader.at_end());
    EXPECT_NO_THROW(reader.expect_end());
}

TEST(AbiTest, OversizedUintRejected) {
    Bytes32 w{};
    w[23] = 0x01;   // 2^64
    AbiWriter writer;
    writer.put_bytes32(w);

    AbiReader reader(writer.bytes());
    EXPECT_THROW(reader.read_uint(), DecodeError);
}

TEST(AbiTest, TruncatedInputRejected) {
    std::vector<uint8_t> data(kWordSize - 1, 0);
    AbiReader reader(data);
    EXPECT_THROW(reader.read_uint(), DecodeError);

    // String length claims more than is present
    AbiWriter writer;
    writer.put_uint(100);
    AbiReader str_reader(writer.bytes());
    EXPECT_THROW(str_reader.read_string(), DecodeError);
}

TEST(AbiTest, TrailingBytesRejected) {
    AbiWriter writer;
    writer.put_uint(1).put_uint(2);
    AbiReader reader(writer.bytes());
    reader.read_uint();
    EXPECT_EQ(reader.remaining(), kWordSize);
    EXPECT_THROW(reader.expect_end(), DecodeError);
}

TEST(AbiTest, HexUtilities) {
    Address a = address_from_hex("0x00000000000000000000000000000000000000ff");
    EXPECT_EQ(a[19], 0xff);
    EXPECT_EQ(to_hex(a), "0x00000000000000000000000000000000000000ff");

    EXPECT_THROW(address_from_hex("0x1234"), ValidationError);
    EXPECT_EQ(address_from_hex("00000000000000000000000000000000000000FF"), a);
    EXPECT_THROW(bytes32_from_hex("0xzz00000000000000000000000000000000000000000000000000000000000000"),
                 ValidationError);
}

// ============================================================================
// Event Codec Tests
// ============================================================================

TEST(EventCodecTest, TopicsAreDistinct) {
    std::set<Bytes32> seen{
        topics::offer_created(), topics::offer_purchased(), topics::offer_deactivated(),
        topics::reveal_requested(), topics::reveal_resolved(), topics::platform_fee_updated(),
        topics::treasury_updated(), topics::emergency_withdrawal(),
        topics::ownership_transferred()};
    EXPECT_EQ(seen.size(), 9u);
}

TEST(EventCodecTest, OfferCreatedIndexesIdAndCreator) {
    OfferCreated in{12, addr(1), "Logo design", 5'000, 14, 3};
    RawLog log = encode_event(in);

    ASSERT_EQ(log.topics.size(), 3u);
    EXPECT_EQ(log.topics[0], topics::offer_created());
    EXPECT_EQ(log.topics[1], uint_word(12));
    EXPECT_EQ(log.topics[2], address_word(addr(1)));

    OfferCreated out = decode_offer_created(log);
    EXPECT_EQ(out.offer_id, 12u);
    EXPECT_EQ(out.creator, addr(1));
    EXPECT_EQ(out.title, "Logo design");
    EXPECT_EQ(out.public_price, 5'000u);
    EXPECT_EQ(out.duration, 14u);
    EXPECT_EQ(out.slots, 3u);
}

TEST(EventCodecTest, OfferPurchasedFields) {
    RawLog log = encode_event(OfferPurchased{4, addr(2), 2, 300, 1});
    EXPECT_EQ(log.data.size(), 3 * kWordSize);

    OfferPurchased out = decode_offer_purchased(log);
    EXPECT_EQ(out.offer_id, 4u);
    EXPECT_EQ(out.buyer, addr(2));
    EXPECT_EQ(out.slots, 2u);
    EXPECT_EQ(out.total_price, 300u);
    EXPECT_EQ(out.slots_left, 1u);
}

TEST(EventCodecTest, RevealRequestedCarriesHandleList) {
    Handle price{};
    price[0] = 0x11;
    Handle slots{};
    slots[0] = 0x22;

    RawLog log = encode_event(RevealRequested{9, {price, slots}});
    ASSERT_EQ(log.topics.size(), 2u);

    RevealRequested out = decode_reveal_requested(log);
    EXPECT_EQ(out.offer_id, 9u);
    ASSERT_EQ(out.handles.size(), 2u);
    EXPECT_EQ(out.handles[0], price);
    EXPECT_EQ(out.handles[1], slots);
}

TEST(EventCodecTest, WrongTopicRejected) {
    RawLog log = encode_event(OfferDeactivated{4, addr(2)});
    EXPECT_THROW(decode_offer_purchased(log), ReconciliationError);

    RawLog no_topics;
    EXPECT_THROW(decode_offer_created(no_topics), ReconciliationError);
}

TEST(EventCodecTest, MalformedDataRejected) {
    RawLog log = encode_event(OfferPurchased{4, addr(2), 2, 300, 1});

    RawLog truncated = log;
    truncated.data.resize(2 * kWordSize);
    EXPECT_THROW(decode_offer_purchased(truncated), ReconciliationError);

    RawLog padded = log;
    padded.data.resize(4 * kWordSize, 0);
    EXPECT_THROW(decode_offer_purchased(padded), ReconciliationError);

    RawLog missing_topic = log;
    missing_topic.topics.pop_back();
    EXPECT_THROW(decode_offer_purchased(missing_topic), ReconciliationError);
}

// ============================================================================
// Event Log Tests
// ============================================================================

TEST(EventLogTest, LogIndexPerBlock) {
    EventLog events;
    events.append(at_block(5, 1000, 1), addr(9), encode_event(OfferDeactivated{1, addr(1)}));
    events.append(at_block(5, 1000, 2), addr(9), encode_event(OfferDeactivated{2, addr(1)}));
    events.append(at_block(6, 1012, 3), addr(9), encode_event(OfferDeactivated{3, addr(1)}));

    auto all = events.query(LogFilter{});
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].log_index, 0u);
    EXPECT_EQ(all[1].log_index, 1u);
    EXPECT_EQ(all[2].log_index, 0u);
    EXPECT_EQ(all[1].tx_hash[31], 2);
}

TEST(EventLogTest, FirstTimestampPerBlockWins) {
    EventLog events;
    events.append(at_block(5, 1000, 1), addr(9), encode_event(OfferDeactivated{1, addr(1)}));
    events.append(at_block(5, 2000, 2), addr(9), encode_event(OfferDeactivated{2, addr(1)}));

    EXPECT_EQ(events.block_timestamp(5), 1000u);
    EXPECT_FALSE(events.block_timestamp(6).has_value());
}

TEST(EventLogTest, OlderBlockInsertedInOrder) {
    EventLog events;
    events.append(at_block(7, 1024, 1), addr(9), encode_event(OfferDeactivated{1, addr(1)}));
    events.append(at_block(5, 1000, 2), addr(9), encode_event(OfferDeactivated{2, addr(1)}));

    auto all = events.query(LogFilter{});
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].block_number, 5u);
    EXPECT_EQ(all[1].block_number, 7u);
    EXPECT_EQ(events.back().block_number, 7u);
}

TEST(EventLogTest, FilterByTopicsAndRange) {
    EventLog events;
    Address ledger = addr(9);
    events.append(at_block(5, 1000, 1), ledger, encode_event(OfferPurchased{1, addr(1), 1, 10, 0}));
    events.append(at_block(6, 1012, 2), ledger, encode_event(OfferPurchased{2, addr(2), 1, 10, 0}));
    events.append(at_block(7, 1024, 3), ledger, encode_event(OfferDeactivated{3, addr(1)}));
    events.append(at_block(8, 1036, 4), addr(8), encode_event(OfferPurchased{3, addr(1), 1, 10, 0}));

    LogFilter by_buyer;
    by_buyer.emitter = ledger;
    by_buyer.topic0 = topics::offer_purchased();
    by_buyer.topic2 = address_word(addr(1));
    auto matched = events.query(by_buyer);
    ASSERT_EQ(matched.size(), 1u);
    EXPECT_EQ(matched[0].block_number, 5u);

    LogFilter range;
    range.from_block = 6;
    range.to_block = 7;
    EXPECT_EQ(events.query(range).size(), 2u);

    LogFilter by_offer;
    by_offer.topic1 = uint_word(3);
    EXPECT_EQ(events.query(by_offer).size(), 2u);
}

TEST(EventLogTest, BackOnEmptyThrows) {
    EventLog events;
    EXPECT_EQ(events.size(), 0u);
    EXPECT_THROW(events.back(), std::out_of_range);
}
