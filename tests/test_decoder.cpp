/**
 * test_decoder.cpp
 *
 * Byte-level protocol state machine against a recording target.
 */

#include <gtest/gtest.h>
#include "decoder.hpp"

namespace {

struct RecordingTarget : BusTarget {
    std::map<Address, HalfWord> control;
    std::map<Address, Word> memory;
    std::vector<std::pair<Address, Word>> control_writes;
    std::vector<std::pair<Address, Word>> memory_writes;
    std::vector<Address> reads;

    HalfWord read_control(Address addr) override {
        reads.push_back(addr);
        return control[addr];
    }
    void write_control(Address addr, HalfWord value) override {
        control_writes.emplace_back(addr, value);
        control[addr] = value;
    }
    Word read_memory(Address addr) override {
        reads.push_back(addr);
        return memory[addr];
    }
    void write_memory(Address addr, Word value) override {
        memory_writes.emplace_back(addr, value);
        memory[addr] = value;
    }
};

using Writes = std::vector<std::pair<Address, Word>>;

} // namespace

class DecoderTest : public ::testing::Test {
protected:
    std::ostringstream sink;
    Logger log{ sink, LogLevel::Warning };
    RecordingTarget target;
    ProtocolDecoder decoder{ target, log };

    std::vector<Byte> send(const std::vector<Byte>& bytes) {
        std::vector<Byte> in;
        for (Byte b : bytes) in.push_back(decoder.transmit(b));
        return in;
    }
};

TEST_F(DecoderTest, MemoryWriteIsBigEndianAndCommitsAfterFourthByte) {
    send({ 0x00, 0x00, 0x10, 0x00, 0x00, 0x00 });
    EXPECT_TRUE(target.memory_writes.empty());

    send({ 0x2A });
    EXPECT_EQ(target.memory_writes, (Writes{ { 0x0010, 0x0000002A } }));
    EXPECT_EQ(decoder.get_state(), ProtocolDecoder::State::Data0);
    EXPECT_EQ(decoder.get_address(), 0x0011);
}

TEST_F(DecoderTest, MemoryReadReturnsMostSignificantByteFirst) {
    target.memory[0x0010] = 0x11223344;
    std::vector<Byte> in = send({ 0x01, 0x00, 0x10, 0x00, 0x00, 0x00, 0x00 });

    EXPECT_EQ(in, (std::vector<Byte>{ 0x00, 0x00, 0x00, 0x11, 0x22, 0x33, 0x44 }));
    EXPECT_TRUE(target.memory_writes.empty());
}

TEST_F(DecoderTest, ControlAccessUsesTwoDataBytes) {
    target.control[0xF000] = 0x1234;
    std::vector<Byte> in = send({ 0x01, 0xF0, 0x00, 0x00, 0x00 });
    EXPECT_EQ(in, (std::vector<Byte>{ 0x00, 0x00, 0x00, 0x12, 0x34 }));
    EXPECT_TRUE(decoder.is_short());
    EXPECT_EQ(decoder.get_state(), ProtocolDecoder::State::Data0);

    decoder.finish_transmission();
    send({ 0x00, 0xF0, 0x01, 0xAB, 0xCD });
    EXPECT_EQ(target.control_writes, (Writes{ { 0xF001, 0xABCD } }));
}

TEST_F(DecoderTest, BurstAutoIncrementsAddress) {
    send({ 0x00, 0xF0, 0x20, 0xAA, 0xBB, 0xCC, 0xDD });
    EXPECT_EQ(target.control_writes, (Writes{ { 0xF020, 0xAABB }, { 0xF021, 0xCCDD } }));

    decoder.finish_transmission();
    send({ 0x00, 0x60, 0x00, 0, 0, 0, 1, 0, 0, 0, 2 });
    EXPECT_EQ(target.memory_writes, (Writes{ { 0x6000, 1 }, { 0x6001, 2 } }));

    decoder.finish_transmission();
    target.memory[0xC000] = 0xCAFEF00D;
    target.memory[0xC001] = 0x01020304;
    std::vector<Byte> in = send({ 0x01, 0xC0, 0x00, 0, 0, 0, 0, 0, 0, 0, 0 });
    EXPECT_EQ(std::vector<Byte>(in.begin() + 3, in.end()),
              (std::vector<Byte>{ 0xCA, 0xFE, 0xF0, 0x0D, 0x01, 0x02, 0x03, 0x04 }));
}

TEST_F(DecoderTest, BurstWidthIsFixedByStartAddress) {
    send({ 0x00, 0xEF, 0xFF, 0, 0, 0, 1, 0, 0, 0, 2 });
    EXPECT_EQ(target.memory_writes, (Writes{ { 0xEFFF, 1 }, { 0xF000, 2 } }));
    EXPECT_TRUE(target.control_writes.empty());
}

TEST_F(DecoderTest, UnexpectedChipAddressWarnsButProceeds) {
    send({ 0xA0, 0x00, 0x10, 0, 0, 0, 5 });
    EXPECT_EQ(log.count(LogLevel::Warning), 1u);
    EXPECT_EQ(target.memory_writes, (Writes{ { 0x0010, 5 } }));

    decoder.finish_transmission();
    target.memory[0x0010] = 0x0A0B0C0D;
    std::vector<Byte> in = send({ 0xA1, 0x00, 0x10, 0, 0, 0, 0 });
    EXPECT_EQ(in.back(), 0x0D);
    EXPECT_EQ(log.count(LogLevel::Warning), 2u);
}

TEST_F(DecoderTest, ConfiguredChipAddressIsAccepted) {
    ProtocolDecoder other(target, log, 0x38);
    other.transmit(0x70);
    EXPECT_EQ(log.count(LogLevel::Warning), 0u);
    EXPECT_EQ(other.get_state(), ProtocolDecoder::State::SubAddressHigh);
}

TEST_F(DecoderTest, DeselectAtAnyOffsetLeavesNoResidue) {
    const std::vector<Byte> aborted = { 0x00, 0x12, 0x34, 0xFF, 0xEE, 0xDD };
    const std::vector<Byte> fresh = { 0x00, 0x00, 0x20, 0x00, 0x00, 0x00, 0x01 };

    for (size_t k = 0; k <= aborted.size(); k++) {
        target.memory_writes.clear();
        send(std::vector<Byte>(aborted.begin(), aborted.begin() + k));
        decoder.finish_transmission();
        EXPECT_EQ(decoder.get_state(), ProtocolDecoder::State::ChipAddress);

        send(fresh);
        decoder.finish_transmission();
        EXPECT_EQ(target.memory_writes, (Writes{ { 0x0020, 1 } })) << "aborted after " << k;
    }
}

TEST_F(DecoderTest, WriteTransactionShiftsOutIdleBytes) {
    std::vector<Byte> in = send({ 0x00, 0x00, 0x10, 0x12, 0x34, 0x56, 0x78 });
    for (Byte b : in) EXPECT_EQ(b, ProtocolDecoder::IDLE_BYTE);
    EXPECT_TRUE(target.reads.empty());
}

TEST_F(DecoderTest, CountsTransactionsAndNamesStates) {
    send({ 0x00, 0x00 });
    decoder.finish_transmission();
    send({ 0x01 });
    EXPECT_EQ(decoder.get_transaction_count(), 2u);
    EXPECT_EQ(ProtocolDecoder::state_name(decoder.get_state()), "SubAddressHigh");
    EXPECT_TRUE(decoder.is_read());
}
