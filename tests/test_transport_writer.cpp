#include "test.h"
#include "thermal/CommandEncoder.hpp"
#include "thermal/link/PrinterLink.hpp"
#include "thermal/transport/TransportWriter.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <thread>

using thermal::CommandEncoder;
using thermal::command::PrinterCommand;
using thermal::events::EventBus;
using thermal::events::EventType;
using thermal::link::PrinterLink;
using thermal::link::WriteStatus;
using thermal::transport::TransportWriter;
using thermal::types::Bytes;

namespace {
    Bytes filled(size_t size, uint8_t value) {
        return Bytes(size, value);
    }
}

TEST_CASE("TransportWriter splits a buffer into ordered chunks") {
    auto characteristic = std::make_shared<FakeCharacteristic>();
    PrinterLink link(characteristic, 20);
    TransportWriter writer;

    Bytes buffer;
    for (size_t i = 0; i < 45; ++i) buffer.push_back(static_cast<uint8_t>(i));

    auto result = writer.send(link, buffer);
    CHECK(result.isSuccess());
    CHECK(result.bytesWritten == 45);

    // ceil(45 / 20) chunks, none above the limit, concatenation is the input
    REQUIRE(characteristic->chunks.size() == 3);
    CHECK(characteristic->chunks[0].size() == 20);
    CHECK(characteristic->chunks[1].size() == 20);
    CHECK(characteristic->chunks[2].size() == 5);
    CHECK(characteristic->written() == buffer);
}

TEST_CASE("TransportWriter chunk limit resolution") {
    TransportWriter writer(16);

    SUBCASE("explicit link limit wins") {
        PrinterLink link(std::make_shared<FakeCharacteristic>(100), 8);
        CHECK(writer.chunkLimitFor(link) == 8);
    }

    SUBCASE("negotiated characteristic size") {
        PrinterLink link(std::make_shared<FakeCharacteristic>(100));
        CHECK(writer.chunkLimitFor(link) == 100);
    }

    SUBCASE("writer default when nothing is known") {
        PrinterLink link(std::make_shared<FakeCharacteristic>(0));
        CHECK(writer.chunkLimitFor(link) == 16);
    }

    SUBCASE("zero default falls back to BLE minimum") {
        TransportWriter fallback(0);
        PrinterLink link(std::make_shared<FakeCharacteristic>(0));
        CHECK(fallback.chunkLimitFor(link) == TransportWriter::DEFAULT_CHUNK_LIMIT);
    }
}

TEST_CASE("TransportWriter buffer of exactly the limit is one chunk") {
    auto characteristic = std::make_shared<FakeCharacteristic>();
    PrinterLink link(characteristic, 20);
    TransportWriter writer;

    CHECK(writer.send(link, filled(20, 'x')).isSuccess());
    CHECK(characteristic->chunks.size() == 1);

    CHECK(writer.send(link, filled(21, 'y')).isSuccess());
    CHECK(characteristic->chunks.size() == 3);
}

TEST_CASE("TransportWriter empty buffer writes nothing") {
    auto characteristic = std::make_shared<FakeCharacteristic>();
    PrinterLink link(characteristic, 20);
    TransportWriter writer;

    auto result = writer.send(link, Bytes{});
    CHECK(result.isSuccess());
    CHECK(result.bytesWritten == 0);
    CHECK(characteristic->attempts() == 0);
}

TEST_CASE("TransportWriter refuses a disconnected link") {
    TransportWriter writer;
    PrinterLink link;

    auto single = writer.send(link, filled(5, 'a'));
    CHECK(single.isNotConnected());
    CHECK(single.bytesWritten == 0);

    auto sequence = writer.sendSequence(link, {filled(5, 'a'), filled(5, 'b')});
    CHECK(sequence.isNotConnected());
    REQUIRE(sequence.commandIndex.has_value());
    CHECK(*sequence.commandIndex == 0);
}

TEST_CASE("TransportWriter sends the HELLO receipt in order") {
    auto characteristic = std::make_shared<FakeCharacteristic>();
    PrinterLink link(characteristic, 512);
    TransportWriter writer;

    auto buffers = CommandEncoder::encodeAll({PrinterCommand::init(), PrinterCommand::alignCenter(),
                                              PrinterCommand::textOf("HELLO"), PrinterCommand::feed()});
    REQUIRE(buffers.size() == 4);

    auto result = writer.sendSequence(link, buffers);
    REQUIRE(result.isSuccess());
    CHECK(result.bytesWritten == 2 + 3 + 5 + 1);

    REQUIRE(characteristic->chunks.size() == 4);
    for (size_t i = 0; i < buffers.size(); ++i) {
        CHECK(characteristic->chunks[i] == buffers[i]);
        CHECK(characteristic->chunks[i].size() <= 512);
    }
    CHECK(characteristic->written() ==
          bytesOf({0x1B, 0x40, 0x1B, 0x61, 0x01, 'H', 'E', 'L', 'L', 'O', 0x0A}));
}

TEST_CASE("TransportWriter stops at the first failing command") {
    auto characteristic = std::make_shared<FakeCharacteristic>();
    PrinterLink link(characteristic, 20);
    TransportWriter writer;

    Bytes a = filled(3, 'A');
    Bytes b = filled(3, 'B');
    Bytes c = filled(3, 'C');

    SUBCASE("rejected chunk") {
        characteristic->failAt = 1;
        characteristic->failStatus = WriteStatus::Rejected;

        auto result = writer.sendSequence(link, {a, b, c});
        CHECK(result.isChunkWriteFailed());
        REQUIRE(result.commandIndex.has_value());
        CHECK(*result.commandIndex == 1);
        CHECK(*result.chunkIndex == 0);
        CHECK(result.bytesWritten == 3);
        CHECK(characteristic->written() == a);
        // C never attempted, and nothing retried
        CHECK(characteristic->attempts() == 2);
        // A rejected chunk does not take the link down
        CHECK(link.isConnected());
    }

    SUBCASE("timed out chunk") {
        characteristic->failAt = 1;
        characteristic->failStatus = WriteStatus::TimedOut;

        auto result = writer.sendSequence(link, {a, b, c});
        CHECK(result.isChunkWriteFailed());
        CHECK(*result.commandIndex == 1);
        CHECK(characteristic->attempts() == 2);
    }
}

TEST_CASE("TransportWriter failure in the middle of a chunked command") {
    auto characteristic = std::make_shared<FakeCharacteristic>();
    PrinterLink link(characteristic, 4);
    TransportWriter writer;

    characteristic->failAt = 3;

    // Command 0 takes writes 0-1, command 1 takes writes 2-4
    auto result = writer.sendSequence(link, {filled(8, 'a'), filled(10, 'b')});
    CHECK(result.isChunkWriteFailed());
    CHECK(*result.commandIndex == 1);
    CHECK(*result.chunkIndex == 1);
    CHECK(result.bytesWritten == 12);
}

TEST_CASE("TransportWriter device disconnect after 2 of 5 commands") {
    auto characteristic = std::make_shared<FakeCharacteristic>();
    auto link = std::make_shared<PrinterLink>(characteristic, 20);
    TransportWriter writer;

    std::vector<Bytes> buffers;
    for (uint8_t i = 0; i < 5; ++i) buffers.push_back(filled(2, static_cast<uint8_t>('0' + i)));

    SUBCASE("write reports the disconnect") {
        characteristic->disconnectAt = 2;

        auto result = writer.sendSequence(*link, buffers);
        CHECK(result.isDisconnected());
        REQUIRE(result.commandIndex.has_value());
        CHECK(*result.commandIndex == 2);
        CHECK(result.bytesWritten == 4);
        CHECK(characteristic->attempts() == 3);
        CHECK_FALSE(link->isConnected());
    }

    SUBCASE("device drops the link between commands") {
        characteristic->onWrite = [link](size_t attempt) {
            if (attempt == 1) link->markDisconnected("device powered off");
        };

        auto result = writer.sendSequence(*link, buffers);
        CHECK(result.isDisconnected());
        CHECK(*result.commandIndex == 2);
        // Write 1 was already in flight and completed, nothing is written after the drop
        CHECK(characteristic->attempts() == 2);
        CHECK(characteristic->chunks.size() == 2);
    }

    SUBCASE("interrupt flag stops the job before the next chunk") {
        std::atomic<bool> interrupt{false};
        writer.setAbortFlag(&interrupt);
        characteristic->onWrite = [&interrupt](size_t attempt) {
            if (attempt == 1) interrupt.store(true);
        };

        auto result = writer.sendSequence(*link, buffers);
        CHECK(result.isDisconnected());
        REQUIRE(result.commandIndex.has_value());
        CHECK(*result.commandIndex == 2);
        CHECK(result.bytesWritten == 4);
        CHECK(characteristic->attempts() == 2);
        CHECK_FALSE(link->isConnected());
    }

    SUBCASE("characteristic closed underneath the link") {
        auto *fake = characteristic.get();
        characteristic->onWrite = [fake](size_t attempt) {
            if (attempt == 1) fake->open = false;
        };

        auto result = writer.sendSequence(*link, buffers);
        CHECK(result.isDisconnected());
        CHECK(*result.commandIndex == 2);
        CHECK(characteristic->attempts() == 2);
        CHECK_FALSE(link->isConnected());
    }

    SUBCASE("a later job fails fast") {
        link->markDisconnected("gone");
        auto result = writer.sendSequence(*link, buffers);
        CHECK(result.isNotConnected());
        CHECK(characteristic->attempts() == 0);
    }
}

TEST_CASE("TransportWriter publishes job events") {
    auto observer = std::make_shared<RecordingObserver>();
    EventBus::getInstance().subscribe(observer);

    auto characteristic = std::make_shared<FakeCharacteristic>();
    PrinterLink link(characteristic, 20);
    TransportWriter writer;

    CHECK(writer.sendSequence(link, {filled(3, 'x')}).isSuccess());
    CHECK(observer->count(EventType::JOB_STARTED) == 1);
    CHECK(observer->count(EventType::JOB_COMPLETED) == 1);

    characteristic->disconnectAt = 1;
    CHECK(writer.sendSequence(link, {filled(3, 'y')}).isDisconnected());
    CHECK(observer->count(EventType::JOB_STARTED) == 2);
    CHECK(observer->count(EventType::JOB_ABORTED) == 1);
    CHECK(observer->count(EventType::LINK_DISCONNECTED) == 1);
}

TEST_CASE("TransportWriter never interleaves two jobs on one link") {
    auto characteristic = std::make_shared<FakeCharacteristic>();
    PrinterLink link(characteristic, 2);
    TransportWriter writer;

    std::promise<void> firstWriteEntered;
    std::promise<void> releaseFirstWrite;
    auto release = releaseFirstWrite.get_future().share();

    characteristic->onWrite = [&](size_t attempt) {
        if (attempt == 0) {
            firstWriteEntered.set_value();
            release.wait();
        }
    };

    std::thread first([&] {
        CHECK(writer.sendSequence(link, {filled(6, 'A'), filled(2, 'A')}).isSuccess());
    });
    firstWriteEntered.get_future().wait();

    std::thread second([&] {
        CHECK(writer.sendSequence(link, {filled(4, 'B')}).isSuccess());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    releaseFirstWrite.set_value();
    first.join();
    second.join();

    Bytes expected = filled(8, 'A');
    Bytes tail = filled(4, 'B');
    expected.insert(expected.end(), tail.begin(), tail.end());
    CHECK(characteristic->written() == expected);
}
