#include <doctest/doctest.h>
#include <set>
#include <string>
#include "fakes.hpp"

using namespace meshz;
using namespace meshz_test;

namespace {

Settings fast_settings() {
    Settings s;
    s.chunk_size = 4;
    s.ack_timeout_ms = 100;
    s.watchdog_interval_ms = 10;
    s.max_retries = 3;
    return s;
}

struct TwoNodes {
    Settings settings = fast_settings();
    MemoryChunkSource files;
    Core alice{settings, files};
    Core bob{settings, files};
    Pump pump{{peer("!a11ce001"), &alice}, {peer("!b0b00002"), &bob}, files, nullptr, {}, {}, {}};

    uint32_t now = 0;

    // Step both cores every 10 ms until @p done, for at most @p limit_ms more.
    template <typename Pred>
    void run(Pred done, uint32_t limit_ms = 20000) {
        const uint32_t until = now + limit_ms;
        for (; now <= until; now += 10) {
            pump.step(now);
            if (done()) { now += 10; break; }
        }
    }
};

std::string content_of(const Action& a) {
    return std::string(a.bytes.begin(), a.bytes.end());
}

} // namespace

TEST_CASE("File crosses a clean link intact") {
    TwoNodes n;
    n.files.put("/home/alice/hello.txt", "Hello, mesh!");   // 12 bytes, 3 chunks

    REQUIRE(n.alice.initiate(peer("!b0b00002"), "/home/alice/hello.txt", 0) == InitiateError::None);
    n.run([&] { return n.alice.sender().state() == SendState::Complete; });

    CHECK(n.alice.sender().state() == SendState::Complete);
    CHECK(n.bob.receiver().state() == RecvState::Complete);
    REQUIRE(n.pump.written.size() == 1);
    CHECK(n.pump.written[0].name == FileNameStr("hello.txt"));
    CHECK(content_of(n.pump.written[0]) == "Hello, mesh!");

    // Stop-and-wait: Request, Ack, then strictly alternating chunk / ack.
    const std::vector<std::string> expect = {
        "MESHZ_REQ|hello.txt|12|3", "MESHZ_ACK",
        "ZD|1|SGVsbA==", "MESHZ_GOCONT|1",
        "ZD|2|bywgbQ==", "MESHZ_GOCONT|2",
        "ZD|3|ZXNoIQ==", "MESHZ_GOCONT|3",
    };
    CHECK(n.pump.wire == expect);
}

TEST_CASE("Lost chunk and lost final ack are recovered by retries") {
    TwoNodes n;
    n.files.put("data.bin", "0123456789");    // 3 chunks
    std::set<std::string> dropped_once;
    n.pump.drop = [&](const PeerId&, const std::string& text) {
        if (text.rfind("ZD|2|", 0) == 0 || text == "MESHZ_GOCONT|3") {
            return dropped_once.insert(text).second;    // first copy only
        }
        return false;
    };

    REQUIRE(n.alice.initiate(peer("!b0b00002"), "data.bin", 0) == InitiateError::None);
    n.run([&] { return n.alice.sender().state() == SendState::Complete; });

    CHECK(n.alice.sender().state() == SendState::Complete);
    REQUIRE(n.pump.written.size() == 1);                 // re-ack after Complete, no rewrite
    CHECK(content_of(n.pump.written[0]) == "0123456789");
    CHECK(dropped_once.size() == 2);

    size_t chunk2_sent = 0;
    for (const auto& w : n.pump.wire) if (w.rfind("ZD|2|", 0) == 0) ++chunk2_sent;
    CHECK(chunk2_sent == 2);
}

TEST_CASE("A silent peer fails the send after the retry budget") {
    TwoNodes n;
    n.files.put("data.bin", "0123456789");
    n.pump.drop = [](const PeerId&, const std::string& text) {
        return text.rfind("ZD|", 0) == 0;           // every chunk vanishes
    };

    REQUIRE(n.alice.initiate(peer("!b0b00002"), "data.bin", 0) == InitiateError::None);
    n.run([&] { return n.alice.sender().state() == SendState::Failed; });

    CHECK(n.alice.sender().state() == SendState::Failed);
    size_t chunk1_sent = 0;
    for (const auto& w : n.pump.wire) if (w.rfind("ZD|1|", 0) == 0) ++chunk1_sent;
    CHECK(chunk1_sent == 1 + 3);                      // first try plus max_retries
    REQUIRE(n.pump.done.size() == 1);
    CHECK_FALSE(n.pump.done[0].ok);

    CHECK(n.bob.receiver().state() == RecvState::Receiving);   // no stall guard by default
    CHECK(n.pump.written.empty());
}

TEST_CASE("Receiver stall guard gives up on an abandoned transfer") {
    TwoNodes n;
    n.settings.receive_stall_ms = 500;
    Core bob{n.settings, n.files};                  // settings are copied at construction
    n.pump.b.core = &bob;
    n.files.put("data.bin", "0123456789");
    n.pump.drop = [](const PeerId&, const std::string& text) {
        return text.rfind("ZD|2|", 0) == 0;
    };

    REQUIRE(n.alice.initiate(peer("!b0b00002"), "data.bin", 0) == InitiateError::None);
    n.run([&] {
        return n.alice.sender().state() == SendState::Failed
            && bob.receiver().state() == RecvState::Idle;
    });

    CHECK(n.alice.sender().state() == SendState::Failed);
    CHECK(bob.receiver().state() == RecvState::Idle);
    CHECK(n.pump.done.size() == 2);                   // one failure per side
    CHECK(n.pump.written.empty());
}

TEST_CASE("A read failure on the sender aborts the transfer") {
    TwoNodes n;
    n.files.put("data.bin", "0123456789");

    REQUIRE(n.alice.initiate(peer("!b0b00002"), "data.bin", 0) == InitiateError::None);
    n.run([&] { return n.alice.sender().session().current_chunk() == 2; });
    n.files.fail_reads(true);
    n.run([&] { return !n.pump.done.empty(); }, 2000);

    CHECK(n.alice.sender().state() == SendState::Failed);
    REQUIRE_FALSE(n.pump.done.empty());
    CHECK_FALSE(n.pump.done.back().ok);
}

TEST_CASE("An empty file is delivered as an empty file") {
    TwoNodes n;
    n.files.put("empty.txt", "");

    REQUIRE(n.alice.initiate(peer("!b0b00002"), "empty.txt", 0) == InitiateError::None);
    n.run([&] { return n.alice.sender().state() == SendState::Complete; }, 1000);

    CHECK(n.alice.sender().state() == SendState::Complete);
    REQUIRE(n.pump.written.size() == 1);
    CHECK(n.pump.written[0].bytes.empty());
}

TEST_CASE("Nodes send to each other in both directions at once") {
    TwoNodes n;
    n.files.put("a.txt", "from alice");
    n.files.put("b.txt", "from bob, longer");

    REQUIRE(n.alice.initiate(peer("!b0b00002"), "a.txt", 0) == InitiateError::None);
    REQUIRE(n.bob.initiate(peer("!a11ce001"), "b.txt", 0) == InitiateError::None);
    n.run([&] {
        return n.alice.sender().state() == SendState::Complete
            && n.bob.sender().state() == SendState::Complete;
    });

    CHECK(n.alice.sender().state() == SendState::Complete);
    CHECK(n.bob.sender().state() == SendState::Complete);
    REQUIRE(n.pump.written.size() == 2);
    std::set<std::string> got;
    for (const auto& w : n.pump.written) got.insert(content_of(w));
    CHECK(got.count("from alice") == 1);
    CHECK(got.count("from bob, longer") == 1);
}
