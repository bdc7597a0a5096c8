#include <doctest/doctest.h>
#include <chrono>
#include <set>
#include <string>
#include "fakes.hpp"
#include "meshz/station.hpp"

using namespace meshz;
using namespace meshz_test;
using namespace std::chrono_literals;

namespace {

Settings quick_settings() {
    Settings s;
    s.chunk_size = 8;
    s.ack_timeout_ms = 200;
    s.watchdog_interval_ms = 20;
    s.max_retries = 5;
    return s;
}

StationOptions quick_options() {
    StationOptions o;
    o.loop_ms = 2;
    o.peer_wait_ms = 50;
    return o;                      // no peers_file: roster stays in memory
}

// One radio node: link, files, screen, roster and the station on top.
struct Node {
    LoopbackLink       link;
    MemoryChunkSource  files;
    MemoryFileSink     sink;
    RecordingPresenter screen;
    PeerDirectory      roster;
    Station            station;

    Node(Air& air, const char* id, const char* name, const Settings& s = quick_settings())
    : link(air, id, name),
      station(s, quick_options(), link, files, sink, screen, roster) {}
};

} // namespace

TEST_CASE("Station delivers a file to another station") {
    Air air;
    Node alice(air, "!a11ce001", "alice");
    Node bob(air, "!b0b00002", "bob");
    alice.files.put("/src/report.txt", "quarterly numbers, all of them");

    REQUIRE(alice.station.start());
    REQUIRE(bob.station.start());

    REQUIRE(alice.station.select_target("!b0b00002"));
    REQUIRE(alice.station.select_file("/src/report.txt"));
    REQUIRE(alice.station.send_requested() == InitiateError::None);

    CHECK(alice.station.wait_send_finished(5000ms) == SendState::Complete);
    REQUIRE(eventually([&] { return bob.station.files_received() == 1; }));

    const auto got = bob.sink.files();
    REQUIRE(got.size() == 1);
    CHECK(got[0].name == "report.txt");
    CHECK(std::string(got[0].bytes.begin(), got[0].bytes.end()) == "quarterly numbers, all of them");
    CHECK(alice.screen.done_count(true) == 1);
    CHECK(bob.screen.logged("saved mem:report.txt"));

    alice.station.stop();
    bob.station.stop();
    CHECK_FALSE(alice.station.running());
}

TEST_CASE("Station recovers from dropped chunks with resent identical text") {
    Air air;
    std::set<std::string> seen;
    air.drop = [&](const std::string&, const std::string& text) {
        if (text.rfind("ZD|", 0) != 0) return false;
        return seen.insert(text).second;               // every chunk lost once
    };
    Node alice(air, "!a11ce001", "alice");
    Node bob(air, "!b0b00002", "bob");
    alice.files.put("/src/a.bin", "0123456789abcdefghij");   // 3 chunks of 8

    REQUIRE(alice.station.start());
    REQUIRE(bob.station.start());
    REQUIRE(alice.station.select_target("!b0b00002"));
    REQUIRE(alice.station.select_file("/src/a.bin"));
    REQUIRE(alice.station.send_requested() == InitiateError::None);

    CHECK(alice.station.wait_send_finished(10000ms) == SendState::Complete);
    REQUIRE(eventually([&] { return bob.station.files_received() == 1; }));
    CHECK(std::string(bob.sink.files()[0].bytes.begin(), bob.sink.files()[0].bytes.end())
          == "0123456789abcdefghij");
    CHECK(seen.size() == 3);                           // a resend is byte-identical
    CHECK(alice.files.reads() == 3);                   // and served from the cache
}

TEST_CASE("Sending an edited file again delivers the new bytes") {
    Air air;
    Node alice(air, "!a11ce001", "alice");
    Node bob(air, "!b0b00002", "bob");
    alice.files.put("/src/a.txt", "v1");

    REQUIRE(alice.station.start());
    REQUIRE(bob.station.start());
    REQUIRE(alice.station.select_target("!b0b00002"));
    REQUIRE(alice.station.select_file("/src/a.txt"));
    REQUIRE(alice.station.send_requested() == InitiateError::None);
    REQUIRE(alice.station.wait_send_finished(5000ms) == SendState::Complete);
    REQUIRE(eventually([&] { return bob.station.files_received() == 1; }));

    alice.files.put("/src/a.txt", "v2xyz");
    REQUIRE(alice.station.send_requested() == InitiateError::None);
    CHECK(alice.station.wait_send_finished(5000ms) == SendState::Complete);
    REQUIRE(eventually([&] { return bob.station.files_received() == 2; }));

    const auto got = bob.sink.files();
    REQUIRE(got.size() == 2);
    CHECK(std::string(got[0].bytes.begin(), got[0].bytes.end()) == "v1");
    CHECK(std::string(got[1].bytes.begin(), got[1].bytes.end()) == "v2xyz");
    CHECK_FALSE(bob.screen.logged("size mismatch"));
    CHECK(alice.files.reads() == 2);
}

TEST_CASE("Station fails the send when chunks cannot be read") {
    Air air;
    Node alice(air, "!a11ce001", "alice");
    Node bob(air, "!b0b00002", "bob");
    alice.files.put("/src/gone.bin", "soon to vanish");
    alice.files.fail_reads(true);

    REQUIRE(alice.station.start());
    REQUIRE(bob.station.start());
    REQUIRE(alice.station.select_target("!b0b00002"));
    REQUIRE(alice.station.select_file("/src/gone.bin"));
    REQUIRE(alice.station.send_requested() == InitiateError::None);

    CHECK(alice.station.wait_send_finished(5000ms) == SendState::Failed);
    CHECK(eventually([&] { return alice.screen.done_count(false) == 1; }));
    CHECK(alice.screen.logged("chunk 1 read failed"));
}

TEST_CASE("Station reports a failed write on the receiving side") {
    Air air;
    Node alice(air, "!a11ce001", "alice");
    Node bob(air, "!b0b00002", "bob");
    alice.files.put("/src/x.txt", "x");
    bob.sink.fail_writes(true);

    REQUIRE(alice.station.start());
    REQUIRE(bob.station.start());
    REQUIRE(alice.station.select_target("!b0b00002"));
    REQUIRE(alice.station.select_file("/src/x.txt"));
    REQUIRE(alice.station.send_requested() == InitiateError::None);

    CHECK(alice.station.wait_send_finished(5000ms) == SendState::Complete);
    CHECK(eventually([&] { return bob.screen.done_count(false) == 1; }));
    CHECK(bob.screen.logged("write failed: disk full"));
    CHECK(bob.station.files_received() == 0);
}

TEST_CASE("Peer refresh fills the roster so targets resolve by name") {
    Air air;
    Node alice(air, "!a11ce001", "alice");
    Node bob(air, "!b0b00002", "bob");
    REQUIRE(alice.station.start());

    CHECK_FALSE(alice.station.select_target("bob"));
    CHECK(alice.screen.logged("unknown peer: bob"));

    REQUIRE(alice.station.refresh_peers());
    REQUIRE(eventually([&] { return alice.screen.peer_update_count() == 1; }));
    REQUIRE(alice.station.select_target("BOB"));
    {
        std::lock_guard<std::mutex> lk(alice.screen.mu_);
        CHECK(alice.screen.target == "!b0b00002");
        REQUIRE(alice.screen.peers.size() == 1);
        CHECK(alice.screen.peers[0].online);
    }
}

TEST_CASE("Station refuses to start on an unavailable link") {
    Air air;
    Node alice(air, "!a11ce001", "alice");
    alice.link.refuse_open = true;
    CHECK_FALSE(alice.station.start());
    CHECK_FALSE(alice.station.running());
    CHECK(alice.screen.logged("link unavailable: loopback"));
}

TEST_CASE("send_requested without selections reports why") {
    Air air;
    Node alice(air, "!a11ce001", "alice");
    alice.files.put("/src/x.txt", "x");
    REQUIRE(alice.station.start());

    CHECK(alice.station.send_requested() == InitiateError::InvalidTarget);
    REQUIRE(alice.station.select_target("!b0b00002"));
    CHECK(alice.station.send_requested() == InitiateError::InvalidFile);
    REQUIRE(alice.station.select_file("/src/missing.txt"));
    CHECK(alice.station.send_requested() == InitiateError::InvalidFile);
    CHECK(alice.station.send_state() == SendState::Idle);
}
