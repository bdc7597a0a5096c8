#include <doctest/doctest.h>
#include "fakes.hpp"
#include "meshz/sender.hpp"

using namespace meshz;
using namespace meshz_test;

namespace {

struct SenderRig {
    Settings settings;
    MemoryChunkSource files;
    etl::deque<Action, 64> outbox;
    TransferCoordinator tx{settings, files, outbox};

    explicit SenderRig(uint32_t chunk = 4) { settings.chunk_size = chunk; }

    std::vector<Action> take() {
        std::vector<Action> out;
        while (!outbox.empty()) {
            out.push_back(outbox.front());
            outbox.pop_front();
        }
        return out;
    }
};

const PeerId BOB = peer("!b0b00001");
const PeerId EVE = peer("!e5e00002");

} // namespace

TEST_CASE("Two-chunk file goes Request, Ack, chunk 1, chunk 2, Complete") {
    SenderRig r;
    r.files.put("/tmp/ab.bin", "ABCDEFGH");

    REQUIRE(r.tx.initiate(BOB, "/tmp/ab.bin", 100) == InitiateError::None);
    CHECK(r.tx.state() == SendState::RequestSent);
    CHECK(r.tx.session().total_chunks() == 2);
    CHECK(r.tx.session().last_ack_ms() == 100);

    auto out = r.take();
    auto sends = of_kind(out, ActionKind::SendText);
    REQUIRE(sends.size() == 1);
    CHECK(sends[0].peer == BOB);
    CHECK(std::string(sends[0].text.c_str()) == "MESHZ_REQ|ab.bin|8|2");
    auto prog = of_kind(out, ActionKind::Progress);
    REQUIRE(prog.size() == 1);
    CHECK(prog[0].current == 0);
    CHECK(prog[0].total == 2);

    r.tx.on_ack(BOB, 200);
    CHECK(r.tx.state() == SendState::Sending);
    out = r.take();
    auto chunks = of_kind(out, ActionKind::SendChunk);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].index == 1);
    CHECK(chunks[0].offset == 0);
    CHECK(chunks[0].length == 4);
    CHECK(chunks[0].path == PathStr("/tmp/ab.bin"));

    r.tx.on_chunk_ack(BOB, 1, 300);
    out = r.take();
    chunks = of_kind(out, ActionKind::SendChunk);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].index == 2);
    CHECK(chunks[0].offset == 4);
    CHECK(chunks[0].length == 4);
    CHECK(r.tx.session().last_ack_ms() == 300);

    r.tx.on_chunk_ack(BOB, 2, 400);
    CHECK(r.tx.state() == SendState::Complete);
    CHECK_FALSE(r.tx.session().active());
    out = r.take();
    CHECK(of_kind(out, ActionKind::SendChunk).empty());
    auto done = of_kind(out, ActionKind::TransferDone);
    REQUIRE(done.size() == 1);
    CHECK(done[0].ok);
    CHECK(of_kind(out, ActionKind::ProgressDone).size() == 1);
}

TEST_CASE("Chunk count is the ceiling of size over chunk size") {
    SenderRig r(4);
    r.files.put("exact", "12345678");
    r.files.put("short", "123456789");
    r.files.put("one", "1");

    REQUIRE(r.tx.initiate(BOB, "exact", 0) == InitiateError::None);
    CHECK(r.tx.session().total_chunks() == 2);
    REQUIRE(r.tx.initiate(BOB, "short", 0) == InitiateError::None);
    CHECK(r.tx.session().total_chunks() == 3);
    CHECK(r.tx.session().chunk_length(3) == 1);
    CHECK(r.tx.session().chunk_offset(3) == 8);
    REQUIRE(r.tx.initiate(BOB, "one", 0) == InitiateError::None);
    CHECK(r.tx.session().total_chunks() == 1);
}

TEST_CASE("Acks from the wrong peer or for the wrong chunk change nothing") {
    SenderRig r;
    r.files.put("f", "ABCDEFGHIJKL");   // 3 chunks
    REQUIRE(r.tx.initiate(BOB, "f", 0) == InitiateError::None);

    r.tx.on_chunk_ack(BOB, 1, 10);               // premature: still RequestSent
    CHECK(r.tx.state() == SendState::RequestSent);

    r.tx.on_ack(EVE, 10);                        // not our target
    CHECK(r.tx.state() == SendState::RequestSent);

    r.tx.on_ack(BOB, 20);
    REQUIRE(r.tx.state() == SendState::Sending);
    r.take();

    r.tx.on_chunk_ack(EVE, 1, 30);               // wrong peer
    r.tx.on_chunk_ack(BOB, 2, 30);               // premature
    r.tx.on_chunk_ack(BOB, 0, 30);               // stale
    CHECK(r.tx.session().current_chunk() == 1);
    CHECK(r.tx.session().last_ack_ms() == 20);

    auto out = r.take();
    CHECK(of_kind(out, ActionKind::SendChunk).empty());
    CHECK(has_log(out, LogLevel::Debug, "ignored chunk ack"));

    r.tx.on_chunk_ack(BOB, 1, 40);
    CHECK(r.tx.session().current_chunk() == 2);
    r.tx.on_chunk_ack(BOB, 1, 50);               // duplicate of an older ack
    CHECK(r.tx.session().current_chunk() == 2);

    r.tx.on_ack(BOB, 60);                        // late second Ack
    CHECK(r.tx.session().current_chunk() == 2);
    CHECK(r.tx.state() == SendState::Sending);
}

TEST_CASE("initiate() rejects missing target and unusable files") {
    SenderRig r;
    r.files.put("/data/ok.txt", "x");
    r.files.put("/data/bad|name", "x");
    r.files.put("/data/", "x");

    CHECK(r.tx.initiate(PeerId(), "/data/ok.txt", 0) == InitiateError::InvalidTarget);
    CHECK(r.tx.initiate(BOB, "", 0) == InitiateError::InvalidFile);
    CHECK(r.tx.initiate(BOB, nullptr, 0) == InitiateError::InvalidFile);
    CHECK(r.tx.initiate(BOB, "/data/missing", 0) == InitiateError::InvalidFile);
    CHECK(r.tx.initiate(BOB, "/data/bad|name", 0) == InitiateError::InvalidFile);
    CHECK(r.tx.initiate(BOB, "/data/", 0) == InitiateError::InvalidFile);
    CHECK(r.tx.state() == SendState::Idle);

    auto out = r.take();
    CHECK(of_kind(out, ActionKind::SendText).empty());
    CHECK(has_log(out, LogLevel::Error, "send refused"));
}

TEST_CASE("A new initiate() replaces the running session") {
    SenderRig r;
    r.files.put("first", "AAAAAAAAAAAA");
    r.files.put("second", "BB");
    REQUIRE(r.tx.initiate(BOB, "first", 0) == InitiateError::None);
    r.tx.on_ack(BOB, 10);
    r.tx.on_chunk_ack(BOB, 1, 20);
    REQUIRE(r.tx.session().current_chunk() == 2);
    r.take();

    REQUIRE(r.tx.initiate(EVE, "second", 30) == InitiateError::None);
    CHECK(r.tx.state() == SendState::RequestSent);
    CHECK(r.tx.session().target() == EVE);
    CHECK(r.tx.session().current_chunk() == 0);
    CHECK(r.tx.session().retry_count() == 0);
    CHECK(r.tx.session().total_chunks() == 1);

    r.tx.on_chunk_ack(BOB, 2, 40);               // belongs to the old session
    CHECK(r.tx.state() == SendState::RequestSent);
}

TEST_CASE("Chunks carry the id of their session; a resend keeps it") {
    SenderRig r;
    r.files.put("/tmp/a.txt", "v1");
    REQUIRE(r.tx.initiate(BOB, "/tmp/a.txt", 0) == InitiateError::None);
    const uint32_t first = r.tx.session().id();
    r.tx.on_ack(BOB, 10);
    r.tx.retry_current_chunk();
    auto chunks = of_kind(r.take(), ActionKind::SendChunk);
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[0].session == first);
    CHECK(chunks[1].session == first);
    r.tx.on_chunk_ack(BOB, 1, 20);
    REQUIRE(r.tx.state() == SendState::Complete);

    // Same path, same peer, new content: a new session.
    r.files.put("/tmp/a.txt", "v2xyz");
    REQUIRE(r.tx.initiate(BOB, "/tmp/a.txt", 30) == InitiateError::None);
    CHECK(r.tx.session().id() != first);
    r.tx.on_ack(BOB, 40);
    chunks = of_kind(r.take(), ActionKind::SendChunk);
    REQUIRE(chunks.size() == 1);
    CHECK(chunks[0].session == r.tx.session().id());
    CHECK(chunks[0].index == 1);
    CHECK(chunks[0].length == 4);
}

TEST_CASE("An empty file completes as soon as the peer accepts it") {
    SenderRig r;
    r.files.put("empty", "");
    REQUIRE(r.tx.initiate(BOB, "empty", 0) == InitiateError::None);
    CHECK(r.tx.session().total_chunks() == 0);

    r.tx.on_ack(BOB, 5);
    CHECK(r.tx.state() == SendState::Complete);
    auto out = r.take();
    CHECK(of_kind(out, ActionKind::SendChunk).empty());
    REQUIRE(of_kind(out, ActionKind::TransferDone).size() == 1);
    CHECK(of_kind(out, ActionKind::TransferDone)[0].ok);
}

TEST_CASE("A failed chunk read aborts the session") {
    SenderRig r;
    r.files.put("f", "ABCDEFGH");
    REQUIRE(r.tx.initiate(BOB, "f", 0) == InitiateError::None);
    r.tx.on_ack(BOB, 1);
    r.take();

    r.tx.on_chunk_read_failed(2);                // not the chunk in flight
    CHECK(r.tx.state() == SendState::Sending);

    r.tx.on_chunk_read_failed(1);
    CHECK(r.tx.state() == SendState::Failed);
    CHECK_FALSE(r.tx.session().active());
    auto out = r.take();
    CHECK(has_log(out, LogLevel::Error, "chunk 1 read failed"));
    auto done = of_kind(out, ActionKind::TransferDone);
    REQUIRE(done.size() == 1);
    CHECK_FALSE(done[0].ok);

    r.tx.on_chunk_ack(BOB, 1, 2);                // too late
    CHECK(r.tx.state() == SendState::Failed);
}
