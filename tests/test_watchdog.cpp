#include <doctest/doctest.h>
#include "fakes.hpp"
#include "meshz/watchdog.hpp"

using namespace meshz;
using namespace meshz_test;

namespace {

struct WatchdogRig {
    Settings settings;
    MemoryChunkSource files;
    etl::deque<Action, 64> outbox;
    TransferCoordinator tx{settings, files, outbox};
    ReceiverAssembler rx{settings, outbox};
    Watchdog dog{settings};

    WatchdogRig() {
        settings.chunk_size = 4;
        settings.ack_timeout_ms = 30000;
        settings.watchdog_interval_ms = 1000;
        settings.max_retries = 5;
        files.put("f", "ABCDEFGH");
    }

    std::vector<Action> take() {
        std::vector<Action> out;
        while (!outbox.empty()) {
            out.push_back(outbox.front());
            outbox.pop_front();
        }
        return out;
    }

    // Request out at t=0, Ack back at t=0: chunk 1 is in flight.
    void chunk_one_in_flight() {
        REQUIRE(tx.initiate(peer("!b0b00001"), "f", 0) == InitiateError::None);
        tx.on_ack(peer("!b0b00001"), 0);
        take();
    }
};

} // namespace

TEST_CASE("Watchdog runs at most once per interval") {
    WatchdogRig r;
    CHECK_FALSE(r.dog.poll(0, r.tx, r.rx));
    CHECK_FALSE(r.dog.poll(999, r.tx, r.rx));
    CHECK(r.dog.poll(1000, r.tx, r.rx));
    CHECK_FALSE(r.dog.poll(1500, r.tx, r.rx));
    CHECK(r.dog.poll(2000, r.tx, r.rx));
    CHECK(r.dog.checks_run() == 2);
}

TEST_CASE("Timeout resends the same chunk and counts one retry") {
    WatchdogRig r;
    r.chunk_one_in_flight();

    CHECK(r.dog.poll(30000, r.tx, r.rx));        // exactly at the timeout: not yet
    CHECK(r.take().empty());
    CHECK(r.tx.session().retry_count() == 0);

    CHECK(r.dog.poll(31000, r.tx, r.rx));
    CHECK(r.tx.session().retry_count() == 1);
    CHECK(r.tx.state() == SendState::Sending);
    CHECK(r.tx.session().last_ack_ms() == 0);    // only a real ack moves it

    auto out = r.take();
    auto resend = of_kind(out, ActionKind::SendChunk);
    REQUIRE(resend.size() == 1);
    CHECK(resend[0].index == 1);
    CHECK(resend[0].offset == 0);
    CHECK(resend[0].length == 4);
    CHECK(has_log(out, LogLevel::Warn, "retrying chunk 1 (1/5)"));
}

TEST_CASE("Retries stop at max_retries and the send fails") {
    WatchdogRig r;
    r.settings.max_retries = 2;
    r.chunk_one_in_flight();

    int resends = 0;
    for (uint32_t t = 31000; t <= 40000; t += 1000) {
        r.dog.poll(t, r.tx, r.rx);
        resends += static_cast<int>(of_kind(r.take(), ActionKind::SendChunk).size());
        if (r.tx.state() == SendState::Failed) break;
    }
    CHECK(resends == 2);
    CHECK(r.tx.state() == SendState::Failed);
    CHECK_FALSE(r.tx.session().active());

    for (uint32_t t = 41000; t <= 45000; t += 1000) r.dog.poll(t, r.tx, r.rx);
    CHECK(of_kind(r.take(), ActionKind::SendChunk).empty());
}

TEST_CASE("A chunk ack resets the retry counter") {
    WatchdogRig r;
    r.chunk_one_in_flight();

    r.dog.poll(31000, r.tx, r.rx);
    REQUIRE(r.tx.session().retry_count() == 1);

    r.tx.on_chunk_ack(peer("!b0b00001"), 1, 31500);
    CHECK(r.tx.session().retry_count() == 0);
    CHECK(r.tx.session().current_chunk() == 2);
    r.take();

    r.dog.poll(32000, r.tx, r.rx);               // fresh ack: well inside the timeout
    CHECK(of_kind(r.take(), ActionKind::SendChunk).empty());
}

TEST_CASE("Watchdog leaves an unanswered Request alone") {
    WatchdogRig r;
    REQUIRE(r.tx.initiate(peer("!b0b00001"), "f", 0) == InitiateError::None);
    r.take();
    for (uint32_t t = 1000; t <= 200000; t += 1000) r.dog.poll(t, r.tx, r.rx);
    CHECK(r.tx.state() == SendState::RequestSent);
    CHECK(r.take().empty());
}

TEST_CASE("Watchdog drives the receiver stall guard") {
    WatchdogRig r;
    r.settings.receive_stall_ms = 5000;
    r.rx.on_request(peer("!a11ce001"), Frame::request("x", 8, 2), 0);
    r.take();

    r.dog.poll(4000, r.tx, r.rx);
    CHECK(r.rx.state() == RecvState::Receiving);
    r.dog.poll(5000, r.tx, r.rx);
    CHECK(r.rx.state() == RecvState::Idle);
}
