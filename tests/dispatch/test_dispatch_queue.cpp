/*
===============================================================================
 dispatch::DispatchQueue — Unit Tests
===============================================================================

Scope:
------
Pacing, deduplication, decode-at-delivery and lifecycle of the DispatchQueue.
All ticks use explicit time points; nothing sleeps.

-------------------------------------------------------------------------------
Covered Contracts
-------------------------------------------------------------------------------

Q1. At most one delivery per pacing interval
Q2. Ticks closer than the pacing check are ignored
Q3. Burst with KeepNewest: only the newest message is delivered
Q4. Burst with NewestOfTwo: the second-oldest wins, the rest stays queued
Q5. A reconnect tag on a dropped message carries over to the delivered one
Q6. stop() drops the buffer, is idempotent, and start() resumes pacing
Q7. Decode failures are reported and do not stop the queue
Q8. A throwing update handler does not stop the queue, whatever it throws
Q9. Re-entrant poll() from the update handler is ignored (single flight)
Q10. A queue that was never started delivers nothing

===============================================================================
*/

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "livestand/dispatch/queue.hpp"
#include "common/snapshot_builder.hpp"
#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace livestand;
using namespace livestand::dispatch;
using namespace std::chrono_literals;

using protocol::parser::Result;
using clock_t_ = DispatchQueue::clock;


// Payload whose tournament id identifies it in the handler
static std::string payload(const std::string& tag) {
    test::SnapshotBuilder b;
    b.tournament_id = tag;
    b.team("ALP", 11, 1);
    return b.json();
}

struct Delivery {
    std::string tag;
    bool        reconnecting;
};

static void record_into(DispatchQueue& q, std::vector<Delivery>& out) {
    q.on_update([&out](const schema::MatchSnapshot& s, bool reconnecting) {
        out.push_back(Delivery{s.tournament_id, reconnecting});
    });
}


// -----------------------------------------------------------------------------
// Q1. Pacing interval
// -----------------------------------------------------------------------------
void test_pacing_interval() {
    std::cout << "[TEST] Q1: one delivery per pacing interval\n";

    DispatchQueue q;
    std::vector<Delivery> got;
    record_into(q, got);
    const auto t0 = clock_t_::now();
    q.start(t0);

    q.enqueue(QueuedMessage{false, payload("A")});
    TEST_CHECK(q.poll(t0 + 100ms) == Result::Ignored);
    TEST_CHECK(q.poll(t0 + 1400ms) == Result::Ignored);
    TEST_CHECK(got.empty());

    TEST_CHECK(q.poll(t0 + 1500ms) == Result::Delivered);
    TEST_CHECK(got.size() == 1);
    TEST_CHECK(got[0].tag == "A");
    TEST_CHECK(q.last_delivery() == t0 + 1500ms);

    q.enqueue(QueuedMessage{false, payload("B")});
    TEST_CHECK(q.poll(t0 + 1600ms) == Result::Ignored);
    TEST_CHECK(q.poll(t0 + 2900ms) == Result::Ignored);
    TEST_CHECK(q.poll(t0 + 3000ms) == Result::Delivered);
    TEST_CHECK(got.size() == 2);
    TEST_CHECK(got[1].tag == "B");

    // Empty queue: nothing to deliver, window stays open
    TEST_CHECK(q.poll(t0 + 5000ms) == Result::Ignored);
    q.enqueue(QueuedMessage{false, payload("C")});
    TEST_CHECK(q.poll(t0 + 5100ms) == Result::Delivered);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q2. Pacing check granularity
// -----------------------------------------------------------------------------
void test_pacing_check() {
    std::cout << "[TEST] Q2: ticks faster than the pacing check are ignored\n";

    DispatchQueue q;
    std::vector<Delivery> got;
    record_into(q, got);
    const auto t0 = clock_t_::now();
    q.start(t0);

    TEST_CHECK(q.poll(t0 + 1450ms) == Result::Ignored);
    q.enqueue(QueuedMessage{false, payload("A")});
    TEST_CHECK(q.poll(t0 + 1500ms) == Result::Ignored);   // 50 ms after the last check
    TEST_CHECK(got.empty());
    TEST_CHECK(q.poll(t0 + 1550ms) == Result::Delivered);
    TEST_CHECK(got.size() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q3. KeepNewest
// -----------------------------------------------------------------------------
void test_burst_keep_newest() {
    std::cout << "[TEST] Q3: burst delivers the newest message only\n";

    DispatchQueue q;
    std::vector<Delivery> got;
    record_into(q, got);
    const auto t0 = clock_t_::now();
    q.start(t0);

    // Three messages within 10 ms
    q.enqueue(QueuedMessage{false, payload("m1")});
    q.enqueue(QueuedMessage{false, payload("m2")});
    q.enqueue(QueuedMessage{false, payload("m3")});
    TEST_CHECK(q.size() == 3);

    TEST_CHECK(q.poll(t0 + 1500ms) == Result::Delivered);
    TEST_CHECK(got.size() == 1);
    TEST_CHECK(got[0].tag == "m3");
    TEST_CHECK(q.size() == 0);

    TEST_CHECK(q.poll(t0 + 3000ms) == Result::Ignored);
    TEST_CHECK(got.size() == 1);

#ifdef LIVESTAND_ENABLE_TELEMETRY_L1
    TEST_CHECK(q.telemetry().enqueued_total.load() == 3);
    TEST_CHECK(q.telemetry().deduplicated_total.load() == 2);
    TEST_CHECK(q.telemetry().delivered_total.load() == 1);
#endif

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q4. NewestOfTwo
// -----------------------------------------------------------------------------
void test_burst_newest_of_two() {
    std::cout << "[TEST] Q4: newest-of-two dedup\n";

    Config cfg;
    cfg.dedup = DedupPolicy::NewestOfTwo;
    DispatchQueue q(cfg);
    std::vector<Delivery> got;
    record_into(q, got);
    const auto t0 = clock_t_::now();
    q.start(t0);

    q.enqueue(QueuedMessage{false, payload("m1")});
    q.enqueue(QueuedMessage{false, payload("m2")});
    q.enqueue(QueuedMessage{false, payload("m3")});

    TEST_CHECK(q.poll(t0 + 1500ms) == Result::Delivered);
    TEST_CHECK(got.size() == 1);
    TEST_CHECK(got[0].tag == "m2");
    TEST_CHECK(q.size() == 1);

    TEST_CHECK(q.poll(t0 + 3000ms) == Result::Delivered);
    TEST_CHECK(got.size() == 2);
    TEST_CHECK(got[1].tag == "m3");
    TEST_CHECK(q.size() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q5. Reconnect tag carry-over
// -----------------------------------------------------------------------------
void test_reconnect_tag_carry_over() {
    std::cout << "[TEST] Q5: reconnect tag survives dedup\n";

    for (auto policy : {DedupPolicy::KeepNewest, DedupPolicy::NewestOfTwo}) {
        Config cfg;
        cfg.dedup = policy;
        DispatchQueue q(cfg);
        std::vector<Delivery> got;
        record_into(q, got);
        const auto t0 = clock_t_::now();
        q.start(t0);

        q.enqueue(QueuedMessage{true, payload("first-after-reconnect")});
        q.enqueue(QueuedMessage{false, payload("second")});

        TEST_CHECK(q.poll(t0 + 1500ms) == Result::Delivered);
        TEST_CHECK(got.size() == 1);
        TEST_CHECK(got[0].tag == "second");
        TEST_CHECK(got[0].reconnecting);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q6. stop()
// -----------------------------------------------------------------------------
void test_stop_drops_buffer() {
    std::cout << "[TEST] Q6: stop() drops buffered messages\n";

    DispatchQueue q;
    std::vector<Delivery> got;
    record_into(q, got);
    const auto t0 = clock_t_::now();
    q.start(t0);
    TEST_CHECK(q.is_running());

    q.enqueue(QueuedMessage{false, payload("A")});
    q.enqueue(QueuedMessage{false, payload("B")});
    q.stop();
    TEST_CHECK(!q.is_running());
    TEST_CHECK(q.size() == 0);
    TEST_CHECK(q.poll(t0 + 5000ms) == Result::Ignored);
    TEST_CHECK(got.empty());

    // Idempotent
    q.stop();
    TEST_CHECK(!q.is_running());

    // Restart: a full interval from the restart time
    q.start(t0 + 10s);
    q.enqueue(QueuedMessage{false, payload("C")});
    TEST_CHECK(q.poll(t0 + 10s + 1400ms) == Result::Ignored);
    TEST_CHECK(q.poll(t0 + 10s + 1500ms) == Result::Delivered);
    TEST_CHECK(got.size() == 1);
    TEST_CHECK(got[0].tag == "C");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q7. Decode failure
// -----------------------------------------------------------------------------
void test_decode_failure_continues() {
    std::cout << "[TEST] Q7: decode failure does not stop the queue\n";

    DispatchQueue q;
    std::vector<Delivery> got;
    record_into(q, got);
    const auto t0 = clock_t_::now();
    q.start(t0);

    q.enqueue(QueuedMessage{false, "{not json"});
    TEST_CHECK(q.poll(t0 + 1500ms) == Result::InvalidJson);
    TEST_CHECK(got.empty());
    TEST_CHECK(q.is_running());

    q.enqueue(QueuedMessage{false, R"({"matchId":"AQID","tournamentId":"t"})"});
    TEST_CHECK(q.poll(t0 + 3000ms) == Result::InvalidSchema);

    q.enqueue(QueuedMessage{false, payload("ok")});
    TEST_CHECK(q.poll(t0 + 4500ms) == Result::Delivered);
    TEST_CHECK(got.size() == 1);
    TEST_CHECK(got[0].tag == "ok");

#ifdef LIVESTAND_ENABLE_TELEMETRY_L1
    TEST_CHECK(q.telemetry().decode_failures_total.load() == 2);
#endif

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q8. Throwing handler
// -----------------------------------------------------------------------------
void test_handler_exception() {
    std::cout << "[TEST] Q8: throwing handler does not stop the queue\n";

    DispatchQueue q;
    int calls = 0;
    q.on_update([&calls](const schema::MatchSnapshot&, bool) {
        ++calls;
        throw std::runtime_error("renderer unavailable");
    });
    const auto t0 = clock_t_::now();
    q.start(t0);

    q.enqueue(QueuedMessage{false, payload("A")});
    TEST_CHECK(q.poll(t0 + 1500ms) == Result::Delivered);
    q.enqueue(QueuedMessage{false, payload("B")});
    TEST_CHECK(q.poll(t0 + 3000ms) == Result::Delivered);
    TEST_CHECK(calls == 2);
    TEST_CHECK(q.is_running());

    // Non-standard exception types are contained as well
    DispatchQueue q2;
    int calls2 = 0;
    q2.on_update([&calls2](const schema::MatchSnapshot&, bool) {
        ++calls2;
        throw 42;
    });
    q2.start(t0);
    q2.enqueue(QueuedMessage{false, payload("C")});
    TEST_CHECK(q2.poll(t0 + 1500ms) == Result::Delivered);
    q2.enqueue(QueuedMessage{false, payload("D")});
    TEST_CHECK(q2.poll(t0 + 3000ms) == Result::Delivered);
    TEST_CHECK(calls2 == 2);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q9. Single flight
// -----------------------------------------------------------------------------
void test_single_flight() {
    std::cout << "[TEST] Q9: re-entrant poll() is ignored\n";

    DispatchQueue q;
    const auto t0 = clock_t_::now();
    Result inner = Result::Delivered;
    int calls = 0;
    q.on_update([&](const schema::MatchSnapshot&, bool) {
        ++calls;
        inner = q.poll(t0 + 60s);
    });
    q.start(t0);

    q.enqueue(QueuedMessage{false, payload("A")});
    q.enqueue(QueuedMessage{false, payload("B")});

    TEST_CHECK(q.poll(t0 + 1500ms) == Result::Delivered);
    TEST_CHECK(calls == 1);
    TEST_CHECK(inner == Result::Ignored);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Q10. Not started
// -----------------------------------------------------------------------------
void test_not_started() {
    std::cout << "[TEST] Q10: no delivery before start()\n";

    DispatchQueue q;
    std::vector<Delivery> got;
    record_into(q, got);
    const auto t0 = clock_t_::now();

    q.enqueue(QueuedMessage{false, payload("A")});
    TEST_CHECK(q.size() == 1);
    TEST_CHECK(q.poll(t0 + 60s) == Result::Ignored);
    TEST_CHECK(got.empty());

    q.clear();
    TEST_CHECK(q.size() == 0);

    std::cout << "[TEST] OK\n";
}


int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_pacing_interval();
    test_pacing_check();
    test_burst_keep_newest();
    test_burst_newest_of_two();
    test_reconnect_tag_carry_over();
    test_stop_drops_buffer();
    test_decode_failure_continues();
    test_handler_exception();
    test_single_flight();
    test_not_started();

    std::cout << "\n[DISPATCH QUEUE TESTS PASSED]\n";
    return 0;
}
