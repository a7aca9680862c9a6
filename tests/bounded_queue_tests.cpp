#include <pipeline/bounded_queue.hpp>
#include <pipeline/types.hpp>

#include <test_support.hpp>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using bgs_test::check;

namespace {
    bgs::FramePtr frame(uint64_t seq) {
        return bgs::make_frame(seq, static_cast<int64_t>(seq) * 1000, cv::Mat(2, 2, CV_8UC3, cv::Scalar::all(0)));
    }

    std::vector<uint64_t> drain(bgs::BoundedQueue<bgs::FramePtr>& q) {
        std::vector<uint64_t> out;
        bgs::FramePtr f;
        while (q.try_pop(f)) out.push_back(f->sequence);
        return out;
    }

    void test_overflow_keeps_newest_oldest_first() {
        bgs::BoundedQueue<bgs::FramePtr> q(3);
        for (uint64_t s = 1; s <= 10; ++s) check(q.push_drop_oldest(frame(s)), "push on an open queue should succeed");

        check(q.size() == 3, "queue should hold exactly capacity items");
        check(q.dropped() == 7, "every overflow should be counted as a drop");
        const auto got = drain(q);
        check(got == std::vector<uint64_t>({8, 9, 10}), "queue should keep the 3 newest frames, oldest first");
    }

    void test_capacity_two_drops_first_frame() {
        bgs::BoundedQueue<bgs::FramePtr> q(2);
        q.push_drop_oldest(frame(1));
        q.push_drop_oldest(frame(2));
        q.push_drop_oldest(frame(3));

        const auto got = drain(q);
        check(got == std::vector<uint64_t>({2, 3}), "C=2 with 1,2,3 enqueued should hold {2,3}");
    }

    void test_close_drains_buffered_and_refuses_new() {
        bgs::BoundedQueue<bgs::FramePtr> q(4);
        q.push_drop_oldest(frame(9));
        q.push_drop_oldest(frame(10));
        q.close();

        check(!q.push_drop_oldest(frame(11)), "push after close should be refused");
        check(!q.finished(), "closed queue with items is not finished");

        bgs::FramePtr f;
        check(q.pop_for(f, std::chrono::milliseconds(10)) && f->sequence == 9, "closed queue should still yield 9");
        check(q.pop_for(f, std::chrono::milliseconds(10)) && f->sequence == 10, "closed queue should still yield 10");
        check(!q.pop_for(f, std::chrono::milliseconds(10)), "nothing after the buffered frames");
        check(q.finished(), "closed and empty queue is finished");
    }

    void test_pop_for_times_out_when_empty() {
        bgs::BoundedQueue<bgs::FramePtr> q(1);
        bgs::FramePtr f;
        const auto t0 = std::chrono::steady_clock::now();
        check(!q.pop_for(f, std::chrono::milliseconds(30)), "pop_for on an empty queue should time out");
        check(std::chrono::steady_clock::now() - t0 >= std::chrono::milliseconds(25), "pop_for should wait for the timeout");
    }

    void test_close_wakes_blocked_consumer() {
        bgs::BoundedQueue<bgs::FramePtr> q(1);
        std::atomic<bool> returned{false};
        std::thread t([&] {
            bgs::FramePtr f;
            q.pop_for(f, std::chrono::seconds(10));
            returned = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        q.close();
        t.join();
        check(returned, "close() should wake a waiting consumer");
    }

    void test_stop_discards_everything() {
        bgs::BoundedQueue<bgs::FramePtr> q(2);
        q.push_drop_oldest(frame(1));
        q.stop();
        bgs::FramePtr f;
        check(!q.try_pop(f), "stopped queue yields nothing");
        check(!q.push_drop_oldest(frame(2)), "stopped queue accepts nothing");
        check(q.finished(), "stopped queue is finished");
    }

    void test_closed_intake_gate_refuses_push() {
        bgs::BoundedQueue<bgs::FramePtr> q(4);
        std::atomic<bool> open{true};
        q.set_intake_gate([&open] { return open.load(); });

        check(q.push_drop_oldest(frame(1)), "open gate should let the push through");
        open = false;
        check(!q.push_drop_oldest(frame(2)), "closed gate should refuse the push");
        check(q.closed(), "closed gate should close the queue");

        bgs::FramePtr f;
        check(q.try_pop(f) && f->sequence == 1, "frame pushed before the gate closed should stay poppable");
        check(!q.try_pop(f), "frame refused by the gate should never be popped");
    }

    void test_concurrent_order_is_strictly_increasing() {
        bgs::BoundedQueue<bgs::FramePtr> q(2);
        constexpr uint64_t kFrames = 2000;

        std::thread producer([&] {
            for (uint64_t s = 0; s < kFrames; ++s) q.push_drop_oldest(frame(s));
            q.close();
        });

        std::vector<uint64_t> seen;
        bgs::FramePtr f;
        while (!q.finished()) {
            if (q.pop_for(f, std::chrono::milliseconds(50))) seen.push_back(f->sequence);
        }
        producer.join();

        bool increasing = true;
        for (size_t i = 1; i < seen.size(); ++i) {
            if (seen[i] <= seen[i - 1]) increasing = false;
        }
        check(!seen.empty(), "consumer should see some frames");
        check(increasing, "consumer should see a strictly increasing subsequence");
        check(seen.back() == kFrames - 1, "the newest frame should always survive");
        check(seen.size() + q.dropped() == kFrames, "every frame is either delivered or counted as dropped");
    }
}

int main() {
    test_overflow_keeps_newest_oldest_first();
    test_capacity_two_drops_first_frame();
    test_close_drains_buffered_and_refuses_new();
    test_pop_for_times_out_when_empty();
    test_close_wakes_blocked_consumer();
    test_stop_discards_everything();
    test_closed_intake_gate_refuses_push();
    test_concurrent_order_is_strictly_increasing();
    return bgs_test::finish("bounded queue");
}
