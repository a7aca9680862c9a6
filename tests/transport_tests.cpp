#include <transport/frame_receiver.hpp>
#include <transport/frame_sender.hpp>
#include <transport/wire_format.hpp>

#include <test_support.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

using bgs_test::check;

namespace {
    bgs::FramePtr frame(uint64_t seq) {
        return bgs::adopt_frame(seq, bgs::steady_now_ns(),
                                cv::Mat(12, 16, CV_8UC3, cv::Scalar::all(static_cast<double>(seq & 0xFF))));
    }

    bgs::FrameReceiver::Options any_port() {
        bgs::FrameReceiver::Options opt;
        opt.host = "127.0.0.1";
        opt.port = 0;
        return opt;
    }

    bgs::FrameSender::Options sender_options(int port, bgs::WireEncoding enc = bgs::WireEncoding::Raw) {
        bgs::FrameSender::Options opt;
        opt.host = "127.0.0.1";
        opt.port = port;
        opt.encoding = enc;
        opt.connect_retries = 3;
        opt.retry_delay_ms = 20;
        opt.request_timeout_ms = 1000;
        return opt;
    }

    std::vector<uint64_t> drain(bgs::BoundedQueue<bgs::FramePtr>& q) {
        std::vector<uint64_t> out;
        bgs::FramePtr f;
        while (q.try_pop(f)) out.push_back(f->sequence);
        return out;
    }

    httplib::Headers to_headers(const bgs::HeaderMap& h) {
        httplib::Headers out;
        for (const auto& kv : h) out.emplace(kv.first, kv.second);
        return out;
    }

    void test_frames_and_token_arrive_in_order() {
        bgs::BoundedQueue<bgs::FramePtr> inbox(16);
        bgs::ShutdownCoordinator processing_stop;
        bgs::FrameReceiver receiver(any_port(), inbox, processing_stop);
        check(receiver.start(), "receiver should bind an ephemeral port");

        bgs::BoundedQueue<bgs::FramePtr> outbox(16);
        bgs::ShutdownCoordinator capture_stop;
        bgs::FrameSender sender(sender_options(receiver.port()), outbox, capture_stop);
        check(sender.connect(), "sender should reach the receiver");

        for (uint64_t s = 1; s <= 5; ++s) outbox.push_drop_oldest(frame(s));
        sender.start();
        check(sender.finish(std::chrono::milliseconds(3000)), "buffered frames and token should go out in time");

        check(sender.sent() == 5, "all 5 frames should be acknowledged");
        check(sender.token_delivered(), "shutdown token should be delivered");
        check(processing_stop.reason() == bgs::StopReason::Peer, "token should stop the processing side with reason peer");
        check(!capture_stop.is_stop_requested(), "capture side stop flag is not touched by a normal finish");
        check(inbox.closed(), "token should close the inbox");
        check(drain(inbox) == std::vector<uint64_t>({1, 2, 3, 4, 5}), "frames should arrive in capture order");
        check(receiver.received() == 5, "receiver should count 5 frames");

        receiver.stop();
    }

    void test_jpeg_frames_cross_the_link() {
        bgs::BoundedQueue<bgs::FramePtr> inbox(4);
        bgs::ShutdownCoordinator processing_stop;
        bgs::FrameReceiver receiver(any_port(), inbox, processing_stop);
        receiver.start();

        bgs::BoundedQueue<bgs::FramePtr> outbox(4);
        bgs::ShutdownCoordinator capture_stop;
        bgs::FrameSender sender(sender_options(receiver.port(), bgs::WireEncoding::Jpeg), outbox, capture_stop);
        check(sender.connect(), "sender should reach the receiver");

        outbox.push_drop_oldest(frame(9));
        sender.start();
        sender.finish(std::chrono::milliseconds(3000));

        bgs::FramePtr f;
        check(inbox.try_pop(f) && f->sequence == 9, "jpeg frame should be received");
        check(f && f->width() == 16 && f->height() == 12 && f->channels() == 3, "jpeg frame should keep its geometry");
        receiver.stop();
    }

    void test_stopping_receiver_stops_capture() {
        bgs::BoundedQueue<bgs::FramePtr> inbox(4);
        bgs::ShutdownCoordinator processing_stop;
        bgs::FrameReceiver receiver(any_port(), inbox, processing_stop);
        receiver.start();

        bgs::BoundedQueue<bgs::FramePtr> outbox(4);
        bgs::ShutdownCoordinator capture_stop;
        bgs::FrameSender sender(sender_options(receiver.port()), outbox, capture_stop);
        check(sender.connect(), "sender should reach the receiver");

        processing_stop.request_stop(bgs::StopReason::Operator);
        outbox.push_drop_oldest(frame(1));
        sender.start();

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (!capture_stop.is_stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }

        check(capture_stop.reason() == bgs::StopReason::Peer, "capture should stop with reason peer");
        check(sender.finish(std::chrono::milliseconds(3000)), "finish should report the peer as notified");
        check(sender.peer_stopping(), "sender should see the receiver stopping");
        check(!sender.token_delivered(), "no token is sent to a stopping receiver");
        check(receiver.received() == 0, "stopping receiver accepts no frame");
        check(inbox.size() == 0 && inbox.closed(), "stopping receiver should close its inbox");

        receiver.stop();
    }

    void test_restarted_capture_is_accepted() {
        bgs::BoundedQueue<bgs::FramePtr> inbox(16);
        bgs::ShutdownCoordinator processing_stop;
        bgs::FrameReceiver receiver(any_port(), inbox, processing_stop);
        receiver.start();

        // first capture run dies without sending the shutdown token
        bgs::BoundedQueue<bgs::FramePtr> outbox_a(8);
        bgs::ShutdownCoordinator stop_a;
        bgs::FrameSender first(sender_options(receiver.port()), outbox_a, stop_a);
        check(first.connect(), "first sender should reach the receiver");
        for (uint64_t s = 1; s <= 3; ++s) outbox_a.push_drop_oldest(frame(s));
        first.start();
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (first.sent() < 3 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        first.stop();
        check(first.sent() == 3, "first run should deliver its 3 frames");

        // second run starts numbering from 0 again
        bgs::BoundedQueue<bgs::FramePtr> outbox_b(8);
        bgs::ShutdownCoordinator stop_b;
        bgs::FrameSender second(sender_options(receiver.port()), outbox_b, stop_b);
        check(second.stream_id() != first.stream_id(), "each sender should get its own stream id");
        check(second.connect(), "second sender should reach the receiver");
        for (uint64_t s = 0; s <= 2; ++s) outbox_b.push_drop_oldest(frame(s));
        second.start();
        check(second.finish(std::chrono::milliseconds(3000)), "second run should finish normally");

        check(second.sent() == 3 && second.failed() == 0, "restarted run should not be refused");
        check(!stop_b.is_stop_requested(), "restarted run should not be told to stop");
        check(receiver.received() == 6, "receiver should accept frames of both runs");
        check(receiver.out_of_order() == 0, "restarted numbering is not out of order");
        check(receiver.streams() == 2, "receiver should count both capture runs");

        std::vector<std::string> streams;
        std::vector<uint64_t> seqs;
        bgs::FramePtr f;
        while (inbox.try_pop(f)) {
            seqs.push_back(f->sequence);
            streams.push_back(f->stream_id);
        }
        check(seqs == std::vector<uint64_t>({1, 2, 3, 0, 1, 2}), "frames of both runs should be queued in arrival order");
        check(streams.size() == 6 && streams[0] == first.stream_id() && streams[5] == second.stream_id(),
              "queued frames should carry the stream id of their run");

        receiver.stop();
    }

    void test_frame_after_stop_is_refused() {
        bgs::BoundedQueue<bgs::FramePtr> inbox(4);
        bgs::ShutdownCoordinator processing_stop;
        bgs::FrameReceiver receiver(any_port(), inbox, processing_stop);
        receiver.start();

        httplib::Client cli("127.0.0.1", receiver.port());
        bgs::WireFrame wf = bgs::encode_frame(*frame(1), bgs::WireEncoding::Raw, 85);
        auto ok = cli.Post(bgs::wire::kFramesPath, to_headers(wf.headers), wf.body, bgs::wire::kContentType);
        check(ok && ok->status == 200, "frame before stop should be accepted");

        processing_stop.request_stop(bgs::StopReason::Signal);
        wf = bgs::encode_frame(*frame(2), bgs::WireEncoding::Raw, 85);
        auto late = cli.Post(bgs::wire::kFramesPath, to_headers(wf.headers), wf.body, bgs::wire::kContentType);
        check(late && late->status == 503, "frame after stop should get 503");
        check(receiver.received() == 1, "frame after stop should not be counted");
        check(inbox.size() == 1 && inbox.closed(), "frame after stop should not reach the inbox");

        receiver.stop();
    }

    void test_bad_requests_are_rejected() {
        bgs::BoundedQueue<bgs::FramePtr> inbox(4);
        bgs::ShutdownCoordinator processing_stop;
        bgs::FrameReceiver receiver(any_port(), inbox, processing_stop);
        receiver.start();

        httplib::Client cli("127.0.0.1", receiver.port());

        auto res = cli.Post(bgs::wire::kFramesPath, std::string("garbage"), bgs::wire::kContentType);
        check(res && res->status == 400, "frame without headers should get 400");
        check(receiver.rejected() == 1, "malformed frame should be counted");

        const auto wf = bgs::encode_frame(*frame(4), bgs::WireEncoding::Raw, 85);
        res = cli.Post(bgs::wire::kFramesPath, to_headers(wf.headers), wf.body, bgs::wire::kContentType);
        check(res && res->status == 200, "valid frame should get 200");

        res = cli.Post(bgs::wire::kFramesPath, to_headers(wf.headers), wf.body, bgs::wire::kContentType);
        check(res && res->status == 409, "repeated sequence should get 409");

        const auto older = bgs::encode_frame(*frame(2), bgs::WireEncoding::Raw, 85);
        res = cli.Post(bgs::wire::kFramesPath, to_headers(older.headers), older.body, bgs::wire::kContentType);
        check(res && res->status == 409, "older sequence should get 409");
        check(receiver.out_of_order() == 2, "both stale frames should be counted");
        check(inbox.size() == 1, "only the valid frame should reach the inbox");
        check(!processing_stop.is_stop_requested(), "bad requests should not stop the pipeline");

        receiver.stop();
    }

    void test_health_and_stats() {
        bgs::BoundedQueue<bgs::FramePtr> inbox(4);
        bgs::ShutdownCoordinator processing_stop;
        bgs::FrameReceiver receiver(any_port(), inbox, processing_stop);
        receiver.set_stats_provider([] { return std::string("{\"processed\":3}"); });
        receiver.start();

        httplib::Client cli("127.0.0.1", receiver.port());
        auto res = cli.Get(bgs::wire::kHealthPath);
        check(res && res->status == 200 && res->body == "ok", "health should answer ok while running");

        res = cli.Get(bgs::wire::kStatsPath);
        check(res && res->status == 200 && res->body == "{\"processed\":3}", "stats should come from the provider");

        processing_stop.request_stop(bgs::StopReason::Signal);
        res = cli.Get(bgs::wire::kHealthPath);
        check(res && res->status == 503, "health should answer 503 while stopping");
        check(res && res->get_header_value(bgs::wire::kPipelineState) == bgs::wire::kStateStopping,
              "stopping reply should carry the pipeline state header");

        receiver.stop();
    }

    void test_connect_gives_up() {
        bgs::BoundedQueue<bgs::FramePtr> outbox(2);
        bgs::ShutdownCoordinator capture_stop;

        // bind and release a port so nothing listens on it
        int port = 0;
        {
            bgs::BoundedQueue<bgs::FramePtr> inbox(1);
            bgs::ShutdownCoordinator s;
            bgs::FrameReceiver scratch(any_port(), inbox, s);
            scratch.start();
            port = scratch.port();
        }

        auto opt = sender_options(port);
        opt.connect_retries = 2;
        opt.retry_delay_ms = 10;
        bgs::FrameSender sender(opt, outbox, capture_stop);
        check(!sender.connect(), "connect should fail when nothing listens");

        capture_stop.request_stop(bgs::StopReason::Signal);
        bgs::FrameSender stopped(opt, outbox, capture_stop);
        check(!stopped.connect(), "connect should return at once after a stop request");
    }
}

int main() {
    test_frames_and_token_arrive_in_order();
    test_jpeg_frames_cross_the_link();
    test_stopping_receiver_stops_capture();
    test_restarted_capture_is_accepted();
    test_frame_after_stop_is_refused();
    test_bad_requests_are_rejected();
    test_health_and_stats();
    test_connect_gives_up();
    return bgs_test::finish("transport");
}
