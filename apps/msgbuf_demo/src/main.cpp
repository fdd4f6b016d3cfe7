/**
 * @file main.cpp
 * @brief msgbuf walkthrough: pool + strategies + async release + readiness wait.
 *
 * **Bootstrap**
 * - Load config (argv[1], optional) or defaults; set log level; prewarm the pool.
 *
 * **Data path**
 * - A connected SEQPACKET pair stands in for the messaging transport.
 * - Side A sends one payload per strategy band and hands one pooled handle
 *   to an AsyncSender, whose I/O thread releases it after the write.
 * - Side B waits in a ReadinessMultiplexer and receives through a Courier.
 *
 * **Shutdown**
 * - A WakeEndpoint unblocks the final infinite poll(); statistics are reported.
 */

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "msgbuf/config/config_loader.hpp"
#include "msgbuf/io/readiness_multiplexer.hpp"
#include "msgbuf/io/wake_endpoint.hpp"
#include "msgbuf/mem/buffer_pool.hpp"
#include "msgbuf/mem/message_handle.hpp"
#include "msgbuf/obs/observability.hpp"
#include "msgbuf/os/rt.hpp"
#include "msgbuf/transport/async_sender.hpp"
#include "msgbuf/transport/courier.hpp"
#include "msgbuf/transport/socket_transport.hpp"
#include "msgbuf/version.hpp"

using namespace msgbuf;

namespace {

std::vector<std::byte> make_payload(std::size_t n, unsigned char seed) {
    std::vector<std::byte> v(n);
    for (std::size_t i = 0; i < n; ++i) v[i] = std::byte(static_cast<unsigned char>(seed + i));
    return v;
}

} // namespace

int main(int argc, char** argv) {
    auto log = obs::logger();
    log->info("msgbuf_demo {}", msgbuf::version_string);

    auto cfg = argc > 1 ? config::Loader::load_from_file(argv[1])
                        : msgbuf_detail::expected<config::RuntimeConfig, config::ConfigError>(config::defaults());
    if (!cfg) {
        log->error("config rejected: {}", config::to_string(cfg.error()));
        return 1;
    }

    mem::BufferPool pool;
    if (auto warmed = config::apply(pool, *cfg); !warmed) {
        log->error("prewarm failed: {}", mem::to_string(warmed.error()));
        return 1;
    }

    auto link = transport::SocketTransport::pair();
    if (!link) {
        log->error("socketpair failed: {}", transport::to_string(link.error()));
        return 1;
    }
    auto& [side_a, side_b] = *link;

    transport::CourierOptions copts;
    copts.thresholds        = cfg->thresholds;
    copts.scratch_bytes     = cfg->scratch_bytes;
    copts.max_message_bytes = cfg->max_message_bytes;

    auto tx = transport::Courier::create(pool, side_a, copts);
    auto rx = transport::Courier::create(pool, side_b, copts);
    if (!tx || !rx) {
        log->error("courier options rejected");
        return 1;
    }

    transport::SenderOptions sopts;
    sopts.queue_depth = cfg->sender_queue_depth;
    sopts.rt = os::RtConfig{ .cpu = -1, .policy = os::RtSchedPolicy::Fifo, .priority = os::prio::kSender };
    auto sender = transport::AsyncSender::start(side_a, sopts);
    if (!sender) {
        log->error("sender failed to start: {}", transport::to_string(sender.error()));
        return 1;
    }
    tx->attach(sender->get());

    auto mux = io::ReadinessMultiplexer::with_capacity(cfg->poller_capacity);
    auto wake = io::WakeEndpoint::create();
    if (!mux || !wake) {
        log->error("readiness setup failed");
        return 1;
    }
    auto rx_ref   = mux->add(side_b, io::PollEvents::In);
    auto wake_ref = mux->add(*wake, io::PollEvents::In);
    if (!rx_ref || !wake_ref) {
        log->error("endpoint registration failed");
        return 1;
    }

    // --- Side A: one payload per band, plus an async handoff ---
    const std::array<std::size_t, 3> sizes = {64, 1024, 128 * 1024};
    std::size_t expected_msgs = 0;
    for (std::size_t n : sizes) {
        const auto payload = make_payload(n, static_cast<unsigned char>(n));
        auto used = tx->send(payload);
        if (!used) {
            log->error("send of {} B failed: {}", n, transport::to_string(used.error()));
            return 1;
        }
        log->info("sent {} B via {}", n, transfer::to_string(*used));
        ++expected_msgs;
    }

    const auto handoff = make_payload(4096, 7);
    auto handle = mem::MessageHandle::from_data(pool, handoff);
    if (!handle) {
        log->error("handoff rent failed: {}", mem::to_string(handle.error()));
        return 1;
    }
    if (auto queued = tx->send(std::move(*handle)); !queued) {
        log->error("handoff failed: {}", transport::to_string(queued.error()));
        return 1;
    }
    ++expected_msgs;

    // --- Side B: wait and receive ---
    std::size_t received = 0;
    while (received < expected_msgs) {
        auto ready = mux->poll(1000);
        if (!ready) {
            log->error("poll failed: {}", io::to_string(ready.error()));
            return 1;
        }
        if (*ready == 0) {
            log->error("timed out with {}/{} messages", received, expected_msgs);
            return 1;
        }
        if (!mux->is_readable(*rx_ref)) continue;

        auto msg = rx->recv();
        if (!msg) {
            log->error("recv failed: {}", transport::to_string(msg.error()));
            return 1;
        }
        log->info("received {} B via {} (owner {})", msg->handle.size(),
                  transfer::to_string(msg->strategy), mem::to_string(msg->handle.owner()));
        if (auto released = msg->handle.release(); !released) {
            log->error("release failed: {}", mem::to_string(released.error()));
            return 1;
        }
        ++received;
    }

    (*sender)->stop();

    // --- Shutdown: nothing left to read, so only the wake endpoint can end this wait ---
    if (auto woke = wake->signal(); !woke) {
        log->error("wake failed: {}", io::to_string(woke.error()));
        return 1;
    }
    auto last = mux->poll(-1);
    if (!last) {
        log->error("final poll failed: {}", io::to_string(last.error()));
        return 1;
    }
    if (mux->is_readable(*wake_ref)) {
        log->info("wake endpoint ended the final wait");
    }

    obs::report(pool);
    return 0;
}
