#include "gridwalk/adapters/tick_source_asio.hpp"
#include <spdlog/spdlog.h>
#include <csignal>

namespace gridwalk::adapters {

TickSourceAsio::TickSourceAsio(std::chrono::milliseconds interval)
    : timer_(io_)
    , signals_(io_, SIGINT, SIGTERM)
    , interval_(interval) {
}

void TickSourceAsio::run(TickHandler on_tick) {
    on_tick_ = std::move(on_tick);
    terminated_by_signal_ = false;

    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, terminating", signal_number);
        terminated_by_signal_ = true;
        stop();
    });

    schedule_tick();
    io_.run();
    io_.restart();
}

void TickSourceAsio::stop() {
    timer_.cancel();
    signals_.cancel();
}

void TickSourceAsio::schedule_tick() {
    timer_.expires_after(interval_);
    timer_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) {
            return;
        }
        if (!on_tick_()) {
            stop();
            return;
        }
        schedule_tick();
    });
}

} // namespace gridwalk::adapters
