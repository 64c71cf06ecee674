#pragma once

#include "gridwalk/ports/itick_source.hpp"
#include <utility>
#include <boost/asio.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>

namespace gridwalk::adapters {

// Periodic ticks from a steady_timer; SIGINT and SIGTERM terminate the run.
class TickSourceAsio : public gridwalk::ports::ITickSource {
public:
    explicit TickSourceAsio(std::chrono::milliseconds interval);
    ~TickSourceAsio() override = default;

    void run(TickHandler on_tick) override;
    void stop() override;
    bool terminated_by_signal() const override { return terminated_by_signal_; }

private:
    void schedule_tick();

    boost::asio::io_context io_;
    boost::asio::steady_timer timer_;
    boost::asio::signal_set signals_;
    std::chrono::milliseconds interval_;
    TickHandler on_tick_;
    bool terminated_by_signal_ = false;
};

} // namespace gridwalk::adapters
