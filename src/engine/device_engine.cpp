/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "engine/device_engine.hpp"

#include "core/overloaded.hpp"
#include "core/ticker.hpp"
#include "protocol/keypad/messages.hpp"

#include <spdlog/fmt/bin_to_hex.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <exception>
#include <string>
#include <utility>

namespace padlink::engine {

namespace {

constexpr std::size_t kMaxOutboundReport = 1 + keypad::kTransferReportSize;

} // namespace

DeviceEngine::DeviceEngine(core::IHidTransport& transport, EngineCfg cfg)
    : cfg_(cfg), sup_(transport, cfg.supervisor) {
  sup_.set_listener([this](ConnectionState s) { on_state_change_(s); });
}

DeviceEngine::~DeviceEngine() { stop(); }

core::Status DeviceEngine::connect(std::vector<core::DeviceId> ids) noexcept {
  const auto st = sup_.connect(std::move(ids));
  if (!st) spdlog::warn("Connect failed, will keep retrying: {}", st);
  return st;
}

void DeviceEngine::register_callback(Callback fn) {
  std::unique_lock lk(cb_m_);
  callbacks_.push_back(std::move(fn));
}

void DeviceEngine::publish(const Event& ev) {
  std::shared_lock lk(cb_m_);
  for (const auto& cb : callbacks_) {
    try {
      cb(ev);
    } catch (const std::exception& e) {
      spdlog::error("Callback threw: {}", e.what());
    }
  }
}

core::Status DeviceEngine::send_command(keypad::Command cmd) noexcept { return enqueue_(std::move(cmd)); }

core::Status DeviceEngine::send_command_sync(keypad::Command cmd, std::chrono::milliseconds timeout) noexcept {
  return send_sync_(std::move(cmd), timeout);
}

core::Status DeviceEngine::send_transfer_sync(keypad::TransferChunk chunk, std::chrono::milliseconds timeout) noexcept {
  return send_sync_(std::move(chunk), timeout);
}

core::Status DeviceEngine::enqueue_(Payload p) noexcept {
  return queue_.push(OutboundItem{std::move(p), nullptr, std::nullopt});
}

core::Status DeviceEngine::send_sync_(Payload p, std::chrono::milliseconds timeout) noexcept {
  auto done = std::make_shared<Completion>();
  auto fut = done->promise.get_future();

  const auto gen = sup_.generation();
  PADLINK_TRY(queue_.push(OutboundItem{std::move(p), done, gen}));

  const auto deadline = clock::now() + timeout;
  while (fut.wait_until(std::min(deadline, clock::now() + cfg_.read_timeout)) != std::future_status::ready) {
    if (sup_.generation() != gen || sup_.state() != ConnectionState::Connected) {
      done->abandoned.store(true, std::memory_order_release);
      return core::Status::Fail(core::Errc::Transport, "device disconnected before the write");
    }
    if (clock::now() >= deadline) {
      done->abandoned.store(true, std::memory_order_release);
      return core::Status::Failf(core::Errc::Timeout, "write not completed within {} ms", timeout.count());
    }
  }
  return fut.get();
}

void DeviceEngine::start() {
  std::lock_guard lk(run_m_);
  if (started_ || stopped_) return;
  started_ = true;
  finished_ = false;

  sup_.start();
  rx_ = std::jthread([this](std::stop_token st) { receive_duty_(st); });
  tx_ = std::jthread([this](std::stop_token st) { transmit_duty_(st); });
  ka_ = std::jthread([this](std::stop_token st) { keepalive_duty_(st); });
}

void DeviceEngine::run() {
  start();
  {
    std::unique_lock lk(run_m_);
    run_cv_.wait(lk, [&] { return finished_; });
  }
  stop();
}

void DeviceEngine::close_queue() noexcept { queue_.close(); }

void DeviceEngine::stop() noexcept {
  {
    std::lock_guard lk(run_m_);
    if (stopped_) return;
    stopped_ = true;
    started_ = false;
  }

  rx_.request_stop();
  tx_.request_stop();
  ka_.request_stop();
  queue_.close();
  acks_.fail(core::Status::Fail(core::Errc::Cancelled, "engine stopped"));

  for (auto* t : {&rx_, &tx_, &ka_})
    if (t->joinable()) t->join();

  for (auto& item : queue_.drain()) resolve_(item, core::Status::Fail(core::Errc::Cancelled, "engine stopped"));

  sup_.stop();
  sup_.close();

  {
    std::lock_guard lk(run_m_);
    finished_ = true;
  }
  run_cv_.notify_all();
}

void DeviceEngine::resolve_(OutboundItem& item, core::Status st) {
  if (!item.done) return;
  item.done->promise.set_value(std::move(st));
  item.done.reset();
}

void DeviceEngine::on_state_change_(ConnectionState s) {
  if (s == ConnectionState::Disconnected) acks_.fail(core::Status::Fail(core::Errc::Transport, "device disconnected"));
}

void DeviceEngine::receive_duty_(std::stop_token st) {
  std::array<std::uint8_t, keypad::kMaxInboundSize> buf{};
  const int timeout_ms = static_cast<int>(cfg_.read_timeout.count());

  while (!st.stop_requested()) {
    if (!sup_.wait_connected(st, cfg_.read_timeout)) continue;

    auto r = sup_.read(buf, timeout_ms);
    if (!r) continue; // supervisor already dropped the connection
    if (r.value == 0) continue;

    handle_report_(std::span<const std::uint8_t>(buf.data(), r.value));
  }
}

void DeviceEngine::handle_report_(std::span<const std::uint8_t> report) {
  spdlog::debug("RX {}", spdlog::to_hex(report.begin(), report.end()));

  auto msg = keypad::decode(report);
  if (!msg) {
    spdlog::warn("Dropping inbound report: {}", msg.st);
    return;
  }

  if (const auto* log = std::get_if<keypad::LogMessage>(&msg.value)) {
    if (log->level == keypad::DeviceLogLevel::Error) spdlog::error("Device: {}", log->text);
    else spdlog::debug("Device: {}", log->text);
  }

  if (acks_.offer(msg.value)) return;

  publish(Event{std::move(msg.value)});
}

void DeviceEngine::transmit_duty_(std::stop_token st) {
  while (!st.stop_requested()) {
    auto item = queue_.pop(st);
    if (!item) break;

    while (!sup_.wait_connected(st, cfg_.read_timeout)) {
      if (st.stop_requested()) {
        resolve_(*item, core::Status::Fail(core::Errc::Cancelled, "engine stopped"));
        return;
      }
    }

    write_item_(*item);
  }

  if (queue_.closed() && !st.stop_requested()) {
    {
      std::lock_guard lk(run_m_);
      finished_ = true;
    }
    run_cv_.notify_all();
  }
}

void DeviceEngine::write_item_(OutboundItem& item) {
  if (item.done && item.done->abandoned.load(std::memory_order_acquire)) return;

  const auto gen = sup_.generation();
  if (item.generation && *item.generation != gen) {
    resolve_(item, core::Status::Fail(core::Errc::Transport, "connection was reset before the write"));
    return;
  }

  // The counter restarts with every connection.
  if (gen != counter_gen_) {
    counter_gen_ = gen;
    counter_ = 0;
  }

  std::array<std::uint8_t, kMaxOutboundReport> buf{};
  std::size_t len = 0;
  std::string what;

  std::visit(core::overloaded{
    [&](const keypad::Command& cmd) {
      const auto rep = keypad::encode(cmd, counter_++);
      buf[0] = static_cast<std::uint8_t>(keypad::ReportId::Communication);
      std::copy(rep.begin(), rep.end(), buf.begin() + 1);
      len = 1 + rep.size();
      what = keypad::describe(cmd);
    },
    [&](const keypad::TransferChunk& chunk) {
      const auto rep = keypad::encode_chunk(chunk);
      buf[0] = static_cast<std::uint8_t>(keypad::ReportId::Transfer);
      std::copy(rep.begin(), rep.end(), buf.begin() + 1);
      len = 1 + rep.size();
      what = keypad::describe(chunk);
    },
  }, item.payload);

  const std::span<const std::uint8_t> report(buf.data(), len);
  spdlog::debug("TX {}: {}", what, spdlog::to_hex(report.begin(), report.end()));

  auto st = sup_.write(report);
  if (st) last_tx_.store(clock::now().time_since_epoch().count(), std::memory_order_release);
  else spdlog::error("Write of {} failed: {}", what, st);

  resolve_(item, std::move(st));
}

void DeviceEngine::keepalive_duty_(std::stop_token st) {
  core::Ticker ticker(cfg_.ping_period);

  while (ticker.wait(st)) {
    if (sup_.state() != ConnectionState::Connected) continue;
    if (queue_.size() != 0) continue;

    const auto last = clock::time_point(clock::duration(last_tx_.load(std::memory_order_acquire)));
    if (clock::now() - last < cfg_.ping_period) continue;

    if (!enqueue_(keypad::Ping{})) break;
  }
}

} // namespace padlink::engine
