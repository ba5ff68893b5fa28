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
#include "engine/update_engine.hpp"
#include "fake_hid_transport.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <thread>
#include <vector>

using namespace padlink;
using namespace padlink::engine;
using namespace std::chrono_literals;
using padlink::test::FakeHidTransport;
using padlink::test::Report;

static int g_pass = 0;
static int g_fail = 0;

template <class T>
static void check_eq(const char* label, T got, T expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

static void check(const char* label, bool ok) { check_eq(label, ok, true); }

static EngineCfg engine_cfg() {
  EngineCfg c;
  c.ping_period = 10s;
  c.read_timeout = 10ms;
  c.supervisor.backoff = 20ms;
  return c;
}

static UpdateCfg update_cfg() {
  UpdateCfg c;
  c.ack_timeout = 60ms;
  c.retries = 3;
  c.settle = 30ms;
  c.write_timeout = 1s;
  return c;
}

static std::vector<std::uint8_t> pattern(std::size_t n) {
  std::vector<std::uint8_t> v(n);
  for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<std::uint8_t>(i);
  return v;
}

// "C:e0" for commands, "T:<type>:<file>:<package>" for transfer reports.
static std::vector<std::string> summary(const FakeHidTransport& t) {
  std::vector<std::string> out;
  for (const auto& w : t.writes()) {
    if (test::is_command(w)) {
      out.push_back(fmt::format("C:{:02x}", w[1]));
    } else if (test::is_transfer(w)) {
      const auto h = test::chunk_header(w);
      out.push_back(fmt::format("T:{}:{}:{}", h.type, h.file_id, h.package));
    }
  }
  return out;
}

static std::size_t count_of(const std::vector<std::string>& v, const std::string& s) {
  return static_cast<std::size_t>(std::count(v.begin(), v.end(), s));
}

// Engine wired to a fake device, connected and running.
struct Rig {
  FakeHidTransport t;
  DeviceEngine eng{t, engine_cfg()};
  UpdateEngine up{eng, update_cfg()};

  std::mutex m;
  std::vector<UpdateProgress> progress;

  Rig() {
    eng.register_callback([this](const Event& ev) {
      if (const auto* p = std::get_if<UpdateProgress>(&ev)) {
        std::lock_guard lk(m);
        progress.push_back(*p);
      }
    });
    (void)eng.connect({});
    eng.start();
  }

  ~Rig() { eng.stop(); }

  bool saw_state(UpdateState s) {
    std::lock_guard lk(m);
    return std::any_of(progress.begin(), progress.end(), [&](const auto& p) { return p.state == s; });
  }
};

// ----- tests -----

static void test_successful_update() {
  Rig r;
  r.t.set_responder(test::ack_everything);

  std::vector<UpdateFile> files;
  files.push_back(UpdateFile{"main.py", pattern(130), false});
  files.push_back(UpdateFile{"old.py", {}, true});

  const auto st = r.up.begin_update(std::move(files));
  check("ok_result", static_cast<bool>(st));
  check("ok_state_idle", r.up.state() == UpdateState::Idle);

  const std::vector<std::string> expected{
    "C:e0",
    "T:1:0:0", "T:2:0:0", "T:2:0:1", "T:2:0:2", "T:3:0:0",
    "T:5:1:0",
    "T:4:0:0",
    "C:e1",
  };
  check_eq("ok_wire_sequence", summary(r.t), expected);

  check("ok_progress_preparing", r.saw_state(UpdateState::Preparing));
  check("ok_progress_transferring", r.saw_state(UpdateState::Transferring));
  check("ok_progress_finalizing", r.saw_state(UpdateState::Finalizing));
  check("ok_progress_resetting", r.saw_state(UpdateState::Resetting));
  {
    std::lock_guard lk(r.m);
    check("ok_progress_ends_idle", !r.progress.empty() && r.progress.back().state == UpdateState::Idle);
  }
}

static void test_silent_device_times_out() {
  Rig r;
  std::vector<UpdateFile> files{UpdateFile{"main.py", pattern(100), false}};

  const auto st = r.up.begin_update(std::move(files));
  check("silent_fails", !st);
  check("silent_timeout", st.code == core::Errc::Timeout);
  check("silent_aborted", r.up.state() == UpdateState::Aborted);
  check("silent_last_error", r.up.last_error().code == core::Errc::Timeout);

  // One send plus three retries of FileStart, then nothing else.
  const auto before = summary(r.t);
  check_eq("silent_start_sent_4x", count_of(before, "T:1:0:0"), std::size_t{4});
  check_eq("silent_total_writes", before.size(), std::size_t{5});

  std::this_thread::sleep_for(200ms);
  check_eq("silent_no_more_chunks", summary(r.t).size(), before.size());
  check("silent_aborted_event", r.saw_state(UpdateState::Aborted));
}

static void test_device_error_surfaces_verbatim() {
  Rig r;
  r.t.set_responder([](std::span<const std::uint8_t> w) -> std::vector<Report> {
    const Report rep(w.begin(), w.end());
    if (test::is_transfer(rep) && test::chunk_header(rep).type == 3) return {test::error_report("CHECKSUM_MISMATCH")};
    return test::ack_everything(w);
  });

  const auto st = r.up.begin_update({UpdateFile{"main.py", pattern(60), false}});
  check("checksum_fails", !st);
  check("checksum_device_reported", st.code == core::Errc::DeviceReported);
  check_eq("checksum_verbatim", st.msg, std::string("CHECKSUM_MISMATCH"));
  check("checksum_aborted", r.up.state() == UpdateState::Aborted);

  const auto w = summary(r.t);
  check_eq("checksum_no_completed", count_of(w, "T:4:0:0"), std::size_t{0});
  check_eq("checksum_no_reset", count_of(w, "C:e1"), std::size_t{0});
}

static void test_error_during_prepare() {
  Rig r;
  r.t.set_responder([](std::span<const std::uint8_t> w) -> std::vector<Report> {
    const Report rep(w.begin(), w.end());
    if (test::is_command(rep) && rep[1] == 0xE0) return {test::error_report("UPDATE_NOT_ALLOWED")};
    return {};
  });

  const auto st = r.up.begin_update({UpdateFile{"main.py", pattern(10), false}});
  check("prepare_rejected", !st && st.code == core::Errc::DeviceReported);
  check_eq("prepare_reason", st.msg, std::string("UPDATE_NOT_ALLOWED"));
  check_eq("prepare_no_transfer", summary(r.t).size(), std::size_t{1});
}

static void test_duplicate_ack_ignored() {
  Rig r;
  auto last = std::make_shared<std::optional<Report>>();
  r.t.set_responder([last](std::span<const std::uint8_t> w) -> std::vector<Report> {
    auto acks = test::ack_everything(w);
    if (acks.empty()) return {};
    std::vector<Report> out;
    if (*last) out.push_back(**last);  // stale repeat of the previous ack first
    out.push_back(acks.front());
    *last = acks.front();
    return out;
  });

  const auto st = r.up.begin_update({UpdateFile{"main.py", pattern(200), false}});
  check("dup_ok", static_cast<bool>(st));
  check("dup_state_idle", r.up.state() == UpdateState::Idle);
}

static void test_duplicate_ack_across_files() {
  Rig r;
  auto last = std::make_shared<std::optional<Report>>();
  r.t.set_responder([last](std::span<const std::uint8_t> w) -> std::vector<Report> {
    auto acks = test::ack_everything(w);
    if (acks.empty()) return {};
    std::vector<Report> out;
    if (*last) out.push_back(**last);  // previous file's FileEnd ack lands before the next FileStart ack
    out.push_back(acks.front());
    *last = acks.front();
    return out;
  });

  std::vector<UpdateFile> files;
  files.push_back(UpdateFile{"a.py", std::vector<std::uint8_t>(60, 'a'), false});
  files.push_back(UpdateFile{"b.py", std::vector<std::uint8_t>(60, 'b'), false});

  const auto st = r.up.begin_update(std::move(files));
  check("dup_files_ok", static_cast<bool>(st));
  check("dup_files_idle", r.up.state() == UpdateState::Idle);

  const auto w = summary(r.t);
  check_eq("dup_files_second_start", count_of(w, "T:1:1:0"), std::size_t{1});
  check_eq("dup_files_second_end", count_of(w, "T:3:1:0"), std::size_t{1});
  check_eq("dup_files_reset", count_of(w, "C:e1"), std::size_t{1});
}

static void test_mismatched_ack_is_violation() {
  Rig r;
  r.t.set_responder([](std::span<const std::uint8_t> w) -> std::vector<Report> {
    const Report rep(w.begin(), w.end());
    if (test::is_transfer(rep) && test::chunk_header(rep).type == 2) return {test::ack_report(9, 0, 2)};
    return test::ack_everything(w);
  });

  const auto st = r.up.begin_update({UpdateFile{"main.py", pattern(100), false}});
  check("mismatch_fails", !st && st.code == core::Errc::ProtocolViolation);
  check("mismatch_aborted", r.up.state() == UpdateState::Aborted);
  check("mismatch_still_connected", r.eng.connection_status() == ConnectionState::Connected);
}

static void test_lost_ack_is_retried() {
  Rig r;
  auto dropped = std::make_shared<std::atomic_bool>(false);
  r.t.set_responder([dropped](std::span<const std::uint8_t> w) -> std::vector<Report> {
    const Report rep(w.begin(), w.end());
    if (test::is_transfer(rep)) {
      const auto h = test::chunk_header(rep);
      if (h.type == 2 && h.package == 1 && !dropped->exchange(true)) return {};
    }
    return test::ack_everything(w);
  });

  const auto st = r.up.begin_update({UpdateFile{"main.py", pattern(150), false}});
  check("retry_ok", static_cast<bool>(st));
  check_eq("retry_resent_once", count_of(summary(r.t), "T:2:0:1"), std::size_t{2});
}

static void test_disconnect_aborts_update() {
  Rig r;
  FakeHidTransport* t = &r.t;
  r.t.set_responder([t](std::span<const std::uint8_t> w) -> std::vector<Report> {
    const Report rep(w.begin(), w.end());
    if (test::is_transfer(rep) && test::chunk_header(rep).type == 2) {
      t->fail_next_reads();
      return {};
    }
    return test::ack_everything(w);
  });

  const auto st = r.up.begin_update({UpdateFile{"main.py", pattern(100), false}});
  check("disconnect_fails", !st && st.code == core::Errc::Transport);
  check("disconnect_aborted", r.up.state() == UpdateState::Aborted);
}

static void test_stop_cancels_update() {
  FakeHidTransport t;
  DeviceEngine eng(t, engine_cfg());
  UpdateCfg cfg = update_cfg();
  cfg.ack_timeout = 5s;
  UpdateEngine up(eng, cfg);
  (void)eng.connect({});
  eng.start();

  std::jthread stopper([&] {
    t.wait_for_writes(2, 2s);  // PrepareUpdate and FileStart are out
    std::this_thread::sleep_for(20ms);
    eng.stop();
  });

  const auto st = up.begin_update({UpdateFile{"main.py", pattern(10), false}});
  check("stop_cancelled", !st && st.code == core::Errc::Cancelled);
}

static void test_rejected_inputs() {
  Rig r;
  check("empty_list", r.up.begin_update({}).code == core::Errc::InvalidArgument);
  check("too_large", r.up.begin_update({UpdateFile{"big.bin", pattern(70000), false}}).code == core::Errc::InvalidArgument);
  check("no_writes_for_rejected", r.t.write_count() == 0);
  check("still_idle", r.up.state() == UpdateState::Idle);

  FakeHidTransport t;
  t.fail_next_opens(1000);
  DeviceEngine eng(t, engine_cfg());
  UpdateEngine up(eng, update_cfg());
  (void)eng.connect({});
  check("offline_rejected", up.begin_update({UpdateFile{"a.py", pattern(1), false}}).code == core::Errc::Transport);
}

static void test_load_update_files() {
  namespace fs = std::filesystem;
  const fs::path dir = fs::temp_directory_path() / "padlink_update_files_test";
  fs::create_directories(dir);
  {
    std::ofstream(dir / "main.py", std::ios::binary) << "print(1)\n";
  }

  const std::vector<fs::path> paths{dir / "main.py", dir / "stale.py.delete"};
  auto r = load_update_files(paths);
  check("load_ok", static_cast<bool>(r));
  if (r) {
    check_eq("load_count", r.value.size(), std::size_t{2});
    check_eq("load_name", r.value[0].name, std::string("main.py"));
    check_eq("load_bytes", r.value[0].bytes.size(), std::size_t{9});
    check("load_not_remove", !r.value[0].remove);
    check_eq("load_delete_name", r.value[1].name, std::string("stale.py"));
    check("load_delete_flag", r.value[1].remove);
  }

  const std::vector<fs::path> missing{dir / "nope.py"};
  auto m = load_update_files(missing);
  check("load_missing_fails", !m && m.st.code == core::Errc::InvalidArgument);

  std::error_code ec;
  fs::remove_all(dir, ec);
}

int main() {
  spdlog::set_level(spdlog::level::off);

  test_successful_update();
  test_silent_device_times_out();
  test_device_error_surfaces_verbatim();
  test_error_during_prepare();
  test_duplicate_ack_ignored();
  test_duplicate_ack_across_files();
  test_mismatched_ack_is_violation();
  test_lost_ack_is_retried();
  test_disconnect_aborts_update();
  test_stop_cancels_update();
  test_rejected_inputs();
  test_load_update_files();

  std::fprintf(stdout, "update engine: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
