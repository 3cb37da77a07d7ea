/**
 * @file test_search_session.cpp
 * @brief Current-result slot ordering, rendering and async completion tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <future>
#include <memory>
#include <vector>

#include <spdlog/spdlog.h>

#include "sarzone/core/constants.hpp"
#include "sarzone/engine/search_session.hpp"
#include "sarzone/sampling/uniform_source.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double d = std::abs(a - b);
  const double n = std::max(std::abs(b), 1e-30);
  return d / n <= rel;
}

class RecordingRenderer final : public sarzone::io::IRenderAdapter {
 public:
  void render(const sarzone::io::RenderPayload& payload) override {
    last = payload;
    ++calls;
  }

  sarzone::io::RenderPayload last{};
  int calls{0};
};

sarzone::engine::SearchRequest make_request(double altitude_ft, std::size_t samples) {
  sarzone::engine::SearchRequest request{};
  request.flight = sarzone::core::FlightState{.position = sarzone::core::Position{.lat_deg = 51.47, .lon_deg = -0.45},
                                              .altitude_ft = altitude_ft,
                                              .ground_speed_kt = 140.0,
                                              .heading_deg = 270.0,
                                              .vertical_speed_fpm = -700.0};
  request.wind = sarzone::core::WindConditions{.speed_kt = 20.0, .direction_deg = 60.0};
  request.aircraft = sarzone::core::AircraftProfile{.name = "test", .glide_ratio = 10.0, .emergency_descent_rate_fpm = 1800.0};
  request.radius_multiplier = 1.5;
  request.sample_count = samples;
  return request;
}

}  // namespace

int main() {
  using namespace sarzone;

  const engine::SearchEngine eng{};
  sampling::SeededUniformSource src(17);
  const auto low = eng.evaluate(make_request(4000.0, 50), src);
  const auto high = eng.evaluate(make_request(9000.0, 80), src);
  if (low.status != core::Status::Ok || high.status != core::Status::Ok) {
    spdlog::error("fixture evaluation failed");
    return 1;
  }

  engine::SearchSession session;
  RecordingRenderer renderer;
  if (session.current().has_value() || session.current_ticket().has_value() || session.render_current(renderer)) {
    spdlog::error("fresh session must be empty");
    return 2;
  }

  const auto t1 = session.begin_request();
  const auto t2 = session.begin_request();
  if (t1 != 1U || t2 != 2U) {
    spdlog::error("tickets must start at 1 and increase: {} {}", t1, t2);
    return 3;
  }

  // Newer request finishes first; the older one arrives late and is dropped.
  if (!session.complete(t2, high) || session.complete(t1, low)) {
    spdlog::error("stale completion must be discarded");
    return 4;
  }
  if (session.current_ticket().value_or(0U) != t2 || session.current()->field.size() != 80U) {
    spdlog::error("current result must belong to the newest ticket");
    return 5;
  }

  engine::SearchResult failed{};
  failed.status = core::Status::InvalidInput;
  const auto t3 = session.begin_request();
  if (session.complete(t3, failed) || session.current_ticket().value_or(0U) != t2) {
    spdlog::error("failed results must never replace the current one");
    return 6;
  }

  // A newer request that failed still supersedes an older one still in flight.
  const auto t4 = session.begin_request();
  const auto t5 = session.begin_request();
  if (session.complete(t5, failed) || session.complete(t4, low) || session.current_ticket().value_or(0U) != t2 ||
      session.current()->field.size() != 80U) {
    spdlog::error("older result accepted after a newer request failed");
    return 12;
  }

  if (!session.render_current(renderer) || renderer.calls != 1 || renderer.last.points.size() != 80U ||
      !approx(renderer.last.radius_m, high.area.radius_nm * core::constants::kMetersPerNauticalMile, 1e-12) ||
      renderer.last.center_lat_deg != high.area.center.lat_deg || renderer.last.points.front().weight != high.field.front().probability) {
    spdlog::error("render payload mismatch");
    return 7;
  }

  session.clear();
  if (session.current().has_value() || session.render_current(renderer) || renderer.calls != 1) {
    spdlog::error("cleared session must render nothing");
    return 8;
  }

  auto done = session.run_async(eng, make_request(6000.0, 120), std::make_unique<sampling::SeededUniformSource>(5));
  if (!done.get() || session.current()->field.size() != 120U || session.current()->status != core::Status::Ok) {
    spdlog::error("async request must become current");
    return 9;
  }

  if (session.run_async(eng, make_request(6000.0, 10), nullptr).get()) {
    spdlog::error("async request without a source must not complete");
    return 10;
  }

  engine::SearchSession burst;
  std::vector<std::future<bool>> pending;
  for (int i = 0; i < 8; ++i) {
    pending.push_back(burst.run_async(eng, make_request(3000.0 + 500.0 * i, 200),
                                      std::make_unique<sampling::SeededUniformSource>(100U + static_cast<unsigned>(i))));
  }
  for (auto& f : pending) {
    f.wait();
  }
  if (burst.current_ticket().value_or(0U) != 8U || burst.current()->field.size() != 200U) {
    spdlog::error("newest async request must win, got ticket {}", burst.current_ticket().value_or(0U));
    return 11;
  }

  return 0;
}
