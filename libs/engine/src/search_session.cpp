/**
 * @file search_session.cpp
 * @brief Current-result slot implementation.
 * @author Watosn
 */

#include "sarzone/engine/search_session.hpp"

#include <utility>

namespace sarzone::engine {

SearchSession::Ticket SearchSession::begin_request() {
  const std::lock_guard<std::mutex> lock(mutex_);
  return next_ticket_++;
}

bool SearchSession::complete(Ticket ticket, SearchResult result) {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (ticket <= latest_ticket_) {
    return false;
  }
  // A newer completion supersedes every older request, even when it failed.
  latest_ticket_ = ticket;
  if (result.status != sarzone::core::Status::Ok) {
    return false;
  }
  stored_ticket_ = ticket;
  current_ = std::move(result);
  return true;
}

std::optional<SearchResult> SearchSession::current() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

std::optional<SearchSession::Ticket> SearchSession::current_ticket() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  if (!current_.has_value()) {
    return std::nullopt;
  }
  return stored_ticket_;
}

void SearchSession::clear() {
  const std::lock_guard<std::mutex> lock(mutex_);
  current_.reset();
}

bool SearchSession::render_current(sarzone::io::IRenderAdapter& adapter) const {
  sarzone::io::RenderPayload payload{};
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    if (!current_.has_value()) {
      return false;
    }
    payload = sarzone::io::make_render_payload(current_->area, current_->field);
  }
  adapter.render(payload);
  return true;
}

std::future<bool> SearchSession::run_async(const SearchEngine& engine,
                                           SearchRequest request,
                                           std::unique_ptr<sarzone::core::IUniformSource> source) {
  const Ticket ticket = begin_request();
  return std::async(std::launch::async,
                    [this, &engine, ticket, request = std::move(request), source = std::move(source)]() mutable {
                      if (!source) {
                        return false;
                      }
                      return complete(ticket, engine.evaluate(request, *source));
                    });
}

}  // namespace sarzone::engine
