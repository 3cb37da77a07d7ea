/**
 * @file search_session.hpp
 * @brief Caller-owned holder of the current search result.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>

#include "sarzone/core/interfaces.hpp"
#include "sarzone/engine/search_engine.hpp"
#include "sarzone/io/render_adapter.hpp"

namespace sarzone::engine {

/**
 * @brief Current-result slot with last-write-wins semantics.
 *
 * Each submitted request takes a ticket from `begin_request()`. A completion is dropped when
 * a newer ticket has already completed, successfully or not, so a slow request that finishes
 * after a newer one is discarded. Only successful results replace the stored one. Safe to use
 * from several threads.
 */
class SearchSession final {
 public:
  using Ticket = std::uint64_t;

  /**
   * @brief Reserve the next ticket.
   */
  [[nodiscard]] Ticket begin_request();

  /**
   * @brief Offer a completed result.
   * @return True when the result became current.
   */
  bool complete(Ticket ticket, SearchResult result);

  [[nodiscard]] std::optional<SearchResult> current() const;
  [[nodiscard]] std::optional<Ticket> current_ticket() const;

  void clear();

  /**
   * @brief Hand the current result to a renderer.
   * @return False when there is nothing to render.
   */
  bool render_current(sarzone::io::IRenderAdapter& adapter) const;

  /**
   * @brief Evaluate a request on a worker thread and complete it into this session.
   *
   * The session and engine must outlive the returned future.
   * @return Future resolving to whether the result became current.
   */
  [[nodiscard]] std::future<bool> run_async(const SearchEngine& engine,
                                            SearchRequest request,
                                            std::unique_ptr<sarzone::core::IUniformSource> source);

 private:
  mutable std::mutex mutex_;
  Ticket next_ticket_{1};
  Ticket latest_ticket_{0};
  Ticket stored_ticket_{0};
  std::optional<SearchResult> current_{};
};

}  // namespace sarzone::engine
