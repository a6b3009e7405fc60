#pragma once

#include <proofline/client/remote_client.hpp>
#include <proofline/schema/primitives.hpp>
#include <proofline/schema/top_up_result.hpp>
#include <proofline/schema/workflow_failure.hpp>
#include <proofline/workflow/sleeper.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace proofline::workflow {

/// What ensure() observed and did for one identifier.
struct balance_outcome final {
  schema::balance_t initial_balance{};
  bool topped_up{};
  std::optional<schema::top_up_result_t> top_up;
  /// Last balance read after the settlement wait, if the read succeeded.
  std::optional<schema::balance_t> settled_balance;
  bool threshold_met{};
};

/// Invoked with the observed balance right before a top-up is issued.
using top_up_observer_t = std::function<void(schema::balance_t balance)>;

/// Keeps an identifier's prepaid balance at or above a submission threshold.
///
/// At most one top-up of exactly `threshold` is issued per ensure() call.
/// After it the guard waits `settlement_delay` and re-reads the balance, up
/// to `settlement_checks` times. The top-up call itself is the success
/// signal: a balance still short after the last check is logged as
/// insufficient_balance_after_top_up and reported through
/// `threshold_met == false`, not as a failure.
class balance_guard final {
 public:
  balance_guard(schema::balance_t threshold,
                std::chrono::milliseconds settlement_delay,
                uint32_t settlement_checks,
                sleeper_t sleeper);

  /// Fails with balance_unavailable when the initial balance read fails
  /// and with top_up_failed when the top-up is refused.
  std::optional<balance_outcome> ensure(
      const schema::identifier_t& identifier,
      client::remote_client& client,
      schema::workflow_failure_t& failure,
      const top_up_observer_t& on_top_up = {}) const;

  schema::balance_t threshold() const { return threshold_; }

 private:
  std::optional<schema::balance_t> settle(
      const schema::identifier_t& identifier,
      client::remote_client& client) const;

  schema::balance_t threshold_{};
  std::chrono::milliseconds settlement_delay_{};
  uint32_t settlement_checks_{1};
  sleeper_t sleeper_;
};

}  // namespace proofline::workflow
