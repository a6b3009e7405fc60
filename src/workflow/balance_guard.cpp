#include <spdlog/spdlog.h>
#include <proofline/workflow/balance_guard.hpp>
#include <algorithm>
#include <string>
#include <utility>

namespace proofline::workflow {

balance_guard::balance_guard(const schema::balance_t threshold,
                             const std::chrono::milliseconds settlement_delay,
                             const uint32_t settlement_checks,
                             sleeper_t sleeper)
    : threshold_{threshold},
      settlement_delay_{settlement_delay},
      settlement_checks_{std::max<uint32_t>(settlement_checks, 1)},
      sleeper_{std::move(sleeper)} {
  if (!sleeper_) {
    sleeper_ = make_thread_sleeper();
  }
}

std::optional<balance_outcome> balance_guard::ensure(
    const schema::identifier_t& identifier,
    client::remote_client& client,
    schema::workflow_failure_t& failure,
    const top_up_observer_t& on_top_up) const {
  auto error = client::client_error{};
  auto balance = client.get_balance(identifier, error);
  if (!balance) {
    failure.code = schema::workflow_error_code::balance_unavailable;
    failure.message = "unable to read balance: " + error.message;
    return std::nullopt;
  }

  auto outcome = balance_outcome{.initial_balance = *balance};
  spdlog::info("Current balance: {}", outcome.initial_balance);
  if (outcome.initial_balance >= threshold_) {
    outcome.threshold_met = true;
    return outcome;
  }

  if (on_top_up) {
    on_top_up(outcome.initial_balance);
  }
  spdlog::info("Balance below {}, topping up with {}", threshold_, threshold_);
  outcome.top_up = client.top_up_credits(identifier, threshold_, error);
  if (!outcome.top_up) {
    failure.code = schema::workflow_error_code::top_up_failed;
    failure.message = "top-up failed: " + error.message;
    return std::nullopt;
  }
  outcome.topped_up = true;
  spdlog::info("Top-up transaction {} for {}", outcome.top_up->transaction_hash,
               outcome.top_up->amount);

  outcome.settled_balance = settle(identifier, client);
  outcome.threshold_met =
      outcome.settled_balance && *outcome.settled_balance >= threshold_;
  if (!outcome.threshold_met) {
    spdlog::warn(
        "insufficient_balance_after_top_up: balance still below {} after {} "
        "check(s); submitting anyway",
        threshold_, settlement_checks_);
  }
  return outcome;
}

std::optional<schema::balance_t> balance_guard::settle(
    const schema::identifier_t& identifier,
    client::remote_client& client) const {
  auto latest = std::optional<schema::balance_t>{};
  for (auto check = uint32_t{1}; check <= settlement_checks_; ++check) {
    sleeper_(settlement_delay_);
    auto error = client::client_error{};
    auto balance = client.get_balance(identifier, error);
    if (!balance) {
      spdlog::warn("Balance re-check {} failed: {}", check, error.message);
      continue;
    }
    latest = balance;
    spdlog::info("New balance after top-up: {}", *latest);
    if (*latest >= threshold_) {
      break;
    }
  }
  return latest;
}

}  // namespace proofline::workflow
