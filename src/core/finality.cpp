#include "flowtx/core/finality.hpp"
#include "flowtx/core/errors.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace flowtx::core {

  Outcome classify(int32_t status, uint32_t status_code) {
    switch (static_cast<TransactionStatus>(status)) {
      case TransactionStatus::Unknown:
      case TransactionStatus::Pending:
      case TransactionStatus::Finalized:
      case TransactionStatus::Executed:
        return Outcome::Pending;
      case TransactionStatus::Sealed:
        return status_code == 0 ? Outcome::Success : Outcome::ExecutionError;
      case TransactionStatus::Expired:
        return Outcome::Expired;
    }
    return Outcome::Unknown;
  }

  std::string to_string(Outcome outcome) {
    switch (outcome) {
      case Outcome::Pending: return "pending";
      case Outcome::Success: return "success";
      case Outcome::ExecutionError: return "execution error";
      case Outcome::Expired: return "expired";
      case Outcome::Unknown: return "unknown";
    }
    return "unknown";
  }

  PollResult await_result(const ResultFetcher& fetch, const PollPolicy& policy,
                          std::atomic<bool>& cancel_flag, Sleeper sleep) {
    if (!fetch) throw InvalidArgument("await_result: no result fetcher");
    if (!sleep) sleep = [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };

    PollResult poll;
    auto delay = policy.initial_delay;

    while (poll.attempts < policy.max_attempts) {
      if (cancel_flag) throw Error("await_result: cancelled");
      sleep(delay);
      if (cancel_flag) throw Error("await_result: cancelled");

      poll.result = fetch();
      ++poll.attempts;
      poll.outcome = classify(poll.result);
      if (is_terminal(poll.outcome)) {
        if (poll.outcome == Outcome::Unknown) {
          spdlog::warn("transaction result has unrecognised status {}", poll.result.status);
        } else {
          spdlog::info("transaction {} after {} attempt(s)", to_string(poll.outcome), poll.attempts);
        }
        return poll;
      }
      delay += policy.delay_step;
    }

    spdlog::warn("transaction still pending after {} attempt(s)", poll.attempts);
    return poll;
  }
}
