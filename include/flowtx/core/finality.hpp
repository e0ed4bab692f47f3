#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace flowtx::core {

  // Transaction result status as reported by the access API.
  enum class TransactionStatus : int32_t {
    Unknown = 0,
    Pending = 1,
    Finalized = 2,
    Executed = 3,
    Sealed = 4,
    Expired = 5,
  };

  enum class Outcome {
    Pending,
    Success,
    ExecutionError,
    Expired,
    Unknown,
  };

  struct TransactionResult {
    int32_t status = 0;
    uint32_t status_code = 0;
    std::string error_message;
  };

  // Unknown/Pending/Finalized/Executed keep polling; Sealed is final (status_code 0
  // is success); Expired is terminal; any other status value is Unknown.
  Outcome classify(int32_t status, uint32_t status_code);
  inline Outcome classify(const TransactionResult& result) { return classify(result.status, result.status_code); }

  inline bool is_terminal(Outcome outcome) { return outcome != Outcome::Pending; }

  std::string to_string(Outcome outcome);

  struct PollPolicy {
    uint32_t max_attempts = 50;
    std::chrono::milliseconds initial_delay{50};
    std::chrono::milliseconds delay_step{200};
  };

  struct PollResult {
    Outcome outcome = Outcome::Pending;
    TransactionResult result;
    uint32_t attempts = 0;
  };

  using ResultFetcher = std::function<TransactionResult()>;
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  // Sleeps, fetches, classifies; stops at the first terminal outcome or after
  // policy.max_attempts fetches (outcome stays Pending). The delay grows by
  // delay_step after every pending result. Throws on cancel.
  PollResult await_result(const ResultFetcher& fetch, const PollPolicy& policy,
                          std::atomic<bool>& cancel_flag, Sleeper sleep = nullptr);
}
