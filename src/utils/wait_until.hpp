/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <type_traits>
#include <utility>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "clock/sleeper.hpp"
#include "log/logger.hpp"
#include "utils/ceil_div.hpp"

namespace anchorwatch {

  enum class WaitError {
    TIMED_OUT = 1,
  };
  Q_ENUM_ERROR_CODE(WaitError) {
    using E = decltype(e);
    switch (e) {
      case E::TIMED_OUT:
        return "Timed out";
    }
    abort();
  }

  struct WaitOptions {
    /// Diagnostic reported when all attempts are exhausted
    std::string error_with = "Timed out";
    std::chrono::milliseconds timeout = std::chrono::seconds{5};
    std::chrono::milliseconds step = std::chrono::milliseconds{500};
  };

  namespace detail {
    template <typename R>
    concept OutcomeLike = requires(R r) {
      r.has_value();
      r.value();
      r.error();
    };

    template <typename R>
    struct ProbeValue {
      using type = R;
    };

    template <OutcomeLike R>
    struct ProbeValue<R> {
      using type = std::decay_t<decltype(std::declval<R &>().value())>;
    };
  }  // namespace detail

  /**
   * Bounded-retry evaluator used by every wait condition.
   *
   * A probe is invoked up to ceil(timeout / step) times with a sleep of `step`
   * after each unsuccessful attempt. An attempt is unsuccessful when the probe
   * returns an error result, throws, or its value does not satisfy the
   * predicate. Exhausting the attempts yields WaitError::TIMED_OUT; the
   * caller's diagnostic is logged at that point.
   */
  class Waiter {
   public:
    Waiter(qtils::SharedRef<log::LoggingSystem> logging_system,
           qtils::SharedRef<clock::Sleeper> sleeper)
        : logger_{logging_system->getLogger("Waiter",
                                            log::defaultGroupName)},
          sleeper_{std::move(sleeper)} {}

    template <typename Probe, typename Predicate>
    auto untilWithValue(Probe &&probe,
                        Predicate &&predicate,
                        const WaitOptions &options) const
        -> outcome::result<
            typename detail::ProbeValue<std::invoke_result_t<Probe &>>::type> {
      using Result = std::invoke_result_t<Probe &>;
      const auto attempts = ceilDiv(options.timeout, options.step);
      for (uint64_t attempt = 0; attempt < attempts; ++attempt) {
        try {
          if constexpr (detail::OutcomeLike<Result>) {
            auto res = probe();
            if (res.has_value() and predicate(std::as_const(res.value()))) {
              return std::move(res).value();
            }
            if (res.has_error()) {
              SL_TRACE(logger_,
                       "Attempt {}/{} failed: {}",
                       attempt + 1,
                       attempts,
                       res.error());
            }
          } else {
            auto value = probe();
            if (predicate(std::as_const(value))) {
              return value;
            }
          }
        } catch (const std::exception &e) {
          SL_TRACE(logger_,
                   "Attempt {}/{} threw: {}",
                   attempt + 1,
                   attempts,
                   e.what());
        }
        sleeper_->sleepFor(options.step);
      }
      SL_WARN(logger_, "{}", options.error_with);
      return WaitError::TIMED_OUT;
    }

    /// Variant for probes whose value is itself the condition
    template <typename Probe>
    outcome::result<void> until(Probe &&probe,
                                const WaitOptions &options) const {
      auto res = untilWithValue(
          std::forward<Probe>(probe),
          [](const auto &value) { return static_cast<bool>(value); },
          options);
      if (res.has_error()) {
        return res.error();
      }
      return outcome::success();
    }

    void sleepFor(std::chrono::milliseconds duration) const {
      sleeper_->sleepFor(duration);
    }

   private:
    log::Logger logger_;
    qtils::SharedRef<clock::Sleeper> sleeper_;
  };

}  // namespace anchorwatch
