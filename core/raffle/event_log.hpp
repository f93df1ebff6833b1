/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include <boost/signals2.hpp>

#include "raffle/events.hpp"

namespace rf::raffle {
  using events::RaffleEvent;

  /**
   * Append-only record of raffle lifecycle events. Observers are notified
   * synchronously after the event is stored.
   */
  class EventLog {
   public:
    using Connection = boost::signals2::connection;
    using EventCallback = void(const RaffleEvent &);

    void append(RaffleEvent event);

    Connection subscribe(std::function<EventCallback> cb);

    std::vector<RaffleEvent> events() const;

    size_t size() const;

    /// Events of one type in emission order
    template <typename T>
    std::vector<T> eventsOf() const {
      std::vector<T> result;
      std::lock_guard lock{mutex_};
      for (const auto &event : events_) {
        if (const auto *typed{boost::get<T>(&event)}) {
          result.push_back(*typed);
        }
      }
      return result;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<RaffleEvent> events_;
    boost::signals2::signal<EventCallback> signal_;
  };
}  // namespace rf::raffle
