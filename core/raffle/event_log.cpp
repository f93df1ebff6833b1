/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/event_log.hpp"

namespace rf::raffle {
  void EventLog::append(RaffleEvent event) {
    {
      std::lock_guard lock{mutex_};
      events_.push_back(event);
    }
    signal_(event);
  }

  EventLog::Connection EventLog::subscribe(std::function<EventCallback> cb) {
    return signal_.connect(std::move(cb));
  }

  std::vector<RaffleEvent> EventLog::events() const {
    std::lock_guard lock{mutex_};
    return events_;
  }

  size_t EventLog::size() const {
    std::lock_guard lock{mutex_};
    return events_.size();
  }
}  // namespace rf::raffle
