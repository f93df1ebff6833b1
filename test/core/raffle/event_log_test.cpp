/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "raffle/event_log.hpp"

#include <gtest/gtest.h>

namespace rf::raffle {
  using events::RaffleEntered;
  using events::RaffleOpened;
  using events::RaffleWinnerPicked;
  using events::RequestedRaffleWinner;
  using events::toString;

  /**
   * @given subscribed observer
   * @when events are appended
   * @then observer and log see them in emission order
   */
  TEST(EventLogTest, AppendAndSubscribe) {
    EventLog log;
    std::vector<std::string> seen;
    auto connection{log.subscribe(
        [&](const RaffleEvent &event) { seen.push_back(toString(event)); })};

    const auto owner{Address::makeFromId(1)};
    const auto player{Address::makeFromId(101)};
    log.append(RaffleOpened{owner, 5});
    log.append(RaffleEntered{player});
    log.append(RequestedRaffleWinner{3});
    log.append(RaffleWinnerPicked{player});

    EXPECT_EQ(log.size(), 4);
    EXPECT_EQ(seen.size(), 4);
    EXPECT_EQ(seen[0],
              "RaffleOpened(0x0000000000000000000000000000000000000001, "
              "0.000000000000000005 ether)");
    EXPECT_EQ(seen[2], "RequestedRaffleWinner(3)");
    EXPECT_EQ(seen[3],
              "RaffleWinnerPicked(0x0000000000000000000000000000000000000065)");

    const auto events{log.events()};
    ASSERT_EQ(events.size(), 4);
    EXPECT_EQ(toString(events[1]), toString(RaffleEntered{player}));
  }

  /// Disconnected observer is not notified
  TEST(EventLogTest, Disconnect) {
    EventLog log;
    size_t calls{0};
    auto connection{log.subscribe([&](const RaffleEvent &) { ++calls; })};
    log.append(RequestedRaffleWinner{1});
    connection.disconnect();
    log.append(RequestedRaffleWinner{2});
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(log.size(), 2);
  }

  /// Events are filtered by type keeping order
  TEST(EventLogTest, EventsOf) {
    EventLog log;
    const auto first{Address::makeFromId(101)};
    const auto second{Address::makeFromId(102)};
    log.append(RaffleOpened{Address::makeFromId(1), 0});
    log.append(RaffleEntered{first});
    log.append(RaffleEntered{second});

    const auto entered{log.eventsOf<RaffleEntered>()};
    ASSERT_EQ(entered.size(), 2);
    EXPECT_EQ(entered[0].player, first);
    EXPECT_EQ(entered[1].player, second);
    EXPECT_TRUE(log.eventsOf<RaffleWinnerPicked>().empty());
  }
}  // namespace rf::raffle
