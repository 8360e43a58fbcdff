/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

namespace tv::clock {
  std::string unixTimeToString(UnixTime time) {
    const auto days{std::chrono::floor<Day>(time)};
    const auto seconds_of_day{time - days};
    const boost::posix_time::ptime ptime{
        boost::gregorian::date(1970, 1, 1)
            + boost::gregorian::days{static_cast<long>(days.count())},
        boost::posix_time::seconds{static_cast<long>(seconds_of_day.count())}};
    return boost::posix_time::to_iso_extended_string(ptime) + "Z";
  }
}  // namespace tv::clock
