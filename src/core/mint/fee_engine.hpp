#pragma once

#include <cstdint>

#include "core/model/types.hpp"

namespace scanmint {

struct FeeQuote {
  std::uint64_t index = 0;
  std::uint64_t required_total_cost = 0;
  std::uint64_t spent_units = 0;
  std::uint64_t billable_units = 0;
  std::uint64_t unit_price = 0;
  std::uint64_t required_fee = 0;
  bool fee_overflow = false;
};

struct Settlement {
  std::uint64_t fee = 0;
  std::uint64_t refund = 0;
};

// Linear schedule: claim i costs kFeeSlopeUnits * i + kFeeBaseUnits units in
// total. The caller pays, in value, whatever part of that total the metered
// execution has not already consumed.
class FeeEngine {
public:
  [[nodiscard]] static std::uint64_t required_total_cost(std::uint64_t index);
  [[nodiscard]] static FeeQuote quote(std::uint64_t index, std::uint64_t spent_units,
                                      std::uint64_t unit_price);
  static Result settle(const FeeQuote& quote, std::uint64_t attached_value, Settlement& out);
};

}  // namespace scanmint
