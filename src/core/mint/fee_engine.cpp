#include "core/mint/fee_engine.hpp"

#include <limits>
#include <string>

namespace scanmint {

std::uint64_t FeeEngine::required_total_cost(std::uint64_t index) {
  return kFeeSlopeUnits * index + kFeeBaseUnits;
}

FeeQuote FeeEngine::quote(std::uint64_t index, std::uint64_t spent_units, std::uint64_t unit_price) {
  FeeQuote quote;
  quote.index = index;
  quote.required_total_cost = required_total_cost(index);
  quote.spent_units = spent_units;
  quote.unit_price = unit_price;

  // Execution that already covers the schedule floors the bill at zero.
  const std::uint64_t consumed = spent_units + kFeeEstimationBiasUnits;
  if (spent_units <= std::numeric_limits<std::uint64_t>::max() - kFeeEstimationBiasUnits &&
      consumed < quote.required_total_cost) {
    quote.billable_units = quote.required_total_cost - consumed;
  }

  if (unit_price != 0 && quote.billable_units > std::numeric_limits<std::uint64_t>::max() / unit_price) {
    quote.fee_overflow = true;
    quote.required_fee = std::numeric_limits<std::uint64_t>::max();
    return quote;
  }
  quote.required_fee = quote.billable_units * unit_price;
  return quote;
}

Result FeeEngine::settle(const FeeQuote& quote, std::uint64_t attached_value, Settlement& out) {
  if (quote.fee_overflow || attached_value < quote.required_fee) {
    return Result::failure(MintError::InsufficientPayment,
                           "Fee insufficient: required " +
                               (quote.fee_overflow ? std::string{"more than 2^64-1"}
                                                   : std::to_string(quote.required_fee)) +
                               ", attached " + std::to_string(attached_value) + ".");
  }

  out.fee = quote.required_fee;
  out.refund = attached_value - quote.required_fee;
  return Result::success();
}

}  // namespace scanmint
