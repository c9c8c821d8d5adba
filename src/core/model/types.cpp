#include "core/model/types.hpp"

namespace scanmint {

std::string_view mint_error_name(MintError error) {
  switch (error) {
    case MintError::None:
      return "None";
    case MintError::InvalidConfiguration:
      return "InvalidConfiguration";
    case MintError::IndexOutOfRange:
      return "IndexOutOfRange";
    case MintError::AlreadyParticipated:
      return "AlreadyParticipated";
    case MintError::MintingComplete:
      return "MintingComplete";
    case MintError::HashMismatch:
      return "HashMismatch";
    case MintError::InsufficientPayment:
      return "InsufficientPayment";
    case MintError::NotYetClaimed:
      return "NotYetClaimed";
    case MintError::NotAuthorized:
      return "NotAuthorized";
    case MintError::NotOwnerNorApproved:
      return "NotOwnerNorApproved";
    case MintError::RefundFailed:
      return "RefundFailed";
    case MintError::PayoutFailed:
      return "PayoutFailed";
    case MintError::MeterUnavailable:
      return "MeterUnavailable";
    case MintError::ReentrantWrite:
      return "ReentrantWrite";
  }
  return "None";
}

}  // namespace scanmint
