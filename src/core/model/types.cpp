#include "core/model/types.hpp"

namespace extropy {

std::string_view error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return "None";
    case ErrorKind::InvalidAmount:
      return "InvalidAmount";
    case ErrorKind::SelfTransfer:
      return "SelfTransfer";
    case ErrorKind::AccountNotFound:
      return "AccountNotFound";
    case ErrorKind::InsufficientBalance:
      return "InsufficientBalance";
    case ErrorKind::UnknownAttributionKind:
      return "UnknownAttributionKind";
    case ErrorKind::DuplicateAttribution:
      return "DuplicateAttribution";
    case ErrorKind::DuplicateAccount:
      return "DuplicateAccount";
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::NotInitialized:
      return "NotInitialized";
    case ErrorKind::StorageFault:
      return "StorageFault";
  }
  return "Unknown";
}

std::string_view transaction_kind_name(TransactionKind kind) {
  switch (kind) {
    case TransactionKind::Earn:
      return "earn";
    case TransactionKind::Transfer:
      return "transfer";
    case TransactionKind::Attribution:
      return "attribution";
  }
  return "earn";
}

std::optional<TransactionKind> transaction_kind_from_string(std::string_view text) {
  if (text == "earn") {
    return TransactionKind::Earn;
  }
  if (text == "transfer") {
    return TransactionKind::Transfer;
  }
  if (text == "attribution") {
    return TransactionKind::Attribution;
  }
  return std::nullopt;
}

std::string_view attribution_kind_name(AttributionKind kind) {
  switch (kind) {
    case AttributionKind::Citation:
      return "citation";
    case AttributionKind::Remix:
      return "remix";
    case AttributionKind::Reply:
      return "reply";
  }
  return "citation";
}

}  // namespace extropy
