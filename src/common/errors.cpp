#include "errors.hpp"

namespace mender {

namespace {

class MenderCategory : public std::error_category {
public:
  const char *name() const noexcept override { return "mender"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
    case errc::invalid_contract:
      return "invalid contract";
    case errc::contract_not_present:
      return "contract not present in contract set";
    case errc::insufficient_funds:
      return "contract has insufficient funds to support download";
    case errc::currency_overflow:
      return "currency arithmetic out of range";
    case errc::dial_failed:
      return "could not connect to host";
    case errc::timed_out:
      return "network deadline exceeded";
    case errc::connection_closed:
      return "connection closed";
    case errc::rpc_init_failed:
      return "couldn't initiate RPC";
    case errc::host_rejected:
      return "host rejected the request";
    case errc::revision_mismatch:
      return "host has a different latest revision";
    case errc::unlock_conditions_mismatch:
      return "unlock conditions do not match";
    case errc::bad_host_signature:
      return "host signature is invalid";
    case errc::object_too_large:
      return "encoded object exceeds size limit";
    case errc::malformed_object:
      return "could not decode object";
    case errc::wrong_sector_count:
      return "host did not send exactly one sector";
    case errc::short_sector:
      return "host did not send enough sector data";
    case errc::bad_sector_data:
      return "host sent bad sector data";
    case errc::file_not_local:
      return "file not available locally";
    case errc::open_failed:
      return "failed to open file locally";
    case errc::read_failed:
      return "failed to read file locally";
    case errc::encode_failed:
      return "erasure coding failed";
    case errc::persist_failed:
      return "could not persist fallback revision";
    case errc::pieces_mismatch:
      return "not enough physical pieces to match the upload settings of the file";
    case errc::interrupted:
      return "interrupted by stop call";
    }
    return "unknown mender error";
  }
};

} // namespace

const std::error_category &mender_category() {
  static MenderCategory cat;
  return cat;
}

std::error_code make_error_code(errc e) {
  return std::error_code(static_cast<int>(e), mender_category());
}

error_class classify(const std::error_code &ec) {
  if (!ec)
    return error_class::none;
  if (ec.category() != mender_category()) {
    if (ec == std::errc::operation_canceled)
      return error_class::interruption;
    return error_class::transport;
  }
  switch (static_cast<errc>(ec.value())) {
  case errc::invalid_contract:
  case errc::contract_not_present:
  case errc::insufficient_funds:
  case errc::currency_overflow:
    return error_class::precondition;
  case errc::dial_failed:
  case errc::timed_out:
  case errc::connection_closed:
    return error_class::transport;
  case errc::wrong_sector_count:
  case errc::short_sector:
  case errc::bad_sector_data:
    return error_class::integrity;
  case errc::file_not_local:
  case errc::open_failed:
  case errc::read_failed:
  case errc::encode_failed:
  case errc::persist_failed:
    return error_class::local;
  case errc::pieces_mismatch:
    return error_class::internal;
  case errc::interrupted:
    return error_class::interruption;
  default:
    return error_class::protocol;
  }
}

const char *error_class_name(error_class c) {
  switch (c) {
  case error_class::none:
    return "none";
  case error_class::precondition:
    return "precondition";
  case error_class::transport:
    return "transport";
  case error_class::protocol:
    return "protocol";
  case error_class::integrity:
    return "integrity";
  case error_class::local:
    return "local";
  case error_class::internal:
    return "internal";
  default:
    return "interruption";
  }
}

} // namespace mender
