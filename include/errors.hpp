#pragma once
#include <string>
#include <system_error>

namespace mender {

enum class errc {
    // precondition
    invalid_contract = 1,
    contract_not_present,
    insufficient_funds,
    currency_overflow,
    // transport
    dial_failed,
    timed_out,
    connection_closed,
    // protocol
    rpc_init_failed,
    host_rejected,
    revision_mismatch,
    unlock_conditions_mismatch,
    bad_host_signature,
    object_too_large,
    malformed_object,
    // integrity
    wrong_sector_count,
    short_sector,
    bad_sector_data,
    // local data
    file_not_local,
    open_failed,
    read_failed,
    encode_failed,
    persist_failed,
    // internal consistency
    pieces_mismatch,
    // interruption
    interrupted
};

enum class error_class { none, precondition, transport, protocol, integrity, local, internal, interruption };

const std::error_category& mender_category();
std::error_code make_error_code(errc e);

// Sorts any error (mender, asio or system) into one of the classes above.
error_class classify(const std::error_code& ec);
const char* error_class_name(error_class c);

inline bool is_revision_mismatch(const std::error_code& ec) {
    return ec == make_error_code(errc::revision_mismatch);
}
inline bool is_interruption(const std::error_code& ec) {
    return classify(ec) == error_class::interruption;
}

} // namespace mender

namespace std {
template <> struct is_error_code_enum<mender::errc> : true_type {};
} // namespace std
