#include "atl_types.hpp"
#include <chrono>
#include <stdexcept>

namespace atl {

const char* const kGenesisSeal = "GENESIS";

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

const char* to_string(Role role) {
    switch (role) {
        case Role::User: return "USER";
        case Role::Admin: return "ADMIN";
    }
    return "USER";
}

const char* to_string(LedgerReason reason) {
    switch (reason) {
        case LedgerReason::Topup: return "TOPUP";
        case LedgerReason::Post: return "POST";
        case LedgerReason::Connect: return "CONNECT";
        case LedgerReason::Adjust: return "ADJUST";
        case LedgerReason::Refund: return "REFUND";
    }
    return "ADJUST";
}

const char* to_string(SubjectKind kind) {
    switch (kind) {
        case SubjectKind::UserProfile: return "USER_PROFILE";
        case SubjectKind::Post: return "POST";
        case SubjectKind::ConnectionRequest: return "CONNECTION_REQUEST";
        case SubjectKind::TopupRequest: return "TOPUP_REQUEST";
    }
    return "POST";
}

const char* to_string(SubjectStatus status) {
    switch (status) {
        case SubjectStatus::Pending: return "PENDING";
        case SubjectStatus::Approved: return "APPROVED";
        case SubjectStatus::Rejected: return "REJECTED";
        case SubjectStatus::Cancelled: return "CANCELLED";
    }
    return "PENDING";
}

const char* to_string(Decision decision) {
    return decision == Decision::Approved ? "APPROVED" : "REJECTED";
}

Role role_from_string(const std::string& name) {
    if (name == "USER") return Role::User;
    if (name == "ADMIN") return Role::Admin;
    throw std::invalid_argument("unknown role: " + name);
}

LedgerReason reason_from_string(const std::string& name) {
    if (name == "TOPUP") return LedgerReason::Topup;
    if (name == "POST") return LedgerReason::Post;
    if (name == "CONNECT") return LedgerReason::Connect;
    if (name == "ADJUST") return LedgerReason::Adjust;
    if (name == "REFUND") return LedgerReason::Refund;
    throw std::invalid_argument("unknown ledger reason: " + name);
}

SubjectKind kind_from_string(const std::string& name) {
    if (name == "USER_PROFILE") return SubjectKind::UserProfile;
    if (name == "POST") return SubjectKind::Post;
    if (name == "CONNECTION_REQUEST") return SubjectKind::ConnectionRequest;
    if (name == "TOPUP_REQUEST") return SubjectKind::TopupRequest;
    throw std::invalid_argument("unknown subject kind: " + name);
}

SubjectStatus status_from_string(const std::string& name) {
    if (name == "PENDING") return SubjectStatus::Pending;
    if (name == "APPROVED") return SubjectStatus::Approved;
    if (name == "REJECTED") return SubjectStatus::Rejected;
    if (name == "CANCELLED") return SubjectStatus::Cancelled;
    throw std::invalid_argument("unknown subject status: " + name);
}

const char* entity_name(SubjectKind kind) {
    switch (kind) {
        case SubjectKind::UserProfile: return "users";
        case SubjectKind::Post: return "posts";
        case SubjectKind::ConnectionRequest: return "connection_requests";
        case SubjectKind::TopupRequest: return "coin_topups";
    }
    return "posts";
}

SubjectDetails details_for(SubjectKind kind) {
    switch (kind) {
        case SubjectKind::UserProfile: return ProfileDetails{};
        case SubjectKind::Post: return PostDetails{};
        case SubjectKind::ConnectionRequest: return ConnectionDetails{};
        case SubjectKind::TopupRequest: return TopupDetails{};
    }
    return PostDetails{};
}

} // namespace atl
