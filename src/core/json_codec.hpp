/**
 * ============================================================================
 * SOFTWARE: ATL: Atoll Coin Ledger
 * MODULE: json_codec.hpp
 * ============================================================================
 * * DESCRIPTION:
 * nlohmann::json conversions for the core types. Used by the HTTP surface for
 * response bodies and by the PostgreSQL backend for the subject detail column.
 * ============================================================================
 */

#ifndef ATL_JSON_CODEC_HPP
#define ATL_JSON_CODEC_HPP

#include "atl_types.hpp"

namespace atl {

    void to_json(json& j, const Account& account);
    void to_json(json& j, const LedgerEntry& entry);
    void to_json(json& j, const ModeratedSubject& subject);
    void to_json(json& j, const Notification& notification);
    void to_json(json& j, const AuditRecord& record);
    void to_json(json& j, const ReconcileReport& report);
    void to_json(json& j, const HistoryPage& page);

    json details_to_json(const SubjectDetails& details);

    // Throws json::exception when a required field is missing or mistyped.
    SubjectDetails details_from_json(SubjectKind kind, const json& j);

} // namespace atl

#endif // ATL_JSON_CODEC_HPP
