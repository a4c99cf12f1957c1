#include "audit.hpp"
#include "logging.hpp"

namespace atl {

RepositoryAuditSink::RepositoryAuditSink(storage::Repository& repo) : repo_(repo) {}

void RepositoryAuditSink::record(const AuditRecord& record) {
    atl_log("AUDIT", "admin=" + std::to_string(record.admin_id) + " action=" + record.action +
            " entity=" + record.entity + "/" + std::to_string(record.entity_id) + " meta=" + record.meta.dump());
    try {
        repo_.insert_audit(record);
    } catch (const std::exception& e) {
        atl_log("ERROR", "Audit record for " + record.action + " not stored: " + e.what());
    }
}

} // namespace atl
