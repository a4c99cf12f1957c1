/**
 * ATL: Atoll Coin Ledger - Audit trail
 * Default IAuditSink: appends each record to the repository's audit table and
 * mirrors it to the log at AUDIT level.
 */

#ifndef ATL_AUDIT_HPP
#define ATL_AUDIT_HPP

#include "../plugins/interface/atl_sink.hpp"
#include "../storage/Repository.hpp"

namespace atl {

class RepositoryAuditSink : public IAuditSink {
public:
    explicit RepositoryAuditSink(storage::Repository& repo);

    void record(const AuditRecord& record) override;

private:
    storage::Repository& repo_;
};

} // namespace atl

#endif // ATL_AUDIT_HPP
