#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ledger::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord> GetEvent(Transaction&, const std::string&) override;
  std::vector<model::EventRecord> ListTraceEvents(Transaction&, const std::string&, uint32_t limit) override;
  std::vector<std::string> ListTraceRoots(Transaction&, const std::string&) override;
  std::vector<model::EventRecord> QueryEvents(Transaction&, const model::EventQuery&) override;
  uint64_t CountEvents(Transaction&) override;

  Result InsertEdge(Transaction&, const model::EdgeRecord&) override;
  std::vector<model::EdgeRecord> ListTraceEdges(Transaction&, const std::string&) override;

  std::optional<model::SpanRecord> GetSpan(Transaction&, const std::string&, const std::string&) override;
  Result UpsertSpan(Transaction&, const model::SpanRecord&) override;
  std::vector<model::SpanRecord> ListTraceSpans(Transaction&, const std::string&) override;
  std::vector<model::SpanRecord> ListOpenSpansStartedBefore(Transaction&, int64_t cutoff_ms) override;

  Result Prune(Transaction&, const model::PruneRequest&, model::PruneCounts*) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
