#include <cassert>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "ledger/kernel/v1/event.pb.h"

namespace {

using ledger::db::ErrorCode;
using ledger::db::Repository;
using ledger::db::memory::MemoryRepository;
using ledger::db::model::EdgeRecord;
using ledger::db::model::EventQuery;
using ledger::db::model::EventRecord;
using ledger::db::model::PruneCounts;
using ledger::db::model::PruneRequest;
using ledger::db::model::SpanRecord;
namespace v1 = ledger::kernel::v1;

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository; // empty store
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;         // reopen the same store
  std::function<void()>                             cleanup;
};

EventRecord MakeRecord(const std::string& id, const std::string& trace, const std::string& parent, int stage,
                       int64_t ts, const std::string& span = "") {
  EventRecord record;
  record.event_id        = id;
  record.trace_id        = trace;
  record.span_id         = span.empty() ? "spn_" + id : span;
  record.parent_event_id = parent;
  record.type            = "inject.applied";
  record.stage           = stage;
  record.source          = "test";
  record.worker_id       = "w1";
  record.timestamp_ms    = ts;
  record.status          = v1::EVENT_STATUS_OK;
  record.envelope        = "envelope:" + id;
  record.ingested_at_ms  = ts + 1;
  return record;
}

std::vector<std::string> Ids(const std::vector<EventRecord>& records) {
  std::vector<std::string> ids;
  for (const auto& record : records) ids.push_back(record.event_id);
  return ids;
}

void VerifyInsertGetAndDuplicates(Repository& repo) {
  auto tx = repo.Begin();

  auto first = MakeRecord("e1", "t1", "", v1::STAGE_INGRESS, 100);
  first.sequence = 7;
  assert(repo.InsertEvent(*tx, first));
  assert(first.row_id > 0);

  auto second = MakeRecord("e2", "t1", "e1", v1::STAGE_INJECT, 110);
  assert(repo.InsertEvent(*tx, second));
  assert(second.row_id > first.row_id);

  auto duplicate = MakeRecord("e1", "t1", "", v1::STAGE_INGRESS, 999);
  auto result    = repo.InsertEvent(*tx, duplicate);
  assert(!result);
  assert(result.code == ErrorCode::AlreadyExists);

  // writes are visible inside their own transaction
  assert(repo.GetEvent(*tx, "e2").has_value());
  tx->Commit();

  auto read = repo.BeginRead();
  auto got  = repo.GetEvent(*read, "e1");
  assert(got.has_value());
  assert(got->timestamp_ms == 100);
  assert(got->sequence.value() == 7);
  assert(got->envelope == "envelope:e1");
  assert(got->stage == v1::STAGE_INGRESS);
  assert(!repo.GetEvent(*read, "e2")->sequence.has_value());
  assert(!repo.GetEvent(*read, "missing").has_value());
  assert(repo.CountEvents(*read) == 2);
  read->Commit();
}

void VerifyTraceListing(Repository& repo) {
  auto tx = repo.Begin();
  // arrival order, not timestamp order
  auto late  = MakeRecord("a", "t2", "", v1::STAGE_INGRESS, 500);
  auto early = MakeRecord("b", "t2", "a", v1::STAGE_ROUTE, 100);
  auto root2 = MakeRecord("c", "t2", "", v1::STAGE_INGRESS, 300);
  auto other = MakeRecord("d", "t3", "", v1::STAGE_INGRESS, 200);
  assert(repo.InsertEvent(*tx, late));
  assert(repo.InsertEvent(*tx, early));
  assert(repo.InsertEvent(*tx, root2));
  assert(repo.InsertEvent(*tx, other));
  tx->Commit();

  auto read = repo.BeginRead();
  assert((Ids(repo.ListTraceEvents(*read, "t2", 100)) == std::vector<std::string>{"a", "b", "c"}));
  assert((Ids(repo.ListTraceEvents(*read, "t2", 2)) == std::vector<std::string>{"a", "b"}));
  assert((repo.ListTraceRoots(*read, "t2") == std::vector<std::string>{"a", "c"}));
  assert(repo.ListTraceEvents(*read, "missing", 100).empty());
  read->Commit();
}

void VerifyFilteredQueries(Repository& repo) {
  auto tx = repo.Begin();
  for (int i = 0; i < 5; ++i) {
    auto record = MakeRecord("q" + std::to_string(i), "tq", "", i % 2 == 0 ? v1::STAGE_INJECT : v1::STAGE_ACK,
                             1000 + i * 10);
    assert(repo.InsertEvent(*tx, record));
  }
  tx->Commit();

  auto read = repo.BeginRead();

  EventQuery by_stage;
  by_stage.stage = v1::STAGE_INJECT;
  assert((Ids(repo.QueryEvents(*read, by_stage)) == std::vector<std::string>{"q0", "q2", "q4"}));

  EventQuery window;
  window.trace_id = "tq";
  window.since_ms = 1010;
  window.until_ms = 1030; // exclusive
  assert((Ids(repo.QueryEvents(*read, window)) == std::vector<std::string>{"q1", "q2"}));

  EventQuery newest;
  newest.worker_id  = "w1";
  newest.trace_id   = "tq";
  newest.descending = true;
  newest.limit      = 2;
  assert((Ids(repo.QueryEvents(*read, newest)) == std::vector<std::string>{"q4", "q3"}));

  EventQuery none;
  none.type = "no.such";
  assert(repo.QueryEvents(*read, none).empty());

  // keyset paging in arrival order, independent of timestamps
  EventQuery first_page;
  first_page.trace_id      = "tq";
  first_page.arrival_order = true;
  first_page.limit         = 2;
  auto page = repo.QueryEvents(*read, first_page);
  assert((Ids(page) == std::vector<std::string>{"q0", "q1"}));

  EventQuery next_page  = first_page;
  next_page.after_row_id = page.back().row_id;
  assert((Ids(repo.QueryEvents(*read, next_page)) == std::vector<std::string>{"q2", "q3"}));
  read->Commit();
}

void VerifyEdgesAndSpans(Repository& repo) {
  auto tx = repo.Begin();

  auto root  = MakeRecord("r", "te", "", v1::STAGE_INGRESS, 100, "spn_shared");
  auto child = MakeRecord("k", "te", "r", v1::STAGE_INGRESS, 150, "spn_shared");
  assert(repo.InsertEvent(*tx, root));
  assert(repo.InsertEvent(*tx, child));

  EdgeRecord edge{"te", "r", "k", v1::EDGE_TYPE_PARENT, 150};
  assert(repo.InsertEdge(*tx, edge));
  assert(repo.InsertEdge(*tx, edge));
  EdgeRecord ack{"te", "r", "k", v1::EDGE_TYPE_ACK_OF, 150};
  assert(repo.InsertEdge(*tx, ack));

  SpanRecord span;
  span.span_id       = "spn_shared";
  span.trace_id      = "te";
  span.stage         = v1::STAGE_INGRESS;
  span.worker_id     = "w1";
  span.source        = "test";
  span.started_at_ms = 100;
  span.status        = v1::EVENT_STATUS_UNKNOWN;
  span.event_count   = 1;
  assert(repo.UpsertSpan(*tx, span));
  tx->Commit();

  {
    auto read = repo.BeginRead();
    assert(repo.ListTraceEdges(*read, "te").size() == 2);
    assert(repo.ListOpenSpansStartedBefore(*read, 200).size() == 1);
    assert(repo.ListOpenSpansStartedBefore(*read, 100).empty());
    read->Commit();
  }

  tx = repo.Begin();
  span.ended_at_ms = 150;
  span.status      = v1::EVENT_STATUS_OK;
  span.event_count = 2;
  assert(repo.UpsertSpan(*tx, span));
  tx->Commit();

  auto read = repo.BeginRead();
  auto got  = repo.GetSpan(*read, "te", "spn_shared");
  assert(got.has_value());
  assert(got->ended_at_ms.value() == 150);
  assert(got->status == v1::EVENT_STATUS_OK);
  assert(got->event_count == 2);
  assert(repo.ListTraceSpans(*read, "te").size() == 1);
  assert(repo.ListOpenSpansStartedBefore(*read, 10'000).empty());
  assert(!repo.GetSpan(*read, "tf", "spn_shared").has_value());
  read->Commit();

  // the same span id in another trace is a different span
  tx = repo.Begin();
  SpanRecord elsewhere  = span;
  elsewhere.trace_id    = "tf";
  elsewhere.ended_at_ms = std::nullopt;
  elsewhere.status      = v1::EVENT_STATUS_UNKNOWN;
  elsewhere.event_count = 1;
  assert(repo.UpsertSpan(*tx, elsewhere));
  tx->Commit();

  read = repo.BeginRead();
  assert(repo.GetSpan(*read, "te", "spn_shared")->event_count == 2);
  assert(repo.GetSpan(*read, "tf", "spn_shared")->event_count == 1);
  assert(!repo.GetSpan(*read, "tf", "spn_shared")->ended_at_ms.has_value());
  assert(repo.ListOpenSpansStartedBefore(*read, 10'000).size() == 1);
  read->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx     = repo.Begin();
    auto record = MakeRecord("rolled", "tr", "", v1::STAGE_INGRESS, 100);
    assert(repo.InsertEvent(*tx, record));
    EdgeRecord edge{"tr", "x", "rolled", v1::EDGE_TYPE_PARENT, 100};
    assert(repo.InsertEdge(*tx, edge));
    tx->Rollback();
  }
  {
    // destructor rolls back too
    auto tx     = repo.Begin();
    auto record = MakeRecord("abandoned", "tr", "", v1::STAGE_INGRESS, 100);
    assert(repo.InsertEvent(*tx, record));
  }

  auto check = repo.BeginRead();
  assert(!repo.GetEvent(*check, "rolled").has_value());
  assert(!repo.GetEvent(*check, "abandoned").has_value());
  assert(repo.ListTraceEdges(*check, "tr").empty());
  assert(repo.CountEvents(*check) == 0);
  check->Commit();

  // the id is free again
  auto tx     = repo.Begin();
  auto record = MakeRecord("rolled", "tr", "", v1::STAGE_INGRESS, 100);
  assert(repo.InsertEvent(*tx, record));
  tx->Commit();
}

void VerifyPruneCascades(Repository& repo) {
  {
    auto tx = repo.Begin();
    for (int i = 1; i <= 3; ++i) {
      const std::string id     = "p" + std::to_string(i);
      // producer clocks run backwards here; retention goes by ingestion
      auto record = MakeRecord(id, "tp", i == 1 ? "" : "p" + std::to_string(i - 1), v1::STAGE_ROUTE, 1000 - i * 100);
      record.ingested_at_ms = i * 100;
      assert(repo.InsertEvent(*tx, record));

      SpanRecord span;
      span.span_id       = record.span_id;
      span.trace_id      = "tp";
      span.stage         = v1::STAGE_ROUTE;
      span.started_at_ms = i * 100;
      assert(repo.UpsertSpan(*tx, span));
      if (i > 1) {
        EdgeRecord edge{"tp", "p" + std::to_string(i - 1), id, v1::EDGE_TYPE_PARENT, i * 100};
        assert(repo.InsertEdge(*tx, edge));
      }
    }
    tx->Commit();
  }

  PruneCounts counts;
  {
    auto         tx = repo.Begin();
    PruneRequest aged;
    aged.older_than_ms = 150;
    assert(repo.Prune(*tx, aged, &counts));
    tx->Commit();
  }
  assert(counts.events == 1);
  assert(counts.edges == 1);
  assert(counts.spans == 1);

  {
    auto         tx = repo.Begin();
    PruneRequest capped;
    capped.max_rows = 1;
    assert(repo.Prune(*tx, capped, &counts));
    tx->Commit();
  }
  assert(counts.events == 1);
  assert(counts.edges == 1);

  auto read = repo.BeginRead();
  assert(repo.CountEvents(*read) == 1);
  assert((Ids(repo.ListTraceEvents(*read, "tp", 10)) == std::vector<std::string>{"p3"}));
  assert(repo.ListTraceEdges(*read, "tp").empty());
  assert(repo.ListTraceSpans(*read, "tp").size() == 1);
  read->Commit();

  // nothing to do is not an error
  auto         tx = repo.Begin();
  PruneRequest noop;
  noop.max_rows = 10;
  assert(repo.Prune(*tx, noop, &counts));
  assert(counts.events == 0);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx     = repo->Begin();
    auto record = MakeRecord("durable", "td", "", v1::STAGE_VERIFY, 4242);
    assert(repo->InsertEvent(*tx, record));
    EdgeRecord edge{"td", "earlier", "durable", v1::EDGE_TYPE_RETRY_OF, 4242};
    assert(repo->InsertEdge(*tx, edge));
    tx->Commit();
  }

  backend.restart(repo);

  auto read = repo->BeginRead();
  auto got  = repo->GetEvent(*read, "durable");
  assert(got.has_value());
  assert(got->timestamp_ms == 4242);
  assert(got->envelope == "envelope:durable");
  assert(repo->ListTraceEdges(*read, "td").size() == 1);

  // row ids keep growing after a reopen
  read->Commit();
  auto tx   = repo->Begin();
  auto next = MakeRecord("after", "td", "durable", v1::STAGE_VERIFY, 4300);
  assert(repo->InsertEvent(*tx, next));
  assert(next.row_id > got->row_id);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

BackendFactory MakeSqliteFactory() {
  const auto db_path = (std::filesystem::temp_directory_path() / "ledger_repository_parity.db").string();

  auto remove_files = [db_path]() {
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
  };

  auto open = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<ledger::db::sqlite::SqliteDB>(db_path, 1000);
    return std::make_shared<ledger::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name = "sqlite",
      .make_repository =
          [remove_files, open]() {
            remove_files();
            return open();
          },
      .supports_restart = []() { return true; },
      .restart =
          [open](std::shared_ptr<Repository>& repo) {
            repo.reset();
            repo = open();
          },
      .cleanup = remove_files,
  };
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  VerifyInsertGetAndDuplicates(*backend.make_repository());
  VerifyTraceListing(*backend.make_repository());
  VerifyFilteredQueries(*backend.make_repository());
  VerifyEdgesAndSpans(*backend.make_repository());
  VerifyRollbackBehavior(*backend.make_repository());
  VerifyPruneCascades(*backend.make_repository());
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
  backends.push_back(MakeSqliteFactory());

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "ledger_integration_repository_parity: pass\n";
  return 0;
}
