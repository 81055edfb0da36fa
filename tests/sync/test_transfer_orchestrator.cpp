#include "loaders/loader_factory.h"
#include "support/Fakes.h"
#include "support/TestRunner.h"
#include "sync/TransferOrchestrator.h"
#include <algorithm>

namespace {
// Records the protocol calls a loader receives and can fail any one of them.
struct LoaderCalls {
  std::vector<std::string> calls;

  size_t count(const std::string &name) const {
    return std::count(calls.begin(), calls.end(), name);
  }
};

class RecordingLoader : public IDestinationLoader {
  std::shared_ptr<LoaderCalls> calls_;
  bool transactional_;
  std::string failAt_;

  void step(const std::string &name) {
    calls_->calls.push_back(name);
    if (name == failAt_)
      throw LoadError(name + " failed");
  }

public:
  RecordingLoader(std::shared_ptr<LoaderCalls> calls, bool transactional,
                  std::string failAt)
      : calls_(std::move(calls)), transactional_(transactional),
        failAt_(std::move(failAt)) {}

  bool isTransactional() const override { return transactional_; }
  void beginTransaction() override { step("begin"); }
  void createTable(const TableTarget &) override { step("createTable"); }
  void stage(ByteSource &contents) override {
    drain(contents);
    step("stage");
  }
  void upsert() override { step("upsert"); }
  void tearDown() override { step("tearDown"); }
  void commitTransaction() override { step("commit"); }
  void rollbackTransaction() override { step("rollback"); }
  std::optional<std::string> objectUrl() const override { return std::nullopt; }
};

class RecordingLoaderFactory : public ILoaderFactory {
public:
  std::shared_ptr<LoaderCalls> calls = std::make_shared<LoaderCalls>();
  bool transactional = true;
  std::string failAt;
  size_t opened = 0;

  std::unique_ptr<IDestinationLoader> open(const Destination &) override {
    ++opened;
    return std::make_unique<RecordingLoader>(calls, transactional, failAt);
  }
};

struct Harness {
  FakeCatalogStore catalog;
  FakeConnectionProvider connections;
  std::shared_ptr<FakeObjectStorage> exports =
      std::make_shared<FakeObjectStorage>();
  std::shared_ptr<FakeObjectStorage> staging =
      std::make_shared<FakeObjectStorage>();
  DefaultLoaderFactory loaders{connections, exports, staging};
  std::shared_ptr<FakeConnectionState> source =
      connections.addHost("source-db");

  Harness(const std::string &observed, size_t rows) {
    if (!observed.empty())
      source->queryResult = Fixtures::watermarkResult(observed);
    source->streamColumns = {"order_id", "total", "updated_at"};
    source->streamRows = Fixtures::orderRows(rows);
  }

  TransferOrchestrator orchestrator() {
    return TransferOrchestrator(catalog, connections, loaders);
  }
};
} // namespace

int main() {
  TestRunner runner;
  const Timestamp previous = Fixtures::at("2024-03-01T00:00:00Z");
  const Timestamp observed = Fixtures::at("2024-03-09T10:00:00Z");

  std::cout << "\n========================================" << std::endl;
  std::cout << "TRANSFER ORCHESTRATOR" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("No rows for the tenant cancels without touching the destination",
                 [&]() {
    Harness h("", 0);
    h.catalog.addTransfer(
        Fixtures::transfer(1, Fixtures::redshiftDestination(), previous));
    auto outcome = h.orchestrator().processTransfer(1);

    runner.assertTrue(outcome.disposition == TransferDisposition::CANCELLED,
                      "CANCELLED");
    runner.assertTrue(h.catalog.status(1) == TransferStatus::CANCELLED,
                      "Status persisted");
    runner.assertTrue(*h.catalog.watermark(1) == previous,
                      "Watermark unchanged");
    runner.assertEquals(0, h.connections.connectionsTo("warehouse-db"),
                        "Destination never contacted");
    runner.assertEquals(0, h.source->streamsOpened, "Nothing extracted");
    runner.assertEquals(0, h.catalog.results.count(1),
                        "No result row for a cancellation");
  });

  runner.runTest("Watermark not newer than the share's cancels", [&]() {
    Harness h("2024-03-01T00:00:00Z", 5);
    h.catalog.addTransfer(
        Fixtures::transfer(2, Fixtures::s3Destination(), previous));
    auto outcome = h.orchestrator().processTransfer(2);

    runner.assertTrue(outcome.disposition == TransferDisposition::CANCELLED,
                      "Equal watermark is not new data");
    runner.assertTrue(h.exports->objects.empty(), "Nothing uploaded");
  });

  runner.runTest("Object store transfer uploads and signs", [&]() {
    Harness h("2024-03-09T10:00:00Z", 10);
    h.catalog.addTransfer(
        Fixtures::transfer(3, Fixtures::s3Destination(), previous));
    auto outcome = h.orchestrator().processTransfer(3);

    runner.assertTrue(outcome.disposition == TransferDisposition::COMPLETE,
                      "COMPLETE");
    runner.assertEquals(1, h.exports->objects.size(), "One object uploaded");
    runner.assertTrue(outcome.objectUrl.has_value(), "URL returned");
    runner.assertContains(*outcome.objectUrl, "X-Amz-Signature",
                          "URL is signed");
    runner.assertContains(*outcome.objectUrl, ".gz", "gzip object");
    runner.assertTrue(h.catalog.status(3) == TransferStatus::COMPLETE,
                      "Status persisted");
    runner.assertTrue(*h.catalog.watermark(3) == observed,
                      "Watermark advanced to the observed maximum");
    runner.assertTrue(h.catalog.results.at(3).objectUrl == outcome.objectUrl,
                      "Result row carries the URL");
    runner.assertEquals(10, h.source->rowsPulled, "Every row extracted");
    runner.assertContains(h.source->statements.back(),
                          "\"updated_at\" > '2024-03-01T00:00:00.000000Z'",
                          "Extraction bounded by the previous watermark");
    runner.assertTrue(h.catalog.logs.empty(), "No audit entry on success");
  });

  runner.runTest("First sync extracts everything for the tenant", [&]() {
    Harness h("2024-03-09T10:00:00Z", 3);
    h.catalog.addTransfer(Fixtures::transfer(4, Fixtures::s3Destination()));
    auto outcome = h.orchestrator().processTransfer(4);

    runner.assertTrue(outcome.disposition == TransferDisposition::COMPLETE,
                      "COMPLETE");
    runner.assertFalse(h.source->statements.back().find(" > ") !=
                           std::string::npos,
                       "No watermark filter");
    runner.assertTrue(*h.catalog.watermark(4) == observed, "Watermark set");
  });

  runner.runTest("Warehouse transfer runs the full load protocol", [&]() {
    Harness h("2024-03-09T10:00:00Z", 4);
    auto warehouse = h.connections.addHost("warehouse-db");
    h.catalog.addTransfer(
        Fixtures::transfer(5, Fixtures::redshiftDestination(), previous));
    auto outcome = h.orchestrator().processTransfer(5);

    runner.assertTrue(outcome.disposition == TransferDisposition::COMPLETE,
                      "COMPLETE: " + outcome.message);
    runner.assertFalse(outcome.objectUrl.has_value(), "No URL for warehouses");
    runner.assertEquals("BEGIN", warehouse->statements.front(), "Begins");
    runner.assertEquals("COMMIT", warehouse->statements.back(), "Commits");
    runner.assertTrue(warehouse->executed("CREATE TABLE IF NOT EXISTS \"analytics\".\"orders\""),
                      "Target created in the destination schema");
    runner.assertTrue(warehouse->executed("COPY "), "Bulk loaded");
    runner.assertEquals(0, warehouse->countStatements("ROLLBACK"),
                        "No rollback");
    runner.assertTrue(h.staging->objects.empty(), "Staged object removed");
    runner.assertEquals(1, h.staging->removed.size(), "Exactly one removal");
    runner.assertTrue(*h.catalog.watermark(5) == observed, "Watermark advanced");
  });

  runner.runTest("Incomplete warehouse credentials fail before connecting",
                 [&]() {
    Harness h("2024-03-09T10:00:00Z", 4);
    auto warehouse = h.connections.addHost("warehouse-db");
    Destination destination = Fixtures::redshiftDestination();
    destination.schema.reset();
    h.catalog.addTransfer(Fixtures::transfer(6, destination, previous));
    auto outcome = h.orchestrator().processTransfer(6);

    runner.assertTrue(outcome.disposition == TransferDisposition::FAILED,
                      "FAILED");
    runner.assertContains(outcome.message,
                          "Incomplete credentials for destination with ID 22",
                          "Names the destination");
    runner.assertContains(outcome.message, "schema", "Names the field");
    runner.assertEquals(0, h.connections.connectionsTo("warehouse-db"),
                        "No connection attempt");
    runner.assertTrue(warehouse->statements.empty(), "No rollback issued");
    runner.assertTrue(h.catalog.status(6) == TransferStatus::FAILED,
                      "Status persisted");
    runner.assertFalse(h.catalog.results.at(6).objectUrl.has_value(),
                       "Result has no URL");
    runner.assertTrue(*h.catalog.watermark(6) == previous,
                      "Watermark unchanged");
  });

  runner.runTest("Staging failure rolls back exactly once", [&]() {
    Harness h("2024-03-09T10:00:00Z", 4);
    auto warehouse = h.connections.addHost("warehouse-db");
    h.staging->failUpload = true;
    h.catalog.addTransfer(
        Fixtures::transfer(7, Fixtures::redshiftDestination(), previous));
    auto outcome = h.orchestrator().processTransfer(7);

    runner.assertTrue(outcome.disposition == TransferDisposition::FAILED,
                      "FAILED");
    runner.assertEquals(1, warehouse->countStatements("BEGIN"), "Began");
    runner.assertEquals(1, warehouse->countStatements("ROLLBACK"),
                        "Rolled back once");
    runner.assertEquals(0, warehouse->countStatements("COMMIT"),
                        "Never committed");
    runner.assertFalse(outcome.objectUrl.has_value(), "No URL");
    runner.assertTrue(*h.catalog.watermark(7) == previous,
                      "Watermark unchanged");
    runner.assertEquals(1, h.catalog.logs.size(), "One audit entry");
    runner.assertTrue(h.catalog.logs[0].domain == LogDomain::TRANSFER &&
                          h.catalog.logs[0].action == LogAction::UPDATE,
                      "Recorded against the transfer");
    runner.assertEquals(7, h.catalog.logs[0].domainId, "Transfer id");
    runner.assertContains(h.catalog.logs[0].message,
                          "Transfer 7 failed: stage failed",
                          "Carries the failure");
  });

  runner.runTest("Rollback only for transactional loaders", [&]() {
    for (bool transactional : {true, false}) {
      Harness h("2024-03-09T10:00:00Z", 2);
      RecordingLoaderFactory loaders;
      loaders.transactional = transactional;
      loaders.failAt = "upsert";
      h.catalog.addTransfer(
          Fixtures::transfer(8, Fixtures::s3Destination(), previous));
      TransferOrchestrator orchestrator(h.catalog, h.connections, loaders);
      auto outcome = orchestrator.processTransfer(8);

      runner.assertTrue(outcome.disposition == TransferDisposition::FAILED,
                        "FAILED");
      runner.assertEquals(transactional ? 1 : 0,
                          loaders.calls->count("rollback"),
                          transactional ? "Transactional loader rolled back"
                                        : "Non-transactional loader untouched");
      runner.assertEquals(0, loaders.calls->count("tearDown"),
                          "Stops at the failing step");
    }
  });

  runner.runTest("Failure to open a loader means nothing to roll back", [&]() {
    Harness h("2024-03-09T10:00:00Z", 2);
    h.catalog.addTransfer(
        Fixtures::transfer(9, Fixtures::redshiftDestination(), previous));
    auto outcome = h.orchestrator().processTransfer(9);

    runner.assertTrue(outcome.disposition == TransferDisposition::FAILED,
                      "Unreachable warehouse fails the transfer");
    runner.assertContains(outcome.message, "unreachable", "Connectivity");
    runner.assertEquals(1, h.connections.connectionsTo("warehouse-db"),
                        "One attempt, no retry");
  });

  runner.runTest("Missing configuration fails the transfer", [&]() {
    Harness h("2024-03-09T10:00:00Z", 2);
    TransferGraph graph =
        Fixtures::transfer(10, Fixtures::s3Destination(), previous);
    graph.share.configuration.reset();
    h.catalog.addTransfer(graph);
    auto outcome = h.orchestrator().processTransfer(10);

    runner.assertTrue(outcome.disposition == TransferDisposition::FAILED,
                      "FAILED");
    runner.assertContains(outcome.message,
                          "No configuration found for transfer with ID 10",
                          "Explains why");
    runner.assertEquals(0, h.connections.requests.size(),
                        "Source never contacted");
  });

  runner.runTest("Unreachable source fails the transfer", [&]() {
    FakeCatalogStore catalog;
    FakeConnectionProvider connections;
    RecordingLoaderFactory loaders;
    catalog.addTransfer(
        Fixtures::transfer(11, Fixtures::s3Destination(), previous));
    TransferOrchestrator orchestrator(catalog, connections, loaders);
    auto outcome = orchestrator.processTransfer(11);

    runner.assertTrue(outcome.disposition == TransferDisposition::FAILED,
                      "FAILED");
    runner.assertEquals(0, loaders.opened, "No loader opened");
  });

  runner.runTest("Unparseable watermark fails the transfer", [&]() {
    Harness h("not a timestamp", 2);
    h.catalog.addTransfer(
        Fixtures::transfer(12, Fixtures::s3Destination(), previous));
    auto outcome = h.orchestrator().processTransfer(12);
    runner.assertTrue(outcome.disposition == TransferDisposition::FAILED,
                      "FAILED");
    runner.assertTrue(h.catalog.status(12) == TransferStatus::FAILED,
                      "Status persisted");
  });

  runner.runTest("Transfers not in STARTED are rejected without writes", [&]() {
    Harness h("2024-03-09T10:00:00Z", 2);
    for (TransferStatus status :
         {TransferStatus::PENDING, TransferStatus::COMPLETE,
          TransferStatus::FAILED, TransferStatus::CANCELLED}) {
      TransferGraph graph =
          Fixtures::transfer(13, Fixtures::s3Destination(), previous);
      graph.transfer.status = status;
      h.catalog.graphs[13] = graph;
      auto outcome = h.orchestrator().processTransfer(13);
      runner.assertTrue(outcome.disposition == TransferDisposition::REJECTED,
                        "Rejected from " + transferStatusToString(status));
      runner.assertContains(outcome.message, "has already been processed",
                            "Explains why");
      runner.assertTrue(h.catalog.status(13) == status, "Status untouched");
    }
    runner.assertEquals(0, h.catalog.writes, "Catalog never written");
    runner.assertTrue(h.connections.requests.empty(), "Source never contacted");
  });

  runner.runTest("Unknown transfer is rejected", [&]() {
    Harness h("2024-03-09T10:00:00Z", 2);
    auto outcome = h.orchestrator().processTransfer(404);
    runner.assertTrue(outcome.disposition == TransferDisposition::REJECTED,
                      "REJECTED");
    runner.assertContains(outcome.message,
                          "Transfer with ID 404 does not exist", "Message");
    runner.assertEquals(0, h.catalog.writes, "No writes");
  });

  runner.runTest("Catalog outage before the claim is a rejection", [&]() {
    Harness h("2024-03-09T10:00:00Z", 2);
    h.catalog.addTransfer(
        Fixtures::transfer(14, Fixtures::s3Destination(), previous));
    h.catalog.failLoad = true;
    auto outcome = h.orchestrator().processTransfer(14);
    runner.assertTrue(outcome.disposition == TransferDisposition::REJECTED,
                      "REJECTED");
    runner.assertEquals(0, h.catalog.writes, "No writes");
    h.catalog.failLoad = false;
    runner.assertTrue(h.catalog.status(14) == TransferStatus::STARTED,
                      "Still claimable later");
  });

  runner.runTest("A transfer is processed once", [&]() {
    Harness h("2024-03-09T10:00:00Z", 2);
    h.catalog.addTransfer(
        Fixtures::transfer(15, Fixtures::s3Destination(), previous));
    auto orchestrator = h.orchestrator();
    auto first = orchestrator.processTransfer(15);
    auto second = orchestrator.processTransfer(15);
    runner.assertTrue(first.disposition == TransferDisposition::COMPLETE,
                      "First run completes");
    runner.assertTrue(second.disposition == TransferDisposition::REJECTED,
                      "Second run rejected");
    runner.assertEquals(1, h.exports->objects.size(), "Uploaded once");
  });

  runner.runTest("Failure to record FAILED is contained", [&]() {
    Harness h("not a timestamp", 2);
    h.catalog.addTransfer(
        Fixtures::transfer(16, Fixtures::s3Destination(), previous));
    h.catalog.failFinalizeFailed = true;
    auto outcome = h.orchestrator().processTransfer(16);
    runner.assertTrue(outcome.disposition == TransferDisposition::FAILED,
                      "Still reported as FAILED");
    runner.assertTrue(h.catalog.status(16) == TransferStatus::PENDING,
                      "Left PENDING in the catalog");
    runner.assertTrue(h.catalog.logs.empty(),
                      "No audit entry for a failure that was not recorded");
  });

  runner.runTest("Load target mirrors the configuration", [&]() {
    TableTarget target = TransferOrchestrator::targetFor(
        Fixtures::ordersConfiguration(), Fixtures::redshiftDestination());
    runner.assertEquals("analytics", target.schema, "Destination schema");
    runner.assertEquals("orders", target.table, "Unqualified view table");
    runner.assertEquals(3, target.columns.size(), "Mapped columns only");
    runner.assertEquals("order_id", target.columns[0].name, "Renamed");
    runner.assertEquals("INTEGER", target.columns[0].dataType,
                        "Type from the view column");
    runner.assertEquals(1, target.keyColumns.size(), "One key");
    runner.assertEquals("order_id", target.keyColumns[0],
                        "Key uses the destination name");
  });

  runner.printSummary();
  return 0;
}
