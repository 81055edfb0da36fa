#include "catalog/destination_remover.h"
#include "core/errors.h"
#include "support/Fakes.h"
#include "support/TestRunner.h"

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "DESTINATION REMOVER" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Pending transfer blocks the delete", [&]() {
    FakeCatalogStore catalog;
    TransferGraph graph = Fixtures::transfer(41, Fixtures::redshiftDestination());
    graph.transfer.status = TransferStatus::PENDING;
    catalog.addTransfer(graph);
    DestinationRemover remover(catalog);

    try {
      remover.remove(22);
      runner.assertTrue(false, "Should have thrown");
    } catch (const PreconditionFailedError &e) {
      runner.assertEquals("transfer_in_progress", e.code(), "Error code");
      runner.assertContains(e.what(), "cancel all transfers", "Explains how");
    }
    runner.assertEquals(1, catalog.destinations.count(22), "Row kept");
    runner.assertEquals(1, catalog.logs.size(), "Audit entry written");
    runner.assertTrue(catalog.logs[0].domain == LogDomain::CONFIGURATION,
                      "Logged against the configuration domain");
    runner.assertTrue(catalog.logs[0].action == LogAction::DELETE, "DELETE");
    runner.assertEquals(
        "Attempted to delete destination 22 where transfer is pending.",
        catalog.logs[0].message, "Audit message");
  });

  runner.runTest("STARTED transfers also block", [&]() {
    FakeCatalogStore catalog;
    catalog.addTransfer(Fixtures::transfer(42, Fixtures::redshiftDestination()));
    DestinationRemover remover(catalog);
    runner.assertThrows<PreconditionFailedError>([&] { remover.remove(22); },
                                                 "Refused");
  });

  runner.runTest("Idle destination is deleted", [&]() {
    FakeCatalogStore catalog;
    TransferGraph graph = Fixtures::transfer(43, Fixtures::redshiftDestination());
    graph.transfer.status = TransferStatus::COMPLETE;
    catalog.addTransfer(graph);
    DestinationRemover remover(catalog);

    remover.remove(22);
    runner.assertEquals(0, catalog.destinations.count(22), "Row removed");
    runner.assertTrue(catalog.logs.back().domain == LogDomain::DESTINATION,
                      "Logged against the destination domain");
  });

  runner.runTest("Unknown destination", [&]() {
    FakeCatalogStore catalog;
    DestinationRemover remover(catalog);
    try {
      remover.remove(999);
      runner.assertTrue(false, "Should have thrown");
    } catch (const NotFoundError &e) {
      runner.assertEquals("destination_id_not_found", e.what(), "Error code");
    }
    runner.assertTrue(catalog.logs.empty(), "Nothing logged");
  });

  runner.printSummary();
  return 0;
}
