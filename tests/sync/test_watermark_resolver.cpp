#include "core/errors.h"
#include "support/Fakes.h"
#include "support/TestRunner.h"
#include "sync/WatermarkResolver.h"

int main() {
  TestRunner runner;
  WatermarkResolver resolver;

  std::cout << "\n========================================" << std::endl;
  std::cout << "WATERMARK RESOLVER" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Discriminators come from the column flags", [&]() {
    Discriminators d = WatermarkResolver::discriminatorsFor(Fixtures::ordersView());
    runner.assertEquals("tenant_id", d.tenantColumn, "Tenant column");
    runner.assertEquals("updated_at", d.lastModifiedColumn, "lastModified");
  });

  runner.runTest("Missing or duplicated discriminators are configuration errors",
                 [&]() {
    View noTenant = Fixtures::ordersView();
    noTenant.columns[1].isTenantColumn = false;
    runner.assertThrows<ConfigurationError>(
        [&] { WatermarkResolver::discriminatorsFor(noTenant); },
        "No tenant column");

    View noLastModified = Fixtures::ordersView();
    noLastModified.columns[3].isLastModified = false;
    runner.assertThrows<ConfigurationError>(
        [&] { WatermarkResolver::discriminatorsFor(noLastModified); },
        "No lastModified column");

    View twoTenants = Fixtures::ordersView();
    twoTenants.columns[0].isTenantColumn = true;
    runner.assertThrows<ConfigurationError>(
        [&] { WatermarkResolver::discriminatorsFor(twoTenants); },
        "Two tenant columns");
  });

  runner.runTest("Resolves the newest value for the tenant", [&]() {
    auto state = std::make_shared<FakeConnectionState>();
    state->queryResult = Fixtures::watermarkResult("2024-03-05 08:15:00.25+00");
    FakeConnection connection(DbEngine::POSTGRES, state);

    auto ts = resolver.resolve(connection, Fixtures::ordersView(), "acme");
    runner.assertTrue(ts.has_value(), "Value found");
    runner.assertEquals("2024-03-05T08:15:00.250000Z",
                        TimeUtils::formatIso8601(*ts), "Parsed as UTC");
    runner.assertEquals(1, state->statements.size(), "One query");
    runner.assertContains(state->statements[0], "LIMIT 1", "Single row");
    runner.assertContains(state->statements[0], "'acme'", "Tenant bound");
  });

  runner.runTest("Zero rows means no watermark", [&]() {
    auto state = std::make_shared<FakeConnectionState>();
    FakeConnection connection(DbEngine::MYSQL, state);
    auto ts = resolver.resolve(connection, Fixtures::ordersView(), "acme");
    runner.assertFalse(ts.has_value(), "nullopt");
    runner.assertContains(state->statements[0], "`updated_at` IS NOT NULL",
                          "MySQL dialect chosen from the connection");
  });

  runner.runTest("Unparseable value is a WatermarkParseError", [&]() {
    auto state = std::make_shared<FakeConnectionState>();
    state->queryResult = Fixtures::watermarkResult("last tuesday");
    FakeConnection connection(DbEngine::POSTGRES, state);
    runner.assertThrows<WatermarkParseError>(
        [&] { resolver.resolve(connection, Fixtures::ordersView(), "acme"); },
        "Garbage timestamp");
  });

  runner.printSummary();
  return 0;
}
