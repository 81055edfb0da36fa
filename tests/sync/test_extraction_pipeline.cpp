#include "core/errors.h"
#include "core/pipeline_config.h"
#include "support/Fakes.h"
#include "support/TestRunner.h"
#include "sync/ExtractionPipeline.h"
#include <zlib.h>

namespace {
std::string gunzip(const std::string &compressed) {
  z_stream zs{};
  inflateInit2(&zs, 15 + 16);
  std::string out(compressed.size() * 20 + 1024, '\0');
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
  zs.avail_in = static_cast<uInt>(compressed.size());
  zs.next_out = reinterpret_cast<Bytef *>(&out[0]);
  zs.avail_out = static_cast<uInt>(out.size());
  int ret = inflate(&zs, Z_FINISH);
  out.resize(zs.total_out);
  inflateEnd(&zs);
  if (ret != Z_STREAM_END)
    throw std::runtime_error("inflate failed: " + std::to_string(ret));
  return out;
}
} // namespace

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "EXTRACTION PIPELINE" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Header follows the destination names", [&]() {
    auto header = ExtractionPipeline::header(Fixtures::ordersConfiguration());
    runner.assertEquals(3, header.size(), "One column per mapping");
    runner.assertEquals("order_id", header[0], "Renamed");
    runner.assertEquals("total", header[1], "Renamed");
    runner.assertEquals("updated_at", header[2], "Unchanged name");
  });

  runner.runTest("Query is scoped to the tenant and the watermark", [&]() {
    auto watermark = Fixtures::at("2024-03-01T10:00:00Z");
    SelectQuery query = ExtractionPipeline::buildQuery(
        Fixtures::ordersConfiguration(), "acme", watermark);
    runner.assertEquals(2, query.where.size(), "Tenant and watermark");
    runner.assertTrue(query.where[1].op == CompareOp::GREATER_THAN,
                      "Strictly greater than the watermark");
    runner.assertEquals("updated_at", query.where[1].column,
                        "Filters on the lastModified column");
    runner.assertTrue(query.subquery != nullptr, "Selects from the view");
    runner.assertEquals(4, query.subquery->columns.size(),
                        "View exposes all of its columns");
  });

  runner.runTest("Configuration without mappings is rejected", [&]() {
    Configuration configuration = Fixtures::ordersConfiguration();
    configuration.columns.clear();
    runner.assertThrows<ConfigurationError>(
        [&] {
          ExtractionPipeline::buildQuery(configuration, "acme", std::nullopt);
        },
        "Empty mapping");
  });

  runner.runTest("Open streams the source through CSV and gzip", [&]() {
    PipelineConfig::setFetchBatchSize(250);
    auto state = std::make_shared<FakeConnectionState>();
    state->streamColumns = {"order_id", "total", "updated_at"};
    state->streamRows = Fixtures::orderRows(10);
    FakeConnection connection(DbEngine::POSTGRES, state);

    ExtractionPipeline pipeline;
    auto stream = pipeline.open(connection, Fixtures::ordersConfiguration(),
                                "acme", Fixtures::at("2024-03-01T00:00:00Z"));
    runner.assertEquals(1, state->streamsOpened, "One cursor opened");
    runner.assertEquals(0, state->rowsPulled, "Nothing read before the consumer asks");

    std::string csv = gunzip(drain(*stream));
    runner.assertEquals(10, stream->rowsEncoded(), "All rows encoded");
    runner.assertEquals(10, state->rowsPulled, "All rows pulled");
    runner.assertTrue(stream->compressedBytes() > 0, "Compressed size tracked");
    runner.assertContains(csv, "order_id,total,updated_at\n", "Header");
    runner.assertContains(csv, "\n1,10.50,", "First row");
    runner.assertContains(state->statements[0],
                          "\"updated_at\" > '2024-03-01T00:00:00.000000Z'",
                          "Watermark rendered into the statement");
  });

  runner.printSummary();
  return 0;
}
