#include "support/Fakes.h"
#include "support/TestRunner.h"
#include "transformations/csv_encoder.h"
#include "transformations/gzip_stream.h"
#include <stdexcept>
#include <zlib.h>

namespace {
const std::string BOM = "\xEF\xBB\xBF";

std::string gunzip(const std::string &compressed) {
  z_stream zs{};
  if (inflateInit2(&zs, 15 + 16) != Z_OK)
    throw std::runtime_error("inflateInit2 failed");

  std::string out;
  char buffer[8192];
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
  zs.avail_in = static_cast<uInt>(compressed.size());
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    zs.next_out = reinterpret_cast<Bytef *>(buffer);
    zs.avail_out = sizeof(buffer);
    ret = inflate(&zs, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&zs);
      throw std::runtime_error("inflate failed: " + std::to_string(ret));
    }
    out.append(buffer, sizeof(buffer) - zs.avail_out);
  }
  inflateEnd(&zs);
  return out;
}

// Produces rows on demand so the test can tell how far the consumer pulled.
class GeneratedRowStream : public IRowStream {
  std::vector<std::string> columns_{"id", "payload"};
  size_t total_;
  size_t pulled_ = 0;
  uint32_t seed_ = 12345;

public:
  explicit GeneratedRowStream(size_t total) : total_(total) {}

  const std::vector<std::string> &columns() const override { return columns_; }

  bool next(SqlRow &row) override {
    if (pulled_ >= total_)
      return false;
    ++pulled_;
    std::string payload;
    for (int i = 0; i < 32; ++i) {
      seed_ = seed_ * 1103515245u + 12345u;
      payload += static_cast<char>('a' + (seed_ >> 16) % 26);
    }
    row = {std::to_string(pulled_), payload};
    return true;
  }

  size_t pulled() const { return pulled_; }
};
} // namespace

int main() {
  TestRunner runner;

  std::cout << "\n========================================" << std::endl;
  std::cout << "CSV ENCODER AND GZIP STREAM" << std::endl;
  std::cout << "========================================\n" << std::endl;

  runner.runTest("Field encoding", [&]() {
    runner.assertEquals("", CsvEncoder::encodeField(std::nullopt), "NULL");
    runner.assertEquals("\"\"", CsvEncoder::encodeField(std::string()),
                        "Empty string is distinguishable from NULL");
    runner.assertEquals("plain", CsvEncoder::encodeField(std::string("plain")),
                        "Plain text unquoted");
    runner.assertEquals("\"a,b\"", CsvEncoder::encodeField(std::string("a,b")),
                        "Delimiter quoted");
    runner.assertEquals("\"say \"\"hi\"\"\"",
                        CsvEncoder::encodeField(std::string("say \"hi\"")),
                        "Quotes doubled");
    runner.assertEquals("\"two\nlines\"",
                        CsvEncoder::encodeField(std::string("two\nlines")),
                        "Line break quoted");
    runner.assertEquals("\"cr\r\"", CsvEncoder::encodeField(std::string("cr\r")),
                        "Carriage return quoted");
  });

  runner.runTest("Header then one line per row", [&]() {
    FakeRowStream rows({"id", "name"},
                       {{std::string("1"), std::string("Ada")},
                        {std::string("2"), std::nullopt}});
    CsvEncoder csv(rows, {"order_id", "customer"});
    std::string text = drain(csv);
    runner.assertEquals(BOM + "order_id,customer\n1,Ada\n2,\n", text,
                        "BOM, renamed header, rows");
    runner.assertEquals(2, csv.rowsEncoded(), "Two rows encoded");
  });

  runner.runTest("Output does not depend on the read size", [&]() {
    FakeRowStream whole({"id"}, {{std::string("1")}, {std::string("22")}});
    CsvEncoder a(whole, {"id"}, false);
    std::string expected = drain(a);

    FakeRowStream bytewise({"id"}, {{std::string("1")}, {std::string("22")}});
    CsvEncoder b(bytewise, {"id"}, false);
    std::string actual;
    char c;
    while (b.read(&c, 1) == 1)
      actual += c;
    runner.assertEquals(expected, actual, "Byte-at-a-time reads match");
    runner.assertEquals("id\n1\n22\n", actual, "No BOM when disabled");
  });

  runner.runTest("Row wider than the header is an error", [&]() {
    FakeRowStream rows({"a", "b"}, {{std::string("1"), std::string("2")}});
    CsvEncoder csv(rows, {"a"});
    runner.assertThrows<std::runtime_error>([&] { drain(csv); },
                                            "Width mismatch");
  });

  runner.runTest("Gzip output inflates back to the CSV", [&]() {
    FakeRowStream plainRows({"id", "note"}, Fixtures::orderRows(50));
    CsvEncoder plain(plainRows, {"id", "total", "updated_at"});
    std::string expected = drain(plain);

    FakeRowStream rows({"id", "note"}, Fixtures::orderRows(50));
    CsvEncoder csv(rows, {"id", "total", "updated_at"});
    GzipStream gzip(csv, 6);
    std::string compressed = drain(gzip);

    runner.assertTrue(compressed.size() > 18, "Has gzip framing");
    runner.assertEquals(0x1f, static_cast<unsigned char>(compressed[0]),
                        "gzip magic byte 1");
    runner.assertEquals(0x8b, static_cast<unsigned char>(compressed[1]),
                        "gzip magic byte 2");
    runner.assertEquals(expected, gunzip(compressed), "Round trip");
    runner.assertEquals(expected.size(), gzip.bytesIn(), "bytesIn counted");
    runner.assertEquals(compressed.size(), gzip.bytesOut(), "bytesOut counted");
    runner.assertEquals(0, gzip.read(&compressed[0], 1),
                        "Finished stream stays at EOF");
  });

  runner.runTest("Empty result still yields a valid file", [&]() {
    FakeRowStream rows({"id"}, {});
    CsvEncoder csv(rows, {"id"});
    GzipStream gzip(csv, 1);
    runner.assertEquals(BOM + "id\n", gunzip(drain(gzip)), "Header only");
    runner.assertEquals(0, csv.rowsEncoded(), "No rows");
  });

  runner.runTest("Rows are pulled only as output is consumed", [&]() {
    const size_t total = 100000;
    GeneratedRowStream rows(total);
    CsvEncoder csv(rows, {"id", "payload"});
    GzipStream gzip(csv, 6, 64);

    char small[16];
    size_t n = gzip.read(small, sizeof(small));
    runner.assertEquals(16, n, "First read is served");
    runner.assertTrue(rows.pulled() < total / 5,
                      "Only a fraction of the source was read (pulled " +
                          std::to_string(rows.pulled()) + ")");

    std::string rest = std::string(small, n) + drain(gzip);
    runner.assertEquals(total, rows.pulled(), "Source fully read at the end");
    runner.assertEquals(total, csv.rowsEncoded(), "Every row encoded");
    std::string text = gunzip(rest);
    runner.assertTrue(text.compare(0, BOM.size() + 11, BOM + "id,payload\n") == 0,
                      "Header first");
  });

  runner.printSummary();
  return 0;
}
