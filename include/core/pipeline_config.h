#ifndef PIPELINE_CONFIG_H
#define PIPELINE_CONFIG_H

#include <atomic>
#include <cstddef>
#include <stdexcept>
#include <string>

// Tunables for the extraction pipeline, the object store uploader and the
// transfer runner. Setters reject out-of-range values.
struct PipelineConfig {
  static std::atomic<size_t> FETCH_BATCH_SIZE;
  static std::atomic<int> COMPRESSION_LEVEL;
  static std::atomic<size_t> MULTIPART_PART_SIZE_MB;
  static std::atomic<size_t> PRESIGN_EXPIRY_SECONDS;
  static std::atomic<size_t> MAX_WORKERS;

  static constexpr size_t DEFAULT_FETCH_BATCH_SIZE = 1000;
  static constexpr int DEFAULT_COMPRESSION_LEVEL = 6;
  static constexpr size_t DEFAULT_MULTIPART_PART_SIZE_MB = 8;
  static constexpr size_t DEFAULT_PRESIGN_EXPIRY_SECONDS = 3600;
  static constexpr size_t DEFAULT_MAX_WORKERS = 4;

  static constexpr size_t MIN_FETCH_BATCH_SIZE = 10;
  static constexpr size_t MAX_FETCH_BATCH_SIZE = 100000;
  static constexpr int MIN_COMPRESSION_LEVEL = 1;
  static constexpr int MAX_COMPRESSION_LEVEL = 9;
  // S3 rejects multipart parts under 5 MiB except for the last one.
  static constexpr size_t MIN_MULTIPART_PART_SIZE_MB = 5;
  static constexpr size_t MAX_MULTIPART_PART_SIZE_MB = 512;
  static constexpr size_t MIN_PRESIGN_EXPIRY_SECONDS = 60;
  static constexpr size_t MAX_PRESIGN_EXPIRY_SECONDS = 604800;
  static constexpr size_t MIN_MAX_WORKERS = 1;
  static constexpr size_t MAX_MAX_WORKERS = 32;

  static void setFetchBatchSize(size_t v) {
    if (v < MIN_FETCH_BATCH_SIZE || v > MAX_FETCH_BATCH_SIZE) {
      throw std::invalid_argument("FETCH_BATCH_SIZE must be between " +
                                  std::to_string(MIN_FETCH_BATCH_SIZE) +
                                  " and " +
                                  std::to_string(MAX_FETCH_BATCH_SIZE));
    }
    FETCH_BATCH_SIZE = v;
  }

  static size_t getFetchBatchSize() { return FETCH_BATCH_SIZE; }

  static void setCompressionLevel(int v) {
    if (v < MIN_COMPRESSION_LEVEL || v > MAX_COMPRESSION_LEVEL) {
      throw std::invalid_argument("COMPRESSION_LEVEL must be between " +
                                  std::to_string(MIN_COMPRESSION_LEVEL) +
                                  " and " +
                                  std::to_string(MAX_COMPRESSION_LEVEL));
    }
    COMPRESSION_LEVEL = v;
  }

  static int getCompressionLevel() { return COMPRESSION_LEVEL; }

  static void setMultipartPartSizeMb(size_t v) {
    if (v < MIN_MULTIPART_PART_SIZE_MB || v > MAX_MULTIPART_PART_SIZE_MB) {
      throw std::invalid_argument("MULTIPART_PART_SIZE_MB must be between " +
                                  std::to_string(MIN_MULTIPART_PART_SIZE_MB) +
                                  " and " +
                                  std::to_string(MAX_MULTIPART_PART_SIZE_MB));
    }
    MULTIPART_PART_SIZE_MB = v;
  }

  static size_t getMultipartPartSizeBytes() {
    return MULTIPART_PART_SIZE_MB * 1024 * 1024;
  }

  static void setPresignExpirySeconds(size_t v) {
    if (v < MIN_PRESIGN_EXPIRY_SECONDS || v > MAX_PRESIGN_EXPIRY_SECONDS) {
      throw std::invalid_argument("PRESIGN_EXPIRY_SECONDS must be between " +
                                  std::to_string(MIN_PRESIGN_EXPIRY_SECONDS) +
                                  " and " +
                                  std::to_string(MAX_PRESIGN_EXPIRY_SECONDS));
    }
    PRESIGN_EXPIRY_SECONDS = v;
  }

  static size_t getPresignExpirySeconds() { return PRESIGN_EXPIRY_SECONDS; }

  static void setMaxWorkers(size_t v) {
    if (v < MIN_MAX_WORKERS || v > MAX_MAX_WORKERS) {
      throw std::invalid_argument("MAX_WORKERS must be between " +
                                  std::to_string(MIN_MAX_WORKERS) + " and " +
                                  std::to_string(MAX_MAX_WORKERS));
    }
    MAX_WORKERS = v;
  }

  static size_t getMaxWorkers() { return MAX_WORKERS; }
};

#endif
