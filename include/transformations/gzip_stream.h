#ifndef GZIP_STREAM_H
#define GZIP_STREAM_H

#include "transformations/byte_source.h"
#include <vector>
#include <zlib.h>

// Deflates an upstream ByteSource with gzip framing as it is read.
class GzipStream : public ByteSource {
  ByteSource &upstream_;
  z_stream zs_{};
  std::vector<char> input_;
  bool inputDone_ = false;
  bool finished_ = false;
  size_t bytesIn_ = 0;
  size_t bytesOut_ = 0;

public:
  static constexpr size_t DEFAULT_INPUT_CHUNK = 64 * 1024;

  GzipStream(ByteSource &upstream, int level,
             size_t inputChunk = DEFAULT_INPUT_CHUNK);
  ~GzipStream() override;

  GzipStream(const GzipStream &) = delete;
  GzipStream &operator=(const GzipStream &) = delete;

  size_t read(char *buffer, size_t size) override;

  size_t bytesIn() const { return bytesIn_; }
  size_t bytesOut() const { return bytesOut_; }
};

#endif
