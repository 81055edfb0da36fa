#include "transformations/gzip_stream.h"
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <string>

namespace {
// 15 window bits plus 16 selects the gzip wrapper instead of zlib.
constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int MEM_LEVEL = 8;
} // namespace

GzipStream::GzipStream(ByteSource &upstream, int level, size_t inputChunk)
    : upstream_(upstream), input_(inputChunk) {
  int ret = deflateInit2(&zs_, level, Z_DEFLATED, GZIP_WINDOW_BITS, MEM_LEVEL,
                         Z_DEFAULT_STRATEGY);
  if (ret != Z_OK) {
    throw std::runtime_error("deflateInit2 failed: " + std::to_string(ret));
  }
}

GzipStream::~GzipStream() { deflateEnd(&zs_); }

size_t GzipStream::read(char *buffer, size_t size) {
  if (finished_ || size == 0)
    return 0;

  size = std::min(size, static_cast<size_t>(UINT_MAX));
  zs_.next_out = reinterpret_cast<Bytef *>(buffer);
  zs_.avail_out = static_cast<uInt>(size);

  while (zs_.avail_out > 0) {
    if (zs_.avail_in == 0 && !inputDone_) {
      size_t n = upstream_.read(input_.data(), input_.size());
      if (n == 0) {
        inputDone_ = true;
      } else {
        zs_.next_in = reinterpret_cast<Bytef *>(input_.data());
        zs_.avail_in = static_cast<uInt>(n);
        bytesIn_ += n;
      }
    }

    int ret = deflate(&zs_, inputDone_ ? Z_FINISH : Z_NO_FLUSH);
    if (ret == Z_STREAM_END) {
      finished_ = true;
      break;
    }
    if (ret != Z_OK && ret != Z_BUF_ERROR) {
      throw std::runtime_error("deflate failed: " + std::to_string(ret));
    }
  }

  size_t produced = size - zs_.avail_out;
  bytesOut_ += produced;
  return produced;
}
