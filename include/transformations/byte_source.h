#ifndef BYTE_SOURCE_H
#define BYTE_SOURCE_H

#include <cstddef>

// Pull side of a byte pipeline. Each stage reads from the one before it only
// when its own reader asks for data, so the slowest consumer sets the pace.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Copies up to size bytes into buffer. Returns 0 only at end of stream.
  virtual size_t read(char *buffer, size_t size) = 0;
};

#endif
