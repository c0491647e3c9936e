#pragma once

#include <string>

#include <stout/try.hpp>

#include "params.hpp"

namespace bucky {
  namespace compression {
    /**
     * Compresses the provided data. GZIP produces a gzip stream, DEFLATE produces a zlib stream
     * (what HTTP calls "deflate"), and IDENTITY returns the data as-is.
     */
    Try<std::string> compress(const std::string& data, params::compression_mode::Value mode);

    /**
     * Reverses compress(). GZIP and DEFLATE input are both accepted by either mode.
     */
    Try<std::string> decompress(const std::string& data, params::compression_mode::Value mode);
  }
}
