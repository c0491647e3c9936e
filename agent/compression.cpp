#include "compression.hpp"

#include <string.h>

#include <zlib.h>

#define GZIP_WINDOW_BITS (15 + 16) /* max window, gzip header */
#define AUTO_WINDOW_BITS (15 + 32) /* max window, detect zlib or gzip header */
#define CHUNK_BYTES 16384

namespace {
  std::string zlib_error(const char* op, int ret, const z_stream& zs) {
    std::string err(op);
    err += " failed: code=" + std::to_string(ret);
    if (zs.msg != NULL) {
      err += " msg=";
      err += zs.msg;
    }
    return err;
  }
}

Try<std::string> bucky::compression::compress(
    const std::string& data, params::compression_mode::Value mode) {
  z_stream zs;
  memset(&zs, 0, sizeof(zs));
  int ret;
  switch (mode) {
    case params::compression_mode::IDENTITY:
      return data;
    case params::compression_mode::GZIP:
      ret = deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8, Z_DEFAULT_STRATEGY);
      break;
    case params::compression_mode::DEFLATE:
      ret = deflateInit(&zs, Z_DEFAULT_COMPRESSION);
      break;
    default:
      return Try<std::string>(Error("Unsupported compression mode"));
  }
  if (ret != Z_OK) {
    return Try<std::string>(Error(zlib_error("deflateInit", ret, zs)));
  }

  zs.next_in = (Bytef*) data.data();
  zs.avail_in = data.size();

  std::string out;
  char chunk[CHUNK_BYTES];
  do {
    zs.next_out = (Bytef*) chunk;
    zs.avail_out = sizeof(chunk);
    ret = deflate(&zs, Z_FINISH);
    if (ret == Z_STREAM_ERROR) {
      deflateEnd(&zs);
      return Try<std::string>(Error(zlib_error("deflate", ret, zs)));
    }
    out.append(chunk, sizeof(chunk) - zs.avail_out);
  } while (ret != Z_STREAM_END);

  deflateEnd(&zs);
  return out;
}

Try<std::string> bucky::compression::decompress(
    const std::string& data, params::compression_mode::Value mode) {
  if (mode == params::compression_mode::IDENTITY) {
    return data;
  }
  if (mode != params::compression_mode::GZIP && mode != params::compression_mode::DEFLATE) {
    return Try<std::string>(Error("Unsupported compression mode"));
  }

  z_stream zs;
  memset(&zs, 0, sizeof(zs));
  int ret = inflateInit2(&zs, AUTO_WINDOW_BITS);
  if (ret != Z_OK) {
    return Try<std::string>(Error(zlib_error("inflateInit", ret, zs)));
  }

  zs.next_in = (Bytef*) data.data();
  zs.avail_in = data.size();

  std::string out;
  char chunk[CHUNK_BYTES];
  do {
    zs.next_out = (Bytef*) chunk;
    zs.avail_out = sizeof(chunk);
    ret = inflate(&zs, Z_NO_FLUSH);
    if (ret != Z_OK && ret != Z_STREAM_END) {
      std::string err = zlib_error("inflate", ret, zs);
      inflateEnd(&zs);
      return Try<std::string>(Error(err));
    }
    out.append(chunk, sizeof(chunk) - zs.avail_out);
    if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      inflateEnd(&zs);
      return Try<std::string>(Error("inflate failed: truncated input"));
    }
  } while (ret != Z_STREAM_END);

  inflateEnd(&zs);
  return out;
}
