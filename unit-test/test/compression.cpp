#include "test/compression.hpp"
#include <brotli/encode.h>
#include <zlib.h>
#include <stdexcept>
#include <vector>

namespace submitter::mock {
using namespace std;

static string deflate_with(const string &data, int window_bits) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, window_bits, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw runtime_error("deflateInit2 failed");

    vector<char> buffer(deflateBound(&stream, data.size()) + 64);
    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    stream.avail_in = data.size();
    stream.next_out = reinterpret_cast<Bytef *>(buffer.data());
    stream.avail_out = buffer.size();
    int ret = deflate(&stream, Z_FINISH);
    size_t written = buffer.size() - stream.avail_out;
    deflateEnd(&stream);
    if (ret != Z_STREAM_END)
        throw runtime_error("deflate failed");
    return string(buffer.data(), written);
}

string gzip_encode(const string &data) {
    return deflate_with(data, 16 + MAX_WBITS);
}

string zlib_encode(const string &data) {
    return deflate_with(data, MAX_WBITS);
}

string deflate_encode(const string &data) {
    return deflate_with(data, -MAX_WBITS);
}

string brotli_encode(const string &data) {
    size_t encoded_size = BrotliEncoderMaxCompressedSize(data.size());
    if (encoded_size == 0) encoded_size = data.size() + 1024;
    vector<uint8_t> buffer(encoded_size);
    if (!BrotliEncoderCompress(BROTLI_DEFAULT_QUALITY, BROTLI_DEFAULT_WINDOW, BROTLI_MODE_TEXT,
                               data.size(), reinterpret_cast<const uint8_t *>(data.data()),
                               &encoded_size, buffer.data()))
        throw runtime_error("brotli encode failed");
    return string(reinterpret_cast<char *>(buffer.data()), encoded_size);
}

}  // namespace submitter::mock
