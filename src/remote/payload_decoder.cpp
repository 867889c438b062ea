#include "remote/payload_decoder.hpp"
#include <brotli/decode.h>
#include <glog/logging.h>
#include <zlib.h>
#include <algorithm>
#include <cctype>
#include <memory>

namespace submitter::remote {
using namespace std;

static const size_t CHUNK_SIZE = 16384;

/**
 * @param window_bits 16 + MAX_WBITS 为 gzip，MAX_WBITS 为 zlib，-MAX_WBITS 为不带包装的 deflate
 */
static optional<string> inflate_with(string_view data, int window_bits) {
    z_stream stream{};
    if (inflateInit2(&stream, window_bits) != Z_OK) return nullopt;

    stream.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    string output;
    char buffer[CHUNK_SIZE];
    int ret;
    do {
        stream.next_out = reinterpret_cast<Bytef *>(buffer);
        stream.avail_out = CHUNK_SIZE;
        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) break;
        output.append(buffer, CHUNK_SIZE - stream.avail_out);
        if (output.size() > MAX_DECODED_PAYLOAD_SIZE) {
            ret = Z_MEM_ERROR;
            break;
        }
        // 输入耗尽但流没有结束，说明数据被截断
        if (ret == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            ret = Z_BUF_ERROR;
            break;
        }
    } while (ret != Z_STREAM_END);
    inflateEnd(&stream);

    if (ret != Z_STREAM_END) return nullopt;
    return output;
}

optional<string> gzip_decode(string_view data) {
    if (data.size() < 2 || (unsigned char)data[0] != 0x1f || (unsigned char)data[1] != 0x8b)
        return nullopt;
    return inflate_with(data, 16 + MAX_WBITS);
}

optional<string> zlib_decode(string_view data) {
    return inflate_with(data, MAX_WBITS);
}

optional<string> deflate_decode(string_view data) {
    return inflate_with(data, -MAX_WBITS);
}

struct brotli_deleter {
    void operator()(BrotliDecoderState *state) const { BrotliDecoderDestroyInstance(state); }
};

optional<string> brotli_decode(string_view data) {
    unique_ptr<BrotliDecoderState, brotli_deleter> state(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr));
    if (!state) return nullopt;

    size_t available_in = data.size();
    const uint8_t *next_in = reinterpret_cast<const uint8_t *>(data.data());
    string output;
    uint8_t buffer[CHUNK_SIZE];
    BrotliDecoderResult result;
    do {
        size_t available_out = CHUNK_SIZE;
        uint8_t *next_out = buffer;
        result = BrotliDecoderDecompressStream(state.get(), &available_in, &next_in, &available_out, &next_out, nullptr);
        output.append(reinterpret_cast<char *>(buffer), CHUNK_SIZE - available_out);
        if (output.size() > MAX_DECODED_PAYLOAD_SIZE) return nullopt;
    } while (result == BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT);

    if (result != BROTLI_DECODER_RESULT_SUCCESS) return nullopt;
    return output;
}

const vector<payload_codec> &payload_codecs() {
    static const vector<payload_codec> codecs = {
        {"gzip", gzip_decode},
        {"brotli", brotli_decode},
        {"zlib", zlib_decode},
        {"deflate", deflate_decode},
    };
    return codecs;
}

static bool looks_structured(const string &decoded) {
    auto begin = find_if_not(decoded.begin(), decoded.end(), [](char c) { return isspace((unsigned char)c); });
    return begin != decoded.end() && (*begin == '{' || *begin == '[');
}

decoded_payload decode_payload_with_codec(string_view data) {
    if (data.size() < 2) return {string(data), "identity"};

    // raw deflate 和 brotli 没有可靠的文件头，可能把明文"解压"成乱码，必须校验结果
    for (auto &codec : payload_codecs()) {
        auto decoded = codec.decode(data);
        if (!decoded) continue;
        if (!looks_structured(*decoded)) {
            DLOG(INFO) << "Payload decoded with " << codec.name << " but does not look like JSON";
            continue;
        }
        DLOG(INFO) << "Successfully decompressed with " << codec.name << ": " << data.size() << " -> " << decoded->size() << " bytes";
        return {std::move(*decoded), codec.name};
    }

    DLOG(INFO) << "All decompression attempts failed, returning original data";
    return {string(data), "identity"};
}

string decode_payload(string_view data) {
    return decode_payload_with_codec(data).body;
}

}  // namespace submitter::remote
