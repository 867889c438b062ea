#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace submitter::remote {

/**
 * @brief 解压后允许的最大字节数，超过则视为解压失败
 */
constexpr std::size_t MAX_DECODED_PAYLOAD_SIZE = 64 << 20;  // 64M

/**
 * @brief 一种候选的压缩编码
 */
struct payload_codec {
    std::string name;

    /**
     * @brief 尝试解压，解压出错或数据不完整时返回空
     */
    std::function<std::optional<std::string>(std::string_view)> decode;
};

/**
 * @brief 按优先级排列的候选编码：gzip、brotli、zlib、raw deflate
 * gzip 仅在数据以 1f 8b 开头时尝试
 */
const std::vector<payload_codec> &payload_codecs();

struct decoded_payload {
    std::string body;

    /**
     * @brief 实际采用的编码，没有编码成功时为 identity
     */
    std::string codec;
};

/**
 * @brief 解码编码未知（或被错误标注）的响应体
 * 依次尝试候选编码，第一个解压成功且结果去除首尾空白后以 { 或 [ 开头的被采用；
 * 都不成功时原样返回输入，交给之后的 JSON 解析判断。
 */
decoded_payload decode_payload_with_codec(std::string_view data);

std::string decode_payload(std::string_view data);

std::optional<std::string> gzip_decode(std::string_view data);

std::optional<std::string> brotli_decode(std::string_view data);

std::optional<std::string> zlib_decode(std::string_view data);

std::optional<std::string> deflate_decode(std::string_view data);

}  // namespace submitter::remote
