#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace submitter::remote {

/**
 * @brief 访问评测服务所需的登录凭据
 */
struct credentials {
    /**
     * @brief 会话 cookie（LEETCODE_SESSION）
     */
    std::string session;

    /**
     * @brief CSRF token（csrftoken cookie），提交时需要作为 X-CSRFToken 头发送
     */
    std::string csrf_token;
};

/**
 * @brief 登录凭据的来源
 */
struct credential_provider {
    virtual ~credential_provider();

    /**
     * @brief 凭据来源的名字，用于日志
     */
    virtual std::string name() const = 0;

    /**
     * @brief 尝试读取凭据
     * @return 若该来源没有可用的会话 cookie 则返回空
     */
    virtual std::optional<credentials> load() = 0;
};

/**
 * @brief 从环境变量 LEETCODE_SESSION、LEETCODE_CSRF_TOKEN 读取凭据
 */
struct env_credential_provider : public credential_provider {
    std::string name() const override;

    std::optional<credentials> load() override;
};

/**
 * @brief 从本地文件读取凭据
 * 
 * dir
 * ├── cookie // LEETCODE_SESSION 的值
 * └── csrf // csrftoken 的值，可选
 */
struct file_credential_provider : public credential_provider {
    std::filesystem::path dir;

    /**
     * @param dir 存放凭据文件的文件夹，默认为 ~/.config/leetcode
     */
    explicit file_credential_provider(const std::filesystem::path &dir);

    std::string name() const override;

    std::optional<credentials> load() override;
};

/**
 * @brief 从浏览器导出的 Netscape 格式 cookie 文件读取凭据
 * 该格式也是 curl 的 cookie jar 格式，每行为
 * domain \t include_subdomains \t path \t secure \t expiry \t name \t value
 */
struct cookie_jar_credential_provider : public credential_provider {
    std::filesystem::path jar;
    std::string domain;

    cookie_jar_credential_provider(const std::filesystem::path &jar, const std::string &domain);

    std::string name() const override;

    std::optional<credentials> load() override;
};

/**
 * @brief 按顺序尝试多个凭据来源，使用第一个可用的
 */
struct credential_chain : public credential_provider {
    std::vector<std::unique_ptr<credential_provider>> providers;

    std::string name() const override;

    std::optional<credentials> load() override;

    /**
     * @brief 读取凭据
     * @throw fatal_error 所有来源都没有可用的凭据
     */
    credentials acquire();
};

/**
 * @brief 构造默认的凭据来源：环境变量、~/.config/leetcode、cookie jar（如果提供）
 * @param cookie_jar 浏览器导出的 cookie 文件，为空时不使用
 * @param domain 评测服务的域名，用于在 cookie jar 中筛选
 */
credential_chain default_credential_chain(const std::filesystem::path &cookie_jar, const std::string &domain);

}  // namespace submitter::remote
