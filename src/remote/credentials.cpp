#include "remote/credentials.hpp"
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <chrono>
#include <fstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace submitter::remote {
using namespace std;

static const char *SESSION_COOKIE = "LEETCODE_SESSION";
static const char *CSRF_COOKIE = "csrftoken";

credential_provider::~credential_provider() {}

string env_credential_provider::name() const {
    return "environment";
}

optional<credentials> env_credential_provider::load() {
    credentials creds;
    creds.session = get_env("LEETCODE_SESSION", "");
    if (creds.session.empty()) return nullopt;
    creds.csrf_token = get_env("LEETCODE_CSRF_TOKEN", "");
    return creds;
}

file_credential_provider::file_credential_provider(const filesystem::path &dir)
    : dir(dir) {}

string file_credential_provider::name() const {
    return "file " + dir.string();
}

optional<credentials> file_credential_provider::load() {
    credentials creds;
    creds.session = boost::algorithm::trim_copy(read_file_content(dir / "cookie", ""));
    if (creds.session.empty()) return nullopt;
    creds.csrf_token = boost::algorithm::trim_copy(read_file_content(dir / "csrf", ""));
    DLOG(INFO) << "Read session cookie from " << (dir / "cookie") << " (length: " << creds.session.size() << ")";
    return creds;
}

cookie_jar_credential_provider::cookie_jar_credential_provider(const filesystem::path &jar, const string &domain)
    : jar(jar), domain(domain) {}

string cookie_jar_credential_provider::name() const {
    return "cookie jar " + jar.string();
}

static bool domain_matches(string cookie_domain, const string &domain) {
    if (boost::starts_with(cookie_domain, "."))
        cookie_domain = cookie_domain.substr(1);
    return cookie_domain == domain || boost::ends_with(domain, "." + cookie_domain);
}

optional<credentials> cookie_jar_credential_provider::load() {
    ifstream fin(jar);
    if (!fin.is_open()) return nullopt;

    long long now = chrono::duration_cast<chrono::seconds>(chrono::system_clock::now().time_since_epoch()).count();
    credentials creds;
    string line;
    while (getline(fin, line)) {
        boost::algorithm::trim_right_if(line, boost::is_any_of("\r\n"));
        // curl 和浏览器导出工具用 #HttpOnly_ 前缀标记 HttpOnly 的 cookie
        if (boost::starts_with(line, "#HttpOnly_"))
            line = line.substr(10);
        else if (line.empty() || line[0] == '#')
            continue;

        vector<string> fields;
        boost::split(fields, line, boost::is_any_of("\t"));
        if (fields.size() < 7) continue;
        if (!domain_matches(fields[0], domain)) continue;

        long long expiry = 0;
        try {
            expiry = boost::lexical_cast<long long>(fields[4]);
        } catch (boost::bad_lexical_cast &) {
            LOG(WARNING) << "Malformed expiry in cookie jar " << jar << ": " << fields[4];
            continue;
        }
        if (expiry != 0 && expiry < now) continue;

        if (fields[5] == SESSION_COOKIE)
            creds.session = fields[6];
        else if (fields[5] == CSRF_COOKIE)
            creds.csrf_token = fields[6];
    }

    if (creds.session.empty()) return nullopt;
    return creds;
}

string credential_chain::name() const {
    return "chain";
}

optional<credentials> credential_chain::load() {
    for (auto &provider : providers) {
        optional<credentials> creds;
        try {
            creds = provider->load();
        } catch (std::exception &e) {
            LOG(WARNING) << "Failed to load credentials from " << provider->name() << ": " << e.what();
            continue;
        }
        if (creds) {
            LOG(INFO) << "Using credentials from " << provider->name();
            if (creds->csrf_token.empty())
                LOG(WARNING) << "No CSRF token found in " << provider->name() << ", submissions are likely to be rejected";
            return creds;
        }
        DLOG(INFO) << "No credentials in " << provider->name();
    }
    return nullopt;
}

credentials credential_chain::acquire() {
    auto creds = load();
    if (!creds)
        BOOST_THROW_EXCEPTION(fatal_error("unable to obtain judge credentials: set LEETCODE_SESSION, write ~/.config/leetcode/cookie, or pass --cookie-jar"));
    return *creds;
}

credential_chain default_credential_chain(const filesystem::path &cookie_jar, const string &domain) {
    credential_chain chain;
    chain.providers.push_back(make_unique<env_credential_provider>());
    chain.providers.push_back(make_unique<file_credential_provider>(home_directory() / ".config" / "leetcode"));
    if (!cookie_jar.empty())
        chain.providers.push_back(make_unique<cookie_jar_credential_provider>(cookie_jar, domain));
    return chain;
}

}  // namespace submitter::remote
