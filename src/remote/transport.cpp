#include "remote/transport.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>

namespace submitter::remote {
using namespace std;

transport::~transport() {}

static string trim_base(const string &base_url) {
    return boost::algorithm::trim_right_copy_if(base_url, boost::is_any_of("/"));
}

string make_referer(const string &url) {
    size_t scheme = url.find("://");
    size_t path_begin = url.find('/', scheme == string::npos ? 0 : scheme + 3);
    if (path_begin == string::npos) return url;

    string origin = url.substr(0, path_begin);
    string path = url.substr(path_begin);
    size_t query = path.find_first_of("?#");
    if (query != string::npos) path.erase(query);

    boost::algorithm::trim_right_if(path, boost::is_any_of("/"));
    size_t last = path.find_last_of('/');
    if (last == string::npos || last == 0)
        return origin + "/";
    return origin + path.substr(0, last);
}

string submit_url(const judge_endpoint &endpoint, const string &title_slug) {
    return fmt::format("{}/problems/{}/submit/", trim_base(endpoint.base_url), title_slug);
}

string check_url(const judge_endpoint &endpoint, uint64_t submission_id) {
    return fmt::format("{}/submissions/detail/{}/check/", trim_base(endpoint.base_url), submission_id);
}

string host_of(const string &url) {
    size_t scheme = url.find("://");
    size_t begin = scheme == string::npos ? 0 : scheme + 3;
    size_t end = url.find_first_of(":/?#", begin);
    return url.substr(begin, end == string::npos ? string::npos : end - begin);
}

}  // namespace submitter::remote
