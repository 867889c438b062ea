#include "remote/classifier.hpp"
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include "common/utils.hpp"

namespace submitter::remote {
using namespace std;
using namespace nlohmann;

static const size_t ERROR_MESSAGE_LIMIT = 80;

static const char *CODE_REJECTION_MARKERS[] = {
    "too long",
};

optional<string> code_rejection_message(const string &decoded_body) {
    json body = json::parse(decoded_body, nullptr, /* allow_exceptions */ false);
    if (!body.is_object() || !body.count("error") || !body.at("error").is_string())
        return nullopt;
    string message = body.at("error").get<string>();
    for (const char *marker : CODE_REJECTION_MARKERS)
        if (message.find(marker) != string::npos)
            return message;
    return nullopt;
}

optional<classification> classify(request_phase phase, const http_response &response, const string &decoded_body) {
    switch (response.status) {
        case transport_status::CONFIGURATION_ERROR:
            return fatal_failure{response.error};
        case transport_status::NETWORK_ERROR:
            return retriable_failure{response.error, true};
        case transport_status::OK:
            break;
    }

    long code = response.status_code;
    if (code >= 200 && code < 300)
        return nullopt;

    if (code == 400 || code == 499 || (code == 403 && phase == request_phase::POLL)) {
        if (auto message = code_rejection_message(decoded_body))
            return non_retriable_failure{*message};
        return non_retriable_failure{"invalid or unauthorized request, see response: " + truncate_message(decoded_body, ERROR_MESSAGE_LIMIT)};
    }

    if (code == 403 || code == 429)
        return retriable_failure{fmt::format("non-ok http response code: {}", code), true};

    return retriable_failure{fmt::format("non-ok http response code: {}", code), false};
}

classification classify_malformed(const string &reason) {
    return retriable_failure{reason, false};
}

string describe(const classification &c) {
    if (auto *f = get_if<fatal_failure>(&c))
        return "fatal: " + f->reason;
    if (auto *n = get_if<non_retriable_failure>(&c))
        return "non-retriable: " + n->message;
    auto &r = get<retriable_failure>(c);
    return string(r.overload ? "retriable (overload): " : "retriable: ") + r.reason;
}

}  // namespace submitter::remote
