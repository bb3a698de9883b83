// ============================================================
// response_classifier.cpp
// ============================================================

#include "response_classifier.hpp"
#include <json/json.h>
#include <memory>

std::optional<ServerErrorPayload> parse_server_error(const std::vector<u8>& body) {
    // Cheap reject before invoking the parser on every response
    size_t i = 0;
    while (i < body.size() && (body[i] == ' ' || body[i] == '\t' ||
                               body[i] == '\r' || body[i] == '\n')) ++i;
    if (i >= body.size() || body[i] != '[') return std::nullopt;

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    const char* begin = (const char*)body.data();
    if (!reader->parse(begin, begin + body.size(), &root, &errs)) return std::nullopt;

    if (!root.isArray() || root.size() != 1) return std::nullopt;
    const Json::Value& item = root[0];
    if (!item.isObject() || !item.isMember("errorCode")) return std::nullopt;

    ServerErrorPayload p;
    p.error_code = item["errorCode"].isString() ? item["errorCode"].asString()
                                                : item["errorCode"].toStyledString();
    if (item.isMember("message") && item["message"].isString()) {
        p.message = item["message"].asString();
    }
    return p;
}

static NetworkError make_error(ErrorKind kind, int code, std::string message,
                               std::string server_code = "")
{
    NetworkError e;
    e.kind              = kind;
    e.code              = code;
    e.message           = std::move(message);
    e.server_error_code = std::move(server_code);
    return e;
}

Classification classify_response(const TransportResult& result,
                                 bool requires_token,
                                 const std::set<std::string>& auth_error_codes)
{
    Classification c;

    if (result.status == TransportStatus::ABORTED) {
        c.outcome = Outcome::ABORTED;
        return c;
    }
    if (is_network_failure(result.status)) {
        c.outcome = Outcome::NETWORK_ERROR;
        c.error   = make_error(ErrorKind::NETWORK, ERR_TRANSPORT,
                               std::string(transport_status_name(result.status)) +
                               (result.error.empty() ? "" : ": " + result.error));
        return c;
    }
    if (result.status == TransportStatus::TIMED_OUT) {
        c.outcome = Outcome::TIMED_OUT;
        c.error   = make_error(ErrorKind::TIMEOUT, ERR_TIMED_OUT,
                               result.error.empty() ? "Request timed out" : result.error);
        return c;
    }

    int http = result.http_status;
    auto payload = parse_server_error(result.body);

    bool auth_rejected = http == 401 ||
        (payload && auth_error_codes.count(payload->error_code) > 0);
    if (auth_rejected) {
        std::string msg = payload && !payload->message.empty() ? payload->message
                                                               : "Access token rejected";
        c.outcome = requires_token ? Outcome::AUTH_ERROR : Outcome::SERVER_ERROR;
        c.error   = make_error(ErrorKind::AUTH, http, msg,
                               payload ? payload->error_code : "");
        return c;
    }

    if (http >= 500) {
        c.outcome = Outcome::NETWORK_ERROR;
        c.error   = make_error(ErrorKind::NETWORK, http, "HTTP " + std::to_string(http),
                               payload ? payload->error_code : "");
        return c;
    }

    if (payload) {
        c.outcome = Outcome::SERVER_ERROR;
        c.error   = make_error(ErrorKind::SERVER, http, payload->message, payload->error_code);
        return c;
    }

    if (http >= 400) {
        c.outcome = Outcome::SERVER_ERROR;
        c.error   = make_error(ErrorKind::SERVER, http, "HTTP " + std::to_string(http));
        return c;
    }

    c.outcome = Outcome::COMPLETED;
    return c;
}

const char* outcome_name(Outcome o) {
    switch (o) {
        case Outcome::COMPLETED:     return "Completed";
        case Outcome::NETWORK_ERROR: return "NetworkError";
        case Outcome::AUTH_ERROR:    return "AuthError";
        case Outcome::SERVER_ERROR:  return "ServerError";
        case Outcome::TIMED_OUT:     return "TimedOut";
        case Outcome::ABORTED:       return "Aborted";
    }
    return "Unknown";
}
