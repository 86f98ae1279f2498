#include <hookstream/core/ingest/ingest_api.hpp>
#include <hookstream/core/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <cctype>

namespace HookStream {

namespace {

constexpr const char* kJson = "application/json";
constexpr const char* kText = "text/plain; charset=utf-8";
constexpr const char* kSessionsPrefix = "/sessions/";

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string toString(boost::beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Well-formed UTF-8: no overlong forms, no surrogates, nothing above U+10FFFF
bool isValidUtf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;

        if (c < 0x80) {
            ++i;
            continue;
        } else if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }

        if (i + len > s.size()) return false;
        unsigned char second = static_cast<unsigned char>(s[i + 1]);
        if (second < lo || second > hi) return false;
        for (size_t k = 2; k < len; ++k) {
            unsigned char cont = static_cast<unsigned char>(s[i + k]);
            if (cont < 0x80 || cont > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

} // namespace

IngestApi::IngestApi(std::shared_ptr<EventStore> store, std::shared_ptr<Notifier> notifier)
    : store_(std::move(store)), notifier_(std::move(notifier)) {
}

HttpResponse IngestApi::handle(const HttpRequest& req) {
    std::string rawTarget = toString(req.target());

    std::string path = rawTarget;
    std::string queryString;
    auto qpos = rawTarget.find('?');
    if (qpos != std::string::npos) {
        path = rawTarget.substr(0, qpos);
        queryString = rawTarget.substr(qpos + 1);
    }

    try {
        return route(req, path, parseQuery(queryString));
    } catch (const std::exception& e) {
        spdlog::error("[IngestApi] {} {} failed: {}",
                      toString(req.method_string()), path, e.what());
        return makeError(req, http::status::internal_server_error, e.what());
    }
}

HttpResponse IngestApi::route(const HttpRequest& req, const std::string& path,
                              const std::unordered_map<std::string, std::string>& query) {
    const auto method = req.method();

    if (method == http::verb::options) {
        return preflight(req);
    }

    if (path == "/health") {
        if (method == http::verb::get) return health(req);
    } else if (path == "/events") {
        if (method == http::verb::post) return ingest(req);
    } else if (path == "/events/recent") {
        if (method == http::verb::get) return recent(req, query);
    } else if (path == "/events/clear") {
        if (method == http::verb::post) return clear(req);
    } else if (path == "/events/filter-options") {
        if (method == http::verb::get) return filterOptions(req);
    } else if (path == "/stats") {
        if (method == http::verb::get) return stats(req, query);
    } else if (startsWith(path, kSessionsPrefix)) {
        std::string segment = path.substr(std::string(kSessionsPrefix).size());
        if (segment.find('/') != std::string::npos) {
            return makeResponse(req, http::status::not_found, "Not Found", kText);
        }
        if (method == http::verb::delete_) return deleteSession(req, percentDecode(segment));
    } else {
        return makeResponse(req, http::status::not_found, "Not Found", kText);
    }

    return makeResponse(req, http::status::method_not_allowed, "Method Not Allowed", kText);
}

// ============================================================================
// Handlers
// ============================================================================

HttpResponse IngestApi::health(const HttpRequest& req) {
    return makeResponse(req, http::status::ok, "OK", kText);
}

HttpResponse IngestApi::ingest(const HttpRequest& req) {
    HookEvent event;
    try {
        event = HookEventDecoder::decode(req.body());
    } catch (const MalformedInput& e) {
        spdlog::debug("[IngestApi] Rejected event ({}): {}", e.status(), e.what());
        return makeError(req, static_cast<http::status>(e.status()), e.what());
    }

    StoredEvent stored = store_->append(std::move(event));
    notifier_->eventAdded(stored);

    spdlog::info("Received event: {} from {} (id={})",
                 stored.hook_event_type, stored.source_app, stored.id);

    return makeJson(req, http::status::created, {{"success", true}, {"id", stored.id}});
}

HttpResponse IngestApi::recent(const HttpRequest& req,
                               const std::unordered_map<std::string, std::string>& query) {
    size_t limit = store_->recentLimit();

    auto it = query.find("limit");
    if (it != query.end()) {
        size_t parsed = 0;
        const char* begin = it->second.data();
        const char* end = begin + it->second.size();
        auto result = std::from_chars(begin, end, parsed);
        if (result.ec == std::errc{} && result.ptr == end) {
            limit = std::min(parsed, limit);
        }
    }

    nlohmann::json body = store_->recent(limit);
    return makeJson(req, http::status::ok, body);
}

HttpResponse IngestApi::clear(const HttpRequest& req) {
    store_->clear();
    notifier_->eventsCleared();
    return makeJson(req, http::status::ok, {{"success", true}, {"message", "All events cleared"}});
}

HttpResponse IngestApi::filterOptions(const HttpRequest& req) {
    nlohmann::json body = store_->filterOptions();
    return makeJson(req, http::status::ok, body);
}

HttpResponse IngestApi::stats(const HttpRequest& req,
                              const std::unordered_map<std::string, std::string>& query) {
    std::optional<std::string> sessionId;
    auto it = query.find("session_id");
    if (it != query.end() && !it->second.empty()) {
        sessionId = it->second;
    }

    nlohmann::json body = store_->stats(sessionId);
    return makeJson(req, http::status::ok, body);
}

HttpResponse IngestApi::deleteSession(const HttpRequest& req, const std::string& sessionId) {
    if (sessionId.empty()) {
        return makeError(req, http::status::bad_request, "Session ID required");
    }
    if (!isValidUtf8(sessionId)) {
        spdlog::debug("[IngestApi] Rejected session id that is not valid UTF-8");
        return makeError(req, http::status::bad_request, "Session ID must be valid UTF-8");
    }

    size_t removed = store_->deleteSession(sessionId);
    notifier_->sessionDeleted(sessionId);

    return makeJson(req, http::status::ok,
                    {{"success", true}, {"sessionId", sessionId}, {"deletedEvents", removed}});
}

HttpResponse IngestApi::preflight(const HttpRequest& req) {
    return makeResponse(req, http::status::no_content, "", kText);
}

// ============================================================================
// Helpers
// ============================================================================

HttpResponse IngestApi::makeResponse(const HttpRequest& req, http::status status,
                                     std::string body, const char* contentType) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, "HookStreamCore");
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "*");
    res.set(http::field::access_control_allow_headers, "*");
    if (!body.empty()) {
        res.set(http::field::content_type, contentType);
    }
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
}

HttpResponse IngestApi::makeJson(const HttpRequest& req, http::status status,
                                 const nlohmann::json& body) {
    return makeResponse(req, status,
                        body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), kJson);
}

HttpResponse IngestApi::makeError(const HttpRequest& req, http::status status,
                                  const std::string& message) {
    return makeJson(req, status, {{"error", message}});
}

std::string IngestApi::percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hexValue(s[i + 1]);
            int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::unordered_map<std::string, std::string> IngestApi::parseQuery(const std::string& query) {
    std::unordered_map<std::string, std::string> params;
    size_t pos = 0;
    while (!query.empty()) {
        size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!pair.empty()) {
            size_t eq = pair.find('=');
            std::string key = pair.substr(0, eq);
            std::string value = eq == std::string::npos ? std::string() : pair.substr(eq + 1);
            std::replace(value.begin(), value.end(), '+', ' ');
            params[percentDecode(key)] = percentDecode(value);
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return params;
}

} // namespace HookStream
