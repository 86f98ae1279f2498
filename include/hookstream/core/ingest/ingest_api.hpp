#pragma once

#include <hookstream/core/storage/event_store.hpp>
#include <hookstream/core/notify/notifier.hpp>
#include <boost/beast/http.hpp>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace HookStream {

namespace http = boost::beast::http;

using HttpRequest = http::request<http::string_body>;
using HttpResponse = http::response<http::string_body>;

/**
 * @class IngestApi
 * @brief HTTP routes of the sidecar, independent of the transport.
 *
 * Routes:
 *   GET    /health                  liveness probe, "OK"
 *   POST   /events                  ingest a HookEvent (201)
 *   GET    /events/recent           newest events, ascending (?limit=N)
 *   POST   /events/clear            drop everything, reset ids
 *   GET    /events/filter-options   distinct apps / sessions / event types
 *   GET    /stats                   counts by type and app (?session_id=S)
 *   DELETE /sessions/{session_id}   drop one session
 *   OPTIONS *                       CORS preflight
 *
 * Every response carries permissive CORS headers. Mutating routes notify
 * the subscriber after the store has been updated.
 */
class IngestApi {
public:
    IngestApi(std::shared_ptr<EventStore> store, std::shared_ptr<Notifier> notifier);

    // Never throws: unexpected failures become a 500 response
    HttpResponse handle(const HttpRequest& req);

    const std::shared_ptr<EventStore>& store() const { return store_; }
    const std::shared_ptr<Notifier>& notifier() const { return notifier_; }

    static std::string percentDecode(const std::string& s);
    static std::unordered_map<std::string, std::string> parseQuery(const std::string& query);

private:
    HttpResponse route(const HttpRequest& req, const std::string& path,
                       const std::unordered_map<std::string, std::string>& query);

    HttpResponse health(const HttpRequest& req);
    HttpResponse ingest(const HttpRequest& req);
    HttpResponse recent(const HttpRequest& req, const std::unordered_map<std::string, std::string>& query);
    HttpResponse clear(const HttpRequest& req);
    HttpResponse filterOptions(const HttpRequest& req);
    HttpResponse stats(const HttpRequest& req, const std::unordered_map<std::string, std::string>& query);
    HttpResponse deleteSession(const HttpRequest& req, const std::string& sessionId);
    HttpResponse preflight(const HttpRequest& req);

    static HttpResponse makeResponse(const HttpRequest& req, http::status status,
                                     std::string body, const char* contentType);
    static HttpResponse makeJson(const HttpRequest& req, http::status status,
                                 const nlohmann::json& body);
    static HttpResponse makeError(const HttpRequest& req, http::status status,
                                  const std::string& message);

    std::shared_ptr<EventStore> store_;
    std::shared_ptr<Notifier> notifier_;
};

} // namespace HookStream
