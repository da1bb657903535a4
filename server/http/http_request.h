#pragma once

#include "chat/chat_types.h"
#include "server/service_error.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace parley {

struct HttpRequest {
  std::string method;
  // Decoded path without the query string.
  std::string path;
  std::map<std::string, std::string> query;
  // Header names are stored lower-cased.
  std::map<std::string, std::string> headers;
  std::string body;
};

// Parses the request line and header block (everything before the blank
// line). Returns false on a malformed request line.
bool ParseRequestHead(const std::string &head, HttpRequest *out);

// Percent-decoding; `+` becomes a space when plus_as_space is set
// (query strings and form bodies).
std::string UrlDecode(const std::string &input, bool plus_as_space = true);

// Parses `a=1&b=two` style strings. Later duplicates win.
std::map<std::string, std::string> ParseQueryString(const std::string &query);

// Case-insensitive header lookup; empty string if absent.
std::string GetHeaderValue(const HttpRequest &request, const std::string &name);

std::optional<std::string> GetCookie(const HttpRequest &request,
                                     const std::string &name);

// Session token from the `token` cookie, else from an
// `Authorization: Bearer` header.
std::optional<std::string> ExtractAccessToken(const HttpRequest &request);

// Path split on '/', empty segments dropped: "/api/chat/x/" -> {api,chat,x}.
std::vector<std::string> SplitPath(const std::string &path);

const char *StatusText(int status);

// Status line + JSON content type + Content-Length framing.
std::string BuildResponse(const std::string &body, int status = 200,
                          const std::string &extra_headers = "");

// `{"detail": message}` error body.
std::string BuildErrorBody(const std::string &message);

// One server-sent event. Multi-line data is split into one `data:` line per
// line so the client reassembles it verbatim.
std::string BuildSseEvent(const std::string &event, const std::string &data);

// Set-Cookie header line (with trailing CRLF) for the session token.
// max_age_seconds == 0 expires the cookie.
std::string BuildSessionCookie(const std::string &value, long long max_age_seconds,
                               bool secure);

int HttpStatusFor(ErrorCode code);

// ChatParameters from the create-chat query string. Absent keys keep their
// defaults; gpu_layers "null" or empty leaves it unset. Throws
// ServiceError(kBadRequest) on unparsable numbers, an empty model, and sizes
// that are non-positive or above the ChatParameters limits.
ChatParameters
ParseChatParameters(const std::map<std::string, std::string> &query);

} // namespace parley
