#include "server/http/http_request.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

using json = nlohmann::json;

namespace parley {

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return value;
}

std::string Trim(const std::string &value) {
  auto s = value.find_first_not_of(" \t\r\n");
  auto e = value.find_last_not_of(" \t\r\n");
  return s == std::string::npos ? std::string() : value.substr(s, e - s + 1);
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

const std::string *FindParam(const std::map<std::string, std::string> &params,
                             const std::string &name) {
  auto it = params.find(name);
  return it == params.end() ? nullptr : &it->second;
}

int IntParam(const std::map<std::string, std::string> &params,
             const std::string &name, int fallback) {
  const std::string *raw = FindParam(params, name);
  if (!raw) {
    return fallback;
  }
  std::size_t used = 0;
  int value = 0;
  try {
    value = std::stoi(*raw, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != raw->size()) {
    throw ServiceError(ErrorCode::kBadRequest,
                       "value is not a valid integer: " + name);
  }
  return value;
}

double DoubleParam(const std::map<std::string, std::string> &params,
                   const std::string &name, double fallback) {
  const std::string *raw = FindParam(params, name);
  if (!raw) {
    return fallback;
  }
  std::size_t used = 0;
  double value = 0.0;
  try {
    value = std::stod(*raw, &used);
  } catch (const std::logic_error &) {
    used = 0;
  }
  if (used == 0 || used != raw->size()) {
    throw ServiceError(ErrorCode::kBadRequest,
                       "value is not a valid number: " + name);
  }
  return value;
}

} // namespace

std::string UrlDecode(const std::string &input, bool plus_as_space) {
  std::string out;
  out.reserve(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    char c = input[i];
    if (c == '%' && i + 2 < input.size()) {
      int hi = HexValue(input[i + 1]);
      int lo = HexValue(input[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out.push_back(' ');
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::map<std::string, std::string> ParseQueryString(const std::string &query) {
  std::map<std::string, std::string> out;
  std::size_t start = 0;
  while (start <= query.size()) {
    auto end = query.find('&', start);
    if (end == std::string::npos) {
      end = query.size();
    }
    std::string pair = query.substr(start, end - start);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      if (eq == std::string::npos) {
        out[UrlDecode(pair)] = "";
      } else {
        out[UrlDecode(pair.substr(0, eq))] = UrlDecode(pair.substr(eq + 1));
      }
    }
    start = end + 1;
  }
  return out;
}

bool ParseRequestHead(const std::string &head, HttpRequest *out) {
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos) {
    return false;
  }
  auto target_end = first_line.find(' ', method_end + 1);
  if (target_end == std::string::npos) {
    return false;
  }
  out->method = first_line.substr(0, method_end);
  std::string target =
      first_line.substr(method_end + 1, target_end - method_end - 1);
  if (out->method.empty() || target.empty() || target[0] != '/') {
    return false;
  }
  auto qpos = target.find('?');
  if (qpos == std::string::npos) {
    out->path = UrlDecode(target, false);
    out->query.clear();
  } else {
    out->path = UrlDecode(target.substr(0, qpos), false);
    out->query = ParseQueryString(target.substr(qpos + 1));
  }

  out->headers.clear();
  if (first_line_end == std::string::npos) {
    return true;
  }
  std::size_t pos = first_line_end + 2;
  while (pos < head.size()) {
    auto end = head.find("\r\n", pos);
    if (end == std::string::npos) {
      end = head.size();
    }
    std::string line = head.substr(pos, end - pos);
    auto colon = line.find(':');
    if (colon != std::string::npos) {
      out->headers[Lower(Trim(line.substr(0, colon)))] =
          Trim(line.substr(colon + 1));
    }
    pos = end + 2;
  }
  return true;
}

std::string GetHeaderValue(const HttpRequest &request,
                           const std::string &name) {
  auto it = request.headers.find(Lower(name));
  return it == request.headers.end() ? std::string() : it->second;
}

std::optional<std::string> GetCookie(const HttpRequest &request,
                                     const std::string &name) {
  std::string header = GetHeaderValue(request, "cookie");
  std::size_t start = 0;
  while (start < header.size()) {
    auto end = header.find(';', start);
    if (end == std::string::npos) {
      end = header.size();
    }
    std::string pair = Trim(header.substr(start, end - start));
    auto eq = pair.find('=');
    if (eq != std::string::npos && pair.substr(0, eq) == name) {
      std::string value = pair.substr(eq + 1);
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      return value;
    }
    start = end + 1;
  }
  return std::nullopt;
}

std::optional<std::string> ExtractAccessToken(const HttpRequest &request) {
  auto cookie = GetCookie(request, "token");
  if (cookie && !cookie->empty()) {
    return cookie;
  }
  std::string auth = GetHeaderValue(request, "authorization");
  if (auth.size() > 7 && Lower(auth.substr(0, 7)) == "bearer ") {
    std::string token = Trim(auth.substr(7));
    if (!token.empty()) {
      return token;
    }
  }
  return std::nullopt;
}

std::vector<std::string> SplitPath(const std::string &path) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string::npos) {
      end = path.size();
    }
    if (end > start) {
      segments.push_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return segments;
}

const char *StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 202:
    return "Accepted";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 503:
    return "Service Unavailable";
  default:
    return status >= 500 ? "Internal Server Error" : "Error";
  }
}

std::string BuildResponse(const std::string &body, int status,
                          const std::string &extra_headers) {
  std::string headers = "HTTP/1.1 " + std::to_string(status) + " " +
                        StatusText(status) + "\r\n";
  headers += "Content-Type: application/json\r\n";
  if (!extra_headers.empty()) {
    headers += extra_headers;
  }
  headers += "Connection: close\r\n";
  headers += "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n";
  return headers + body;
}

std::string BuildErrorBody(const std::string &message) {
  return json({{"detail", message}})
      .dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string BuildSseEvent(const std::string &event, const std::string &data) {
  std::string out = "event: " + event + "\r\n";
  std::size_t start = 0;
  while (true) {
    auto end = data.find('\n', start);
    std::string line = data.substr(start, end == std::string::npos
                                              ? std::string::npos
                                              : end - start);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    out += "data: " + line + "\r\n";
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  out += "\r\n";
  return out;
}

std::string BuildSessionCookie(const std::string &value,
                               long long max_age_seconds, bool secure) {
  std::string cookie = "Set-Cookie: token=" + value + "; HttpOnly; Path=/";
  if (secure) {
    cookie += "; Secure";
  }
  cookie += "; SameSite=Strict; Max-Age=" + std::to_string(max_age_seconds);
  if (max_age_seconds == 0) {
    cookie += "; Expires=Thu, 01 Jan 1970 00:00:00 GMT";
  }
  return cookie + "\r\n";
}

int HttpStatusFor(ErrorCode code) {
  switch (code) {
  case ErrorCode::kInvalidCredential:
  case ErrorCode::kUnauthorized:
    return 401;
  case ErrorCode::kNotFound:
    return 404;
  case ErrorCode::kModelUnavailable:
  case ErrorCode::kBadRequest:
    return 400;
  case ErrorCode::kConflict:
    return 409;
  case ErrorCode::kGenerationFailure:
    return 500;
  }
  return 500;
}

ChatParameters
ParseChatParameters(const std::map<std::string, std::string> &query) {
  ChatParameters params;
  if (const std::string *model = FindParam(query, "model")) {
    params.model_path = *model;
  }
  params.temperature = DoubleParam(query, "temperature", params.temperature);
  params.top_k = IntParam(query, "top_k", params.top_k);
  params.top_p = DoubleParam(query, "top_p", params.top_p);
  params.max_tokens = IntParam(query, "max_length", params.max_tokens);
  params.n_ctx = IntParam(query, "context_window", params.n_ctx);
  const std::string *gpu_layers = FindParam(query, "gpu_layers");
  if (gpu_layers && !gpu_layers->empty() && *gpu_layers != "null") {
    params.n_gpu_layers = IntParam(query, "gpu_layers", 0);
  }
  params.last_n_tokens_size =
      IntParam(query, "repeat_last_n", params.last_n_tokens_size);
  params.repeat_penalty =
      DoubleParam(query, "repeat_penalty", params.repeat_penalty);
  if (const std::string *init_prompt = FindParam(query, "init_prompt")) {
    params.init_prompt = *init_prompt;
  }
  params.n_threads = IntParam(query, "n_threads", params.n_threads);
  if (params.model_path.empty()) {
    throw ServiceError(ErrorCode::kBadRequest, "model must not be empty");
  }
  if (params.n_ctx <= 0 || params.max_tokens <= 0 || params.n_threads <= 0) {
    throw ServiceError(
        ErrorCode::kBadRequest,
        "context_window, max_length and n_threads must be positive");
  }
  if (params.n_ctx > ChatParameters::kMaxContextWindow) {
    throw ServiceError(ErrorCode::kBadRequest,
                       "context_window must be at most " +
                           std::to_string(ChatParameters::kMaxContextWindow));
  }
  if (params.max_tokens > ChatParameters::kMaxTokens) {
    throw ServiceError(ErrorCode::kBadRequest,
                       "max_length must be at most " +
                           std::to_string(ChatParameters::kMaxTokens));
  }
  if (params.n_threads > ChatParameters::kMaxThreads) {
    throw ServiceError(ErrorCode::kBadRequest,
                       "n_threads must be at most " +
                           std::to_string(ChatParameters::kMaxThreads));
  }
  return params;
}

} // namespace parley
