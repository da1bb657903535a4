#include "server/http/http_server.h"

#include "server/logging/logger.h"

#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>

using json = nlohmann::json;

namespace parley {

namespace {

std::string Dump(const json &j) {
  return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

const std::string *FindParam(const std::map<std::string, std::string> &params,
                             const std::string &name) {
  auto it = params.find(name);
  return it == params.end() ? nullptr : &it->second;
}

const char *EventName(StreamEvent::Type type) {
  switch (type) {
  case StreamEvent::Type::kMessage:
    return "message";
  case StreamEvent::Type::kClose:
    return "close";
  case StreamEvent::Type::kError:
    return "error";
  }
  return "error";
}

} // namespace

HttpServer::HttpServer(std::string host, int port, Services services,
                       TlsConfig tls_config, int num_workers)
    : host_(std::move(host)), port_(port), services_(services),
      num_workers_(num_workers > 0 ? num_workers : 4) {
  if (tls_config.enabled) {
    if (tls_config.cert_path.empty() || tls_config.key_path.empty()) {
      log::Warn("http", "TLS enabled without cert/key; falling back to HTTP");
    } else {
      SSL_load_error_strings();
      OpenSSL_add_ssl_algorithms();
      ssl_ctx_ = SSL_CTX_new(TLS_server_method());
      if (!ssl_ctx_) {
        log::Error("http", "failed to initialize TLS context");
      } else {
        SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
        if (SSL_CTX_use_certificate_file(ssl_ctx_, tls_config.cert_path.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
          log::Error("http", "failed to load TLS certificate",
                     "path=" + tls_config.cert_path);
          SSL_CTX_free(ssl_ctx_);
          ssl_ctx_ = nullptr;
        } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_,
                                               tls_config.key_path.c_str(),
                                               SSL_FILETYPE_PEM) <= 0) {
          log::Error("http", "failed to load TLS key",
                     "path=" + tls_config.key_path);
          SSL_CTX_free(ssl_ctx_);
          ssl_ctx_ = nullptr;
        } else {
          tls_enabled_ = true;
          log::Info("http", "TLS enabled", "cert=" + tls_config.cert_path);
        }
      }
    }
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

void HttpServer::Start() {
  if (running_) {
    return;
  }
  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::ServeConnection(int fd) {
  ClientSession session;
  session.fd = fd;
  HandleClient(session);
  CloseSession(session);
}

void HttpServer::Run() {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error("http", "socket() failed", std::strerror(errno));
    return;
  }

  int opt = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    log::Warn("http", "SO_REUSEADDR not applied", std::strerror(errno));
  }

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
    log::Error("http", "invalid listen address", "host=" + host_);
    ::close(fd);
    return;
  }

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    log::Error("http", "bind() failed",
               "endpoint=" + host_ + ":" + std::to_string(port_) +
                   " error=" + std::strerror(errno));
    ::close(fd);
    return;
  }

  if (::listen(fd, 128) < 0) {
    log::Error("http", "listen() failed", std::strerror(errno));
    ::close(fd);
    return;
  }

  server_fd_.store(fd);
  log::Info("http", "listening",
            "endpoint=" + host_ + ":" + std::to_string(port_) +
                " workers=" + std::to_string(num_workers_) +
                " tls=" + (tls_enabled_ ? "on" : "off"));

  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      break; // Socket closed by Stop() or error.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    ClientSession session;
    session.fd = client_fd;
    if (tls_enabled_) {
      SSL *ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  // If Stop() hasn't already closed the socket, close it now.
  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

void HttpServer::HandleClient(ClientSession &session) {
  constexpr std::size_t kMaxRequest = 1024 * 1024;
  std::string request;
  std::size_t header_end_pos = std::string::npos;
  char buffer[4096];

  // Phase 1: read until we find the end-of-headers marker.
  while (header_end_pos == std::string::npos) {
    ssize_t bytes = Receive(session, buffer, sizeof(buffer));
    if (bytes <= 0) {
      return;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
    if (request.size() > kMaxRequest) {
      SendAll(session, BuildResponse(BuildErrorBody("request too large"), 413));
      return;
    }
    header_end_pos = request.find("\r\n\r\n");
  }

  RequestContext ctx;
  if (!ParseRequestHead(request.substr(0, header_end_pos), &ctx.request)) {
    SendAll(session, BuildResponse(BuildErrorBody("malformed request"), 400));
    return;
  }

  // Phase 2: read the remaining body bytes announced by Content-Length.
  std::size_t body_start = header_end_pos + 4;
  std::size_t content_length = 0;
  std::string cl = GetHeaderValue(ctx.request, "content-length");
  if (!cl.empty()) {
    try {
      content_length = std::stoull(cl);
    } catch (const std::logic_error &) {
      SendAll(session,
              BuildResponse(BuildErrorBody("invalid Content-Length"), 400));
      return;
    }
  }
  if (content_length > kMaxRequest) {
    SendAll(session, BuildResponse(BuildErrorBody("request too large"), 413));
    return;
  }
  std::size_t needed = body_start + content_length;
  while (request.size() < needed) {
    ssize_t bytes = Receive(session, buffer,
                            std::min(sizeof(buffer), needed - request.size()));
    if (bytes <= 0) {
      return;
    }
    request.append(buffer, static_cast<std::size_t>(bytes));
  }
  ctx.request.body = request.substr(body_start, content_length);

  log::Debug("http", "request",
             ctx.request.method + " " + ctx.request.path);
  try {
    Dispatch(session, ctx);
  } catch (const ServiceError &e) {
    SendServiceError(session, ctx, e);
  } catch (const std::exception &e) {
    log::Error("http", "request failed",
               ctx.request.method + " " + ctx.request.path +
                   " error=" + e.what());
    SendJson(session, ctx, BuildErrorBody(e.what()), 500);
  }
}

void HttpServer::Dispatch(ClientSession &session, RequestContext &ctx) {
  const std::string &method = ctx.request.method;
  const std::string &path = ctx.request.path;

  if (method == "GET" && (path == "/healthz" || path == "/livez")) {
    if (path == "/livez") {
      SendAll(session, BuildResponse(Dump({{"status", "ok"}})));
    } else {
      HandleHealth(session);
    }
    return;
  }

  std::vector<std::string> seg = SplitPath(path);
  if (seg.empty() || seg[0] != "api") {
    SendJson(session, ctx, BuildErrorBody("Not Found"), 404);
    return;
  }

  if (seg.size() == 3 && seg[1] == "auth" && method == "POST") {
    if (seg[2] == "token") {
      HandleLogin(session, ctx);
      return;
    }
    if (seg[2] == "logout") {
      HandleLogout(session, ctx);
      return;
    }
  }

  ctx.identity =
      services_.auth->ResolveIdentityOrAnonymous(ExtractAccessToken(ctx.request));
  if (ctx.identity.clear_cookie) {
    ctx.extra_headers +=
        BuildSessionCookie("", 0, services_.secure_cookie);
  }

  if (seg.size() == 2 && seg[1] == "user" && method == "GET") {
    HandleCurrentUser(session, ctx);
    return;
  }

  if (seg.size() >= 2 && seg[1] == "chat") {
    if (seg.size() == 2) {
      if (method == "POST") {
        HandleCreateChat(session, ctx);
        return;
      }
      if (method == "GET") {
        HandleListChats(session, ctx);
        return;
      }
    } else if (seg.size() == 4 && seg[2] == "delete" && seg[3] == "all" &&
               method == "DELETE") {
      HandleDeleteAll(session, ctx);
      return;
    } else if (seg.size() == 3) {
      if (method == "GET") {
        HandleGetChat(session, ctx, seg[2]);
        return;
      }
      if (method == "DELETE") {
        HandleDeleteChat(session, ctx, seg[2]);
        return;
      }
    } else if (seg.size() == 4) {
      const std::string &chat_id = seg[2];
      if (seg[3] == "history" && method == "GET") {
        HandleGetHistory(session, ctx, chat_id);
        return;
      }
      if (seg[3] == "prompt" && method == "DELETE") {
        HandleDeletePrompt(session, ctx, chat_id);
        return;
      }
      if (seg[3] == "question" && method == "GET") {
        HandleStreamQuestion(session, ctx, chat_id);
        return;
      }
      if (seg[3] == "question" && method == "POST") {
        HandleAskQuestion(session, ctx, chat_id);
        return;
      }
    }
  }

  SendJson(session, ctx, BuildErrorBody("Not Found"), 404);
}

void HttpServer::HandleHealth(ClientSession &session) {
  bool kv_ok = !services_.kv || services_.kv->Ping();
  json j = {{"status", kv_ok ? "ok" : "degraded"}, {"kv", kv_ok}};
  SendAll(session, BuildResponse(Dump(j), kv_ok ? 200 : 503));
}

void HttpServer::HandleLogin(ClientSession &session, RequestContext &ctx) {
  auto form = ParseQueryString(ctx.request.body);
  std::string username = form["username"];
  std::string password = form["password"];
  auto user = services_.auth->Authenticate(username, password);
  if (services_.audit) {
    services_.audit->LogLogin(username, user.has_value());
  }
  if (!user) {
    log::Info("auth", "login failed", "username=" + username);
    SendJson(session, ctx, BuildErrorBody("Incorrect username or password"),
             401);
    return;
  }
  AccessToken token = services_.auth->IssueToken(user->username);
  ctx.extra_headers += BuildSessionCookie(
      token.token,
      static_cast<long long>(services_.auth->session_expiry_minutes()) * 60,
      services_.secure_cookie);
  log::Info("auth", "login succeeded", "username=" + user->username);
  SendJson(session, ctx,
           Dump({{"access_token", token.token}, {"token_type", "bearer"}}));
}

void HttpServer::HandleLogout(ClientSession &session, RequestContext &ctx) {
  ctx.extra_headers += BuildSessionCookie("", 0, services_.secure_cookie);
  SendJson(session, ctx, Dump({{"message", "Logged out successfully"}}));
}

void HttpServer::HandleCurrentUser(ClientSession &session,
                                   RequestContext &ctx) {
  const User &user = ctx.identity.user;
  json chats = json::array();
  for (const auto &ref : user.chats) {
    chats.push_back(ref.chat_id);
  }
  SendJson(session, ctx, Dump({{"username", user.username}, {"chats", chats}}));
}

void HttpServer::HandleCreateChat(ClientSession &session,
                                  RequestContext &ctx) {
  ChatParameters params = ParseChatParameters(ctx.request.query);
  User &user = ctx.identity.user;
  ChatSession created = services_.registry->CreateSession(user, params);
  if (services_.audit) {
    services_.audit->Log(user.username, created.id, "chat_create", "success",
                         "model=" + params.model_path);
  }
  SendJson(session, ctx, Dump(created.id));
}

void HttpServer::HandleListChats(ClientSession &session, RequestContext &ctx) {
  json out = json::array();
  for (const auto &summary :
       services_.registry->ListSessions(ctx.identity.user)) {
    out.push_back(SummaryToJson(summary));
  }
  SendJson(session, ctx, Dump(out));
}

void HttpServer::HandleGetChat(ClientSession &session, RequestContext &ctx,
                               const std::string &chat_id) {
  ChatSession chat =
      services_.registry->GetAuthorizedSession(ctx.identity.user, chat_id);
  json out = SessionToJson(chat);
  json history = json::array();
  for (const auto &message : services_.history->ReadAll(chat_id)) {
    history.push_back(MessageToJson(message));
  }
  out["history"] = history;
  SendJson(session, ctx, Dump(out));
}

void HttpServer::HandleGetHistory(ClientSession &session, RequestContext &ctx,
                                  const std::string &chat_id) {
  services_.registry->AuthorizeAccess(ctx.identity.user, chat_id);
  json history = json::array();
  for (const auto &message : services_.history->ReadAll(chat_id)) {
    history.push_back(MessageToJson(message));
  }
  SendJson(session, ctx, Dump(history));
}

void HttpServer::HandleDeletePrompt(ClientSession &session,
                                    RequestContext &ctx,
                                    const std::string &chat_id) {
  services_.registry->AuthorizeAccess(ctx.identity.user, chat_id);
  const std::string *raw = FindParam(ctx.request.query, "idx");
  if (!raw) {
    throw ServiceError(ErrorCode::kBadRequest, "idx is required");
  }
  long long idx = 0;
  try {
    std::size_t used = 0;
    idx = std::stoll(*raw, &used);
    if (used != raw->size()) {
      throw ServiceError(ErrorCode::kBadRequest, "idx must be an integer");
    }
  } catch (const std::logic_error &) {
    throw ServiceError(ErrorCode::kBadRequest, "idx must be an integer");
  }
  try {
    services_.history->TruncateBefore(chat_id, idx);
  } catch (const ServiceError &e) {
    if (e.code() != ErrorCode::kConflict) {
      throw;
    }
    // A truncation racing a generation is a retry-later signal, not an error.
    SendJson(session, ctx, BuildErrorBody(e.what()), 202);
    return;
  }
  SendJson(session, ctx, "true");
}

void HttpServer::HandleDeleteChat(ClientSession &session, RequestContext &ctx,
                                  const std::string &chat_id) {
  User &user = ctx.identity.user;
  services_.registry->DeleteSession(user, chat_id);
  if (services_.audit) {
    services_.audit->Log(user.username, chat_id, "chat_delete", "success");
  }
  SendJson(session, ctx, "true");
}

void HttpServer::HandleDeleteAll(ClientSession &session, RequestContext &ctx) {
  User &user = ctx.identity.user;
  DeleteAllReport report = services_.registry->DeleteAllSessions(user);
  json failures = json::array();
  for (const auto &failure : report.failures) {
    failures.push_back({{"chat_id", failure.chat_id}, {"error", failure.error}});
  }
  if (services_.audit) {
    services_.audit->Log(user.username, "", "chat_delete_all",
                         report.ok() ? "success" : "partial",
                         "deleted=" + std::to_string(report.deleted.size()) +
                             " failed=" + std::to_string(report.failures.size()));
  }
  SendJson(session, ctx,
           Dump({{"deleted", report.deleted}, {"failures", failures}}),
           report.ok() ? 200 : 500);
}

void HttpServer::HandleStreamQuestion(ClientSession &session,
                                      RequestContext &ctx,
                                      const std::string &chat_id) {
  const std::string *prompt = FindParam(ctx.request.query, "prompt");
  if (!prompt) {
    throw ServiceError(ErrorCode::kBadRequest, "prompt is required");
  }

  // Headers go out with the first event so that authorization and busy-chat
  // failures can still be answered with a plain JSON error.
  bool headers_sent = false;
  bool client_alive = true;
  EventSink sink = [&](const StreamEvent &event) {
    if (!client_alive) {
      return false;
    }
    if (!headers_sent) {
      headers_sent = true;
      std::string stream_headers = "HTTP/1.1 200 OK\r\n"
                                   "Content-Type: text/event-stream\r\n"
                                   "Cache-Control: no-cache\r\n"
                                   "Connection: keep-alive\r\n" +
                                   ctx.extra_headers + "\r\n";
      if (!SendAll(session, stream_headers)) {
        client_alive = false;
        return false;
      }
    }
    client_alive =
        SendAll(session, BuildSseEvent(EventName(event.type), event.data));
    return client_alive;
  };

  try {
    services_.orchestrator->Stream(ctx.identity.user, chat_id, *prompt, sink);
  } catch (const std::exception &e) {
    if (!headers_sent) {
      throw;
    }
    log::Error("http", "stream failed after headers were sent",
               "chat_id=" + chat_id + " error=" + e.what());
  }
}

void HttpServer::HandleAskQuestion(ClientSession &session, RequestContext &ctx,
                                   const std::string &chat_id) {
  const std::string *prompt = FindParam(ctx.request.query, "prompt");
  if (!prompt) {
    throw ServiceError(ErrorCode::kBadRequest, "prompt is required");
  }
  AskResult result =
      services_.orchestrator->Ask(ctx.identity.user, chat_id, *prompt);
  if (!result.ok) {
    SendJson(session, ctx, BuildErrorBody(result.text), 500);
    return;
  }
  SendJson(session, ctx, Dump(result.text));
}

void HttpServer::SendJson(ClientSession &session, RequestContext &ctx,
                          const std::string &body, int status) {
  std::string headers = ctx.extra_headers;
  if (status == 401) {
    headers += "WWW-Authenticate: Bearer\r\n";
  }
  SendAll(session, BuildResponse(body, status, headers));
}

void HttpServer::SendServiceError(ClientSession &session, RequestContext &ctx,
                                  const ServiceError &error) {
  int status = HttpStatusFor(error.code());
  log::Info("http", "request rejected",
            ctx.request.method + " " + ctx.request.path +
                " code=" + ErrorCodeName(error.code()) +
                " status=" + std::to_string(status) + " detail=" + error.what());
  SendJson(session, ctx, BuildErrorBody(error.what()), status);
}

bool HttpServer::SendAll(ClientSession &session, const std::string &payload) {
  const char *data = payload.c_str();
  std::size_t remaining = payload.size();
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace parley
