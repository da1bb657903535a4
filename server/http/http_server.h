#pragma once

#include "chat/chat_history.h"
#include "chat/chat_registry.h"
#include "runtime/streaming_orchestrator.h"
#include "server/auth/auth_gate.h"
#include "server/http/http_request.h"
#include "server/logging/audit_logger.h"
#include "storage/kv_store.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include <openssl/ssl.h>

namespace parley {

class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  // Collaborators the routes dispatch to. Not owned; all must outlive the
  // server. audit and kv may be null.
  struct Services {
    AuthGate* auth{nullptr};
    ChatRegistry* registry{nullptr};
    ChatHistoryLog* history{nullptr};
    StreamingInferenceOrchestrator* orchestrator{nullptr};
    KvStore* kv{nullptr};
    AuditLogger* audit{nullptr};
    // Adds `Secure` to the session cookie. Off only for plain-HTTP dev setups.
    bool secure_cookie{true};
  };

  HttpServer(std::string host,
             int port,
             Services services,
             TlsConfig tls_config,
             int num_workers = 4);
  ~HttpServer();

  void Start();
  void Stop();

  // Serves one request on an already-accepted plaintext socket and closes
  // it. Worker threads do the same for every queued connection.
  void ServeConnection(int fd);

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
  };

  // Per-request state shared by the route handlers.
  struct RequestContext {
    HttpRequest request;
    IdentityResolution identity;
    // Response headers every reply to this request must carry (the cookie
    // reset for a rejected token).
    std::string extra_headers;
  };

  void Run();
  void WorkerLoop();
  void HandleClient(ClientSession& session);
  void Dispatch(ClientSession& session, RequestContext& ctx);

  void HandleLogin(ClientSession& session, RequestContext& ctx);
  void HandleLogout(ClientSession& session, RequestContext& ctx);
  void HandleCurrentUser(ClientSession& session, RequestContext& ctx);
  void HandleCreateChat(ClientSession& session, RequestContext& ctx);
  void HandleListChats(ClientSession& session, RequestContext& ctx);
  void HandleGetChat(ClientSession& session, RequestContext& ctx, const std::string& chat_id);
  void HandleGetHistory(ClientSession& session, RequestContext& ctx, const std::string& chat_id);
  void HandleDeletePrompt(ClientSession& session, RequestContext& ctx, const std::string& chat_id);
  void HandleDeleteChat(ClientSession& session, RequestContext& ctx, const std::string& chat_id);
  void HandleDeleteAll(ClientSession& session, RequestContext& ctx);
  void HandleStreamQuestion(ClientSession& session, RequestContext& ctx, const std::string& chat_id);
  void HandleAskQuestion(ClientSession& session, RequestContext& ctx, const std::string& chat_id);
  void HandleHealth(ClientSession& session);

  void SendJson(ClientSession& session, RequestContext& ctx, const std::string& body, int status = 200);
  void SendServiceError(ClientSession& session, RequestContext& ctx, const ServiceError& error);

  bool SendAll(ClientSession& session, const std::string& payload);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  std::string host_;
  int port_;
  Services services_;
  bool tls_enabled_{false};
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
};

}  // namespace parley
