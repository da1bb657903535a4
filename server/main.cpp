#include "chat/chat_history.h"
#include "chat/chat_lock.h"
#include "chat/chat_registry.h"
#include "runtime/backends/llama_engine.h"
#include "runtime/prompt/prompt_assembler.h"
#include "runtime/streaming_orchestrator.h"
#include "server/auth/auth_gate.h"
#include "server/auth/identity_policy.h"
#include "server/auth/token_codec.h"
#include "server/config/server_config.h"
#include "server/http/http_server.h"
#include "server/logging/audit_logger.h"
#include "server/logging/logger.h"
#include "storage/memory_kv_store.h"
#include "storage/redis_kv_store.h"
#include "storage/sqlite_user_store.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running{true};

void SignalHandler(int) { g_running = false; }

namespace {

std::unique_ptr<parley::KvStore> MakeKvStore(const parley::ServerConfig& config) {
  if (config.store_backend == "memory") {
    parley::log::Warn("server", "using in-memory KV store; chats are lost on exit");
    return std::make_unique<parley::MemoryKvStore>();
  }
  if (config.store_backend != "redis") {
    parley::log::Warn("server", "unknown store backend, using redis",
                      "backend=" + config.store_backend);
  }
  return std::make_unique<parley::RedisKvStore>(config.redis);
}

int Serve(const parley::ServerConfig& config) {
  auto kv = MakeKvStore(config);
  if (!kv->Ping()) {
    parley::log::Warn("server", "KV store not reachable at startup", "backend=" + kv->Name());
  }

  parley::SqliteUserStore users(config.sqlite_path);
  users.EnsureUser(config.anonymous_user, {{parley::AuthType::kPasswordless, {}}});

  parley::ChatLockTable locks;
  parley::ChatHistoryLog history(kv.get(), &locks);
  parley::LlamaEngine engine(config.models);
  parley::ChatRegistry registry(kv.get(), &users, &history, &locks, &engine,
                                config.anonymous_user);
  parley::InstructPromptAssembler assembler;
  parley::AuditLogger audit_logger(config.audit_log_path, config.audit_debug);
  parley::StreamingInferenceOrchestrator orchestrator(
      &registry, &history, &locks, &engine, &assembler,
      audit_logger.Enabled() ? &audit_logger : nullptr);

  auto fallback =
      std::make_shared<parley::StoreBackedIdentityPolicy>(&users, config.anonymous_user);
  parley::AuthGate auth(&users, parley::TokenCodec(config.secret_key), fallback,
                        config.session_expiry_minutes);

  parley::HttpServer::Services services;
  services.auth = &auth;
  services.registry = &registry;
  services.history = &history;
  services.orchestrator = &orchestrator;
  services.kv = kv.get();
  services.audit = audit_logger.Enabled() ? &audit_logger : nullptr;
  services.secure_cookie = !config.insecure_cookie;

  parley::HttpServer server(config.host, config.port, services, config.tls,
                            config.http_workers);

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  server.Start();
  parley::log::Info("server", "parley started",
                    "endpoint=" + config.host + ":" + std::to_string(config.port) +
                        " store=" + kv->Name() + " users=" + users.Name() +
                        " engine=" + engine.Name() +
                        " weights_dir=" + config.models.weights_dir.string());

  while (g_running) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  server.Stop();
  parley::log::Info("server", "parley shutting down");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  std::string config_path = "config/server.yaml";
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: parley_server [--config <path>]" << std::endl;
      return 0;
    }
  }

  parley::ServerConfig config = parley::LoadServerConfig(config_path);
  parley::ApplyEnvOverrides(&config);
  parley::log::SetJsonMode(config.log_format == "json");
  parley::log::SetMinLevel(parley::log::ParseLevel(config.log_level));

  try {
    parley::EnsureSecretKey(&config);
    return Serve(config);
  } catch (const std::exception& e) {
    parley::log::Error("server", "fatal startup error", e.what());
    return 1;
  }
}
