#pragma once

#include "runtime/backends/llama_engine.h"
#include "server/http/http_server.h"
#include "storage/redis_kv_store.h"

#include <string>

namespace parley {

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{8080};
  int http_workers{4};

  std::string secret_key;
  int session_expiry_minutes{60};
  std::string anonymous_user{"system"};
  // Drop the `Secure` cookie attribute (plain-HTTP development only).
  bool insecure_cookie{false};

  // "redis" or "memory".
  std::string store_backend{"redis"};
  RedisConfig redis;
  std::string sqlite_path{"parley.db"};

  LlamaEngineConfig models;

  std::string log_format{"text"};
  std::string log_level{"info"};
  std::string audit_log_path;
  bool audit_debug{false};

  HttpServer::TlsConfig tls;
};

// Reads the YAML file at `path`. A missing file yields the defaults; a parse
// error is logged and the keys read before it are kept.
ServerConfig LoadServerConfig(const std::string& path);

// Applies PARLEY_* environment variables on top of `config`. Malformed
// numeric values are logged and ignored.
void ApplyEnvOverrides(ServerConfig* config);

// Fills in a random per-process secret when none is configured. Tokens
// issued with it do not survive a restart. Returns true if one was generated.
bool EnsureSecretKey(ServerConfig* config);

}  // namespace parley
