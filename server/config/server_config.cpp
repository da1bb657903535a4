#include "server/config/server_config.h"

#include "server/logging/logger.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/rand.h>

namespace parley {
namespace {

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

bool ParseBool(const std::string& value) {
  auto lowered = ToLower(value);
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

template <typename T>
void Read(const YAML::Node& node, const char* key, T* out) {
  if (node && node[key]) {
    *out = node[key].as<T>();
  }
}

void EnvString(const char* name, std::string* out) {
  if (const char* value = std::getenv(name)) {
    *out = value;
  }
}

void EnvBool(const char* name, bool* out) {
  if (const char* value = std::getenv(name)) {
    *out = ParseBool(value);
  }
}

template <typename T>
void EnvInt(const char* name, T* out) {
  const char* value = std::getenv(name);
  if (!value) {
    return;
  }
  try {
    *out = static_cast<T>(std::stoll(value));
  } catch (const std::logic_error&) {
    log::Warn("config", "ignoring malformed integer override",
              std::string(name) + "=" + value);
  }
}

}  // namespace

ServerConfig LoadServerConfig(const std::string& path) {
  ServerConfig config;
  if (!std::filesystem::exists(path)) {
    log::Info("config", "no config file, using defaults", "path=" + path);
    return config;
  }
  try {
    YAML::Node root = YAML::LoadFile(path);

    if (auto server = root["server"]) {
      Read(server, "host", &config.host);
      Read(server, "http_port", &config.port);
      Read(server, "http_workers", &config.http_workers);
    }

    if (auto auth = root["auth"]) {
      Read(auth, "secret_key", &config.secret_key);
      Read(auth, "session_expiry_minutes", &config.session_expiry_minutes);
      Read(auth, "anonymous_user", &config.anonymous_user);
      Read(auth, "insecure_cookie", &config.insecure_cookie);
    }

    if (auto store = root["store"]) {
      Read(store, "backend", &config.store_backend);
      Read(store, "sqlite_path", &config.sqlite_path);
      if (auto redis = store["redis"]) {
        Read(redis, "host", &config.redis.host);
        Read(redis, "port", &config.redis.port);
        Read(redis, "password", &config.redis.password);
        Read(redis, "db", &config.redis.db);
        Read(redis, "pool_size", &config.redis.pool_size);
        if (redis["socket_timeout_ms"]) {
          config.redis.socket_timeout =
              std::chrono::milliseconds(redis["socket_timeout_ms"].as<long>());
        }
      }
    }

    if (auto models = root["models"]) {
      if (models["weights_dir"]) {
        config.models.weights_dir = models["weights_dir"].as<std::string>();
      }
      Read(models, "extension", &config.models.extension);
      Read(models, "batch_size", &config.models.batch_size);
      Read(models, "max_cached_models", &config.models.max_cached_models);
    }

    if (auto logging = root["logging"]) {
      Read(logging, "format", &config.log_format);
      Read(logging, "level", &config.log_level);
      Read(logging, "audit_log", &config.audit_log_path);
      Read(logging, "audit_debug", &config.audit_debug);
    }

    if (auto tls = root["tls"]) {
      Read(tls, "enabled", &config.tls.enabled);
      Read(tls, "cert_path", &config.tls.cert_path);
      Read(tls, "key_path", &config.tls.key_path);
    }
  } catch (const YAML::Exception& e) {
    log::Error("config", "failed to parse config file",
               "path=" + path + " error=" + e.what());
  }
  return config;
}

void ApplyEnvOverrides(ServerConfig* config) {
  EnvString("PARLEY_HOST", &config->host);
  EnvInt("PARLEY_PORT", &config->port);
  EnvInt("PARLEY_HTTP_WORKERS", &config->http_workers);

  EnvString("PARLEY_SECRET_KEY", &config->secret_key);
  EnvInt("PARLEY_SESSION_EXPIRY_MINUTES", &config->session_expiry_minutes);
  EnvString("PARLEY_ANONYMOUS_USER", &config->anonymous_user);
  EnvBool("PARLEY_INSECURE_COOKIE", &config->insecure_cookie);

  EnvString("PARLEY_STORE_BACKEND", &config->store_backend);
  EnvString("PARLEY_SQLITE_PATH", &config->sqlite_path);
  EnvString("PARLEY_REDIS_HOST", &config->redis.host);
  EnvInt("PARLEY_REDIS_PORT", &config->redis.port);
  EnvString("PARLEY_REDIS_PASSWORD", &config->redis.password);
  EnvInt("PARLEY_REDIS_DB", &config->redis.db);
  EnvInt("PARLEY_REDIS_POOL_SIZE", &config->redis.pool_size);

  std::string weights_dir;
  EnvString("PARLEY_WEIGHTS_DIR", &weights_dir);
  if (!weights_dir.empty()) {
    config->models.weights_dir = weights_dir;
  }
  EnvString("PARLEY_MODEL_EXTENSION", &config->models.extension);
  EnvInt("PARLEY_MAX_CACHED_MODELS", &config->models.max_cached_models);

  EnvString("PARLEY_LOG_FORMAT", &config->log_format);
  EnvString("PARLEY_LOG_LEVEL", &config->log_level);
  EnvString("PARLEY_AUDIT_LOG", &config->audit_log_path);
  EnvBool("PARLEY_AUDIT_DEBUG", &config->audit_debug);

  EnvBool("PARLEY_TLS_ENABLED", &config->tls.enabled);
  EnvString("PARLEY_TLS_CERT_PATH", &config->tls.cert_path);
  EnvString("PARLEY_TLS_KEY_PATH", &config->tls.key_path);

  config->store_backend = ToLower(config->store_backend);
  config->log_format = ToLower(config->log_format);
}

bool EnsureSecretKey(ServerConfig* config) {
  if (!config->secret_key.empty()) {
    return false;
  }
  unsigned char bytes[32];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw std::runtime_error("RAND_bytes failed while generating secret key");
  }
  std::ostringstream hex;
  for (unsigned char b : bytes) {
    hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  }
  config->secret_key = hex.str();
  log::Warn("config",
            "no secret key configured; generated a per-process key, sessions "
            "will not survive a restart");
  return true;
}

}  // namespace parley
