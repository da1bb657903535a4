#include <catch2/catch_all.hpp>

#include "server/http/http_request.h"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

using parley::HttpRequest;

TEST_CASE("ParseRequestHead splits method, path, query and headers", "[http]") {
  HttpRequest req;
  REQUIRE(parley::ParseRequestHead(
      "GET /api/chat/abc/question?prompt=hello+there%21&x=1 HTTP/1.1\r\n"
      "Host: localhost\r\n"
      "Cookie: theme=dark; token=\"abc.def.ghi\"\r\n"
      "Content-Length:  12 ",
      &req));
  REQUIRE(req.method == "GET");
  REQUIRE(req.path == "/api/chat/abc/question");
  REQUIRE(req.query["prompt"] == "hello there!");
  REQUIRE(req.query["x"] == "1");
  REQUIRE(parley::GetHeaderValue(req, "HOST") == "localhost");
  REQUIRE(parley::GetHeaderValue(req, "content-length") == "12");
  REQUIRE(parley::GetHeaderValue(req, "missing").empty());
  REQUIRE(parley::GetCookie(req, "token") == std::string("abc.def.ghi"));
  REQUIRE(parley::GetCookie(req, "theme") == std::string("dark"));
  REQUIRE_FALSE(parley::GetCookie(req, "session"));
}

TEST_CASE("ParseRequestHead rejects malformed request lines", "[http]") {
  HttpRequest req;
  REQUIRE_FALSE(parley::ParseRequestHead("", &req));
  REQUIRE_FALSE(parley::ParseRequestHead("GET", &req));
  REQUIRE_FALSE(parley::ParseRequestHead("GET /x", &req));
  REQUIRE_FALSE(parley::ParseRequestHead("GET x HTTP/1.1", &req));
}

TEST_CASE("Path plus signs are literal, query plus signs are spaces", "[http]") {
  REQUIRE(parley::UrlDecode("a+b%20c", false) == "a+b c");
  REQUIRE(parley::UrlDecode("a+b%20c") == "a b c");
  REQUIRE(parley::UrlDecode("100%") == "100%");
  REQUIRE(parley::UrlDecode("%zz") == "%zz");
}

TEST_CASE("Form bodies decode like query strings", "[http]") {
  auto form = parley::ParseQueryString("username=alice&password=p%40ss+word&flag");
  REQUIRE(form["username"] == "alice");
  REQUIRE(form["password"] == "p@ss word");
  REQUIRE(form.count("flag") == 1);
  REQUIRE(form["flag"].empty());
  REQUIRE(parley::ParseQueryString("").empty());
}

TEST_CASE("Access token comes from the cookie, then the bearer header", "[http]") {
  HttpRequest req;
  REQUIRE_FALSE(parley::ExtractAccessToken(req));

  req.headers["authorization"] = "Bearer header-token";
  REQUIRE(parley::ExtractAccessToken(req) == std::string("header-token"));

  req.headers["cookie"] = "token=cookie-token";
  REQUIRE(parley::ExtractAccessToken(req) == std::string("cookie-token"));

  req.headers["cookie"] = "token=";
  REQUIRE(parley::ExtractAccessToken(req) == std::string("header-token"));

  req.headers["authorization"] = "Basic abc";
  REQUIRE_FALSE(parley::ExtractAccessToken(req));
}

TEST_CASE("SplitPath drops empty segments", "[http]") {
  REQUIRE(parley::SplitPath("/api/chat/") == std::vector<std::string>{"api", "chat"});
  REQUIRE(parley::SplitPath("//api//user") == std::vector<std::string>{"api", "user"});
  REQUIRE(parley::SplitPath("/").empty());
}

TEST_CASE("BuildResponse frames a JSON body", "[http]") {
  std::string res = parley::BuildResponse("{\"a\":1}", 404, "X-Test: 1\r\n");
  REQUIRE(res.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
  REQUIRE(res.find("Content-Type: application/json\r\n") != std::string::npos);
  REQUIRE(res.find("X-Test: 1\r\n") != std::string::npos);
  REQUIRE(res.find("Content-Length: 7\r\n\r\n{\"a\":1}") != std::string::npos);

  auto body = nlohmann::json::parse(parley::BuildErrorBody("Chat does not exist"));
  REQUIRE(body["detail"] == "Chat does not exist");
}

TEST_CASE("SSE events carry one data line per payload line", "[http]") {
  REQUIRE(parley::BuildSseEvent("message", "Hello") == "event: message\r\ndata: Hello\r\n\r\n");
  REQUIRE(parley::BuildSseEvent("message", "a\nb") ==
          "event: message\r\ndata: a\r\ndata: b\r\n\r\n");
  REQUIRE(parley::BuildSseEvent("close", "") == "event: close\r\ndata: \r\n\r\n");
}

TEST_CASE("Session cookie attributes", "[http]") {
  std::string set = parley::BuildSessionCookie("abc", 3600, true);
  REQUIRE(set.rfind("Set-Cookie: token=abc; HttpOnly; Path=/; Secure; SameSite=Strict", 0) == 0);
  REQUIRE(set.find("Max-Age=3600") != std::string::npos);
  REQUIRE(set.find("Expires") == std::string::npos);

  std::string clear = parley::BuildSessionCookie("", 0, false);
  REQUIRE(clear.find("token=;") != std::string::npos);
  REQUIRE(clear.find("Secure") == std::string::npos);
  REQUIRE(clear.find("Max-Age=0") != std::string::npos);
  REQUIRE(clear.find("Expires=Thu, 01 Jan 1970") != std::string::npos);
  REQUIRE(clear.substr(clear.size() - 2) == "\r\n");
}

TEST_CASE("Service errors map to HTTP statuses", "[http]") {
  using parley::ErrorCode;
  REQUIRE(parley::HttpStatusFor(ErrorCode::kInvalidCredential) == 401);
  REQUIRE(parley::HttpStatusFor(ErrorCode::kUnauthorized) == 401);
  REQUIRE(parley::HttpStatusFor(ErrorCode::kNotFound) == 404);
  REQUIRE(parley::HttpStatusFor(ErrorCode::kModelUnavailable) == 400);
  REQUIRE(parley::HttpStatusFor(ErrorCode::kBadRequest) == 400);
  REQUIRE(parley::HttpStatusFor(ErrorCode::kConflict) == 409);
  REQUIRE(parley::HttpStatusFor(ErrorCode::kGenerationFailure) == 500);
  REQUIRE(std::string(parley::StatusText(202)) == "Accepted");
}

namespace {

parley::ErrorCode ParseCode(const std::map<std::string, std::string> &query) {
  try {
    parley::ParseChatParameters(query);
  } catch (const parley::ServiceError &e) {
    return e.code();
  }
  FAIL("expected ServiceError");
  return parley::ErrorCode::kGenerationFailure;
}

} // namespace

TEST_CASE("Create-chat parameters keep defaults and parse overrides",
          "[http]") {
  auto defaults = parley::ParseChatParameters({});
  REQUIRE(defaults.model_path == "7B");
  REQUIRE(defaults.n_ctx == 2048);
  REQUIRE_FALSE(defaults.n_gpu_layers.has_value());

  auto params = parley::ParseChatParameters(
      {{"model", "13B"}, {"temperature", "0.7"}, {"context_window", "4096"},
       {"gpu_layers", "null"}, {"n_threads", "8"}});
  REQUIRE(params.model_path == "13B");
  REQUIRE(params.temperature == Catch::Approx(0.7));
  REQUIRE(params.n_ctx == 4096);
  REQUIRE_FALSE(params.n_gpu_layers.has_value());
  REQUIRE(params.n_threads == 8);

  REQUIRE(parley::ParseChatParameters({{"gpu_layers", "35"}}).n_gpu_layers ==
          35);
}

TEST_CASE("Create-chat sizes are bounded", "[http]") {
  using parley::ChatParameters;
  using parley::ErrorCode;
  REQUIRE(ParseCode({{"context_window", "2147483647"}}) ==
          ErrorCode::kBadRequest);
  REQUIRE(ParseCode({{"max_length", "2147483647"}}) == ErrorCode::kBadRequest);
  REQUIRE(ParseCode({{"n_threads", "100000"}}) == ErrorCode::kBadRequest);
  REQUIRE(ParseCode({{"context_window", "0"}}) == ErrorCode::kBadRequest);
  REQUIRE(ParseCode({{"context_window", "99999999999"}}) ==
          ErrorCode::kBadRequest);
  REQUIRE(ParseCode({{"top_k", "5x"}}) == ErrorCode::kBadRequest);
  REQUIRE(ParseCode({{"model", ""}}) == ErrorCode::kBadRequest);

  auto at_limit = parley::ParseChatParameters(
      {{"context_window", std::to_string(ChatParameters::kMaxContextWindow)},
       {"max_length", std::to_string(ChatParameters::kMaxTokens)},
       {"n_threads", std::to_string(ChatParameters::kMaxThreads)}});
  REQUIRE(at_limit.n_ctx == ChatParameters::kMaxContextWindow);
  REQUIRE(at_limit.max_tokens == ChatParameters::kMaxTokens);
  REQUIRE(at_limit.n_threads == ChatParameters::kMaxThreads);
}
