#include "seedvault/bindings/http.hpp"
#include "seedvault/core/clock.hpp"
#include "seedvault/core/log.hpp"
#include "seedvault/security/fingerprint.hpp"

#include <nlohmann/json.hpp>

namespace seedvault::bindings::http {

using namespace seedvault::core;
using json = nlohmann::json;

namespace {
    void respond(HttpResponse* out, u16 status, const json& body) {
        out->status = status;
        out->body = body.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    void respond_error(HttpResponse* out, u16 status, const char* message) {
        respond(out, status, json{{"error", message}});
    }

    void respond_locked(HttpResponse* out, Status s) {
        respond(out, 423, json{
            {"error", "Account is locked due to too many failed attempts"},
            {"remainingSeconds", s.aux},
        });
    }

    bool ascii_iequal(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            char x = a[i];
            char y = b[i];
            if (x >= 'A' && x <= 'Z') x = static_cast<char>(x - 'A' + 'a');
            if (y >= 'A' && y <= 'Z') y = static_cast<char>(y - 'A' + 'a');
            if (x != y) {
                return false;
            }
        }
        return true;
    }

    // Parses a JSON object body into out; false (400 already set) otherwise.
    bool parse_body(const HttpRequest& req, HttpResponse* out, json* body) {
        *body = json::parse(req.body.begin(), req.body.end(), nullptr, false);
        if (body->is_discarded() || !body->is_object()) {
            respond_error(out, 400, "Malformed JSON body");
            return false;
        }
        return true;
    }

    // Non-empty string field, or nullptr.
    const std::string* string_field(const json& j, const char* key) {
        const auto it = j.find(key);
        if (it == j.end() || !it->is_string()) {
            return nullptr;
        }
        const std::string* s = it->get_ptr<const std::string*>();
        return s->empty() ? nullptr : s;
    }

    std::string request_origin(const HttpRequest& req) {
        return seedvault::security::origin_fingerprint(req.remote_addr);
    }

    json user_json(const seedvault::vault::AccountView& a) {
        return json{{"id", a.id.v}, {"email", a.email}};
    }

    // Bearer token to account; on failure the response is already written.
    Status require_account(seedvault::vault::VaultService& service, const HttpRequest& req, HttpResponse* out, AccountId* account) {
        constexpr std::string_view kBearer = "Bearer ";
        const std::string_view auth = find_header(req, "Authorization");
        if (auth.size() <= kBearer.size() || !ascii_iequal(auth.substr(0, kBearer.size()), kBearer)) {
            respond_error(out, 401, "Access token required");
            return make_status(StatusDomain::Bindings, StatusCode::Authentication);
        }

        const Status s = service.authenticate(auth.substr(kBearer.size()), account);
        if (s.code == StatusCode::Locked) {
            respond_locked(out, s);
        } else if (s.code == StatusCode::Authentication) {
            respond_error(out, 401, "Invalid token");
        } else if (!is_ok(s)) {
            respond_error(out, http_status_for(s), "Authentication failed");
        }
        return s;
    }

    Status handle_health(seedvault::vault::VaultService& service, HttpResponse* out) {
        respond(out, 200, json{{"status", "OK"}, {"timestamp", format_iso8601(service.clock().now_ms())}});
        return ok_status();
    }

    Status handle_register(seedvault::vault::VaultService& service, const HttpRequest& req, HttpResponse* out) {
        json body;
        if (!parse_body(req, out, &body)) {
            return make_status(StatusDomain::Bindings, StatusCode::Invalid);
        }
        const std::string* email = string_field(body, "email");
        const std::string* password = string_field(body, "password");
        if (email == nullptr || password == nullptr) {
            respond_error(out, 400, "Valid email and password required");
            return make_status(StatusDomain::Bindings, StatusCode::Invalid);
        }

        seedvault::vault::AccountView account;
        const Status s = service.register_account(*email, *password, request_origin(req), &account);
        if (s.code == StatusCode::Conflict) {
            respond_error(out, 409, "User already exists");
            return s;
        }
        if (s.code == StatusCode::Invalid) {
            respond_error(out, 400, "Valid email and a password of at least 8 characters required");
            return s;
        }
        if (!is_ok(s)) {
            respond_error(out, http_status_for(s), "Registration failed");
            return s;
        }

        respond(out, 201, json{{"message", "User registered successfully"}, {"user", user_json(account)}});
        return s;
    }

    Status handle_login(seedvault::vault::VaultService& service, const HttpRequest& req, HttpResponse* out) {
        json body;
        if (!parse_body(req, out, &body)) {
            return make_status(StatusDomain::Bindings, StatusCode::Invalid);
        }
        const std::string* email = string_field(body, "email");
        const std::string* password = string_field(body, "password");
        if (email == nullptr || password == nullptr) {
            respond_error(out, 400, "Email and password required");
            return make_status(StatusDomain::Bindings, StatusCode::Invalid);
        }

        seedvault::vault::LoginResult result;
        const Status s = service.login(*email, *password, request_origin(req), &result);
        if (s.code == StatusCode::Locked) {
            respond_locked(out, s);
            return s;
        }
        if (s.code == StatusCode::Authentication) {
            respond_error(out, 401, "Invalid credentials");
            return s;
        }
        if (s.code == StatusCode::Busy) {
            respond_error(out, 429, "Too many login attempts in progress");
            return s;
        }
        if (s.code == StatusCode::Invalid) {
            respond_error(out, 400, "Valid email required");
            return s;
        }
        if (!is_ok(s)) {
            respond_error(out, http_status_for(s), "Login failed");
            return s;
        }

        respond(out, 200, json{
            {"message", "Login successful"},
            {"token", result.token},
            {"user", user_json(result.account)},
        });
        return s;
    }

    Status handle_vault_put(seedvault::vault::VaultService& service, const HttpRequest& req, HttpResponse* out) {
        AccountId account{};
        Status s = require_account(service, req, out, &account);
        if (!is_ok(s)) {
            return s;
        }
        json body;
        if (!parse_body(req, out, &body)) {
            return make_status(StatusDomain::Bindings, StatusCode::Invalid);
        }
        const std::string* data = string_field(body, "encryptedData");
        const std::string* salt = string_field(body, "clientSalt");
        if (data == nullptr || salt == nullptr) {
            respond_error(out, 400, "Encrypted data and client salt required");
            return make_status(StatusDomain::Bindings, StatusCode::Invalid);
        }

        Timestamp updated_at = 0;
        s = service.put_vault(account, *data, *salt, request_origin(req), &updated_at);
        if (s.code == StatusCode::Invalid) {
            respond_error(out, 400, "Encrypted data and client salt must be base64");
            return s;
        }
        if (!is_ok(s)) {
            respond_error(out, http_status_for(s), "Failed to save vault");
            return s;
        }

        respond(out, 200, json{{"message", "Vault saved successfully"}, {"updatedAt", format_iso8601(updated_at)}});
        return s;
    }

    Status handle_vault_get(seedvault::vault::VaultService& service, const HttpRequest& req, HttpResponse* out, bool is_export) {
        AccountId account{};
        Status s = require_account(service, req, out, &account);
        if (!is_ok(s)) {
            return s;
        }

        seedvault::vault::VaultView view;
        s = is_export ? service.export_vault(account, request_origin(req), &view)
                      : service.get_vault(account, request_origin(req), &view);
        if (s.code == StatusCode::NotFound) {
            respond(out, 200, json{{"message", "No vault found"}, {"encryptedData", nullptr}});
            return s;
        }
        if (s.code == StatusCode::Unavailable) {
            respond(out, 200, json{{"message", "No vault available"}, {"encryptedData", nullptr}});
            return s;
        }
        if (!is_ok(s)) {
            respond_error(out, http_status_for(s), "Failed to retrieve vault");
            return s;
        }

        if (is_export) {
            respond(out, 200, json{
                {"version", view.version},
                {"timestamp", format_iso8601(service.clock().now_ms())},
                {"clientSalt", view.client_salt},
                {"encryptedData", view.encrypted_data},
            });
        } else {
            respond(out, 200, json{
                {"encryptedData", view.encrypted_data},
                {"clientSalt", view.client_salt},
                {"version", view.version},
                {"updatedAt", format_iso8601(view.updated_at)},
                {"lastAccessed", format_iso8601(view.last_accessed)},
            });
        }
        return s;
    }

    Status handle_vault_delete(seedvault::vault::VaultService& service, const HttpRequest& req, HttpResponse* out) {
        AccountId account{};
        Status s = require_account(service, req, out, &account);
        if (!is_ok(s)) {
            return s;
        }

        s = service.delete_vault(account, request_origin(req));
        if (s.code == StatusCode::NotFound) {
            respond_error(out, 404, "Vault not found");
            return s;
        }
        if (!is_ok(s)) {
            respond_error(out, http_status_for(s), "Failed to delete vault");
            return s;
        }
        respond(out, 200, json{{"message", "Vault deleted successfully"}});
        return s;
    }
}

u16 http_status_for(Status s) noexcept {
    switch (s.code) {
        case StatusCode::Ok: return 200;
        case StatusCode::Invalid: return 400;
        case StatusCode::Authentication: return 401;
        case StatusCode::NotFound: return 404;
        case StatusCode::Conflict: return 409;
        case StatusCode::Locked: return 423;
        case StatusCode::Transport:
        case StatusCode::Unavailable:
        case StatusCode::Busy: return 503;
        default: return 500;
    }
}

std::string_view find_header(const HttpRequest& req, std::string_view name) noexcept {
    if (req.headers == nullptr) {
        return {};
    }
    for (u32 i = 0; i < req.header_count; ++i) {
        if (ascii_iequal(req.headers[i].name, name)) {
            return req.headers[i].value;
        }
    }
    return {};
}

Status handle_http_request(seedvault::vault::VaultService& service, const HttpRequest& req, HttpResponse* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }
    out->status = 500;
    out->body.clear();

    if (req.body.size() > kMaxBodyBytes) {
        respond_error(out, 413, "Request body too large");
        return make_status(StatusDomain::Bindings, StatusCode::Invalid);
    }

    // Query strings do not select routes.
    std::string_view path = req.path;
    if (const std::size_t q = path.find('?'); q != std::string_view::npos) {
        path = path.substr(0, q);
    }
    if (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }

    const std::string_view m = req.method;
    Status s = make_status(StatusDomain::Bindings, StatusCode::Unsupported);
    bool routed = true;

    if (path == "/health") {
        if (m == "GET") return handle_health(service, out);
    } else if (path == "/auth/register") {
        if (m == "POST") return handle_register(service, req, out);
    } else if (path == "/auth/login") {
        if (m == "POST") return handle_login(service, req, out);
    } else if (path == "/vault") {
        if (m == "GET") return handle_vault_get(service, req, out, false);
        if (m == "POST") return handle_vault_put(service, req, out);
        if (m == "DELETE") return handle_vault_delete(service, req, out);
    } else if (path == "/vault/export") {
        if (m == "GET") return handle_vault_get(service, req, out, true);
    } else {
        routed = false;
    }

    if (!routed) {
        respond_error(out, 404, "Route not found");
        return make_status(StatusDomain::Bindings, StatusCode::NotFound);
    }
    log_write(LogLevel::Debug, "method not allowed on known route");
    respond_error(out, 405, "Method not allowed");
    return s;
}

} // namespace seedvault::bindings::http
