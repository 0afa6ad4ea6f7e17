#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "api_admin.hpp"
#include "api_http.hpp"
#include "api_service.hpp"
#include "env_loader.hpp"

using bayestext::ClassifierService;
using bayestext::json;
using bayestext::send_error;
using bayestext::send_json;

int main(int argc, char** argv) {
    auto env_vars = bayestext::load_env_file(".env");

    ClassifierService service;
    service.model_path = bayestext::env_or(env_vars, "NB_MODEL_PATH", "model.json");
    if (argc >= 2) service.model_path = std::filesystem::path(argv[1]);

    int port = 8080;
    double smoothing = bayestext::DEFAULT_SMOOTHING;
    bayestext::AdminConfig admin;
    try {
        port = std::stoi(bayestext::env_or(env_vars, "PORT", "8080"));
        if (argc >= 3) port = std::stoi(argv[2]);
        smoothing = std::stod(bayestext::env_or(env_vars, "NB_SMOOTHING", "1.0"));
        admin.jwt_expiration = std::stoi(bayestext::env_or(env_vars, "JWT_EXPIRATION", "3600"));
    } catch (const std::exception& e) {
        std::cerr << "Invalid port or configuration value: " << e.what() << "\n"
                  << "Usage: nb_server [MODEL_JSON] [port]\n";
        return 1;
    }
    admin.password = bayestext::env_or(env_vars, "ADMIN_PASSWORD");
    admin.jwt_secret = bayestext::env_or(env_vars, "JWT_SECRET");

    try {
        service.smoothing = smoothing;
        service.reset();
    } catch (const std::invalid_argument& e) {
        std::cerr << "Invalid NB_SMOOTHING: " << e.what() << "\n";
        return 1;
    }

    if (!service.reload()) {
        std::cerr << "[server] no usable model at " << service.model_path
                  << ", starting untrained\n";
    }

    if (!admin.enabled()) {
        std::cerr << "[warning] Admin authentication not configured. Set ADMIN_PASSWORD and JWT_SECRET in .env file to enable training endpoints.\n";
    } else {
        std::cout << "[admin] Admin authentication enabled with JWT expiration: " << admin.jwt_expiration << "s\n";
    }

    httplib::Server svr;

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    svr.set_exception_handler(bayestext::send_exception);

    svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) {
        bayestext::enable_cors(res);
        res.status = 204;
    });

    svr.Get("/health", [&](const httplib::Request&, httplib::Response& res) {
        bayestext::enable_cors(res);
        send_json(res, service.health());
    });

    svr.Get("/api/labels", [&](const httplib::Request&, httplib::Response& res) {
        bayestext::enable_cors(res);
        send_json(res, service.labels());
    });

    svr.Get("/api/classify", [&](const httplib::Request& req, httplib::Response& res) {
        bayestext::enable_cors(res);
        if (!req.has_param("q")) {
            send_error(res, 400, "missing q param");
            return;
        }
        send_json(res, service.classify(req.get_param_value("q")));
    });

    svr.Post("/api/classify", [&](const httplib::Request& req, httplib::Response& res) {
        bayestext::enable_cors(res);
        json body = json::parse(req.body);
        if (!body.is_object() || !body.contains("text") || !body["text"].is_string()) {
            send_error(res, 400, "required: text");
            return;
        }
        send_json(res, service.classify(body["text"].get<std::string>()));
    });

    svr.Post("/api/admin/login", [&](const httplib::Request& req, httplib::Response& res) {
        bayestext::enable_cors(res);
        if (!admin.enabled()) {
            send_error(res, 503, "Admin authentication not configured");
            return;
        }

        json body = json::parse(req.body);
        if (!body.is_object() || body.value("password", "") != admin.password) {
            std::cerr << "[admin] failed login attempt\n";
            send_error(res, 401, "Invalid password");
            return;
        }

        json out;
        out["token"] = bayestext::generate_jwt_token(admin.jwt_secret, admin.jwt_expiration);
        out["expires_in"] = admin.jwt_expiration;
        send_json(res, out);
    });

    svr.Post("/api/documents", [&](const httplib::Request& req, httplib::Response& res) {
        bayestext::enable_cors(res);
        if (!bayestext::require_admin_auth(req, res, admin)) return;

        std::vector<std::pair<std::string, std::string>> docs;
        std::string error;
        if (!bayestext::parse_documents(json::parse(req.body), docs, error)) {
            send_error(res, 400, error);
            return;
        }
        send_json(res, service.add_documents(docs));
    });

    svr.Post("/api/train", [&](const httplib::Request& req, httplib::Response& res) {
        bayestext::enable_cors(res);
        if (!bayestext::require_admin_auth(req, res, admin)) return;
        send_json(res, service.train());
    });

    svr.Post("/api/reset", [&](const httplib::Request& req, httplib::Response& res) {
        bayestext::enable_cors(res);
        if (!bayestext::require_admin_auth(req, res, admin)) return;
        service.reset();
        send_json(res, service.health());
    });

    svr.Post("/api/reload", [&](const httplib::Request& req, httplib::Response& res) {
        bayestext::enable_cors(res);
        if (!bayestext::require_admin_auth(req, res, admin)) return;
        bool ok = service.reload();
        json j = service.health();
        j["reloaded"] = ok;
        send_json(res, j);
    });

    std::cout << "[server] API running on http://127.0.0.1:" << port << "\n";
    std::cout << "Try: /api/classify?q=salami+pancetta+beef+ribs\n";
    if (!svr.listen("0.0.0.0", port)) {
        std::cerr << "[server] failed to listen on port " << port << "\n";
        return 1;
    }
    return 0;
}
