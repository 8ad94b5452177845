/**
 * @file csrf_protector_example.cpp
 * @brief CSRF protection walkthrough - Issue, validate, replay and rotate
 *
 * CSRFGuard - Cross-Site Request Forgery protection engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates:
 * - Loading configuration (JSON file + CSRFGUARD_* environment)
 * - Issuing a token and accepting the matching POST
 * - Replay and missing-origin rejections
 * - Token rotation with an overlap window
 */

#include "csrfguard/csrf_protector.hpp"
#include "csrfguard/utilities.hpp"
#include <iostream>

using namespace csrfguard;

namespace {
    void print_result(const std::string& label, const std::pair<bool, ValidationInfo>& result) {
        std::cout << "  " << label << ": " << (result.first ? "ACCEPTED" : "REJECTED") << "\n";
        std::cout << "    " << result.second.to_json().dump() << "\n";
    }

    BasicRequest make_post(const nlohmann::json& session, const std::string& token) {
        BasicRequest request("POST", std::string("https://app.example.com"));
        request.session_record = session;
        request.form[security::TOKEN_FORM_FIELD] = token;
        return request;
    }
}

int main(int argc, char** argv) {
    utilities::initialize_logging_from_environment();

    security::ProtectorConfig config;
    if (argc >= 2) {
        auto loaded = security::load_config_file(argv[1]);
        if (!loaded) {
            std::cerr << "Error: Could not load configuration from " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
    }
    if (config.secret_key.empty()) {
        config.secret_key = "example-secret-change-me";
    }
    security::apply_environment_overrides(config);

    try {
        std::cout << "\n=== CSRFGuard Protector Example ===\n\n";

        CsrfProtector protector(config);
        std::cout << "Strategy: " << protector.active_strategy_name() << "\n\n";

        // Issue a token on the form-rendering GET
        BasicRequest page("GET", std::string("https://app.example.com"));
        GeneratedToken issued = protector.generate_token_full(page);
        std::cout << "Issued token metadata: " << issued.metadata.dump() << "\n\n";

        auto get_result = protector.validate_request(page);
        print_result("GET (safe method)", get_result);

        // Submit the form
        BasicRequest submit = make_post(page.session_record, issued.token);
        submit.cookies[security::TOKEN_COOKIE_NAME] = issued.token;
        print_result("POST with token", protector.validate_request(submit));

        // Replay the same submission
        print_result("POST replayed", protector.validate_request(submit));

        // Forged request without Origin
        BasicRequest forged("POST");
        forged.form[security::TOKEN_FORM_FIELD] = issued.token;
        print_result("POST without Origin", protector.validate_request(forged));

        // Rotate and submit again
        GeneratedToken rotated = protector.rotate_token(page);
        BasicRequest after_rotation = make_post(page.session_record, rotated.token);
        after_rotation.cookies[security::TOKEN_COOKIE_NAME] = rotated.token;
        print_result("POST with rotated token", protector.validate_request(after_rotation));

        std::cout << "\nReplay cache entries: " << protector.replay_cache_size() << "\n";
        std::cout << "\n=== Example Complete ===\n\n";

    } catch (const CsrfException& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
