#ifndef DOCUMENT_STACK_CONFIG_HPP
#define DOCUMENT_STACK_CONFIG_HPP

#include <string>

#include "../http/model/model.hpp"

namespace documentstack::api {

    struct Config {
        std::string api_key_;   // Bearer token, required
        std::string base_url_;  // default constants::DEFAULT_BASE_URL
        int timeout_s_ = 0;     // <= 0 means constants::DEFAULT_TIMEOUT_S
        http::model::HeaderMap headers_;  // sent with every request, may override the defaults
        bool debug_ = false;
    };

    // Applies defaults and strips one trailing '/' from the base URL.
    // Throws DocumentStackError (CONFIGURATION) when the API key is empty.
    Config resolve_config(Config config);

}  // namespace documentstack::api

#endif
