#include "config.hpp"

#include <string>
#include <utility>

#include "../utils/constants.hpp"
#include "../utils/string_utils.hpp"
#include "errors.hpp"

namespace documentstack::api {

    Config resolve_config(Config config) {
        if (config.api_key_.empty()) {
            throw make_configuration_error("API key is required");
        }

        if (config.base_url_.empty()) {
            config.base_url_ = constants::DEFAULT_BASE_URL;
        }
        config.base_url_ = string_utils::strip_trailing_slash(std::move(config.base_url_));

        if (config.timeout_s_ <= 0) {
            config.timeout_s_ = constants::DEFAULT_TIMEOUT_S;
        }

        return config;
    }

}  // namespace documentstack::api
