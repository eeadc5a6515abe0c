#include "documentstack.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../../api/config.hpp"
#include "../../api/errors.hpp"
#include "../../api/types.hpp"
#include "../../api/value.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"
#include "../model/model.hpp"

using namespace simdjson;

namespace documentstack::http::provider {
    struct DocumentStackOptions {
        static constexpr const char* GENERATE_PATH = "/api/v1/generate/";
        static constexpr const char* JSON_CONTENT_TYPE = "application/json";
        static constexpr const char* UNKNOWN_ERROR_CODE = "Unknown Error";
    };

    namespace {
        api::Value to_value(ondemand::value& v) {
            const ondemand::json_type type = v.type();
            switch (type) {
                case ondemand::json_type::object: {
                    api::Object out;
                    for (ondemand::field field : v.get_object()) {
                        const std::string_view key = field.unescaped_key();
                        out[std::string(key)] = to_value(field.value());
                    }
                    return out;
                }
                case ondemand::json_type::array: {
                    api::Array out;
                    for (ondemand::value item : v.get_array()) {
                        out.push_back(to_value(item));
                    }
                    return out;
                }
                case ondemand::json_type::number: {
                    ondemand::number num = v.get_number();
                    if (num.is_int64()) {
                        return num.get_int64();
                    }
                    return num.as_double();
                }
                case ondemand::json_type::string:
                    return std::string(std::string_view(v.get_string()));
                case ondemand::json_type::boolean:
                    return bool(v.get_bool());
                case ondemand::json_type::null:
                    return nullptr;
                default:
                    throw simdjson_error(INCORRECT_TYPE);
            }
        }

        // A JSON null leaves the field empty; any other non-string is a decode failure.
        std::string string_or_empty(ondemand::value& v) {
            if (v.is_null()) {
                return {};
            }
            return std::string(std::string_view(v.get_string()));
        }

        std::int64_t header_integer(const http::model::Response& resp, const char* name) {
            const auto raw = resp.header(name);
            if (!raw) {
                return 0;
            }
            return string_utils::parse_integer(*raw).value_or(0);
        }
    }  // namespace

    DocumentStackProvider::DocumentStackProvider(const api::Config& config)
        : base_url_(config.base_url_), api_key_(config.api_key_), headers_(config.headers_) {}

    http::model::Request DocumentStackProvider::build_generate(const std::string& template_id, const api::GenerateRequest& req) const {
        http::model::Request r;
        r.url_ = base_url_ + DocumentStackOptions::GENERATE_PATH + string_utils::escape_path_segment(template_id);
        r.method_ = "POST";

        try {
            r.body_ = encode_generate_body(req);
        } catch (const nlohmann::json::exception& e) {
            throw api::DocumentStackError(api::NetworkError{.message_ = "failed to marshal request body", .cause_ = e.what()});
        } catch (const std::invalid_argument& e) {
            throw api::DocumentStackError(api::NetworkError{.message_ = "failed to marshal request body", .cause_ = e.what()});
        }

        r.headers_[HeaderKeys::CONTENT_TYPE] = DocumentStackOptions::JSON_CONTENT_TYPE;
        r.headers_[HeaderKeys::AUTHORIZATION] = "Bearer " + api_key_;
        for (const auto& [name, value] : headers_) {
            r.headers_[name] = value;
        }

        return r;
    }

    api::GenerateResponse DocumentStackProvider::parse_generate(const http::model::Response& resp) const {
        api::GenerateResponse out{};
        out.pdf_.assign(resp.body_.begin(), resp.body_.end());
        out.filename_ = parse_filename(resp.header(HeaderKeys::CONTENT_DISPOSITION).value_or(""));
        out.generation_time_ms_ = header_integer(resp, HeaderKeys::GENERATION_TIME_MS);
        out.content_length_ = header_integer(resp, HeaderKeys::CONTENT_LENGTH);

        if (out.content_length_ == 0) {
            out.content_length_ = static_cast<std::int64_t>(out.pdf_.size());
        }

        return out;
    }

    std::string encode_generate_body(const api::GenerateRequest& req) {
        nlohmann::json j = nlohmann::json::object();

        if (!req.data_.empty()) {
            nlohmann::json data = nlohmann::json::object();
            for (const auto& [key, value] : req.data_) {
                data[key] = nlohmann::json(value);
            }
            j["data"] = std::move(data);
        }

        if (req.options_) {
            nlohmann::json options = nlohmann::json::object();
            if (!req.options_->filename_.empty()) {
                options["filename"] = req.options_->filename_;
            }
            j["options"] = std::move(options);
        }

        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

    std::optional<api::ApiErrorBody> decode_error_body(const std::string& body) {
        try {
            ondemand::parser parser;
            padded_string json(body);
            ondemand::document doc = parser.iterate(json);

            api::ApiErrorBody out;
            for (ondemand::field field : doc.get_object()) {
                const std::string_view key = field.unescaped_key();
                ondemand::value& value = field.value();
                if (key == "error") {
                    out.error_ = string_or_empty(value);
                } else if (key == "message") {
                    out.message_ = string_or_empty(value);
                } else if (key == "details") {
                    api::Value details = to_value(value);
                    out.details_ = details.is_null() ? std::nullopt : std::optional<api::Value>(std::move(details));
                }
            }

            if (!doc.at_end()) {
                return std::nullopt;
            }
            return out;
        } catch (const simdjson_error&) {
            return std::nullopt;
        }
    }

    std::string parse_filename(std::string_view content_disposition) {
        static const std::regex FILENAME_PATTERN(R"re(filename="?([^";\n]+)"?)re");

        std::match_results<std::string_view::const_iterator> m;
        if (std::regex_search(content_disposition.begin(), content_disposition.end(), m, FILENAME_PATTERN) && m[1].matched) {
            return m[1].str();
        }
        return constants::DEFAULT_FILENAME;
    }

    api::DocumentStackError classify_error_response(const http::model::Response& resp) {
        api::ApiErrorBody body = decode_error_body(resp.body_).value_or(api::ApiErrorBody{
            .error_ = DocumentStackOptions::UNKNOWN_ERROR_CODE,
            .message_ = resp.status_line_,
        });

        api::ApiError err{
            .status_code_ = resp.status_,
            .error_code_ = std::move(body.error_),
            .message_ = std::move(body.message_),
            .details_ = std::move(body.details_),
        };

        if (api::is_rate_limit_error(resp.status_)) {
            int retry_after = 0;
            if (const auto raw = resp.header(HeaderKeys::RETRY_AFTER)) {
                const auto parsed = string_utils::parse_integer(*raw);
                if (parsed && *parsed >= std::numeric_limits<int>::min() && *parsed <= std::numeric_limits<int>::max()) {
                    retry_after = static_cast<int>(*parsed);
                }
            }
            return api::DocumentStackError(api::RateLimitError{.api_ = std::move(err), .retry_after_s_ = retry_after});
        }

        return api::DocumentStackError(std::move(err));
    }
}  // namespace documentstack::http::provider
