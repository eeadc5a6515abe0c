#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "src/api/client.hpp"
#include "src/api/config.hpp"
#include "src/api/errors.hpp"
#include "src/api/types.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/context/call_context.hpp"
#include "src/utils/string_utils.hpp"

using namespace documentstack;

namespace {
    const char* env_or_empty(const char* name) {
        const char* v = std::getenv(name);
        return v != nullptr ? v : "";
    }

    // "true"/"false"/"null", integers and decimals keep their JSON kind; anything else is a string.
    api::Value parse_cli_value(const std::string& raw) {
        if (raw == "true") {
            return true;
        }
        if (raw == "false") {
            return false;
        }
        if (raw == "null") {
            return nullptr;
        }
        if (const auto i = string_utils::parse_integer(raw)) {
            return *i;
        }
        if (!raw.empty()) {
            char* end = nullptr;
            const double d = std::strtod(raw.c_str(), &end);
            if (end != nullptr && *end == '\0') {
                return d;
            }
        }
        return raw;
    }

    void usage(const char* argv0) {
        std::cerr << "usage: " << argv0 << " <template-id> [-o output.pdf] [--filename name] [key=value ...]\n"
                  << "env: DOCUMENTSTACK_API_KEY (required), DOCUMENTSTACK_BASE_URL, DOCUMENTSTACK_DEBUG=1\n";
    }
}  // namespace

int main(int argc, char** argv) {
    try {
        //
        // Collect
        //

        if (argc < 2) {
            usage(argv[0]);
            return 1;
        }

        const std::string template_id = argv[1];
        std::string output_path;
        api::GenerateRequest request;

        for (int i = 2; i < argc; ++i) {
            const std::string_view arg = argv[i];
            if (arg == "-o" && i + 1 < argc) {
                output_path = argv[++i];
            } else if (arg == "--filename" && i + 1 < argc) {
                request.options_ = api::GenerateOptions{.filename_ = argv[++i]};
            } else if (const auto eq = arg.find('='); eq != std::string_view::npos && eq > 0) {
                request.data_[std::string(arg.substr(0, eq))] = parse_cli_value(std::string(arg.substr(eq + 1)));
            } else {
                usage(argv[0]);
                return 1;
            }
        }

        const std::string debug_flag = env_or_empty("DOCUMENTSTACK_DEBUG");

        api::Config config{
            .api_key_ = env_or_empty("DOCUMENTSTACK_API_KEY"),
            .base_url_ = env_or_empty("DOCUMENTSTACK_BASE_URL"),
            .debug_ = !debug_flag.empty() && debug_flag != "0",
        };

        if (config.api_key_.empty()) {
            std::cout << "DOCUMENTSTACK_API_KEY not set" << std::endl;
            return 1;
        }

        //
        // Generate
        //

        http::client::CurlGlobal curl_global;
        const api::Client client(std::move(config));

        const api::GenerateResponse result = client.generate(http::context::CallContext::background(), template_id, request);

        if (output_path.empty()) {
            output_path = result.filename_;
        }

        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error("open failed: " + output_path);
        }
        std::copy(result.pdf_.begin(), result.pdf_.end(), std::ostreambuf_iterator<char>(out));
        out.flush();
        if (!out) {
            throw std::runtime_error("write failed: " + output_path);
        }

        std::cout << "Wrote " << result.content_length_ << " bytes to " << output_path << " (generated in " << result.generation_time_ms_ << "ms)\n";
    } catch (const api::DocumentStackError& e) {
        std::cerr << "DocumentStack " << api::to_string(e.kind()) << " error: " << e.what();
        if (const auto status = e.status_code()) {
            std::cerr << " (HTTP " << *status << ")";
        }
        if (const auto retry = e.retry_after()) {
            std::cerr << " (retry after " << *retry << "s)";
        }
        std::cerr << "\n";
        return e.status_code() ? 2 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
};
