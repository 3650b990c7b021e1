/**
 * @file http_transport.cpp
 * @brief curl-backed HTTP transport
 * @date 2025
 */

#include "overseer/api/http_transport.hpp"
#include "overseer/utils/process_utils.hpp"
#include "overseer/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <sstream>
#include <cctype>

namespace overseer {
namespace api {

namespace {

// Quote a value for a curl config file line
std::string QuoteConfigValue(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('"');
    for (char c : value) {
        switch (c) {
            case '\\': quoted += "\\\\"; break;
            case '"':  quoted += "\\\""; break;
            case '\n': quoted += "\\n"; break;
            case '\r': quoted += "\\r"; break;
            case '\t': quoted += "\\t"; break;
            default:   quoted.push_back(c); break;
        }
    }
    quoted.push_back('"');
    return quoted;
}

} // anonymous namespace

bool IsTransientStatus(int status) {
    return status == 0 || status == 429 || status >= 500;
}

CurlTransport::CurlTransport(std::string curl_binary)
    : curl_binary_(std::move(curl_binary)) {
}

std::string CurlTransport::BuildCurlConfig(const HttpRequest& request) {
    std::ostringstream config;
    config << "silent\n";
    config << "show-error\n";
    config << "url = " << QuoteConfigValue(request.url) << "\n";
    config << "request = " << QuoteConfigValue(request.method) << "\n";
    config << "max-time = " << request.timeout.count() << "\n";
    
    for (const auto& [name, value] : request.headers) {
        config << "header = " << QuoteConfigValue(name + ": " + value) << "\n";
    }
    
    if (request.body) {
        // data-raw never treats a leading '@' as a file reference
        config << "data-raw = " << QuoteConfigValue(*request.body) << "\n";
    }
    
    config << "write-out = " << QuoteConfigValue("\n%{http_code}") << "\n";
    return config.str();
}

HttpResponse CurlTransport::ParseCurlOutput(const std::string& output) {
    HttpResponse response;
    
    auto newline = output.find_last_of('\n');
    std::string status_text = newline == std::string::npos ? output : output.substr(newline + 1);
    status_text = utils::StringUtils::Trim(status_text);
    
    bool numeric = !status_text.empty();
    for (char c : status_text) {
        numeric = numeric && std::isdigit(static_cast<unsigned char>(c));
    }
    if (!numeric) {
        response.error = "curl output carries no status line";
        return response;
    }
    
    response.status = std::stoi(status_text);
    response.body = newline == std::string::npos ? std::string() : output.substr(0, newline);
    if (response.status == 0) {
        response.error = "no HTTP response";
    }
    return response;
}

HttpResponse CurlTransport::Send(const HttpRequest& request) {
    utils::ProcessOptions options;
    options.argv = {curl_binary_, "--config", "-"};
    options.stdin_data = BuildCurlConfig(request);
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(
        request.timeout + std::chrono::seconds(5));
    
    spdlog::debug("HTTP {} {}", request.method, request.url);
    auto result = utils::RunProcess(options);
    
    if (!result.started) {
        HttpResponse response;
        response.error = fmt::format("cannot run {}: {}", curl_binary_, result.error);
        return response;
    }
    if (!result.Succeeded()) {
        HttpResponse response;
        response.error = fmt::format("curl {} ({})", utils::DescribeTermination(result),
                                     utils::StringUtils::Trim(result.stderr_output));
        return response;
    }
    
    auto response = ParseCurlOutput(result.stdout_output);
    spdlog::debug("HTTP {} {} -> {}", request.method, request.url, response.status);
    return response;
}

} // namespace api
} // namespace overseer
