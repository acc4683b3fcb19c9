// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "node_url.hpp"

#include <regex>
#include <sstream>
#include <stdexcept>

#include <gsl/narrow>

#include <stakeoracle/core/common/util.hpp>

namespace stakeoracle::rpc {

using namespace std;

static NodeUrl::Scheme parse_scheme(const string& scheme) {
    if (iequals(scheme, "ws")) return NodeUrl::Scheme::kWs;
    if (iequals(scheme, "wss")) return NodeUrl::Scheme::kWss;
    if (iequals(scheme, "http")) return NodeUrl::Scheme::kHttp;
    return NodeUrl::Scheme::kHttps;
}

static uint16_t default_port(NodeUrl::Scheme scheme) {
    switch (scheme) {
        case NodeUrl::Scheme::kWs:
        case NodeUrl::Scheme::kHttp:
            return 80;
        case NodeUrl::Scheme::kWss:
        case NodeUrl::Scheme::kHttps:
            return 443;
    }
    return 80;
}

static string_view scheme_name(NodeUrl::Scheme scheme) {
    switch (scheme) {
        case NodeUrl::Scheme::kWs:
            return "ws";
        case NodeUrl::Scheme::kWss:
            return "wss";
        case NodeUrl::Scheme::kHttp:
            return "http";
        case NodeUrl::Scheme::kHttps:
            return "https";
    }
    return "";
}

NodeUrl::NodeUrl(string_view url) {
    regex url_regex(
        R"((wss?|https?)://(\[[0-9a-f:.]+\]|[a-z0-9._-]+)(?::(\d{1,5}))?(/.*)?)",
        regex::icase);
    match_results<string_view::const_iterator> match;
    if (!regex_match(url.cbegin(), url.cend(), match, url_regex)) {
        throw invalid_argument("Invalid node URL: " + string{url});
    }

    scheme_ = parse_scheme(match[1].str());
    host_ = match[2].str();
    if (host_.front() == '[') {
        host_ = host_.substr(1, host_.size() - 2);
    }
    if (match[3].matched) {
        const auto port = std::stoul(match[3].str());
        if (port == 0 || port > 65535) {
            throw invalid_argument("Invalid port in node URL: " + string{url});
        }
        port_ = gsl::narrow<uint16_t>(port);
    } else {
        port_ = default_port(scheme_);
    }
    target_ = match[4].matched ? match[4].str() : "/";
}

std::string NodeUrl::host_header() const {
    const bool ipv6 = host_.find(':') != string::npos;
    ostringstream out;
    out << (ipv6 ? "[" : "") << host_ << (ipv6 ? "]" : "");
    if (port_ != default_port(scheme_)) {
        out << ":" << port_;
    }
    return out.str();
}

std::string NodeUrl::to_string() const {
    ostringstream out;
    out << scheme_name(scheme_) << "://" << host_header();
    if (target_ != "/") {
        out << target_;
    }
    return out.str();
}

}  // namespace stakeoracle::rpc
