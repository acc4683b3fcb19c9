// Copyright 2025 The Stakeoracle Authors
// SPDX-License-Identifier: Apache-2.0

#include "abi_checker.hpp"

#include <fstream>
#include <set>
#include <stdexcept>

#include <stakeoracle/infra/common/log.hpp>
#include <stakeoracle/oracle/report_builder.hpp>

namespace stakeoracle::oracle {

std::vector<std::string_view> oracle_master_signatures() {
    return {
        kReportRelaySignature,
        "getStashAccounts()",
        "getCurrentEraId()",
        "isReportedLastEra(address,bytes32)",
    };
}

nlohmann::json load_abi(const std::filesystem::path& path) {
    std::ifstream file{path};
    if (!file) {
        throw std::invalid_argument{"cannot open ABI file " + path.string()};
    }
    const auto contents = nlohmann::json::parse(file, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (contents.is_discarded()) {
        throw std::invalid_argument{"invalid JSON in ABI file " + path.string()};
    }
    if (contents.is_array()) {
        return contents;
    }
    if (contents.is_object() && contents.contains("abi") && contents["abi"].is_array()) {
        return contents["abi"];
    }
    throw std::invalid_argument{"no ABI found in " + path.string()};
}

static std::string canonical_type(const nlohmann::json& parameter) {
    const auto type{parameter.at("type").get<std::string>()};
    if (type.rfind("tuple", 0) != 0) {
        return type;
    }
    std::string tuple{"("};
    for (const auto& component : parameter.at("components")) {
        if (tuple.size() > 1) {
            tuple += ",";
        }
        tuple += canonical_type(component);
    }
    tuple += ")";
    // Array suffixes of the tuple, if any
    return tuple + type.substr(std::string_view{"tuple"}.size());
}

std::string canonical_signature(const nlohmann::json& function) {
    std::string signature{function.at("name").get<std::string>() + "("};
    bool first{true};
    for (const auto& input : function.value("inputs", nlohmann::json::array())) {
        if (!first) {
            signature += ",";
        }
        signature += canonical_type(input);
        first = false;
    }
    return signature + ")";
}

void check_oracle_master_abi(const nlohmann::json& abi) {
    std::set<std::string> declared;
    try {
        for (const auto& entry : abi) {
            if (entry.value("type", "function") == "function") {
                declared.insert(canonical_signature(entry));
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument{std::string{"malformed ABI entry: "} + e.what()};
    }

    std::string missing;
    for (const auto signature : oracle_master_signatures()) {
        if (!declared.contains(std::string{signature})) {
            missing += (missing.empty() ? "" : ", ") + std::string{signature};
        }
    }
    if (!missing.empty()) {
        throw std::invalid_argument{"OracleMaster ABI does not declare " + missing};
    }
    log::Info("OracleMaster ABI checked", {"functions", std::to_string(declared.size())});
}

}  // namespace stakeoracle::oracle
