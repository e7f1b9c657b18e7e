#include "mcpbridge/codec.hpp"
#include "mcpbridge/error.hpp"
#include "mcpbridge/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcpbridge {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

// Scalar documents cannot be viewed as a value, so they are read off the
// document directly.
nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    switch (doc.type().value()) {
        case simdjson::ondemand::json_type::object:
        case simdjson::ondemand::json_type::array: {
            auto val = doc.get_value();
            if (val.error()) {
                throw ParseError("Failed to get document value");
            }
            return simdjson_to_nlohmann(val.value());
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = doc.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            return nlohmann::json(doc.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw ParseError("Unsupported JSON document");
    }
}

} // anonymous namespace

nlohmann::json Codec::parse_value(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw ParseError("JSON parse error: trailing content after value");
    }
    return j;
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    if (!j.contains("jsonrpc") || !j.at("jsonrpc").is_string()) {
        throw ParseError("Missing 'jsonrpc' field");
    }
    if (j.at("jsonrpc").get<std::string>() != JSONRPC_VERSION) {
        throw ParseError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    try {
        if (has_method && has_id) {
            if (j.at("id").is_null()) {
                throw ParseError("Request ID must not be null");
            }
            JsonRpcRequest req;
            from_json(j.at("id"), req.id);
            req.method = j.at("method").get<std::string>();
            if (j.contains("params")) req.params = j.at("params");
            return req;
        } else if (has_method && !has_id) {
            JsonRpcNotification notif;
            notif.method = j.at("method").get<std::string>();
            if (j.contains("params")) notif.params = j.at("params");
            return notif;
        } else if (has_id && !has_method) {
            if (j.at("id").is_null()) {
                throw ParseError("Response ID must not be null");
            }
            JsonRpcResponse resp;
            from_json(j.at("id"), resp.id);
            if (j.contains("result")) resp.result = j.at("result");
            if (j.contains("error")) resp.error = j.at("error").get<JsonRpcError>();
            if (!resp.result && !resp.error) {
                throw ParseError("Response must carry 'result' or 'error'");
            }
            return resp;
        }
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("Malformed message: ") + e.what());
    }
    throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return parse_object(parse_value(raw));
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcpbridge
