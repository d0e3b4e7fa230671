#include "ambassador/codec.hpp"
#include "ambassador/error.hpp"
#include "ambassador/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace ambassador {

namespace {

nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
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

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
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
        // Scalar roots are rejected by get_value(); every frame we accept
        // is an object, and the backend only answers with objects.
        auto val = doc.get_value();
        if (val.error()) {
            throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(val.error()));
        }
        j = simdjson_to_nlohmann(val.value());
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        // simdjson_result::value() throws simdjson_error on malformed input
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw ParseError("Trailing content after JSON value");
    }
    return j;
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (!j.contains("jsonrpc")) {
        throw ParseError("Missing 'jsonrpc' field");
    }
    const auto& version = j.at("jsonrpc");
    if (!version.is_string() || version.get<std::string>() != JSONRPC_VERSION) {
        throw ParseError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method && !j.at("method").is_string()) {
        throw ParseError("'method' must be a string");
    }

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
            JsonRpcResponse resp;
            from_json(j, resp);
            return resp;
        }
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("Malformed JSON-RPC message: ") + e.what());
    }
    throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcResponse& msg) {
    nlohmann::json j = msg;
    // Replace invalid UTF-8 rather than throw: a frame must always be written.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace ambassador
