#include "mcpparse/json_tree.hpp"
#include <simdjson.h>
#include <string>

namespace mcpparse {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                // Duplicate keys: the last occurrence wins.
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
        case simdjson::ondemand::json_type::null: {
            bool is_null = val.is_null();
            if (!is_null) {
                throw simdjson::simdjson_error(simdjson::N_ATOM_ERROR);
            }
            return nlohmann::json(nullptr);
        }
        default:
            throw simdjson::simdjson_error(simdjson::TAPE_ERROR);
    }
}

// simdjson refuses get_value() on a scalar root, so scalar documents are read
// through the document accessors directly.
nlohmann::json scalar_document_to_nlohmann(simdjson::ondemand::document& doc,
                                           simdjson::ondemand::json_type type) {
    switch (type) {
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = doc.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto result_int = doc.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = doc.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(doc.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(doc.get_bool().value());
        case simdjson::ondemand::json_type::null: {
            bool is_null = doc.is_null();
            if (!is_null) {
                throw simdjson::simdjson_error(simdjson::N_ATOM_ERROR);
            }
            return nlohmann::json(nullptr);
        }
        default:
            throw simdjson::simdjson_error(simdjson::TAPE_ERROR);
    }
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    simdjson::ondemand::json_type type = doc.type();
    if (type != simdjson::ondemand::json_type::object
        && type != simdjson::ondemand::json_type::array) {
        // Root scalar accessors reject trailing content themselves.
        return scalar_document_to_nlohmann(doc, type);
    }
    nlohmann::json j = simdjson_to_nlohmann(doc.get_value());
    if (!doc.at_end()) {
        throw simdjson::simdjson_error(simdjson::TRAILING_CONTENT);
    }
    return j;
}

} // anonymous namespace

DecodeResult<nlohmann::json> parse_json(std::string_view raw) {
    if (raw.empty()) {
        return DecodeError::invalid_json("empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        return DecodeError::invalid_json(simdjson::error_message(error));
    }

    // Errors past the structural index surface lazily while walking the
    // document, as simdjson_error exceptions.
    try {
        return simdjson_doc_to_nlohmann(doc);
    } catch (const simdjson::simdjson_error& e) {
        return DecodeError::invalid_json(e.what());
    }
}

} // namespace mcpparse
