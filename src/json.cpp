#include <docsnap-cpp/json.hpp>
#include <docsnap-cpp/error.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace docsnap_cpp {

namespace {

constexpr std::string_view base64_chars =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

auto base64_encode(const Bytes& data) -> std::string {
    auto result = std::string{};
    result.reserve(((data.size() + 2) / 3) * 4);
    auto bits = std::uint32_t{0};
    auto pending = 0;
    for (auto b : data) {
        bits = (bits << 8) | static_cast<std::uint8_t>(b);
        pending += 8;
        while (pending >= 6) {
            pending -= 6;
            result.push_back(base64_chars[(bits >> pending) & 0x3F]);
        }
    }
    if (pending > 0) {
        result.push_back(base64_chars[(bits << (6 - pending)) & 0x3F]);
    }
    while (result.size() % 4 != 0) result.push_back('=');
    return result;
}

auto base64_decode(std::string_view encoded) -> Bytes {
    auto result = Bytes{};
    result.reserve((encoded.size() / 4) * 3);
    auto bits = std::uint32_t{0};
    auto pending = 0;
    for (auto c : encoded) {
        if (c == '=') break;
        auto pos = base64_chars.find(c);
        if (pos == std::string_view::npos) {
            throw SnapshotError{ErrorKind::decoding_error, "invalid base64 character"};
        }
        bits = (bits << 6) | static_cast<std::uint32_t>(pos);
        pending += 6;
        if (pending >= 8) {
            pending -= 8;
            result.push_back(static_cast<std::byte>((bits >> pending) & 0xFF));
        }
    }
    return result;
}

auto op_type_from_string(std::string_view name) -> OpType {
    for (auto type : {OpType::create, OpType::del, OpType::set, OpType::update}) {
        if (to_string_view(type) == name) return type;
    }
    throw SnapshotError{ErrorKind::decoding_error, "unknown operation type '" + std::string{name} + "'"};
}

}  // anonymous namespace

// =============================================================================
// Scalars and values
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Timestamp& t) {
    j = nlohmann::json{{"__type", "timestamp"}, {"value", t.millis_since_epoch}};
}

void to_json(nlohmann::json& j, const ScalarValue& sv) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](double d) { j = d; },
        [&](const Timestamp& t) { to_json(j, t); },
        [&](const std::string& s) { j = s; },
        [&](const Bytes& b) {
            j = nlohmann::json{{"__type", "bytes"}, {"value", base64_encode(b)}};
        },
    }, sv);
}

void from_json(const nlohmann::json& j, ScalarValue& sv) {
    if (j.is_object()) {
        auto type = j.value("__type", std::string{});
        if (type == "timestamp") {
            sv = Timestamp{j.at("value").get<std::int64_t>()};
            return;
        }
        if (type == "bytes") {
            sv = base64_decode(j.at("value").get<std::string>());
            return;
        }
        throw SnapshotError{ErrorKind::decoding_error, "untagged JSON object is not a scalar"};
    }
    if (j.is_null()) {
        sv = Null{};
    } else if (j.is_boolean()) {
        sv = j.get<bool>();
    } else if (j.is_number_unsigned()) {
        auto val = j.get<std::uint64_t>();
        if (val > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            throw SnapshotError{ErrorKind::decoding_error, "integer out of int64 range"};
        }
        sv = static_cast<std::int64_t>(val);
    } else if (j.is_number_integer()) {
        sv = j.get<std::int64_t>();
    } else if (j.is_number_float()) {
        sv = j.get<double>();
    } else if (j.is_string()) {
        sv = j.get<std::string>();
    } else {
        throw SnapshotError{ErrorKind::decoding_error, "cannot convert JSON to ScalarValue"};
    }
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](const ScalarValue& sv) { to_json(j, sv); },
        [&](const Sequence& seq) {
            j = nlohmann::json::array();
            for (const auto& item : seq) {
                auto element = nlohmann::json{};
                to_json(element, item);
                j.push_back(std::move(element));
            }
        },
    }, v);
}

void from_json(const nlohmann::json& j, Value& v) {
    if (j.is_array()) {
        auto seq = Sequence{};
        seq.reserve(j.size());
        for (const auto& element : j) {
            auto item = ScalarValue{};
            from_json(element, item);
            seq.push_back(std::move(item));
        }
        v = std::move(seq);
        return;
    }
    auto sv = ScalarValue{};
    from_json(j, sv);
    v = std::move(sv);
}

// =============================================================================
// Document model
// =============================================================================

void to_json(nlohmann::json& j, const Node& n) {
    auto properties = nlohmann::json::object();
    for (const auto& [name, value] : n.properties) {
        to_json(properties[name], value);
    }
    j = nlohmann::json{{"id", n.id}, {"type", n.type}, {"properties", std::move(properties)}};
}

void from_json(const nlohmann::json& j, Node& n) {
    n.id = j.at("id").get<std::string>();
    n.type = j.at("type").get<std::string>();
    n.properties.clear();
    if (auto it = j.find("properties"); it != j.end()) {
        for (const auto& [name, value] : it->items()) {
            auto v = Value{};
            from_json(value, v);
            n.properties.emplace(name, std::move(v));
        }
    }
}

void to_json(nlohmann::json& j, const Op& op) {
    j = nlohmann::json{{"type", std::string{to_string_view(op.action)}}, {"path", op.path}};
    switch (op.action) {
        case OpType::create:
        case OpType::del:
            if (op.node) to_json(j["node"], *op.node);
            break;
        case OpType::set:
            to_json(j["value"], op.value);
            break;
        case OpType::update:
            j["offset"] = op.offset;
            j["remove"] = op.remove;
            to_json(j["insert"], op.value);
            break;
    }
}

void from_json(const nlohmann::json& j, Op& op) {
    op = Op{};
    op.action = op_type_from_string(j.at("type").get<std::string>());
    op.path = j.at("path").get<Path>();
    switch (op.action) {
        case OpType::create:
        case OpType::del:
            if (auto it = j.find("node"); it != j.end()) {
                auto node = Node{};
                from_json(*it, node);
                op.node = std::move(node);
            }
            break;
        case OpType::set:
            from_json(j.at("value"), op.value);
            break;
        case OpType::update:
            op.offset = j.at("offset").get<std::size_t>();
            op.remove = j.value("remove", std::size_t{0});
            from_json(j.at("insert"), op.value);
            break;
    }
}

void to_json(nlohmann::json& j, const Change& c) {
    auto ops = nlohmann::json::array();
    for (const auto& op : c.ops) {
        auto element = nlohmann::json{};
        to_json(element, op);
        ops.push_back(std::move(element));
    }
    j = nlohmann::json{
        {"document_id", c.document_id},
        {"version", c.version},
        {"ops", std::move(ops)},
        {"timestamp", c.timestamp},
    };
    if (c.message) j["message"] = *c.message;
}

void from_json(const nlohmann::json& j, Change& c) {
    c.document_id = j.at("document_id").get<std::string>();
    c.version = j.at("version").get<Version>();
    c.ops.clear();
    for (const auto& element : j.at("ops")) {
        auto op = Op{};
        from_json(element, op);
        c.ops.push_back(std::move(op));
    }
    c.timestamp = j.value("timestamp", std::int64_t{0});
    c.message.reset();
    if (auto it = j.find("message"); it != j.end() && !it->is_null()) {
        c.message = it->get<std::string>();
    }
}

void to_json(nlohmann::json& j, const Snapshot& s) {
    j = nlohmann::json{{"document_id", s.document_id}, {"version", s.version}, {"data", s.data}};
}

void from_json(const nlohmann::json& j, Snapshot& s) {
    s.document_id = j.at("document_id").get<std::string>();
    s.version = j.at("version").get<Version>();
    s.data = j.at("data");
}

void to_json(nlohmann::json& j, const DocumentRecord& r) {
    j = nlohmann::json{
        {"document_id", r.document_id},
        {"schema_name", r.schema_name},
        {"version", r.version},
    };
}

void from_json(const nlohmann::json& j, DocumentRecord& r) {
    r.document_id = j.at("document_id").get<std::string>();
    r.schema_name = j.at("schema_name").get<std::string>();
    r.version = j.value("version", Version{0});
}

// =============================================================================
// Schemas
// =============================================================================

void to_json(nlohmann::json& j, const PropertyDef& d) {
    j = nlohmann::json{{"type", std::string{to_string_view(d.type)}}};
    to_json(j["default"], d.default_value);
}

void from_json(const nlohmann::json& j, PropertyDef& d) {
    d.type = property_type_from_string(j.at("type").get<std::string>());
    d.default_value = Value{};
    if (auto it = j.find("default"); it != j.end()) {
        from_json(*it, d.default_value);
    }
}

void to_json(nlohmann::json& j, const NodeSchema& s) {
    auto types = nlohmann::json::object();
    for (const auto& type : s.node_types()) {
        auto& props = types[type.name] = nlohmann::json::object();
        for (const auto& [name, def] : type.properties) {
            to_json(props[name], def);
        }
    }
    auto seeds = nlohmann::json::array();
    for (const auto& node : s.seed_nodes()) {
        auto element = nlohmann::json{};
        to_json(element, node);
        seeds.push_back(std::move(element));
    }
    j = nlohmann::json{{"name", s.name()}, {"node_types", std::move(types)}, {"seed_nodes", std::move(seeds)}};
}

auto schema_from_json(const nlohmann::json& j) -> std::shared_ptr<NodeSchema> {
    try {
        auto types = std::vector<NodeType>{};
        for (const auto& [type_name, props] : j.at("node_types").items()) {
            auto type = NodeType{.name = type_name, .properties = {}};
            for (const auto& [prop_name, def_json] : props.items()) {
                auto def = PropertyDef{};
                from_json(def_json, def);
                type.properties.emplace(prop_name, std::move(def));
            }
            types.push_back(std::move(type));
        }
        auto seeds = std::vector<Node>{};
        if (auto it = j.find("seed_nodes"); it != j.end()) {
            for (const auto& element : *it) {
                auto node = Node{};
                from_json(element, node);
                seeds.push_back(std::move(node));
            }
        }
        return std::make_shared<NodeSchema>(j.at("name").get<std::string>(),
                                            std::move(types), std::move(seeds));
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError{ErrorKind::invalid_arguments,
                            std::string{"malformed schema definition: "} + e.what()};
    } catch (const SnapshotError& e) {
        if (e.kind() == ErrorKind::invalid_arguments) throw;
        throw SnapshotError{ErrorKind::invalid_arguments, "malformed schema definition: " + e.error().message};
    }
}

// =============================================================================
// Document codec
// =============================================================================

auto export_document(const Document& doc) -> nlohmann::json {
    auto nodes = nlohmann::json::array();
    for (const auto& node : doc.nodes()) {
        auto element = nlohmann::json{};
        to_json(element, node);
        nodes.push_back(std::move(element));
    }
    return nlohmann::json{{"schema", doc.schema_name()}, {"nodes", std::move(nodes)}};
}

auto import_document(Document& doc, const nlohmann::json& data) -> Document& {
    try {
        auto schema = data.at("schema").get<std::string>();
        if (schema != doc.schema_name()) {
            throw SnapshotError{ErrorKind::decoding_error,
                "data was exported from schema '" + schema + "', not '" + doc.schema_name() + "'"};
        }
        auto restored = Document{doc};
        restored.clear();
        for (const auto& element : data.at("nodes")) {
            auto node = Node{};
            from_json(element, node);
            restored.apply(create_node(std::move(node)));
        }
        doc = std::move(restored);
        return doc;
    } catch (const nlohmann::json::exception& e) {
        throw SnapshotError{ErrorKind::decoding_error, std::string{"malformed document data: "} + e.what()};
    } catch (const SnapshotError& e) {
        if (e.kind() == ErrorKind::decoding_error) throw;
        throw SnapshotError{ErrorKind::decoding_error, "document data does not fit its schema: " + e.error().message};
    }
}

}  // namespace docsnap_cpp
