// Fuzz target for the snapshot read path: frame decoding, JSON parsing and
// import_document(). Any input that imports must re-export identically.

#include <docsnap-cpp/docsnap.hpp>

#include "storage/compression.hpp"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>

namespace {

auto schema() -> std::shared_ptr<const docsnap_cpp::DocumentSchema> {
    static auto instance = docsnap_cpp::schema_from_json(nlohmann::json::parse(R"({
        "name": "note",
        "node_types": {
            "container": {"nodes": {"type": "sequence"}},
            "paragraph": {"content": {"type": "string"}, "weight": {"type": "number"}},
            "attachment": {"data": {"type": "bytes"}, "at": {"type": "timestamp"}}
        }
    })"));
    return instance;
}

}  // anonymous namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto* first = reinterpret_cast<const std::byte*>(data);
    auto frame = std::vector<std::byte>(first, first + size);

    // Framed input goes through the decompressor; anything else is raw JSON
    auto payload = docsnap_cpp::storage::decompress_frame(frame);
    auto text = payload ? *payload : std::string(reinterpret_cast<const char*>(data), size);

    auto json = nlohmann::json::parse(text, nullptr, false);
    if (json.is_discarded()) return 0;

    auto doc = schema()->create_document();
    try {
        docsnap_cpp::import_document(doc, json);
    } catch (const docsnap_cpp::SnapshotError& e) {
        if (e.kind() != docsnap_cpp::ErrorKind::decoding_error) std::abort();
        return 0;
    }

    auto exported = docsnap_cpp::export_document(doc);
    auto again = schema()->create_document();
    docsnap_cpp::import_document(again, exported);
    if (docsnap_cpp::export_document(again) != exported) std::abort();
    return 0;
}
