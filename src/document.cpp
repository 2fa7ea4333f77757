#include <docsnap-cpp/document.hpp>
#include <docsnap-cpp/error.hpp>

#include "doc_state.hpp"

#include <algorithm>
#include <iterator>
#include <memory>
#include <ranges>
#include <utility>

namespace docsnap_cpp {

Document::Document(std::shared_ptr<const DocumentSchema> schema) {
    if (!schema) {
        throw SnapshotError{ErrorKind::invalid_arguments, "a document requires a schema"};
    }
    state_ = std::make_unique<detail::DocState>(std::move(schema));
}

Document::~Document() = default;

Document::Document(Document&& other) noexcept = default;

auto Document::operator=(Document&& other) noexcept -> Document& = default;

Document::Document(const Document& other)
    : state_{std::make_unique<detail::DocState>(*other.state_)} {}

auto Document::operator=(const Document& other) -> Document& {
    if (this != &other) {
        state_ = std::make_unique<detail::DocState>(*other.state_);
    }
    return *this;
}

auto Document::schema() const -> const DocumentSchema& {
    return *state_->schema;
}

auto Document::schema_name() const -> const std::string& {
    return state_->schema->name();
}

void Document::apply(const Op& op) {
    state_->apply(op);
}

void Document::clear() {
    state_->nodes.clear();
}

auto Document::contains(std::string_view id) const -> bool {
    return state_->find_node(id) != nullptr;
}

auto Document::get(std::string_view id) const -> std::optional<Node> {
    const auto* node = state_->find_node(id);
    if (!node) return std::nullopt;
    return *node;
}

auto Document::get(std::string_view id, std::string_view property) const -> std::optional<Value> {
    const auto* node = state_->find_node(id);
    if (!node) return std::nullopt;
    return node->get(property);
}

auto Document::node_ids() const -> std::vector<NodeId> {
    auto result = std::vector<NodeId>{};
    result.reserve(state_->nodes.size());
    std::ranges::transform(state_->nodes, std::back_inserter(result),
        [](const auto& pair) { return pair.first; });
    return result;
}

auto Document::nodes() const -> std::vector<Node> {
    auto result = std::vector<Node>{};
    result.reserve(state_->nodes.size());
    std::ranges::transform(state_->nodes, std::back_inserter(result),
        [](const auto& pair) { return pair.second; });
    return result;
}

auto Document::size() const -> std::size_t {
    return state_->nodes.size();
}

}  // namespace docsnap_cpp
