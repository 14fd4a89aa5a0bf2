#include "router/router.hpp"

#include <spdlog/spdlog.h>

#include <utility>

// ---------------------------------------------------------------------------
// Router 내부 노드 구조
//
//   Node
//     literal_children : 세그먼트 문자열 -> 자식
//     param_child      : ":name" 세그먼트 자식 (이름은 Entry 의 패턴이 보관)
//     leaf             : 이 노드에서 끝나는 항목
//     wildcard_leaf    : 이 노드 아래 나머지 경로 전체를 받는 항목
//
//   파라미터 이름은 트리에 저장하지 않는다. 같은 위치에 다른 이름을 쓴
//   패턴은 같은 노드로 합쳐지며, 캡처는 매칭된 Entry 의 PathPattern 이 수행한다.
// ---------------------------------------------------------------------------
struct Router::Entry {
    PathPattern                  pattern;
    std::shared_ptr<const Route> route;
};

struct Router::Node {
    std::map<std::string, std::unique_ptr<Node>, std::less<>> literal_children{};
    std::unique_ptr<Node>                                     param_child{};
    std::unique_ptr<Entry>                                    leaf{};
    std::unique_ptr<Entry>                                    wildcard_leaf{};
};

Router::Router() = default;
Router::~Router() = default;
Router::Router(Router&&) noexcept = default;
Router& Router::operator=(Router&&) noexcept = default;

auto Router::insert(std::string_view method, std::shared_ptr<const Route> route)
    -> std::expected<std::shared_ptr<const Route>, ProxyError>
{
    auto pattern = PathPattern::parse(route->path);
    if (!pattern) {
        return std::unexpected(pattern.error());
    }

    auto tree_it = trees_.find(method);
    if (tree_it == trees_.end()) {
        tree_it = trees_.emplace(std::string{method}, std::make_unique<Node>()).first;
        method_order_.emplace_back(method);
    }

    Node* node = tree_it->second.get();
    std::unique_ptr<Entry>* slot = nullptr;

    for (const auto& seg : pattern->segments()) {
        switch (seg.kind) {
            case SegmentKind::kLiteral: {
                auto child = node->literal_children.find(seg.text);
                if (child == node->literal_children.end()) {
                    child = node->literal_children.emplace(seg.text, std::make_unique<Node>()).first;
                }
                node = child->second.get();
                break;
            }
            case SegmentKind::kParam:
                if (!node->param_child) {
                    node->param_child = std::make_unique<Node>();
                }
                node = node->param_child.get();
                break;
            case SegmentKind::kWildcard:
                slot = &node->wildcard_leaf;
                break;
        }
    }
    if (slot == nullptr) {
        slot = &node->leaf;
    }

    std::shared_ptr<const Route> replaced{};
    if (*slot) {
        spdlog::warn("[router] {} {} registered again, replacing '{}'",
                     method, route->path, (*slot)->pattern.text());
        replaced = (*slot)->route;
    } else {
        ++size_;
    }

    *slot = std::make_unique<Entry>(Entry{std::move(*pattern), std::move(route)});
    return replaced;
}

auto Router::lookup(const Node&                          node,
                    const std::vector<std::string_view>& parts,
                    std::size_t                          index) -> const Entry*
{
    if (index == parts.size()) {
        if (node.leaf) {
            return node.leaf.get();
        }
        return node.wildcard_leaf.get();
    }

    const std::string_view part = parts[index];

    if (const auto it = node.literal_children.find(part); it != node.literal_children.end()) {
        if (const Entry* found = lookup(*it->second, parts, index + 1)) {
            return found;
        }
    }

    if (node.param_child && !part.empty()) {
        if (const Entry* found = lookup(*node.param_child, parts, index + 1)) {
            return found;
        }
    }

    return node.wildcard_leaf.get();
}

auto Router::match(std::string_view method, std::string_view path) const -> RouteMatch
{
    RouteMatch result{};
    if (path.empty() || path.front() != '/') {
        return result;
    }

    const auto parts = split_path(path);

    if (const auto tree = trees_.find(method); tree != trees_.end()) {
        if (const Entry* entry = lookup(*tree->second, parts, 0)) {
            if (auto params = entry->pattern.match(path)) {
                result.status = MatchStatus::kMatched;
                result.route  = entry->route;
                result.params = std::move(*params);
                return result;
            }
        }
    }

    for (const auto& other : method_order_) {
        if (other == method) {
            continue;
        }
        const auto& tree = trees_.find(other)->second;
        if (lookup(*tree, parts, 0) != nullptr) {
            result.allowed_methods.push_back(other);
        }
    }

    if (!result.allowed_methods.empty()) {
        result.status = MatchStatus::kMethodNotAllowed;
    }
    return result;
}
