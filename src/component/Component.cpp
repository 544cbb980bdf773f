#include "component/Component.hpp"
#include <stdexcept>
#include <type_traits>

// ── Leaf ─────────────────────────────────────────────────────────────────

Leaf::Leaf(std::string name, RenderFn render, InvalidateFn invalidate)
    : name_(std::move(name))
    , render_(std::move(render))
    , invalidate_(std::move(invalidate))
{
    if (!render_)
        throw std::invalid_argument("Leaf '" + name_ + "' has no render function");
}

Leaf Leaf::fixed(std::string name, Lines lines) {
    return Leaf(std::move(name),
                [lines = std::move(lines)](int) { return lines; });
}

// ── Container ────────────────────────────────────────────────────────────

Container::Container(std::string name)
    : name_(std::move(name)) {}

Container::~Container() = default;
Container::Container(const Container&) = default;
Container::Container(Container&&) noexcept = default;
Container& Container::operator=(const Container&) = default;
Container& Container::operator=(Container&&) noexcept = default;

void Container::add(Component child) {
    children_.push_back(std::move(child));
}

bool Container::removeAt(size_t index) {
    if (index >= children_.size()) return false;
    children_.erase(children_.begin() + index);
    return true;
}

void Container::clear() {
    children_.clear();
}

size_t Container::size() const {
    return children_.size();
}

bool Container::empty() const {
    return children_.empty();
}

Component& Container::at(size_t index) {
    return children_.at(index);
}

const Component& Container::at(size_t index) const {
    return children_.at(index);
}

// ── Component ────────────────────────────────────────────────────────────

Lines Component::render(int width) const {
    return std::visit([width](const auto& n) -> Lines {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Leaf>) {
            return n.render(width);
        } else {
            Lines out;
            for (auto& child : n.children()) {
                auto lines = child.render(width);
                out.insert(out.end(), std::make_move_iterator(lines.begin()),
                           std::make_move_iterator(lines.end()));
            }
            return out;
        }
    }, node_);
}

void Component::invalidate() {
    std::visit([](auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, Leaf>) {
            n.invalidate();
        } else {
            for (auto& child : n.children()) child.invalidate();
        }
    }, node_);
}

const std::string& Component::name() const {
    return std::visit([](const auto& n) -> const std::string& {
        return n.name();
    }, node_);
}
