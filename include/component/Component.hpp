#pragma once
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

using Lines = std::vector<std::string>;

class Component;

// Content-producing node. The content source is a pair of callables so any
// widget type (or a lambda) can back a leaf without a common base class.
class Leaf {
public:
    using RenderFn     = std::function<Lines(int width)>;
    using InvalidateFn = std::function<void()>;

    Leaf(std::string name, RenderFn render, InvalidateFn invalidate = {});

    // Wrap any type exposing `Lines render(int)` and `void invalidate()`.
    // The widget is shared with the caller so it can keep mutating it.
    template <typename Widget>
    static Leaf of(std::shared_ptr<Widget> widget, std::string name) {
        return Leaf(std::move(name),
                    [widget](int width) { return widget->render(width); },
                    [widget] { widget->invalidate(); });
    }

    // Static lines, rendered as-is
    static Leaf fixed(std::string name, Lines lines);

    Lines render(int width) const { return render_(width); }
    void invalidate() { if (invalidate_) invalidate_(); }

    const std::string& name() const { return name_; }

private:
    std::string  name_;
    RenderFn     render_;
    InvalidateFn invalidate_;
};

// Ordered list of children, exclusively owned. Renders as the
// concatenation of its children's lines.
class Container {
public:
    explicit Container(std::string name = "container");
    ~Container();
    Container(const Container&);
    Container(Container&&) noexcept;
    Container& operator=(const Container&);
    Container& operator=(Container&&) noexcept;

    void add(Component child);
    bool removeAt(size_t index);
    void clear();

    size_t size() const;
    bool empty() const;

    Component& at(size_t index);
    const Component& at(size_t index) const;

    std::vector<Component>& children() { return children_; }
    const std::vector<Component>& children() const { return children_; }

    const std::string& name() const { return name_; }

private:
    std::string name_;
    std::vector<Component> children_;
};

// A node of the UI tree: exactly one of Leaf or Container.
class Component {
public:
    using Node = std::variant<Leaf, Container>;

    Component(Leaf leaf) : node_(std::move(leaf)) {}
    Component(Container container) : node_(std::move(container)) {}

    // Raw render without failure isolation (the FrameBuilder isolates)
    Lines render(int width) const;

    // Clear memoized output of this node and all descendants
    void invalidate();

    const std::string& name() const;

    bool isLeaf() const { return std::holds_alternative<Leaf>(node_); }
    bool isContainer() const { return std::holds_alternative<Container>(node_); }

    Leaf* asLeaf() { return std::get_if<Leaf>(&node_); }
    Container* asContainer() { return std::get_if<Container>(&node_); }
    const Leaf* asLeaf() const { return std::get_if<Leaf>(&node_); }
    const Container* asContainer() const { return std::get_if<Container>(&node_); }

    const Node& node() const { return node_; }
    Node& node() { return node_; }

private:
    Node node_;
};
