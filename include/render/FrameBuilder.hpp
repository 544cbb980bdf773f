#pragma once
#include "Frame.hpp"
#include "component/Component.hpp"
#include <stdexcept>
#include <string>

// A component produced a line wider than the width it was given
class ComponentRenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Flattens the component tree into the desired frame.
// Failures are isolated per leaf: the leaf's output is replaced by one
// diagnostic line and the rest of the frame renders normally.
class FrameBuilder {
public:
    struct Result {
        Frame frame;
        int   failedComponents = 0;
    };

    explicit FrameBuilder(std::string ellipsis = "…");

    Result build(const Component& root, int width, int height) const;

    // Diagnostic line substituted for a failed subtree
    std::string placeholder(const std::string& name,
                            const std::string& what, int width) const;

private:
    void renderNode(const Component& node, int width,
                    Lines& out, int& failures) const;
    void renderLeaf(const Leaf& leaf, int width,
                    Lines& out, int& failures) const;

    std::string ellipsis_;
};
