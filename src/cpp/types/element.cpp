#include <recomp/types/element.h>

#include <stdexcept>

namespace recomp {
    Element::Element(AnyCompose::s_ptr node) : _node{std::move(node)} {}

    bool Element::empty() const { return _node == nullptr; }

    Element::operator bool() const { return _node != nullptr; }

    std::type_index Element::type_id() const { return _node ? _node->type_id() : std::type_index{typeid(void)}; }

    std::string_view Element::name() const { return _node ? _node->name() : std::string_view{}; }

    const AnyCompose::s_ptr &Element::node() const { return _node; }

    bool Element::same_node(const Element &other) const { return _node == other._node; }

    Children::Children(std::initializer_list<Element> elements) : _elements(elements) {}

    Children::Children(std::vector<Element> elements) : _elements(std::move(elements)) {}

    Children::Children(Element element) { _elements.push_back(std::move(element)); }

    Children Children::keep() {
        Children children;
        children._keep = true;
        return children;
    }

    Children Children::rebuild(Children children) {
        if (children._keep) { throw std::logic_error("Cannot rebuild a keep() child list"); }
        children._rebuild = true;
        return children;
    }

    bool Children::keeps_previous() const { return _keep; }

    bool Children::rebuilds() const { return _rebuild; }

    std::size_t Children::size() const { return _elements.size(); }

    bool Children::empty() const { return _elements.empty(); }

    const Element &Children::operator[](std::size_t index) const {
        if (index >= _elements.size()) {
            throw std::out_of_range(fmt::format("Child index {} out of range for {} children", index, _elements.size()));
        }
        return _elements[index];
    }

    Children::const_iterator Children::begin() const { return _elements.begin(); }

    Children::const_iterator Children::end() const { return _elements.end(); }

    void Children::push_back(Element element) {
        if (_keep) { throw std::logic_error("Cannot add children to a keep() child list"); }
        _elements.push_back(std::move(element));
    }
} // namespace recomp
