#include <recomp/runtime/composer.h>
#include <recomp/types/error_type.h>
#include <recomp/types/scope.h>
#include <recomp/util/errors.h>

#include <algorithm>

namespace recomp {
    Scope::Scope(Composer &composer, ptr parent, Position position, Element element)
        : _composer{composer}, _parent{parent}, _position{std::move(position)}, _element{std::move(element)} {
    }

    Composer &Scope::composer() const { return _composer; }

    Scope::ptr Scope::parent() const { return _parent; }

    const Position &Scope::position() const { return _position; }

    const Element &Scope::element() const { return _element; }

    std::string_view Scope::name() const { return _element.name(); }

    std::string Scope::path() const {
        std::vector<std::string_view> names;
        for (auto scope = this; scope != nullptr; scope = scope->_parent) { names.push_back(scope->name()); }
        std::reverse(names.begin(), names.end());
        return fmt::format("{}", fmt::join(names, "/"));
    }

    uint64_t Scope::generation() const { return _generation; }

    bool Scope::has_composed() const { return _generation > 0; }

    uint64_t Scope::last_pass() const { return _last_pass; }

    std::size_t Scope::child_count() const { return _children.size(); }

    Scope::ptr Scope::child(std::size_t index) const {
        if (index >= _children.size()) {
            throw std::out_of_range(fmt::format("{} has no child slot {}", path(), index));
        }
        return _children[index].get();
    }

    std::size_t Scope::hook_count() const { return _hooks.size(); }

    const LifetimeToken::s_ptr &Scope::lifetime() const { return _lifetime; }

    void Scope::mark_dirty() { _composer.schedule(*this); }

    void Scope::provide_context(std::type_index type, std::shared_ptr<void> value) {
        _provided.emplace_back(type, std::move(value));
    }

    std::shared_ptr<void> Scope::find_context(std::type_index type) const {
        for (auto scope = _parent; scope != nullptr; scope = scope->_parent) {
            // Latest registration wins when a scope provides the same type twice
            for (auto it = scope->_provided.rbegin(); it != scope->_provided.rend(); ++it) {
                if (it->first == type) { return it->second; }
            }
        }
        return _composer.find_root_context(type);
    }

    void Scope::initialise() { _lifetime = std::make_shared<LifetimeToken>(); }

    void Scope::start() {
        if (_lifetime == nullptr || _lifetime->cancelled()) { _lifetime = std::make_shared<LifetimeToken>(); }
    }

    void Scope::stop() {
        _lifetime->cancel();
        std::exception_ptr first_exc;
        for (auto it = _hooks.rbegin(); it != _hooks.rend(); ++it) {
            try {
                (*it)->stop();
            } catch (...) {
                if (!first_exc) first_exc = std::current_exception();
            }
        }
        if (first_exc) std::rethrow_exception(first_exc);
    }

    void Scope::dispose() {
        // Children are disposed by the Composer before their parent
        while (!_hooks.empty()) { _hooks.pop_back(); }
        _provided.clear();
        _hook_idx = 0;
        _committed_hooks = 0;
        _committed_provided = 0;
    }

    void Scope::set_element(Element element) { _element = std::move(element); }

    void Scope::begin_compose(uint64_t pass_id) {
        _hook_idx = 0;
        _last_pass = pass_id;
    }

    void Scope::end_compose() {
        if (has_composed() && _hook_idx != _hooks.size() && _hook_check_enabled()) {
            throw_error<HookOrderError>("{} used {} hooks but {} were used on its previous composition", path(),
                                        _hook_idx, _hooks.size());
        }
        _committed_hooks = _hooks.size();
        _committed_provided = _provided.size();
        ++_generation;
    }

    void Scope::rollback_compose() {
        // Slots created by the failed composition are discarded, newest first
        while (_hooks.size() > _committed_hooks) { _hooks.pop_back(); }
        _provided.erase(_provided.begin() + static_cast<std::ptrdiff_t>(_committed_provided), _provided.end());
        _hook_idx = 0;
    }

    bool Scope::_hook_check_enabled() const { return _composer.config().hook_check == HookCheck::ENABLED; }

    void Scope::_hook_type_mismatch(std::size_t slot, const std::type_info &requested) const {
        const Hook &existing{*_hooks[slot]};
        throw_error<HookOrderError>("{} requested a {} at hook slot {} which holds a {}", path(),
                                    short_type_name(requested), slot, short_type_name(typeid(existing)));
    }

    void Scope::_hook_added(std::size_t slot, const std::type_info &requested) const {
        throw_error<HookOrderError>("{} requested a new {} at hook slot {} after its first composition used {} hooks",
                                    path(), short_type_name(requested), slot, _hooks.size());
    }
} // namespace recomp
