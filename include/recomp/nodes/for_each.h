#ifndef RECOMP_FOR_EACH_H
#define RECOMP_FOR_EACH_H

#include <recomp/types/element.h>

#include <vector>

namespace recomp {
    /**
     * One child per item, built with ``make_item(item)``. Children are matched to the previous composition by
     * index, so appending keeps the state of the existing items, inserting at the front does not.
     */
    template<typename Item, typename Fn>
    struct ForEach {
        static constexpr std::string_view name{"ForEach"};

        std::vector<Item> items;
        Fn make_item;

        Children compose(Scope &) const {
            std::vector<Element> children;
            children.reserve(items.size());
            for (const auto &item: items) { children.emplace_back(Element(make_item(item))); }
            return Children(std::move(children));
        }
    };

    template<typename Item, typename Fn>
    ForEach<Item, std::decay_t<Fn>> for_each(std::vector<Item> items, Fn &&make_item) {
        return ForEach<Item, std::decay_t<Fn>>{std::move(items), std::forward<Fn>(make_item)};
    }
} // namespace recomp

#endif  // RECOMP_FOR_EACH_H
