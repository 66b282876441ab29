#ifndef RECOMP_POSITION_H
#define RECOMP_POSITION_H

#include <recomp/recomp_base.h>

#include <compare>
#include <ostream>

namespace recomp {
    /**
     * The stable location of a scope in the tree: the path of child-slot indices from the root (the root is the
     * empty path). Positions compare lexicographically, a prefix sorts before any of its extensions, which makes the
     * ordering a pre-order traversal of the tree. Adding or removing a sibling never changes the position of any
     * other existing scope.
     */
    struct RECOMP_EXPORT Position {
        using index_type = uint32_t;

        Position() = default;

        explicit Position(std::vector<index_type> path);

        [[nodiscard]] Position child(index_type index) const;

        [[nodiscard]] const std::vector<index_type> &path() const;

        [[nodiscard]] std::size_t depth() const;

        [[nodiscard]] bool is_root() const;

        [[nodiscard]] std::string to_string() const;

        auto operator<=>(const Position &other) const = default;

        bool operator==(const Position &other) const = default;

        friend std::ostream &operator<<(std::ostream &os, const Position &position);

    private:
        std::vector<index_type> _path;
    };
} // namespace recomp

template<>
struct fmt::formatter<recomp::Position> : fmt::formatter<std::string_view> {
    auto format(const recomp::Position &position, format_context &ctx) const {
        return fmt::formatter<std::string_view>::format(position.to_string(), ctx);
    }
};

#endif  // RECOMP_POSITION_H
