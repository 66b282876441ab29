#include <recomp/types/position.h>

namespace recomp {
    Position::Position(std::vector<index_type> path) : _path{std::move(path)} {}

    Position Position::child(index_type index) const {
        auto path{_path};
        path.push_back(index);
        return Position{std::move(path)};
    }

    const std::vector<Position::index_type> &Position::path() const { return _path; }

    std::size_t Position::depth() const { return _path.size(); }

    bool Position::is_root() const { return _path.empty(); }

    std::string Position::to_string() const { return fmt::format("[{}]", fmt::join(_path, ".")); }

    std::ostream &operator<<(std::ostream &os, const Position &position) { return os << position.to_string(); }
} // namespace recomp
