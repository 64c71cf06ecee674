#include "gridwalk/core/strategy.hpp"
#include <algorithm>
#include <charconv>
#include <iterator>

namespace gridwalk::core {

std::optional<Cell> RandomWalkStrategy::next_position(const Grid& grid, const AgentState& agent) {
    return random_step(grid, agent.pos, rng_);
}

std::optional<Cell> ShortestPathStrategy::next_position(const Grid& grid, const AgentState& agent) {
    return next_step_toward_nearest_destination(grid, agent.pos);
}

void RouteStrategy::place(const boost::uuids::uuid& agent_id, std::size_t index) {
    cursors_.insert_or_assign(agent_id, index % route_.size());
}

std::optional<Cell> RouteStrategy::next_position(const Grid&, const AgentState& agent) {
    auto cursor = cursors_.find(agent.id);
    if (cursor == cursors_.end() || route_[cursor->second] != agent.pos) {
        // New agent, or one a fallback moved: rejoin where its cell first appears
        auto it = std::find(route_.begin(), route_.end(), agent.pos);
        if (it == route_.end()) {
            if (cursor != cursors_.end()) {
                cursors_.erase(cursor);
            }
            return std::nullopt;
        }
        const auto index = static_cast<std::size_t>(std::distance(route_.begin(), it));
        cursor = cursors_.insert_or_assign(agent.id, index).first;
    }

    cursor->second = (cursor->second + 1) % route_.size();
    return route_[cursor->second];
}

bool validate_route(const Grid& grid, const Path& route) {
    if (route.empty()) {
        return false;
    }

    return std::all_of(route.begin(), route.end(),
        [&grid](const Cell& cell) { return grid.is_traversable(cell); });
}

std::optional<Path> parse_route(std::string_view text) {
    Path route;

    auto parse_int = [](std::string_view token, int& out) {
        auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), out);
        return ec == std::errc() && ptr == token.data() + token.size();
    };

    while (!text.empty()) {
        const auto end = text.find(';');
        const auto item = text.substr(0, end);
        const auto comma = item.find(',');
        if (comma == std::string_view::npos) {
            return std::nullopt;
        }

        Cell cell{};
        if (!parse_int(item.substr(0, comma), cell.x) || !parse_int(item.substr(comma + 1), cell.y)) {
            return std::nullopt;
        }
        route.push_back(cell);

        if (end == std::string_view::npos) {
            break;
        }
        text.remove_prefix(end + 1);
    }

    if (route.empty()) {
        return std::nullopt;
    }
    return route;
}

StrategyPtr make_strategy(StrategyKind kind, std::mt19937_64& rng, const Path& route) {
    switch (kind) {
        case StrategyKind::RandomWalk:
            return std::make_unique<RandomWalkStrategy>(rng);
        case StrategyKind::ShortestPath:
            return std::make_unique<ShortestPathStrategy>();
        case StrategyKind::Route:
            return std::make_unique<RouteStrategy>(route);
    }
    return nullptr;
}

} // namespace gridwalk::core
