#include <catch2/catch_test_macros.hpp>
#include "gridwalk/core/grid.hpp"

using namespace gridwalk::core;

TEST_CASE("Grid parsing", "[grid]") {
    SECTION("Every glyph maps to its terrain") {
        auto grid = Grid::parse("^ #\n# $");

        REQUIRE(grid.width() == 3);
        REQUIRE(grid.height() == 2);
        REQUIRE(grid.terrain_at({0, 0}) == Terrain::SpawnPoint);
        REQUIRE(grid.terrain_at({1, 0}) == Terrain::Empty);
        REQUIRE(grid.terrain_at({2, 0}) == Terrain::Wall);
        REQUIRE(grid.terrain_at({0, 1}) == Terrain::Wall);
        REQUIRE(grid.terrain_at({1, 1}) == Terrain::Empty);
        REQUIRE(grid.terrain_at({2, 1}) == Terrain::Destination);
    }

    SECTION("Short rows are padded with empty cells") {
        auto grid = Grid::parse("#\n####\n##");

        REQUIRE(grid.width() == 4);
        REQUIRE(grid.height() == 3);
        REQUIRE(grid.terrain_at({0, 0}) == Terrain::Wall);
        REQUIRE(grid.terrain_at({1, 0}) == Terrain::Empty);
        REQUIRE(grid.terrain_at({3, 0}) == Terrain::Empty);
        REQUIRE(grid.terrain_at({3, 1}) == Terrain::Wall);
        REQUIRE(grid.terrain_at({2, 2}) == Terrain::Empty);

        for (const auto& row : grid.to_lines()) {
            REQUIRE(row.size() == 4);
        }
    }

    SECTION("Empty lines do not count as rows") {
        auto grid = Grid::parse("\n#$\n\n\n ^\n");

        REQUIRE(grid.height() == 2);
        REQUIRE(grid.width() == 2);
        REQUIRE(grid.terrain_at({1, 1}) == Terrain::SpawnPoint);
    }

    SECTION("Carriage returns are stripped") {
        auto grid = Grid::parse("# \r\n $\r\n");

        REQUIRE(grid.width() == 2);
        REQUIRE(grid.height() == 2);
        REQUIRE(grid.terrain_at({1, 1}) == Terrain::Destination);
    }

    SECTION("Leading spaces are cells") {
        auto grid = Grid::parse("  $");
        REQUIRE(grid.width() == 3);
        REQUIRE(grid.terrain_at({0, 0}) == Terrain::Empty);
        REQUIRE(grid.terrain_at({2, 0}) == Terrain::Destination);
    }
}

TEST_CASE("Grid parse failures", "[grid]") {
    SECTION("Unknown glyph reports character and cell") {
        REQUIRE_THROWS_AS(Grid::parse("# x"), MapError);

        try {
            Grid::parse("###\n# x");
            FAIL("expected MapError");
        } catch (const MapError& e) {
            REQUIRE(e.kind() == ErrorKind::InvalidMapCharacter);
            REQUIRE(e.glyph() == 'x');
            REQUIRE(e.cell() == Cell{2, 1});
        }
    }

    SECTION("Tabs are not map glyphs") {
        REQUIRE_THROWS_AS(Grid::parse("#\t#"), MapError);
    }

    SECTION("No lines at all") {
        for (const char* text : {"", "\n", "\n\n\r\n"}) {
            try {
                Grid::parse(text);
                FAIL("expected MapError");
            } catch (const MapError& e) {
                REQUIRE(e.kind() == ErrorKind::EmptyMap);
            }
        }
    }
}

TEST_CASE("Grid bounds", "[grid]") {
    auto grid = Grid::parse("   \n # \n   \n  $");

    SECTION("Row and column zero are inside") {
        REQUIRE(grid.in_bounds({0, 0}));
        REQUIRE(grid.in_bounds({0, 3}));
        REQUIRE(grid.in_bounds({2, 0}));
        REQUIRE(grid.in_bounds({2, 3}));
    }

    SECTION("Every cell outside the extent is rejected") {
        for (int y = -2; y < grid.height() + 2; ++y) {
            for (int x = -2; x < grid.width() + 2; ++x) {
                bool expected = x >= 0 && x < grid.width() && y >= 0 && y < grid.height();
                REQUIRE(grid.in_bounds({x, y}) == expected);
            }
        }
    }

    SECTION("terrain_at outside throws") {
        REQUIRE_THROWS_AS(grid.terrain_at({-1, 0}), OutOfBounds);
        REQUIRE_THROWS_AS(grid.terrain_at({0, -1}), OutOfBounds);
        REQUIRE_THROWS_AS(grid.terrain_at({3, 0}), OutOfBounds);
        REQUIRE_THROWS_AS(grid.terrain_at({0, 4}), OutOfBounds);
    }

    SECTION("Traversability") {
        REQUIRE(grid.is_traversable({0, 0}));
        REQUIRE(!grid.is_traversable({1, 1}));
        REQUIRE(grid.is_traversable({2, 3}));
        REQUIRE(!grid.is_traversable({5, 5}));
    }
}

TEST_CASE("Grid queries", "[grid]") {
    auto grid = Grid::parse("^ $\n#$^");

    REQUIRE(grid.spawn_points() == std::vector<Cell>{{0, 0}, {2, 1}});
    REQUIRE(grid.destinations() == std::vector<Cell>{{2, 0}, {1, 1}});
    REQUIRE(grid.cells_with(Terrain::Wall) == std::vector<Cell>{{0, 1}});

    SECTION("Lines render back to map text") {
        auto lines = grid.to_lines();
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0] == "^ $");
        REQUIRE(lines[1] == "#$^");
    }

    SECTION("Glyph table") {
        REQUIRE(terrain_glyph(Terrain::Empty) == ' ');
        REQUIRE(terrain_glyph(Terrain::Wall) == '#');
        REQUIRE(terrain_glyph(Terrain::SpawnPoint) == '^');
        REQUIRE(terrain_glyph(Terrain::Destination) == '$');
        REQUIRE(terrain_from_glyph('$') == Terrain::Destination);
        REQUIRE(!terrain_from_glyph('.').has_value());
    }
}
