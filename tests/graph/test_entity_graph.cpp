#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "entity-pulse/core/errors.hpp"
#include "entity-pulse/graph/community.hpp"
#include "entity-pulse/graph/entity_graph.hpp"

#include <string>
#include <vector>

using namespace entitypulse::graph;
using entitypulse::core::InvalidParameter;

namespace {

// Two triangles joined by the bridge c - d, plus the isolated node g.
EntityGraph twoTriangles() {
	EntityGraph graph;
	graph.addEdge("a", "b", 0.9);
	graph.addEdge("b", "c", 0.8);
	graph.addEdge("a", "c", 0.7);
	graph.addEdge("c", "d", 0.6);
	graph.addEdge("d", "e", 0.9);
	graph.addEdge("e", "f", 0.8);
	graph.addEdge("d", "f", 0.7);
	graph.addNode("g");
	return graph;
}

} // namespace

TEST_CASE("Nodes are interned by name", "[graph]") {
	EntityGraph graph;
	REQUIRE(graph.addNode("alpha") == 0);
	REQUIRE(graph.addNode("beta") == 1);
	REQUIRE(graph.addNode("alpha") == 0);
	REQUIRE(graph.nodeCount() == 2);
	REQUIRE(graph.nodeIndex("beta") == std::optional<std::size_t>(1));
	REQUIRE_FALSE(graph.nodeIndex("gamma").has_value());
	REQUIRE(graph.nodeName(1) == "beta");
}

TEST_CASE("Undirected edges are found in both directions", "[graph]") {
	EntityGraph graph;
	graph.addEdge("a", "b", 0.5);
	REQUIRE(graph.hasEdge("a", "b"));
	REQUIRE(graph.hasEdge("b", "a"));
	REQUIRE_FALSE(graph.hasEdge("a", "c"));
	REQUIRE(graph.findEdge("b", "a")->weight == Catch::Approx(0.5));
	REQUIRE(neighbours(graph, 1) == std::vector<std::size_t>{0});
}

TEST_CASE("Directed edges keep their orientation and lag", "[graph]") {
	EntityGraph graph(true);
	graph.addEdge("leader", "follower", 0.8, 2, 0.01);

	const Edge *edge = graph.findEdge("leader", "follower");
	REQUIRE(edge != nullptr);
	REQUIRE(edge->lag == std::optional<int>(2));
	REQUIRE(edge->p_value == Catch::Approx(0.01));
	REQUIRE(graph.findEdge("follower", "leader") == nullptr);

	REQUIRE(neighbours(graph, 0) == std::vector<std::size_t>{1});
	REQUIRE(neighbours(graph, 1).empty());
	REQUIRE(degree(graph, 1) == 1);
}

TEST_CASE("Invalid edges are rejected", "[graph]") {
	EntityGraph graph;
	graph.addNode("a");
	REQUIRE_THROWS_AS(graph.addEdge("a", "a", 1.0), InvalidParameter);
	REQUIRE_THROWS_AS(graph.addEdge(0, 5, 1.0), InvalidParameter);
}

TEST_CASE("Greedy modularity separates two triangles", "[graph][community]") {
	const auto graph = twoTriangles();
	const auto communities = greedyModularityCommunities(graph);

	REQUIRE(communities.size() == 3);
	REQUIRE(communities[0] == Community{"a", "b", "c"});
	REQUIRE(communities[1] == Community{"d", "e", "f"});
	REQUIRE(communities[2] == Community{"g"});

	// Q = 2 * (6/14 - (7/14)^2)
	REQUIRE(modularity(graph, communities) == Catch::Approx(0.3571428571));
	REQUIRE(modularity(graph, {{"a", "b", "c", "d", "e", "f", "g"}}) == Catch::Approx(0.0).margin(1e-12));
}

TEST_CASE("Graphs without edges give singleton communities", "[graph][community]") {
	EntityGraph graph;
	graph.addNode("y");
	graph.addNode("x");
	const auto communities = greedyModularityCommunities(graph);
	REQUIRE(communities.size() == 2);
	REQUIRE(communities[0] == Community{"x"});
	REQUIRE(communities[1] == Community{"y"});
	REQUIRE(modularity(graph, communities) == 0.0);

	REQUIRE(greedyModularityCommunities(EntityGraph()).empty());
}

TEST_CASE("Modularity rejects unknown members", "[graph][community]") {
	const auto graph = twoTriangles();
	REQUIRE_THROWS_AS(modularity(graph, {{"a", "zzz"}}), InvalidParameter);
}
