// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include "catch.hpp"
// sgx
#include "sgx/io/gltf/GltfGraph.hpp"
// std
#include <cmath>
#include <set>

using namespace sgx;
using namespace sgx::core;
using namespace sgx::io;
using namespace sgx::io::gltf;

static std::set<std::string> frameNames(const GraphReconstruction &g)
{
  std::set<std::string> names;
  for (const auto &e : g.edges)
    names.insert(e.frameTo);
  return names;
}

SCENARIO("sgx::io::gltf::UniqueNameGenerator interface", "[GltfGraph]")
{
  GIVEN("Two generators with the same seed")
  {
    UniqueNameGenerator a(42);
    UniqueNameGenerator b(42);

    THEN("They produce the same sequence of names")
    {
      for (int i = 0; i < 8; i++)
        REQUIRE(a.next("mesh") == b.next("mesh"));
    }
  }

  GIVEN("A default seeded generator")
  {
    UniqueNameGenerator g;

    THEN("Names are the prefix plus a 6 character suffix")
    {
      const auto name = g.next("mesh");
      REQUIRE(name.size() == 4 + 1 + 6);
      REQUIRE(name.rfind("mesh_", 0) == 0);
      for (size_t i = 5; i < name.size(); i++) {
        const char c = name[i];
        REQUIRE(((c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z')));
      }
    }

    THEN("Issued names are taken and never repeated")
    {
      std::set<std::string> names;
      for (int i = 0; i < 100; i++)
        names.insert(g.next("x"));
      REQUIRE(names.size() == 100);
      REQUIRE(g.isTaken(*names.begin()));
    }

    THEN("Numeric names have at most 10 digits")
    {
      const auto n = g.nextNumeric();
      REQUIRE(!n.empty());
      REQUIRE(n.size() <= 10);
      REQUIRE(n.find_first_not_of("0123456789") == std::string::npos);
    }
  }
}

SCENARIO("Scene graph reconstruction from GLTF nodes", "[GltfGraph]")
{
  GIVEN("A two node hierarchy where both nodes instance the same mesh")
  {
    nlohmann::json doc = {
        {"nodes",
            {{{"name", "a"}, {"children", {1}}, {"mesh", 0}},
                {{"name", "b"}, {"mesh", 0}}}},
        {"scenes", {{{"nodes", {0}}}}}};
    const std::vector<std::vector<std::string>> meshGeometry = {{"g"}};

    const auto g = reconstructGraph(doc, meshGeometry, {});

    THEN("The base frame is 'world'")
    {
      REQUIRE(g.baseFrame == "world");
    }

    THEN("There is one edge per node plus one per instanced geometry")
    {
      REQUIRE(g.edges.size() == 4);
    }

    THEN("Every frame name is unique")
    {
      REQUIRE(frameNames(g).size() == g.edges.size());
    }

    THEN("Child nodes hang off their parent node")
    {
      bool found = false;
      for (const auto &e : g.edges) {
        if (e.frameTo == "b") {
          REQUIRE(e.frameFrom == "a");
          found = true;
        }
      }
      REQUIRE(found);
    }

    THEN("Geometry edges share the parent and transform of their node")
    {
      size_t instances = 0;
      for (const auto &e : g.edges) {
        if (!e.geometry)
          continue;
        instances++;
        REQUIRE(*e.geometry == "g");
        REQUIRE(e.frameTo.rfind("g_", 0) == 0);
        REQUIRE((e.frameFrom == "world" || e.frameFrom == "a"));
      }
      REQUIRE(instances == 2);
    }

    THEN("The same seed reproduces the same frame names")
    {
      REQUIRE(frameNames(reconstructGraph(doc, meshGeometry, {}))
          == frameNames(g));
    }

    THEN("A different seed changes the generated frame names")
    {
      ImportOptions options;
      options.nameSeed = 7;
      REQUIRE(frameNames(reconstructGraph(doc, meshGeometry, options))
          != frameNames(g));
    }
  }

  GIVEN("A node which is itself named 'world'")
  {
    nlohmann::json doc = {{"nodes", {{{"name", "world"}}}},
        {"scenes", {{{"nodes", {0}}}}}};

    const auto g = reconstructGraph(doc, {}, {});

    THEN("A numeric base frame is generated instead")
    {
      REQUIRE(g.baseFrame != "world");
      REQUIRE(g.baseFrame.find_first_not_of("0123456789") == std::string::npos);
      REQUIRE(g.edges.size() == 1);
      REQUIRE(g.edges[0].frameFrom == g.baseFrame);
      REQUIRE(g.edges[0].frameTo == "world");
    }
  }

  GIVEN("A node with a column-major matrix")
  {
    nlohmann::json doc = {{"nodes",
                              {{{"name", "n"},
                                  {"matrix",
                                      {1, 0, 0, 0, 0, 1, 0, 0, 0, 0, 1, 0, 5, 6, 7, 1}}}}},
        {"scenes", {{{"nodes", {0}}}}}};

    THEN("The last four values become the translation column")
    {
      const auto g = reconstructGraph(doc, {}, {});
      REQUIRE(g.edges[0].matrix[3] == math::float4(5.f, 6.f, 7.f, 1.f));
      REQUIRE(g.edges[0].matrix[0] == math::float4(1.f, 0.f, 0.f, 0.f));
    }
  }

  GIVEN("A node with translation, rotation and scale")
  {
    const float s = std::sqrt(0.5f);
    nlohmann::json doc = {{"nodes",
                              {{{"translation", {1, 2, 3}},
                                  {"rotation", {0.f, 0.f, s, s}},
                                  {"scale", {2, 2, 2}}}}},
        {"scenes", {{{"nodes", {0}}}}}};

    WHEN("TRS composition is enabled")
    {
      const auto g = reconstructGraph(doc, {}, {});
      const auto &m = g.edges[0].matrix;

      THEN("The transform is translation * rotation * scale")
      {
        // x axis is scaled by 2 then rotated onto +y
        REQUIRE(m[0].x == Approx(0.f).margin(1e-6));
        REQUIRE(m[0].y == Approx(2.f));
        REQUIRE(m[3] == math::float4(1.f, 2.f, 3.f, 1.f));
      }
    }

    WHEN("TRS composition is disabled")
    {
      ImportOptions options;
      options.composeTRS = false;
      const auto g = reconstructGraph(doc, {}, options);

      THEN("The node transform is the identity")
      {
        REQUIRE(math::isIdentity(g.edges[0].matrix));
      }
    }
  }

  GIVEN("Nodes without names and with duplicate names")
  {
    nlohmann::json doc = {
        {"nodes", {{{"name", "dup"}}, {{"name", "dup"}}, nlohmann::json::object()}},
        {"scenes", {{{"nodes", {0, 1, 2}}}}}};

    const auto names = frameNames(reconstructGraph(doc, {}, {}));

    THEN("Unnamed nodes use their index and duplicates are renamed")
    {
      REQUIRE(names.count("dup") == 1);
      REQUIRE(names.count("dup_1") == 1);
      REQUIRE(names.count("2") == 1);
    }
  }

  GIVEN("A duplicate whose renamed form is already another node's name")
  {
    nlohmann::json doc = {
        {"nodes", {{{"name", "a"}}, {{"name", "a_2"}}, {{"name", "a"}}}},
        {"scenes", {{{"nodes", {0, 1, 2}}}}}};

    const auto g = reconstructGraph(doc, {}, {});
    const auto names = frameNames(g);

    THEN("Every node still gets its own frame")
    {
      REQUIRE(g.edges.size() == 3);
      REQUIRE(names.size() == 3);
      REQUIRE(names.count("a") == 1);
      REQUIRE(names.count("a_2") == 1);
    }
  }

  GIVEN("A node reachable from two parents")
  {
    nlohmann::json doc = {{"nodes",
                              {{{"children", {2}}},
                                  {{"children", {2}}},
                                  nlohmann::json::object()}},
        {"scenes", {{{"nodes", {0, 1}}}}}};

    THEN("Reconstruction fails")
    {
      REQUIRE_THROWS_AS(reconstructGraph(doc, {}, {}), FormatError);
    }
  }

  GIVEN("A node hierarchy with a cycle")
  {
    nlohmann::json doc = {{"nodes", {{{"children", {1}}}, {{"children", {0}}}}},
        {"scenes", {{{"nodes", {0}}}}}};

    THEN("Reconstruction fails")
    {
      REQUIRE_THROWS_AS(reconstructGraph(doc, {}, {}), FormatError);
    }
  }

  GIVEN("A node referencing a mesh that does not exist")
  {
    nlohmann::json doc = {{"nodes", {{{"mesh", 3}}}},
        {"scenes", {{{"nodes", {0}}}}}};

    THEN("Reconstruction fails")
    {
      REQUIRE_THROWS_AS(reconstructGraph(doc, {}, {}), FormatError);
    }
  }

  GIVEN("A document without scenes")
  {
    nlohmann::json doc = {{"nodes", {{{"name", "n"}}}}};

    THEN("No edges are produced")
    {
      REQUIRE(reconstructGraph(doc, {}, {}).edges.empty());
    }
  }
}

SCENARIO("Scene graph flattening to GLTF nodes", "[GltfGraph]")
{
  GIVEN("A graph with two levels and one unconnected frame")
  {
    SceneGraph graph;
    GraphEdge e;
    e.frameFrom = "world";
    e.frameTo = "a";
    graph.update(e);
    e.frameFrom = "a";
    e.frameTo = "b";
    e.geometry = "mesh";
    graph.update(e);
    e.frameFrom = "nowhere";
    e.frameTo = "lost";
    e.geometry.reset();
    graph.update(e);

    FlatMap<std::string, size_t> meshIndex;
    meshIndex["mesh"] = 0;

    const auto nodes = flattenGraph(graph, meshIndex);

    THEN("Only frames reachable from the base frame are written")
    {
      REQUIRE(nodes.size() == 3);
    }

    THEN("Nodes are written breadth first")
    {
      REQUIRE(nodes[0]["name"] == "world");
      REQUIRE(nodes[1]["name"] == "a");
      REQUIRE(nodes[2]["name"] == "b");
      REQUIRE(nodes[0]["children"] == nlohmann::json::array({1}));
      REQUIRE(nodes[1]["children"] == nlohmann::json::array({2}));
    }

    THEN("Mesh references are attached to geometry frames")
    {
      REQUIRE(nodes[2]["mesh"] == 0);
      REQUIRE(!nodes[1].contains("mesh"));
    }
  }
}
