// Copyright 2024-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include "catch.hpp"
// sgx_core
#include "sgx/core/scene/Scene.hpp"
// std
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace sgx;
using namespace sgx::core;

SCENARIO("sgx::core::SceneGraph interface", "[SceneGraph]")
{
  GIVEN("A default constructed SceneGraph")
  {
    SceneGraph graph;

    THEN("Only the base frame exists")
    {
      REQUIRE(graph.baseFrame() == "world");
      REQUIRE(graph.contains("world"));
      REQUIRE(graph.size() == 0);
    }

    THEN("An edge into the base frame is rejected")
    {
      GraphEdge e;
      e.frameFrom = "a";
      e.frameTo = "world";
      REQUIRE_THROWS_AS(graph.update(e), std::invalid_argument);
    }

    THEN("A self referencing edge is rejected")
    {
      GraphEdge e;
      e.frameFrom = "a";
      e.frameTo = "a";
      REQUIRE_THROWS_AS(graph.update(e), std::invalid_argument);
    }

    WHEN("A chain of two translated frames is added")
    {
      GraphEdge e;
      e.frameFrom = "world";
      e.frameTo = "a";
      e.matrix = math::translation_matrix(math::float3(1.f, 0.f, 0.f));
      graph.update(e);
      e.frameFrom = "a";
      e.frameTo = "b";
      e.matrix = math::translation_matrix(math::float3(0.f, 2.f, 0.f));
      e.geometry = "mesh";
      graph.update(e);

      THEN("Transforms accumulate from the base frame")
      {
        const auto m = graph.worldTransform("b");
        REQUIRE(m[3] == math::float4(1.f, 2.f, 0.f, 1.f));
      }

      THEN("Parents and children are reported")
      {
        REQUIRE(graph.parent("b") == std::optional<std::string>("a"));
        REQUIRE(!graph.parent("world"));
        REQUIRE(graph.children("world").size() == 1);
        REQUIRE(graph.children("a")[0]->frameTo == "b");
      }

      THEN("Frames with geometry are listed")
      {
        REQUIRE(graph.nodesWithGeometry() == std::vector<std::string>{"b"});
      }

      THEN("Unknown frames have no world transform")
      {
        REQUIRE_THROWS_AS(graph.worldTransform("c"), std::out_of_range);
      }

      WHEN("The edge into 'b' is replaced")
      {
        GraphEdge r;
        r.frameFrom = "world";
        r.frameTo = "b";
        graph.update(r);

        THEN("The graph size is unchanged and 'b' moves")
        {
          REQUIRE(graph.size() == 2);
          REQUIRE(graph.parent("b") == std::optional<std::string>("world"));
          REQUIRE(math::isIdentity(graph.worldTransform("b")));
        }
      }
    }
  }
}

SCENARIO("sgx::core::Scene interface", "[Scene]")
{
  GIVEN("An empty Scene")
  {
    Scene scene;

    WHEN("Two geometries with the same name are added")
    {
      auto a = scene.addGeometry(std::make_shared<TriangleMesh>(), "part");
      auto b = scene.addGeometry(std::make_shared<TriangleMesh>(), "part");

      THEN("The second one is renamed")
      {
        REQUIRE(a == "part");
        REQUIRE(b == "part_1");
        REQUIRE(scene.geometry().size() == 2);
        REQUIRE(scene.geometry().at("part_1")->name == "part_1");
      }

      THEN("Each geometry is instanced under the base frame")
      {
        REQUIRE(scene.graph().size() == 2);
        for (const auto &e : scene.graph().edges()) {
          REQUIRE(e.frameFrom == "world");
          REQUIRE(e.geometry);
        }
      }
    }

    THEN("Adding under an unknown parent frame fails")
    {
      REQUIRE_THROWS_AS(scene.addGeometry(std::make_shared<TriangleMesh>(),
                            "x",
                            math::IDENTITY_MAT4,
                            "missing"),
          std::invalid_argument);
    }

    THEN("Adding null geometry fails")
    {
      REQUIRE_THROWS_AS(scene.addGeometry(nullptr), std::invalid_argument);
    }
  }

  GIVEN("A SceneDescription with a custom base frame")
  {
    SceneDescription d;
    d.baseFrame = "root";
    d.geometry["g"] = std::make_shared<TriangleMesh>();
    GraphEdge e;
    e.frameFrom = "root";
    e.frameTo = "g_frame";
    e.geometry = "g";
    d.graph.push_back(e);

    const Scene scene(d);

    THEN("The scene adopts the description")
    {
      REQUIRE(scene.graph().baseFrame() == "root");
      REQUIRE(scene.geometry().contains("g"));
      REQUIRE(scene.graph().nodesWithGeometry().size() == 1);
    }
  }
}

SCENARIO("sgx::core::TriangleMesh interface", "[Geometry]")
{
  GIVEN("A single triangle in the XY plane")
  {
    TriangleMesh mesh;
    mesh.vertices = {{0.f, 0.f, 0.f}, {2.f, 0.f, 0.f}, {0.f, 1.f, 0.f}};
    mesh.faces = {{0, 1, 2}};

    THEN("Bounds and max index are computed")
    {
      const auto b = mesh.bounds();
      REQUIRE(b.first == math::float3(0.f, 0.f, 0.f));
      REQUIRE(b.second == math::float3(2.f, 1.f, 0.f));
      REQUIRE(mesh.maxIndex() == 2);
    }

    THEN("Generated normals face +Z")
    {
      const auto n = mesh.vertexNormals();
      REQUIRE(n.size() == 3);
      for (const auto &v : n)
        REQUIRE(v == math::float3(0.f, 0.f, 1.f));
    }

    THEN("The main color defaults to grey")
    {
      REQUIRE(mesh.mainColor() == TriangleMesh::DEFAULT_COLOR);
    }

    WHEN("A material is assigned")
    {
      mesh.material = std::make_shared<PBRMaterial>();
      mesh.material->baseColorFactor = math::float4(0.f, 1.f, 0.f, 1.f);

      THEN("The main color comes from the material")
      {
        REQUIRE(mesh.mainColor() == math::ubyte4(0, 255, 0, 255));
      }

      WHEN("A two pixel texture and texture coordinates are added")
      {
        auto image = std::make_shared<Image>(2, 1, 3);
        image->pixels() = {255, 0, 0, 0, 0, 255};
        mesh.material->baseColorFactor = math::float4(1.f);
        mesh.material->baseColorTexture = image;
        mesh.uv = {{0.f, 0.f}, {1.f, 0.f}, {0.f, 1.f}};

        THEN("Per-vertex colors are sampled from the texture")
        {
          REQUIRE(mesh.hasTexture());
          const auto c = mesh.textureColors();
          REQUIRE(c[0] == math::ubyte4(255, 0, 0, 255));
          REQUIRE(c[1] == math::ubyte4(0, 0, 255, 255));
        }

        THEN("Converting to colors drops the texture")
        {
          mesh.toColor();
          REQUIRE(mesh.hasVertexColors());
          REQUIRE(!mesh.material);
          REQUIRE(mesh.uv.empty());
        }
      }
    }

    WHEN("Vertex colors are assigned")
    {
      mesh.vertexColors = {math::ubyte4(9, 9, 9, 255),
          math::ubyte4(1, 1, 1, 255),
          math::ubyte4(9, 9, 9, 255)};

      THEN("The most frequent color is the main color")
      {
        REQUIRE(mesh.mainColor() == math::ubyte4(9, 9, 9, 255));
      }
    }

    WHEN("A face indexes past the vertices")
    {
      mesh.faces.push_back({0, 1, 5});

      THEN("Normal generation fails")
      {
        REQUIRE_THROWS_AS(mesh.vertexNormals(), std::out_of_range);
      }
    }
  }
}

SCENARIO("sgx::core::Path interface", "[Geometry]")
{
  GIVEN("A path with two polylines")
  {
    Path path;
    path.vertices = {{0.f, 0.f, 0.f}, {1.f, 0.f, 0.f}, {1.f, 1.f, 0.f}};
    path.entities = {{0, 1, 2}, {2, 0}};

    THEN("Each segment contributes two line vertices")
    {
      const auto lines = path.toLineList();
      REQUIRE(lines.size() == 6);
      REQUIRE(lines[2] == math::float3(1.f, 0.f, 0.f));
      REQUIRE(lines[5] == math::float3(0.f, 0.f, 0.f));
    }

    THEN("Out of range entities are rejected")
    {
      path.entities.push_back({0, 9});
      REQUIRE_THROWS_AS(path.toLineList(), std::out_of_range);
    }
  }
}

SCENARIO("sgx::core::Image interface", "[Image]")
{
  GIVEN("A 2x2 grey image")
  {
    Image image(2, 2, 1);
    image.pixels() = {10, 20, 30, 40};

    THEN("Pixels expand to opaque RGBA")
    {
      REQUIRE(image.pixel(1, 0) == math::ubyte4(20, 20, 20, 255));
    }

    THEN("Texture coordinates start at the lower-left corner")
    {
      REQUIRE(image.texel(0.f, 0.f) == math::ubyte4(30, 30, 30, 255));
      REQUIRE(image.texel(1.f, 1.f) == math::ubyte4(20, 20, 20, 255));
    }
  }

  GIVEN("An invalid channel count")
  {
    THEN("Construction fails")
    {
      REQUIRE_THROWS_AS(Image(1, 1, 5), std::invalid_argument);
    }
  }
}
