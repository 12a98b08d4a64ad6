// Copyright 2025-2026 NVIDIA Corporation
// SPDX-License-Identifier: Apache-2.0

// catch
#include "catch.hpp"
// sgx
#include "sgx/io/gltf/GltfMaterials.hpp"
// std
#include <memory>
#include <string>

using namespace sgx;
using namespace sgx::core;
using namespace sgx::io;
using namespace sgx::io::gltf;

namespace {

// Decodes any non-empty input to a 2x1 RGB image, records its last input
struct RecordingDecoder : public ImageDecoder
{
  ImagePtr decode(const std::byte *data,
      size_t size,
      const std::string &mimeType) const override
  {
    lastSize = size;
    lastMimeType = mimeType;
    if (data == nullptr || size == 0)
      return {};
    auto image = std::make_shared<Image>(2, 1, 3);
    image->pixels() = {255, 0, 0, 0, 0, 255};
    return image;
  }

  mutable size_t lastSize{0};
  mutable std::string lastMimeType;
};

struct FailingDecoder : public ImageDecoder
{
  ImagePtr decode(const std::byte *, size_t, const std::string &) const override
  {
    return {};
  }
};

} // namespace

SCENARIO("GLTF material field handling", "[GltfMaterials]")
{
  GIVEN("A material with nested metallic-roughness values")
  {
    const nlohmann::json material = {{"name", "paint"},
        {"doubleSided", true},
        {"pbrMetallicRoughness",
            {{"baseColorFactor", {0.5, 0.5, 0.5, 1.0}},
                {"metallicFactor", 0.25},
                {"baseColorTexture", {{"index", 0}}}}}};

    WHEN("It is flattened")
    {
      const auto flat = flattenMaterial(material);

      THEN("The nested values move to the top level")
      {
        REQUIRE(!flat.contains("pbrMetallicRoughness"));
        REQUIRE(flat["metallicFactor"] == 0.25);
        REQUIRE(flat["name"] == "paint");
        REQUIRE(flat.contains("baseColorTexture"));
      }
    }

    WHEN("The fields are split against a document with one texture")
    {
      const nlohmann::json doc = {{"textures", {{{"source", 0}}}}};
      auto image = std::make_shared<Image>(1, 1, 4);
      const auto fields =
          splitMaterialFields(flattenMaterial(material), doc, {image});

      THEN("Texture references are replaced by the decoded image")
      {
        REQUIRE(fields.textures.size() == 1);
        REQUIRE(fields.textures.at("baseColorTexture") == image);
        REQUIRE(!fields.scalars.contains("baseColorTexture"));
      }

      THEN("A material is built from the fields")
      {
        const auto m = makeMaterial(fields);
        REQUIRE(m->name == "paint");
        REQUIRE(m->doubleSided);
        REQUIRE(m->metallicFactor == 0.25f);
        REQUIRE(m->roughnessFactor == 1.f);
        REQUIRE(m->baseColorFactor == math::float4(0.5f, 0.5f, 0.5f, 1.f));
        REQUIRE(m->baseColorTexture == image);
        REQUIRE(m->hasTextures());
      }
    }

    WHEN("The referenced texture has no image source")
    {
      const nlohmann::json doc = {
          {"textures", nlohmann::json::array({nlohmann::json::object()})}};
      const auto fields = splitMaterialFields(flattenMaterial(material), doc, {});

      THEN("The texture slot is left empty")
      {
        REQUIRE(fields.textures.contains("baseColorTexture"));
        REQUIRE(!fields.textures.at("baseColorTexture"));
      }
    }

    WHEN("The referenced texture does not exist")
    {
      const nlohmann::json doc = {{"textures", nlohmann::json::array()}};

      THEN("Splitting fails")
      {
        REQUIRE_THROWS_AS(
            splitMaterialFields(flattenMaterial(material), doc, {}),
            FormatError);
      }
    }
  }

  GIVEN("Material values of the wrong type")
  {
    MaterialFields fields;
    fields.scalars["metallicFactor"] = "shiny";
    fields.scalars["baseColorFactor"] = {1, 2};

    THEN("Defaults are kept")
    {
      const auto m = makeMaterial(fields);
      REQUIRE(m->metallicFactor == 1.f);
      REQUIRE(m->baseColorFactor == math::float4(1.f));
    }
  }
}

SCENARIO("GLTF image and material parsing", "[GltfMaterials]")
{
  GIVEN("A document with one image stored in a bufferView")
  {
    const nlohmann::json doc = {
        {"images", {{{"bufferView", 0}, {"mimeType", "image/png"}}}},
        {"textures", {{{"source", 0}}}},
        {"materials",
            {{{"pbrMetallicRoughness",
                {{"baseColorTexture", {{"index", 0}}}}}}}}};
    const std::vector<ByteBuffer> views = {ByteBuffer(16, std::byte{1})};

    WHEN("It is parsed with a working decoder")
    {
      RecordingDecoder decoder;
      const auto materials = parseMaterials(doc, views, &decoder);

      THEN("The image bytes are handed to the decoder")
      {
        REQUIRE(decoder.lastSize == 16);
        REQUIRE(decoder.lastMimeType == "image/png");
      }

      THEN("The material uses the decoded image")
      {
        REQUIRE(materials);
        REQUIRE(materials->size() == 1);
        const auto &tex = (*materials)[0]->baseColorTexture;
        REQUIRE(tex);
        REQUIRE(tex->width() == 2);
      }
    }

    WHEN("Decoding fails")
    {
      FailingDecoder decoder;
      const auto materials = parseMaterials(doc, views, &decoder);

      THEN("The material is kept without the texture")
      {
        REQUIRE(materials);
        REQUIRE(materials->size() == 1);
        REQUIRE(!(*materials)[0]->baseColorTexture);
      }
    }

    WHEN("There is no decoder")
    {
      THEN("Materials are skipped")
      {
        REQUIRE(!parseMaterials(doc, views, nullptr));
      }
    }
  }

  GIVEN("A directory style document with an external image")
  {
    const nlohmann::json doc = {{"images", {{{"uri", "tex.png"}}}}};
    FileMap files;
    files["tex.png"] = ByteBuffer(4, std::byte{7});
    RecordingDecoder decoder;

    THEN("The image is read from the file map")
    {
      const auto images = decodeImages(doc, {}, decoder, &files);
      REQUIRE(images.size() == 1);
      REQUIRE(images[0]);
      REQUIRE(decoder.lastSize == 4);
    }

    THEN("A missing file leaves an empty slot")
    {
      const auto images = decodeImages(doc, {}, decoder, nullptr);
      REQUIRE(images.size() == 1);
      REQUIRE(!images[0]);
    }
  }

  GIVEN("A document without materials")
  {
    THEN("An empty material list is returned")
    {
      const auto materials =
          parseMaterials(nlohmann::json::object(), {}, nullptr);
      REQUIRE(materials);
      REQUIRE(materials->empty());
    }
  }
}

SCENARIO("GLTF material export", "[GltfMaterials]")
{
  GIVEN("A default PBRMaterial")
  {
    PBRMaterial m;

    THEN("Only the metallic-roughness block is written")
    {
      const auto j = materialToGLTF(m);
      REQUIRE(j.contains("pbrMetallicRoughness"));
      REQUIRE(!j.contains("alphaMode"));
      REQUIRE(!j.contains("emissiveFactor"));
      REQUIRE(!j.contains("name"));
    }

    WHEN("It uses alpha masking")
    {
      m.alphaMode = "MASK";
      m.alphaCutoff = 0.25f;
      const auto j = materialToGLTF(m);

      THEN("The mode and cutoff are written")
      {
        REQUIRE(j["alphaMode"] == "MASK");
        REQUIRE(j["alphaCutoff"].get<float>() == 0.25f);
      }
    }
  }

  GIVEN("An 8-bit color")
  {
    const auto j = colorToGLTF(math::ubyte4(255, 0, 51, 255));

    THEN("It becomes a non-metallic, zero roughness base color")
    {
      const auto &pbr = j["pbrMetallicRoughness"];
      REQUIRE(pbr["baseColorFactor"][0].get<double>() == Approx(1.0));
      REQUIRE(pbr["baseColorFactor"][2].get<double>() == Approx(0.2));
      REQUIRE(pbr["metallicFactor"].get<double>() == 0.0);
      REQUIRE(pbr["roughnessFactor"].get<double>() == 0.0);
    }
  }
}
