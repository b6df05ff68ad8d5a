#include "stream/VariantResolver.hpp"

#include "catalog/JsonCatalog.hpp"

#include <gtest/gtest.h>

namespace
{

Catalog::JsonCatalog getCatalog()
{
    return Catalog::JsonCatalog::fromJson(R"({
        "videos": [
            { "id": 1, "variants": [
                { "quality": "360p", "location": "1/360p.mp4" },
                { "quality": "720p", "location": "1/720p.mp4" },
                { "quality": "1080p", "location": "1/1080p.mp4", "processed": false }
            ] },
            { "id": 2, "variants": [
                { "quality": "120p", "location": "https://cdn.example.com/2/120p.mp4" }
            ] },
            { "id": 3, "variants": [
                { "quality": "original", "location": "3/original.mp4" }
            ] },
            { "id": 4, "variants": [] }
        ]
    })", "/srv/media");
}

TEST(VariantResolver, Exact)
{
    Catalog::JsonCatalog catalog = getCatalog();
    const Catalog::Variant *variant = Stream::resolveVariant(catalog, 1, "360p");
    ASSERT_NE(nullptr, variant);
    EXPECT_EQ("360p", variant->quality);
    EXPECT_EQ(Catalog::VariantLocation(Catalog::LocalFile{ "/srv/media/1/360p.mp4" }), variant->location);
}

TEST(VariantResolver, FallbackToDefault)
{
    Catalog::JsonCatalog catalog = getCatalog();

    // 1080p exists but isn't processed, so 720p is the best there is.
    const Catalog::Variant *variant = Stream::resolveVariant(catalog, 1, "1080p");
    ASSERT_NE(nullptr, variant);
    EXPECT_EQ("720p", variant->quality);

    variant = Stream::resolveVariant(catalog, 1, "4k");
    ASSERT_NE(nullptr, variant);
    EXPECT_EQ("720p", variant->quality);

    variant = Stream::resolveVariant(catalog, 2, "720p");
    ASSERT_NE(nullptr, variant);
    EXPECT_EQ("120p", variant->quality);
    EXPECT_EQ(Catalog::VariantLocation(Catalog::RemoteUrl{ "https://cdn.example.com/2/120p.mp4" }),
              variant->location);
}

TEST(VariantResolver, NonDefaultQualityByName)
{
    Catalog::JsonCatalog catalog = getCatalog();
    const Catalog::Variant *variant = Stream::resolveVariant(catalog, 3, "original");
    ASSERT_NE(nullptr, variant);
    EXPECT_EQ("original", variant->quality);
}

TEST(VariantResolver, NotFound)
{
    Catalog::JsonCatalog catalog = getCatalog();
    EXPECT_EQ(nullptr, Stream::resolveVariant(catalog, 3, "720p")); // No prioritized quality to fall back to.
    EXPECT_EQ(nullptr, Stream::resolveVariant(catalog, 4, "720p"));
    EXPECT_EQ(nullptr, Stream::resolveVariant(catalog, 5, "720p"));
}

} // namespace
