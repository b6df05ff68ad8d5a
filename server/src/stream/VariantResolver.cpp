#include "VariantResolver.hpp"

const Catalog::Variant *Stream::resolveVariant(const Catalog::Catalog &catalog, Catalog::VideoId id,
                                               std::string_view quality)
{
    if (const Catalog::Variant *variant = catalog.findVariant(id, quality)) {
        return variant;
    }

    /* Fall back to the best quality there is. */
    std::optional<std::string> defaultQuality = catalog.defaultQuality(id);
    if (!defaultQuality) {
        return nullptr;
    }
    return catalog.findVariant(id, *defaultQuality);
}
