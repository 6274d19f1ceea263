#pragma once

#include "core/shared/types.h"

#include <QString>
#include <vector>

namespace aq {

// Place-name lookups. Every method orders results by population, largest
// first, and throws DataSourceError when the gazetteer cannot be read.
class GazetteerStore {
public:
    virtual ~GazetteerStore() = default;

    // Case-insensitive equality on the primary name.
    virtual std::vector<GeocodeEntry> exactMatch(const QString& name, int limit) const = 0;

    // Primary name starts with the given text.
    virtual std::vector<GeocodeEntry> prefixMatch(const QString& prefix, int limit) const = 0;

    // Alternate-name list contains the given text.
    virtual std::vector<GeocodeEntry> substringMatch(const QString& text, int limit) const = 0;
};

} // namespace aq
