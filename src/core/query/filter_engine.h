#pragma once

#include "core/query/filter_spec.h"
#include "core/shared/types.h"

#include <QSet>
#include <QString>
#include <functional>
#include <vector>

namespace aq {

// Auxiliary sets some predicates consult. Not owned.
struct FilterContext {
    const QSet<QString>* borderCrossings = nullptr;         // for pointOfEntry
    const QSet<QString>* notificationQualifying = nullptr;  // for maxHoursNotice
};

using FilterPredicate = std::function<bool(const Airport&)>;

// FilterEngine -- turns a FilterSpec into an ordered list of independent
// predicates and evaluates their conjunction. Stateless.
class FilterEngine {
public:
    // One predicate per constraining field. Cheap, selective checks come
    // first; runway, procedure and enrichment scans last.
    static std::vector<FilterPredicate> buildPredicates(const FilterSpec& spec,
                                                        const FilterContext& context);

    static bool matches(const Airport& airport, const FilterSpec& spec,
                        const FilterContext& context = {});

    // Keeps the airports that pass every predicate, in input order.
    static std::vector<Airport> apply(const std::vector<Airport>& candidates,
                                      const FilterSpec& spec,
                                      const FilterContext& context = {});

    // Same, for any element type exposing the airport through `project`.
    template <typename T, typename Projection>
    static std::vector<T> applyTo(const std::vector<T>& candidates,
                                  const FilterSpec& spec,
                                  const FilterContext& context,
                                  Projection project)
    {
        const std::vector<FilterPredicate> predicates = buildPredicates(spec, context);
        std::vector<T> kept;
        kept.reserve(candidates.size());
        for (const T& candidate : candidates) {
            if (passesAll(predicates, project(candidate))) {
                kept.push_back(candidate);
            }
        }
        return kept;
    }

private:
    static bool passesAll(const std::vector<FilterPredicate>& predicates, const Airport& airport);
};

} // namespace aq
