#include "core/query/filter_engine.h"

#include <algorithm>

namespace aq {

namespace {

FilterPredicate flagEquals(bool (Airport::*flag)() const, bool wanted)
{
    return [flag, wanted](const Airport& airport) { return (airport.*flag)() == wanted; };
}

bool inSet(const QSet<QString>* set, const QString& icao)
{
    return set != nullptr && set->contains(icao);
}

} // namespace

std::vector<FilterPredicate> FilterEngine::buildPredicates(const FilterSpec& spec,
                                                           const FilterContext& context)
{
    std::vector<FilterPredicate> predicates;

    // ── Cheap, selective ──

    if (spec.country) {
        const QString country = spec.country->trimmed();
        predicates.push_back([country](const Airport& airport) {
            return airport.country.compare(country, Qt::CaseInsensitive) == 0;
        });
    }
    if (spec.pointOfEntry) {
        const bool wanted = *spec.pointOfEntry;
        const QSet<QString>* crossings = context.borderCrossings;
        predicates.push_back([wanted, crossings](const Airport& airport) {
            return inSet(crossings, airport.icao) == wanted;
        });
    }
    if (spec.maxHoursNotice) {
        // Without a qualifying set nothing can be shown to meet the bound
        const QSet<QString>* qualifying = context.notificationQualifying;
        predicates.push_back([qualifying](const Airport& airport) {
            return inSet(qualifying, airport.icao);
        });
    }
    if (spec.excludeLargeAirports.value_or(false)) {
        predicates.push_back([](const Airport& airport) {
            return airport.type != AirportType::Large;
        });
    }
    if (spec.maxLandingFee) {
        const double maxFee = *spec.maxLandingFee;
        predicates.push_back([maxFee](const Airport& airport) {
            return !airport.landingFee.has_value() || airport.landingFee->amount <= maxFee;
        });
    }
    if (spec.hasAipData) {
        predicates.push_back(flagEquals(&Airport::hasAipData, *spec.hasAipData));
    }
    if (spec.hasProcedures) {
        predicates.push_back(flagEquals(&Airport::hasProcedures, *spec.hasProcedures));
    }

    // ── Runway scans ──

    if (spec.minRunwayLengthFt) {
        const int minLength = *spec.minRunwayLengthFt;
        predicates.push_back([minLength](const Airport& airport) {
            const std::optional<int> longest = airport.longestRunwayFt();
            return longest.has_value() && *longest >= minLength;
        });
    }
    if (spec.maxRunwayLengthFt) {
        const int maxLength = *spec.maxRunwayLengthFt;
        predicates.push_back([maxLength](const Airport& airport) {
            const std::optional<int> longest = airport.longestRunwayFt();
            return longest.has_value() && *longest <= maxLength;
        });
    }
    if (spec.hasHardRunway) {
        predicates.push_back(flagEquals(&Airport::hasHardRunway, *spec.hasHardRunway));
    }
    if (spec.hasLightedRunway) {
        predicates.push_back(flagEquals(&Airport::hasLightedRunway, *spec.hasLightedRunway));
    }

    // ── Procedure scans ──

    if (spec.hasIls) {
        predicates.push_back(flagEquals(&Airport::hasIls, *spec.hasIls));
    }
    if (spec.hasRnav) {
        predicates.push_back(flagEquals(&Airport::hasRnav, *spec.hasRnav));
    }
    if (spec.hasPrecisionApproach) {
        predicates.push_back(flagEquals(&Airport::hasPrecisionApproach, *spec.hasPrecisionApproach));
    }

    // ── Enrichment ──

    // Airports with no fuel data at all pass; the dataset is sparse
    if (spec.hasAvgas.value_or(false)) {
        predicates.push_back([](const Airport& airport) {
            return airport.fuels.empty() || airport.hasAvgas();
        });
    }
    if (spec.hasJetA.value_or(false)) {
        predicates.push_back([](const Airport& airport) {
            return airport.fuels.empty() || airport.hasJetA();
        });
    }
    if (spec.aipField) {
        const QString field = spec.aipField->trimmed();
        predicates.push_back([field](const Airport& airport) {
            return airport.aipValue(field).has_value();
        });
    }

    return predicates;
}

bool FilterEngine::passesAll(const std::vector<FilterPredicate>& predicates, const Airport& airport)
{
    return std::all_of(predicates.begin(), predicates.end(),
                       [&airport](const FilterPredicate& predicate) { return predicate(airport); });
}

bool FilterEngine::matches(const Airport& airport, const FilterSpec& spec,
                           const FilterContext& context)
{
    return passesAll(buildPredicates(spec, context), airport);
}

std::vector<Airport> FilterEngine::apply(const std::vector<Airport>& candidates,
                                         const FilterSpec& spec,
                                         const FilterContext& context)
{
    return applyTo(candidates, spec, context, [](const Airport& airport) -> const Airport& {
        return airport;
    });
}

} // namespace aq
