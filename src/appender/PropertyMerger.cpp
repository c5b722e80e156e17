#include "logdb/PropertyMerger.hpp"

namespace logdb {

PropertyMap mergePropertyMaps(const std::optional<PropertyMap>& contextProperties,
                              const std::optional<PropertyMap>& mdcProperties) {
    PropertyMap merged;
    if (contextProperties) {
        merged = *contextProperties;
    }
    if (mdcProperties) {
        for (auto it = mdcProperties->constBegin(); it != mdcProperties->constEnd(); ++it) {
            merged.insert(it.key(), it.value());
        }
    }
    return merged;
}

}  // namespace logdb
