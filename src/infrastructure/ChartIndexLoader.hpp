/**
 * @file ChartIndexLoader.hpp
 * @brief Parses a Helm repository index.yaml document.
 */

#pragma once
#include <string>
#include "domain/ChartIndex.hpp"

namespace chartkeeper::infrastructure {

class ChartIndexLoader {
public:
    /**
     * @brief Builds a ChartIndex from raw index bytes.
     *
     * Expects a YAML map with "apiVersion", optional "generated" and an
     * "entries" map of chart name to version list. Entries lacking a name
     * inherit the map key. An index without entries parses to an empty index.
     * @throws domain::ContentError on malformed input or missing apiVersion.
     */
    static domain::ChartIndex Parse(const std::string& bytes);
};

} // namespace chartkeeper::infrastructure
